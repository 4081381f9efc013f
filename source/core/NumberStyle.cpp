// ============================================================================
// NumberStyle - Implementation
// ============================================================================

#include "NumberStyle.h"

#include <QDebug>
#include <QStringList>

#include <algorithm>

static const QStringList& knownKeys()
{
    static const QStringList keys = {
        "name", "font_family", "font_size", "text_color", "bg_color",
        "bg_opacity", "padding", "border_enabled", "border_width",
        "tail_enabled", "tail_length", "tail_width"
    };
    return keys;
}

NumberStyle NumberStyle::create(const QString& styleName,
                                const QColor& text,
                                const QColor& background,
                                int size,
                                qreal opacity)
{
    NumberStyle style;
    style.name = styleName;
    style.textColor = text;
    style.backgroundColor = background;
    style.fontSize = size;
    style.backgroundOpacity = opacity;
    return style;
}

bool NumberStyle::operator==(const NumberStyle& other) const
{
    return name == other.name
        && fontFamily == other.fontFamily
        && fontSize == other.fontSize
        && textColor == other.textColor
        && backgroundColor == other.backgroundColor
        && qFuzzyCompare(backgroundOpacity + 1.0, other.backgroundOpacity + 1.0)
        && padding == other.padding
        && borderEnabled == other.borderEnabled
        && qFuzzyCompare(borderWidth + 1.0, other.borderWidth + 1.0)
        && tailEnabled == other.tailEnabled
        && qFuzzyCompare(tailLength + 1.0, other.tailLength + 1.0)
        && qFuzzyCompare(tailWidth + 1.0, other.tailWidth + 1.0);
}

QJsonObject NumberStyle::toJson() const
{
    QJsonObject obj;
    obj["name"] = name;
    obj["font_family"] = fontFamily;
    obj["font_size"] = fontSize;
    obj["text_color"] = textColor.name(QColor::HexRgb).toUpper();
    obj["bg_color"] = backgroundColor.name(QColor::HexRgb).toUpper();
    obj["bg_opacity"] = backgroundOpacity;
    obj["padding"] = padding;
    obj["border_enabled"] = borderEnabled;
    obj["border_width"] = borderWidth;
    obj["tail_enabled"] = tailEnabled;
    obj["tail_length"] = tailLength;
    obj["tail_width"] = tailWidth;
    return obj;
}

NumberStyle NumberStyle::fromJson(const QJsonObject& obj)
{
    NumberStyle style;

    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (!knownKeys().contains(it.key())) {
            qDebug() << "NumberStyle::fromJson: ignoring unknown key" << it.key();
        }
    }

    style.name = obj["name"].toString(style.name);
    style.fontFamily = obj["font_family"].toString(style.fontFamily);

    int size = obj["font_size"].toInt(style.fontSize);
    if (size > 0) {
        style.fontSize = size;
    }

    QColor text(obj["text_color"].toString());
    if (text.isValid()) {
        style.textColor = text;
    }
    QColor background(obj["bg_color"].toString());
    if (background.isValid()) {
        style.backgroundColor = background;
    }

    style.backgroundOpacity = std::clamp(obj["bg_opacity"].toDouble(style.backgroundOpacity), 0.0, 1.0);
    style.padding = std::max(0, obj["padding"].toInt(style.padding));
    style.borderEnabled = obj["border_enabled"].toBool(style.borderEnabled);
    style.borderWidth = std::max(0.0, obj["border_width"].toDouble(style.borderWidth));
    style.tailEnabled = obj["tail_enabled"].toBool(style.tailEnabled);
    style.tailLength = std::max(0.0, obj["tail_length"].toDouble(style.tailLength));
    style.tailWidth = std::max(0.0, obj["tail_width"].toDouble(style.tailWidth));

    return style;
}
