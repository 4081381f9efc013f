// ============================================================================
// StyleCatalog - Implementation
// ============================================================================

#include "StyleCatalog.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>

const QString StyleCatalog::DefaultName = QStringLiteral("Default");

StyleCatalog::StyleCatalog()
{
    m_presets.append(NumberStyle());
    m_presets.append(NumberStyle::create(QStringLiteral("Red on White"),
                                         QColor(255, 0, 0), QColor(255, 255, 255)));
    m_presets.append(NumberStyle::create(QStringLiteral("White on Black"),
                                         QColor(255, 255, 255), QColor(0, 0, 0)));
    m_presets.append(NumberStyle::create(QStringLiteral("Large Yellow"),
                                         QColor(0, 0, 0), QColor(255, 255, 0), 72));
    m_presets.append(NumberStyle::create(QStringLiteral("Subtle Gray"),
                                         QColor(0x33, 0x33, 0x33), QColor(0xCC, 0xCC, 0xCC), 24, 0.7));
}

int StyleCatalog::indexOf(const QString& name) const
{
    for (int i = 0; i < m_presets.size(); ++i) {
        if (m_presets[i].name == name) {
            return i;
        }
    }
    return -1;
}

void StyleCatalog::save(const NumberStyle& style)
{
    int index = indexOf(style.name);
    if (index >= 0) {
        m_presets[index] = style.copy();
    } else {
        m_presets.append(style.copy());
    }
}

bool StyleCatalog::remove(const QString& name)
{
    if (name == DefaultName) {
        return false;
    }
    int index = indexOf(name);
    if (index < 0) {
        return false;
    }
    m_presets.remove(index);
    return true;
}

NumberStyle StyleCatalog::get(const QString& name, bool* found) const
{
    int index = indexOf(name);
    if (found) {
        *found = (index >= 0);
    }
    if (index < 0) {
        return NumberStyle();
    }
    return m_presets[index].copy();
}

QStringList StyleCatalog::names() const
{
    QStringList result;
    for (const NumberStyle& style : m_presets) {
        result.append(style.name);
    }
    return result;
}

QString StyleCatalog::toJson() const
{
    QJsonObject obj;
    for (const NumberStyle& style : m_presets) {
        obj[style.name] = style.toJson();
    }
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

bool StyleCatalog::fromJson(const QString& json, QString* errorMessage)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "StyleCatalog::fromJson: parse error" << parseError.errorString();
        if (errorMessage) {
            *errorMessage = parseError.errorString();
        }
        return false;
    }
    if (!doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Style presets must be a JSON object");
        }
        return false;
    }

    // Validate everything before touching the catalog
    QVector<NumberStyle> loaded;
    const QJsonObject root = doc.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (!it.value().isObject()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Preset '%1' is not an object").arg(it.key());
            }
            return false;
        }
        NumberStyle style = NumberStyle::fromJson(it.value().toObject());
        style.name = it.key();  // the mapping key wins over the embedded name
        loaded.append(style);
    }

    for (const NumberStyle& style : loaded) {
        save(style);
    }
    qDebug() << "StyleCatalog: loaded" << loaded.size() << "presets";
    return true;
}
