#pragma once

// ============================================================================
// NumberStyle - Visual style of a number annotation
// ============================================================================
// A plain value type. Presets and annotations each own their own copy, so
// editing the style currently shown in the toolbar never rewrites the
// annotations or presets that were created from it.
// ============================================================================

#include <QString>
#include <QColor>
#include <QJsonObject>

class NumberStyle {
public:
    // ===== Text =====
    QString name = QStringLiteral("Default");       ///< Display name (preset key)
    QString fontFamily = QStringLiteral("Arial");   ///< Font family
    int fontSize = 24;                              ///< Font size in points (> 0)
    QColor textColor = QColor(0, 0, 0);             ///< Text color

    // ===== Box =====
    QColor backgroundColor = QColor(255, 255, 0);   ///< Fill color
    qreal backgroundOpacity = 1.0;                  ///< Fill opacity (0.0 - 1.0)
    int padding = 4;                                ///< Space between text and box edge

    // ===== Border =====
    bool borderEnabled = false;
    qreal borderWidth = 1.0;

    // ===== Tail (leader line) =====
    bool tailEnabled = false;
    qreal tailLength = 30.0;
    qreal tailWidth = 2.0;

    NumberStyle() = default;

    /**
     * @brief Create a style with the given name and colors, other fields default.
     */
    static NumberStyle create(const QString& styleName,
                              const QColor& text,
                              const QColor& background,
                              int size = 24,
                              qreal opacity = 1.0);

    /**
     * @brief Return an independent copy.
     *
     * Spelled out at every point where a style changes owner (toolbar to
     * preset, preset to annotation) so the hand-over reads as a copy.
     */
    NumberStyle copy() const { return *this; }

    bool operator==(const NumberStyle& other) const;
    bool operator!=(const NumberStyle& other) const { return !(*this == other); }

    // ===== Serialization =====

    QJsonObject toJson() const;

    /**
     * @brief Build a style from JSON.
     * @param obj JSON object; missing keys keep their defaults, unknown keys
     *            are ignored, out-of-range values are clamped.
     */
    static NumberStyle fromJson(const QJsonObject& obj);
};
