#pragma once

// ============================================================================
// StyleCatalog - Named style presets
// ============================================================================
// Seeded with a fixed set of built-in presets. "Default" always exists and
// cannot be deleted. Styles go in and come out as copies.
// ============================================================================

#include "NumberStyle.h"

#include <QString>
#include <QStringList>
#include <QVector>

class StyleCatalog {
public:
    static const QString DefaultName;   ///< "Default"

    /**
     * @brief Construct a catalog holding the built-in presets.
     */
    StyleCatalog();

    /**
     * @brief Insert or replace a preset, keyed by style.name.
     */
    void save(const NumberStyle& style);

    /**
     * @brief Delete a preset.
     * @return False for "Default" or an unknown name.
     */
    bool remove(const QString& name);

    /**
     * @brief Look up a preset.
     * @param name Preset name.
     * @param found Set to false when no such preset exists.
     * @return A copy of the preset, or a default style when not found.
     */
    NumberStyle get(const QString& name, bool* found = nullptr) const;

    bool contains(const QString& name) const { return indexOf(name) >= 0; }
    QStringList names() const;
    int count() const { return m_presets.size(); }

    // ===== Serialization =====

    /**
     * @brief Serialize as a JSON object mapping name to style.
     */
    QString toJson() const;

    /**
     * @brief Merge presets from JSON produced by toJson().
     * @param json JSON text.
     * @param errorMessage Receives a description on failure.
     * @return False on malformed input; the catalog is left untouched.
     */
    bool fromJson(const QString& json, QString* errorMessage = nullptr);

private:
    int indexOf(const QString& name) const;

    QVector<NumberStyle> m_presets;     ///< Insertion order is the display order
};
