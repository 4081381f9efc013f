#pragma once

// ============================================================================
// AppSettings - Persistent user preferences
// ============================================================================
// Thin wrapper over QSettings. Created once by the shell at startup and
// passed to whoever needs it; the core classes never read settings on their
// own.
//
// Stored JSON (presets, current style) that fails to parse is logged and
// ignored so a damaged settings file never blocks startup.
// ============================================================================

#include "NumberStyle.h"
#include "StyleCatalog.h"

#include <QString>
#include <QStringList>
#include <memory>

class QSettings;

class AppSettings {
public:
    static constexpr int MAX_RECENT_FILES = 10;
    static constexpr int DEFAULT_UNDO_DEPTH = 50;
    static constexpr int MIN_UNDO_DEPTH = 1;
    static constexpr int MAX_UNDO_DEPTH = 500;

    /**
     * @brief Use the platform settings store ("SeqMark" / "App").
     */
    AppSettings();

    /**
     * @brief Use an explicit ini file (portable installs, tests).
     */
    explicit AppSettings(const QString& iniPath);

    ~AppSettings();

    AppSettings(const AppSettings&) = delete;
    AppSettings& operator=(const AppSettings&) = delete;

    // ===== Style presets =====

    /**
     * @brief Merge the stored presets into a catalog.
     * @return False if stored presets exist but could not be parsed.
     */
    bool loadPresets(StyleCatalog& catalog) const;
    void savePresets(const StyleCatalog& catalog);

    /**
     * @brief Style last selected in the toolbar.
     * @return The stored style, or a default style if none is stored.
     */
    NumberStyle currentStyle() const;
    void setCurrentStyle(const NumberStyle& style);

    // ===== Recent files =====

    QStringList recentFiles() const;

    /**
     * @brief Move a file to the front of the recent list.
     *
     * Duplicates are removed and the list is capped at MAX_RECENT_FILES.
     */
    void addRecentFile(const QString& path);
    void removeRecentFile(const QString& path);
    void clearRecentFiles();

    // ===== Misc =====

    int undoDepth() const;
    void setUndoDepth(int depth);

    QString language() const;
    void setLanguage(const QString& language);

    /**
     * @brief Flush pending writes to storage.
     */
    void sync();

    QString fileName() const;

private:
    static QString normalizePath(const QString& path);

    std::unique_ptr<QSettings> m_settings;
};
