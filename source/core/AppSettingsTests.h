#pragma once

// ============================================================================
// AppSettingsTests - Unit tests for persisted preferences
// ============================================================================
// Every test works on an ini file inside a QTemporaryDir so the user's real
// settings are never touched.
// ============================================================================

#include "AppSettings.h"

#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QTemporaryDir>

namespace AppSettingsTests {

/**
 * @brief Test that values survive a reopen of the settings file.
 */
inline bool testRoundTrip()
{
    qDebug() << "=== Test: Settings Round-Trip ===";

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: could not create temp dir";
        return false;
    }
    const QString iniPath = dir.filePath("settings.ini");

    bool success = true;
    const NumberStyle style = NumberStyle::create("Mine", QColor("#112233"), QColor("#FFEEDD"), 30, 0.5);

    {
        AppSettings settings(iniPath);
        StyleCatalog catalog;
        catalog.save(style);
        settings.savePresets(catalog);
        settings.setCurrentStyle(style);
        settings.setUndoDepth(80);
        settings.setLanguage("de");
        settings.sync();
    }

    AppSettings reopened(iniPath);
    StyleCatalog loaded;
    if (!reopened.loadPresets(loaded) || !loaded.contains("Mine") || loaded.get("Mine") != style) {
        qDebug() << "FAIL: presets not restored";
        success = false;
    }
    if (reopened.currentStyle() != style) {
        qDebug() << "FAIL: current style not restored";
        success = false;
    }
    if (reopened.undoDepth() != 80) {
        qDebug() << "FAIL: undo depth" << reopened.undoDepth();
        success = false;
    }
    if (reopened.language() != "de") {
        qDebug() << "FAIL: language" << reopened.language();
        success = false;
    }

    // Fresh file falls back to defaults
    AppSettings fresh(dir.filePath("empty.ini"));
    StyleCatalog builtIns;
    if (fresh.currentStyle() != NumberStyle() || fresh.undoDepth() != AppSettings::DEFAULT_UNDO_DEPTH
        || !fresh.recentFiles().isEmpty() || !fresh.loadPresets(builtIns) || builtIns.count() != 5) {
        qDebug() << "FAIL: defaults for an empty settings file";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Settings round-trip";
    }
    return success;
}

/**
 * @brief Test recent-file ordering, dedup and cap.
 */
inline bool testRecentFiles()
{
    qDebug() << "=== Test: Recent Files ===";

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: could not create temp dir";
        return false;
    }

    bool success = true;
    AppSettings settings(dir.filePath("settings.ini"));

    const QString a = dir.filePath("a.pdf");
    const QString b = dir.filePath("b.pdf");
    settings.addRecentFile(a);
    settings.addRecentFile(b);
    settings.addRecentFile(dir.path() + "/sub/../a.pdf");

    const QStringList files = settings.recentFiles();
    if (files.size() != 2 || files.first() != QDir::cleanPath(a)) {
        qDebug() << "FAIL: re-adding a should move it to the front once" << files;
        success = false;
    }

    for (int i = 0; i < 15; ++i) {
        settings.addRecentFile(dir.filePath(QString("doc%1.pdf").arg(i)));
    }
    const QStringList capped = settings.recentFiles();
    if (capped.size() != AppSettings::MAX_RECENT_FILES
        || capped.first() != QDir::cleanPath(dir.filePath("doc14.pdf"))) {
        qDebug() << "FAIL: list should be capped at" << AppSettings::MAX_RECENT_FILES << capped;
        success = false;
    }

    settings.removeRecentFile(dir.filePath("doc14.pdf"));
    if (settings.recentFiles().contains(QDir::cleanPath(dir.filePath("doc14.pdf")))) {
        qDebug() << "FAIL: removeRecentFile()";
        success = false;
    }

    settings.clearRecentFiles();
    if (!settings.recentFiles().isEmpty()) {
        qDebug() << "FAIL: clearRecentFiles()";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Recent files maintained";
    }
    return success;
}

/**
 * @brief Test clamping and damaged stored values.
 */
inline bool testClampingAndDamage()
{
    qDebug() << "=== Test: Clamping / Damaged Values ===";

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: could not create temp dir";
        return false;
    }
    const QString iniPath = dir.filePath("settings.ini");

    bool success = true;
    AppSettings settings(iniPath);

    settings.setUndoDepth(0);
    if (settings.undoDepth() != AppSettings::MIN_UNDO_DEPTH) {
        qDebug() << "FAIL: depth 0 should clamp to" << AppSettings::MIN_UNDO_DEPTH;
        success = false;
    }
    settings.setUndoDepth(100000);
    if (settings.undoDepth() != AppSettings::MAX_UNDO_DEPTH) {
        qDebug() << "FAIL: huge depth should clamp to" << AppSettings::MAX_UNDO_DEPTH;
        success = false;
    }
    settings.sync();

    // Write garbage behind the wrapper's back
    {
        QSettings raw(iniPath, QSettings::IniFormat);
        raw.setValue("style_presets", "{not json");
        raw.setValue("current_style", "[1, 2");
        raw.setValue("undo_depth", "lots");
        raw.sync();
    }

    AppSettings damaged(iniPath);
    StyleCatalog catalog;
    if (damaged.loadPresets(catalog)) {
        qDebug() << "FAIL: damaged presets should report failure";
        success = false;
    }
    if (catalog.count() != 5) {
        qDebug() << "FAIL: damaged presets should leave the built-ins alone";
        success = false;
    }
    if (damaged.currentStyle() != NumberStyle()) {
        qDebug() << "FAIL: damaged current style should fall back to the default";
        success = false;
    }
    if (damaged.undoDepth() != AppSettings::DEFAULT_UNDO_DEPTH) {
        qDebug() << "FAIL: non-numeric depth should fall back to the default";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Bad values clamped or ignored";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running AppSettings Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testRoundTrip();
    qDebug() << "";

    allPass &= testRecentFiles();
    qDebug() << "";

    allPass &= testClampingAndDamage();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL APPSETTINGS TESTS PASSED!";
    } else {
        qDebug() << "SOME APPSETTINGS TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace AppSettingsTests
