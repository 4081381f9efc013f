#include "AppSettings.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSettings>

#include <algorithm>

static const char* KEY_STYLE_PRESETS = "style_presets";
static const char* KEY_CURRENT_STYLE = "current_style";
static const char* KEY_RECENT_FILES = "recent_files";
static const char* KEY_UNDO_DEPTH = "undo_depth";
static const char* KEY_LANGUAGE = "language";

AppSettings::AppSettings()
    : m_settings(std::make_unique<QSettings>(QStringLiteral("SeqMark"), QStringLiteral("App")))
{
}

AppSettings::AppSettings(const QString& iniPath)
    : m_settings(std::make_unique<QSettings>(iniPath, QSettings::IniFormat))
{
}

AppSettings::~AppSettings() = default;

// ============================================================================
// Style presets
// ============================================================================

bool AppSettings::loadPresets(StyleCatalog& catalog) const
{
    const QString json = m_settings->value(KEY_STYLE_PRESETS).toString();
    if (json.isEmpty()) {
        return true;
    }

    QString error;
    if (!catalog.fromJson(json, &error)) {
        qWarning() << "[AppSettings] Ignoring stored presets:" << error;
        return false;
    }
    return true;
}

void AppSettings::savePresets(const StyleCatalog& catalog)
{
    m_settings->setValue(KEY_STYLE_PRESETS, catalog.toJson());
}

NumberStyle AppSettings::currentStyle() const
{
    const QString json = m_settings->value(KEY_CURRENT_STYLE).toString();
    if (json.isEmpty()) {
        return NumberStyle();
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[AppSettings] Ignoring stored current style:" << parseError.errorString();
        return NumberStyle();
    }
    return NumberStyle::fromJson(doc.object());
}

void AppSettings::setCurrentStyle(const NumberStyle& style)
{
    const QJsonDocument doc(style.toJson());
    m_settings->setValue(KEY_CURRENT_STYLE, QString::fromUtf8(doc.toJson(QJsonDocument::Compact)));
}

// ============================================================================
// Recent files
// ============================================================================

QString AppSettings::normalizePath(const QString& path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

QStringList AppSettings::recentFiles() const
{
    QStringList files;
    for (const QString& path : m_settings->value(KEY_RECENT_FILES).toStringList()) {
        if (!path.isEmpty() && !files.contains(path)) {
            files.append(path);
        }
    }
    while (files.size() > MAX_RECENT_FILES) {
        files.removeLast();
    }
    return files;
}

void AppSettings::addRecentFile(const QString& path)
{
    if (path.isEmpty()) return;

    const QString normalized = normalizePath(path);
    QStringList files = recentFiles();
    files.removeAll(normalized);
    files.prepend(normalized);

    while (files.size() > MAX_RECENT_FILES) {
        files.removeLast();
    }
    m_settings->setValue(KEY_RECENT_FILES, files);
}

void AppSettings::removeRecentFile(const QString& path)
{
    if (path.isEmpty()) return;

    QStringList files = recentFiles();
    if (files.removeAll(normalizePath(path)) > 0 || files.removeAll(path) > 0) {
        m_settings->setValue(KEY_RECENT_FILES, files);
    }
}

void AppSettings::clearRecentFiles()
{
    m_settings->remove(KEY_RECENT_FILES);
}

// ============================================================================
// Misc
// ============================================================================

int AppSettings::undoDepth() const
{
    bool ok = false;
    const int depth = m_settings->value(KEY_UNDO_DEPTH, DEFAULT_UNDO_DEPTH).toInt(&ok);
    if (!ok) {
        return DEFAULT_UNDO_DEPTH;
    }
    return std::clamp(depth, MIN_UNDO_DEPTH, MAX_UNDO_DEPTH);
}

void AppSettings::setUndoDepth(int depth)
{
    m_settings->setValue(KEY_UNDO_DEPTH, std::clamp(depth, MIN_UNDO_DEPTH, MAX_UNDO_DEPTH));
}

QString AppSettings::language() const
{
    return m_settings->value(KEY_LANGUAGE).toString();
}

void AppSettings::setLanguage(const QString& language)
{
    m_settings->setValue(KEY_LANGUAGE, language);
}

void AppSettings::sync()
{
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "[AppSettings] Failed to write" << m_settings->fileName();
    }
}

QString AppSettings::fileName() const
{
    return m_settings->fileName();
}
