#include "CliHandler.h"
#include "CliReporter.h"
#include "../core/AnnotationSession.h"
#include "../core/AppSettings.h"
#include "../core/StyleCatalog.h"
#include "../pdf/MuPdfAnnotationSurface.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <memory>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    // "json" is only an option for some commands; optionNames() avoids
    // QCommandLineParser's warning about undefined options
    if (parser.optionNames().contains(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    return OutputMode::Simple;
}

static std::unique_ptr<AppSettings> openSettings(const QCommandLineParser& parser)
{
    const QString iniPath = parser.value(QStringLiteral("settings"));
    if (iniPath.isEmpty()) {
        return std::make_unique<AppSettings>();
    }
    return std::make_unique<AppSettings>(iniPath);
}

static QString absolutePath(const QString& path)
{
    return QDir::cleanPath(QDir::current().absoluteFilePath(path));
}

// Read-only commands can report on a document whose embedded data is
// damaged; commands that write would replace that data with an empty store
enum class DamagedData {
    Warn,
    Fail
};

/**
 * @brief Open the PDF named by the first positional argument and load the
 *        annotation data embedded in it.
 * @param damaged What to do when the embedded data cannot be loaded
 * @return ExitCode::Success, or the code to exit with
 */
static int openDocument(const QCommandLineParser& parser,
                        MuPdfAnnotationSurface& surface,
                        AnnotationSession& session,
                        ConsoleReporter& reporter,
                        DamagedData damaged = DamagedData::Warn)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "No PDF specified. Use 'seqmark <command> --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    if (!surface.isValid()) {
        reporter.reportError(QCoreApplication::translate("CLI", "PDF engine failed to start."));
        return ExitCode::IoError;
    }

    const QString pdfPath = absolutePath(positional.first());
    if (!surface.open(pdfPath)) {
        reporter.reportError(QCoreApplication::translate("CLI", "Cannot open %1").arg(pdfPath));
        return ExitCode::IoError;
    }

    const QString json = surface.readStoreMetadata();
    if (!json.isEmpty()) {
        QString error;
        if (!session.store().fromJson(json, &error)) {
            if (damaged == DamagedData::Fail) {
                reporter.reportError(QCoreApplication::translate("CLI",
                    "Damaged annotation data in %1: %2").arg(pdfPath, error));
                return ExitCode::IoError;
            }
            reporter.reportWarning(QCoreApplication::translate("CLI",
                "Ignoring damaged annotation data in %1: %2").arg(pdfPath, error));
        }
    }

    const int pages = surface.pageCount();
    for (const NumberAnnotation* annotation : session.store().all()) {
        if (annotation->page >= pages) {
            reporter.reportWarning(QCoreApplication::translate("CLI",
                "#%1 is on page %2, but the document has %3 pages")
                .arg(annotation->label)
                .arg(annotation->page + 1)
                .arg(pages));
        }
    }

    surface.refreshLocators(session.store());
    session.store().clearModified();
    session.setSurface(&surface);
    return ExitCode::Success;
}

static QString requireOutput(const QCommandLineParser& parser, ConsoleReporter& reporter)
{
    const QString outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify destination."));
        return QString();
    }
    return absolutePath(outputPath);
}

/**
 * @brief Embed the store and write the PDF.
 */
static int saveDocument(MuPdfAnnotationSurface& surface,
                        AnnotationSession& session,
                        const QString& outputPath,
                        AppSettings& settings,
                        ConsoleReporter& reporter)
{
    if (!surface.writeStoreMetadata(session.store().toJson())) {
        reporter.reportError(QCoreApplication::translate("CLI", "Cannot embed annotation data."));
        return ExitCode::IoError;
    }
    if (!surface.save(outputPath)) {
        reporter.reportError(QCoreApplication::translate("CLI", "Cannot write %1").arg(outputPath));
        return ExitCode::IoError;
    }

    surface.refreshLocators(session.store());
    session.store().clearModified();

    settings.addRecentFile(outputPath);
    settings.sync();

    reporter.reportSaved(outputPath, session.store().count());
    return ExitCode::Success;
}

static int exitCodeFromEdit(const EditResult& result)
{
    switch (result.status) {
        case EditResult::Applied:      return ExitCode::Success;
        case EditResult::Cancelled:    return ExitCode::Failure;
        case EditResult::InvalidLabel: return ExitCode::InvalidArgs;
        case EditResult::NotFound:     return ExitCode::InvalidArgs;
    }
    return ExitCode::InvalidArgs;
}

// =============================================================================
// Read-only Handlers
// =============================================================================

int handleList(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    std::unique_ptr<AppSettings> settings = openSettings(parser);
    MuPdfAnnotationSurface surface;
    AnnotationSession session(settings->undoDepth());

    const int code = openDocument(parser, surface, session, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    reporter.reportAnnotations(session.store().allSorted());
    return ExitCode::Success;
}

int handleValidate(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    std::unique_ptr<AppSettings> settings = openSettings(parser);
    MuPdfAnnotationSurface surface;
    AnnotationSession session(settings->undoDepth());

    const int code = openDocument(parser, surface, session, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    const SequenceValidation validation = session.store().validateSequence();
    reporter.reportValidation(validation);
    return validation.valid ? ExitCode::Success : ExitCode::Failure;
}

int handleExport(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    std::unique_ptr<AppSettings> settings = openSettings(parser);

    const QString outputPath = requireOutput(parser, reporter);
    if (outputPath.isEmpty()) {
        return ExitCode::InvalidArgs;
    }

    MuPdfAnnotationSurface surface;
    AnnotationSession session(settings->undoDepth());
    const int code = openDocument(parser, surface, session, reporter, DamagedData::Fail);
    if (code != ExitCode::Success) {
        return code;
    }

    QFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        reporter.reportError(QCoreApplication::translate("CLI", "Cannot write %1: %2")
                             .arg(outputPath, file.errorString()));
        return ExitCode::IoError;
    }
    const QByteArray data = session.store().toJson().toUtf8();
    if (file.write(data) != data.size()) {
        reporter.reportError(QCoreApplication::translate("CLI", "Cannot write %1: %2")
                             .arg(outputPath, file.errorString()));
        return ExitCode::IoError;
    }
    file.close();

    reporter.reportSaved(outputPath, session.store().count());
    return ExitCode::Success;
}

// =============================================================================
// Editing Handlers
// =============================================================================

int handleImport(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    std::unique_ptr<AppSettings> settings = openSettings(parser);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() < 2) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "Usage: seqmark import <pdf> <json> -o <output.pdf>"));
        return ExitCode::InvalidArgs;
    }
    const QString outputPath = requireOutput(parser, reporter);
    if (outputPath.isEmpty()) {
        return ExitCode::InvalidArgs;
    }

    const QString jsonPath = absolutePath(positional.at(1));
    QFile jsonFile(jsonPath);
    if (!jsonFile.open(QIODevice::ReadOnly)) {
        reporter.reportError(QCoreApplication::translate("CLI", "Cannot read %1: %2")
                             .arg(jsonPath, jsonFile.errorString()));
        return ExitCode::IoError;
    }
    const QString json = QString::fromUtf8(jsonFile.readAll());
    jsonFile.close();

    MuPdfAnnotationSurface surface;
    if (!surface.isValid()) {
        reporter.reportError(QCoreApplication::translate("CLI", "PDF engine failed to start."));
        return ExitCode::IoError;
    }
    const QString pdfPath = absolutePath(positional.first());
    if (!surface.open(pdfPath)) {
        reporter.reportError(QCoreApplication::translate("CLI", "Cannot open %1").arg(pdfPath));
        return ExitCode::IoError;
    }

    // Headless session: the surface is rebuilt in one pass below
    AnnotationSession session(settings->undoDepth());
    QString error;
    if (!session.replaceAll(json, &error)) {
        reporter.reportError(QCoreApplication::translate("CLI", "Invalid annotation data in %1: %2")
                             .arg(jsonPath, error));
        return ExitCode::InvalidArgs;
    }

    const int pages = surface.pageCount();
    for (const NumberAnnotation* annotation : session.store().all()) {
        if (annotation->page >= pages) {
            reporter.reportError(QCoreApplication::translate("CLI",
                "#%1 is on page %2, but the document has %3 pages")
                .arg(annotation->label)
                .arg(annotation->page + 1)
                .arg(pages));
            return ExitCode::InvalidArgs;
        }
    }

    surface.rebuild(session.store());
    return saveDocument(surface, session, outputPath, *settings, reporter);
}

int handleInsert(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    std::unique_ptr<AppSettings> settings = openSettings(parser);

    const QString outputPath = requireOutput(parser, reporter);
    if (outputPath.isEmpty()) {
        return ExitCode::InvalidArgs;
    }

    // Duplicate policy
    const QString mode = parser.value(QStringLiteral("on-duplicate"));
    DuplicateResolution resolution = DuplicateResolution::Cancel;
    if (mode == QLatin1String("advance")) {
        resolution = DuplicateResolution::AutoAdvance;
    } else if (mode == QLatin1String("sub")) {
        resolution = DuplicateResolution::UseSubNumber;
    } else if (mode != QLatin1String("cancel")) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "Unknown --on-duplicate mode '%1' (expected advance, sub or cancel)").arg(mode));
        return ExitCode::InvalidArgs;
    }

    // Position
    bool pageOk = false;
    bool xOk = false;
    bool yOk = false;
    const int page = parser.value(QStringLiteral("page")).toInt(&pageOk);
    const double x = parser.value(QStringLiteral("x")).toDouble(&xOk);
    const double y = parser.value(QStringLiteral("y")).toDouble(&yOk);
    if (!pageOk || !xOk || !yOk) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "--page, --x and --y are required numbers."));
        return ExitCode::InvalidArgs;
    }

    // Style
    NumberStyle style = settings->currentStyle();
    if (parser.isSet(QStringLiteral("style"))) {
        StyleCatalog catalog;
        settings->loadPresets(catalog);
        const QString styleName = parser.value(QStringLiteral("style"));
        bool found = false;
        style = catalog.get(styleName, &found);
        if (!found) {
            reporter.reportError(QCoreApplication::translate("CLI",
                "Unknown style '%1'. Available: %2")
                .arg(styleName, catalog.names().join(QStringLiteral(", "))));
            return ExitCode::InvalidArgs;
        }
    }

    MuPdfAnnotationSurface surface;
    AnnotationSession session(settings->undoDepth());
    const int code = openDocument(parser, surface, session, reporter, DamagedData::Fail);
    if (code != ExitCode::Success) {
        return code;
    }

    if (page < 1 || page > surface.pageCount()) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "Page %1 is out of range (1-%2)").arg(page).arg(surface.pageCount()));
        return ExitCode::InvalidArgs;
    }

    const QString label = parser.isSet(QStringLiteral("label"))
        ? parser.value(QStringLiteral("label"))
        : session.store().nextWholeNumber();
    if (label.isEmpty()) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "No number left to insert (highest is %1).").arg(NumberToken::MAX_COMPONENT));
        return ExitCode::InvalidArgs;
    }

    const EditResult result = session.insertAnnotation(page - 1, QPointF(x, y), label, style, resolution);
    reporter.reportEdit(result);
    if (!result.isApplied()) {
        return exitCodeFromEdit(result);
    }

    return saveDocument(surface, session, outputPath, *settings, reporter);
}

int handleDelete(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    std::unique_ptr<AppSettings> settings = openSettings(parser);

    const QString outputPath = requireOutput(parser, reporter);
    if (outputPath.isEmpty()) {
        return ExitCode::InvalidArgs;
    }

    const QString label = parser.value(QStringLiteral("label"));
    if (label.isEmpty()) {
        reporter.reportError(QCoreApplication::translate("CLI", "--label is required."));
        return ExitCode::InvalidArgs;
    }

    MuPdfAnnotationSurface surface;
    AnnotationSession session(settings->undoDepth());
    const int code = openDocument(parser, surface, session, reporter, DamagedData::Fail);
    if (code != ExitCode::Success) {
        return code;
    }

    const NumberAnnotation* target = session.store().getByLabel(label);
    if (!target) {
        reporter.reportError(QCoreApplication::translate("CLI", "No annotation #%1").arg(label));
        return ExitCode::InvalidArgs;
    }

    const DeleteRenumber renumber = parser.isSet(QStringLiteral("renumber"))
        ? DeleteRenumber::DecreaseFollowing
        : DeleteRenumber::KeepNumbers;

    const QString targetId = target->id;
    const EditResult result = session.deleteAnnotation(targetId, renumber);
    reporter.reportEdit(result);
    if (!result.isApplied()) {
        return exitCodeFromEdit(result);
    }

    return saveDocument(surface, session, outputPath, *settings, reporter);
}

} // namespace Cli
