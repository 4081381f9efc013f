// ============================================================================
// seqmark - Main Entry Point
// ============================================================================

#include <QCoreApplication>
#include <QLocale>
#include <QStandardPaths>
#include <QStringList>
#include <QTranslator>

#include <memory>

#include "cli/CliParser.h"
#include "core/AppSettings.h"

// Test includes
#include "core/NumberTokenTests.h"
#include "core/NumberStyleTests.h"
#include "core/AnnotationStoreTests.h"
#include "core/UndoLogTests.h"
#include "core/AnnotationSessionTests.h"
#include "core/AppSettingsTests.h"
#include "pdf/MuPdfAnnotationSurfaceTests.h"
#include "cli/CliHandlerTests.h"

// ============================================================================
// Translations
// ============================================================================

static void loadTranslations(QCoreApplication& app, QTranslator& translator,
                             const AppSettings& settings)
{
    QString langCode = settings.language();
    if (langCode.isEmpty()) {
        langCode = QLocale::system().name().section('_', 0, 0);
    }

    const QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/seqmark/translations",
        "/usr/local/share/seqmark/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "seqmark/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (translator.load(path + "/seqmark_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
    bool success = false;

    if (testType == "token") {
        success = NumberTokenTests::runAllTests();
    } else if (testType == "style") {
        success = NumberStyleTests::runAllTests();
    } else if (testType == "store") {
        success = AnnotationStoreTests::runAllTests();
    } else if (testType == "undo") {
        success = UndoLogTests::runAllTests();
    } else if (testType == "session") {
        success = AnnotationSessionTests::runAllTests();
    } else if (testType == "settings") {
        success = AppSettingsTests::runAllTests();
    } else if (testType == "mupdf") {
        success = MuPdfAnnotationSurfaceTests::runAllTests();
    } else if (testType == "cli") {
        success = CliHandlerTests::runAllTests();
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("SeqMark");
    app.setApplicationName("App");
    app.setApplicationVersion("1.0.0");

    // Same preferences the command will use, so --settings picks the language too
    const QString iniPath = Cli::settingsPath(app.arguments());
    std::unique_ptr<AppSettings> settings = iniPath.isEmpty()
        ? std::make_unique<AppSettings>()
        : std::make_unique<AppSettings>(iniPath);

    QTranslator translator;
    loadTranslations(app, translator, *settings);

    // ========== CLI Commands ==========
    if (Cli::isCliMode(argc, argv)) {
        return Cli::run(app, argc, argv);
    }

    // ========== Test Flags ==========
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--test-token") {
            testToRun = "token";
        } else if (arg == "--test-style") {
            testToRun = "style";
        } else if (arg == "--test-store") {
            testToRun = "store";
        } else if (arg == "--test-undo") {
            testToRun = "undo";
        } else if (arg == "--test-session") {
            testToRun = "session";
        } else if (arg == "--test-settings") {
            testToRun = "settings";
        } else if (arg == "--test-mupdf") {
            testToRun = "mupdf";
        } else if (arg == "--test-cli") {
            testToRun = "cli";
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // No command: print usage
    return Cli::run(app, argc, argv);
}
