#include "CliParser.h"
#include "CliHandler.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Application version (matches CMakeLists.txt project VERSION)
static const char* APP_VERSION = "1.0.0";

struct CommandEntry {
    const char* name;
    Command command;
};

static const CommandEntry COMMANDS[] = {
    {"list",     Command::List},
    {"validate", Command::Validate},
    {"export",   Command::Export},
    {"import",   Command::Import},
    {"insert",   Command::Insert},
    {"delete",   Command::Delete},
};

// =============================================================================
// CLI Detection
// =============================================================================

bool isCliMode(int argc, char* argv[])
{
    return parseCommand(argc, argv) != Command::None;
}

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    for (const CommandEntry& entry : COMMANDS) {
        if (std::strcmp(arg1, entry.name) == 0) {
            return entry.command;
        }
    }

    // Global flags
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    return Command::None;
}

QString commandName(Command cmd)
{
    for (const CommandEntry& entry : COMMANDS) {
        if (entry.command == cmd) {
            return QString::fromLatin1(entry.name);
        }
    }
    switch (cmd) {
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

QString settingsPath(const QStringList& arguments)
{
    const QString option = QStringLiteral("--settings");
    const QString prefix = option + QLatin1Char('=');

    // Skip argv[0]; the last occurrence wins, as in QCommandLineParser::value()
    QString path;
    for (int i = 1; i < arguments.size(); ++i) {
        const QString& arg = arguments.at(i);
        if (arg == option && i + 1 < arguments.size()) {
            path = arguments.at(++i);
        } else if (arg.startsWith(prefix)) {
            path = arg.mid(prefix.size());
        }
    }
    return path;
}

// =============================================================================
// Parser Setup
// =============================================================================

static void addPdfArgument(QCommandLineParser& parser)
{
    parser.addPositionalArgument(
        QStringLiteral("pdf"),
        QCoreApplication::translate("CLI", "PDF document"),
        QStringLiteral("<pdf>"));
}

static void addOutputOption(QCommandLineParser& parser, const QString& description)
{
    parser.addOption(QCommandLineOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        description,
        QStringLiteral("path")));
}

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "seqmark - Numbered annotations for PDF documents"));

    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOption(QCommandLineOption(
        QStringLiteral("settings"),
        QCoreApplication::translate("CLI", "Read preferences from this ini file"),
        QStringLiteral("ini")));

    switch (cmd) {
        case Command::List:
        case Command::Validate:
            addPdfArgument(parser);
            parser.addOption(QCommandLineOption(
                QStringLiteral("json"),
                QCoreApplication::translate("CLI", "Output results as JSON")));
            break;

        case Command::Export:
            addPdfArgument(parser);
            addOutputOption(parser, QCoreApplication::translate("CLI", "JSON file to write"));
            break;

        case Command::Import:
            addPdfArgument(parser);
            parser.addPositionalArgument(
                QStringLiteral("json"),
                QCoreApplication::translate("CLI", "Annotation data written by 'export'"),
                QStringLiteral("<json>"));
            addOutputOption(parser, QCoreApplication::translate("CLI", "PDF file to write"));
            break;

        case Command::Insert:
            addPdfArgument(parser);
            parser.addOption(QCommandLineOption(
                QStringLiteral("page"),
                QCoreApplication::translate("CLI", "Page number, starting at 1"),
                QStringLiteral("N")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("x"),
                QCoreApplication::translate("CLI", "Left edge in points"),
                QStringLiteral("X")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("y"),
                QCoreApplication::translate("CLI", "Top edge in points"),
                QStringLiteral("Y")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("label"),
                QCoreApplication::translate("CLI", "Number to place (default: next whole number)"),
                QStringLiteral("L")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("style"),
                QCoreApplication::translate("CLI", "Style preset (default: current style)"),
                QStringLiteral("name")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("on-duplicate"),
                QCoreApplication::translate("CLI", "advance, sub or cancel (default: cancel)"),
                QStringLiteral("mode"),
                QStringLiteral("cancel")));
            addOutputOption(parser, QCoreApplication::translate("CLI", "PDF file to write"));
            break;

        case Command::Delete:
            addPdfArgument(parser);
            parser.addOption(QCommandLineOption(
                QStringLiteral("label"),
                QCoreApplication::translate("CLI", "Number to remove"),
                QStringLiteral("L")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("renumber"),
                QCoreApplication::translate("CLI", "Shift the following numbers down by one")));
            addOutputOption(parser, QCoreApplication::translate("CLI", "PDF file to write"));
            break;

        default:
            // No command-specific options for Help/Version/None
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: seqmark <command> [options] <pdf>\n"
            "\n"
            "seqmark - Numbered annotations for PDF documents.\n"
            "\n"
            "COMMANDS:\n"
            "  list            Print the numbers in a PDF, sorted\n"
            "  validate        Report missing numbers\n"
            "  export          Write annotation data to JSON\n"
            "  import          Replace annotations from JSON\n"
            "  insert          Place a number\n"
            "  delete          Remove a number\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "  --settings <ini> Use this preferences file\n"
            "\n"
            "EXAMPLES:\n"
            "  seqmark insert plan.pdf --page 1 --x 100 --y 200 -o plan.pdf\n"
            "  seqmark insert plan.pdf --page 2 --x 50 --y 80 --label 5 --on-duplicate advance -o plan.pdf\n"
            "  seqmark delete plan.pdf --label 4 --renumber -o plan.pdf\n"
            "  seqmark validate plan.pdf\n"
            "\n"
            "EXIT CODES:\n"
            "  0   Success\n"
            "  1   Sequence has gaps, or the edit was cancelled\n"
            "  3   Invalid arguments or input data\n"
            "  4   File could not be read or written\n"
            "\n"
            "Run 'seqmark <command> --help' for command-specific options.\n");
    } else {
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "seqmark " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    Command cmd = parseCommand(argc, argv);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // Build argument list without the command name
    // (QCommandLineParser doesn't understand subcommands)
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    switch (cmd) {
        case Command::List:
            return handleList(parser);
        case Command::Validate:
            return handleValidate(parser);
        case Command::Export:
            return handleExport(parser);
        case Command::Import:
            return handleImport(parser);
        case Command::Insert:
            return handleInsert(parser);
        case Command::Delete:
            return handleDelete(parser);
        default:
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
