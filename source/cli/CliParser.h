#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for seqmark.
 *
 * seqmark is headless: every invocation runs one command against one PDF
 * and exits.
 *
 * Supported commands:
 * - list: Print the numbers placed in a PDF
 * - validate: Check the sequence for missing numbers
 * - export: Write the annotation data to a JSON file
 * - import: Replace the annotations of a PDF from a JSON file
 * - insert: Place one number
 * - delete: Remove one number, optionally closing the gap
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No command given
    Help,           ///< Show help message
    Version,        ///< Show version information
    List,           ///< Print annotations sorted by number
    Validate,       ///< Report gaps in the sequence
    Export,         ///< Write store JSON
    Import,         ///< Replace annotations from store JSON
    Insert,         ///< Place one number
    Delete          ///< Remove one number
};

/**
 * @brief Output mode for CLI results.
 */
enum class OutputMode {
    Simple,         ///< Human-readable lines (default)
    Json            ///< JSON format for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< Command succeeded
    constexpr int Failure = 1;        ///< Sequence has gaps, or the edit was cancelled
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments or input data
    constexpr int IoError = 4;        ///< Can't read/write files
}

// =============================================================================
// CLI Detection
// =============================================================================

/**
 * @brief Quick check if the first argument names a command or help/version.
 *
 * Should be called before creating any Qt application object.
 */
bool isCliMode(int argc, char* argv[]);

/**
 * @brief Parse the command keyword from argv[1].
 * @return The detected command, or Command::None
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Get command name as string (e.g., "insert").
 */
QString commandName(Command cmd);

/**
 * @brief Find the --settings value without a full parse.
 *
 * Accepts "--settings <ini>" and "--settings=<ini>". Used before the
 * command is dispatched, e.g. to pick the translation.
 * @return The ini path, or an empty string for the platform store
 */
QString settingsPath(const QStringList& arguments);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Show help for a command, or general help for Command::None.
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run CLI operations.
 *
 * Parses arguments, executes the requested command, and returns an exit
 * code.
 *
 * @param app The QCoreApplication instance
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
