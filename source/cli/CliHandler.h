#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for seqmark.
 *
 * Each handler reads its options, opens the PDF through
 * MuPdfAnnotationSurface, loads the embedded annotation data into an
 * AnnotationSession, performs the command, and writes the result.
 */

#include "CliParser.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the list command.
 *
 * Prints every annotation sorted by number (--json for scripting).
 */
int handleList(const QCommandLineParser& parser);

/**
 * @brief Handle the validate command.
 * @return ExitCode::Success if the sequence is complete, ExitCode::Failure on gaps
 */
int handleValidate(const QCommandLineParser& parser);

/**
 * @brief Handle the export command (annotation data to a JSON file).
 */
int handleExport(const QCommandLineParser& parser);

/**
 * @brief Handle the import command.
 *
 * Replaces all annotations with the JSON contents, redraws every mark,
 * embeds the data and saves to --output.
 */
int handleImport(const QCommandLineParser& parser);

/**
 * @brief Handle the insert command.
 *
 * A taken label is resolved by --on-duplicate (advance, sub or cancel).
 */
int handleInsert(const QCommandLineParser& parser);

/**
 * @brief Handle the delete command.
 *
 * --renumber shifts the following whole numbers down by one.
 */
int handleDelete(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode from parser options.
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

} // namespace Cli

#endif // CLIHANDLER_H
