#ifndef CLIREPORTER_H
#define CLIREPORTER_H

/**
 * @file CliReporter.h
 * @brief Console output for CLI commands.
 *
 * Formats command results for terminal display. Supports two output modes:
 * - Simple: Human-readable lines (`#5  page 2  (100.0, 200.0)  Default`)
 * - JSON: Structured output for scripting
 *
 * Results go to stdout, errors and warnings to stderr.
 */

#include "CliParser.h"

#include <QTextStream>
#include <QVector>

class NumberAnnotation;
struct SequenceValidation;
struct EditResult;
class QJsonObject;

namespace Cli {

class ConsoleReporter {
public:
    explicit ConsoleReporter(OutputMode mode = OutputMode::Simple);

    /**
     * @brief Print annotations in the given order.
     *
     * JSON mode prints the same objects the store serializes.
     */
    void reportAnnotations(const QVector<NumberAnnotation*>& annotations);

    void reportValidation(const SequenceValidation& validation);

    /**
     * @brief Print the outcome of an edit, including any renumbering.
     */
    void reportEdit(const EditResult& result);

    /**
     * @brief Report a file written by the command.
     */
    void reportSaved(const QString& path, int annotationCount);

    void reportError(const QString& message);
    void reportWarning(const QString& message);

private:
    void writeJson(const QJsonObject& object);

    static QString statusString(const EditResult& result);

private:
    OutputMode m_mode;
    QTextStream m_out;      ///< stdout stream
    QTextStream m_err;      ///< stderr stream
};

} // namespace Cli

#endif // CLIREPORTER_H
