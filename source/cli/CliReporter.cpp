#include "CliReporter.h"
#include "../core/AnnotationSession.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

/**
 * @file CliReporter.cpp
 * @brief Implementation of console output.
 *
 * @see CliReporter.h for API documentation
 */

namespace Cli {

ConsoleReporter::ConsoleReporter(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

void ConsoleReporter::writeJson(const QJsonObject& object)
{
    m_out << QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact)) << "\n";
    m_out.flush();
}

QString ConsoleReporter::statusString(const EditResult& result)
{
    switch (result.status) {
        case EditResult::Applied:      return QStringLiteral("applied");
        case EditResult::Cancelled:    return QStringLiteral("cancelled");
        case EditResult::InvalidLabel: return QStringLiteral("invalid_label");
        case EditResult::NotFound:     return QStringLiteral("not_found");
    }
    return QString();
}

// =============================================================================
// Results
// =============================================================================

void ConsoleReporter::reportAnnotations(const QVector<NumberAnnotation*>& annotations)
{
    if (m_mode == OutputMode::Json) {
        QJsonArray array;
        for (const NumberAnnotation* annotation : annotations) {
            array.append(annotation->toJson());
        }
        QJsonObject object;
        object["type"] = QStringLiteral("annotations");
        object["count"] = annotations.size();
        object["annotations"] = array;
        writeJson(object);
        return;
    }

    if (annotations.isEmpty()) {
        m_out << QCoreApplication::translate("CLI", "No annotations") << "\n";
        m_out.flush();
        return;
    }

    for (const NumberAnnotation* annotation : annotations) {
        m_out << QStringLiteral("#%1\tpage %2\t(%3, %4)\t%5\n")
                     .arg(annotation->label)
                     .arg(annotation->page + 1)
                     .arg(annotation->position.x(), 0, 'f', 1)
                     .arg(annotation->position.y(), 0, 'f', 1)
                     .arg(annotation->style.name);
    }
    m_out.flush();
}

void ConsoleReporter::reportValidation(const SequenceValidation& validation)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject object;
        object["type"] = QStringLiteral("validation");
        object["valid"] = validation.valid;
        object["message"] = validation.message;
        writeJson(object);
        return;
    }

    m_out << validation.message << "\n";
    m_out.flush();
}

void ConsoleReporter::reportEdit(const EditResult& result)
{
    if (m_mode == OutputMode::Json) {
        QJsonArray renumbered;
        for (const LabelChange& change : result.renumbered) {
            QJsonObject entry;
            entry["id"] = change.annotationId;
            entry["old"] = change.oldLabel;
            entry["new"] = change.newLabel;
            renumbered.append(entry);
        }
        QJsonObject object;
        object["type"] = QStringLiteral("edit");
        object["status"] = statusString(result);
        object["message"] = result.message;
        object["id"] = result.annotationId;
        object["label"] = result.label;
        object["renumbered"] = renumbered;
        writeJson(object);
        return;
    }

    if (result.isApplied()) {
        m_out << result.message << "\n";
        for (const LabelChange& change : result.renumbered) {
            m_out << QStringLiteral("  #%1 -> #%2\n").arg(change.oldLabel, change.newLabel);
        }
        m_out.flush();
    } else {
        m_err << result.message << "\n";
        m_err.flush();
    }
}

void ConsoleReporter::reportSaved(const QString& path, int annotationCount)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject object;
        object["type"] = QStringLiteral("saved");
        object["path"] = path;
        object["count"] = annotationCount;
        writeJson(object);
        return;
    }

    m_out << QCoreApplication::translate("CLI", "Saved %1 (%2 annotations)")
                 .arg(path)
                 .arg(annotationCount)
          << "\n";
    m_out.flush();
}

// =============================================================================
// Errors
// =============================================================================

void ConsoleReporter::reportError(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject object;
        object["type"] = QStringLiteral("error");
        object["message"] = message;
        m_err << QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact)) << "\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
    }
    m_err.flush();
}

void ConsoleReporter::reportWarning(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject object;
        object["type"] = QStringLiteral("warning");
        object["message"] = message;
        m_err << QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact)) << "\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Warning: ") << message << "\n";
    }
    m_err.flush();
}

} // namespace Cli
