#pragma once

// ============================================================================
// AnnotationSession - Edits on one open document, with undo and PDF sync
// ============================================================================
// The session is the single call site for annotation edits. Each operation
// validates its input, mutates the AnnotationStore, forwards every touched
// annotation to the PdfAnnotationSurface, and records one AnnotationCommand
// covering the whole user-visible action.
//
// Policy decisions (what to do about a duplicate label, whether to renumber
// on delete) are made by the shell and passed in as enum arguments.
//
// The session is also the CommandDispatcher for its UndoLog.
// ============================================================================

#include "AnnotationStore.h"
#include "UndoLog.h"

#include <QString>
#include <QPointF>
#include <QVector>

class PdfAnnotationSurface;

/**
 * @brief What to do when an insert or relabel targets a taken label.
 */
enum class DuplicateResolution {
    AutoAdvance,    ///< Shift the taken number and everything after it up by one
    UseSubNumber,   ///< Use the next free sub-number of the same main number
    Cancel          ///< Do nothing
};

/**
 * @brief Whether deleting a whole number closes the gap it leaves.
 */
enum class DeleteRenumber {
    DecreaseFollowing,  ///< Shift every higher whole number down by one
    KeepNumbers         ///< Leave the gap
};

/**
 * @brief Outcome of a session edit, ready for a status bar.
 */
struct EditResult {
    enum Status {
        Applied,        ///< The edit was performed and recorded
        Cancelled,      ///< Nothing changed (user choice or no-op)
        InvalidLabel,   ///< The label does not match main[.sub][p]
        NotFound        ///< Unknown annotation id or label
    };

    Status status = Applied;
    QString message;                    ///< Human-readable summary
    QString annotationId;               ///< Annotation the edit targeted
    QString label;                      ///< Label actually used
    QVector<LabelChange> renumbered;    ///< Other annotations relabelled
    QVector<QString> affectedIds;       ///< Every annotation whose mark changed

    bool isApplied() const { return status == Applied; }
};

class AnnotationSession : public CommandDispatcher {
public:
    explicit AnnotationSession(int undoDepth = UndoLog::DEFAULT_MAX_DEPTH);
    ~AnnotationSession() override = default;

    AnnotationSession(const AnnotationSession&) = delete;
    AnnotationSession& operator=(const AnnotationSession&) = delete;

    /**
     * @brief Attach the PDF surface kept in sync with the store.
     * @param surface Not owned; nullptr for headless use.
     */
    void setSurface(PdfAnnotationSurface* surface) { m_surface = surface; }
    PdfAnnotationSurface* surface() const { return m_surface; }

    AnnotationStore& store() { return m_store; }
    const AnnotationStore& store() const { return m_store; }
    UndoLog& undoLog() { return m_undoLog; }
    const UndoLog& undoLog() const { return m_undoLog; }

    /**
     * @brief Check whether a label is taken by another annotation.
     * @param label Label to test ("5p" equals "5").
     * @param ignoreId Annotation to leave out (the one being relabelled).
     */
    bool isDuplicate(const QString& label, const QString& ignoreId = QString()) const;

    // ===== Edits =====

    EditResult insertAnnotation(int page, const QPointF& position,
                                const QString& label, const NumberStyle& style,
                                DuplicateResolution resolution = DuplicateResolution::Cancel);

    EditResult relabelAnnotation(const QString& id, const QString& label,
                                 DuplicateResolution resolution = DuplicateResolution::Cancel);

    EditResult moveAnnotation(const QString& id, const QPointF& position);

    EditResult restyleAnnotation(const QString& id, const NumberStyle& style);

    /**
     * @brief Delete an annotation.
     * @param renumber Ignored for sub-numbers, which never renumber.
     */
    EditResult deleteAnnotation(const QString& id,
                                DeleteRenumber renumber = DeleteRenumber::KeepNumbers);

    /**
     * @brief Shift a whole number and everything after it up by one.
     */
    EditResult advanceFrom(const QString& label);

    /**
     * @brief Remove every annotation and forget the history.
     */
    void clearAll();

    /**
     * @brief Replace all annotations from store JSON (import).
     * @return False on malformed JSON; nothing changes in that case.
     */
    bool replaceAll(const QString& json, QString* errorMessage = nullptr);

    // ===== History =====

    /**
     * @return Description of the undone edit, or a null string.
     */
    QString undo() { return m_undoLog.undo(*this); }

    /**
     * @return Description of the redone edit, or a null string.
     */
    QString redo() { return m_undoLog.redo(*this); }

    // ===== CommandDispatcher =====
    void applyCommand(const AnnotationCommand& command) override;
    void revertCommand(const AnnotationCommand& command) override;

private:
    void syncApply(const QString& id);
    void syncApply(const QVector<QString>& ids);
    void syncRemove(const QString& id);
    void syncRenumber(const QVector<LabelChange>& changes);

    /**
     * @brief Run the duplicate policy for a taken label.
     * @param label In: requested label. Out: label to use.
     * @param renumbered Receives the changes of an auto-advance.
     * @param ignoreId Annotation being relabelled, not counted as a holder.
     * @return False if the edit is cancelled. Nothing is renumbered then.
     */
    bool resolveDuplicate(QString& label, DuplicateResolution resolution,
                          QVector<LabelChange>& renumbered,
                          const QString& ignoreId = QString());

    AnnotationStore m_store;
    UndoLog m_undoLog;
    PdfAnnotationSurface* m_surface = nullptr;
};
