#pragma once

// ============================================================================
// UndoLog - Bounded linear undo/redo history of annotation edits
// ============================================================================
// Records are tagged commands carrying their own before/after data rather
// than callbacks. The log only stores and orders them; a CommandDispatcher
// (AnnotationSession) applies or reverts each one by its type.
//
// A command may carry a bulk renumber (LabelChange list) alongside its main
// edit, so "insert #5 and advance everything after it" is one undo step.
// ============================================================================

#include "AnnotationStore.h"
#include "NumberAnnotation.h"
#include "NumberStyle.h"

#include <QString>
#include <QPointF>
#include <QStack>
#include <QVector>

/**
 * @brief One undoable annotation edit.
 */
struct AnnotationCommand {
    enum Type {
        Add,            ///< Annotation inserted (undo = remove it)
        Remove,         ///< Annotation deleted (undo = add it back)
        Move,           ///< Position changed
        Relabel,        ///< Label changed
        Restyle,        ///< Style changed
        BulkRenumber    ///< Only the renumber list applies
    };

    Type type = Add;
    QString description;                ///< Shown as "Undo <description>"

    NumberAnnotation annotation;        ///< Snapshot for Add / Remove
    QString annotationId;               ///< Target of Move / Relabel / Restyle

    QPointF oldPosition;                ///< For Move
    QPointF newPosition;
    QString oldLabel;                   ///< For Relabel
    QString newLabel;
    NumberStyle oldStyle;               ///< For Restyle
    NumberStyle newStyle;

    /// Renumber performed as part of this edit, in the order it was applied.
    /// Redo applies it before the main edit; undo reverts it after.
    QVector<LabelChange> renumbered;

    /**
     * @brief Id of the annotation the main edit targets.
     */
    QString targetId() const {
        return (type == Add || type == Remove) ? annotation.id : annotationId;
    }
};

/**
 * @brief Applies and reverts commands popped from an UndoLog.
 */
class CommandDispatcher {
public:
    virtual ~CommandDispatcher() = default;

    /// Re-apply a command (redo).
    virtual void applyCommand(const AnnotationCommand& command) = 0;

    /// Revert a command (undo).
    virtual void revertCommand(const AnnotationCommand& command) = 0;
};

class UndoLog {
public:
    static constexpr int DEFAULT_MAX_DEPTH = 50;

    explicit UndoLog(int maxDepth = DEFAULT_MAX_DEPTH);

    /**
     * @brief Record a new edit.
     *
     * Clears the redo stack and drops the oldest entry when the history is
     * full. Rejected while a command is being applied or reverted.
     * @return False if the push was rejected.
     */
    bool push(const AnnotationCommand& command);

    /**
     * @brief Revert the most recent edit.
     * @return Its description, or a null string if there is nothing to undo.
     */
    QString undo(CommandDispatcher& dispatcher);

    /**
     * @brief Re-apply the most recently undone edit.
     * @return Its description, or a null string if there is nothing to redo.
     */
    QString redo(CommandDispatcher& dispatcher);

    bool canUndo() const { return !m_undoStack.isEmpty(); }
    bool canRedo() const { return !m_redoStack.isEmpty(); }

    QString undoDescription() const;
    QString redoDescription() const;

    int undoCount() const { return m_undoStack.size(); }
    int redoCount() const { return m_redoStack.size(); }

    int maxDepth() const { return m_maxDepth; }

    /**
     * @brief Change the history limit, dropping the oldest entries if needed.
     */
    void setMaxDepth(int maxDepth);

    /**
     * @brief Forget all history (document open/close, clear all).
     */
    void clear();

private:
    void trimUndoStack();

    QStack<AnnotationCommand> m_undoStack;
    QStack<AnnotationCommand> m_redoStack;
    int m_maxDepth = DEFAULT_MAX_DEPTH;
    bool m_dispatching = false;         ///< True while undo()/redo() run a command
};
