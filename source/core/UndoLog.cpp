// ============================================================================
// UndoLog - Implementation
// ============================================================================

#include "UndoLog.h"

#include <QDebug>

#include <algorithm>

UndoLog::UndoLog(int maxDepth)
    : m_maxDepth(std::max(1, maxDepth))
{
}

bool UndoLog::push(const AnnotationCommand& command)
{
    if (m_dispatching) {
        qWarning() << "UndoLog::push: rejected while applying" << command.description;
        return false;
    }

    m_undoStack.push(command);
    m_redoStack.clear();
    trimUndoStack();
    return true;
}

QString UndoLog::undo(CommandDispatcher& dispatcher)
{
    if (m_undoStack.isEmpty() || m_dispatching) {
        return QString();
    }

    AnnotationCommand command = m_undoStack.pop();

    m_dispatching = true;
    dispatcher.revertCommand(command);
    m_dispatching = false;

    m_redoStack.push(command);
    return command.description;
}

QString UndoLog::redo(CommandDispatcher& dispatcher)
{
    if (m_redoStack.isEmpty() || m_dispatching) {
        return QString();
    }

    AnnotationCommand command = m_redoStack.pop();

    m_dispatching = true;
    dispatcher.applyCommand(command);
    m_dispatching = false;

    m_undoStack.push(command);
    trimUndoStack();
    return command.description;
}

QString UndoLog::undoDescription() const
{
    return m_undoStack.isEmpty() ? QString() : m_undoStack.top().description;
}

QString UndoLog::redoDescription() const
{
    return m_redoStack.isEmpty() ? QString() : m_redoStack.top().description;
}

void UndoLog::setMaxDepth(int maxDepth)
{
    m_maxDepth = std::max(1, maxDepth);
    trimUndoStack();
}

void UndoLog::clear()
{
    m_undoStack.clear();
    m_redoStack.clear();
}

void UndoLog::trimUndoStack()
{
    // Oldest entry sits at index 0
    while (m_undoStack.size() > m_maxDepth) {
        m_undoStack.remove(0);
    }
}
