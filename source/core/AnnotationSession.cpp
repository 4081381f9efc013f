// ============================================================================
// AnnotationSession - Implementation
// ============================================================================

#include "AnnotationSession.h"
#include "../pdf/PdfAnnotationSurface.h"

#include <QDebug>

// ============================================================================
// Helpers
// ============================================================================

static QString hashLabel(const QString& label)
{
    return QStringLiteral("#") + label;
}

// Renumber entries that are not the edited annotation itself
static int countOthers(const QVector<LabelChange>& changes, const QString& selfId)
{
    int others = 0;
    for (const LabelChange& change : changes) {
        if (change.annotationId != selfId) {
            ++others;
        }
    }
    return others;
}

static void appendUnique(QVector<QString>& ids, const QString& id)
{
    if (!ids.contains(id)) {
        ids.append(id);
    }
}

static EditResult failure(EditResult::Status status, const QString& message,
                          const QString& annotationId = QString())
{
    EditResult result;
    result.status = status;
    result.message = message;
    result.annotationId = annotationId;
    return result;
}

static EditResult notFound(const QString& id)
{
    return failure(EditResult::NotFound, QStringLiteral("Annotation not found"), id);
}

AnnotationSession::AnnotationSession(int undoDepth)
    : m_undoLog(undoDepth)
{
}

bool AnnotationSession::isDuplicate(const QString& label, const QString& ignoreId) const
{
    const NumberToken key = NumberToken::parse(label);
    if (!key.isValid()) {
        return false;
    }
    for (NumberAnnotation* annotation : m_store.all()) {
        if (annotation->id != ignoreId && annotation->token() == key) {
            return true;
        }
    }
    return false;
}

bool AnnotationSession::resolveDuplicate(QString& label, DuplicateResolution resolution,
                                         QVector<LabelChange>& renumbered, const QString& ignoreId)
{
    switch (resolution) {
        case DuplicateResolution::AutoAdvance: {
            const NumberToken key = NumberToken::parse(label);
            renumbered = key.isWhole() ? m_store.advanceFrom(label, 1)
                                       : m_store.advanceSubNumbersFrom(label, 1);
            break;
        }

        case DuplicateResolution::UseSubNumber:
            label = m_store.nextSubNumber(label);
            if (label.isEmpty()) {
                return false;
            }
            break;

        case DuplicateResolution::Cancel:
            return false;
    }

    // The advance may have been refused at the range limit
    if (isDuplicate(label, ignoreId)) {
        qWarning() << "AnnotationSession: could not free" << label;
        m_store.applyLabelChanges(renumbered, true);
        renumbered.clear();
        return false;
    }
    return true;
}

// ============================================================================
// Edits
// ============================================================================

EditResult AnnotationSession::insertAnnotation(int page, const QPointF& position,
                                               const QString& label, const NumberStyle& style,
                                               DuplicateResolution resolution)
{
    const NumberToken key = NumberToken::parse(label);
    if (!key.isValid()) {
        return failure(EditResult::InvalidLabel,
                       QStringLiteral("Invalid number '%1': %2").arg(label, key.errorString()));
    }
    if (page < 0) {
        return failure(EditResult::NotFound, QStringLiteral("Invalid page %1").arg(page + 1));
    }

    QString finalLabel = label;
    QVector<LabelChange> renumbered;
    if (isDuplicate(label)) {
        if (!resolveDuplicate(finalLabel, resolution, renumbered)) {
            return failure(EditResult::Cancelled,
                           QStringLiteral("%1 already exists").arg(hashLabel(label)));
        }
    }

    NumberAnnotation* stored = m_store.add(
        NumberAnnotation::create(page, position, finalLabel, style.copy()));

    EditResult result;
    result.annotationId = stored->id;
    result.label = finalLabel;
    result.renumbered = renumbered;
    for (const LabelChange& change : renumbered) {
        appendUnique(result.affectedIds, change.annotationId);
    }
    appendUnique(result.affectedIds, stored->id);
    syncApply(result.affectedIds);

    AnnotationCommand command;
    command.type = AnnotationCommand::Add;
    command.description = QStringLiteral("Insert %1").arg(hashLabel(finalLabel));
    command.annotation = *stored;
    command.renumbered = renumbered;
    m_undoLog.push(command);

    result.message = QStringLiteral("Inserted %1").arg(hashLabel(finalLabel));
    if (!renumbered.isEmpty()) {
        result.message += QStringLiteral(", advanced %1 others").arg(renumbered.size());
    }
    return result;
}

EditResult AnnotationSession::relabelAnnotation(const QString& id, const QString& label,
                                                DuplicateResolution resolution)
{
    NumberAnnotation* annotation = m_store.get(id);
    if (!annotation) {
        return notFound(id);
    }

    const NumberToken key = NumberToken::parse(label);
    if (!key.isValid()) {
        return failure(EditResult::InvalidLabel,
                       QStringLiteral("Invalid number '%1': %2").arg(label, key.errorString()), id);
    }

    const QString oldLabel = annotation->label;
    if (label == oldLabel) {
        return failure(EditResult::Cancelled, QStringLiteral("No change"), id);
    }

    QString finalLabel = label;
    QVector<LabelChange> renumbered;
    if (isDuplicate(label, id)) {
        if (!resolveDuplicate(finalLabel, resolution, renumbered, id)) {
            return failure(EditResult::Cancelled,
                           QStringLiteral("%1 already exists").arg(hashLabel(label)), id);
        }
    }

    m_store.relabel(id, finalLabel);

    EditResult result;
    result.annotationId = id;
    result.label = finalLabel;
    result.renumbered = renumbered;
    for (const LabelChange& change : renumbered) {
        appendUnique(result.affectedIds, change.annotationId);
    }
    appendUnique(result.affectedIds, id);
    syncApply(result.affectedIds);

    AnnotationCommand command;
    command.type = AnnotationCommand::Relabel;
    command.description = QStringLiteral("Change %1 to %2").arg(hashLabel(oldLabel), hashLabel(finalLabel));
    command.annotationId = id;
    command.oldLabel = oldLabel;
    command.newLabel = finalLabel;
    command.renumbered = renumbered;
    m_undoLog.push(command);

    result.message = QStringLiteral("Changed %1 to %2").arg(hashLabel(oldLabel), hashLabel(finalLabel));
    const int others = countOthers(renumbered, id);
    if (others > 0) {
        result.message += QStringLiteral(", advanced %1 others").arg(others);
    }
    return result;
}

EditResult AnnotationSession::moveAnnotation(const QString& id, const QPointF& position)
{
    NumberAnnotation* annotation = m_store.get(id);
    if (!annotation) {
        return notFound(id);
    }
    if (annotation->position == position) {
        return failure(EditResult::Cancelled, QStringLiteral("No change"), id);
    }

    AnnotationCommand command;
    command.type = AnnotationCommand::Move;
    command.description = QStringLiteral("Move %1").arg(hashLabel(annotation->label));
    command.annotationId = id;
    command.oldPosition = annotation->position;
    command.newPosition = position;

    m_store.move(id, position);
    syncApply(id);
    m_undoLog.push(command);

    EditResult result;
    result.annotationId = id;
    result.label = annotation->label;
    result.affectedIds.append(id);
    result.message = QStringLiteral("Moved %1").arg(hashLabel(annotation->label));
    return result;
}

EditResult AnnotationSession::restyleAnnotation(const QString& id, const NumberStyle& style)
{
    NumberAnnotation* annotation = m_store.get(id);
    if (!annotation) {
        return notFound(id);
    }
    if (annotation->style == style) {
        return failure(EditResult::Cancelled, QStringLiteral("No change"), id);
    }

    AnnotationCommand command;
    command.type = AnnotationCommand::Restyle;
    command.description = QStringLiteral("Restyle %1").arg(hashLabel(annotation->label));
    command.annotationId = id;
    command.oldStyle = annotation->style.copy();
    command.newStyle = style.copy();

    m_store.restyle(id, style);
    syncApply(id);
    m_undoLog.push(command);

    EditResult result;
    result.annotationId = id;
    result.label = annotation->label;
    result.affectedIds.append(id);
    result.message = QStringLiteral("Restyled %1").arg(hashLabel(annotation->label));
    return result;
}

EditResult AnnotationSession::deleteAnnotation(const QString& id, DeleteRenumber renumber)
{
    NumberAnnotation* annotation = m_store.get(id);
    if (!annotation) {
        return notFound(id);
    }

    // Snapshot before anything moves
    const NumberAnnotation snapshot = *annotation;

    QVector<LabelChange> renumbered;
    if (renumber == DeleteRenumber::DecreaseFollowing && snapshot.isWholeNumber()) {
        renumbered = m_store.decreaseFrom(snapshot.label, 1);
    }

    // id may refer into the annotation being removed
    syncRemove(snapshot.id);
    m_store.remove(snapshot.id);

    EditResult result;
    result.annotationId = snapshot.id;
    result.label = snapshot.label;
    result.renumbered = renumbered;
    for (const LabelChange& change : renumbered) {
        appendUnique(result.affectedIds, change.annotationId);
    }
    syncApply(result.affectedIds);
    result.affectedIds.prepend(snapshot.id);

    AnnotationCommand command;
    command.type = AnnotationCommand::Remove;
    command.description = QStringLiteral("Delete %1").arg(hashLabel(snapshot.label));
    command.annotation = snapshot;
    command.renumbered = renumbered;
    m_undoLog.push(command);

    result.message = QStringLiteral("Deleted %1").arg(hashLabel(snapshot.label));
    if (!renumbered.isEmpty()) {
        result.message += QStringLiteral(", decreased %1 others").arg(renumbered.size());
    }
    return result;
}

EditResult AnnotationSession::advanceFrom(const QString& label)
{
    const NumberToken key = NumberToken::parse(label);
    if (!key.isValid()) {
        return failure(EditResult::InvalidLabel,
                       QStringLiteral("Invalid number '%1': %2").arg(label, key.errorString()));
    }

    const QVector<LabelChange> renumbered = m_store.advanceFrom(label, 1);
    if (renumbered.isEmpty() && m_store.nextWholeNumber().isEmpty()) {
        return failure(EditResult::Cancelled,
                       QStringLiteral("Cannot advance past %1").arg(NumberToken::MAX_COMPONENT));
    }
    if (renumbered.isEmpty()) {
        return failure(EditResult::Cancelled,
                       QStringLiteral("No numbers to advance from %1").arg(hashLabel(label)));
    }

    EditResult result;
    result.label = label;
    result.renumbered = renumbered;
    for (const LabelChange& change : renumbered) {
        appendUnique(result.affectedIds, change.annotationId);
    }
    syncApply(result.affectedIds);

    AnnotationCommand command;
    command.type = AnnotationCommand::BulkRenumber;
    command.description = QStringLiteral("Advance from %1").arg(hashLabel(label));
    command.renumbered = renumbered;
    m_undoLog.push(command);

    result.message = QStringLiteral("Advanced %1 numbers from %2")
                         .arg(renumbered.size())
                         .arg(hashLabel(label));
    return result;
}

void AnnotationSession::clearAll()
{
    for (NumberAnnotation* annotation : m_store.all()) {
        syncRemove(annotation->id);
    }
    m_store.clear();
    m_undoLog.clear();
}

bool AnnotationSession::replaceAll(const QString& json, QString* errorMessage)
{
    // Validate against a scratch store first; the live one stays untouched on failure
    {
        AnnotationStore scratch;
        if (!scratch.fromJson(json, errorMessage)) {
            qWarning() << "[AnnotationSession] Import rejected:" << (errorMessage ? *errorMessage : QString());
            return false;
        }
    }

    for (NumberAnnotation* annotation : m_store.all()) {
        syncRemove(annotation->id);
    }
    if (!m_store.fromJson(json, errorMessage)) {
        return false;
    }

    QVector<QString> ids;
    for (NumberAnnotation* annotation : m_store.all()) {
        ids.append(annotation->id);
    }
    syncApply(ids);
    m_undoLog.clear();

    qDebug() << "[AnnotationSession] Imported" << ids.size() << "annotations";
    return true;
}

// ============================================================================
// CommandDispatcher
// ============================================================================

void AnnotationSession::applyCommand(const AnnotationCommand& command)
{
    // Renumber first, then the main edit (the order they originally ran in)
    if (!command.renumbered.isEmpty()) {
        m_store.applyLabelChanges(command.renumbered, false);
        syncRenumber(command.renumbered);
    }

    switch (command.type) {
        case AnnotationCommand::Add:
            m_store.add(command.annotation);
            syncApply(command.annotation.id);
            break;

        case AnnotationCommand::Remove:
            syncRemove(command.annotation.id);
            m_store.remove(command.annotation.id);
            break;

        case AnnotationCommand::Move:
            m_store.move(command.annotationId, command.newPosition);
            syncApply(command.annotationId);
            break;

        case AnnotationCommand::Relabel:
            m_store.relabel(command.annotationId, command.newLabel);
            syncApply(command.annotationId);
            break;

        case AnnotationCommand::Restyle:
            m_store.restyle(command.annotationId, command.newStyle);
            syncApply(command.annotationId);
            break;

        case AnnotationCommand::BulkRenumber:
            break;
    }
}

void AnnotationSession::revertCommand(const AnnotationCommand& command)
{
    // Main edit first, then the renumber (reverse of applyCommand)
    switch (command.type) {
        case AnnotationCommand::Add:
            syncRemove(command.annotation.id);
            m_store.remove(command.annotation.id);
            break;

        case AnnotationCommand::Remove:
            m_store.add(command.annotation);
            syncApply(command.annotation.id);
            break;

        case AnnotationCommand::Move:
            m_store.move(command.annotationId, command.oldPosition);
            syncApply(command.annotationId);
            break;

        case AnnotationCommand::Relabel:
            m_store.relabel(command.annotationId, command.oldLabel);
            syncApply(command.annotationId);
            break;

        case AnnotationCommand::Restyle:
            m_store.restyle(command.annotationId, command.oldStyle);
            syncApply(command.annotationId);
            break;

        case AnnotationCommand::BulkRenumber:
            break;
    }

    if (!command.renumbered.isEmpty()) {
        m_store.applyLabelChanges(command.renumbered, true);
        syncRenumber(command.renumbered);
    }
}

// ============================================================================
// PDF sync
// ============================================================================

void AnnotationSession::syncApply(const QString& id)
{
    if (!m_surface) {
        return;
    }
    NumberAnnotation* annotation = m_store.get(id);
    if (!annotation) {
        return;
    }
    if (!m_surface->applyAnnotation(*annotation)) {
        qWarning() << "[AnnotationSession] Failed to draw" << hashLabel(annotation->label)
                   << "on page" << annotation->page + 1;
    }
}

void AnnotationSession::syncApply(const QVector<QString>& ids)
{
    for (const QString& id : ids) {
        syncApply(id);
    }
}

void AnnotationSession::syncRemove(const QString& id)
{
    if (!m_surface) {
        return;
    }
    NumberAnnotation* annotation = m_store.get(id);
    if (!annotation) {
        return;
    }
    if (!m_surface->removeAnnotation(*annotation)) {
        qWarning() << "[AnnotationSession] No mark found for" << hashLabel(annotation->label);
    }
}

void AnnotationSession::syncRenumber(const QVector<LabelChange>& changes)
{
    QVector<QString> ids;
    for (const LabelChange& change : changes) {
        appendUnique(ids, change.annotationId);
    }
    syncApply(ids);
}
