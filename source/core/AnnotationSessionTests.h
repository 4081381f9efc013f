#pragma once

// ============================================================================
// AnnotationSessionTests - Unit tests for session edits, undo and PDF sync
// ============================================================================
// A recording surface stands in for the PDF so the tests can check which
// marks each edit redraws without opening a document.
// ============================================================================

#include "AnnotationSession.h"
#include "../pdf/PdfAnnotationSurface.h"

#include <QDebug>
#include <QStringList>

namespace AnnotationSessionTests {

/**
 * @brief Surface that logs "apply <label>" / "remove <label>".
 */
class RecordingSurface : public PdfAnnotationSurface {
public:
    QStringList calls;
    int nextLocator = 1;

    bool applyAnnotation(NumberAnnotation& annotation) override {
        calls.append("apply " + annotation.label);
        annotation.surfaceLocator = nextLocator++;
        return true;
    }

    bool removeAnnotation(NumberAnnotation& annotation) override {
        calls.append("remove " + annotation.label);
        annotation.surfaceLocator = QVariant();
        return true;
    }
};

inline QStringList sortedLabels(const AnnotationSession& session)
{
    QStringList labels;
    for (const NumberAnnotation* annotation : session.store().allSorted()) {
        labels.append(annotation->label);
    }
    return labels;
}

// Inserts labels in order and returns their ids
inline QStringList seed(AnnotationSession& session, const QStringList& labels)
{
    QStringList ids;
    for (int i = 0; i < labels.size(); ++i) {
        EditResult r = session.insertAnnotation(0, QPointF(50, 50 + 40 * i), labels[i], NumberStyle());
        ids.append(r.annotationId);
    }
    return ids;
}

/**
 * @brief Insert onto a taken number with auto-advance, undone in one step.
 */
inline bool testInsertAutoAdvance()
{
    qDebug() << "=== Test: Insert With Auto-Advance ===";

    bool success = true;
    AnnotationSession session;
    RecordingSurface surface;
    session.setSurface(&surface);

    const QStringList ids = seed(session, {"1", "2", "3"});
    surface.calls.clear();

    EditResult r = session.insertAnnotation(1, QPointF(100, 100), "2", NumberStyle(),
                                            DuplicateResolution::AutoAdvance);
    if (!r.isApplied() || r.label != "2") {
        qDebug() << "FAIL: insert should apply with label 2:" << r.message;
        return false;
    }
    if (r.message != "Inserted #2, advanced 2 others") {
        qDebug() << "FAIL: message" << r.message;
        success = false;
    }
    if (session.store().get(ids[1])->label != "3" || session.store().get(ids[2])->label != "4"
        || session.store().get(ids[0])->label != "1") {
        qDebug() << "FAIL: existing numbers not advanced";
        success = false;
    }
    if (surface.calls != QStringList({"apply 3", "apply 4", "apply 2"})) {
        qDebug() << "FAIL: surface calls" << surface.calls;
        success = false;
    }
    if (session.undoLog().undoCount() != 4 || session.undoLog().undoDescription() != "Insert #2") {
        qDebug() << "FAIL: insert + advance should be one undo entry";
        success = false;
    }

    // One undo restores everything
    if (session.undo() != "Insert #2") {
        qDebug() << "FAIL: undo description";
        success = false;
    }
    if (sortedLabels(session) != QStringList({"1", "2", "3"}) || session.store().get(r.annotationId)) {
        qDebug() << "FAIL: undo should restore {1,2,3}" << sortedLabels(session);
        success = false;
    }
    if (session.store().get(ids[1])->label != "2") {
        qDebug() << "FAIL: original #2 should have its label back";
        success = false;
    }

    session.redo();
    if (sortedLabels(session) != QStringList({"1", "2", "3", "4"})
        || !session.store().get(r.annotationId) || session.store().get(r.annotationId)->label != "2") {
        qDebug() << "FAIL: redo should re-insert #2 and advance" << sortedLabels(session);
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Auto-advance insert is one undo step";
    }
    return success;
}

/**
 * @brief Sub-number and cancel duplicate policies.
 */
inline bool testInsertSubNumberAndCancel()
{
    qDebug() << "=== Test: Insert With Sub-Number / Cancel ===";

    bool success = true;
    AnnotationSession session;
    seed(session, {"5", "5.1"});

    EditResult sub = session.insertAnnotation(0, QPointF(0, 0), "5", NumberStyle(),
                                              DuplicateResolution::UseSubNumber);
    if (!sub.isApplied() || sub.label != "5.2" || !sub.renumbered.isEmpty()) {
        qDebug() << "FAIL: sub-number insert should use 5.2, got" << sub.label;
        success = false;
    }

    const int undoBefore = session.undoLog().undoCount();
    EditResult cancelled = session.insertAnnotation(0, QPointF(0, 0), "5p", NumberStyle(),
                                                    DuplicateResolution::Cancel);
    if (cancelled.status != EditResult::Cancelled || cancelled.message != "#5p already exists") {
        qDebug() << "FAIL: cancel policy" << cancelled.message;
        success = false;
    }
    if (session.store().count() != 3 || session.undoLog().undoCount() != undoBefore) {
        qDebug() << "FAIL: cancelled insert changed state";
        success = false;
    }

    EditResult invalid = session.insertAnnotation(0, QPointF(0, 0), "5.x", NumberStyle());
    if (invalid.status != EditResult::InvalidLabel || session.store().count() != 3) {
        qDebug() << "FAIL: invalid label should be rejected";
        success = false;
    }

    EditResult badPage = session.insertAnnotation(-1, QPointF(0, 0), "9", NumberStyle());
    if (badPage.status != EditResult::NotFound) {
        qDebug() << "FAIL: negative page should be rejected";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Duplicate policies honored";
    }
    return success;
}

/**
 * @brief Delete with decrease, undone in one step.
 */
inline bool testDeleteWithDecrease()
{
    qDebug() << "=== Test: Delete With Decrease ===";

    bool success = true;
    AnnotationSession session;
    RecordingSurface surface;
    session.setSurface(&surface);

    const QStringList ids = seed(session, {"1", "2", "3", "4", "2.1"});
    surface.calls.clear();

    EditResult r = session.deleteAnnotation(ids[1], DeleteRenumber::DecreaseFollowing);
    if (!r.isApplied() || r.message != "Deleted #2, decreased 2 others") {
        qDebug() << "FAIL: delete message" << r.message;
        success = false;
    }
    if (sortedLabels(session) != QStringList({"1", "2", "2.1", "3"})) {
        qDebug() << "FAIL: labels after delete" << sortedLabels(session);
        success = false;
    }
    if (surface.calls != QStringList({"remove 2", "apply 2", "apply 3"})) {
        qDebug() << "FAIL: surface calls" << surface.calls;
        success = false;
    }

    session.undo();
    if (sortedLabels(session) != QStringList({"1", "2", "2.1", "3", "4"})
        || session.store().get(ids[1]) == nullptr || session.store().get(ids[3])->label != "4") {
        qDebug() << "FAIL: undo should restore #2 and the following numbers" << sortedLabels(session);
        success = false;
    }

    // Sub-numbers never renumber
    EditResult sub = session.deleteAnnotation(ids[4], DeleteRenumber::DecreaseFollowing);
    if (!sub.isApplied() || !sub.renumbered.isEmpty() || session.store().count() != 4) {
        qDebug() << "FAIL: deleting 2.1 should not renumber";
        success = false;
    }

    if (session.deleteAnnotation("missing").status != EditResult::NotFound) {
        qDebug() << "FAIL: unknown id should be NotFound";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Delete with decrease is one undo step";
    }
    return success;
}

/**
 * @brief Relabel rules, including the 'p' marker on the same key.
 */
inline bool testRelabel()
{
    qDebug() << "=== Test: Relabel ===";

    bool success = true;
    AnnotationSession session;
    const QStringList ids = seed(session, {"3", "5"});

    // Same key with the empty marker is not a duplicate of itself
    EditResult marker = session.relabelAnnotation(ids[1], "5p");
    if (!marker.isApplied() || marker.message != "Changed #5 to #5p") {
        qDebug() << "FAIL: 5 -> 5p" << marker.message;
        success = false;
    }

    if (session.relabelAnnotation(ids[1], "5p").message != "No change") {
        qDebug() << "FAIL: relabel to the current label should be a no-op";
        success = false;
    }

    EditResult taken = session.relabelAnnotation(ids[0], "5");
    if (taken.status != EditResult::Cancelled || session.store().get(ids[0])->label != "3") {
        qDebug() << "FAIL: relabel onto a taken number should cancel";
        success = false;
    }

    EditResult advanced = session.relabelAnnotation(ids[0], "5", DuplicateResolution::AutoAdvance);
    if (!advanced.isApplied() || session.store().get(ids[0])->label != "5"
        || session.store().get(ids[1])->label != "6p") {
        qDebug() << "FAIL: relabel with advance" << sortedLabels(session);
        success = false;
    }
    if (advanced.message != "Changed #3 to #5, advanced 1 others") {
        qDebug() << "FAIL: message" << advanced.message;
        success = false;
    }

    session.undo();
    if (session.store().get(ids[0])->label != "3" || session.store().get(ids[1])->label != "5p") {
        qDebug() << "FAIL: undo of relabel" << sortedLabels(session);
        success = false;
    }

    if (session.relabelAnnotation(ids[0], "abc").status != EditResult::InvalidLabel) {
        qDebug() << "FAIL: invalid relabel";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Relabel rules correct";
    }
    return success;
}

/**
 * @brief Relabel onto a lower taken number, so the advance also moves the
 *        annotation being relabelled.
 */
inline bool testRelabelIntoAdvancedRange()
{
    qDebug() << "=== Test: Relabel Into Advanced Range ===";

    bool success = true;
    AnnotationSession session;
    const QStringList ids = seed(session, {"5", "7"});

    EditResult r = session.relabelAnnotation(ids[1], "5", DuplicateResolution::AutoAdvance);
    if (!r.isApplied() || r.renumbered.size() != 2) {
        qDebug() << "FAIL: relabel 7 -> 5 should apply and record both shifts:" << r.message;
        return false;
    }
    if (session.store().get(ids[0])->label != "6" || session.store().get(ids[1])->label != "5") {
        qDebug() << "FAIL: after relabel" << sortedLabels(session);
        success = false;
    }
    if (r.message != "Changed #7 to #5, advanced 1 others") {
        qDebug() << "FAIL: message" << r.message;
        success = false;
    }

    session.undo();
    if (session.store().get(ids[0])->label != "5" || session.store().get(ids[1])->label != "7") {
        qDebug() << "FAIL: undo should restore {5, 7}" << sortedLabels(session);
        success = false;
    }

    session.redo();
    if (session.store().get(ids[0])->label != "6" || session.store().get(ids[1])->label != "5") {
        qDebug() << "FAIL: redo should give 6 and 5 again" << sortedLabels(session);
        success = false;
    }

    session.undo();
    if (sortedLabels(session) != QStringList({"5", "7"})) {
        qDebug() << "FAIL: second undo" << sortedLabels(session);
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Relabel with advance survives undo/redo";
    }
    return success;
}

/**
 * @brief Auto-advance onto a taken sub-number shifts the sub-numbers only.
 */
inline bool testInsertAutoAdvanceSubNumber()
{
    qDebug() << "=== Test: Insert Sub-Number With Auto-Advance ===";

    bool success = true;
    AnnotationSession session;
    const QStringList ids = seed(session, {"5", "5.1", "6"});

    EditResult r = session.insertAnnotation(0, QPointF(0, 0), "5.1", NumberStyle(),
                                            DuplicateResolution::AutoAdvance);
    if (!r.isApplied() || r.label != "5.1") {
        qDebug() << "FAIL: insert 5.1 should apply:" << r.message;
        return false;
    }
    if (session.store().get(ids[0])->label != "5" || session.store().get(ids[1])->label != "5.2"
        || session.store().get(ids[2])->label != "6") {
        qDebug() << "FAIL: only the old 5.1 should move" << sortedLabels(session);
        success = false;
    }
    if (sortedLabels(session) != QStringList({"5", "5.1", "5.2", "6"})) {
        qDebug() << "FAIL: labels should be unique" << sortedLabels(session);
        success = false;
    }
    if (r.message != "Inserted #5.1, advanced 1 others") {
        qDebug() << "FAIL: message" << r.message;
        success = false;
    }

    session.undo();
    if (sortedLabels(session) != QStringList({"5", "5.1", "6"})
        || session.store().get(ids[1])->label != "5.1") {
        qDebug() << "FAIL: undo should restore {5, 5.1, 6}" << sortedLabels(session);
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Sub-number auto-advance keeps labels unique";
    }
    return success;
}

/**
 * @brief Auto-advance that would pass the largest number cancels cleanly.
 */
inline bool testAdvanceAtLimit()
{
    qDebug() << "=== Test: Advance At Limit ===";

    bool success = true;
    AnnotationSession session;
    const QStringList ids = seed(session, {"999998", "999999"});
    const int undoCount = session.undoLog().undoCount();

    EditResult r = session.insertAnnotation(0, QPointF(0, 0), "999998", NumberStyle(),
                                            DuplicateResolution::AutoAdvance);
    if (r.status != EditResult::Cancelled) {
        qDebug() << "FAIL: insert past the limit should cancel:" << r.message;
        success = false;
    }
    if (sortedLabels(session) != QStringList({"999998", "999999"})
        || session.undoLog().undoCount() != undoCount) {
        qDebug() << "FAIL: cancelled insert changed the session" << sortedLabels(session);
        success = false;
    }

    EditResult advanced = session.advanceFrom("999999");
    if (advanced.status != EditResult::Cancelled || session.store().get(ids[1])->label != "999999") {
        qDebug() << "FAIL: advance from the top should cancel:" << advanced.message;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Advances stop at the largest number";
    }
    return success;
}

/**
 * @brief Move and restyle with undo/redo.
 */
inline bool testMoveRestyle()
{
    qDebug() << "=== Test: Move / Restyle ===";

    bool success = true;
    AnnotationSession session;
    const QString id = seed(session, {"1"}).first();
    const QPointF start = session.store().get(id)->position;

    EditResult moved = session.moveAnnotation(id, QPointF(200, 300));
    if (!moved.isApplied() || moved.message != "Moved #1") {
        qDebug() << "FAIL: move" << moved.message;
        success = false;
    }
    if (session.moveAnnotation(id, QPointF(200, 300)).status != EditResult::Cancelled) {
        qDebug() << "FAIL: move to the same spot should be a no-op";
        success = false;
    }

    const NumberStyle red = NumberStyle::create("Red on White", Qt::red, Qt::white);
    EditResult restyled = session.restyleAnnotation(id, red);
    if (!restyled.isApplied() || session.store().get(id)->style != red) {
        qDebug() << "FAIL: restyle";
        success = false;
    }

    session.undo();
    if (session.store().get(id)->style != NumberStyle()) {
        qDebug() << "FAIL: undo restyle";
        success = false;
    }
    session.undo();
    if (session.store().get(id)->position != start) {
        qDebug() << "FAIL: undo move";
        success = false;
    }
    session.redo();
    session.redo();
    if (session.store().get(id)->position != QPointF(200, 300) || session.store().get(id)->style != red) {
        qDebug() << "FAIL: redo move + restyle";
        success = false;
    }

    EditResult advance = session.advanceFrom("1");
    if (!advance.isApplied() || advance.message != "Advanced 1 numbers from #1"
        || session.store().get(id)->label != "2") {
        qDebug() << "FAIL: advanceFrom" << advance.message;
        success = false;
    }
    if (session.advanceFrom("9").status != EditResult::Cancelled) {
        qDebug() << "FAIL: advancing past the end should cancel";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Move/restyle undo and redo";
    }
    return success;
}

/**
 * @brief Import and clear.
 */
inline bool testReplaceAndClear()
{
    qDebug() << "=== Test: Replace All / Clear All ===";

    bool success = true;
    AnnotationSession session;
    RecordingSurface surface;
    session.setSurface(&surface);
    seed(session, {"1", "2"});
    surface.calls.clear();

    QString error;
    if (session.replaceAll("[{\"page\": 0, \"number\": \"bad\"}]", &error)) {
        qDebug() << "FAIL: malformed import accepted";
        success = false;
    }
    if (session.store().count() != 2 || session.undoLog().undoCount() != 2 || !surface.calls.isEmpty()) {
        qDebug() << "FAIL: rejected import changed state";
        success = false;
    }

    const QString json = "[{\"id\": \"a\", \"page\": 0, \"x\": 1, \"y\": 1, \"number\": \"7\"},"
                         " {\"id\": \"b\", \"page\": 1, \"x\": 2, \"y\": 2, \"number\": \"8\"}]";
    if (!session.replaceAll(json, &error)) {
        qDebug() << "FAIL: valid import rejected:" << error;
        return false;
    }
    if (sortedLabels(session) != QStringList({"7", "8"}) || session.undoLog().canUndo()) {
        qDebug() << "FAIL: import should replace contents and clear history";
        success = false;
    }
    if (surface.calls != QStringList({"remove 1", "remove 2", "apply 7", "apply 8"})) {
        qDebug() << "FAIL: surface calls" << surface.calls;
        success = false;
    }

    surface.calls.clear();
    session.clearAll();
    if (!session.store().isEmpty() || session.undoLog().canUndo()
        || surface.calls != QStringList({"remove 7", "remove 8"})) {
        qDebug() << "FAIL: clearAll";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Replace and clear correct";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running AnnotationSession Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testInsertAutoAdvance();
    qDebug() << "";

    allPass &= testInsertSubNumberAndCancel();
    qDebug() << "";

    allPass &= testDeleteWithDecrease();
    qDebug() << "";

    allPass &= testRelabel();
    qDebug() << "";

    allPass &= testRelabelIntoAdvancedRange();
    qDebug() << "";

    allPass &= testInsertAutoAdvanceSubNumber();
    qDebug() << "";

    allPass &= testAdvanceAtLimit();
    qDebug() << "";

    allPass &= testMoveRestyle();
    qDebug() << "";

    allPass &= testReplaceAndClear();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL ANNOTATIONSESSION TESTS PASSED!";
    } else {
        qDebug() << "SOME ANNOTATIONSESSION TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace AnnotationSessionTests
