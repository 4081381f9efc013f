#pragma once

// ============================================================================
// MuPdfAnnotationSurfaceTests - Unit tests for the MuPDF annotation surface
// ============================================================================
// Runs against blank documents created in memory and saved into a
// QTemporaryDir, so no fixture PDFs are needed.
//
// Current tests:
// - Create / replace / remove marks
// - Removal through the position fallback
// - Tails
// - Store metadata survives save and reopen
// - rebuild() and refreshLocators()
// ============================================================================

#include "MuPdfAnnotationSurface.h"
#include "../core/AnnotationStore.h"

#include <QDebug>
#include <QTemporaryDir>

#include <cmath>

namespace MuPdfAnnotationSurfaceTests {

inline bool nearlyEqual(const QRectF& a, const QRectF& b, qreal tolerance = 0.5)
{
    return std::fabs(a.left() - b.left()) < tolerance
        && std::fabs(a.top() - b.top()) < tolerance
        && std::fabs(a.right() - b.right()) < tolerance
        && std::fabs(a.bottom() - b.bottom()) < tolerance;
}

/**
 * @brief Test creating, replacing and removing marks.
 */
inline bool testMarkLifecycle()
{
    qDebug() << "=== Test: Mark Lifecycle ===";

    MuPdfAnnotationSurface surface;
    if (!surface.isValid() || !surface.createBlank(2)) {
        qDebug() << "FAIL: could not create a blank document";
        return false;
    }

    bool success = true;

    if (surface.pageCount() != 2 || surface.pageSize(0) != QSizeF(595, 842)) {
        qDebug() << "FAIL: blank document geometry" << surface.pageCount() << surface.pageSize(0);
        success = false;
    }

    NumberAnnotation a = NumberAnnotation::create(0, QPointF(100, 100), "1", NumberStyle());
    NumberAnnotation b = NumberAnnotation::create(0, QPointF(100, 200), "2", NumberStyle());

    // Test 1: apply writes a named mark and sets the locator
    {
        if (!surface.applyAnnotation(a) || !surface.applyAnnotation(b)) {
            qDebug() << "FAIL: applyAnnotation()";
            return false;
        }
        if (!a.surfaceLocator.isValid() || a.surfaceLocator.toInt() <= 0) {
            qDebug() << "FAIL: locator not set";
            success = false;
        }
        if (surface.markNames(0) != QStringList({a.id, b.id})) {
            qDebug() << "FAIL: page 0 marks" << surface.markNames(0);
            success = false;
        } else {
            qDebug() << "  - Two marks written: OK";
        }
    }

    // Test 2: the mark box matches the expected label box
    {
        const QRectF actual = surface.markRect(0, a.id);
        const QRectF expected = surface.expectedRect(a);
        if (!nearlyEqual(actual, expected) || expected.width() <= 2 * a.style.padding) {
            qDebug() << "FAIL: mark rect" << actual << "expected" << expected;
            success = false;
        } else {
            qDebug() << "  - Mark rect matches label box: OK";
        }
    }

    // Test 3: re-applying after a relabel replaces instead of duplicating
    {
        const QRectF narrow = surface.markRect(0, a.id);
        a.label = "10.2";
        if (!surface.applyAnnotation(a) || surface.markNames(0).count(a.id) != 1
            || surface.markNames(0).size() != 2) {
            qDebug() << "FAIL: relabel should replace the mark" << surface.markNames(0);
            success = false;
        } else if (surface.markRect(0, a.id).width() <= narrow.width()) {
            qDebug() << "FAIL: a longer label should give a wider box";
            success = false;
        } else {
            qDebug() << "  - Relabel replaces mark: OK";
        }
    }

    // Test 4: moving to another page leaves nothing behind
    {
        NumberAnnotation moved = b;
        if (!surface.removeAnnotation(moved)) {
            qDebug() << "FAIL: removeAnnotation()";
            success = false;
        }
        moved.page = 1;
        surface.applyAnnotation(moved);
        if (surface.markNames(0) != QStringList({a.id}) || surface.markNames(1) != QStringList({b.id})) {
            qDebug() << "FAIL: page move" << surface.markNames(0) << surface.markNames(1);
            success = false;
        } else {
            qDebug() << "  - Page move: OK";
        }
        if (moved.surfaceLocator.toInt() <= 0) {
            qDebug() << "FAIL: locator after re-apply";
            success = false;
        }
    }

    // Test 5: removing an unknown annotation reports false
    {
        NumberAnnotation stranger = NumberAnnotation::create(0, QPointF(400, 400), "99", NumberStyle());
        if (surface.removeAnnotation(stranger) || surface.markNames(0).size() != 1) {
            qDebug() << "FAIL: removing an unknown mark should find nothing";
            success = false;
        }
        NumberAnnotation offPage = NumberAnnotation::create(5, QPointF(0, 0), "1", NumberStyle());
        if (surface.applyAnnotation(offPage)) {
            qDebug() << "FAIL: page out of range should fail";
            success = false;
        }
    }

    if (success) {
        qDebug() << "PASS: Mark lifecycle correct";
    }
    return success;
}

/**
 * @brief Test removal when both locator and name are unusable.
 */
inline bool testPositionFallback()
{
    qDebug() << "=== Test: Position Fallback ===";

    MuPdfAnnotationSurface surface;
    if (!surface.createBlank(1)) {
        qDebug() << "FAIL: could not create a blank document";
        return false;
    }

    bool success = true;
    NumberAnnotation original = NumberAnnotation::create(0, QPointF(50, 60), "7", NumberStyle());
    surface.applyAnnotation(original);

    // Same geometry, different id and a locator that points nowhere
    NumberAnnotation orphan = NumberAnnotation::create(0, QPointF(50, 60), "7", NumberStyle());
    orphan.surfaceLocator = 999999;

    if (!surface.removeAnnotation(orphan)) {
        qDebug() << "FAIL: position fallback should find the mark";
        success = false;
    }
    if (!surface.markNames(0).isEmpty()) {
        qDebug() << "FAIL: mark still present" << surface.markNames(0);
        success = false;
    }
    if (orphan.surfaceLocator.isValid()) {
        qDebug() << "FAIL: locator should be cleared after removal";
        success = false;
    }

    // A stale locator never removes someone else's mark during apply
    NumberAnnotation first = NumberAnnotation::create(0, QPointF(10, 10), "1", NumberStyle());
    NumberAnnotation second = NumberAnnotation::create(0, QPointF(10, 300), "2", NumberStyle());
    surface.applyAnnotation(first);
    second.surfaceLocator = first.surfaceLocator;
    surface.applyAnnotation(second);
    if (surface.markNames(0) != QStringList({first.id, second.id})) {
        qDebug() << "FAIL: apply with a foreign locator replaced another mark" << surface.markNames(0);
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Position fallback works";
    }
    return success;
}

/**
 * @brief Test tail creation and removal.
 */
inline bool testTail()
{
    qDebug() << "=== Test: Tail ===";

    MuPdfAnnotationSurface surface;
    if (!surface.createBlank(1)) {
        qDebug() << "FAIL: could not create a blank document";
        return false;
    }

    bool success = true;
    NumberStyle style;
    style.tailEnabled = true;
    style.tailLength = 20.0;
    NumberAnnotation tailed = NumberAnnotation::create(0, QPointF(200, 200), "3", style);
    NumberAnnotation plain = NumberAnnotation::create(0, QPointF(300, 200), "4", NumberStyle());

    surface.applyAnnotation(tailed);
    surface.applyAnnotation(plain);
    if (!surface.hasTail(0, tailed.id) || surface.hasTail(0, plain.id)) {
        qDebug() << "FAIL: tail presence";
        success = false;
    }

    // Tails are not counted as marks
    if (surface.markNames(0).size() != 2) {
        qDebug() << "FAIL: tail listed as a mark" << surface.markNames(0);
        success = false;
    }

    // Turning the tail off on re-apply drops it
    tailed.style.tailEnabled = false;
    surface.applyAnnotation(tailed);
    if (surface.hasTail(0, tailed.id)) {
        qDebug() << "FAIL: tail should be gone after disabling it";
        success = false;
    }

    tailed.style.tailEnabled = true;
    surface.applyAnnotation(tailed);
    surface.removeAnnotation(tailed);
    if (surface.hasTail(0, tailed.id)) {
        qDebug() << "FAIL: removing a mark should remove its tail";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Tails follow their marks";
    }
    return success;
}

/**
 * @brief Test metadata, rebuild and locator refresh across save/reopen.
 */
inline bool testSaveAndReopen()
{
    qDebug() << "=== Test: Save / Reopen ===";

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: could not create temp dir";
        return false;
    }
    const QString path = dir.filePath("numbered.pdf");

    bool success = true;
    AnnotationStore store;
    NumberStyle tailStyle;
    tailStyle.tailEnabled = true;
    store.add(NumberAnnotation::create(0, QPointF(100, 100), "1", NumberStyle()));
    store.add(NumberAnnotation::create(0, QPointF(100, 200), "1.1", NumberStyle()));
    store.add(NumberAnnotation::create(1, QPointF(100, 100), "2p", tailStyle));

    {
        MuPdfAnnotationSurface writer;
        if (!writer.createBlank(2)) {
            qDebug() << "FAIL: could not create a blank document";
            return false;
        }
        for (NumberAnnotation* annotation : store.all()) {
            writer.applyAnnotation(*annotation);
        }
        if (!writer.writeStoreMetadata(store.toJson()) || !writer.save(path)) {
            qDebug() << "FAIL: save";
            return false;
        }
    }

    MuPdfAnnotationSurface reader;
    if (!reader.open(path) || reader.pageCount() != 2) {
        qDebug() << "FAIL: reopen";
        return false;
    }

    // Metadata gives back the exact store
    AnnotationStore loaded;
    const QString json = reader.readStoreMetadata();
    if (json.isEmpty() || !loaded.fromJson(json)) {
        qDebug() << "FAIL: embedded store missing or unreadable";
        return false;
    }
    if (loaded.count() != 3 || !loaded.hasLabel("2") || loaded.getByLabel("2")->label != "2p") {
        qDebug() << "FAIL: embedded store content";
        success = false;
    } else {
        qDebug() << "  - Metadata round-trip: OK";
    }

    if (reader.markNames(0).size() != 2 || reader.markNames(1).size() != 1) {
        qDebug() << "FAIL: marks after reopen" << reader.markNames(0) << reader.markNames(1);
        success = false;
    }

    // Locators from the writer mean nothing here; refresh resolves by name
    if (reader.refreshLocators(loaded) != 3) {
        qDebug() << "FAIL: refreshLocators() should resolve all 3";
        success = false;
    }
    for (NumberAnnotation* annotation : loaded.all()) {
        if (annotation->surfaceLocator.toInt() <= 0) {
            qDebug() << "FAIL: locator missing for" << annotation->label;
            success = false;
        }
    }

    // rebuild() redraws exactly one mark per annotation
    if (reader.rebuild(loaded) != 3) {
        qDebug() << "FAIL: rebuild() should write 3 marks";
        success = false;
    }
    if (reader.markNames(0).size() != 2 || reader.markNames(1).size() != 1
        || !reader.hasTail(1, loaded.getByLabel("2")->id)) {
        qDebug() << "FAIL: marks after rebuild" << reader.markNames(0) << reader.markNames(1);
        success = false;
    } else {
        qDebug() << "  - Rebuild: OK";
    }

    // Overwriting the open file keeps it usable
    if (!reader.save(path) || !reader.isOpen() || reader.markNames(0).size() != 2) {
        qDebug() << "FAIL: save over the open file";
        success = false;
    }

    MuPdfAnnotationSurface empty;
    if (!empty.createBlank(1) || !empty.readStoreMetadata().isEmpty()) {
        qDebug() << "FAIL: a fresh document has no embedded store";
        success = false;
    }
    if (empty.open(dir.filePath("missing.pdf")) || empty.isOpen()) {
        qDebug() << "FAIL: opening a missing file should fail";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Save/reopen preserves marks and metadata";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running MuPdfAnnotationSurface Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testMarkLifecycle();
    qDebug() << "";

    allPass &= testPositionFallback();
    qDebug() << "";

    allPass &= testTail();
    qDebug() << "";

    allPass &= testSaveAndReopen();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL MUPDFANNOTATIONSURFACE TESTS PASSED!";
    } else {
        qDebug() << "SOME MUPDFANNOTATIONSURFACE TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace MuPdfAnnotationSurfaceTests
