#pragma once

// ============================================================================
// PdfAnnotationSurface - Abstract interface for editing rendered marks
// ============================================================================
// The annotation engine keeps the PDF in sync through this interface only.
// Implementations create, replace and erase the visible mark of one
// NumberAnnotation and keep whatever they need to find it again in
// NumberAnnotation::surfaceLocator.
//
// Currently implemented by MuPdfAnnotationSurface.
// ============================================================================

class NumberAnnotation;

class PdfAnnotationSurface {
public:
    virtual ~PdfAnnotationSurface() = default;

    /**
     * @brief Create or replace the visible mark for an annotation.
     * @param annotation The annotation; its surfaceLocator is updated.
     * @return True if the mark was written.
     *
     * An existing mark found through the locator is replaced, so callers
     * may apply after any edit without removing first.
     */
    virtual bool applyAnnotation(NumberAnnotation& annotation) = 0;

    /**
     * @brief Erase the visible mark for an annotation.
     * @param annotation The annotation, with the page, position and label
     *                   the mark was drawn with.
     * @return True if a mark was found and erased.
     *
     * Uses the locator first. When it is stale, implementations fall back
     * to matching the mark by name and then by position.
     */
    virtual bool removeAnnotation(NumberAnnotation& annotation) = 0;
};
