#pragma once

// ============================================================================
// MuPdfAnnotationSurface - Number marks as real PDF annotations (MuPDF)
// ============================================================================
// Each NumberAnnotation becomes a FreeText annotation:
//   - Helvetica text, centered (/Q 1), text color via /DA
//   - fill color (/C) and opacity (/CA) from the style
//   - /NM set to the annotation id so the mark survives reloads
//   - optional border width
// An enabled tail adds a Line annotation named "<id>:tail" running down from
// the bottom centre of the box.
//
// The surface also embeds the store JSON in the document Info /Keywords so a
// reopened file gives back labels, styles and sub-numbers exactly.
//
// Coordinates are MuPDF page space (origin top-left, points).
// ============================================================================

#include "PdfAnnotationSurface.h"

#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>

class AnnotationStore;
class NumberAnnotation;

// Forward declarations for MuPDF types (mupdf headers stay in the .cpp)
struct fz_context;
struct fz_font;
struct pdf_document;
struct pdf_page;
struct pdf_annot;

class MuPdfAnnotationSurface : public PdfAnnotationSurface {
public:
    /// Prefix of the store JSON inside the Info /Keywords entry
    static const char* const METADATA_PREFIX;

    /// Max distance (points) per edge for the position fallback
    static constexpr float POSITION_TOLERANCE = 2.0f;

    MuPdfAnnotationSurface();
    ~MuPdfAnnotationSurface() override;

    MuPdfAnnotationSurface(const MuPdfAnnotationSurface&) = delete;
    MuPdfAnnotationSurface& operator=(const MuPdfAnnotationSurface&) = delete;

    /**
     * @brief Check whether the MuPDF context was created.
     */
    bool isValid() const { return m_ctx != nullptr; }

    // ===== Document =====

    bool open(const QString& path);

    /**
     * @brief Start a new document of blank pages.
     * @param pageSize Page size in points (A4 by default).
     */
    bool createBlank(int pageCount, const QSizeF& pageSize = QSizeF(595, 842));

    /**
     * @brief Write the document (full rewrite, not incremental).
     *
     * Saving over the file that is currently open goes through a temporary
     * file, since MuPDF still reads from the original.
     */
    bool save(const QString& path);

    void close();

    bool isOpen() const { return m_doc != nullptr; }
    QString path() const { return m_path; }
    int pageCount() const;
    QSizeF pageSize(int page) const;

    // ===== PdfAnnotationSurface =====

    bool applyAnnotation(NumberAnnotation& annotation) override;
    bool removeAnnotation(NumberAnnotation& annotation) override;

    // ===== Bulk =====

    /**
     * @brief Remove every FreeText mark and tail, then redraw the store.
     * @return Number of marks written.
     */
    int rebuild(AnnotationStore& store);

    /**
     * @brief Re-resolve every locator by annotation name.
     * @return Number of annotations whose mark was found.
     */
    int refreshLocators(AnnotationStore& store);

    // ===== Metadata =====

    bool writeStoreMetadata(const QString& json);

    /**
     * @return The embedded store JSON, or an empty string if there is none.
     */
    QString readStoreMetadata() const;

    // ===== Inspection =====

    /**
     * @brief Names (/NM) of the FreeText annotations on a page, in page order.
     */
    QStringList markNames(int page) const;

    /**
     * @brief Rectangle of the mark named after an annotation id.
     * @return Null rect if the page has no such mark.
     */
    QRectF markRect(int page, const QString& annotationId) const;

    /**
     * @brief True if the page carries the tail of an annotation.
     */
    bool hasTail(int page, const QString& annotationId) const;

    /**
     * @brief Box a label occupies: Helvetica advance widths plus padding.
     */
    QRectF expectedRect(const NumberAnnotation& annotation) const;

private:
    pdf_page* loadPage(int page) const;

    enum class Match { LocatorOrName, LocatorNameOrPosition };
    pdf_annot* findMark(pdf_page* page, const NumberAnnotation& annotation, Match match) const;
    pdf_annot* findByName(pdf_page* page, const QString& name, int type) const;

    bool deleteMarks(pdf_page* page, const NumberAnnotation& annotation, Match match);
    int writeMark(pdf_page* page, const NumberAnnotation& annotation);

    float textWidth(const QString& text, float fontSize) const;

    fz_context* m_ctx = nullptr;
    fz_font* m_helvetica = nullptr;     ///< For measuring labels
    pdf_document* m_doc = nullptr;
    QString m_path;
};
