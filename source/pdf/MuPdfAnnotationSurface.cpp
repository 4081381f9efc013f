// ============================================================================
// MuPdfAnnotationSurface - Implementation
// ============================================================================

#include "MuPdfAnnotationSurface.h"

#include "../core/AnnotationStore.h"
#include "../core/NumberAnnotation.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFile>
#include <QFileInfo>

#include <cmath>

const char* const MuPdfAnnotationSurface::METADATA_PREFIX = "SeqMark_Annotations:";

// Suffix of the /NM of a tail (Line annotation)
static const char* const TAIL_SUFFIX = ":tail";

static void toRgb(const QColor& color, float rgb[3])
{
    rgb[0] = static_cast<float>(color.redF());
    rgb[1] = static_cast<float>(color.greenF());
    rgb[2] = static_cast<float>(color.blueF());
}

static QString annotName(fz_context* ctx, pdf_annot* annot)
{
    return QString::fromUtf8(pdf_dict_get_text_string(ctx, pdf_annot_obj(ctx, annot), PDF_NAME(NM)));
}

// FreeText marks and our own tails; anything else on the page is left alone
static bool isOwnedMark(fz_context* ctx, pdf_annot* annot)
{
    const enum pdf_annot_type type = pdf_annot_type(ctx, annot);
    if (type == PDF_ANNOT_FREE_TEXT) {
        return true;
    }
    return type == PDF_ANNOT_LINE && annotName(ctx, annot).endsWith(QLatin1String(TAIL_SUFFIX));
}

// ============================================================================
// Construction
// ============================================================================

MuPdfAnnotationSurface::MuPdfAnnotationSurface()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to create MuPDF context";
        return;
    }

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
        m_helvetica = fz_new_base14_font(m_ctx, "Helvetica");
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to initialize:" << fz_caught_message(m_ctx);
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        m_helvetica = nullptr;
    }
}

MuPdfAnnotationSurface::~MuPdfAnnotationSurface()
{
    close();
    if (m_ctx) {
        fz_drop_font(m_ctx, m_helvetica);
        fz_drop_context(m_ctx);
    }
}

// ============================================================================
// Document
// ============================================================================

bool MuPdfAnnotationSurface::open(const QString& path)
{
    if (!m_ctx) return false;
    close();

    if (!QFile::exists(path)) {
        qWarning() << "[MuPdfAnnotationSurface] File not found:" << path;
        return false;
    }

    const QByteArray pathUtf8 = path.toUtf8();
    bool ok = true;
    fz_try(m_ctx) {
        m_doc = pdf_open_document(m_ctx, pathUtf8.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to open" << path << "-" << fz_caught_message(m_ctx);
        m_doc = nullptr;
        ok = false;
    }
    if (!ok) return false;

    m_path = path;
    qDebug() << "[MuPdfAnnotationSurface] Opened" << path << "with" << pageCount() << "pages";
    return true;
}

bool MuPdfAnnotationSurface::createBlank(int pageCount, const QSizeF& pageSize)
{
    if (!m_ctx || pageCount < 1) return false;
    close();

    pdf_obj* pageObj = nullptr;
    pdf_obj* resources = nullptr;
    fz_buffer* contents = nullptr;
    bool ok = true;

    fz_var(pageObj);
    fz_var(resources);
    fz_var(contents);

    fz_try(m_ctx) {
        m_doc = pdf_create_document(m_ctx);
        const fz_rect mediabox = fz_make_rect(0, 0,
                                              static_cast<float>(pageSize.width()),
                                              static_cast<float>(pageSize.height()));
        for (int i = 0; i < pageCount; ++i) {
            resources = pdf_new_dict(m_ctx, m_doc, 1);
            contents = fz_new_buffer(m_ctx, 16);
            pageObj = pdf_add_page(m_ctx, m_doc, mediabox, 0, resources, contents);
            pdf_insert_page(m_ctx, m_doc, -1, pageObj);

            pdf_drop_obj(m_ctx, pageObj);
            pageObj = nullptr;
            pdf_drop_obj(m_ctx, resources);
            resources = nullptr;
            fz_drop_buffer(m_ctx, contents);
            contents = nullptr;
        }
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, pageObj);
        pdf_drop_obj(m_ctx, resources);
        fz_drop_buffer(m_ctx, contents);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to create document:" << fz_caught_message(m_ctx);
        ok = false;
    }

    if (!ok) {
        close();
        return false;
    }
    return true;
}

bool MuPdfAnnotationSurface::save(const QString& path)
{
    if (!m_doc) return false;

    // MuPDF reads lazily from the open file; never write over it directly
    const bool overwriting = !m_path.isEmpty()
        && QFileInfo(path).absoluteFilePath() == QFileInfo(m_path).absoluteFilePath();
    const QString target = overwriting ? path + QStringLiteral(".seqmark-tmp") : path;
    const QByteArray targetUtf8 = target.toUtf8();

    bool ok = true;
    fz_try(m_ctx) {
        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;
        pdf_save_document(m_ctx, m_doc, targetUtf8.constData(), &opts);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to save" << path << "-" << fz_caught_message(m_ctx);
        ok = false;
    }
    if (!ok) return false;

    if (overwriting) {
        close();
        if (!QFile::remove(path) || !QFile::rename(target, path)) {
            qWarning() << "[MuPdfAnnotationSurface] Failed to replace" << path;
            return false;
        }
        if (!open(path)) {
            return false;
        }
    }

    qDebug() << "[MuPdfAnnotationSurface] Saved to" << path;
    return true;
}

void MuPdfAnnotationSurface::close()
{
    if (m_doc) {
        pdf_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    m_path.clear();
}

int MuPdfAnnotationSurface::pageCount() const
{
    if (!m_doc) return 0;

    int count = 0;
    fz_try(m_ctx) {
        count = pdf_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to count pages:" << fz_caught_message(m_ctx);
        count = 0;
    }
    return count;
}

QSizeF MuPdfAnnotationSurface::pageSize(int page) const
{
    pdf_page* pdfPage = loadPage(page);
    if (!pdfPage) return QSizeF();

    fz_rect bounds = fz_empty_rect;
    fz_try(m_ctx) {
        bounds = fz_bound_page(m_ctx, &pdfPage->super);
    }
    fz_always(m_ctx) {
        fz_drop_page(m_ctx, &pdfPage->super);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to bound page" << page << ":" << fz_caught_message(m_ctx);
        return QSizeF();
    }
    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

pdf_page* MuPdfAnnotationSurface::loadPage(int page) const
{
    if (!m_doc) return nullptr;
    if (page < 0 || page >= pageCount()) {
        qWarning() << "[MuPdfAnnotationSurface] Page out of range:" << page;
        return nullptr;
    }

    pdf_page* pdfPage = nullptr;
    fz_try(m_ctx) {
        pdfPage = pdf_load_page(m_ctx, m_doc, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to load page" << page << ":" << fz_caught_message(m_ctx);
        pdfPage = nullptr;
    }
    return pdfPage;
}

// ============================================================================
// Geometry
// ============================================================================

float MuPdfAnnotationSurface::textWidth(const QString& text, float fontSize) const
{
    if (!m_helvetica) return 0.0f;

    float advance = 0.0f;
    fz_try(m_ctx) {
        for (const QChar ch : text) {
            const int glyph = fz_encode_character(m_ctx, m_helvetica, ch.unicode());
            advance += fz_advance_glyph(m_ctx, m_helvetica, glyph, 0);
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to measure" << text << ":" << fz_caught_message(m_ctx);
        advance = 0.0f;
    }
    return advance * fontSize;
}

QRectF MuPdfAnnotationSurface::expectedRect(const NumberAnnotation& annotation) const
{
    const NumberStyle& style = annotation.style;
    const qreal width = textWidth(annotation.label, static_cast<float>(style.fontSize)) + style.padding * 2;
    const qreal height = style.fontSize + style.padding * 2;
    return QRectF(annotation.position, QSizeF(width, height));
}

// ============================================================================
// Lookup
// ============================================================================

pdf_annot* MuPdfAnnotationSurface::findByName(pdf_page* page, const QString& name, int type) const
{
    pdf_annot* found = nullptr;
    fz_try(m_ctx) {
        for (pdf_annot* annot = pdf_first_annot(m_ctx, page); annot; annot = pdf_next_annot(m_ctx, annot)) {
            if (pdf_annot_type(m_ctx, annot) == type && annotName(m_ctx, annot) == name) {
                found = annot;
                break;
            }
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Lookup failed:" << fz_caught_message(m_ctx);
        found = nullptr;
    }
    return found;
}

pdf_annot* MuPdfAnnotationSurface::findMark(pdf_page* page, const NumberAnnotation& annotation, Match match) const
{
    const int xref = annotation.surfaceLocator.isValid() ? annotation.surfaceLocator.toInt() : 0;
    pdf_annot* found = nullptr;

    // 1. Locator (object number)
    if (xref > 0) {
        fz_try(m_ctx) {
            for (pdf_annot* annot = pdf_first_annot(m_ctx, page); annot; annot = pdf_next_annot(m_ctx, annot)) {
                if (pdf_annot_type(m_ctx, annot) != PDF_ANNOT_FREE_TEXT
                    || pdf_to_num(m_ctx, pdf_annot_obj(m_ctx, annot)) != xref) {
                    continue;
                }
                // Object numbers are reused; a named mark must carry our id
                const QString name = annotName(m_ctx, annot);
                if (name.isEmpty() || name == annotation.id) {
                    found = annot;
                }
                break;
            }
        }
        fz_catch(m_ctx) {
            qWarning() << "[MuPdfAnnotationSurface] Locator lookup failed:" << fz_caught_message(m_ctx);
            found = nullptr;
        }
    }

    // 2. Name
    if (!found) {
        found = findByName(page, annotation.id, PDF_ANNOT_FREE_TEXT);
    }

    // 3. Position
    if (!found && match == Match::LocatorNameOrPosition) {
        const QRectF expected = expectedRect(annotation);
        fz_try(m_ctx) {
            for (pdf_annot* annot = pdf_first_annot(m_ctx, page); annot; annot = pdf_next_annot(m_ctx, annot)) {
                if (pdf_annot_type(m_ctx, annot) != PDF_ANNOT_FREE_TEXT) {
                    continue;
                }
                const fz_rect r = pdf_annot_rect(m_ctx, annot);
                if (std::fabs(r.x0 - expected.left()) < POSITION_TOLERANCE
                    && std::fabs(r.y0 - expected.top()) < POSITION_TOLERANCE
                    && std::fabs(r.x1 - expected.right()) < POSITION_TOLERANCE
                    && std::fabs(r.y1 - expected.bottom()) < POSITION_TOLERANCE) {
                    found = annot;
                    break;
                }
            }
        }
        fz_catch(m_ctx) {
            qWarning() << "[MuPdfAnnotationSurface] Position lookup failed:" << fz_caught_message(m_ctx);
            found = nullptr;
        }
    }

    return found;
}

// ============================================================================
// Writing
// ============================================================================

bool MuPdfAnnotationSurface::deleteMarks(pdf_page* page, const NumberAnnotation& annotation, Match match)
{
    bool deleted = false;
    pdf_annot* box = findMark(page, annotation, match);
    if (box) {
        fz_try(m_ctx) {
            pdf_delete_annot(m_ctx, page, box);
            deleted = true;
        }
        fz_catch(m_ctx) {
            qWarning() << "[MuPdfAnnotationSurface] Failed to delete mark:" << fz_caught_message(m_ctx);
        }
    }

    pdf_annot* tail = findByName(page, annotation.id + QLatin1String(TAIL_SUFFIX), PDF_ANNOT_LINE);
    if (tail) {
        fz_try(m_ctx) {
            pdf_delete_annot(m_ctx, page, tail);
        }
        fz_catch(m_ctx) {
            qWarning() << "[MuPdfAnnotationSurface] Failed to delete tail:" << fz_caught_message(m_ctx);
        }
    }
    return deleted;
}

int MuPdfAnnotationSurface::writeMark(pdf_page* page, const NumberAnnotation& annotation)
{
    const NumberStyle& style = annotation.style;
    const QRectF rect = expectedRect(annotation);
    const QByteArray labelUtf8 = annotation.label.toUtf8();
    const QByteArray idUtf8 = annotation.id.toUtf8();
    const QByteArray tailNameUtf8 = (annotation.id + QLatin1String(TAIL_SUFFIX)).toUtf8();

    float textRgb[3];
    float fillRgb[3];
    toRgb(style.textColor, textRgb);
    toRgb(style.backgroundColor, fillRgb);

    pdf_annot* box = nullptr;
    pdf_annot* tail = nullptr;
    int xref = 0;

    fz_var(box);
    fz_var(tail);

    fz_try(m_ctx) {
        box = pdf_create_annot(m_ctx, page, PDF_ANNOT_FREE_TEXT);
        pdf_set_annot_rect(m_ctx, box, fz_make_rect(static_cast<float>(rect.left()),
                                                    static_cast<float>(rect.top()),
                                                    static_cast<float>(rect.right()),
                                                    static_cast<float>(rect.bottom())));
        pdf_set_annot_contents(m_ctx, box, labelUtf8.constData());
        pdf_set_annot_default_appearance(m_ctx, box, "Helv", static_cast<float>(style.fontSize), 3, textRgb);
        pdf_set_annot_quadding(m_ctx, box, 1);

        if (style.backgroundOpacity > 0.0) {
            pdf_set_annot_color(m_ctx, box, 3, fillRgb);
            if (style.backgroundOpacity < 1.0) {
                pdf_set_annot_opacity(m_ctx, box, static_cast<float>(style.backgroundOpacity));
            }
        } else {
            pdf_set_annot_color(m_ctx, box, 0, nullptr);
        }

        pdf_set_annot_border_width(m_ctx, box,
                                   style.borderEnabled ? static_cast<float>(style.borderWidth) : 0.0f);
        pdf_dict_put_text_string(m_ctx, pdf_annot_obj(m_ctx, box), PDF_NAME(NM), idUtf8.constData());
        pdf_update_annot(m_ctx, box);
        xref = pdf_to_num(m_ctx, pdf_annot_obj(m_ctx, box));

        if (style.tailEnabled && style.tailLength > 0.0) {
            const float cx = static_cast<float>(rect.center().x());
            const float top = static_cast<float>(rect.bottom());
            const float bottom = top + static_cast<float>(style.tailLength);

            tail = pdf_create_annot(m_ctx, page, PDF_ANNOT_LINE);
            pdf_set_annot_line(m_ctx, tail, fz_make_point(cx, top), fz_make_point(cx, bottom));
            pdf_set_annot_color(m_ctx, tail, 3, textRgb);
            pdf_set_annot_border_width(m_ctx, tail, static_cast<float>(style.tailWidth));
            pdf_dict_put_text_string(m_ctx, pdf_annot_obj(m_ctx, tail), PDF_NAME(NM), tailNameUtf8.constData());
            pdf_update_annot(m_ctx, tail);
        }
    }
    fz_always(m_ctx) {
        pdf_drop_annot(m_ctx, tail);
        pdf_drop_annot(m_ctx, box);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to write mark" << annotation.label
                   << ":" << fz_caught_message(m_ctx);
        xref = 0;
    }
    return xref;
}

bool MuPdfAnnotationSurface::applyAnnotation(NumberAnnotation& annotation)
{
    pdf_page* page = loadPage(annotation.page);
    if (!page) return false;

    deleteMarks(page, annotation, Match::LocatorOrName);
    const int xref = writeMark(page, annotation);
    fz_drop_page(m_ctx, &page->super);

    if (xref <= 0) {
        annotation.surfaceLocator = QVariant();
        return false;
    }
    annotation.surfaceLocator = xref;
    return true;
}

bool MuPdfAnnotationSurface::removeAnnotation(NumberAnnotation& annotation)
{
    pdf_page* page = loadPage(annotation.page);
    if (!page) return false;

    const bool found = deleteMarks(page, annotation, Match::LocatorNameOrPosition);
    fz_drop_page(m_ctx, &page->super);

    annotation.surfaceLocator = QVariant();
    return found;
}

// ============================================================================
// Bulk
// ============================================================================

int MuPdfAnnotationSurface::rebuild(AnnotationStore& store)
{
    if (!m_doc) return 0;

    const int pages = pageCount();
    int removed = 0;
    for (int i = 0; i < pages; ++i) {
        pdf_page* page = loadPage(i);
        if (!page) continue;

        fz_try(m_ctx) {
            // Deleting unlinks from the list, so rescan from the start each time
            bool again = true;
            while (again) {
                again = false;
                for (pdf_annot* annot = pdf_first_annot(m_ctx, page); annot; annot = pdf_next_annot(m_ctx, annot)) {
                    if (isOwnedMark(m_ctx, annot)) {
                        pdf_delete_annot(m_ctx, page, annot);
                        ++removed;
                        again = true;
                        break;
                    }
                }
            }
        }
        fz_always(m_ctx) {
            fz_drop_page(m_ctx, &page->super);
        }
        fz_catch(m_ctx) {
            qWarning() << "[MuPdfAnnotationSurface] Failed to clear page" << i << ":" << fz_caught_message(m_ctx);
        }
    }

    int written = 0;
    for (NumberAnnotation* annotation : store.all()) {
        annotation->surfaceLocator = QVariant();
        if (applyAnnotation(*annotation)) {
            ++written;
        }
    }

    qDebug() << "[MuPdfAnnotationSurface] Rebuilt marks: removed" << removed << "wrote" << written;
    return written;
}

int MuPdfAnnotationSurface::refreshLocators(AnnotationStore& store)
{
    int resolved = 0;
    for (int pageIndex : store.pagesWithAnnotations()) {
        pdf_page* page = loadPage(pageIndex);
        const QVector<NumberAnnotation*> onPage = store.getForPage(pageIndex);
        if (!page) {
            for (NumberAnnotation* annotation : onPage) {
                annotation->surfaceLocator = QVariant();
            }
            continue;
        }

        for (NumberAnnotation* annotation : onPage) {
            pdf_annot* mark = findByName(page, annotation->id, PDF_ANNOT_FREE_TEXT);
            if (mark) {
                annotation->surfaceLocator = pdf_to_num(m_ctx, pdf_annot_obj(m_ctx, mark));
                ++resolved;
            } else {
                annotation->surfaceLocator = QVariant();
            }
        }
        fz_drop_page(m_ctx, &page->super);
    }
    return resolved;
}

// ============================================================================
// Metadata
// ============================================================================

bool MuPdfAnnotationSurface::writeStoreMetadata(const QString& json)
{
    if (!m_doc) return false;

    const QByteArray payload = QByteArray(METADATA_PREFIX) + json.toUtf8();
    bool ok = true;
    fz_try(m_ctx) {
        pdf_obj* trailer = pdf_trailer(m_ctx, m_doc);
        pdf_obj* info = pdf_dict_get(m_ctx, trailer, PDF_NAME(Info));
        if (!pdf_is_dict(m_ctx, info)) {
            info = pdf_add_new_dict(m_ctx, m_doc, 4);
            pdf_dict_put_drop(m_ctx, trailer, PDF_NAME(Info), info);
        }
        pdf_dict_put_text_string(m_ctx, info, PDF_NAME(Keywords), payload.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to write metadata:" << fz_caught_message(m_ctx);
        ok = false;
    }
    return ok;
}

QString MuPdfAnnotationSurface::readStoreMetadata() const
{
    if (!m_doc) return QString();

    QString keywords;
    fz_try(m_ctx) {
        pdf_obj* info = pdf_dict_get(m_ctx, pdf_trailer(m_ctx, m_doc), PDF_NAME(Info));
        keywords = QString::fromUtf8(pdf_dict_get_text_string(m_ctx, info, PDF_NAME(Keywords)));
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to read metadata:" << fz_caught_message(m_ctx);
        return QString();
    }

    const QString prefix = QString::fromLatin1(METADATA_PREFIX);
    if (!keywords.startsWith(prefix)) {
        return QString();
    }
    return keywords.mid(prefix.size());
}

// ============================================================================
// Inspection
// ============================================================================

QStringList MuPdfAnnotationSurface::markNames(int page) const
{
    QStringList names;
    pdf_page* pdfPage = loadPage(page);
    if (!pdfPage) return names;

    fz_try(m_ctx) {
        for (pdf_annot* annot = pdf_first_annot(m_ctx, pdfPage); annot; annot = pdf_next_annot(m_ctx, annot)) {
            if (pdf_annot_type(m_ctx, annot) == PDF_ANNOT_FREE_TEXT) {
                names.append(annotName(m_ctx, annot));
            }
        }
    }
    fz_always(m_ctx) {
        fz_drop_page(m_ctx, &pdfPage->super);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfAnnotationSurface] Failed to list marks:" << fz_caught_message(m_ctx);
    }
    return names;
}

QRectF MuPdfAnnotationSurface::markRect(int page, const QString& annotationId) const
{
    pdf_page* pdfPage = loadPage(page);
    if (!pdfPage) return QRectF();

    QRectF result;
    pdf_annot* mark = findByName(pdfPage, annotationId, PDF_ANNOT_FREE_TEXT);
    if (mark) {
        fz_try(m_ctx) {
            const fz_rect r = pdf_annot_rect(m_ctx, mark);
            result = QRectF(QPointF(r.x0, r.y0), QPointF(r.x1, r.y1));
        }
        fz_catch(m_ctx) {
            qWarning() << "[MuPdfAnnotationSurface] Failed to read rect:" << fz_caught_message(m_ctx);
        }
    }
    fz_drop_page(m_ctx, &pdfPage->super);
    return result;
}

bool MuPdfAnnotationSurface::hasTail(int page, const QString& annotationId) const
{
    pdf_page* pdfPage = loadPage(page);
    if (!pdfPage) return false;

    const bool found = findByName(pdfPage, annotationId + QLatin1String(TAIL_SUFFIX), PDF_ANNOT_LINE) != nullptr;
    fz_drop_page(m_ctx, &pdfPage->super);
    return found;
}
