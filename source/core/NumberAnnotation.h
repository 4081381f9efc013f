#pragma once

// ============================================================================
// NumberAnnotation - One numbered mark placed on a PDF page
// ============================================================================
// Position is stored in PDF page space (points), never in screen pixels, so
// it stays valid across zoom and pan. The label is kept as text because
// sub-numbers ("5.1") and the empty marker ("5p") must round-trip exactly.
// ============================================================================

#include "NumberStyle.h"
#include "NumberToken.h"

#include <QString>
#include <QPointF>
#include <QVariant>
#include <QJsonObject>

class NumberAnnotation {
public:
    // ===== Identity =====
    QString id;                     ///< UUID, stable across renumber/move/undo

    // ===== Placement =====
    int page = 0;                   ///< 0-based page index
    QPointF position;               ///< Top-left of the mark in page coordinates

    // ===== Content =====
    QString label = QStringLiteral("1");   ///< e.g. "12", "12.1", "12p"
    NumberStyle style;                     ///< Owned copy

    /// Handle set by the PDF surface to find the rendered mark again.
    /// Never interpreted outside the surface.
    QVariant surfaceLocator;

    /**
     * @brief Default constructor. Assigns a fresh UUID.
     */
    NumberAnnotation();

    /**
     * @brief Create an annotation with a fresh UUID.
     * @param pageIndex 0-based page.
     * @param pos Position in page coordinates.
     * @param labelText Label; must already be validated by the caller.
     * @param annotationStyle Style; copied.
     */
    static NumberAnnotation create(int pageIndex, const QPointF& pos,
                                   const QString& labelText,
                                   const NumberStyle& annotationStyle);

    // ===== Label helpers =====

    NumberToken token() const { return NumberToken::parse(label); }
    bool isWholeNumber() const { return token().isWhole(); }
    bool hasEmptyMarker() const { return NumberToken::hasEmptyMarker(label); }

    // ===== Serialization =====

    QJsonObject toJson() const;

    /**
     * @brief Build an annotation from JSON.
     * @param obj JSON object with id, page, x, y, number, style and locator.
     * @param errorMessage Receives a description when the entry is unusable.
     * @param ok Set to false when the entry is unusable (bad label, bad page).
     *
     * A missing id is replaced by a fresh UUID; an integer "number" (older
     * files) is converted to its decimal label.
     */
    static NumberAnnotation fromJson(const QJsonObject& obj, bool* ok, QString* errorMessage = nullptr);
};
