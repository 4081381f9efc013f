#pragma once

// ============================================================================
// AnnotationStore - All number annotations of one open document
// ============================================================================
// The store is the authoritative collection and owns every sequence-level
// algorithm: duplicate lookup, next-number allocation, advance/decrease,
// gap detection and serialization. It never touches rendering; callers take
// the returned change lists to keep the PDF and the undo log in sync.
//
// Uniqueness of labels (ignoring the 'p' marker) is a caller policy, not an
// add() check. See AnnotationSession for the duplicate-resolution protocol.
// ============================================================================

#include "NumberAnnotation.h"

#include <QString>
#include <QVector>
#include <QHash>
#include <memory>
#include <vector>

/**
 * @brief One relabel performed by a bulk renumber.
 */
struct LabelChange {
    QString annotationId;   ///< Stable id of the relabelled annotation
    QString oldLabel;       ///< Label before the change
    QString newLabel;       ///< Label after the change

    bool operator==(const LabelChange& other) const {
        return annotationId == other.annotationId
            && oldLabel == other.oldLabel
            && newLabel == other.newLabel;
    }
};

/**
 * @brief Result of validateSequence().
 */
struct SequenceValidation {
    bool valid = true;
    QString message;
};

class AnnotationStore {
public:
    AnnotationStore() = default;
    ~AnnotationStore() = default;

    // Owns its annotations; not copyable
    AnnotationStore(const AnnotationStore&) = delete;
    AnnotationStore& operator=(const AnnotationStore&) = delete;

    // ===== Mutation =====

    /**
     * @brief Insert an annotation (replacing any entry with the same id).
     * @return Pointer to the stored annotation.
     *
     * Does not check for duplicate labels.
     */
    NumberAnnotation* add(const NumberAnnotation& annotation);

    /**
     * @brief Remove an annotation.
     * @return The removed annotation, or nullptr if the id is unknown.
     */
    std::unique_ptr<NumberAnnotation> remove(const QString& id);

    bool relabel(const QString& id, const QString& label);
    bool move(const QString& id, const QPointF& position);
    bool restyle(const QString& id, const NumberStyle& style);

    /**
     * @brief Remove every annotation.
     */
    void clear();

    // ===== Lookup =====

    NumberAnnotation* get(const QString& id) const;
    QVector<NumberAnnotation*> getForPage(int page) const;
    QVector<NumberAnnotation*> all() const;

    /**
     * @brief All annotations ordered by number key.
     *
     * Stable: equal keys keep insertion order.
     */
    QVector<NumberAnnotation*> allSorted() const;

    /**
     * @brief Distinct pages that carry annotations, ascending.
     */
    QVector<int> pagesWithAnnotations() const;

    int count() const { return static_cast<int>(m_annotations.size()); }
    bool isEmpty() const { return m_annotations.empty(); }

    /**
     * @brief Check whether a label is taken ("5p" and "5" are the same).
     */
    bool hasLabel(const QString& label) const;

    /**
     * @brief First annotation whose label matches ignoring the 'p' marker.
     */
    NumberAnnotation* getByLabel(const QString& label) const;

    // ===== Sequence =====

    /**
     * @brief Next whole number after the highest whole number in use.
     * @return "1" for a store without whole numbers, or an empty string
     *         when the highest number is already NumberToken::MAX_COMPONENT.
     */
    QString nextWholeNumber() const;

    /**
     * @brief Next free sub-number under a main number.
     * @param main Main number as text (a full label is accepted too).
     * @return e.g. "5.3" when 5.1 and 5.2 exist, "5.1" when none exist,
     *         or an empty string for an unparsable main or when the
     *         sub-numbers are exhausted.
     */
    QString nextSubNumber(const QString& main) const;
    QString nextSubNumber(int main) const;

    /**
     * @brief Shift whole numbers >= the target's main up by delta.
     *
     * Sub-numbers are never touched. A trailing 'p' is kept.
     * Nothing changes if any result would leave 0..NumberToken::MAX_COMPONENT.
     * @return The changes, ordered by old number.
     */
    QVector<LabelChange> advanceFrom(const QString& label, int delta = 1);

    /**
     * @brief Shift sub-numbers of the target's main with sub >= the target's sub.
     *
     * "5.2" with delta 1 turns 5.2, 5.3 into 5.3, 5.4 and leaves 5 and 5.1
     * alone. A whole-number target changes nothing.
     * @return The changes, ordered by old number.
     */
    QVector<LabelChange> advanceSubNumbersFrom(const QString& label, int delta = 1);

    /**
     * @brief Shift whole numbers > the target's main down by delta.
     *
     * The target itself is excluded: it is the entry about to be deleted.
     * @return The changes, ordered by old number.
     */
    QVector<LabelChange> decreaseFrom(const QString& label, int delta = 1);

    /**
     * @brief Replay (or revert) a recorded renumber.
     * @param changes Changes returned by advanceFrom()/decreaseFrom().
     * @param revert Restore oldLabel instead of applying newLabel.
     * @return Ids of the annotations that were relabelled.
     */
    QVector<QString> applyLabelChanges(const QVector<LabelChange>& changes, bool revert);

    /**
     * @brief Whole numbers missing between the lowest and highest in use.
     * @param limit Stop after this many gaps (-1 for all).
     */
    QVector<int> findGaps(int limit = -1) const;

    /**
     * @brief Number of missing whole numbers, without listing them.
     */
    int gapCount() const;

    SequenceValidation validateSequence() const;

    // ===== Modified flag =====

    bool isModified() const { return m_modified; }
    void setModified(bool modified) { m_modified = modified; }
    void markModified() { m_modified = true; }
    void clearModified() { m_modified = false; }

    // ===== Serialization =====

    QString toJson() const;

    /**
     * @brief Replace all annotations with the contents of a JSON array.
     * @param json Text produced by toJson().
     * @param errorMessage Receives a description on failure.
     * @return False on malformed input; the store is left untouched.
     */
    bool fromJson(const QString& json, QString* errorMessage = nullptr);

private:
    QVector<int> sortedWholeNumbers() const;
    QVector<LabelChange> relabelShifted(const QVector<NumberAnnotation*>& affected, int delta, bool shiftSub);
    QVector<LabelChange> shiftWholeNumbers(int threshold, bool inclusive, int delta);

    std::vector<std::unique_ptr<NumberAnnotation>> m_annotations;  ///< Insertion order
    QHash<QString, NumberAnnotation*> m_index;                     ///< id -> annotation
    bool m_modified = false;
};
