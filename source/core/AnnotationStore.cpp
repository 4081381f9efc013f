// ============================================================================
// AnnotationStore - Implementation
// ============================================================================

#include "AnnotationStore.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>
#include <QStringList>

#include <algorithm>

// Gaps listed one by one up to this count; longer lists are summarized
static constexpr int MAX_LISTED_GAPS = 5;

// ============================================================================
// Mutation
// ============================================================================

NumberAnnotation* AnnotationStore::add(const NumberAnnotation& annotation)
{
    m_modified = true;

    NumberAnnotation* existing = m_index.value(annotation.id, nullptr);
    if (existing) {
        *existing = annotation;
        return existing;
    }

    m_annotations.push_back(std::make_unique<NumberAnnotation>(annotation));
    NumberAnnotation* stored = m_annotations.back().get();
    m_index.insert(stored->id, stored);
    return stored;
}

std::unique_ptr<NumberAnnotation> AnnotationStore::remove(const QString& id)
{
    auto it = std::find_if(m_annotations.begin(), m_annotations.end(),
                           [&id](const std::unique_ptr<NumberAnnotation>& a) { return a->id == id; });
    if (it == m_annotations.end()) {
        return nullptr;
    }

    std::unique_ptr<NumberAnnotation> removed = std::move(*it);
    m_annotations.erase(it);
    m_index.remove(id);
    m_modified = true;
    return removed;
}

bool AnnotationStore::relabel(const QString& id, const QString& label)
{
    NumberAnnotation* annotation = get(id);
    if (!annotation) return false;

    annotation->label = label;
    m_modified = true;
    return true;
}

bool AnnotationStore::move(const QString& id, const QPointF& position)
{
    NumberAnnotation* annotation = get(id);
    if (!annotation) return false;

    annotation->position = position;
    m_modified = true;
    return true;
}

bool AnnotationStore::restyle(const QString& id, const NumberStyle& style)
{
    NumberAnnotation* annotation = get(id);
    if (!annotation) return false;

    annotation->style = style.copy();
    m_modified = true;
    return true;
}

void AnnotationStore::clear()
{
    m_annotations.clear();
    m_index.clear();
    m_modified = true;
}

// ============================================================================
// Lookup
// ============================================================================

NumberAnnotation* AnnotationStore::get(const QString& id) const
{
    return m_index.value(id, nullptr);
}

QVector<NumberAnnotation*> AnnotationStore::getForPage(int page) const
{
    QVector<NumberAnnotation*> result;
    for (const auto& annotation : m_annotations) {
        if (annotation->page == page) {
            result.append(annotation.get());
        }
    }
    return result;
}

QVector<NumberAnnotation*> AnnotationStore::all() const
{
    QVector<NumberAnnotation*> result;
    result.reserve(count());
    for (const auto& annotation : m_annotations) {
        result.append(annotation.get());
    }
    return result;
}

QVector<NumberAnnotation*> AnnotationStore::allSorted() const
{
    QVector<NumberAnnotation*> result = all();
    std::stable_sort(result.begin(), result.end(),
                     [](const NumberAnnotation* a, const NumberAnnotation* b) {
                         return a->token() < b->token();
                     });
    return result;
}

QVector<int> AnnotationStore::pagesWithAnnotations() const
{
    QVector<int> pages;
    for (const auto& annotation : m_annotations) {
        if (!pages.contains(annotation->page)) {
            pages.append(annotation->page);
        }
    }
    std::sort(pages.begin(), pages.end());
    return pages;
}

bool AnnotationStore::hasLabel(const QString& label) const
{
    return getByLabel(label) != nullptr;
}

NumberAnnotation* AnnotationStore::getByLabel(const QString& label) const
{
    const NumberToken key = NumberToken::parse(label);
    if (!key.isValid()) {
        return nullptr;
    }
    for (const auto& annotation : m_annotations) {
        if (annotation->token() == key) {
            return annotation.get();
        }
    }
    return nullptr;
}

// ============================================================================
// Sequence
// ============================================================================

QString AnnotationStore::nextWholeNumber() const
{
    int highest = 0;
    for (const auto& annotation : m_annotations) {
        const NumberToken key = annotation->token();
        if (key.isValid() && key.isWhole()) {
            highest = std::max(highest, key.main);
        }
    }
    if (highest >= NumberToken::MAX_COMPONENT) {
        qWarning() << "AnnotationStore::nextWholeNumber: no number left above" << highest;
        return QString();
    }
    return NumberToken::format(highest + 1);
}

QString AnnotationStore::nextSubNumber(const QString& main) const
{
    const NumberToken key = NumberToken::parse(main);
    if (!key.isValid()) {
        return QString();
    }
    return nextSubNumber(key.main);
}

QString AnnotationStore::nextSubNumber(int main) const
{
    if (main < 0 || main > NumberToken::MAX_COMPONENT) {
        return QString();
    }

    int highestSub = 0;
    for (const auto& annotation : m_annotations) {
        const NumberToken key = annotation->token();
        if (key.isValid() && key.main == main) {
            highestSub = std::max(highestSub, key.sub);
        }
    }
    if (highestSub >= NumberToken::MAX_COMPONENT) {
        qWarning() << "AnnotationStore::nextSubNumber: no sub-number left under" << main;
        return QString();
    }
    return NumberToken::format(main, highestSub + 1);
}

QVector<LabelChange> AnnotationStore::relabelShifted(const QVector<NumberAnnotation*>& affected,
                                                     int delta, bool shiftSub)
{
    // Check the whole range first so a refused shift changes nothing
    for (const NumberAnnotation* annotation : affected) {
        const NumberToken key = annotation->token();
        const qint64 shifted = static_cast<qint64>(shiftSub ? key.sub : key.main) + delta;
        if (shifted < (shiftSub ? 1 : 0) || shifted > NumberToken::MAX_COMPONENT) {
            qWarning() << "AnnotationStore: shifting" << annotation->label << "by" << delta
                       << "leaves the number range";
            return {};
        }
    }

    QVector<LabelChange> changes;
    for (NumberAnnotation* annotation : affected) {
        const NumberToken key = annotation->token();
        QString newLabel = shiftSub ? NumberToken::format(key.main, key.sub + delta)
                                    : NumberToken::format(key.main + delta);
        if (annotation->hasEmptyMarker()) {
            newLabel += QLatin1Char('p');
        }
        changes.append({annotation->id, annotation->label, newLabel});
        annotation->label = newLabel;
    }

    if (!changes.isEmpty()) {
        m_modified = true;
    }
    return changes;
}

QVector<LabelChange> AnnotationStore::shiftWholeNumbers(int threshold, bool inclusive, int delta)
{
    QVector<NumberAnnotation*> affected;
    for (NumberAnnotation* annotation : allSorted()) {
        const NumberToken key = annotation->token();
        if (!key.isValid() || !key.isWhole()) {
            continue;
        }
        if (key.main > threshold || (inclusive && key.main == threshold)) {
            affected.append(annotation);
        }
    }
    return relabelShifted(affected, delta, false);
}

QVector<LabelChange> AnnotationStore::advanceFrom(const QString& label, int delta)
{
    const NumberToken target = NumberToken::parse(label);
    if (!target.isValid()) {
        qWarning() << "AnnotationStore::advanceFrom: invalid label" << label;
        return {};
    }
    return shiftWholeNumbers(target.main, true, delta);
}

QVector<LabelChange> AnnotationStore::advanceSubNumbersFrom(const QString& label, int delta)
{
    const NumberToken target = NumberToken::parse(label);
    if (!target.isValid()) {
        qWarning() << "AnnotationStore::advanceSubNumbersFrom: invalid label" << label;
        return {};
    }
    if (target.isWhole()) {
        return {};
    }

    QVector<NumberAnnotation*> affected;
    for (NumberAnnotation* annotation : allSorted()) {
        const NumberToken key = annotation->token();
        if (key.isValid() && key.main == target.main && key.sub >= target.sub) {
            affected.append(annotation);
        }
    }
    return relabelShifted(affected, delta, true);
}

QVector<LabelChange> AnnotationStore::decreaseFrom(const QString& label, int delta)
{
    const NumberToken target = NumberToken::parse(label);
    if (!target.isValid()) {
        qWarning() << "AnnotationStore::decreaseFrom: invalid label" << label;
        return {};
    }
    return shiftWholeNumbers(target.main, false, -delta);
}

QVector<QString> AnnotationStore::applyLabelChanges(const QVector<LabelChange>& changes, bool revert)
{
    QVector<QString> relabelled;
    for (const LabelChange& change : changes) {
        NumberAnnotation* annotation = get(change.annotationId);
        if (!annotation) {
            qWarning() << "AnnotationStore::applyLabelChanges: missing annotation" << change.annotationId;
            continue;
        }
        annotation->label = revert ? change.oldLabel : change.newLabel;
        relabelled.append(annotation->id);
    }
    if (!relabelled.isEmpty()) {
        m_modified = true;
    }
    return relabelled;
}

QVector<int> AnnotationStore::sortedWholeNumbers() const
{
    QSet<int> mains;
    for (const auto& annotation : m_annotations) {
        const NumberToken key = annotation->token();
        if (key.isValid() && key.isWhole()) {
            mains.insert(key.main);
        }
    }
    QVector<int> sorted(mains.begin(), mains.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

QVector<int> AnnotationStore::findGaps(int limit) const
{
    const QVector<int> mains = sortedWholeNumbers();

    // Walk neighbouring pairs; never steps past the highest number in use
    QVector<int> gaps;
    for (int i = 1; i < mains.size(); ++i) {
        for (int n = mains[i - 1] + 1; n < mains[i]; ++n) {
            if (limit >= 0 && gaps.size() >= limit) {
                return gaps;
            }
            gaps.append(n);
        }
    }
    return gaps;
}

int AnnotationStore::gapCount() const
{
    const QVector<int> mains = sortedWholeNumbers();
    if (mains.isEmpty()) {
        return 0;
    }
    return (mains.last() - mains.first() + 1) - mains.size();
}

SequenceValidation AnnotationStore::validateSequence() const
{
    SequenceValidation result;
    const int missing = gapCount();

    if (missing == 0) {
        result.valid = true;
        result.message = QStringLiteral("Sequence complete (%1 numbers)").arg(count());
        return result;
    }

    result.valid = false;
    if (missing == 1) {
        result.message = QStringLiteral("Missing number: %1").arg(findGaps(1).first());
    } else if (missing <= MAX_LISTED_GAPS) {
        QStringList listed;
        for (int gap : findGaps(MAX_LISTED_GAPS)) {
            listed.append(QString::number(gap));
        }
        result.message = QStringLiteral("Missing numbers: %1").arg(listed.join(QStringLiteral(", ")));
    } else {
        // First gap follows the first break; last gap precedes the last break
        const QVector<int> mains = sortedWholeNumbers();
        int first = 0;
        int last = 0;
        for (int i = 1; i < mains.size(); ++i) {
            if (mains[i] > mains[i - 1] + 1) {
                first = mains[i - 1] + 1;
                break;
            }
        }
        for (int i = mains.size() - 1; i > 0; --i) {
            if (mains[i] > mains[i - 1] + 1) {
                last = mains[i] - 1;
                break;
            }
        }
        result.message = QStringLiteral("%1 missing: %2...%3").arg(missing).arg(first).arg(last);
    }
    return result;
}

// ============================================================================
// Serialization
// ============================================================================

QString AnnotationStore::toJson() const
{
    QJsonArray array;
    for (const auto& annotation : m_annotations) {
        array.append(annotation->toJson());
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Indented));
}

bool AnnotationStore::fromJson(const QString& json, QString* errorMessage)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "AnnotationStore::fromJson: parse error" << parseError.errorString();
        if (errorMessage) {
            *errorMessage = parseError.errorString();
        }
        return false;
    }
    if (!doc.isArray()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Annotation data must be a JSON array");
        }
        return false;
    }

    // Parse everything first so a bad entry leaves the store untouched
    QVector<NumberAnnotation> loaded;
    QSet<QString> seenIds;
    const QJsonArray array = doc.array();
    for (int i = 0; i < array.size(); ++i) {
        if (!array[i].isObject()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Entry %1 is not an object").arg(i);
            }
            return false;
        }
        bool ok = false;
        QString entryError;
        NumberAnnotation annotation = NumberAnnotation::fromJson(array[i].toObject(), &ok, &entryError);
        if (!ok) {
            qWarning() << "AnnotationStore::fromJson: rejecting entry" << i << "-" << entryError;
            if (errorMessage) {
                *errorMessage = QStringLiteral("Entry %1: %2").arg(i).arg(entryError);
            }
            return false;
        }
        if (seenIds.contains(annotation.id)) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Entry %1: duplicate id %2").arg(i).arg(annotation.id);
            }
            return false;
        }
        seenIds.insert(annotation.id);
        loaded.append(annotation);
    }

    m_annotations.clear();
    m_index.clear();
    for (const NumberAnnotation& annotation : loaded) {
        add(annotation);
    }
    m_modified = true;

    qDebug() << "AnnotationStore: loaded" << loaded.size() << "annotations";
    return true;
}
