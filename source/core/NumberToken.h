#pragma once

// ============================================================================
// NumberToken - Parsed ordering key of an annotation label
// ============================================================================
// Labels follow the grammar  main[.sub][p]
//
//   "67"     -> (67, 0)
//   "67.1"   -> (67, 1)
//   "67p"    -> (67, 0)   trailing 'p' marks an empty/placeholder slot
//   "67.1p"  -> (67, 1)
//
// The 'p' marker is cosmetic: it is stripped before parsing and never takes
// part in ordering or uniqueness. format() never re-appends it; callers that
// want the marker keep it on the label themselves.
// ============================================================================

#include <QString>
#include <QHash>

/**
 * @brief The (main, sub) key derived from a label.
 *
 * An invalid token is returned instead of raising when the label does not
 * match the grammar; check isValid() and errorString().
 */
class NumberToken {
public:
    /// Largest accepted main or sub component. Keeps every renumber and
    /// next-number result representable and the gap range enumerable.
    static constexpr int MAX_COMPONENT = 999999;

    int main = 0;             ///< Whole-number component
    int sub = 0;              ///< Sub-number component (0 = whole number)

    NumberToken() = default;
    NumberToken(int mainValue, int subValue) : main(mainValue), sub(subValue), m_valid(true) {}

    /**
     * @brief Parse a label into its ordering key.
     * @param label Label text, e.g. "12", "12.3", "12p".
     * @return The token. Check isValid() before using main/sub.
     */
    static NumberToken parse(const QString& label);

    /**
     * @brief Convenience wrapper returning the key directly.
     * @param label Label text.
     * @param ok Set to false when the label is malformed.
     */
    static NumberToken parse(const QString& label, bool* ok);

    /**
     * @brief Format a key as label text without the 'p' marker.
     * @return "main" when sub == 0, otherwise "main.sub".
     */
    static QString format(int main, int sub = 0);

    /**
     * @brief Three-way comparison of two labels by key.
     * @return -1, 0 or 1. Malformed labels sort before valid ones.
     */
    static int compare(const QString& a, const QString& b);

    /**
     * @brief Ordering key of a label (alias of parse()).
     */
    static NumberToken sortKey(const QString& label) { return parse(label); }

    static bool isValidLabel(const QString& label) { return parse(label).isValid(); }
    static bool hasEmptyMarker(const QString& label) { return label.endsWith(QLatin1Char('p')); }
    static QString stripEmptyMarker(const QString& label);

    bool isValid() const { return m_valid; }
    bool isWhole() const { return sub == 0; }
    QString errorString() const { return m_error; }

    /**
     * @brief Label text for this key, without the 'p' marker.
     */
    QString toString() const { return format(main, sub); }

    bool operator==(const NumberToken& other) const { return main == other.main && sub == other.sub; }
    bool operator!=(const NumberToken& other) const { return !(*this == other); }
    bool operator<(const NumberToken& other) const {
        return main < other.main || (main == other.main && sub < other.sub);
    }
    bool operator>(const NumberToken& other) const { return other < *this; }
    bool operator<=(const NumberToken& other) const { return !(other < *this); }
    bool operator>=(const NumberToken& other) const { return !(*this < other); }

private:
    static NumberToken invalid(const QString& error);

    bool m_valid = false;
    QString m_error;
};

inline size_t qHash(const NumberToken& token, size_t seed = 0)
{
    return qHashMulti(seed, token.main, token.sub);
}
