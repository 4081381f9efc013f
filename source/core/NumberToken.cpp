// ============================================================================
// NumberToken - Implementation
// ============================================================================

#include "NumberToken.h"

#include <QStringList>

enum class ComponentStatus { Ok, NotNumeric, OutOfRange };

// Parses a non-negative decimal integer made of ASCII digits only.
// QString::toInt() alone would accept signs and surrounding whitespace.
static ComponentStatus parseComponent(const QString& text, int* value)
{
    if (text.isEmpty()) {
        return ComponentStatus::NotNumeric;
    }
    for (const QChar c : text) {
        if (c < QLatin1Char('0') || c > QLatin1Char('9')) {
            return ComponentStatus::NotNumeric;
        }
    }
    bool ok = false;
    const qlonglong result = text.toLongLong(&ok);
    if (!ok || result > NumberToken::MAX_COMPONENT) {
        return ComponentStatus::OutOfRange;
    }
    *value = static_cast<int>(result);
    return ComponentStatus::Ok;
}

NumberToken NumberToken::invalid(const QString& error)
{
    NumberToken token;
    token.m_valid = false;
    token.m_error = error;
    return token;
}

QString NumberToken::stripEmptyMarker(const QString& label)
{
    if (hasEmptyMarker(label)) {
        return label.left(label.size() - 1);
    }
    return label;
}

NumberToken NumberToken::parse(const QString& label)
{
    const QString numeric = stripEmptyMarker(label);
    if (numeric.isEmpty()) {
        return invalid(QStringLiteral("Empty number"));
    }

    const QStringList parts = numeric.split(QLatin1Char('.'));
    if (parts.size() > 2) {
        return invalid(QStringLiteral("'%1' has more than one decimal point").arg(label));
    }

    int mainValue = 0;
    switch (parseComponent(parts[0], &mainValue)) {
        case ComponentStatus::Ok:
            break;
        case ComponentStatus::NotNumeric:
            return invalid(QStringLiteral("'%1' is not a valid number (e.g. 67 or 67.1)").arg(label));
        case ComponentStatus::OutOfRange:
            return invalid(QStringLiteral("'%1' is too large (max %2)").arg(label).arg(MAX_COMPONENT));
    }

    int subValue = 0;
    if (parts.size() == 2) {
        switch (parseComponent(parts[1], &subValue)) {
            case ComponentStatus::Ok:
                break;
            case ComponentStatus::NotNumeric:
                return invalid(QStringLiteral("'%1' has an invalid sub-number").arg(label));
            case ComponentStatus::OutOfRange:
                return invalid(QStringLiteral("'%1' has a sub-number above %2").arg(label).arg(MAX_COMPONENT));
        }
    }

    return NumberToken(mainValue, subValue);
}

NumberToken NumberToken::parse(const QString& label, bool* ok)
{
    NumberToken token = parse(label);
    if (ok) {
        *ok = token.isValid();
    }
    return token;
}

QString NumberToken::format(int main, int sub)
{
    if (sub == 0) {
        return QString::number(main);
    }
    return QStringLiteral("%1.%2").arg(main).arg(sub);
}

int NumberToken::compare(const QString& a, const QString& b)
{
    const NumberToken ka = parse(a);
    const NumberToken kb = parse(b);

    if (!ka.isValid() || !kb.isValid()) {
        if (ka.isValid() == kb.isValid()) return 0;
        return ka.isValid() ? 1 : -1;
    }

    if (ka < kb) return -1;
    if (kb < ka) return 1;
    return 0;
}
