// ============================================================================
// NumberAnnotation - Implementation
// ============================================================================

#include "NumberAnnotation.h"

#include <QUuid>

#include <cmath>

NumberAnnotation::NumberAnnotation()
{
    id = QUuid::createUuid().toString(QUuid::WithoutBraces);
}

NumberAnnotation NumberAnnotation::create(int pageIndex, const QPointF& pos,
                                          const QString& labelText,
                                          const NumberStyle& annotationStyle)
{
    NumberAnnotation annotation;
    annotation.page = pageIndex;
    annotation.position = pos;
    annotation.label = labelText;
    annotation.style = annotationStyle.copy();
    return annotation;
}

QJsonObject NumberAnnotation::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["page"] = page;
    obj["x"] = position.x();
    obj["y"] = position.y();
    obj["number"] = label;
    obj["style"] = style.toJson();
    if (surfaceLocator.isValid()) {
        obj["locator"] = QJsonValue::fromVariant(surfaceLocator);
    }
    return obj;
}

NumberAnnotation NumberAnnotation::fromJson(const QJsonObject& obj, bool* ok, QString* errorMessage)
{
    NumberAnnotation annotation;
    *ok = false;

    const QString loadedId = obj["id"].toString();
    if (!loadedId.isEmpty()) {
        annotation.id = loadedId;
    }

    // Older files store the number as a JSON integer
    const QJsonValue number = obj["number"];
    if (number.isDouble()) {
        const double value = number.toDouble();
        if (!std::isfinite(value) || value < 0 || value > NumberToken::MAX_COMPONENT
            || std::floor(value) != value) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Annotation %1 has number %2, expected a whole number 0-%3")
                                    .arg(annotation.id)
                                    .arg(value)
                                    .arg(NumberToken::MAX_COMPONENT);
            }
            return annotation;
        }
        annotation.label = QString::number(static_cast<int>(value));
    } else if (number.isString()) {
        annotation.label = number.toString();
    } else {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Annotation %1 has no number").arg(annotation.id);
        }
        return annotation;
    }

    NumberToken token = NumberToken::parse(annotation.label);
    if (!token.isValid()) {
        if (errorMessage) {
            *errorMessage = token.errorString();
        }
        return annotation;
    }

    annotation.page = obj["page"].toInt(0);
    if (annotation.page < 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Annotation %1 has a negative page index").arg(annotation.label);
        }
        return annotation;
    }

    annotation.position = QPointF(obj["x"].toDouble(), obj["y"].toDouble());

    const QJsonValue style = obj["style"];
    if (style.isObject()) {
        annotation.style = NumberStyle::fromJson(style.toObject());
    } else if (!style.isUndefined() && !style.isNull()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Annotation %1 has a malformed style").arg(annotation.label);
        }
        return annotation;
    }

    if (obj.contains("locator")) {
        annotation.surfaceLocator = obj["locator"].toVariant();
    }

    *ok = true;
    return annotation;
}
