#include "parametervalidator.h"

#include <cmath>

QString ValidationError::kindString() const
{
    switch (kind) {
    case Kind::None:       return QStringLiteral("None");
    case Kind::Malformed:  return QStringLiteral("Malformed");
    case Kind::OutOfRange: return QStringLiteral("OutOfRange");
    }
    return QStringLiteral("None");
}

QString ValidationError::message() const
{
    switch (kind) {
    case Kind::Malformed:
        return QString("%1 must be a number (got \"%2\")").arg(field, rawValue);
    case Kind::OutOfRange:
        return QString("%1 must be between %2 and %3 (got %4)")
            .arg(field).arg(range.min).arg(range.max).arg(value);
    case Kind::None:
        break;
    }
    return QString();
}

QJsonObject ValidationError::toJson() const
{
    QJsonObject obj;
    obj["error"] = kindString();
    obj["field"] = field;
    if (kind == Kind::OutOfRange) {
        obj["value"] = value;
        obj["min"] = range.min;
        obj["max"] = range.max;
    } else {
        obj["value"] = rawValue;
    }
    obj["message"] = message();
    return obj;
}

ValidationError ValidationError::malformed(const QString& field, const QString& rawValue)
{
    ValidationError error;
    error.kind = Kind::Malformed;
    error.field = field;
    error.rawValue = rawValue;
    return error;
}

ValidationError ValidationError::outOfRange(const QString& field, double value, const ParameterRange& range)
{
    ValidationError error;
    error.kind = Kind::OutOfRange;
    error.field = field;
    error.rawValue = QString::number(value);
    error.value = value;
    error.range = range;
    return error;
}

ParameterValidator::ParameterValidator(const ParameterLimits& limits)
    : m_limits(limits)
{
}

bool ParameterValidator::parseValue(const QString& raw, double fallback, double* out)
{
    if (raw.isNull()) {
        *out = fallback;
        return true;
    }

    bool ok = false;
    double value = raw.trimmed().toDouble(&ok);
    if (!ok || !std::isfinite(value)) {
        return false;
    }
    *out = value;
    return true;
}

ValidationResult ParameterValidator::validate(const RawExtractionParameters& raw) const
{
    ValidationResult result;
    const ExtractionParameters& defaults = m_limits.defaults;

    // Each field is parsed and range-checked before the next one is looked at
    result.error = checkField(ParameterField::Temperature, raw.temperature, defaults.temperature,
                              m_limits.temperature, &result.parameters.temperature);
    if (result.error.isError()) return result;

    result.error = checkField(ParameterField::Pressure, raw.pressure, defaults.pressure,
                              m_limits.pressure, &result.parameters.pressure);
    if (result.error.isError()) return result;

    result.error = checkField(ParameterField::TimeSeconds, raw.timeSeconds, defaults.timeSeconds,
                              m_limits.timeSeconds, &result.parameters.timeSeconds);
    return result;
}

ValidationResult ParameterValidator::validate(const ExtractionParameters& params) const
{
    ValidationResult result;
    result.parameters = params;

    result.error = checkRange(ParameterField::Temperature, params.temperature, m_limits.temperature);
    if (result.error.isError()) return result;

    result.error = checkRange(ParameterField::Pressure, params.pressure, m_limits.pressure);
    if (result.error.isError()) return result;

    result.error = checkRange(ParameterField::TimeSeconds, params.timeSeconds, m_limits.timeSeconds);
    return result;
}

ValidationError ParameterValidator::checkField(const char* field, const QString& raw, double fallback,
                                               const ParameterRange& range, double* out) const
{
    if (!parseValue(raw, fallback, out)) {
        return ValidationError::malformed(field, raw);
    }
    return checkRange(field, *out, range);
}

ValidationError ParameterValidator::checkRange(const char* field, double value, const ParameterRange& range) const
{
    if (!std::isfinite(value)) {
        return ValidationError::malformed(field, QString::number(value));
    }
    if (!range.contains(value)) {
        return ValidationError::outOfRange(field, value, range);
    }
    return ValidationError();
}
