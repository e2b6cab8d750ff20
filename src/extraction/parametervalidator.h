#pragma once

#include "extractionparameters.h"

#include <QString>
#include <QJsonObject>

// Raw parameter strings as they arrive from a request.
// A null QString means the parameter was not supplied.
struct RawExtractionParameters {
    QString temperature;
    QString pressure;
    QString timeSeconds;
};

struct ValidationError {
    enum class Kind {
        None,
        Malformed,      // Present but not a finite number
        OutOfRange      // Parsed, but outside the accepted range
    };

    Kind kind = Kind::None;
    QString field;          // Wire name of the offending parameter
    QString rawValue;       // Value as supplied
    double value = 0.0;     // Parsed value (OutOfRange only)
    ParameterRange range;   // Accepted bounds (OutOfRange only)

    bool isError() const { return kind != Kind::None; }
    QString kindString() const;
    QString message() const;
    QJsonObject toJson() const;

    static ValidationError malformed(const QString& field, const QString& rawValue);
    static ValidationError outOfRange(const QString& field, double value, const ParameterRange& range);
};

struct ValidationResult {
    ExtractionParameters parameters;
    ValidationError error;

    bool isValid() const { return !error.isError(); }
};

/**
 * ParameterValidator turns raw brewing inputs into validated parameters.
 *
 * A missing value takes the configured default. Fields are checked in the
 * order temperature, pressure, time_seconds and the first failure is
 * reported.
 */
class ParameterValidator {
public:
    ParameterValidator() = default;
    explicit ParameterValidator(const ParameterLimits& limits);

    const ParameterLimits& limits() const { return m_limits; }

    ValidationResult validate(const RawExtractionParameters& raw) const;
    ValidationResult validate(const ExtractionParameters& params) const;

private:
    ValidationError checkField(const char* field, const QString& raw, double fallback,
                               const ParameterRange& range, double* out) const;
    ValidationError checkRange(const char* field, double value, const ParameterRange& range) const;
    static bool parseValue(const QString& raw, double fallback, double* out);

    ParameterLimits m_limits;
};
