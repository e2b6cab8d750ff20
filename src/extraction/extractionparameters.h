#pragma once

#include <QString>
#include <QJsonObject>

/**
 * ExtractionParameters holds the brewing inputs of one simulated shot.
 *
 * Values coming out of ParameterValidator are guaranteed to lie inside the
 * configured ParameterLimits. Field names on the wire are "temperature",
 * "pressure" and "time_seconds".
 */
struct ExtractionParameters {
    double temperature = 93.0;   // Brew water temperature (Celsius)
    double pressure = 9.0;       // Pump pressure (bar)
    double timeSeconds = 25.0;   // Shot duration (seconds)

    QJsonObject toJson() const;
    static ExtractionParameters fromJson(const QJsonObject& json);

    bool operator==(const ExtractionParameters& other) const {
        return temperature == other.temperature
            && pressure == other.pressure
            && timeSeconds == other.timeSeconds;
    }
    bool operator!=(const ExtractionParameters& other) const { return !(*this == other); }
};

// Inclusive [min, max] bounds for one parameter
struct ParameterRange {
    double min = 0.0;
    double max = 0.0;

    bool contains(double value) const { return value >= min && value <= max; }
    QString toString() const;
};

// Accepted ranges and the values used when a parameter is omitted
struct ParameterLimits {
    ParameterRange temperature{85.0, 100.0};
    ParameterRange pressure{6.0, 12.0};
    ParameterRange timeSeconds{15.0, 40.0};

    ExtractionParameters defaults;
};

namespace ParameterField {
    inline const char* Temperature = "temperature";
    inline const char* Pressure = "pressure";
    inline const char* TimeSeconds = "time_seconds";
}
