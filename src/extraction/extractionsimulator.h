#pragma once

#include "extractionparameters.h"

#include <QString>
#include <QJsonObject>

enum class ExtractionClass {
    Perfect,        // Every parameter inside the ideal window
    Good,           // Outside the window but close enough to score well
    Suboptimal
};

enum class ExtractionCharacter {
    UnderExtracted,
    Balanced,
    OverExtracted
};

QString extractionClassToString(ExtractionClass value);
ExtractionClass extractionClassFromString(const QString& str);
QString extractionCharacterToString(ExtractionCharacter value);
ExtractionCharacter extractionCharacterFromString(const QString& str);

// Derived metrics of one simulated shot
struct ExtractionOutcome {
    double qualityScore = 0.0;      // 0-100, 100 = ideal
    double extractionYield = 0.0;   // Percent of dose dissolved into the cup
    double beverageWeight = 0.0;    // Grams in the cup
    double brewRatio = 0.0;         // beverageWeight / dose
    ExtractionClass classification = ExtractionClass::Suboptimal;
    ExtractionCharacter character = ExtractionCharacter::Balanced;

    bool isPerfect() const { return classification == ExtractionClass::Perfect; }
    bool isGood() const { return classification == ExtractionClass::Good; }

    QJsonObject toJson() const;
    static ExtractionOutcome fromJson(const QJsonObject& json);
};

/**
 * ExtractionSimulator - closed-form espresso extraction model
 *
 * Pure function of the parameters: no I/O, no shared state, same input gives
 * the same outcome every time. Defined for any finite input, so it cannot
 * fail on validated parameters.
 *
 * Model:
 * - Quality: Gaussian falloff of the weighted, window-normalized deviation
 *   from the ideal temperature, pressure and time.
 * - Extraction yield: linear sensitivity around 20% at the ideal point.
 *   Hotter water, higher pressure and longer contact all extract more.
 * - Beverage weight: a 36g reference shot scaled by pressure (flow through
 *   the puck) and contact time.
 */
class ExtractionSimulator {
public:
    ExtractionSimulator() = default;
    explicit ExtractionSimulator(double doseGrams);

    double dose() const { return m_dose; }

    ExtractionOutcome simulate(const ExtractionParameters& params) const;

    // True when all three parameters lie inside the ideal window
    static bool isInIdealWindow(const ExtractionParameters& params);

    // Ideal window (the "perfect extraction" zone)
    static constexpr double IDEAL_TEMPERATURE = 93.0;
    static constexpr double TEMPERATURE_TOLERANCE = 3.0;    // 90-96 C
    static constexpr double IDEAL_PRESSURE = 9.0;
    static constexpr double PRESSURE_TOLERANCE = 1.0;       // 8-10 bar
    static constexpr double IDEAL_TIME = 25.0;
    static constexpr double TIME_TOLERANCE = 5.0;           // 20-30 s

    // Quality weights (sum to 1)
    static constexpr double TEMPERATURE_WEIGHT = 0.4;
    static constexpr double PRESSURE_WEIGHT = 0.3;
    static constexpr double TIME_WEIGHT = 0.3;
    static constexpr double GOOD_SCORE_THRESHOLD = 50.0;

    // Extraction yield sensitivities (percentage points per unit)
    static constexpr double BASE_YIELD = 20.0;
    static constexpr double YIELD_PER_DEGREE = 0.25;
    static constexpr double YIELD_PER_BAR = 0.30;
    static constexpr double YIELD_PER_SECOND = 0.15;
    static constexpr double UNDER_EXTRACTED_BELOW = 18.0;
    static constexpr double OVER_EXTRACTED_ABOVE = 22.0;

    // Beverage output
    static constexpr double REFERENCE_BEVERAGE_WEIGHT = 36.0;   // Grams at the ideal point
    static constexpr double DEFAULT_DOSE = 18.0;                // Grams of ground coffee

private:
    double m_dose = DEFAULT_DOSE;
};
