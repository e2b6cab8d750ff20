#include "extractionsimulator.h"

#include <cmath>
#include <QtGlobal>

QString extractionClassToString(ExtractionClass value)
{
    switch (value) {
    case ExtractionClass::Perfect:    return QStringLiteral("Perfect Extraction");
    case ExtractionClass::Good:       return QStringLiteral("Good Extraction");
    case ExtractionClass::Suboptimal: return QStringLiteral("Suboptimal Extraction");
    }
    return QStringLiteral("Suboptimal Extraction");
}

ExtractionClass extractionClassFromString(const QString& str)
{
    if (str == QLatin1String("Perfect Extraction")) return ExtractionClass::Perfect;
    if (str == QLatin1String("Good Extraction"))    return ExtractionClass::Good;
    return ExtractionClass::Suboptimal;
}

QString extractionCharacterToString(ExtractionCharacter value)
{
    switch (value) {
    case ExtractionCharacter::UnderExtracted: return QStringLiteral("Under-extracted");
    case ExtractionCharacter::Balanced:       return QStringLiteral("Balanced");
    case ExtractionCharacter::OverExtracted:  return QStringLiteral("Over-extracted");
    }
    return QStringLiteral("Balanced");
}

ExtractionCharacter extractionCharacterFromString(const QString& str)
{
    if (str == QLatin1String("Under-extracted")) return ExtractionCharacter::UnderExtracted;
    if (str == QLatin1String("Over-extracted"))  return ExtractionCharacter::OverExtracted;
    return ExtractionCharacter::Balanced;
}

QJsonObject ExtractionOutcome::toJson() const
{
    QJsonObject obj;
    obj["qualityScore"] = qualityScore;
    obj["extractionYield"] = extractionYield;
    obj["beverageWeight"] = beverageWeight;
    obj["brewRatio"] = brewRatio;
    obj["classification"] = extractionClassToString(classification);
    obj["character"] = extractionCharacterToString(character);
    return obj;
}

ExtractionOutcome ExtractionOutcome::fromJson(const QJsonObject& json)
{
    ExtractionOutcome outcome;
    outcome.qualityScore = json["qualityScore"].toDouble();
    outcome.extractionYield = json["extractionYield"].toDouble();
    outcome.beverageWeight = json["beverageWeight"].toDouble();
    outcome.brewRatio = json["brewRatio"].toDouble();
    outcome.classification = extractionClassFromString(json["classification"].toString());
    outcome.character = extractionCharacterFromString(json["character"].toString());
    return outcome;
}

ExtractionSimulator::ExtractionSimulator(double doseGrams)
    : m_dose(doseGrams > 0 ? doseGrams : DEFAULT_DOSE)
{
}

bool ExtractionSimulator::isInIdealWindow(const ExtractionParameters& params)
{
    return std::abs(params.temperature - IDEAL_TEMPERATURE) <= TEMPERATURE_TOLERANCE
        && std::abs(params.pressure - IDEAL_PRESSURE) <= PRESSURE_TOLERANCE
        && std::abs(params.timeSeconds - IDEAL_TIME) <= TIME_TOLERANCE;
}

ExtractionOutcome ExtractionSimulator::simulate(const ExtractionParameters& params) const
{
    ExtractionOutcome outcome;

    // Deviations normalized so the edge of the ideal window is 1.0
    double dT = (params.temperature - IDEAL_TEMPERATURE) / TEMPERATURE_TOLERANCE;
    double dP = (params.pressure - IDEAL_PRESSURE) / PRESSURE_TOLERANCE;
    double dt = (params.timeSeconds - IDEAL_TIME) / TIME_TOLERANCE;

    double weighted = TEMPERATURE_WEIGHT * dT * dT
                    + PRESSURE_WEIGHT * dP * dP
                    + TIME_WEIGHT * dt * dt;
    outcome.qualityScore = qBound(0.0, 100.0 * std::exp(-0.5 * weighted), 100.0);

    outcome.extractionYield = BASE_YIELD
        + YIELD_PER_DEGREE * (params.temperature - IDEAL_TEMPERATURE)
        + YIELD_PER_BAR * (params.pressure - IDEAL_PRESSURE)
        + YIELD_PER_SECOND * (params.timeSeconds - IDEAL_TIME);

    outcome.beverageWeight = REFERENCE_BEVERAGE_WEIGHT
        * (params.pressure / IDEAL_PRESSURE)
        * (params.timeSeconds / IDEAL_TIME);
    outcome.brewRatio = outcome.beverageWeight / m_dose;

    if (isInIdealWindow(params)) {
        outcome.classification = ExtractionClass::Perfect;
    } else if (outcome.qualityScore >= GOOD_SCORE_THRESHOLD) {
        outcome.classification = ExtractionClass::Good;
    } else {
        outcome.classification = ExtractionClass::Suboptimal;
    }

    if (outcome.extractionYield < UNDER_EXTRACTED_BELOW) {
        outcome.character = ExtractionCharacter::UnderExtracted;
    } else if (outcome.extractionYield > OVER_EXTRACTED_ABOVE) {
        outcome.character = ExtractionCharacter::OverExtracted;
    } else {
        outcome.character = ExtractionCharacter::Balanced;
    }

    return outcome;
}
