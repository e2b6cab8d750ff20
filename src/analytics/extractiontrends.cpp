#include "extractiontrends.h"

namespace {

qint64 periodDays(TrendPeriod period)
{
    switch (period) {
    case TrendPeriod::Daily:   return 1;
    case TrendPeriod::Weekly:  return 7;
    case TrendPeriod::Monthly: return 30;
    case TrendPeriod::Yearly:  return 365;
    case TrendPeriod::All:     return 0;
    }
    return 0;
}

} // namespace

QString trendPeriodToString(TrendPeriod period)
{
    switch (period) {
    case TrendPeriod::Daily:   return QStringLiteral("daily");
    case TrendPeriod::Weekly:  return QStringLiteral("weekly");
    case TrendPeriod::Monthly: return QStringLiteral("monthly");
    case TrendPeriod::Yearly:  return QStringLiteral("yearly");
    case TrendPeriod::All:     return QStringLiteral("all");
    }
    return QStringLiteral("all");
}

bool trendPeriodFromString(const QString& str, TrendPeriod* period)
{
    QString name = str.trimmed().toLower();
    if (name == QLatin1String("daily"))        *period = TrendPeriod::Daily;
    else if (name == QLatin1String("weekly"))  *period = TrendPeriod::Weekly;
    else if (name == QLatin1String("monthly")) *period = TrendPeriod::Monthly;
    else if (name == QLatin1String("yearly"))  *period = TrendPeriod::Yearly;
    else if (name == QLatin1String("all"))     *period = TrendPeriod::All;
    else return false;
    return true;
}

QString trendDirectionToString(TrendDirection direction)
{
    switch (direction) {
    case TrendDirection::Improving: return QStringLiteral("Improving");
    case TrendDirection::Stable:    return QStringLiteral("Stable");
    case TrendDirection::Declining: return QStringLiteral("Declining");
    }
    return QStringLiteral("Declining");
}

ExtractionTrends ExtractionTrends::calculate(const QVector<ExtractionRecord>& records,
                                             TrendPeriod period,
                                             const QDateTime& now)
{
    ExtractionTrends trends;
    trends.period = period;

    qint64 days = periodDays(period);
    QDateTime windowStart = days > 0 ? now.addDays(-days) : QDateTime();

    double sumTemperature = 0;
    double sumPressure = 0;
    double sumTime = 0;
    double sumQuality = 0;

    for (const ExtractionRecord& record : records) {
        if (days > 0 && (record.createdAt <= windowStart || record.createdAt > now)) {
            continue;
        }

        trends.sampleCount++;
        sumTemperature += record.parameters.temperature;
        sumPressure += record.parameters.pressure;
        sumTime += record.parameters.timeSeconds;
        sumQuality += record.outcome.qualityScore;

        switch (record.outcome.classification) {
        case ExtractionClass::Perfect:    trends.distribution.perfect++; break;
        case ExtractionClass::Good:       trends.distribution.good++; break;
        case ExtractionClass::Suboptimal: trends.distribution.suboptimal++; break;
        }
    }

    if (trends.sampleCount > 0) {
        double n = trends.sampleCount;
        trends.perfectExtractionRate = trends.distribution.perfect / n * 100.0;
        trends.averages.temperature = sumTemperature / n;
        trends.averages.pressure = sumPressure / n;
        trends.averages.timeSeconds = sumTime / n;
        trends.averages.qualityScore = sumQuality / n;
    }

    if (trends.perfectExtractionRate > IMPROVING_ABOVE) {
        trends.direction = TrendDirection::Improving;
    } else if (trends.perfectExtractionRate > STABLE_ABOVE) {
        trends.direction = TrendDirection::Stable;
    } else {
        trends.direction = TrendDirection::Declining;
    }

    return trends;
}

QJsonObject ExtractionTrends::toJson() const
{
    QJsonObject averagesObj;
    averagesObj["temperature"] = averages.temperature;
    averagesObj["pressure"] = averages.pressure;
    averagesObj["timeSeconds"] = averages.timeSeconds;
    averagesObj["qualityScore"] = averages.qualityScore;

    QJsonObject distributionObj;
    distributionObj["perfect"] = distribution.perfect;
    distributionObj["good"] = distribution.good;
    distributionObj["suboptimal"] = distribution.suboptimal;

    QJsonObject obj;
    obj["period"] = trendPeriodToString(period);
    obj["sampleCount"] = sampleCount;
    obj["perfectExtractionRate"] = perfectExtractionRate;
    obj["averages"] = averagesObj;
    obj["qualityDistribution"] = distributionObj;
    obj["trendDirection"] = trendDirectionToString(direction);
    return obj;
}
