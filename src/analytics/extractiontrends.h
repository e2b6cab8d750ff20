#pragma once

#include "../extraction/extractionrecord.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

enum class TrendPeriod {
    Daily,
    Weekly,
    Monthly,
    Yearly,
    All
};

enum class TrendDirection {
    Improving,
    Stable,
    Declining
};

QString trendPeriodToString(TrendPeriod period);
// Returns false for an unrecognized period name
bool trendPeriodFromString(const QString& str, TrendPeriod* period);
QString trendDirectionToString(TrendDirection direction);

struct AverageMetrics {
    double temperature = 0;
    double pressure = 0;
    double timeSeconds = 0;
    double qualityScore = 0;
};

struct QualityDistribution {
    int perfect = 0;
    int good = 0;
    int suboptimal = 0;
};

// Aggregate view over the records created within one period
struct ExtractionTrends {
    TrendPeriod period = TrendPeriod::All;
    int sampleCount = 0;
    double perfectExtractionRate = 0;   // Percent of perfect extractions
    AverageMetrics averages;
    QualityDistribution distribution;
    TrendDirection direction = TrendDirection::Declining;

    // Records with createdAt inside (now - period, now] are included
    static ExtractionTrends calculate(const QVector<ExtractionRecord>& records,
                                      TrendPeriod period,
                                      const QDateTime& now);

    QJsonObject toJson() const;

    static constexpr double IMPROVING_ABOVE = 75.0;
    static constexpr double STABLE_ABOVE = 50.0;
};
