#pragma once

#include "extractiontrends.h"
#include "../extraction/extractionrecord.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <functional>

enum class AlertSeverity {
    Info,
    Warning,
    Critical
};

enum class AlertCategory {
    ExtractionQuality,
    ParameterDeviation,
    PerformanceTrend,
    SystemHealth
};

QString alertSeverityToString(AlertSeverity severity);
QString alertCategoryToString(AlertCategory category);

struct Alert {
    QString id;                 // UUID without braces
    QDateTime timestamp;
    AlertSeverity severity = AlertSeverity::Info;
    AlertCategory category = AlertCategory::SystemHealth;
    QString rule;               // Name of the rule that raised it
    QString message;
    QJsonObject metadata;

    QJsonObject toJson() const;
};

/**
 * AlertGenerator evaluates a fixed rule set against single records and
 * against aggregated trends.
 *
 * Record rules flag parameters that left the ideal brewing window.
 * Trend rules flag a falling share of perfect extractions.
 */
class AlertGenerator {
public:
    AlertGenerator();

    QList<Alert> forRecord(const ExtractionRecord& record, const QDateTime& now) const;
    QList<Alert> forTrends(const ExtractionTrends& trends, const QDateTime& now) const;

    QStringList ruleNames() const;

    static constexpr double LOW_PERFECT_RATE = 40.0;       // Percent

private:
    struct RecordRule {
        QString name;
        std::function<bool(const ExtractionRecord&, Alert*)> evaluate;
    };
    struct TrendRule {
        QString name;
        std::function<bool(const ExtractionTrends&, Alert*)> evaluate;
    };

    static RecordRule temperatureDeviationRule();
    static RecordRule pressureInstabilityRule();
    static TrendRule lowPerfectRateRule();

    QList<RecordRule> m_recordRules;
    QList<TrendRule> m_trendRules;
};
