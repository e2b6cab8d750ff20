#include "alertgenerator.h"
#include "../extraction/extractionsimulator.h"

#include <QUuid>
#include <cmath>

QString alertSeverityToString(AlertSeverity severity)
{
    switch (severity) {
    case AlertSeverity::Info:     return QStringLiteral("Info");
    case AlertSeverity::Warning:  return QStringLiteral("Warning");
    case AlertSeverity::Critical: return QStringLiteral("Critical");
    }
    return QStringLiteral("Info");
}

QString alertCategoryToString(AlertCategory category)
{
    switch (category) {
    case AlertCategory::ExtractionQuality:  return QStringLiteral("ExtractionQuality");
    case AlertCategory::ParameterDeviation: return QStringLiteral("ParameterDeviation");
    case AlertCategory::PerformanceTrend:   return QStringLiteral("PerformanceTrend");
    case AlertCategory::SystemHealth:       return QStringLiteral("SystemHealth");
    }
    return QStringLiteral("SystemHealth");
}

QJsonObject Alert::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["timestamp"] = timestamp.toUTC().toString(Qt::ISODateWithMs);
    obj["severity"] = alertSeverityToString(severity);
    obj["category"] = alertCategoryToString(category);
    obj["rule"] = rule;
    obj["message"] = message;
    obj["metadata"] = metadata;
    return obj;
}

AlertGenerator::AlertGenerator()
{
    m_recordRules << temperatureDeviationRule() << pressureInstabilityRule();
    m_trendRules << lowPerfectRateRule();
}

AlertGenerator::RecordRule AlertGenerator::temperatureDeviationRule()
{
    return RecordRule{
        QStringLiteral("Temperature Deviation"),
        [](const ExtractionRecord& record, Alert* alert) {
            double temperature = record.parameters.temperature;
            if (std::abs(temperature - ExtractionSimulator::IDEAL_TEMPERATURE)
                    <= ExtractionSimulator::TEMPERATURE_TOLERANCE) {
                return false;
            }
            alert->severity = AlertSeverity::Critical;
            alert->category = AlertCategory::ParameterDeviation;
            alert->message = QStringLiteral("Temperature outside acceptable range");
            alert->metadata["recordId"] = record.id;
            alert->metadata["temperature"] = temperature;
            return true;
        }
    };
}

AlertGenerator::RecordRule AlertGenerator::pressureInstabilityRule()
{
    return RecordRule{
        QStringLiteral("Pressure Instability"),
        [](const ExtractionRecord& record, Alert* alert) {
            double pressure = record.parameters.pressure;
            if (std::abs(pressure - ExtractionSimulator::IDEAL_PRESSURE)
                    <= ExtractionSimulator::PRESSURE_TOLERANCE) {
                return false;
            }
            alert->severity = AlertSeverity::Warning;
            alert->category = AlertCategory::ParameterDeviation;
            alert->message = QStringLiteral("Pressure outside stable range");
            alert->metadata["recordId"] = record.id;
            alert->metadata["pressure"] = pressure;
            return true;
        }
    };
}

AlertGenerator::TrendRule AlertGenerator::lowPerfectRateRule()
{
    return TrendRule{
        QStringLiteral("Low Perfect Extraction Rate"),
        [](const ExtractionTrends& trends, Alert* alert) {
            if (trends.sampleCount == 0 || trends.perfectExtractionRate >= LOW_PERFECT_RATE) {
                return false;
            }
            alert->severity = AlertSeverity::Warning;
            alert->category = AlertCategory::ExtractionQuality;
            alert->message = QStringLiteral("Low perfect extraction rate detected");
            alert->metadata["perfectRate"] = trends.perfectExtractionRate;
            alert->metadata["sampleCount"] = trends.sampleCount;
            alert->metadata["period"] = trendPeriodToString(trends.period);
            return true;
        }
    };
}

QList<Alert> AlertGenerator::forRecord(const ExtractionRecord& record, const QDateTime& now) const
{
    QList<Alert> alerts;
    for (const RecordRule& rule : m_recordRules) {
        Alert alert;
        if (rule.evaluate(record, &alert)) {
            alert.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
            alert.timestamp = now;
            alert.rule = rule.name;
            alerts.append(alert);
        }
    }
    return alerts;
}

QList<Alert> AlertGenerator::forTrends(const ExtractionTrends& trends, const QDateTime& now) const
{
    QList<Alert> alerts;
    for (const TrendRule& rule : m_trendRules) {
        Alert alert;
        if (rule.evaluate(trends, &alert)) {
            alert.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
            alert.timestamp = now;
            alert.rule = rule.name;
            alerts.append(alert);
        }
    }
    return alerts;
}

QStringList AlertGenerator::ruleNames() const
{
    QStringList names;
    for (const RecordRule& rule : m_recordRules) {
        names << rule.name;
    }
    for (const TrendRule& rule : m_trendRules) {
        names << rule.name;
    }
    return names;
}
