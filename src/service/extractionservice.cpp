#include "extractionservice.h"
#include "../history/metricsstore.h"

#include <QDebug>

ExtractionService::ExtractionService(MetricsStore* store,
                                     const ParameterValidator& validator,
                                     const ExtractionSimulator& simulator,
                                     QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_validator(validator)
    , m_simulator(simulator)
{
}

StartResult ExtractionService::start(const RawExtractionParameters& raw)
{
    return record(m_validator.validate(raw));
}

StartResult ExtractionService::start(const ExtractionParameters& params)
{
    return record(m_validator.validate(params));
}

StartResult ExtractionService::record(const ValidationResult& validation)
{
    StartResult result;

    if (!validation.isValid()) {
        result.error = validation.error;
        qInfo() << "ExtractionService: Rejected -" << validation.error.message();
        emit extractionRejected(validation.error.field);
        return result;
    }

    result.record.parameters = validation.parameters;
    result.record.outcome = m_simulator.simulate(validation.parameters);
    m_store->append(result.record, &result.record);

    qDebug() << "ExtractionService: Recorded extraction" << result.record.id
             << extractionClassToString(result.record.outcome.classification)
             << "score" << result.record.outcome.qualityScore;

    const QList<Alert> raised = m_alertGenerator.forRecord(result.record, result.record.createdAt);
    for (const Alert& alert : raised) {
        qWarning() << "ExtractionService:" << alertSeverityToString(alert.severity)
                   << alert.message << "on extraction" << result.record.id;
    }

    emit extractionRecorded(result.record.id);
    return result;
}

QVector<ExtractionRecord> ExtractionService::history() const
{
    return m_store->all();
}

ExtractionTrends ExtractionService::trends(TrendPeriod period, const QDateTime& now) const
{
    return ExtractionTrends::calculate(m_store->all(), period, now);
}

QList<Alert> ExtractionService::alerts(const QDateTime& now) const
{
    const QVector<ExtractionRecord> records = m_store->all();

    QList<Alert> result;
    for (const ExtractionRecord& record : records) {
        result.append(m_alertGenerator.forRecord(record, now));
    }
    result.append(m_alertGenerator.forTrends(ExtractionTrends::calculate(records, TrendPeriod::All, now), now));
    return result;
}
