#pragma once

#include <QObject>
#include <QDateTime>
#include <QList>
#include <QVector>

#include "../extraction/parametervalidator.h"
#include "../extraction/extractionsimulator.h"
#include "../extraction/extractionrecord.h"
#include "../analytics/alertgenerator.h"
#include "../analytics/extractiontrends.h"

class MetricsStore;

struct StartResult {
    ExtractionRecord record;
    ValidationError error;

    bool isSuccess() const { return !error.isError(); }
};

/**
 * ExtractionService runs one extraction request end to end:
 * validate → simulate → append to the MetricsStore.
 *
 * A rejected request leaves the store untouched. The store is injected and
 * not owned, so several services (or tests) can each work on their own.
 * Safe to call from several threads; only the store append is serialized.
 */
class ExtractionService : public QObject {
    Q_OBJECT

public:
    ExtractionService(MetricsStore* store,
                      const ParameterValidator& validator,
                      const ExtractionSimulator& simulator,
                      QObject* parent = nullptr);

    StartResult start(const RawExtractionParameters& raw);
    StartResult start(const ExtractionParameters& params);

    QVector<ExtractionRecord> history() const;

    ExtractionTrends trends(TrendPeriod period, const QDateTime& now) const;
    QList<Alert> alerts(const QDateTime& now) const;

    const ParameterValidator& validator() const { return m_validator; }
    const ExtractionSimulator& simulator() const { return m_simulator; }

signals:
    void extractionRecorded(qint64 recordId);
    void extractionRejected(const QString& field);

private:
    StartResult record(const ValidationResult& validation);

    MetricsStore* m_store = nullptr;
    ParameterValidator m_validator;
    ExtractionSimulator m_simulator;
    AlertGenerator m_alertGenerator;
};
