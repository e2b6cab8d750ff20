#pragma once

#include "extractionparameters.h"
#include "extractionsimulator.h"

#include <QDateTime>
#include <QJsonObject>

// One recorded extraction. Immutable once appended to the MetricsStore.
struct ExtractionRecord {
    qint64 id = 0;                  // Assigned by MetricsStore, starts at 1
    ExtractionParameters parameters;
    ExtractionOutcome outcome;
    QDateTime createdAt;            // UTC

    // "timestamp" (Unix seconds) and "createdAt" (ISO 8601) are both written
    QJsonObject toJson() const;
    static ExtractionRecord fromJson(const QJsonObject& json);
};
