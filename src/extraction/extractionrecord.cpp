#include "extractionrecord.h"

QJsonObject ExtractionRecord::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["timestamp"] = createdAt.toSecsSinceEpoch();
    obj["createdAt"] = createdAt.toUTC().toString(Qt::ISODateWithMs);
    obj["parameters"] = parameters.toJson();
    obj["outcome"] = outcome.toJson();
    return obj;
}

ExtractionRecord ExtractionRecord::fromJson(const QJsonObject& json)
{
    ExtractionRecord record;
    record.id = json["id"].toInteger();
    record.parameters = ExtractionParameters::fromJson(json["parameters"].toObject());
    record.outcome = ExtractionOutcome::fromJson(json["outcome"].toObject());

    record.createdAt = QDateTime::fromString(json["createdAt"].toString(), Qt::ISODateWithMs);
    if (!record.createdAt.isValid()) {
        // Older entries only carry the Unix timestamp
        record.createdAt = QDateTime::fromSecsSinceEpoch(json["timestamp"].toInteger(), Qt::UTC);
    }
    record.createdAt = record.createdAt.toUTC();
    return record;
}
