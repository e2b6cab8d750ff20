#include "extractionparameters.h"

QJsonObject ExtractionParameters::toJson() const {
    QJsonObject obj;
    obj[ParameterField::Temperature] = temperature;
    obj[ParameterField::Pressure] = pressure;
    obj[ParameterField::TimeSeconds] = timeSeconds;
    return obj;
}

ExtractionParameters ExtractionParameters::fromJson(const QJsonObject& json) {
    ExtractionParameters params;
    params.temperature = json[ParameterField::Temperature].toDouble(params.temperature);
    params.pressure = json[ParameterField::Pressure].toDouble(params.pressure);
    params.timeSeconds = json[ParameterField::TimeSeconds].toDouble(params.timeSeconds);
    return params;
}

QString ParameterRange::toString() const {
    return QString("[%1, %2]").arg(min).arg(max);
}
