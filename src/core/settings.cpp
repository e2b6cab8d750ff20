#include "settings.h"
#include "../extraction/extractionsimulator.h"

#include <QDebug>

Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_settings("Mastrena", "Mastrena")
{
}

Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
    if (m_settings.status() != QSettings::NoError) {
        qWarning() << "Settings: Failed to read" << iniPath << "- using defaults";
    }
}

// Server settings
int Settings::port() const {
    return m_settings.value("server/port", 3000).toInt();
}

void Settings::setPort(int port) {
    if (this->port() != port) {
        m_settings.setValue("server/port", port);
        emit portChanged();
    }
}

QString Settings::bindAddress() const {
    return m_settings.value("server/bindAddress", "127.0.0.1").toString();
}

void Settings::setBindAddress(const QString& address) {
    if (bindAddress() != address) {
        m_settings.setValue("server/bindAddress", address);
        emit bindAddressChanged();
    }
}

// Parameter ranges and defaults
ParameterLimits Settings::parameterLimits() const {
    ParameterLimits limits;

    limits.temperature.min = m_settings.value("limits/temperatureMin", limits.temperature.min).toDouble();
    limits.temperature.max = m_settings.value("limits/temperatureMax", limits.temperature.max).toDouble();
    limits.pressure.min = m_settings.value("limits/pressureMin", limits.pressure.min).toDouble();
    limits.pressure.max = m_settings.value("limits/pressureMax", limits.pressure.max).toDouble();
    limits.timeSeconds.min = m_settings.value("limits/timeMin", limits.timeSeconds.min).toDouble();
    limits.timeSeconds.max = m_settings.value("limits/timeMax", limits.timeSeconds.max).toDouble();

    limits.defaults.temperature = m_settings.value("defaults/temperature", limits.defaults.temperature).toDouble();
    limits.defaults.pressure = m_settings.value("defaults/pressure", limits.defaults.pressure).toDouble();
    limits.defaults.timeSeconds = m_settings.value("defaults/timeSeconds", limits.defaults.timeSeconds).toDouble();

    return limits;
}

void Settings::setParameterLimits(const ParameterLimits& limits) {
    m_settings.setValue("limits/temperatureMin", limits.temperature.min);
    m_settings.setValue("limits/temperatureMax", limits.temperature.max);
    m_settings.setValue("limits/pressureMin", limits.pressure.min);
    m_settings.setValue("limits/pressureMax", limits.pressure.max);
    m_settings.setValue("limits/timeMin", limits.timeSeconds.min);
    m_settings.setValue("limits/timeMax", limits.timeSeconds.max);

    m_settings.setValue("defaults/temperature", limits.defaults.temperature);
    m_settings.setValue("defaults/pressure", limits.defaults.pressure);
    m_settings.setValue("defaults/timeSeconds", limits.defaults.timeSeconds);
    emit parameterLimitsChanged();
}

// Simulation settings
double Settings::doseGrams() const {
    return m_settings.value("simulation/doseGrams", ExtractionSimulator::DEFAULT_DOSE).toDouble();
}

void Settings::setDoseGrams(double grams) {
    if (doseGrams() != grams) {
        m_settings.setValue("simulation/doseGrams", grams);
        emit doseGramsChanged();
    }
}

// Output files
QString Settings::journalPath() const {
    return m_settings.value("metrics/journalPath", "").toString();
}

void Settings::setJournalPath(const QString& path) {
    if (journalPath() != path) {
        m_settings.setValue("metrics/journalPath", path);
        emit journalPathChanged();
    }
}

QString Settings::logFilePath() const {
    return m_settings.value("log/filePath", "").toString();
}

void Settings::setLogFilePath(const QString& path) {
    if (logFilePath() != path) {
        m_settings.setValue("log/filePath", path);
        emit logFilePathChanged();
    }
}

QVariant Settings::value(const QString& key, const QVariant& defaultValue) const {
    return m_settings.value(key, defaultValue);
}

void Settings::setValue(const QString& key, const QVariant& value) {
    m_settings.setValue(key, value);
    emit valueChanged(key);
}

void Settings::sync() {
    m_settings.sync();
    if (m_settings.status() != QSettings::NoError) {
        qWarning() << "Settings: Failed to write" << m_settings.fileName();
    }
}
