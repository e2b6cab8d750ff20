#pragma once

#include <QObject>
#include <QSettings>
#include <QString>
#include <QVariant>

#include "../extraction/extractionparameters.h"

class Settings : public QObject {
    Q_OBJECT

    // Server settings
    Q_PROPERTY(int port READ port WRITE setPort NOTIFY portChanged)
    Q_PROPERTY(QString bindAddress READ bindAddress WRITE setBindAddress NOTIFY bindAddressChanged)

    // Simulation settings
    Q_PROPERTY(double doseGrams READ doseGrams WRITE setDoseGrams NOTIFY doseGramsChanged)

    // Output files
    Q_PROPERTY(QString journalPath READ journalPath WRITE setJournalPath NOTIFY journalPathChanged)
    Q_PROPERTY(QString logFilePath READ logFilePath WRITE setLogFilePath NOTIFY logFilePathChanged)

public:
    // Platform default location (organization/application "Mastrena")
    explicit Settings(QObject* parent = nullptr);
    // INI file at an explicit path (--config, tests)
    explicit Settings(const QString& iniPath, QObject* parent = nullptr);

    QString fileName() const { return m_settings.fileName(); }

    // Server settings
    int port() const;
    void setPort(int port);

    QString bindAddress() const;
    void setBindAddress(const QString& address);

    // Parameter ranges and defaults
    ParameterLimits parameterLimits() const;
    void setParameterLimits(const ParameterLimits& limits);

    // Simulation settings
    double doseGrams() const;
    void setDoseGrams(double grams);

    // Output files (empty = disabled)
    QString journalPath() const;
    void setJournalPath(const QString& path);

    QString logFilePath() const;
    void setLogFilePath(const QString& path);

    // Generic settings access (for extensibility)
    QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    void sync();

signals:
    void portChanged();
    void bindAddressChanged();
    void parameterLimitsChanged();
    void doseGramsChanged();
    void journalPathChanged();
    void logFilePathChanged();
    void valueChanged(const QString& key);

private:
    QSettings m_settings;
};
