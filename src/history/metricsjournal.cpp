#include "metricsjournal.h"
#include "../extraction/extractionrecord.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QDebug>

MetricsJournal::~MetricsJournal()
{
    close();
}

bool MetricsJournal::open(const QString& filePath)
{
    close();

    m_filePath = filePath;
    QFileInfo fi(filePath);
    QDir().mkpath(fi.absolutePath());

    m_file.setFileName(filePath);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "MetricsJournal: Failed to open" << filePath << m_file.errorString();
        return false;
    }

    qDebug() << "MetricsJournal: Writing records to" << filePath;
    return true;
}

void MetricsJournal::close()
{
    if (m_file.isOpen()) {
        m_file.close();
    }
}

bool MetricsJournal::write(const ExtractionRecord& record)
{
    if (!m_file.isOpen()) {
        return false;
    }

    QByteArray line = QJsonDocument(record.toJson()).toJson(QJsonDocument::Compact);
    line.append('\n');

    if (m_file.write(line) != line.size() || !m_file.flush()) {
        qWarning() << "MetricsJournal: Write failed for record" << record.id << m_file.errorString();
        return false;
    }
    return true;
}
