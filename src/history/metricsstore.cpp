#include "metricsstore.h"
#include "metricsjournal.h"

#include <QDebug>

void MetricsStore::setJournal(MetricsJournal* journal)
{
    QMutexLocker lock(&m_mutex);
    m_journal = journal;
}

qint64 MetricsStore::append(ExtractionRecord record, ExtractionRecord* stored)
{
    QMutexLocker lock(&m_mutex);

    // Stamped under the lock so creation time never decreases in id order
    record.id = m_nextId++;
    record.createdAt = QDateTime::currentDateTimeUtc();
    m_records.append(record);
    if (stored) {
        *stored = record;
    }

    // The in-memory history stays authoritative when the journal write fails
    if (m_journal && m_journal->isOpen() && !m_journal->write(record)) {
        qWarning() << "MetricsStore: Record" << record.id << "kept in memory only";
    }

    return record.id;
}

QVector<ExtractionRecord> MetricsStore::all() const
{
    QMutexLocker lock(&m_mutex);
    return m_records;
}

int MetricsStore::size() const
{
    QMutexLocker lock(&m_mutex);
    return static_cast<int>(m_records.size());
}

ExtractionRecord MetricsStore::last() const
{
    QMutexLocker lock(&m_mutex);
    if (m_records.isEmpty()) {
        return ExtractionRecord();
    }
    return m_records.last();
}
