#pragma once

#include "../extraction/extractionrecord.h"

#include <QMutex>
#include <QVector>

class MetricsJournal;

/**
 * MetricsStore - append-only history of extraction records
 *
 * Insertion order is creation order and ids are gap-free, starting at 1.
 * There is no update or delete. All methods are thread-safe: a single mutex
 * covers id assignment, the insert and the optional journal line, and
 * readers receive a snapshot copy of the history.
 */
class MetricsStore {
public:
    MetricsStore() = default;

    MetricsStore(const MetricsStore&) = delete;
    MetricsStore& operator=(const MetricsStore&) = delete;

    // Optional file mirror (not owned). Attach before the first append.
    void setJournal(MetricsJournal* journal);

    // Assigns the next id and the creation time, stores the record and
    // returns the id. The stored copy is written to stored when given.
    qint64 append(ExtractionRecord record, ExtractionRecord* stored = nullptr);

    // Snapshot of every record in insertion order
    QVector<ExtractionRecord> all() const;

    int size() const;
    bool isEmpty() const { return size() == 0; }

    // Most recently appended record (default-constructed, id 0, when empty)
    ExtractionRecord last() const;

private:
    mutable QMutex m_mutex;
    QVector<ExtractionRecord> m_records;
    qint64 m_nextId = 1;
    MetricsJournal* m_journal = nullptr;
};
