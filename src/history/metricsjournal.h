#pragma once

#include <QFile>
#include <QString>

struct ExtractionRecord;

// Append-only JSON-lines file mirroring the MetricsStore.
// Each session truncates the file, so line order always matches store order.
// The journal is write-only: records are never loaded back on startup.
class MetricsJournal {
public:
    MetricsJournal() = default;
    ~MetricsJournal();

    MetricsJournal(const MetricsJournal&) = delete;
    MetricsJournal& operator=(const MetricsJournal&) = delete;

    bool open(const QString& filePath);
    void close();
    bool isOpen() const { return m_file.isOpen(); }
    QString filePath() const { return m_filePath; }

    // Writes one compact JSON line and flushes. Returns false on I/O error.
    bool write(const ExtractionRecord& record);

private:
    QFile m_file;
    QString m_filePath;
};
