#pragma once

#include <QString>
#include <QDateTime>
#include <QHash>

// Remembers which fingerprints have already been reported. Entries leave
// the index only through evictOlderThan() or the entry cap.
class DedupIndex
{
public:
    explicit DedupIndex(int maxEntries = 0);

    bool isNew(const QString &fingerprint) const;
    void record(const QString &fingerprint, const QString &renderedText,
                const QDateTime &occurredAt);

    // Drops entries for events that occurred before the cutoff. Returns the
    // number of entries removed.
    int evictOlderThan(const QDateTime &cutoff);

    QString renderedText(const QString &fingerprint) const;
    int size() const { return m_entries.size(); }
    int maxEntries() const { return m_maxEntries; }
    void setMaxEntries(int maxEntries);
    qint64 evictedCount() const { return m_evictedCount; }
    void clear();

private:
    struct Entry {
        QString renderedText;
        QDateTime occurredAt;
        quint64 lastSeen = 0;
    };

    void trimToCapacity();

    QHash<QString, Entry> m_entries;
    int m_maxEntries;       // 0 = unbounded
    quint64 m_sequence;
    qint64 m_evictedCount;
};
