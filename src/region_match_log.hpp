#pragma once

#include <QString>
#include <QStringList>

// Rendered region matches kept for the end-of-run report. Entries are not
// deduplicated. With a positive capacity the oldest entries are dropped.
class RegionMatchLog
{
public:
    explicit RegionMatchLog(int capacity = 0);

    void append(const QString &renderedText);
    const QStringList &entries() const { return m_entries; }
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }
    int capacity() const { return m_capacity; }
    qint64 droppedCount() const { return m_droppedCount; }
    void clear();

private:
    QStringList m_entries;
    int m_capacity;
    qint64 m_droppedCount;
};
