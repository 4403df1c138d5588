#include "dedup_index.hpp"
#include "logging.hpp"

#include <algorithm>

DedupIndex::DedupIndex(int maxEntries)
    : m_maxEntries(qMax(0, maxEntries))
    , m_sequence(0)
    , m_evictedCount(0)
{
}

bool DedupIndex::isNew(const QString &fingerprint) const
{
    return !m_entries.contains(fingerprint);
}

void DedupIndex::record(const QString &fingerprint, const QString &renderedText,
                        const QDateTime &occurredAt)
{
    Entry &entry = m_entries[fingerprint];
    entry.renderedText = renderedText;
    entry.occurredAt = occurredAt;
    entry.lastSeen = ++m_sequence;

    trimToCapacity();
}

int DedupIndex::evictOlderThan(const QDateTime &cutoff)
{
    if (!cutoff.isValid())
        return 0;

    int removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->occurredAt.isValid() && it->occurredAt < cutoff) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        m_evictedCount += removed;
        qCDebug(lcDedup) << "Evicted" << removed << "fingerprints older than"
                         << cutoff.toString(Qt::ISODate) << "- remaining:" << m_entries.size();
    }
    return removed;
}

QString DedupIndex::renderedText(const QString &fingerprint) const
{
    const auto it = m_entries.constFind(fingerprint);
    return it == m_entries.cend() ? QString() : it->renderedText;
}

void DedupIndex::setMaxEntries(int maxEntries)
{
    m_maxEntries = qMax(0, maxEntries);
    trimToCapacity();
}

void DedupIndex::clear()
{
    m_entries.clear();
}

void DedupIndex::trimToCapacity()
{
    if (m_maxEntries == 0)
        return;

    while (m_entries.size() > m_maxEntries) {
        // Least recently seen goes first
        auto oldest = std::min_element(m_entries.begin(), m_entries.end(),
                                       [](const Entry &a, const Entry &b) {
                                           return a.lastSeen < b.lastSeen;
                                       });
        qCDebug(lcDedup) << "Index full, dropping" << oldest->renderedText;
        m_entries.erase(oldest);
        ++m_evictedCount;
    }
}
