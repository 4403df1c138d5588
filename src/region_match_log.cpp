#include "region_match_log.hpp"

RegionMatchLog::RegionMatchLog(int capacity)
    : m_capacity(qMax(0, capacity))
    , m_droppedCount(0)
{
}

void RegionMatchLog::append(const QString &renderedText)
{
    m_entries.append(renderedText);
    while (m_capacity > 0 && m_entries.size() > m_capacity) {
        m_entries.removeFirst();
        ++m_droppedCount;
    }
}

void RegionMatchLog::clear()
{
    m_entries.clear();
    m_droppedCount = 0;
}
