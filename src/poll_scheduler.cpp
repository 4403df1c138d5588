#include "poll_scheduler.hpp"
#include "timeline.hpp"
#include "logging.hpp"

#include <QtCore/QTimeZone>

PollScheduler::PollScheduler(FeedSource *source, const RegionFilter &regionFilter,
                             const PollOptions &options, QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_regionFilter(regionFilter)
    , m_options(options)
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
    , m_cycleTimer(new QTimer(this))
    , m_state(State::Idle)
    , m_fetchInFlight(false)
    , m_completedCycles(0)
    , m_consecutiveFailures(0)
    , m_dedupIndex(options.maxDedupEntries)
    , m_regionMatches(options.maxRegionMatches)
{
    m_cycleTimer->setSingleShot(true);
    connect(m_cycleTimer, &QTimer::timeout, this, &PollScheduler::runCycle);

    connect(m_source, &FeedSource::batchReady, this, &PollScheduler::onBatchReady);
    connect(m_source, &FeedSource::fetchFailed, this, &PollScheduler::onFetchFailed);
}

PollScheduler::~PollScheduler()
{
    m_cycleTimer->stop();
    if (m_fetchInFlight && m_source) {
        m_source->cancel();
    }
}

void PollScheduler::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

int PollScheduler::currentIntervalMs() const
{
    const qint64 base = qMax(0, m_options.intervalMs);
    const qint64 ceiling = qMax<qint64>(base, m_options.maxIntervalMs);

    qint64 interval = base;
    for (int i = 0; i < m_consecutiveFailures && interval < ceiling; ++i) {
        interval = interval > 0 ? interval * 2 : 1;
    }
    return static_cast<int>(qMin(interval, ceiling));
}

FeedQuery PollScheduler::queryWindow() const
{
    const QDate today = m_clock().toUTC().date();

    FeedQuery query;
    query.endDate = today.addDays(m_options.daysAhead);
    query.startDate = query.endDate.addDays(-m_options.windowDays);
    query.minMagnitude = m_options.minMagnitude;
    return query;
}

void PollScheduler::start()
{
    if (m_state != State::Idle) {
        qCWarning(lcScheduler) << "Scheduler can only be started once";
        return;
    }

    m_state = State::Running;
    qCInfo(lcScheduler) << "Polling started, interval" << m_options.intervalMs << "ms,"
                        << "region" << m_regionFilter.name();
    m_cycleTimer->start(0);
}

void PollScheduler::stop()
{
    if (m_state == State::Stopped)
        return;

    m_state = State::Stopped;
    m_cycleTimer->stop();
    if (m_fetchInFlight) {
        m_source->cancel();
        m_fetchInFlight = false;
    }

    qCInfo(lcScheduler) << "Polling stopped after" << m_completedCycles << "cycle(s)";
    emit finished();
}

void PollScheduler::runCycle()
{
    if (m_state != State::Running)
        return;

    const FeedQuery query = queryWindow();
    m_windowStart = query.startDate.isValid()
        ? query.startDate.startOfDay(QTimeZone::utc())
        : QDateTime();

    qCDebug(lcScheduler) << "Cycle" << (m_completedCycles + 1) << "query" << query.toString();

    m_fetchInFlight = true;
    m_source->fetch(query);
}

void PollScheduler::onBatchReady(const EventBatch &batch)
{
    if (!m_fetchInFlight || m_state != State::Running)
        return;
    m_fetchInFlight = false;

    // Anything that occurred before the window can no longer be returned.
    // Failed cycles leave the index untouched.
    if (m_windowStart.isValid()) {
        m_dedupIndex.evictOlderThan(m_windowStart);
    }

    processBatch(batch);
    m_consecutiveFailures = 0;
    completeCycle(true);
}

void PollScheduler::onFetchFailed(const FeedError &error)
{
    if (!m_fetchInFlight || m_state != State::Running)
        return;
    m_fetchInFlight = false;

    ++m_consecutiveFailures;
    qCWarning(lcScheduler).noquote() << "Error retrieving earthquake data:" << error.toString()
                                     << error.message();
    emit fetchFailed(error);
    completeCycle(false);
}

void PollScheduler::processBatch(const EventBatch &batch)
{
    const EventBatch ordered = Timeline::order(batch);

    int newEvents = 0;
    int regionEvents = 0;
    for (const SeismicEvent &event : ordered) {
        const QString rendered = event.render();
        const QString fingerprint = event.fingerprint(m_options.fingerprintMode);

        if (m_dedupIndex.isNew(fingerprint)) {
            ++newEvents;
            emit eventEmitted(event, rendered);
        }
        m_dedupIndex.record(fingerprint, rendered, event.occurredAt);

        // A receiver may have stopped us after a failed write
        if (m_state != State::Running)
            break;

        if (m_regionFilter.isInRegion(event)) {
            ++regionEvents;
            if (m_options.streamRegionMatches) {
                emit regionMatched(rendered);
                if (m_state != State::Running)
                    break;
            } else {
                m_regionMatches.append(rendered);
            }
        }
    }

    m_lastGoodBatch = ordered;

    qCDebug(lcScheduler) << "Batch of" << ordered.size() << "events:" << newEvents << "new,"
                         << regionEvents << "in" << m_regionFilter.name()
                         << "- index size" << m_dedupIndex.size();
}

void PollScheduler::completeCycle(bool success)
{
    ++m_completedCycles;
    emit cycleFinished(m_completedCycles, success);

    // A cycleFinished() receiver may have stopped us
    if (m_state != State::Running)
        return;

    if (m_options.maxCycles > 0 && m_completedCycles >= m_options.maxCycles) {
        stop();
        return;
    }

    scheduleNext();
}

void PollScheduler::scheduleNext()
{
    const int delay = currentIntervalMs();
    if (m_consecutiveFailures > 0) {
        qCInfo(lcScheduler) << "Retrying in" << delay << "ms after"
                            << m_consecutiveFailures << "consecutive failure(s)";
    }
    m_cycleTimer->start(delay);
}
