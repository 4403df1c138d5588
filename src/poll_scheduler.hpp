#pragma once

#include <QtCore/QObject>
#include <QtCore/QTimer>
#include <QtCore/QDateTime>
#include <functional>

#include "seismic_event.hpp"
#include "feed_source.hpp"
#include "dedup_index.hpp"
#include "region_filter.hpp"
#include "region_match_log.hpp"

struct PollOptions {
    double minMagnitude = 5.0;
    int windowDays = 5;            // startDate = endDate - windowDays
    int daysAhead = 2;             // endDate = today + daysAhead
    int intervalMs = 1000;
    int maxIntervalMs = 60000;     // backoff ceiling
    int maxCycles = 0;             // 0 = run until stop()
    FingerprintMode fingerprintMode = FingerprintMode::Rendered;
    bool streamRegionMatches = false;
    int maxRegionMatches = 0;      // 0 = unbounded
    int maxDedupEntries = 0;       // 0 = bounded by the query window only
};

// Drives fetch -> order -> dedup -> classify -> emit. Cycles never overlap:
// the next one is scheduled only after the current fetch has resolved.
class PollScheduler : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Running,
        Stopped
    };

    using Clock = std::function<QDateTime()>;

    PollScheduler(FeedSource *source, const RegionFilter &regionFilter,
                  const PollOptions &options, QObject *parent = nullptr);
    ~PollScheduler() override;

    void setClock(Clock clock);

    State state() const { return m_state; }
    bool isRunning() const { return m_state == State::Running; }
    int completedCycles() const { return m_completedCycles; }
    int consecutiveFailures() const { return m_consecutiveFailures; }
    int currentIntervalMs() const;

    FeedQuery queryWindow() const;

    // Last successfully fetched batch in timeline order, empty before the
    // first success.
    EventBatch lastGoodBatch() const { return m_lastGoodBatch; }

    const DedupIndex &dedupIndex() const { return m_dedupIndex; }
    const RegionMatchLog &regionMatches() const { return m_regionMatches; }
    const RegionFilter &regionFilter() const { return m_regionFilter; }
    const PollOptions &options() const { return m_options; }

public slots:
    void start();
    void stop();

signals:
    void eventEmitted(const SeismicEvent &event, const QString &rendered);
    void regionMatched(const QString &rendered);
    void cycleFinished(int cycle, bool success);
    void fetchFailed(const FeedError &error);
    void finished();

private slots:
    void runCycle();
    void onBatchReady(const EventBatch &batch);
    void onFetchFailed(const FeedError &error);

private:
    void processBatch(const EventBatch &batch);
    void completeCycle(bool success);
    void scheduleNext();

    FeedSource *m_source;
    RegionFilter m_regionFilter;
    PollOptions m_options;
    Clock m_clock;

    QTimer *m_cycleTimer;
    State m_state;
    bool m_fetchInFlight;
    int m_completedCycles;
    int m_consecutiveFailures;
    QDateTime m_windowStart;       // start of the window the in-flight fetch asked for

    DedupIndex m_dedupIndex;
    RegionMatchLog m_regionMatches;
    EventBatch m_lastGoodBatch;
};
