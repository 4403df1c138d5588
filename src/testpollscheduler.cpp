#include "poll_scheduler.hpp"

#include <QSignalSpy>
#include <QTest>
#include <QTimeZone>

// Answers fetch() synchronously from a script, or holds the request open.
class FakeFeedSource : public FeedSource
{
    Q_OBJECT

public:
    struct Response {
        bool ok = true;
        EventBatch batch;
        FeedError error;
    };

    using FeedSource::FeedSource;

    void addBatch(const EventBatch &batch) { Response r; r.batch = batch; m_script.append(r); }
    void addError(const FeedError &error) { Response r; r.ok = false; r.error = error; m_script.append(r); }

    void fetch(const FeedQuery &query) override {
        queries.append(query);
        if (hold) {
            pending = true;
            return;
        }
        respond();
    }

    void cancel() override {
        if (pending) {
            pending = false;
            ++cancelCount;
        }
    }

    bool isBusy() const override { return pending; }

    void respond() {
        pending = false;
        if (m_script.isEmpty()) {
            emit batchReady(EventBatch());
            return;
        }
        const Response r = m_script.takeFirst();
        if (r.ok)
            emit batchReady(r.batch);
        else
            emit fetchFailed(r.error);
    }

    void emitLate(const EventBatch &batch) { emit batchReady(batch); }

    QList<FeedQuery> queries;
    bool hold = false;
    bool pending = false;
    int cancelCount = 0;

private:
    QList<Response> m_script;
};

class TestPollScheduler : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testQueryWindow();
    void testDuplicateAcrossCyclesEmittedOnce();
    void testEmissionFollowsTimeline();
    void testEmptyBatchContinues();
    void testServerErrorLeavesStateUntouched();
    void testFailedCycleDoesNotEvict();
    void testRegionSplit();
    void testStreamRegionMatches();
    void testBackoffAndReset();
    void testStopDuringFetchDiscardsResult();
    void testStopDuringWait();
    void testWindowEvictionAllowsReemission();
    void testFeedIdFingerprint();
    void testStopFromEventReceiverRecordsEvent();
    void testStopFromRegionReceiver();

private:
    PollScheduler *makeScheduler(const PollOptions &options);

    FakeFeedSource *m_source = nullptr;
    PollScheduler *m_scheduler = nullptr;
    QDateTime m_now;
};

namespace {

const qint64 kBaseTime = Q_INT64_C(1741176896789); // 2025-03-05T12:14:56.789Z

SeismicEvent inside(qint64 offsetMs = 0, const QString &place = "10 km SW of Julian, CA") {
    return SeismicEvent(5.3, place, kBaseTime + offsetMs, 33.0123, -116.6543, 10.0);
}

SeismicEvent outside(qint64 offsetMs = 0, const QString &place = "Fiji region") {
    return SeismicEvent(6.1, place, kBaseTime + offsetMs, -17.8, -178.1, 550.0);
}

PollOptions fastOptions(int maxCycles) {
    PollOptions options;
    options.intervalMs = 1;
    options.maxIntervalMs = 8;
    options.maxCycles = maxCycles;
    return options;
}

} // namespace

void TestPollScheduler::init() {
    m_source = new FakeFeedSource(this);
    m_now = QDateTime(QDate(2025, 3, 5), QTime(13, 0), QTimeZone::utc());
}

void TestPollScheduler::cleanup() {
    delete m_scheduler;
    m_scheduler = nullptr;
    delete m_source;
    m_source = nullptr;
}

PollScheduler *TestPollScheduler::makeScheduler(const PollOptions &options) {
    m_scheduler = new PollScheduler(m_source, RegionFilter::northAmerica(), options);
    m_scheduler->setClock([this] { return m_now; });
    return m_scheduler;
}

void TestPollScheduler::testQueryWindow() {
    PollScheduler *scheduler = makeScheduler(fastOptions(1));
    m_now = QDateTime(QDate(2025, 3, 5), QTime(23, 59), QTimeZone::utc());

    const FeedQuery query = scheduler->queryWindow();
    QCOMPARE(query.endDate, QDate(2025, 3, 7));
    QCOMPARE(query.startDate, QDate(2025, 3, 2));
    QCOMPARE(query.minMagnitude, 5.0);
    QVERIFY(query.isValid());

    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);
    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(m_source->queries.size(), 1);
    QCOMPARE(m_source->queries.first().startDate, QDate(2025, 3, 2));
}

void TestPollScheduler::testDuplicateAcrossCyclesEmittedOnce() {
    m_source->addBatch(EventBatch{inside()});
    m_source->addBatch(EventBatch{inside()});

    PollScheduler *scheduler = makeScheduler(fastOptions(2));
    QSignalSpy emittedSpy(scheduler, &PollScheduler::eventEmitted);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(emittedSpy.count(), 1);
    QCOMPARE(emittedSpy.first().at(1).toString(), inside().render());
    QCOMPARE(scheduler->dedupIndex().size(), 1);
    QVERIFY(!scheduler->dedupIndex().isNew(inside().render()));
    // Region matches are not deduplicated
    QCOMPARE(scheduler->regionMatches().size(), 2);
    QCOMPARE(scheduler->completedCycles(), 2);
    QCOMPARE(scheduler->state(), PollScheduler::State::Stopped);
}

void TestPollScheduler::testEmissionFollowsTimeline() {
    m_source->addBatch(EventBatch{inside(3000, "c"), inside(1000, "a"), outside(2000, "b")});

    PollScheduler *scheduler = makeScheduler(fastOptions(1));
    QStringList emitted;
    connect(scheduler, &PollScheduler::eventEmitted,
            [&emitted](const SeismicEvent &event, const QString &) { emitted << event.place; });
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(emitted, QStringList({"a", "b", "c"}));
    QCOMPARE(scheduler->lastGoodBatch().size(), 3);
    QCOMPARE(scheduler->lastGoodBatch().first().place, QString("a"));
}

void TestPollScheduler::testEmptyBatchContinues() {
    m_source->addBatch(EventBatch());
    m_source->addBatch(EventBatch());

    PollScheduler *scheduler = makeScheduler(fastOptions(2));
    QSignalSpy emittedSpy(scheduler, &PollScheduler::eventEmitted);
    QSignalSpy cycleSpy(scheduler, &PollScheduler::cycleFinished);
    QSignalSpy failedSpy(scheduler, &PollScheduler::fetchFailed);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    QVERIFY(scheduler->lastGoodBatch().isEmpty());
    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(emittedSpy.count(), 0);
    QCOMPARE(failedSpy.count(), 0);
    QCOMPARE(cycleSpy.count(), 2);
    QCOMPARE(cycleSpy.at(0).at(1).toBool(), true);
    QCOMPARE(cycleSpy.at(1).at(1).toBool(), true);
    QVERIFY(scheduler->lastGoodBatch().isEmpty());
}

void TestPollScheduler::testServerErrorLeavesStateUntouched() {
    m_source->addBatch(EventBatch{inside(), outside()});
    m_source->addError(FeedError::server(500, "Internal Server Error"));

    PollScheduler *scheduler = makeScheduler(fastOptions(2));
    QSignalSpy failedSpy(scheduler, &PollScheduler::fetchFailed);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    int indexSizeAfterFirst = -1;
    QStringList matchesAfterFirst;
    EventBatch batchAfterFirst;
    connect(scheduler, &PollScheduler::cycleFinished, [&](int cycle, bool) {
        if (cycle == 1) {
            indexSizeAfterFirst = scheduler->dedupIndex().size();
            matchesAfterFirst = scheduler->regionMatches().entries();
            batchAfterFirst = scheduler->lastGoodBatch();
        }
    });

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(failedSpy.count(), 1);
    const FeedError error = failedSpy.first().at(0).value<FeedError>();
    QCOMPARE(error.kind(), FeedError::Kind::Server);
    QCOMPARE(error.statusCode(), 500);
    QCOMPARE(error.toString(), QString("ServerError(500)"));

    QCOMPARE(scheduler->dedupIndex().size(), indexSizeAfterFirst);
    QCOMPARE(scheduler->regionMatches().entries(), matchesAfterFirst);
    QCOMPARE(scheduler->lastGoodBatch().size(), batchAfterFirst.size());
    QCOMPARE(scheduler->consecutiveFailures(), 1);
    QCOMPARE(scheduler->completedCycles(), 2);
}

void TestPollScheduler::testFailedCycleDoesNotEvict() {
    const qint64 earlyMs = QDateTime(QDate(2025, 3, 2), QTime(1, 0), QTimeZone::utc()).toMSecsSinceEpoch();
    m_source->addBatch(EventBatch{SeismicEvent(5.3, "Julian", earlyMs, 33.0, -116.6, 10.0)});
    m_source->addError(FeedError::server(500, "Internal Server Error"));
    m_source->addBatch(EventBatch());

    PollScheduler *scheduler = makeScheduler(fastOptions(3));
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    QList<int> sizes;
    connect(scheduler, &PollScheduler::cycleFinished, [&](int cycle, bool) {
        sizes << scheduler->dedupIndex().size();
        // The next window starts 2025-03-03, after the recorded event
        if (cycle == 1)
            m_now = m_now.addDays(1);
    });

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(m_source->queries.at(1).startDate, QDate(2025, 3, 3));
    // Kept through the 500, evicted by the next successful cycle
    QCOMPARE(sizes, QList<int>({1, 1, 0}));
    QCOMPARE(scheduler->dedupIndex().evictedCount(), qint64(1));
}

void TestPollScheduler::testRegionSplit() {
    m_source->addBatch(EventBatch{outside(0), inside(1000)});

    PollScheduler *scheduler = makeScheduler(fastOptions(1));
    QSignalSpy emittedSpy(scheduler, &PollScheduler::eventEmitted);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(emittedSpy.count(), 2);
    QCOMPARE(scheduler->regionMatches().entries(), QStringList({inside(1000).render()}));
}

void TestPollScheduler::testStreamRegionMatches() {
    m_source->addBatch(EventBatch{inside()});
    m_source->addBatch(EventBatch{inside()});

    PollOptions options = fastOptions(2);
    options.streamRegionMatches = true;
    PollScheduler *scheduler = makeScheduler(options);
    QSignalSpy regionSpy(scheduler, &PollScheduler::regionMatched);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(regionSpy.count(), 2);
    QVERIFY(scheduler->regionMatches().isEmpty());
}

void TestPollScheduler::testBackoffAndReset() {
    for (int i = 0; i < 4; ++i)
        m_source->addError(FeedError::transport("Connection refused"));
    m_source->addBatch(EventBatch());

    PollOptions options = fastOptions(5);
    options.intervalMs = 1;
    options.maxIntervalMs = 4;
    PollScheduler *scheduler = makeScheduler(options);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    QList<int> intervals;
    connect(scheduler, &PollScheduler::cycleFinished,
            [&](int, bool) { intervals << scheduler->currentIntervalMs(); });

    QCOMPARE(scheduler->currentIntervalMs(), 1);
    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(intervals, QList<int>({2, 4, 4, 4, 1}));
    QCOMPARE(scheduler->consecutiveFailures(), 0);
}

void TestPollScheduler::testStopDuringFetchDiscardsResult() {
    m_source->hold = true;

    PollScheduler *scheduler = makeScheduler(fastOptions(0));
    QSignalSpy emittedSpy(scheduler, &PollScheduler::eventEmitted);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    scheduler->start();
    QTRY_VERIFY(m_source->pending);

    scheduler->stop();
    QCOMPARE(m_source->cancelCount, 1);
    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(scheduler->state(), PollScheduler::State::Stopped);

    m_source->emitLate(EventBatch{inside()});
    QCOMPARE(emittedSpy.count(), 0);
    QCOMPARE(scheduler->dedupIndex().size(), 0);

    scheduler->stop();
    QCOMPARE(finishedSpy.count(), 1);
}

void TestPollScheduler::testStopDuringWait() {
    PollOptions options = fastOptions(0);
    options.intervalMs = 60000;
    options.maxIntervalMs = 60000;
    PollScheduler *scheduler = makeScheduler(options);
    QSignalSpy cycleSpy(scheduler, &PollScheduler::cycleFinished);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    scheduler->start();
    QTRY_COMPARE(cycleSpy.count(), 1);

    scheduler->stop();
    QCOMPARE(finishedSpy.count(), 1);
    QTest::qWait(50);
    QCOMPARE(m_source->queries.size(), 1);
    QCOMPARE(m_source->cancelCount, 0);
}

void TestPollScheduler::testWindowEvictionAllowsReemission() {
    m_source->addBatch(EventBatch{inside()});
    m_source->addBatch(EventBatch{inside()});

    PollScheduler *scheduler = makeScheduler(fastOptions(2));
    QSignalSpy emittedSpy(scheduler, &PollScheduler::eventEmitted);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    // Move the clock past the window before the second cycle
    connect(scheduler, &PollScheduler::cycleFinished, [this](int cycle, bool) {
        if (cycle == 1)
            m_now = m_now.addDays(30);
    });

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(emittedSpy.count(), 2);
    QCOMPARE(scheduler->dedupIndex().size(), 1);
    QCOMPARE(scheduler->dedupIndex().evictedCount(), qint64(1));
}

void TestPollScheduler::testFeedIdFingerprint() {
    SeismicEvent first(5.3, "Julian", kBaseTime, 33.0, -116.6, 10.0, "ci1");
    SeismicEvent second(5.3, "Julian", kBaseTime, 33.0, -116.6, 12.0, "ci2");
    m_source->addBatch(EventBatch{first, second});

    PollOptions options = fastOptions(1);
    options.fingerprintMode = FingerprintMode::FeedId;
    PollScheduler *scheduler = makeScheduler(options);
    QSignalSpy emittedSpy(scheduler, &PollScheduler::eventEmitted);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(emittedSpy.count(), 2);
    QCOMPARE(scheduler->dedupIndex().size(), 2);
}

void TestPollScheduler::testStopFromEventReceiverRecordsEvent() {
    m_source->addBatch(EventBatch{inside(0, "a"), inside(1000, "b")});

    PollScheduler *scheduler = makeScheduler(fastOptions(0));
    QSignalSpy emittedSpy(scheduler, &PollScheduler::eventEmitted);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);
    connect(scheduler, &PollScheduler::eventEmitted,
            [scheduler](const SeismicEvent &, const QString &) { scheduler->stop(); });

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(emittedSpy.count(), 1);
    QCOMPARE(scheduler->dedupIndex().size(), 1);
    QVERIFY(!scheduler->dedupIndex().isNew(inside(0, "a").render()));
    QVERIFY(scheduler->dedupIndex().isNew(inside(1000, "b").render()));
    QCOMPARE(scheduler->state(), PollScheduler::State::Stopped);
}

void TestPollScheduler::testStopFromRegionReceiver() {
    m_source->addBatch(EventBatch{inside(0, "a"), inside(1000, "b")});

    PollOptions options = fastOptions(0);
    options.streamRegionMatches = true;
    PollScheduler *scheduler = makeScheduler(options);
    QSignalSpy emittedSpy(scheduler, &PollScheduler::eventEmitted);
    QSignalSpy regionSpy(scheduler, &PollScheduler::regionMatched);
    QSignalSpy finishedSpy(scheduler, &PollScheduler::finished);
    connect(scheduler, &PollScheduler::regionMatched,
            [scheduler](const QString &) { scheduler->stop(); });

    scheduler->start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(regionSpy.count(), 1);
    QCOMPARE(emittedSpy.count(), 1);
    QCOMPARE(scheduler->dedupIndex().size(), 1);
}

QTEST_MAIN(TestPollScheduler)
#include "testpollscheduler.moc"
