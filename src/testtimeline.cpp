#include "timeline.hpp"

#include <QTest>

class TestTimeline : public QObject {
    Q_OBJECT
private slots:
    void testEmptyBatch();
    void testAscendingOrder();
    void testEqualTimesKeepFeedOrder();
    void testInputUntouched();
};

namespace {

SeismicEvent eventAt(qint64 timeMs, const QString &place) {
    return SeismicEvent(5.0, place, timeMs, 10.0, -100.0, 5.0);
}

QStringList places(const EventBatch &batch) {
    QStringList result;
    for (const auto &event : batch)
        result << event.place;
    return result;
}

} // namespace

void TestTimeline::testEmptyBatch() {
    const EventBatch ordered = Timeline::order(EventBatch());
    QVERIFY(ordered.isEmpty());
    QVERIFY(Timeline::isOrdered(ordered));
}

void TestTimeline::testAscendingOrder() {
    EventBatch batch;
    batch << eventAt(3000, "c") << eventAt(1000, "a") << eventAt(5000, "e") << eventAt(2000, "b");

    const EventBatch ordered = Timeline::order(batch);
    QCOMPARE(ordered.size(), batch.size());
    QVERIFY(Timeline::isOrdered(ordered));
    QCOMPARE(places(ordered), QStringList({"a", "b", "c", "e"}));
}

void TestTimeline::testEqualTimesKeepFeedOrder() {
    EventBatch batch;
    batch << eventAt(2000, "second-1") << eventAt(1000, "first")
          << eventAt(2000, "second-2") << eventAt(2000, "second-3") << eventAt(500, "zeroth");

    const EventBatch ordered = Timeline::order(batch);
    QCOMPARE(places(ordered),
             QStringList({"zeroth", "first", "second-1", "second-2", "second-3"}));
}

void TestTimeline::testInputUntouched() {
    EventBatch batch;
    batch << eventAt(2000, "b") << eventAt(1000, "a");

    Timeline::order(batch);
    QCOMPARE(places(batch), QStringList({"b", "a"}));
    QVERIFY(!Timeline::isOrdered(batch));
}

QTEST_MAIN(TestTimeline)
#include "testtimeline.moc"
