#include "dedup_index.hpp"

#include <QTest>
#include <QTimeZone>

class TestDedupIndex : public QObject {
    Q_OBJECT
private slots:
    void testRecordMakesFingerprintSeen();
    void testRecordOverwrites();
    void testEvictOlderThan();
    void testCapDropsLeastRecentlySeen();
    void testShrinkingCapTrims();
};

namespace {

QDateTime at(qint64 ms) {
    return QDateTime::fromMSecsSinceEpoch(ms, QTimeZone::utc());
}

} // namespace

void TestDedupIndex::testRecordMakesFingerprintSeen() {
    DedupIndex index;
    QVERIFY(index.isNew("a"));
    index.record("a", "event a", at(1000));
    QVERIFY(!index.isNew("a"));
    QVERIFY(index.isNew("b"));
    QCOMPARE(index.size(), 1);
    QCOMPARE(index.renderedText("a"), QString("event a"));
    QVERIFY(index.renderedText("b").isEmpty());
}

void TestDedupIndex::testRecordOverwrites() {
    DedupIndex index;
    index.record("a", "first text", at(1000));
    index.record("a", "second text", at(2000));
    QCOMPARE(index.size(), 1);
    QCOMPARE(index.renderedText("a"), QString("second text"));
    QVERIFY(!index.isNew("a"));
}

void TestDedupIndex::testEvictOlderThan() {
    DedupIndex index;
    index.record("old", "old", at(1000));
    index.record("edge", "edge", at(5000));
    index.record("new", "new", at(9000));

    QCOMPARE(index.evictOlderThan(at(5000)), 1);
    QVERIFY(index.isNew("old"));
    QVERIFY(!index.isNew("edge"));
    QVERIFY(!index.isNew("new"));
    QCOMPARE(index.evictedCount(), qint64(1));

    QCOMPARE(index.evictOlderThan(QDateTime()), 0);
    QCOMPARE(index.size(), 2);
}

void TestDedupIndex::testCapDropsLeastRecentlySeen() {
    DedupIndex index(2);
    index.record("a", "a", at(1000));
    index.record("b", "b", at(2000));
    // Seeing "a" again makes "b" the least recently seen
    index.record("a", "a", at(1000));
    index.record("c", "c", at(3000));

    QCOMPARE(index.size(), 2);
    QVERIFY(!index.isNew("a"));
    QVERIFY(index.isNew("b"));
    QVERIFY(!index.isNew("c"));
    QCOMPARE(index.evictedCount(), qint64(1));
}

void TestDedupIndex::testShrinkingCapTrims() {
    DedupIndex index;
    for (int i = 0; i < 10; ++i)
        index.record(QString::number(i), QString::number(i), at(i * 1000));
    QCOMPARE(index.size(), 10);

    index.setMaxEntries(3);
    QCOMPARE(index.size(), 3);
    QVERIFY(!index.isNew("9"));
    QVERIFY(!index.isNew("7"));
    QVERIFY(index.isNew("6"));
}

QTEST_MAIN(TestDedupIndex)
#include "testdedupindex.moc"
