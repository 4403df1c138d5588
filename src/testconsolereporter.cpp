#include "console_reporter.hpp"
#include "region_match_log.hpp"

#include <QBuffer>
#include <QTest>

class TestConsoleReporter : public QObject {
    Q_OBJECT
private slots:
    void testEventLines();
    void testSummary();
    void testSummaryReportsDroppedMatches();
    void testNearbyPlacesIsCaseSensitive();
    void testWriteFailureMarksUnhealthy();
};

void TestConsoleReporter::testEventLines() {
    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));
    ConsoleReporter reporter(&buffer);

    reporter.printNewEvent("line one");
    reporter.printRegionMatch("North America", "line two");
    QVERIFY(reporter.isHealthy());
    QCOMPARE(buffer.data(), QByteArray("line one\n[North America] line two\n"));
}

void TestConsoleReporter::testSummary() {
    EventBatch lastBatch;
    lastBatch << SeismicEvent(5.1, "10 km SW of Julian, CA", 0, 33.0, -116.6, 5.0)
              << SeismicEvent(5.5, "Fiji region", 1000, -17.8, -178.1, 550.0)
              << SeismicEvent(5.2, "5 km N of Julian, CA", 2000, 33.1, -116.6, 7.0);

    RegionMatchLog matches;
    matches.append("match a");
    matches.append("match a");

    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));
    ConsoleReporter reporter(&buffer);
    reporter.printSummary(lastBatch, "Julian", "North America", matches);

    QCOMPARE(QString::fromUtf8(buffer.data()),
             QString("Nearby shaker(s): \n"
                     "10 km SW of Julian, CA\n"
                     "5 km N of Julian, CA\n"
                     "Filter for North America\n"
                     "match a \n"
                     "match a \n"));
}

void TestConsoleReporter::testSummaryReportsDroppedMatches() {
    RegionMatchLog matches(2);
    matches.append("a");
    matches.append("b");
    matches.append("c");
    QCOMPARE(matches.entries(), QStringList({"b", "c"}));
    QCOMPARE(matches.droppedCount(), qint64(1));

    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));
    ConsoleReporter reporter(&buffer);
    reporter.printSummary(EventBatch(), "Julian", "Japan", matches);

    QCOMPARE(QString::fromUtf8(buffer.data()),
             QString("Nearby shaker(s): \n"
                     "Filter for Japan\n"
                     "(1 older match(es) dropped)\n"
                     "b \n"
                     "c \n"));
}

void TestConsoleReporter::testNearbyPlacesIsCaseSensitive() {
    EventBatch batch;
    batch << SeismicEvent(5.0, "near julian", 0, 0.0, 0.0, 0.0)
          << SeismicEvent(5.0, "near Julian", 0, 0.0, 0.0, 0.0);
    QCOMPARE(ConsoleReporter::nearbyPlaces(batch, "Julian"), QStringList({"near Julian"}));
    QVERIFY(ConsoleReporter::nearbyPlaces(batch, QString()).isEmpty());
}

void TestConsoleReporter::testWriteFailureMarksUnhealthy() {
    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::ReadOnly));
    ConsoleReporter reporter(&buffer);
    reporter.printNewEvent("cannot be written");
    QVERIFY(!reporter.isHealthy());
}

QTEST_MAIN(TestConsoleReporter)
#include "testconsolereporter.moc"
