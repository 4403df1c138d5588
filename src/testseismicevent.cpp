#include "seismic_event.hpp"

#include <QTest>

class TestSeismicEvent : public QObject {
    Q_OBJECT
private slots:
    void testRender_data();
    void testRender();
    void testCoordinatesKeepOrder();
    void testFingerprintModes();
    void testPercentInPlaceIsLiteral();
};

void TestSeismicEvent::testRender_data() {
    QTest::addColumn<qint64>("timeMs");
    QTest::addColumn<double>("magnitude");
    QTest::addColumn<QString>("expected");

    QTest::newRow("with millis") << Q_INT64_C(1741176896789) << 5.3
        << "2025-03-05T12:14:56.789Z: Magnitude 5.3 at 10 km SW of Julian, CA (33.0123, -116.6543)";
    QTest::newRow("whole second") << Q_INT64_C(1741176896000) << 6.0
        << "2025-03-05T12:14:56Z: Magnitude 6.0 at 10 km SW of Julian, CA (33.0123, -116.6543)";
}

void TestSeismicEvent::testRender() {
    QFETCH(qint64, timeMs);
    QFETCH(double, magnitude);
    QFETCH(QString, expected);

    SeismicEvent event(magnitude, "10 km SW of Julian, CA", timeMs, 33.0123456, -116.6543219, 10.0);
    QCOMPARE(event.render(), expected);
}

void TestSeismicEvent::testCoordinatesKeepOrder() {
    SeismicEvent event(5.0, "somewhere", 0, 12.5, -100.25, 33.0);
    QCOMPARE(event.latitude(), 12.5);
    QCOMPARE(event.longitude(), -100.25);
    QCOMPARE(event.depth, 33.0);
    QCOMPARE(event.occurredAt.toMSecsSinceEpoch(), Q_INT64_C(0));
}

void TestSeismicEvent::testFingerprintModes() {
    SeismicEvent withId(5.0, "somewhere", 1000, 1.0, 2.0, 3.0, "us7000abcd");
    SeismicEvent withoutId(5.0, "somewhere", 1000, 1.0, 2.0, 3.0);

    QCOMPARE(withId.fingerprint(FingerprintMode::Rendered), withId.render());
    QCOMPARE(withId.fingerprint(FingerprintMode::FeedId), QString("id:us7000abcd"));
    QCOMPARE(withoutId.fingerprint(FingerprintMode::FeedId), withoutId.render());

    // Same rendering means same fingerprint, even for distinct feed records
    SeismicEvent other(5.04, "somewhere", 1000, 1.00001, 2.00001, 9.0, "us7000zzzz");
    QCOMPARE(other.fingerprint(), withId.fingerprint());
    QVERIFY(other.fingerprint(FingerprintMode::FeedId) != withId.fingerprint(FingerprintMode::FeedId));
}

void TestSeismicEvent::testPercentInPlaceIsLiteral() {
    SeismicEvent event(4.5, "%4 odd %1 place", 0, 1.0, 2.0, 3.0);
    QVERIFY(event.render().contains("at %4 odd %1 place (1.0000, 2.0000)"));
}

QTEST_MAIN(TestSeismicEvent)
#include "testseismicevent.moc"
