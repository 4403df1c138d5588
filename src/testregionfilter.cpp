#include "region_filter.hpp"

#include <QTest>

class TestRegionFilter : public QObject {
    Q_OBJECT
private slots:
    void testNorthAmericaBoundaries_data();
    void testNorthAmericaBoundaries();
    void testEventClassification();
    void testCustomRegion();
    void testInvalidRegion();
};

void TestRegionFilter::testNorthAmericaBoundaries_data() {
    QTest::addColumn<double>("latitude");
    QTest::addColumn<double>("longitude");
    QTest::addColumn<bool>("expected");

    QTest::newRow("south-east corner") << 7.0 << -52.5 << true;
    QTest::newRow("just south") << 6.999 << -52.5 << false;
    QTest::newRow("south-west corner") << 7.0 << -167.0 << true;
    QTest::newRow("just west") << 7.0 << -167.01 << false;
    QTest::newRow("north-west corner") << 83.0 << -167.0 << true;
    QTest::newRow("just north") << 83.001 << -100.0 << false;
    QTest::newRow("just east") << 40.0 << -52.49 << false;
    QTest::newRow("Julian, CA") << 33.08 << -116.6 << true;
    QTest::newRow("Tokyo") << 35.68 << 139.69 << false;
    QTest::newRow("Santiago") << -33.45 << -70.67 << false;
}

void TestRegionFilter::testNorthAmericaBoundaries() {
    QFETCH(double, latitude);
    QFETCH(double, longitude);
    QFETCH(bool, expected);

    const RegionFilter filter = RegionFilter::northAmerica();
    QCOMPARE(filter.contains(latitude, longitude), expected);
}

void TestRegionFilter::testEventClassification() {
    const RegionFilter filter;
    QCOMPARE(filter.name(), QString("North America"));

    SeismicEvent inside(5.1, "Alaska Peninsula", 0, 56.0, -157.0, 20.0);
    SeismicEvent outside(5.1, "Fiji region", 0, -17.8, -178.1, 550.0);
    QVERIFY(filter.isInRegion(inside));
    QVERIFY(!filter.isInRegion(outside));
}

void TestRegionFilter::testCustomRegion() {
    const RegionFilter japan("Japan", 24.0, 46.0, 122.0, 146.0);
    QVERIFY(japan.isValid());
    QVERIFY(japan.contains(35.68, 139.69));
    QVERIFY(japan.contains(24.0, 146.0));
    QVERIFY(!japan.contains(33.08, -116.6));
}

void TestRegionFilter::testInvalidRegion() {
    QVERIFY(!RegionFilter("upside down", 50.0, 10.0, -10.0, 10.0).isValid());
    QVERIFY(!RegionFilter("antimeridian", 10.0, 50.0, 170.0, -170.0).isValid());
    QVERIFY(RegionFilter::northAmerica().isValid());
}

QTEST_MAIN(TestRegionFilter)
#include "testregionfilter.moc"
