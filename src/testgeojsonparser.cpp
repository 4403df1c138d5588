#include "geojson_parser.hpp"

#include <QTest>

class TestGeoJsonParser : public QObject {
    Q_OBJECT
private slots:
    void testParsesFeatures();
    void testEmptyFeatures();
    void testRejectsPayload_data();
    void testRejectsPayload();
};

namespace {

QByteArray feature(const QByteArray &properties, const QByteArray &coordinates,
                   const QByteArray &id = "\"us7000abcd\"") {
    return "{\"type\":\"Feature\",\"id\":" + id
         + ",\"properties\":{" + properties + "}"
         + ",\"geometry\":{\"type\":\"Point\",\"coordinates\":" + coordinates + "}}";
}

QByteArray collection(const QByteArray &features) {
    return "{\"type\":\"FeatureCollection\",\"metadata\":{\"status\":200},\"features\":["
         + features + "]}";
}

const QByteArray kGoodProperties =
    "\"mag\":5.3,\"place\":\"10 km SW of Julian, CA\",\"time\":1741176896789,\"status\":\"reviewed\"";

} // namespace

void TestGeoJsonParser::testParsesFeatures() {
    const QByteArray payload = collection(
        feature(kGoodProperties, "[-116.6543219,33.0123456,10.5]") + ","
        + feature("\"mag\":6.1,\"place\":\"Fiji region\",\"time\":1741170000000",
                  "[-178.1,-17.8,550]", "null"));

    const GeoJsonParser::ParseResult result = GeoJsonParser::parseUSGSGeoJson(payload);
    QVERIFY2(result.success, qPrintable(result.errorMessage));
    QCOMPARE(result.totalFeatures, 2);
    QCOMPARE(result.events.size(), 2);

    const SeismicEvent &first = result.events.at(0);
    QCOMPARE(first.magnitude, 5.3);
    QCOMPARE(first.place, QString("10 km SW of Julian, CA"));
    QCOMPARE(first.occurredAt.toMSecsSinceEpoch(), Q_INT64_C(1741176896789));
    QCOMPARE(first.latitude(), 33.0123456);
    QCOMPARE(first.longitude(), -116.6543219);
    QCOMPARE(first.depth, 10.5);
    QCOMPARE(first.eventId, QString("us7000abcd"));

    QVERIFY(result.events.at(1).eventId.isEmpty());
}

void TestGeoJsonParser::testEmptyFeatures() {
    const GeoJsonParser::ParseResult result =
        GeoJsonParser::parseUSGSGeoJson("{\"type\":\"FeatureCollection\",\"features\":[]}");
    QVERIFY(result.success);
    QCOMPARE(result.totalFeatures, 0);
    QVERIFY(result.events.isEmpty());
}

void TestGeoJsonParser::testRejectsPayload_data() {
    QTest::addColumn<QByteArray>("payload");
    QTest::addColumn<QString>("expectedError");

    QTest::newRow("not json") << QByteArray("<html>503</html>") << "JSON Parse Error";
    QTest::newRow("top-level array") << QByteArray("[]") << "not an object";
    QTest::newRow("missing features") << QByteArray("{\"type\":\"FeatureCollection\"}")
                                      << "missing 'features'";
    QTest::newRow("features not array") << QByteArray("{\"features\":{}}")
                                        << "'features' is not an array";
    QTest::newRow("null magnitude")
        << collection(feature("\"mag\":null,\"place\":\"x\",\"time\":1", "[1,2,3]"))
        << "Feature 0: 'mag' is not a number";
    QTest::newRow("missing place")
        << collection(feature("\"mag\":5,\"time\":1", "[1,2,3]"))
        << "Feature 0: missing 'place'";
    QTest::newRow("fractional time")
        << collection(feature("\"mag\":5,\"place\":\"x\",\"time\":1.5", "[1,2,3]"))
        << "'time' is not an integer";
    QTest::newRow("string time")
        << collection(feature("\"mag\":5,\"place\":\"x\",\"time\":\"1\"", "[1,2,3]"))
        << "'time' is not a number";
    QTest::newRow("two coordinates")
        << collection(feature(kGoodProperties, "[1,2]"))
        << "expected [lon, lat, depth]";
    QTest::newRow("null depth")
        << collection(feature(kGoodProperties, "[1,2,null]"))
        << "'geometry.coordinates[2]' is not a number";
    QTest::newRow("second feature bad")
        << collection(feature(kGoodProperties, "[1,2,3]") + ",{\"properties\":{}}")
        << "Feature 1: missing 'geometry'";
}

void TestGeoJsonParser::testRejectsPayload() {
    QFETCH(QByteArray, payload);
    QFETCH(QString, expectedError);

    const GeoJsonParser::ParseResult result = GeoJsonParser::parseUSGSGeoJson(payload);
    QVERIFY(!result.success);
    QVERIFY(result.events.isEmpty());
    QVERIFY2(result.errorMessage.contains(expectedError), qPrintable(result.errorMessage));
}

QTEST_MAIN(TestGeoJsonParser)
#include "testgeojsonparser.moc"
