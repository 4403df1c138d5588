#include "monitor_settings.hpp"

#include <QTemporaryDir>
#include <QTest>

class TestMonitorSettings : public QObject {
    Q_OBJECT
private slots:
    void testDefaults();
    void testLoadFromIni();
    void testSaveLoadKeepsValues();
    void testValidationErrors_data();
    void testValidationErrors();
    void testUnknownFingerprintMode();
    void testNonNumericValues_data();
    void testNonNumericValues();
};

namespace {

QString writeIni(const QTemporaryDir &dir, const QByteArray &content) {
    const QString path = dir.filePath("quakewatch.ini");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly))
        file.write(content);
    return path;
}

} // namespace

void TestMonitorSettings::testDefaults() {
    const MonitorSettings settings;
    QVERIFY2(settings.validate().isEmpty(), qPrintable(settings.validate().join("; ")));
    QCOMPARE(settings.endpoint.toString(), QString("https://earthquake.usgs.gov/fdsnws/event/1/query"));
    QCOMPARE(settings.poll.minMagnitude, 5.0);
    QCOMPARE(settings.poll.windowDays, 5);
    QCOMPARE(settings.poll.daysAhead, 2);
    QCOMPARE(settings.poll.intervalMs, 1000);
    QCOMPARE(settings.placeFilter, QString("Julian"));
    QCOMPARE(settings.regionName, QString("North America"));
    QVERIFY(settings.regionFilter().contains(7.0, -52.5));
    QVERIFY(settings.responseLogFile.isEmpty());
}

void TestMonitorSettings::testLoadFromIni() {
    QTemporaryDir dir;
    const QString path = writeIni(dir,
        "[Feed]\n"
        "endpoint=http://localhost:8080/query\n"
        "minMagnitude=2.5\n"
        "windowDays=1\n"
        "[Polling]\n"
        "intervalMs=30000\n"
        "maxIntervalMs=600000\n"
        "maxCycles=10\n"
        "[Dedup]\n"
        "fingerprint=feedId\n"
        "maxEntries=5000\n"
        "[Region]\n"
        "name=Japan\n"
        "minLatitude=24\n"
        "maxLatitude=46\n"
        "minLongitude=122\n"
        "maxLongitude=146\n"
        "[Report]\n"
        "placeFilter=Tokyo\n"
        "streamRegionMatches=true\n"
        "[Logging]\n"
        "responseLogFile=/tmp/raw.log\n"
        "level=debug\n");

    QSettings ini(path, QSettings::IniFormat);
    MonitorSettings settings;
    settings.load(ini);

    QVERIFY2(settings.validate().isEmpty(), qPrintable(settings.validate().join("; ")));
    QCOMPARE(settings.endpoint, QUrl("http://localhost:8080/query"));
    QCOMPARE(settings.poll.minMagnitude, 2.5);
    QCOMPARE(settings.poll.windowDays, 1);
    QCOMPARE(settings.poll.daysAhead, 2);
    QCOMPARE(settings.poll.intervalMs, 30000);
    QCOMPARE(settings.poll.maxCycles, 10);
    QCOMPARE(settings.poll.fingerprintMode, FingerprintMode::FeedId);
    QCOMPARE(settings.poll.maxDedupEntries, 5000);
    QVERIFY(settings.poll.streamRegionMatches);
    QCOMPARE(settings.placeFilter, QString("Tokyo"));
    QCOMPARE(settings.responseLogFile, QString("/tmp/raw.log"));
    QCOMPARE(settings.logLevel, QString("debug"));

    const RegionFilter region = settings.regionFilter();
    QCOMPARE(region.name(), QString("Japan"));
    QVERIFY(region.contains(35.68, 139.69));
    QVERIFY(!region.contains(33.08, -116.6));
}

void TestMonitorSettings::testSaveLoadKeepsValues() {
    QTemporaryDir dir;
    const QString path = dir.filePath("saved.ini");

    MonitorSettings original;
    original.poll.maxRegionMatches = 250;
    original.poll.fingerprintMode = FingerprintMode::FeedId;
    original.regionName = "Alaska";
    {
        QSettings ini(path, QSettings::IniFormat);
        original.save(ini);
    }

    QSettings ini(path, QSettings::IniFormat);
    MonitorSettings loaded;
    loaded.load(ini);
    QCOMPARE(loaded.poll.maxRegionMatches, 250);
    QCOMPARE(loaded.poll.fingerprintMode, FingerprintMode::FeedId);
    QCOMPARE(loaded.regionName, QString("Alaska"));
    QVERIFY(loaded.validate().isEmpty());
}

void TestMonitorSettings::testValidationErrors_data() {
    QTest::addColumn<QByteArray>("ini");
    QTest::addColumn<QString>("expected");

    QTest::newRow("negative magnitude") << QByteArray("[Feed]\nminMagnitude=-1\n") << "minMagnitude";
    QTest::newRow("zero interval") << QByteArray("[Polling]\nintervalMs=0\n") << "intervalMs";
    QTest::newRow("backoff below base") << QByteArray("[Polling]\nintervalMs=5000\nmaxIntervalMs=1000\n") << "maxIntervalMs";
    QTest::newRow("bad endpoint") << QByteArray("[Feed]\nendpoint=not a url\n") << "endpoint";
    QTest::newRow("upside-down region") << QByteArray("[Region]\nminLatitude=50\nmaxLatitude=10\n") << "Region bounds";
    QTest::newRow("bad level") << QByteArray("[Logging]\nlevel=verbose\n") << "Logging/level";
    QTest::newRow("negative cap") << QByteArray("[Dedup]\nmaxEntries=-5\n") << "maxEntries";
}

void TestMonitorSettings::testValidationErrors() {
    QFETCH(QByteArray, ini);
    QFETCH(QString, expected);

    QTemporaryDir dir;
    QSettings settingsFile(writeIni(dir, ini), QSettings::IniFormat);
    MonitorSettings settings;
    settings.load(settingsFile);

    const QStringList errors = settings.validate();
    QCOMPARE(errors.size(), 1);
    QVERIFY2(errors.first().contains(expected), qPrintable(errors.first()));
}

void TestMonitorSettings::testUnknownFingerprintMode() {
    QTemporaryDir dir;
    QSettings settingsFile(writeIni(dir, "[Dedup]\nfingerprint=sha1\n"), QSettings::IniFormat);
    MonitorSettings settings;
    settings.load(settingsFile);

    const QStringList errors = settings.validate();
    QCOMPARE(errors.size(), 1);
    QVERIFY(errors.first().contains("sha1"));
    QCOMPARE(settings.poll.fingerprintMode, FingerprintMode::Rendered);
}

void TestMonitorSettings::testNonNumericValues_data() {
    QTest::addColumn<QByteArray>("ini");
    QTest::addColumn<QString>("key");

    QTest::newRow("cycles") << QByteArray("[Polling]\nmaxCycles=abc\n") << "Polling/maxCycles";
    QTest::newRow("interval") << QByteArray("[Polling]\nintervalMs=1.5s\n") << "Polling/intervalMs";
    QTest::newRow("magnitude") << QByteArray("[Feed]\nminMagnitude=big\n") << "Feed/minMagnitude";
    QTest::newRow("latitude") << QByteArray("[Region]\nminLatitude=north\n") << "Region/minLatitude";
    QTest::newRow("stream") << QByteArray("[Report]\nstreamRegionMatches=maybe\n") << "Report/streamRegionMatches";
}

void TestMonitorSettings::testNonNumericValues() {
    QFETCH(QByteArray, ini);
    QFETCH(QString, key);

    QTemporaryDir dir;
    QSettings settingsFile(writeIni(dir, ini), QSettings::IniFormat);
    MonitorSettings settings;
    settings.load(settingsFile);

    const QStringList errors = settings.validate();
    QCOMPARE(errors.size(), 1);
    QVERIFY2(errors.first().startsWith(key), qPrintable(errors.first()));

    // The default is kept rather than a silent zero
    const MonitorSettings defaults;
    QCOMPARE(settings.poll.maxCycles, defaults.poll.maxCycles);
    QCOMPARE(settings.poll.intervalMs, defaults.poll.intervalMs);
    QCOMPARE(settings.poll.minMagnitude, defaults.poll.minMagnitude);
    QCOMPARE(settings.regionMinLatitude, defaults.regionMinLatitude);
    QCOMPARE(settings.poll.streamRegionMatches, defaults.poll.streamRegionMatches);
}

QTEST_MAIN(TestMonitorSettings)
#include "testmonitorsettings.moc"
