#include "usgs_feed_source.hpp"
#include "response_log.hpp"

#include <QSignalSpy>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>
#include <QTest>

// Minimal HTTP/1.1 responder: one canned response per connection.
class HttpStub : public QObject
{
    Q_OBJECT

public:
    explicit HttpStub(QObject *parent = nullptr)
        : QObject(parent)
    {
        connect(&m_server, &QTcpServer::newConnection, this, &HttpStub::onNewConnection);
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }
    quint16 port() const { return m_server.serverPort(); }
    QUrl url() const { return QUrl(QString("http://127.0.0.1:%1/fdsnws/event/1/query").arg(port())); }

    void respondWith(int status, const QByteArray &reason, const QByteArray &body) {
        m_status = status;
        m_reason = reason;
        m_body = body;
    }

    bool silent = false;          // accept but never answer
    QList<QByteArray> requests;   // raw request heads

private slots:
    void onNewConnection() {
        while (QTcpSocket *socket = m_server.nextPendingConnection()) {
            connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
                QByteArray &buffer = m_buffers[socket];
                buffer += socket->readAll();
                if (!buffer.contains("\r\n\r\n"))
                    return;
                requests.append(buffer.left(buffer.indexOf("\r\n\r\n")));
                if (silent)
                    return;
                socket->write("HTTP/1.1 " + QByteArray::number(m_status) + " " + m_reason + "\r\n"
                              "Content-Type: application/json\r\n"
                              "Content-Length: " + QByteArray::number(m_body.size()) + "\r\n"
                              "Connection: close\r\n\r\n" + m_body);
                socket->disconnectFromHost();
            });
            connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
                m_buffers.remove(socket);
                socket->deleteLater();
            });
        }
    }

private:
    QTcpServer m_server;
    QHash<QTcpSocket *, QByteArray> m_buffers;
    int m_status = 200;
    QByteArray m_reason = "OK";
    QByteArray m_body;
};

class TestUsgsFeedSource : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testBuildQueryUrl_data();
    void testBuildQueryUrl();
    void testSuccessfulFetch();
    void testServerError_data();
    void testServerError();
    void testMalformedPayload();
    void testConnectionRefused();
    void testInvalidQuery();
    void testCancelSuppressesSignals();
    void testTimeout();
    void testResponseLogAppends();

private:
    FeedQuery defaultQuery() const;

    HttpStub *m_stub = nullptr;
    UsgsFeedSource *m_source = nullptr;
};

namespace {

const QByteArray kPayload =
    "{\"type\":\"FeatureCollection\",\"features\":[{\"type\":\"Feature\",\"id\":\"ci40000001\","
    "\"properties\":{\"mag\":5.3,\"place\":\"10 km SW of Julian, CA\",\"time\":1741176896789},"
    "\"geometry\":{\"type\":\"Point\",\"coordinates\":[-116.6543,33.0123,10.0]}}]}";

} // namespace

void TestUsgsFeedSource::init() {
    m_stub = new HttpStub(this);
    QVERIFY(m_stub->listen());
    m_source = new UsgsFeedSource(this);
    m_source->setEndpoint(m_stub->url());
    m_source->setUserAgent("QuakeWatchTest/1.0");
}

void TestUsgsFeedSource::cleanup() {
    delete m_source;
    m_source = nullptr;
    delete m_stub;
    m_stub = nullptr;
}

FeedQuery TestUsgsFeedSource::defaultQuery() const {
    FeedQuery query;
    query.startDate = QDate(2025, 3, 2);
    query.endDate = QDate(2025, 3, 7);
    query.minMagnitude = 5.0;
    return query;
}

void TestUsgsFeedSource::testBuildQueryUrl_data() {
    QTest::addColumn<double>("minMagnitude");
    QTest::addColumn<QString>("expected");

    QTest::newRow("whole") << 5.0 << "5";
    QTest::newRow("two decimals") << 4.95 << "4.95";
    QTest::newRow("small") << 0.05 << "0.05";
    QTest::newRow("half step") << 2.75 << "2.75";
    QTest::newRow("zero") << 0.0 << "0";
}

void TestUsgsFeedSource::testBuildQueryUrl() {
    QFETCH(double, minMagnitude);
    QFETCH(QString, expected);

    UsgsFeedSource source;
    QCOMPARE(source.endpoint(), UsgsFeedSource::DEFAULT_ENDPOINT);

    FeedQuery feedQuery = defaultQuery();
    feedQuery.minMagnitude = minMagnitude;
    const QUrl url = source.buildQueryUrl(feedQuery);
    QCOMPARE(url.host(), QString("earthquake.usgs.gov"));
    QCOMPARE(url.path(), QString("/fdsnws/event/1/query"));

    const QUrlQuery query(url);
    QCOMPARE(query.queryItemValue("format"), QString("geojson"));
    QCOMPARE(query.queryItemValue("starttime"), QString("2025-03-02"));
    QCOMPARE(query.queryItemValue("endtime"), QString("2025-03-07"));
    QCOMPARE(query.queryItemValue("minmagnitude"), expected);
}

void TestUsgsFeedSource::testSuccessfulFetch() {
    m_stub->respondWith(200, "OK", kPayload);
    QSignalSpy batchSpy(m_source, &FeedSource::batchReady);
    QSignalSpy failedSpy(m_source, &FeedSource::fetchFailed);

    m_source->fetch(defaultQuery());
    QVERIFY(m_source->isBusy());
    QTRY_COMPARE(batchSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 0);
    QVERIFY(!m_source->isBusy());

    const EventBatch batch = batchSpy.first().at(0).value<EventBatch>();
    QCOMPARE(batch.size(), 1);
    QCOMPARE(batch.first().place, QString("10 km SW of Julian, CA"));
    QCOMPARE(batch.first().eventId, QString("ci40000001"));

    QCOMPARE(m_stub->requests.size(), 1);
    const QByteArray head = m_stub->requests.first();
    QVERIFY(head.startsWith("GET /fdsnws/event/1/query?"));
    QVERIFY(head.contains("starttime=2025-03-02"));
    QVERIFY(head.contains("endtime=2025-03-07"));
    QVERIFY(head.contains("minmagnitude=5"));
    QVERIFY(head.contains("format=geojson"));
    QVERIFY(head.contains("QuakeWatchTest/1.0"));
    QCOMPARE(m_source->getSuccessfulRequests(), 1);
}

void TestUsgsFeedSource::testServerError_data() {
    QTest::addColumn<int>("status");
    QTest::addColumn<QByteArray>("reason");

    QTest::newRow("500") << 500 << QByteArray("Internal Server Error");
    QTest::newRow("503") << 503 << QByteArray("Service Unavailable");
    QTest::newRow("404") << 404 << QByteArray("Not Found");
    QTest::newRow("204") << 204 << QByteArray("No Content");
}

void TestUsgsFeedSource::testServerError() {
    QFETCH(int, status);
    QFETCH(QByteArray, reason);

    m_stub->respondWith(status, reason, status == 204 ? QByteArray() : QByteArray("error"));
    QSignalSpy batchSpy(m_source, &FeedSource::batchReady);
    QSignalSpy failedSpy(m_source, &FeedSource::fetchFailed);

    m_source->fetch(defaultQuery());
    QTRY_COMPARE(failedSpy.count(), 1);
    QCOMPARE(batchSpy.count(), 0);

    const FeedError error = failedSpy.first().at(0).value<FeedError>();
    QCOMPARE(error.kind(), FeedError::Kind::Server);
    QCOMPARE(error.statusCode(), status);
    QCOMPARE(error.toString(), QString("ServerError(%1)").arg(status));
}

void TestUsgsFeedSource::testMalformedPayload() {
    m_stub->respondWith(200, "OK", "{\"type\":\"FeatureCollection\"}");
    QSignalSpy failedSpy(m_source, &FeedSource::fetchFailed);

    m_source->fetch(defaultQuery());
    QTRY_COMPARE(failedSpy.count(), 1);

    const FeedError error = failedSpy.first().at(0).value<FeedError>();
    QCOMPARE(error.kind(), FeedError::Kind::Parse);
    QVERIFY(error.message().contains("features"));
    QCOMPARE(m_source->getFailedRequests(), 1);
}

void TestUsgsFeedSource::testConnectionRefused() {
    QTcpServer probe;
    QVERIFY(probe.listen(QHostAddress::LocalHost));
    const quint16 closedPort = probe.serverPort();
    probe.close();

    m_source->setEndpoint(QUrl(QString("http://127.0.0.1:%1/query").arg(closedPort)));
    QSignalSpy failedSpy(m_source, &FeedSource::fetchFailed);

    m_source->fetch(defaultQuery());
    QTRY_COMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.first().at(0).value<FeedError>().kind(), FeedError::Kind::Transport);
}

void TestUsgsFeedSource::testInvalidQuery() {
    FeedQuery query = defaultQuery();
    query.startDate = QDate(2025, 3, 8);
    QSignalSpy failedSpy(m_source, &FeedSource::fetchFailed);

    m_source->fetch(query);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.first().at(0).value<FeedError>().kind(), FeedError::Kind::InvalidQuery);

    query = defaultQuery();
    query.minMagnitude = -1.0;
    m_source->fetch(query);
    QCOMPARE(failedSpy.count(), 2);
    QVERIFY(m_stub->requests.isEmpty());
}

void TestUsgsFeedSource::testCancelSuppressesSignals() {
    m_stub->silent = true;
    QSignalSpy batchSpy(m_source, &FeedSource::batchReady);
    QSignalSpy failedSpy(m_source, &FeedSource::fetchFailed);

    m_source->fetch(defaultQuery());
    QTRY_COMPARE(m_stub->requests.size(), 1);

    m_source->cancel();
    QVERIFY(!m_source->isBusy());
    QTest::qWait(100);
    QCOMPARE(batchSpy.count(), 0);
    QCOMPARE(failedSpy.count(), 0);
}

void TestUsgsFeedSource::testTimeout() {
    m_stub->silent = true;
    m_source->setTimeout(200);
    QSignalSpy failedSpy(m_source, &FeedSource::fetchFailed);

    m_source->fetch(defaultQuery());
    QTRY_COMPARE_WITH_TIMEOUT(failedSpy.count(), 1, 10000);
    QCOMPARE(failedSpy.first().at(0).value<FeedError>().kind(), FeedError::Kind::Transport);
}

void TestUsgsFeedSource::testResponseLogAppends() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    ResponseLog log(dir.filePath("logs/responses.txt"));
    QVERIFY(log.open());
    m_source->setResponseLog(&log);

    m_stub->respondWith(200, "OK", kPayload);
    QSignalSpy batchSpy(m_source, &FeedSource::batchReady);

    m_source->fetch(defaultQuery());
    QTRY_COMPARE(batchSpy.count(), 1);
    m_source->fetch(defaultQuery());
    QTRY_COMPARE(batchSpy.count(), 2);
    m_source->setResponseLog(nullptr);

    QFile file(dir.filePath("logs/responses.txt"));
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), kPayload + "\n" + kPayload + "\n");
}

QTEST_MAIN(TestUsgsFeedSource)
#include "testusgsfeedsource.moc"
