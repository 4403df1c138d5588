#include "monitor_session.hpp"
#include "console_reporter.hpp"
#include "poll_scheduler.hpp"
#include "response_log.hpp"
#include "usgs_feed_source.hpp"

#include <QBuffer>
#include <QSignalSpy>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>
#include <QTest>
#include <QTimeZone>

// Answers every fetch() with the same batch.
class FixedFeedSource : public FeedSource
{
    Q_OBJECT

public:
    using FeedSource::FeedSource;

    void fetch(const FeedQuery &) override {
        ++fetchCount;
        emit batchReady(batch);
    }
    void cancel() override {}
    bool isBusy() const override { return false; }

    EventBatch batch;
    int fetchCount = 0;
};

// Serves one 200 response with the given body to every connection.
class OneShotHttpServer : public QObject
{
    Q_OBJECT

public:
    explicit OneShotHttpServer(const QByteArray &body, QObject *parent = nullptr)
        : QObject(parent)
        , m_body(body)
    {
        connect(&m_server, &QTcpServer::newConnection, this, [this]() {
            while (QTcpSocket *socket = m_server.nextPendingConnection()) {
                connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
                    m_request += socket->readAll();
                    if (!m_request.contains("\r\n\r\n"))
                        return;
                    socket->write("HTTP/1.1 200 OK\r\n"
                                  "Content-Type: application/json\r\n"
                                  "Content-Length: " + QByteArray::number(m_body.size()) + "\r\n"
                                  "Connection: close\r\n\r\n" + m_body);
                    socket->disconnectFromHost();
                });
                connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
            }
        });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }
    QUrl url() const { return QUrl(QString("http://127.0.0.1:%1/query").arg(m_server.serverPort())); }

private:
    QTcpServer m_server;
    QByteArray m_body;
    QByteArray m_request;
};

class TestMonitorSession : public QObject {
    Q_OBJECT
private slots:
    void testCleanRunExitsOk();
    void testStdoutFailureStopsPolling();
    void testResponseLogFailureStopsPolling();
};

namespace {

const qint64 kBaseTime = Q_INT64_C(1741176896789); // 2025-03-05T12:14:56.789Z

const QByteArray kPayload =
    "{\"type\":\"FeatureCollection\",\"features\":[{\"type\":\"Feature\",\"id\":\"ci40000001\","
    "\"properties\":{\"mag\":5.3,\"place\":\"10 km SW of Julian, CA\",\"time\":1741176896789},"
    "\"geometry\":{\"type\":\"Point\",\"coordinates\":[-116.6543,33.0123,10.0]}}]}";

SeismicEvent julianEvent(qint64 offsetMs = 0) {
    return SeismicEvent(5.3, "10 km SW of Julian, CA", kBaseTime + offsetMs, 33.0123, -116.6543, 10.0);
}

PollOptions options(int maxCycles) {
    PollOptions result;
    result.intervalMs = 1;
    result.maxIntervalMs = 1;
    result.maxCycles = maxCycles;
    return result;
}

} // namespace

void TestMonitorSession::testCleanRunExitsOk() {
    FixedFeedSource source;
    source.batch = EventBatch{julianEvent()};
    PollScheduler scheduler(&source, RegionFilter::northAmerica(), options(1));

    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));
    ConsoleReporter reporter(&buffer);
    MonitorSession session(&scheduler, &reporter, "Julian");
    QSignalSpy finishedSpy(&session, &MonitorSession::finished);

    scheduler.start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(finishedSpy.first().at(0).toInt(), int(MonitorSession::ExitOk));
    QCOMPARE(session.exitCode(), int(MonitorSession::ExitOk));
    const QString rendered = julianEvent().render();
    QCOMPARE(QString::fromUtf8(buffer.data()),
             rendered + "\n"
             "Nearby shaker(s): \n"
             "10 km SW of Julian, CA\n"
             "Filter for North America\n"
             + rendered + " \n");
}

void TestMonitorSession::testStdoutFailureStopsPolling() {
    FixedFeedSource source;
    source.batch = EventBatch{julianEvent(0), julianEvent(1000)};
    PollScheduler scheduler(&source, RegionFilter::northAmerica(), options(0));

    // Read-only: every write fails
    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::ReadOnly));
    ConsoleReporter reporter(&buffer);
    MonitorSession session(&scheduler, &reporter, "Julian");
    QSignalSpy emittedSpy(&scheduler, &PollScheduler::eventEmitted);
    QSignalSpy finishedSpy(&session, &MonitorSession::finished);

    scheduler.start();
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(finishedSpy.first().at(0).toInt(), int(MonitorSession::ExitSinkFailed));
    QCOMPARE(session.exitCode(), int(MonitorSession::ExitSinkFailed));
    QVERIFY(session.summaryPrinted());
    QCOMPARE(scheduler.state(), PollScheduler::State::Stopped);
    QCOMPARE(emittedSpy.count(), 1);
    QCOMPARE(source.fetchCount, 1);
}

void TestMonitorSession::testResponseLogFailureStopsPolling() {
    OneShotHttpServer server(kPayload);
    QVERIFY(server.listen());

    // A directory cannot be opened for appending
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    ResponseLog responseLog(dir.path());

    UsgsFeedSource source;
    source.setEndpoint(server.url());
    source.setResponseLog(&responseLog);
    PollScheduler scheduler(&source, RegionFilter::northAmerica(), options(0));
    scheduler.setClock([] { return QDateTime(QDate(2025, 3, 5), QTime(13, 0), QTimeZone::utc()); });

    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));
    ConsoleReporter reporter(&buffer);
    MonitorSession session(&scheduler, &reporter, "Julian");
    connect(&source, &UsgsFeedSource::responseLogFailed,
            &session, &MonitorSession::onResponseLogFailed);
    QSignalSpy emittedSpy(&scheduler, &PollScheduler::eventEmitted);
    QSignalSpy finishedSpy(&session, &MonitorSession::finished);

    scheduler.start();
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 10000);

    QCOMPARE(finishedSpy.first().at(0).toInt(), int(MonitorSession::ExitSinkFailed));
    QCOMPARE(scheduler.state(), PollScheduler::State::Stopped);
    // The batch behind the failed write is discarded; the summary still runs
    QCOMPARE(emittedSpy.count(), 0);
    QCOMPARE(QString::fromUtf8(buffer.data()),
             QString("Nearby shaker(s): \n"
                     "Filter for North America\n"));
}

QTEST_MAIN(TestMonitorSession)
#include "testmonitorsession.moc"
