#include "response_log.hpp"

#include <QTemporaryDir>
#include <QTest>

class TestResponseLog : public QObject {
    Q_OBJECT
private slots:
    void testCreatesAndAppends();
    void testKeepsExistingContent();
    void testOpenFailsOnDirectory();
};

void TestResponseLog::testCreatesAndAppends() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("nested/raw.log");

    ResponseLog log(path);
    QVERIFY(!log.isOpen());
    QVERIFY(log.append("first"));
    QVERIFY(log.isOpen());
    QVERIFY(log.append("second\n"));
    QCOMPARE(log.bytesWritten(), qint64(13));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("first\nsecond\n"));
}

void TestResponseLog::testKeepsExistingContent() {
    QTemporaryDir dir;
    const QString path = dir.filePath("raw.log");
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("earlier\n");
    }

    {
        ResponseLog log(path);
        QVERIFY(log.open());
        QVERIFY(log.append("later"));
    }

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("earlier\nlater\n"));
}

void TestResponseLog::testOpenFailsOnDirectory() {
    QTemporaryDir dir;
    ResponseLog log(dir.path());
    QVERIFY(!log.open());
    QVERIFY(!log.append("data"));
    QVERIFY(!log.errorString().isEmpty());
}

QTEST_MAIN(TestResponseLog)
#include "testresponselog.moc"
