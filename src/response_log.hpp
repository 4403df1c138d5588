#pragma once

#include <QtCore/QFile>
#include <QtCore/QString>
#include <QtCore/QByteArray>

// Append-only sink for raw feed responses. Created if absent, never rotated.
class ResponseLog
{
public:
    explicit ResponseLog(const QString &filePath);
    ~ResponseLog();

    bool open();
    bool isOpen() const { return m_file.isOpen(); }
    bool append(const QByteArray &data);

    QString filePath() const { return m_file.fileName(); }
    QString errorString() const { return m_file.errorString(); }
    qint64 bytesWritten() const { return m_bytesWritten; }

private:
    QFile m_file;
    qint64 m_bytesWritten;
};
