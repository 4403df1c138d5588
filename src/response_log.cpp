#include "response_log.hpp"
#include "logging.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QDir>

ResponseLog::ResponseLog(const QString &filePath)
    : m_file(filePath)
    , m_bytesWritten(0)
{
}

ResponseLog::~ResponseLog()
{
    if (m_file.isOpen()) {
        m_file.flush();
        m_file.close();
    }
}

bool ResponseLog::open()
{
    if (m_file.isOpen())
        return true;

    const QString dirPath = QFileInfo(m_file.fileName()).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        qCWarning(lcFeed) << "Failed to create response log directory:" << dirPath;
        return false;
    }

    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        qCWarning(lcFeed) << "Failed to open response log file:" << m_file.fileName()
                          << m_file.errorString();
        return false;
    }

    qCInfo(lcFeed) << "Appending raw responses to" << m_file.fileName();
    return true;
}

bool ResponseLog::append(const QByteArray &data)
{
    if (!m_file.isOpen() && !open())
        return false;

    QByteArray record = data;
    if (!record.endsWith('\n'))
        record.append('\n');

    const qint64 written = m_file.write(record);
    if (written != record.size() || !m_file.flush()) {
        qCWarning(lcFeed) << "Failed to write response log:" << m_file.errorString();
        return false;
    }

    m_bytesWritten += written;
    return true;
}
