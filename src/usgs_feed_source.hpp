#pragma once

#include <QtCore/QObject>
#include <QtCore/QDateTime>
#include <QtCore/QLocale>
#include <QtCore/QUrl>
#include <QtCore/QUrlQuery>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkRequest>
#include <QtNetwork/QNetworkReply>
#include "feed_source.hpp"

class ResponseLog;

// FDSN event web service client (GeoJSON format).
class UsgsFeedSource : public FeedSource
{
    Q_OBJECT

public:
    explicit UsgsFeedSource(QObject *parent = nullptr);
    ~UsgsFeedSource() override;

    // Configuration methods
    void setEndpoint(const QUrl &endpoint);
    void setUserAgent(const QString &userAgent);
    void setTimeout(int timeoutMs);
    // Not owned. Pass nullptr to disable.
    void setResponseLog(ResponseLog *responseLog);

    QUrl endpoint() const { return m_endpoint; }
    int timeout() const { return m_timeoutMs; }

    void fetch(const FeedQuery &query) override;
    void cancel() override;
    bool isBusy() const override { return m_currentReply != nullptr; }

    // Status and information
    QDateTime getLastUpdateTime() const { return m_lastUpdateTime; }
    QString getLastError() const { return m_lastError; }
    int getSuccessfulRequests() const { return m_successfulRequests; }
    int getFailedRequests() const { return m_failedRequests; }

    QUrl buildQueryUrl(const FeedQuery &query) const;

    static const QUrl DEFAULT_ENDPOINT;
    static const int DEFAULT_TIMEOUT_MS;
    static const int HTTP_OK;

signals:
    void responseLogFailed(const QString &error);

private slots:
    void onNetworkReplyFinished();

private:
    void fail(const FeedError &error);
    void logApiCall(const QUrl &url);

    QNetworkAccessManager *m_networkManager;
    QNetworkReply *m_currentReply;
    ResponseLog *m_responseLog;

    QUrl m_endpoint;
    QString m_userAgent;
    int m_timeoutMs;

    QDateTime m_lastUpdateTime;
    QString m_lastError;
    int m_successfulRequests;
    int m_failedRequests;
};
