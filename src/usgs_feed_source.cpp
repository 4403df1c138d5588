#include "usgs_feed_source.hpp"
#include "geojson_parser.hpp"
#include "response_log.hpp"
#include "logging.hpp"

const QUrl UsgsFeedSource::DEFAULT_ENDPOINT(QStringLiteral("https://earthquake.usgs.gov/fdsnws/event/1/query"));
const int UsgsFeedSource::DEFAULT_TIMEOUT_MS = 30000;
const int UsgsFeedSource::HTTP_OK = 200;

UsgsFeedSource::UsgsFeedSource(QObject *parent)
    : FeedSource(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_currentReply(nullptr)
    , m_responseLog(nullptr)
    , m_endpoint(DEFAULT_ENDPOINT)
    , m_userAgent(QStringLiteral("QuakeWatch/1.0"))
    , m_timeoutMs(DEFAULT_TIMEOUT_MS)
    , m_successfulRequests(0)
    , m_failedRequests(0)
{
}

UsgsFeedSource::~UsgsFeedSource()
{
    cancel();
}

void UsgsFeedSource::setEndpoint(const QUrl &endpoint)
{
    m_endpoint = endpoint;
}

void UsgsFeedSource::setUserAgent(const QString &userAgent)
{
    m_userAgent = userAgent;
}

void UsgsFeedSource::setTimeout(int timeoutMs)
{
    m_timeoutMs = qMax(0, timeoutMs);
}

void UsgsFeedSource::setResponseLog(ResponseLog *responseLog)
{
    m_responseLog = responseLog;
}

QUrl UsgsFeedSource::buildQueryUrl(const FeedQuery &query) const
{
    QUrlQuery params;
    params.addQueryItem("format", "geojson");
    params.addQueryItem("starttime", query.startDate.toString("yyyy-MM-dd"));
    params.addQueryItem("endtime", query.endDate.toString("yyyy-MM-dd"));
    params.addQueryItem("minmagnitude", QString::number(query.minMagnitude, 'g', QLocale::FloatingPointShortest));

    QUrl url(m_endpoint);
    url.setQuery(params);
    return url;
}

void UsgsFeedSource::fetch(const FeedQuery &query)
{
    if (!query.isValid()) {
        fail(FeedError::invalidQuery(QString("Invalid query window %1").arg(query.toString())));
        return;
    }

    // Strictly one request at a time
    cancel();

    const QUrl url = buildQueryUrl(query);
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::UserAgentHeader, m_userAgent);
    request.setRawHeader("Accept", "application/json");
    if (m_timeoutMs > 0) {
        request.setTransferTimeout(m_timeoutMs);
    }

    logApiCall(url);
    m_currentReply = m_networkManager->get(request);
    connect(m_currentReply, &QNetworkReply::finished,
            this, &UsgsFeedSource::onNetworkReplyFinished);
}

void UsgsFeedSource::cancel()
{
    if (!m_currentReply)
        return;

    QNetworkReply *reply = m_currentReply;
    m_currentReply = nullptr;
    // Disconnect first so abort() does not report a failure
    disconnect(reply, nullptr, this, nullptr);
    reply->abort();
    reply->deleteLater();
    qCDebug(lcFeed) << "In-flight request cancelled";
}

void UsgsFeedSource::onNetworkReplyFinished()
{
    QNetworkReply *reply = qobject_cast<QNetworkReply*>(sender());
    if (!reply || reply != m_currentReply) {
        if (reply)
            reply->deleteLater();
        return;
    }
    m_currentReply = nullptr;
    reply->deleteLater();

    const QVariant statusAttribute = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);

    if (!statusAttribute.isValid()) {
        // No HTTP response at all: DNS, refused connection, TLS, timeout
        fail(FeedError::transport(reply->errorString()));
        return;
    }

    const int statusCode = statusAttribute.toInt();
    if (statusCode != HTTP_OK) {
        fail(FeedError::server(statusCode,
            reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString()));
        return;
    }

    if (reply->error() != QNetworkReply::NoError) {
        // Connection dropped while the body was still arriving
        fail(FeedError::transport(reply->errorString()));
        return;
    }

    const QByteArray body = reply->readAll();

    if (m_responseLog && !m_responseLog->append(body)) {
        emit responseLogFailed(m_responseLog->errorString());
    }

    GeoJsonParser::ParseResult result = GeoJsonParser::parseUSGSGeoJson(body);
    if (!result.success) {
        fail(FeedError::parse(result.errorMessage));
        return;
    }

    m_lastUpdateTime = QDateTime::currentDateTimeUtc();
    m_lastError.clear();
    ++m_successfulRequests;

    qCInfo(lcFeed) << "Received" << result.totalFeatures << "features ("
                   << body.size() << "bytes, parsed in" << result.parseTimeMs << "ms)";

    emit batchReady(result.events);
}

void UsgsFeedSource::fail(const FeedError &error)
{
    m_lastError = error.message();
    ++m_failedRequests;
    emit fetchFailed(error);
}

void UsgsFeedSource::logApiCall(const QUrl &url)
{
    qCDebug(lcFeed) << "GET" << url.toString();
}
