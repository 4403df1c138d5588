#include "feed_source.hpp"

bool FeedQuery::isValid() const
{
    return startDate.isValid() && endDate.isValid()
        && startDate <= endDate
        && minMagnitude >= 0.0;
}

QString FeedQuery::toString() const
{
    return QString("%1..%2 M>=%3")
        .arg(startDate.toString(Qt::ISODate), endDate.toString(Qt::ISODate))
        .arg(minMagnitude);
}

FeedError::FeedError()
    : FeedError(Kind::Transport, 0, QString())
{
}

FeedError::FeedError(Kind kind, int statusCode, const QString &message)
    : m_kind(kind)
    , m_statusCode(statusCode)
    , m_message(message)
{
}

FeedError FeedError::transport(const QString &message)
{
    return FeedError(Kind::Transport, 0, message);
}

FeedError FeedError::server(int statusCode, const QString &message)
{
    return FeedError(Kind::Server, statusCode, message);
}

FeedError FeedError::parse(const QString &message)
{
    return FeedError(Kind::Parse, 0, message);
}

FeedError FeedError::invalidQuery(const QString &message)
{
    return FeedError(Kind::InvalidQuery, 0, message);
}

QString FeedError::kindName() const
{
    switch (m_kind) {
    case Kind::Transport:    return QStringLiteral("TransportError");
    case Kind::Server:       return QStringLiteral("ServerError");
    case Kind::Parse:        return QStringLiteral("ParseError");
    case Kind::InvalidQuery: return QStringLiteral("InvalidQueryError");
    }
    return QStringLiteral("UnknownError");
}

QString FeedError::toString() const
{
    if (m_kind == Kind::Server)
        return QString("%1(%2)").arg(kindName()).arg(m_statusCode);
    return kindName();
}

FeedSource::FeedSource(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<EventBatch>("EventBatch");
    qRegisterMetaType<FeedError>("FeedError");
}

FeedSource::~FeedSource() = default;
