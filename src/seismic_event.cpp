#include "seismic_event.hpp"

#include <QTimeZone>

SeismicEvent::SeismicEvent(double magnitude, const QString &place, qint64 occurredAtMs,
                           double latitude, double longitude, double depth,
                           const QString &eventId)
    : eventId(eventId)
    , magnitude(magnitude)
    , place(place)
    , occurredAt(QDateTime::fromMSecsSinceEpoch(occurredAtMs, QTimeZone::utc()))
    , location(latitude, longitude)
    , depth(depth)
{
}

QString SeismicEvent::render() const
{
    // Single-pass arg() so a '%' in the place text is left alone
    return QString("%1: Magnitude %2 at %3 (%4, %5)")
        .arg(formatInstant(occurredAt),
             QString::number(magnitude, 'f', 1),
             place,
             QString::number(latitude(), 'f', 4),
             QString::number(longitude(), 'f', 4));
}

QString SeismicEvent::fingerprint(FingerprintMode mode) const
{
    if (mode == FingerprintMode::FeedId && !eventId.isEmpty())
        return QStringLiteral("id:") + eventId;
    return render();
}

QString SeismicEvent::formatInstant(const QDateTime &instant)
{
    // Milliseconds are printed only when non-zero
    const QDateTime utc = instant.toUTC();
    if (utc.time().msec() == 0)
        return utc.toString(Qt::ISODate);
    return utc.toString(Qt::ISODateWithMs);
}
