#pragma once

#include <QString>
#include <QDateTime>
#include <QMetaType>
#include <QVector>
#include <QtPositioning/QGeoCoordinate>

enum class FingerprintMode {
    Rendered,   // display string, the default
    FeedId      // feed "id" when present, display string otherwise
};

struct SeismicEvent {
    QString eventId;
    double magnitude = 0.0;
    QString place;
    QDateTime occurredAt;
    QGeoCoordinate location;
    double depth = 0.0;

    SeismicEvent() = default;
    SeismicEvent(double magnitude, const QString &place, qint64 occurredAtMs,
                 double latitude, double longitude, double depth,
                 const QString &eventId = QString());

    double latitude() const { return location.latitude(); }
    double longitude() const { return location.longitude(); }

    // "<instant>: Magnitude <m.m> at <place> (<lat>, <lon>)"
    QString render() const;
    QString fingerprint(FingerprintMode mode = FingerprintMode::Rendered) const;

    static QString formatInstant(const QDateTime &instant);
};

using EventBatch = QVector<SeismicEvent>;

Q_DECLARE_METATYPE(SeismicEvent)
