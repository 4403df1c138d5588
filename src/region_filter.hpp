#pragma once
#include "seismic_event.hpp"

#include <QString>
#include <QtPositioning/QGeoRectangle>

// Inclusive latitude/longitude box test. Boxes crossing the antimeridian
// are not supported.
class RegionFilter
{
public:
    RegionFilter();
    RegionFilter(const QString &name, double minLatitude, double maxLatitude,
                 double minLongitude, double maxLongitude);

    bool isInRegion(const SeismicEvent &event) const;
    bool contains(double latitude, double longitude) const;

    QString name() const { return m_name; }
    QGeoRectangle bounds() const { return m_bounds; }
    bool isValid() const;

    // 7N..83N, 167W..52.5W
    static RegionFilter northAmerica();

    static const double NORTH_AMERICA_MIN_LAT;
    static const double NORTH_AMERICA_MAX_LAT;
    static const double NORTH_AMERICA_MIN_LON;
    static const double NORTH_AMERICA_MAX_LON;

private:
    QString m_name;
    QGeoRectangle m_bounds;
};
