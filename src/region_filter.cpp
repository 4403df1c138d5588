#include "region_filter.hpp"

const double RegionFilter::NORTH_AMERICA_MIN_LAT = 7.0;
const double RegionFilter::NORTH_AMERICA_MAX_LAT = 83.0;
const double RegionFilter::NORTH_AMERICA_MIN_LON = -167.0;
const double RegionFilter::NORTH_AMERICA_MAX_LON = -52.5;

RegionFilter::RegionFilter()
    : RegionFilter(northAmerica())
{
}

RegionFilter::RegionFilter(const QString &name, double minLatitude, double maxLatitude,
                           double minLongitude, double maxLongitude)
    : m_name(name)
    , m_bounds(QGeoCoordinate(maxLatitude, minLongitude),
               QGeoCoordinate(minLatitude, maxLongitude))
{
}

bool RegionFilter::isInRegion(const SeismicEvent &event) const
{
    return contains(event.latitude(), event.longitude());
}

bool RegionFilter::contains(double latitude, double longitude) const
{
    // QGeoRectangle::contains() treats every edge as part of the box
    return m_bounds.contains(QGeoCoordinate(latitude, longitude));
}

bool RegionFilter::isValid() const
{
    return m_bounds.isValid()
        && m_bounds.topLeft().longitude() <= m_bounds.bottomRight().longitude();
}

RegionFilter RegionFilter::northAmerica()
{
    return RegionFilter(QStringLiteral("North America"),
                        NORTH_AMERICA_MIN_LAT, NORTH_AMERICA_MAX_LAT,
                        NORTH_AMERICA_MIN_LON, NORTH_AMERICA_MAX_LON);
}
