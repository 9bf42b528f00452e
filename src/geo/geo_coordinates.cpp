#include "geo_coordinates.h"

#include <algorithm>

namespace geo
{
    GeoCoordinates GeoCoordinates::from_degrees(double lat_deg, double lon_deg, double alt_m)
    {
        return GeoCoordinates{lat_deg, lon_deg, alt_m};
    }

    GeoCoordinates GeoCoordinates::from_radians(double lat_rad, double lon_rad, double alt_m)
    {
        const double to_deg = 180.0 / glm::pi<double>();
        return GeoCoordinates{lat_rad * to_deg, lon_rad * to_deg, alt_m};
    }

    double GeoCoordinates::latitude_radians() const
    {
        return latitude * (glm::pi<double>() / 180.0);
    }

    double GeoCoordinates::longitude_radians() const
    {
        return longitude * (glm::pi<double>() / 180.0);
    }

    GeoBox GeoBox::from_corners(const GeoCoordinates &a, const GeoCoordinates &b)
    {
        GeoBox box{};
        box.south_west = GeoCoordinates{std::min(a.latitude, b.latitude),
                                        std::min(a.longitude, b.longitude),
                                        std::min(a.altitude, b.altitude)};
        box.north_east = GeoCoordinates{std::max(a.latitude, b.latitude),
                                        std::max(a.longitude, b.longitude),
                                        std::max(a.altitude, b.altitude)};
        return box;
    }

    GeoCoordinates GeoBox::center() const
    {
        return GeoCoordinates{(south() + north()) * 0.5,
                              (west() + east()) * 0.5,
                              (south_west.altitude + north_east.altitude) * 0.5};
    }
} // namespace geo
