#pragma once

#include <glm/gtc/constants.hpp>

namespace geo
{
    // Latitude/longitude in degrees, altitude in meters above the reference surface.
    struct GeoCoordinates
    {
        double latitude = 0.0;
        double longitude = 0.0;
        double altitude = 0.0;

        static GeoCoordinates from_degrees(double lat_deg, double lon_deg, double alt_m = 0.0);
        static GeoCoordinates from_radians(double lat_rad, double lon_rad, double alt_m = 0.0);

        double latitude_radians() const;
        double longitude_radians() const;

        friend bool operator==(const GeoCoordinates &, const GeoCoordinates &) = default;
    };

    struct GeoBox
    {
        GeoCoordinates south_west{};
        GeoCoordinates north_east{};

        // Orders the corners so south <= north and west <= east.
        static GeoBox from_corners(const GeoCoordinates &a, const GeoCoordinates &b);

        double south() const { return south_west.latitude; }
        double north() const { return north_east.latitude; }
        double west() const { return south_west.longitude; }
        double east() const { return north_east.longitude; }

        double latitude_span() const { return north() - south(); }
        double longitude_span() const { return east() - west(); }

        GeoCoordinates center() const;
    };
} // namespace geo
