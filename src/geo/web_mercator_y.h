#pragma once

namespace geo
{
    // Maps latitudes inside [south, north] to their normalized position along the
    // web Mercator Y axis (0 at south, 1 at north).
    class WebMercatorYConverter
    {
    public:
        WebMercatorYConverter(double south_rad, double north_rad);

        double convert(double lat_rad) const;

        static double mercator_angle(double lat_rad);

    private:
        double _south_mercator_y = 0.0;
        double _one_over_mercator_height = 0.0;
    };
} // namespace geo
