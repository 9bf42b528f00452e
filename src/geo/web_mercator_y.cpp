#include "web_mercator_y.h"

#include "projection.h"

#include <cmath>

namespace geo
{
    WebMercatorYConverter::WebMercatorYConverter(double south_rad, double north_rad)
        : _south_mercator_y(mercator_angle(south_rad))
    {
        const double height = mercator_angle(north_rad) - _south_mercator_y;
        _one_over_mercator_height = (height != 0.0) ? (1.0 / height) : 0.0;
    }

    double WebMercatorYConverter::mercator_angle(double lat_rad)
    {
        const double s = std::sin(MercatorProjection::clamp_latitude(lat_rad));
        return 0.5 * std::log((1.0 + s) / (1.0 - s));
    }

    double WebMercatorYConverter::convert(double lat_rad) const
    {
        return (mercator_angle(lat_rad) - _south_mercator_y) * _one_over_mercator_height;
    }
} // namespace geo
