#include "projection.h"

#include <core/config.h>

#include <cmath>

#include <glm/common.hpp>
#include <glm/geometric.hpp>

namespace geo
{
    namespace
    {
        const double kPi = glm::pi<double>();
        const double kTwoPi = 2.0 * glm::pi<double>();
    } // namespace

    // ---- Sphere ----

    WorldVec3 SphereProjection::project_point(const GeoCoordinates &geo_point) const
    {
        const double radius = unit_scale() + geo_point.altitude;
        const double lat = geo_point.latitude_radians();
        const double lon = geo_point.longitude_radians();
        const double cos_lat = std::cos(lat);

        return WorldVec3(radius * cos_lat * std::cos(lon),
                         radius * cos_lat * std::sin(lon),
                         radius * std::sin(lat));
    }

    GeoCoordinates SphereProjection::unproject_point(const WorldVec3 &world_point) const
    {
        const double parallel_radius_sq = world_point.x * world_point.x + world_point.y * world_point.y;
        const double parallel_radius = std::sqrt(parallel_radius_sq);
        const double radius = std::sqrt(parallel_radius_sq + world_point.z * world_point.z);
        if (!(radius > 0.0))
        {
            return GeoCoordinates::from_radians(0.0, 0.0, -unit_scale());
        }

        const double lon = std::atan2(world_point.y, world_point.x);
        const double lat = std::atan2(world_point.z, parallel_radius);
        return GeoCoordinates::from_radians(lat, lon, radius - unit_scale());
    }

    WorldBox SphereProjection::world_extent(double /*min_altitude*/, double max_altitude) const
    {
        const double radius = unit_scale() + max_altitude;
        return WorldBox{WorldVec3(-radius), WorldVec3(radius)};
    }

    glm::dvec3 SphereProjection::surface_normal(const WorldVec3 &world_point) const
    {
        const double len = glm::length(world_point);
        if (!(len > 0.0))
        {
            return glm::dvec3(0.0, 0.0, 1.0);
        }
        return world_point / len;
    }

    // ---- Mercator ----

    double MercatorProjection::clamp_latitude(double lat_rad)
    {
        return glm::clamp(lat_rad, -kMaxMercatorLatitude, kMaxMercatorLatitude);
    }

    double MercatorProjection::latitude_to_mercator_y(double lat_rad)
    {
        const double s = std::sin(clamp_latitude(lat_rad));
        return 0.5 * std::log((1.0 + s) / (1.0 - s)) / kPi;
    }

    double MercatorProjection::mercator_y_to_latitude(double mercator_y)
    {
        return std::atan(std::sinh(mercator_y * kPi));
    }

    WorldVec3 MercatorProjection::project_point(const GeoCoordinates &geo_point) const
    {
        const double x = (geo_point.longitude_radians() + kPi) / kTwoPi;
        const double y = latitude_to_mercator_y(geo_point.latitude_radians()) * 0.5 + 0.5;
        return WorldVec3(x * unit_scale(), y * unit_scale(), geo_point.altitude);
    }

    GeoCoordinates MercatorProjection::unproject_point(const WorldVec3 &world_point) const
    {
        const double lon = (world_point.x / unit_scale()) * kTwoPi - kPi;
        const double lat = mercator_y_to_latitude((world_point.y / unit_scale() - 0.5) * 2.0);
        return GeoCoordinates::from_radians(lat, lon, world_point.z);
    }

    WorldBox MercatorProjection::world_extent(double min_altitude, double max_altitude) const
    {
        return WorldBox{WorldVec3(0.0, 0.0, min_altitude),
                        WorldVec3(unit_scale(), unit_scale(), max_altitude)};
    }

    glm::dvec3 MercatorProjection::surface_normal(const WorldVec3 & /*world_point*/) const
    {
        return glm::dvec3(0.0, 0.0, 1.0);
    }

    // ---- Web Mercator ----

    WorldVec3 WebMercatorProjection::project_point(const GeoCoordinates &geo_point) const
    {
        const double x = (geo_point.longitude_radians() + kPi) / kTwoPi;
        const double y = 0.5 - latitude_to_mercator_y(geo_point.latitude_radians()) * 0.5;
        return WorldVec3(x * unit_scale(), y * unit_scale(), geo_point.altitude);
    }

    GeoCoordinates WebMercatorProjection::unproject_point(const WorldVec3 &world_point) const
    {
        const double lon = (world_point.x / unit_scale()) * kTwoPi - kPi;
        const double lat = mercator_y_to_latitude((0.5 - world_point.y / unit_scale()) * 2.0);
        return GeoCoordinates::from_radians(lat, lon, world_point.z);
    }

    // ---- Equirectangular ----

    WorldVec3 EquirectangularProjection::project_point(const GeoCoordinates &geo_point) const
    {
        const double x = (geo_point.longitude_radians() + kPi) / kTwoPi;
        const double y = (geo_point.latitude_radians() + kPi * 0.5) / kTwoPi;
        return WorldVec3(x * unit_scale(), y * unit_scale(), geo_point.altitude);
    }

    GeoCoordinates EquirectangularProjection::unproject_point(const WorldVec3 &world_point) const
    {
        const double lon = (world_point.x / unit_scale()) * kTwoPi - kPi;
        const double lat = (world_point.y / unit_scale()) * kTwoPi - kPi * 0.5;
        return GeoCoordinates::from_radians(lat, lon, world_point.z);
    }

    WorldBox EquirectangularProjection::world_extent(double min_altitude, double max_altitude) const
    {
        return WorldBox{WorldVec3(0.0, 0.0, min_altitude),
                        WorldVec3(unit_scale(), unit_scale() * 0.5, max_altitude)};
    }

    glm::dvec3 EquirectangularProjection::surface_normal(const WorldVec3 & /*world_point*/) const
    {
        return glm::dvec3(0.0, 0.0, 1.0);
    }

    // ---- Shared instances ----

    const SphereProjection &sphere_projection()
    {
        static const SphereProjection instance(kEquatorialRadius);
        return instance;
    }

    const MercatorProjection &mercator_projection()
    {
        static const MercatorProjection instance(kEquatorialRadius);
        return instance;
    }

    const WebMercatorProjection &web_mercator_projection()
    {
        static const WebMercatorProjection instance(kEquatorialRadius);
        return instance;
    }

    const EquirectangularProjection &normalized_equirectangular_projection()
    {
        static const EquirectangularProjection instance(1.0);
        return instance;
    }
} // namespace geo
