#pragma once

#include "geo_coordinates.h"

#include <core/world.h>

#include <cstdint>

namespace geo
{
    enum class ProjectionType : uint8_t
    {
        Planar = 0,
        Spherical = 1,
    };

    // Maps geographic coordinates to a world space and back.
    class Projection
    {
    public:
        explicit Projection(double unit_scale) : _unit_scale(unit_scale) {}
        virtual ~Projection() = default;

        virtual const char *name() const = 0;
        virtual ProjectionType type() const = 0;

        virtual WorldVec3 project_point(const GeoCoordinates &geo_point) const = 0;
        virtual GeoCoordinates unproject_point(const WorldVec3 &world_point) const = 0;
        virtual WorldBox world_extent(double min_altitude, double max_altitude) const = 0;
        virtual glm::dvec3 surface_normal(const WorldVec3 &world_point) const = 0;

        double unit_scale() const { return _unit_scale; }

    private:
        double _unit_scale = 1.0;
    };

    class SphereProjection final : public Projection
    {
    public:
        explicit SphereProjection(double radius_m) : Projection(radius_m) {}

        const char *name() const override { return "sphere"; }
        ProjectionType type() const override { return ProjectionType::Spherical; }

        WorldVec3 project_point(const GeoCoordinates &geo_point) const override;
        GeoCoordinates unproject_point(const WorldVec3 &world_point) const override;
        WorldBox world_extent(double min_altitude, double max_altitude) const override;
        glm::dvec3 surface_normal(const WorldVec3 &world_point) const override;
    };

    // Plane with x growing east and y growing north.
    class MercatorProjection : public Projection
    {
    public:
        explicit MercatorProjection(double unit_scale) : Projection(unit_scale) {}

        const char *name() const override { return "mercator"; }
        ProjectionType type() const override { return ProjectionType::Planar; }

        WorldVec3 project_point(const GeoCoordinates &geo_point) const override;
        GeoCoordinates unproject_point(const WorldVec3 &world_point) const override;
        WorldBox world_extent(double min_altitude, double max_altitude) const override;
        glm::dvec3 surface_normal(const WorldVec3 &world_point) const override;

        static double clamp_latitude(double lat_rad);
        // Normalized Mercator Y in [-1, 1] for latitudes within the clamp range.
        static double latitude_to_mercator_y(double lat_rad);
        static double mercator_y_to_latitude(double mercator_y);
    };

    // Mercator with y growing south, so row 0 of a tiling is the northern edge.
    class WebMercatorProjection final : public MercatorProjection
    {
    public:
        explicit WebMercatorProjection(double unit_scale) : MercatorProjection(unit_scale) {}

        const char *name() const override { return "web_mercator"; }

        WorldVec3 project_point(const GeoCoordinates &geo_point) const override;
        GeoCoordinates unproject_point(const WorldVec3 &world_point) const override;
    };

    class EquirectangularProjection final : public Projection
    {
    public:
        explicit EquirectangularProjection(double unit_scale) : Projection(unit_scale) {}

        const char *name() const override { return "equirectangular"; }
        ProjectionType type() const override { return ProjectionType::Planar; }

        WorldVec3 project_point(const GeoCoordinates &geo_point) const override;
        GeoCoordinates unproject_point(const WorldVec3 &world_point) const override;
        WorldBox world_extent(double min_altitude, double max_altitude) const override;
        glm::dvec3 surface_normal(const WorldVec3 &world_point) const override;
    };

    // Process-lifetime instances.
    const SphereProjection &sphere_projection();
    const MercatorProjection &mercator_projection();
    const WebMercatorProjection &web_mercator_projection();
    const EquirectangularProjection &normalized_equirectangular_projection();
} // namespace geo
