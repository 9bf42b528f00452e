#pragma once

#include <core/world.h>

#include <optional>

#include <glm/mat4x4.hpp>

namespace tile
{
    // A tile origin placed on the sphere and on the Mercator plane. The
    // "rotation" is the corner basis the renderer applies to simple patches;
    // coarse tiles have none.
    class TileTransformation
    {
    public:
        struct Blend
        {
            WorldVec3 position{0.0};
            std::optional<glm::dmat4> rotation;
        };

        TileTransformation(const WorldVec3 &sphere_position,
                           const std::optional<glm::dmat4> &sphere_rotation,
                           const WorldVec3 &mercator_position,
                           const std::optional<glm::dmat4> &mercator_rotation);

        const WorldVec3 &sphere_position() const { return _sphere_position; }
        const std::optional<glm::dmat4> &sphere_rotation() const { return _sphere_rotation; }
        const WorldVec3 &mercator_position() const { return _mercator_position; }
        const std::optional<glm::dmat4> &mercator_rotation() const { return _mercator_rotation; }

        // t = 0 is the sphere, t = 1 the Mercator plane; t is clamped to [0, 1].
        // Positions and rotation elements blend linearly. When only one side has a
        // rotation it is used up to the midpoint (exclusive) and dropped past it.
        Blend interpolate(double t) const;

        bool equals(const TileTransformation &other) const;

    private:
        WorldVec3 _sphere_position{0.0};
        std::optional<glm::dmat4> _sphere_rotation;
        WorldVec3 _mercator_position{0.0};
        std::optional<glm::dmat4> _mercator_rotation;
    };
} // namespace tile
