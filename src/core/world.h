#pragma once

#include <glm/vec3.hpp>

#include <cmath>

// Authoritative world-space coordinates are stored as double precision.
using WorldVec3 = glm::dvec3;

// Float buffers handed to the renderer hold positions relative to a tile origin.
inline glm::vec3 world_to_local(const WorldVec3 &world, const WorldVec3 &origin_world)
{
    const WorldVec3 local_d = world - origin_world;
    return glm::vec3(static_cast<float>(local_d.x),
                     static_cast<float>(local_d.y),
                     static_cast<float>(local_d.z));
}

inline bool is_zero(const glm::dvec3 &v)
{
    return v.x == 0.0 && v.y == 0.0 && v.z == 0.0;
}

// Axis-aligned box in projected world space.
struct WorldBox
{
    WorldVec3 min{0.0, 0.0, 0.0};
    WorldVec3 max{0.0, 0.0, 0.0};

    WorldVec3 size() const { return max - min; }
    WorldVec3 center() const { return (min + max) * 0.5; }
};
