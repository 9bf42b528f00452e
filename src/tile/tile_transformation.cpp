#include "tile_transformation.h"

#include <algorithm>

namespace tile
{
    namespace
    {
        // Weighted form so t = 0 and t = 1 reproduce the endpoints exactly.
        glm::dmat4 lerp_elements(const glm::dmat4 &a, const glm::dmat4 &b, double t)
        {
            glm::dmat4 out(0.0);
            for (int c = 0; c < 4; ++c)
            {
                for (int r = 0; r < 4; ++r)
                {
                    out[c][r] = a[c][r] * (1.0 - t) + b[c][r] * t;
                }
            }
            return out;
        }

        bool same_rotation(const std::optional<glm::dmat4> &a, const std::optional<glm::dmat4> &b)
        {
            if (a.has_value() != b.has_value())
            {
                return false;
            }
            return !a.has_value() || *a == *b;
        }
    } // namespace

    TileTransformation::TileTransformation(const WorldVec3 &sphere_position,
                                           const std::optional<glm::dmat4> &sphere_rotation,
                                           const WorldVec3 &mercator_position,
                                           const std::optional<glm::dmat4> &mercator_rotation)
        : _sphere_position(sphere_position)
        , _sphere_rotation(sphere_rotation)
        , _mercator_position(mercator_position)
        , _mercator_rotation(mercator_rotation)
    {
    }

    TileTransformation::Blend TileTransformation::interpolate(double t) const
    {
        t = std::clamp(t, 0.0, 1.0);

        Blend out{};
        out.position = _sphere_position * (1.0 - t) + _mercator_position * t;

        if (_sphere_rotation && _mercator_rotation)
        {
            out.rotation = lerp_elements(*_sphere_rotation, *_mercator_rotation, t);
        }
        else if (_sphere_rotation)
        {
            if (t < 0.5)
            {
                out.rotation = _sphere_rotation;
            }
        }
        else if (_mercator_rotation)
        {
            if (t > 0.5)
            {
                out.rotation = _mercator_rotation;
            }
        }

        return out;
    }

    bool TileTransformation::equals(const TileTransformation &other) const
    {
        return _sphere_position == other._sphere_position &&
               same_rotation(_sphere_rotation, other._sphere_rotation) &&
               _mercator_position == other._mercator_position &&
               same_rotation(_mercator_rotation, other._mercator_rotation);
    }
} // namespace tile
