#include "skirt.h"

#include <core/config.h>

#include <algorithm>
#include <cmath>

#include <glm/gtc/constants.hpp>

namespace tile
{
    uint32_t subdivision_for_level(uint32_t level)
    {
        const uint32_t from_level = (level < kSubdivisionBase) ? (kSubdivisionBase - level) : 0u;
        return std::max(from_level, kMinPatchSubdivision);
    }

    uint32_t patch_grid_width(uint32_t subdivision)
    {
        return (1u << subdivision) + 1u;
    }

    double level_zero_geometric_error(const geo::Projection &projection,
                                      uint32_t grid_width,
                                      uint32_t tiles_at_level_zero)
    {
        return (projection.unit_scale() * 2.0 * glm::pi<double>() * 0.25) /
               (static_cast<double>(grid_width) * static_cast<double>(tiles_at_level_zero));
    }

    double skirt_height(const geo::Projection &sphere,
                        const geo::SubdivisionScheme &subdivision,
                        uint32_t level)
    {
        const double error0 = level_zero_geometric_error(sphere,
                                                         patch_grid_width(subdivision_for_level(level)),
                                                         subdivision.subdivision_x(0));
        const double scaled = error0 / std::ldexp(1.0, static_cast<int>(level)) * kSkirtErrorScale;
        return std::min(scaled, kMaxSkirtHeight);
    }

    double patch_skirt_offset(uint32_t level)
    {
        return kPatchSkirtFraction / std::ldexp(1.0, static_cast<int>(level));
    }
} // namespace tile
