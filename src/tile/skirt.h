#pragma once

#include <geo/projection.h>
#include <geo/subdivision_scheme.h>

#include <cstdint>

namespace tile
{
    // Grid subdivision used for tiles of a level: max(7 - level, 4).
    uint32_t subdivision_for_level(uint32_t level);

    // Vertices along one edge of an unskirted patch: 2^subdivision + 1.
    uint32_t patch_grid_width(uint32_t subdivision);

    // Geometric error of a level-0 tile sampled with grid_width vertices per edge.
    double level_zero_geometric_error(const geo::Projection &projection,
                                      uint32_t grid_width,
                                      uint32_t tiles_at_level_zero);

    // World-space skirt depth for a tile. Coarser tiles get deeper skirts,
    // capped at kMaxSkirtHeight.
    double skirt_height(const geo::Projection &sphere,
                        const geo::SubdivisionScheme &subdivision,
                        uint32_t level);

    // Skirt ring offset of a bucketed patch, in multiples of the projection's unit scale.
    double patch_skirt_offset(uint32_t level);
} // namespace tile
