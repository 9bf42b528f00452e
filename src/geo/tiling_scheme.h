#pragma once

#include "geo_coordinates.h"
#include "projection.h"
#include "subdivision_scheme.h"
#include "tile_key.h"

#include <core/world.h>

namespace geo
{
    // A subdivision scheme laid over a projection's world extent. Tile (row, column)
    // at a level covers the cell of the world box starting at its min corner.
    class TilingScheme
    {
    public:
        TilingScheme(const SubdivisionScheme &subdivision, const Projection &projection);

        const SubdivisionScheme &subdivision_scheme() const { return *_subdivision; }
        const Projection &projection() const { return *_projection; }

        WorldBox world_box(const TileKey &key) const;
        WorldVec3 tile_key_world_origin(const TileKey &key) const;

        GeoBox geo_box(const TileKey &key) const;
        GeoCoordinates tile_key_geo_origin(const TileKey &key) const;

        // True when row 0 lies north of row 1.
        bool is_y_axis_down() const;

    private:
        struct TileOrigin
        {
            double origin_x = 0.0;
            double origin_y = 0.0;
            double size_x = 0.0;
            double size_y = 0.0;
        };

        TileOrigin tile_origin(const TileKey &key) const;

        const SubdivisionScheme *_subdivision = nullptr;
        const Projection *_projection = nullptr;
        WorldBox _world_box{};
        WorldVec3 _world_dimensions{0.0};
    };

    // Quadtree over web Mercator (row 0 north).
    const TilingScheme &web_mercator_tiling_scheme();
    // Half quadtree over the normalized equirectangular projection (row 0 south).
    const TilingScheme &geographic_standard_tiling();
} // namespace geo
