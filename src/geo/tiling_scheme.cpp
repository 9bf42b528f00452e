#include "tiling_scheme.h"

namespace geo
{
    const QuadTreeSubdivisionScheme &quad_tree_subdivision_scheme()
    {
        static const QuadTreeSubdivisionScheme instance;
        return instance;
    }

    const HalfQuadTreeSubdivisionScheme &half_quad_tree_subdivision_scheme()
    {
        static const HalfQuadTreeSubdivisionScheme instance;
        return instance;
    }

    TilingScheme::TilingScheme(const SubdivisionScheme &subdivision, const Projection &projection)
        : _subdivision(&subdivision)
        , _projection(&projection)
        , _world_box(projection.world_extent(0.0, 0.0))
        , _world_dimensions(_world_box.size())
    {
    }

    TilingScheme::TileOrigin TilingScheme::tile_origin(const TileKey &key) const
    {
        const double dim_x = static_cast<double>(_subdivision->level_dimension_x(key.level));
        const double dim_y = static_cast<double>(_subdivision->level_dimension_y(key.level));

        TileOrigin o{};
        o.size_x = _world_dimensions.x / dim_x;
        o.size_y = _world_dimensions.y / dim_y;
        o.origin_x = _world_box.min.x + o.size_x * static_cast<double>(key.column);
        o.origin_y = _world_box.min.y + o.size_y * static_cast<double>(key.row);
        return o;
    }

    WorldBox TilingScheme::world_box(const TileKey &key) const
    {
        const TileOrigin o = tile_origin(key);
        return WorldBox{WorldVec3(o.origin_x, o.origin_y, _world_box.min.z),
                        WorldVec3(o.origin_x + o.size_x, o.origin_y + o.size_y, _world_box.max.z)};
    }

    WorldVec3 TilingScheme::tile_key_world_origin(const TileKey &key) const
    {
        const TileOrigin o = tile_origin(key);
        return WorldVec3(o.origin_x, o.origin_y, 0.0);
    }

    GeoBox TilingScheme::geo_box(const TileKey &key) const
    {
        const WorldBox box = world_box(key);
        return GeoBox::from_corners(_projection->unproject_point(box.min),
                                    _projection->unproject_point(box.max));
    }

    GeoCoordinates TilingScheme::tile_key_geo_origin(const TileKey &key) const
    {
        return _projection->unproject_point(tile_key_world_origin(key));
    }

    bool TilingScheme::is_y_axis_down() const
    {
        const GeoBox row0 = geo_box(TileKey::from_row_column_level(0, 0, 1));
        const GeoBox row1 = geo_box(TileKey::from_row_column_level(1, 0, 1));
        return row0.north() > row1.north();
    }

    const TilingScheme &web_mercator_tiling_scheme()
    {
        static const TilingScheme instance(quad_tree_subdivision_scheme(), web_mercator_projection());
        return instance;
    }

    const TilingScheme &geographic_standard_tiling()
    {
        static const TilingScheme instance(half_quad_tree_subdivision_scheme(),
                                           normalized_equirectangular_projection());
        return instance;
    }
} // namespace geo
