#pragma once

#include "geometry_mode.h"
#include "patch_generator.h"
#include "tile_transformation.h"

#include <core/config.h>
#include <geo/tile_key.h>
#include <geo/tiling_scheme.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace tile
{
    struct TileGeometry
    {
        std::shared_ptr<const GeometryMode> geometry;
        TileTransformation transformation;
        double skirt_height = 0.0;
    };

    struct TileGeometryBuilderSettings
    {
        uint32_t min_detail_level = kDefaultMinDetailLevel;  // first level with skirts
        uint32_t max_detail_level = kDefaultMaxDetailLevel;  // first level using the simple patch
    };

    // Hands out patch geometry for tile keys. Patches depend only on (level, row)
    // because a tile row is rotationally symmetric on the sphere; tiles at or
    // above max_detail_level all share one planar patch positioned by their
    // transformation. Entries are built on first use and live as long as the
    // builder. Returned geometry is shared and must not be modified.
    class TileGeometryBuilder
    {
    public:
        using Settings = TileGeometryBuilderSettings;

        struct Stats
        {
            uint32_t entries = 0;
            uint32_t hits = 0;
            uint32_t misses = 0;
            uint32_t failures = 0;
        };

        TileGeometryBuilder(const geo::TilingScheme &tiling,
                            const geo::Projection &sphere,
                            const Settings &settings = {});

        const Settings &settings() const { return _settings; }
        const Stats &stats() const { return _stats; }
        const PatchGenerator &generator() const { return _generator; }
        const geo::TilingScheme &tiling_scheme() const { return _generator.tiling_scheme(); }

        bool is_simple_patch_level(uint32_t level) const { return level >= _settings.max_detail_level; }

        static std::string cache_key(uint32_t level, uint32_t row, bool is_simple_patch);

        // nullptr if the patch cannot be generated.
        std::shared_ptr<const GeometryMode> get_geometry(uint32_t level, uint32_t row, bool is_simple_patch);

        std::optional<TileGeometry> get_tile_geometry_with_transform(const geo::TileKey &key);

        TileTransformation compute_transformation(const geo::TileKey &key) const;

        // Origin for level 0, otherwise the projected center of the tile's geo box.
        WorldVec3 tile_base_position(const geo::TileKey &key, const geo::Projection &projection) const;

        // Corner basis of a simple-patch tile: columns hold SW - origin, SE - SW,
        // NW - origin, NE - NW, with the child scale and offsets in the last row.
        // Tiles below max_detail_level have none, and neither does a child key
        // that is not a descendant of key at a supported level.
        std::optional<glm::dmat4> tile_rotation_matrix(const geo::TileKey &key,
                                                       const WorldVec3 &tile_position,
                                                       const geo::Projection &projection,
                                                       const std::optional<geo::TileKey> &child = std::nullopt) const;

        double skirt_height(uint32_t level) const;

    private:
        std::shared_ptr<GeometryMode> build_geometry(uint32_t level, uint32_t row, bool is_simple_patch) const;

        PatchGenerator _generator;
        Settings _settings{};
        Stats _stats{};
        std::unordered_map<std::string, std::shared_ptr<const GeometryMode>> _cache;
    };
} // namespace tile
