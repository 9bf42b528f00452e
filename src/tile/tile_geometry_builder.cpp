#include "tile_geometry_builder.h"

#include "skirt.h"
#include "vertex_normals.h"

#include <core/util/logger.h>

#include <array>
#include <cmath>

#include <fmt/core.h>

namespace tile
{
    TileGeometryBuilder::TileGeometryBuilder(const geo::TilingScheme &tiling,
                                             const geo::Projection &sphere,
                                             const Settings &settings)
        : _generator(tiling, sphere)
        , _settings(settings)
    {
        if (_settings.min_detail_level > _settings.max_detail_level)
        {
            Logger::warn("min_detail_level {} above max_detail_level {}; clamping",
                         _settings.min_detail_level, _settings.max_detail_level);
            _settings.min_detail_level = _settings.max_detail_level;
        }
    }

    std::string TileGeometryBuilder::cache_key(uint32_t level, uint32_t row, bool is_simple_patch)
    {
        if (is_simple_patch)
        {
            return fmt::format("simple.patch/{}", subdivision_for_level(level));
        }
        return fmt::format("{}/{}/patch", level, row);
    }

    std::shared_ptr<GeometryMode> TileGeometryBuilder::build_geometry(uint32_t level,
                                                                     uint32_t row,
                                                                     bool is_simple_patch) const
    {
        const uint32_t subdivision = subdivision_for_level(level);
        auto mode = std::make_shared<GeometryMode>();

        if (is_simple_patch)
        {
            const uint32_t size = patch_grid_width(subdivision);
            if (!_generator.generate_simple_patch_with_skirt(*mode, size * 2u, size * 2u))
            {
                return nullptr;
            }
            return mode;
        }

        const geo::TileKey key = geo::TileKey::from_row_column_level(row, 0, level);
        const bool ok = (level >= _settings.min_detail_level)
                            ? _generator.generate_patch_with_buckets_and_skirt(*mode, subdivision, key, true)
                            : _generator.generate_patch_with_buckets(*mode, subdivision, key, true);
        if (!ok)
        {
            return nullptr;
        }

        compute_vertex_normals(mode->sources.front(), mode->materials.front());
        return mode;
    }

    std::shared_ptr<const GeometryMode> TileGeometryBuilder::get_geometry(uint32_t level,
                                                                         uint32_t row,
                                                                         bool is_simple_patch)
    {
        if (level > kMaxTileLevel)
        {
            ++_stats.failures;
            Logger::error("Tile level {} is deeper than the supported level {}", level, kMaxTileLevel);
            return nullptr;
        }

        const std::string key = cache_key(level, row, is_simple_patch);

        auto it = _cache.find(key);
        if (it != _cache.end())
        {
            ++_stats.hits;
            return it->second;
        }

        ++_stats.misses;
        std::shared_ptr<const GeometryMode> mode = build_geometry(level, row, is_simple_patch);
        if (!mode)
        {
            ++_stats.failures;
            Logger::error("Failed to build patch geometry '{}'", key);
            return nullptr;
        }

        _cache.emplace(key, mode);
        _stats.entries = static_cast<uint32_t>(_cache.size());
        Logger::debug("Cached patch '{}' ({} vertices, {} bytes)", key,
                      mode->source().vertex_count, mode->byte_size());
        return mode;
    }

    WorldVec3 TileGeometryBuilder::tile_base_position(const geo::TileKey &key,
                                                      const geo::Projection &projection) const
    {
        if (key.level == 0)
        {
            return WorldVec3(0.0);
        }
        return projection.project_point(tiling_scheme().geo_box(key).center());
    }

    std::optional<glm::dmat4> TileGeometryBuilder::tile_rotation_matrix(const geo::TileKey &key,
                                                                         const WorldVec3 &tile_position,
                                                                         const geo::Projection &projection,
                                                                         const std::optional<geo::TileKey> &child) const
    {
        if (key.level < _settings.max_detail_level)
        {
            return std::nullopt;
        }

        geo::TileKey corner_key = key;
        double scale = 1.0;
        double child_x = 0.0;
        double child_y = 0.0;

        if (child)
        {
            if (child->level < key.level || child->level > kMaxTileLevel)
            {
                Logger::error("Child {} is not a supported descendant of {}", child->to_string(), key.to_string());
                return std::nullopt;
            }

            const uint32_t level_diff = child->level - key.level;
            if ((child->row >> level_diff) != key.row || (child->column >> level_diff) != key.column)
            {
                Logger::error("Child {} does not lie inside {}", child->to_string(), key.to_string());
                return std::nullopt;
            }

            const uint32_t offset_row = child->row - (key.row << level_diff);
            const uint32_t offset_column = child->column - (key.column << level_diff);

            corner_key = *child;
            scale = std::ldexp(1.0, -static_cast<int>(level_diff));
            child_x = static_cast<double>(offset_row) * scale;
            child_y = static_cast<double>(offset_column) * scale;
        }

        const geo::GeoBox box = tiling_scheme().geo_box(corner_key);
        const std::array<WorldVec3, 4> corners{
            projection.project_point(geo::GeoCoordinates::from_degrees(box.south(), box.west())),
            projection.project_point(geo::GeoCoordinates::from_degrees(box.south(), box.east())),
            projection.project_point(geo::GeoCoordinates::from_degrees(box.north(), box.west())),
            projection.project_point(geo::GeoCoordinates::from_degrees(box.north(), box.east())),
        };

        glm::dmat4 m(0.0);
        m[0] = glm::dvec4(corners[0] - tile_position, scale);
        m[1] = glm::dvec4(corners[1] - corners[0], 0.0);
        m[2] = glm::dvec4(corners[2] - tile_position, child_y);
        m[3] = glm::dvec4(corners[3] - corners[2], child_x);
        return m;
    }

    TileTransformation TileGeometryBuilder::compute_transformation(const geo::TileKey &key) const
    {
        const geo::Projection &sphere = _generator.sphere();
        const geo::Projection &mercator = _generator.mercator();

        const WorldVec3 sphere_position = tile_base_position(key, sphere);
        const WorldVec3 mercator_position = tile_base_position(key, mercator);

        return TileTransformation(sphere_position,
                                  tile_rotation_matrix(key, sphere_position, sphere),
                                  mercator_position,
                                  tile_rotation_matrix(key, mercator_position, mercator));
    }

    double TileGeometryBuilder::skirt_height(uint32_t level) const
    {
        return tile::skirt_height(_generator.sphere(), tiling_scheme().subdivision_scheme(), level);
    }

    std::optional<TileGeometry> TileGeometryBuilder::get_tile_geometry_with_transform(const geo::TileKey &key)
    {
        std::shared_ptr<const GeometryMode> geometry = get_geometry(key.level, key.row, is_simple_patch_level(key.level));
        if (!geometry)
        {
            return std::nullopt;
        }

        return TileGeometry{std::move(geometry), compute_transformation(key), skirt_height(key.level)};
    }
} // namespace tile
