#include "patch_generator.h"

#include "bucket_index.h"
#include "skirt.h"

#include <core/config.h>
#include <core/util/logger.h>
#include <geo/web_mercator_y.h>

#include <limits>

namespace tile
{
    namespace
    {
        GeometrySource &reset_mode(GeometryMode &out, uint32_t vertex_count, uint32_t triangle_count)
        {
            out = GeometryMode{};
            out.sources.resize(1);
            out.materials.resize(1);

            GeometrySource &src = out.sources.front();
            src.vertex_count = vertex_count;
            src.positions.assign(static_cast<size_t>(vertex_count) * 3u, 0.0f);
            src.uvs.assign(static_cast<size_t>(vertex_count) * 2u, 0.0f);
            src.web_mercator_y.assign(vertex_count, 0.0f);
            src.mercator_positions.assign(static_cast<size_t>(vertex_count) * 3u, 0.0f);

            GeometryMaterial &mat = out.materials.front();
            mat.source_index = 0;
            mat.triangle_count = triangle_count;
            mat.indices.assign(static_cast<size_t>(triangle_count) * 3u, 0u);
            return src;
        }

        void init_buckets(GeometryMode &out, uint32_t subdivision)
        {
            GeometryMaterial &mat = out.materials.front();
            mat.bucket_levels = subdivision;
            mat.bucket_count = 1u << (subdivision << 1);
            mat.bucket_offsets.assign(static_cast<size_t>(mat.bucket_count) + 1u, 0u);
            out.bucket_levels = subdivision;
        }

        void store_vec3(std::vector<float> &dst, size_t vertex, const glm::vec3 &v)
        {
            dst[vertex * 3u + 0] = v.x;
            dst[vertex * 3u + 1] = v.y;
            dst[vertex * 3u + 2] = v.z;
        }

        // Writes the two triangles of cell (x, y) starting at index slot `at`.
        void write_cell(std::vector<uint16_t> &indices, size_t at, uint32_t x, uint32_t y, uint32_t width,
                        bool y_axis_down)
        {
            const auto v00 = static_cast<uint16_t>((y - 1u) * width + (x - 1u));
            const auto v10 = static_cast<uint16_t>((y - 1u) * width + x);
            const auto v01 = static_cast<uint16_t>(y * width + (x - 1u));
            const auto v11 = static_cast<uint16_t>(y * width + x);

            if (y_axis_down)
            {
                indices[at + 0] = v01;
                indices[at + 1] = v10;
                indices[at + 2] = v00;
                indices[at + 3] = v01;
                indices[at + 4] = v11;
                indices[at + 5] = v10;
            }
            else
            {
                indices[at + 0] = v00;
                indices[at + 1] = v10;
                indices[at + 2] = v01;
                indices[at + 3] = v10;
                indices[at + 4] = v11;
                indices[at + 5] = v01;
            }
        }
    } // namespace

    PatchGenerator::PatchGenerator(const geo::TilingScheme &tiling,
                                   const geo::Projection &sphere,
                                   const geo::Projection &mercator)
        : _tiling(&tiling)
        , _sphere(&sphere)
        , _mercator(&mercator)
        , _y_axis_down(tiling.is_y_axis_down())
        , _uv_web_mercator(&tiling.projection() != &geo::web_mercator_projection())
    {
    }

    PatchGenerator::PatchCenter PatchGenerator::patch_center(const geo::GeoBox &box,
                                                             uint32_t level,
                                                             bool centered) const
    {
        // A level-0 tile is the whole world and stays at the origin.
        if (!centered || level == 0)
        {
            return {};
        }

        const geo::GeoCoordinates center = box.center();
        return PatchCenter{_sphere->project_point(center), _mercator->project_point(center)};
    }

    bool PatchGenerator::validate(uint32_t subdivision, const geo::TileKey &key) const
    {
        if (subdivision > kMaxPatchSubdivision)
        {
            Logger::error("Patch subdivision {} exceeds the 16-bit index limit (max {})",
                          subdivision, kMaxPatchSubdivision);
            return false;
        }
        if (key.level > kMaxTileLevel)
        {
            Logger::error("Tile {} is deeper than the supported level {}", key.to_string(), kMaxTileLevel);
            return false;
        }
        return true;
    }

    bool PatchGenerator::generate_patch_with_buckets(GeometryMode &out,
                                                     uint32_t subdivision,
                                                     const geo::TileKey &key,
                                                     bool centered,
                                                     double normal_offset) const
    {
        if (!validate(subdivision, key))
        {
            return false;
        }

        const uint32_t sub_level = 1u << subdivision;
        const uint32_t width = sub_level + 1u;
        const uint32_t height = width;
        const uint32_t vertex_count = width * height;
        const uint32_t triangle_count = (width - 1u) * (height - 1u) * 2u;

        GeometrySource &src = reset_mode(out, vertex_count, triangle_count);
        init_buckets(out, subdivision);
        GeometryMaterial &mat = out.materials.front();

        const geo::GeoBox box = _tiling->geo_box(key);
        const geo::WebMercatorYConverter to_web_mercator_y(box.south_west.latitude_radians(),
                                                          box.north_east.latitude_radians());
        const PatchCenter center = patch_center(box, key.level, centered);
        const uint32_t detail_level = key.level + subdivision;

        size_t vertex = 0;
        for (uint32_t y = 0; y < height; ++y)
        {
            for (uint32_t x = 0; x < width; ++x, ++vertex)
            {
                const double u = static_cast<double>(x) / static_cast<double>(width - 1u);
                const double t = static_cast<double>(y) / static_cast<double>(height - 1u);
                const double v = _y_axis_down ? 1.0 - t : t;

                const geo::GeoCoordinates geo_pos = _tiling->tile_key_geo_origin(
                        geo::TileKey::from_row_column_level(key.row * sub_level + y,
                                                            key.column * sub_level + x,
                                                            detail_level));

                WorldVec3 world = _sphere->project_point(geo_pos);
                const WorldVec3 mercator = _mercator->project_point(geo_pos);

                if (normal_offset != 0.0)
                {
                    world += _sphere->surface_normal(world) * normal_offset;
                }

                store_vec3(src.positions, vertex, world_to_local(world, center.sphere));
                store_vec3(src.mercator_positions, vertex, world_to_local(mercator, center.mercator));

                src.uvs[vertex * 2u + 0] = static_cast<float>(u);
                src.uvs[vertex * 2u + 1] = static_cast<float>(v);

                if (_uv_web_mercator)
                {
                    const double wmy = to_web_mercator_y.convert(geo_pos.latitude_radians());
                    src.web_mercator_y[vertex] = static_cast<float>(_y_axis_down ? wmy : 1.0 - wmy);
                }
                else
                {
                    src.web_mercator_y[vertex] = static_cast<float>(v);
                }

                if (x > 0 && y > 0)
                {
                    const size_t at = static_cast<size_t>(bucket_index(x, y, width, height, false)) * 6u;
                    write_cell(mat.indices, at, x, y, width, _y_axis_down);
                }
            }
        }

        for (uint32_t i = 0; i < mat.bucket_count; ++i)
        {
            mat.bucket_offsets[i + 1u] = static_cast<uint16_t>(mat.bucket_offsets[i] + 2u);
        }

        Logger::debug("Generated bucketed patch {} (subdivision {}): {} vertices, {} triangles",
                      key.to_string(), subdivision, vertex_count, triangle_count);
        return true;
    }

    bool PatchGenerator::generate_patch_with_buckets_and_skirt(GeometryMode &out,
                                                               uint32_t subdivision,
                                                               const geo::TileKey &key,
                                                               bool centered) const
    {
        if (!validate(subdivision, key))
        {
            return false;
        }

        const uint32_t sub_level = 1u << subdivision;
        const uint32_t width = sub_level + 3u;
        const uint32_t height = width;
        const uint32_t vertex_count = width * height;
        const uint32_t triangle_count = (width - 1u) * (height - 1u) * 2u;

        GeometrySource &src = reset_mode(out, vertex_count, triangle_count);
        init_buckets(out, subdivision);
        GeometryMaterial &mat = out.materials.front();

        src.skirt_flags.assign(vertex_count, 0u);
        src.skirt_surface_positions.assign(static_cast<size_t>(vertex_count) * 3u, 0.0f);
        out.skirt_offset = patch_skirt_offset(key.level);

        // Counting pass: each bucket's end offset, in triangles.
        {
            std::vector<uint32_t> counts(mat.bucket_count, 0u);
            for (uint32_t y = 1; y < height; ++y)
            {
                for (uint32_t x = 1; x < width; ++x)
                {
                    counts[bucket_index(x, y, width, height, true)] += 2u;
                }
            }

            uint32_t running = 0;
            for (uint32_t i = 0; i < mat.bucket_count; ++i)
            {
                running += counts[i];
                mat.bucket_offsets[i] = static_cast<uint16_t>(running);
            }
            mat.bucket_offsets[mat.bucket_count] = static_cast<uint16_t>(running);
        }

        const geo::GeoBox box = _tiling->geo_box(key);
        const geo::WebMercatorYConverter to_web_mercator_y(box.south_west.latitude_radians(),
                                                          box.north_east.latitude_radians());
        const PatchCenter center = patch_center(box, key.level, centered);
        const uint32_t detail_level = key.level + subdivision;
        const int64_t first_column = static_cast<int64_t>(key.column) * sub_level;
        const int64_t first_row = static_cast<int64_t>(key.row) * sub_level;

        size_t vertex = 0;
        for (uint32_t y = 0; y < height; ++y)
        {
            for (uint32_t x = 0; x < width; ++x, ++vertex)
            {
                double z = 0.0;
                double u = (static_cast<double>(x) - 1.0) / static_cast<double>(width - 3u);
                double v = (static_cast<double>(y) - 1.0) / static_cast<double>(height - 3u);

                int64_t tile_column = first_column + static_cast<int64_t>(x) - 1;
                int64_t tile_row = first_row + static_cast<int64_t>(y) - 1;

                // The skirt ring reuses the footprint of the adjacent edge vertex.
                if (u < 0.0)
                {
                    u = 0.0;
                    tile_column = first_column;
                    z = out.skirt_offset;
                }
                else if (u > 1.0)
                {
                    u = 1.0;
                    tile_column = first_column + static_cast<int64_t>(x) - 2;
                    z = out.skirt_offset;
                }

                if (v < 0.0)
                {
                    v = 0.0;
                    tile_row = first_row;
                    z = out.skirt_offset;
                }
                else if (v > 1.0)
                {
                    v = 1.0;
                    tile_row = first_row + static_cast<int64_t>(y) - 2;
                    z = out.skirt_offset;
                }

                geo::GeoCoordinates geo_pos = _tiling->tile_key_geo_origin(
                        geo::TileKey::from_row_column_level(static_cast<uint32_t>(tile_row),
                                                            static_cast<uint32_t>(tile_column),
                                                            detail_level));
                geo_pos.altitude = -z * _sphere->unit_scale();

                const WorldVec3 world = _sphere->project_point(geo_pos);
                const WorldVec3 mercator = _mercator->project_point(geo_pos);

                store_vec3(src.positions, vertex, world_to_local(world, center.sphere));
                store_vec3(src.mercator_positions, vertex, world_to_local(mercator, center.mercator));

                if (_uv_web_mercator)
                {
                    const double wmy = to_web_mercator_y.convert(geo_pos.latitude_radians());
                    src.web_mercator_y[vertex] = static_cast<float>(_y_axis_down ? wmy : 1.0 - wmy);
                }
                else
                {
                    src.web_mercator_y[vertex] = static_cast<float>(_y_axis_down ? 1.0 - v : v);
                }

                if (z != 0.0)
                {
                    geo_pos.altitude = 0.0;
                    src.skirt_flags[vertex] = 1u;
                    store_vec3(src.skirt_surface_positions, vertex,
                               world_to_local(_sphere->project_point(geo_pos), center.sphere));
                }

                src.uvs[vertex * 2u + 0] = static_cast<float>(u);
                src.uvs[vertex * 2u + 1] = static_cast<float>(_y_axis_down ? 1.0 - v : v);

                if (x > 0 && y > 0)
                {
                    const uint32_t bucket = bucket_index(x, y, width, height, true);
                    mat.bucket_offsets[bucket] = static_cast<uint16_t>(mat.bucket_offsets[bucket] - 2u);
                    const size_t at = static_cast<size_t>(mat.bucket_offsets[bucket]) * 3u;
                    write_cell(mat.indices, at, x, y, width, _y_axis_down);
                }
            }
        }

        Logger::debug("Generated skirted patch {} (subdivision {}): {} vertices, {} triangles, skirt {}",
                      key.to_string(), subdivision, vertex_count, triangle_count, out.skirt_offset);
        return true;
    }

    bool PatchGenerator::generate_simple_patch_with_skirt(GeometryMode &out,
                                                          uint32_t segments_x,
                                                          uint32_t segments_y) const
    {
        const uint64_t width64 = static_cast<uint64_t>(segments_x) + 2u;
        const uint64_t height64 = static_cast<uint64_t>(segments_y) + 2u;
        if (segments_x < 2 || segments_y < 2 ||
            width64 * height64 > static_cast<uint64_t>(std::numeric_limits<uint16_t>::max()) + 1u)
        {
            Logger::error("Simple patch {}x{} is outside the 16-bit index range", segments_x, segments_y);
            return false;
        }

        const auto width = static_cast<uint32_t>(width64);
        const auto height = static_cast<uint32_t>(height64);
        const uint32_t vertex_count = width * height;
        const uint32_t triangle_count = (width - 1u) * (height - 1u) * 2u - 8u;

        GeometrySource &src = reset_mode(out, vertex_count, triangle_count);
        GeometryMaterial &mat = out.materials.front();
        src.skirt_flags.assign(vertex_count, 0u);
        src.skirt_surface_positions.assign(static_cast<size_t>(vertex_count) * 3u, 0.0f);
        out.is_simple_patch = true;
        out.skirt_offset = kSimplePatchSkirtValue;

        size_t vertex = 0;
        size_t index = 0;
        for (uint32_t y = 0; y < height; ++y)
        {
            for (uint32_t x = 0; x < width; ++x, ++vertex)
            {
                float z = 0.0f;
                double u = (static_cast<double>(x) - 1.0) / static_cast<double>(width - 3u);
                double v = (static_cast<double>(y) - 1.0) / static_cast<double>(height - 3u);

                if (u < 0.0)
                {
                    u = 0.0;
                    z = kSimplePatchSkirtValue;
                }
                else if (u > 1.0)
                {
                    u = 1.0;
                    z = kSimplePatchSkirtValue;
                }

                if (v < 0.0)
                {
                    v = 0.0;
                    z = kSimplePatchSkirtValue;
                }
                else if (v > 1.0)
                {
                    v = 1.0;
                    z = kSimplePatchSkirtValue;
                }

                // Planar, so the sphere and Mercator streams are identical.
                const glm::vec3 p(static_cast<float>(u), static_cast<float>(v), z);
                store_vec3(src.positions, vertex, p);
                store_vec3(src.mercator_positions, vertex, p);

                src.uvs[vertex * 2u + 0] = static_cast<float>(u);
                src.uvs[vertex * 2u + 1] = static_cast<float>(v);
                src.web_mercator_y[vertex] = static_cast<float>(_y_axis_down ? v : 1.0 - v);

                if (z != 0.0f)
                {
                    src.skirt_flags[vertex] = 1u;
                    store_vec3(src.skirt_surface_positions, vertex, glm::vec3(p.x, p.y, 0.0f));
                }

                const bool corner_cell = ((x - 1u) % (width - 2u) == 0u) && ((y - 1u) % (height - 2u) == 0u);
                if (x > 0 && y > 0 && !corner_cell)
                {
                    mat.indices[index + 0] = static_cast<uint16_t>((y - 1u) * width + (x - 1u));
                    mat.indices[index + 1] = static_cast<uint16_t>((y - 1u) * width + x);
                    mat.indices[index + 2] = static_cast<uint16_t>(y * width + (x - 1u));
                    mat.indices[index + 3] = static_cast<uint16_t>((y - 1u) * width + x);
                    mat.indices[index + 4] = static_cast<uint16_t>(y * width + x);
                    mat.indices[index + 5] = static_cast<uint16_t>(y * width + (x - 1u));
                    index += 6;
                }
            }
        }

        Logger::debug("Generated simple patch {}x{}: {} vertices, {} triangles",
                      segments_x, segments_y, vertex_count, triangle_count);
        return true;
    }
} // namespace tile
