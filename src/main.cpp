// terramorph_tile_info: builds the patch geometry of one tile and reports it.
//
// Usage: terramorph_tile_info <level> <row> <column> [config.json]

#include <core/util/logger.h>
#include <geo/projection.h>
#include <tile/bucket_index.h>
#include <tile/tile_builder_config.h>
#include <tile/tile_geometry_builder.h>

#include <charconv>
#include <system_error>
#include <cstdint>
#include <string_view>

namespace
{
    bool parse_u32(std::string_view text, uint32_t &out)
    {
        const char *begin = text.data();
        const char *end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, out);
        return ec == std::errc() && ptr == end;
    }

    void report_blend(const tile::TileTransformation &transformation, double t)
    {
        const tile::TileTransformation::Blend blend = transformation.interpolate(t);
        Logger::info("  t={:.1f}: position ({:.3f}, {:.3f}, {:.3f}), rotation {}",
                     t, blend.position.x, blend.position.y, blend.position.z,
                     blend.rotation ? "yes" : "none");
    }

    int run(int argc, char *argv[])
    {
        if (argc < 4 || argc > 5)
        {
            Logger::error("Usage: {} <level> <row> <column> [config.json]", argv[0]);
            return 2;
        }

        uint32_t level = 0;
        uint32_t row = 0;
        uint32_t column = 0;
        if (!parse_u32(argv[1], level) || !parse_u32(argv[2], row) || !parse_u32(argv[3], column))
        {
            Logger::error("level, row and column must be unsigned integers");
            return 2;
        }

        tile::TileBuilderConfig config{};
        if (argc == 5)
        {
            auto loaded = tile::load_tile_builder_config(argv[4]);
            if (!loaded)
            {
                return 1;
            }
            config = *loaded;
        }
        Logger::set_level(config.log_level);

        const geo::SphereProjection sphere(config.sphere_radius_m);
        const geo::TilingScheme &tiling = tile::tiling_scheme_for(config.tiling_scheme);
        tile::TileGeometryBuilder builder(tiling, sphere, config.builder_settings());

        const geo::TileKey key = geo::TileKey::from_row_column_level(row, column, level);
        const std::optional<tile::TileGeometry> result = builder.get_tile_geometry_with_transform(key);
        if (!result)
        {
            Logger::error("No geometry for tile {}", key.to_string());
            return 1;
        }

        const tile::GeometryMode &mode = *result->geometry;
        const tile::GeometryMaterial &material = mode.material();
        const tile::TriangleRange first_bucket = tile::bucket_triangle_range(material, 0);

        Logger::info("Tile {} ({} tiling over {}, sphere radius {} m)", key.to_string(),
                     tile::tiling_scheme_name(config.tiling_scheme), tiling.projection().name(), sphere.unit_scale());
        Logger::info("  patch: {}", mode.is_simple_patch ? "simple" : (mode.skirt_offset > 0.0 ? "skirted" : "bucketed"));
        Logger::info("  vertices: {}, triangles: {}, bytes: {}",
                     mode.source().vertex_count, material.triangle_count, mode.byte_size());
        Logger::info("  buckets: {} (levels {}), bucket 0 holds {} triangles",
                     material.bucket_count, material.bucket_levels, first_bucket.count);
        Logger::info("  skirt height: {:.3f}", result->skirt_height);

        report_blend(result->transformation, 0.0);
        report_blend(result->transformation, 0.5);
        report_blend(result->transformation, 1.0);
        return 0;
    }
}

int main(int argc, char *argv[])
{
    Logger::init(LogOutput::Console, LogLevel::Info);
    const int rc = run(argc, argv);
    Logger::shutdown();
    return rc;
}
