#pragma once

#include "tile_geometry_builder.h"

#include <core/util/logger.h>
#include <geo/tiling_scheme.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tile
{
    enum class TilingSchemeKind : uint8_t
    {
        WebMercator = 0,
        Geographic = 1,
    };

    struct TileBuilderConfig
    {
        TilingSchemeKind tiling_scheme = TilingSchemeKind::WebMercator;
        double sphere_radius_m = kEquatorialRadius;
        uint32_t min_detail_level = kDefaultMinDetailLevel;
        uint32_t max_detail_level = kDefaultMaxDetailLevel;
        LogLevel log_level = LogLevel::Info;

        TileGeometryBuilder::Settings builder_settings() const
        {
            return TileGeometryBuilder::Settings{min_detail_level, max_detail_level};
        }
    };

    const geo::TilingScheme &tiling_scheme_for(TilingSchemeKind kind);
    const char *tiling_scheme_name(TilingSchemeKind kind);

    // Parse a TileBuilderConfig from JSON text. Missing fields keep their defaults.
    // Returns std::nullopt on parse, type or range errors (errors logged via Logger).
    std::optional<TileBuilderConfig> parse_tile_builder_config(std::string_view json_text,
                                                               std::string_view source_name = "<memory>");

    // Load a TileBuilderConfig from a JSON file.
    std::optional<TileBuilderConfig> load_tile_builder_config(const std::string &json_path);

    std::string serialize_tile_builder_config(const TileBuilderConfig &config);

    // Returns false on IO failure (errors logged via Logger).
    bool save_tile_builder_config(const std::string &json_path, const TileBuilderConfig &config);
} // namespace tile
