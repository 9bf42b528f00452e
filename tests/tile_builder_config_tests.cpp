#include "tile/tile_builder_config.h"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace
{
    using json = nlohmann::json;

    std::filesystem::path make_temp_dir()
    {
        static std::atomic<uint64_t> counter{0};
        const auto tick = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        const uint64_t seq = counter.fetch_add(1, std::memory_order_relaxed);
        std::filesystem::path dir = std::filesystem::temp_directory_path() /
                                    ("terramorph_config_" + std::to_string(tick) + "_" + std::to_string(seq));
        std::filesystem::create_directories(dir);
        return dir;
    }

    struct TempDir
    {
        std::filesystem::path path = make_temp_dir();
        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    };

    json make_valid_config()
    {
        return json{
                {"schema_version", 1},
                {"tiling_scheme", "geographic"},
                {"sphere_radius_m", 6371000.0},
                {"min_detail_level", 3},
                {"max_detail_level", 10},
                {"log_level", "debug"},
        };
    }

    std::optional<tile::TileBuilderConfig> parse(const json &j)
    {
        return tile::parse_tile_builder_config(j.dump(), "test");
    }

    void write_text(const std::filesystem::path &path, const std::string &text)
    {
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        out << text;
    }
} // namespace

TEST(TileBuilderConfig, ParsesValidDocument)
{
    const auto cfg = parse(make_valid_config());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->tiling_scheme, tile::TilingSchemeKind::Geographic);
    EXPECT_DOUBLE_EQ(cfg->sphere_radius_m, 6371000.0);
    EXPECT_EQ(cfg->min_detail_level, 3u);
    EXPECT_EQ(cfg->max_detail_level, 10u);
    EXPECT_EQ(cfg->log_level, LogLevel::Debug);

    const tile::TileGeometryBuilder::Settings settings = cfg->builder_settings();
    EXPECT_EQ(settings.min_detail_level, 3u);
    EXPECT_EQ(settings.max_detail_level, 10u);
}

TEST(TileBuilderConfig, EmptyObjectUsesDefaults)
{
    const auto cfg = tile::parse_tile_builder_config("{}");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->tiling_scheme, tile::TilingSchemeKind::WebMercator);
    EXPECT_DOUBLE_EQ(cfg->sphere_radius_m, kEquatorialRadius);
    EXPECT_EQ(cfg->min_detail_level, kDefaultMinDetailLevel);
    EXPECT_EQ(cfg->max_detail_level, kDefaultMaxDetailLevel);
    EXPECT_EQ(cfg->log_level, LogLevel::Info);
}

TEST(TileBuilderConfig, RejectsUnsupportedSchemaVersion)
{
    json j = make_valid_config();
    j["schema_version"] = 2;
    EXPECT_FALSE(parse(j).has_value());
}

TEST(TileBuilderConfig, RejectsInvalidEnumValues)
{
    json scheme = make_valid_config();
    scheme["tiling_scheme"] = "polar";
    EXPECT_FALSE(parse(scheme).has_value());

    json level = make_valid_config();
    level["log_level"] = "verbose";
    EXPECT_FALSE(parse(level).has_value());
}

TEST(TileBuilderConfig, RejectsTypeMismatch)
{
    json j = make_valid_config();
    j["sphere_radius_m"] = "large";
    EXPECT_FALSE(parse(j).has_value());
}

TEST(TileBuilderConfig, RejectsNonPositiveRadius)
{
    json zero = make_valid_config();
    zero["sphere_radius_m"] = 0.0;
    EXPECT_FALSE(parse(zero).has_value());

    json negative = make_valid_config();
    negative["sphere_radius_m"] = -1.0;
    EXPECT_FALSE(parse(negative).has_value());
}

TEST(TileBuilderConfig, RejectsInvalidLevelRanges)
{
    json inverted = make_valid_config();
    inverted["min_detail_level"] = 9;
    inverted["max_detail_level"] = 5;
    EXPECT_FALSE(parse(inverted).has_value());

    json too_deep = make_valid_config();
    too_deep["max_detail_level"] = 25;
    EXPECT_FALSE(parse(too_deep).has_value());

    json negative = make_valid_config();
    negative["min_detail_level"] = -1;
    EXPECT_FALSE(parse(negative).has_value());
}

TEST(TileBuilderConfig, RejectsFractionalAndHugeLevels)
{
    json fractional = make_valid_config();
    fractional["max_detail_level"] = 7.9;
    EXPECT_FALSE(parse(fractional).has_value());

    json huge = make_valid_config();
    huge["min_detail_level"] = 1e30;
    EXPECT_FALSE(parse(huge).has_value());

    json schema = make_valid_config();
    schema["schema_version"] = 1.5;
    EXPECT_FALSE(parse(schema).has_value());
}

TEST(TileBuilderConfig, RejectsMalformedJson)
{
    EXPECT_FALSE(tile::parse_tile_builder_config("{\"tiling_scheme\": ").has_value());
    EXPECT_FALSE(tile::parse_tile_builder_config("[1, 2, 3]").has_value());
}

TEST(TileBuilderConfig, LoadRejectsMissingFile)
{
    TempDir tmp;
    EXPECT_FALSE(tile::load_tile_builder_config((tmp.path / "missing.json").string()).has_value());
}

TEST(TileBuilderConfig, LoadsFromFile)
{
    TempDir tmp;
    const std::filesystem::path path = tmp.path / "tiles.json";
    write_text(path, make_valid_config().dump(2));

    const auto cfg = tile::load_tile_builder_config(path.string());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->max_detail_level, 10u);
}

TEST(TileBuilderConfig, SaveRejectsEmptyPath)
{
    EXPECT_FALSE(tile::save_tile_builder_config("", tile::TileBuilderConfig{}));
}

TEST(TileBuilderConfig, SaveCreatesParentDirectoriesAndRoundTrips)
{
    TempDir tmp;
    const auto loaded = parse(make_valid_config());
    ASSERT_TRUE(loaded.has_value());

    const std::filesystem::path output_path = tmp.path / "nested" / "dir" / "tiles.json";
    ASSERT_TRUE(tile::save_tile_builder_config(output_path.string(), *loaded));
    ASSERT_TRUE(std::filesystem::exists(output_path));

    const auto reloaded = tile::load_tile_builder_config(output_path.string());
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->tiling_scheme, loaded->tiling_scheme);
    EXPECT_DOUBLE_EQ(reloaded->sphere_radius_m, loaded->sphere_radius_m);
    EXPECT_EQ(reloaded->min_detail_level, loaded->min_detail_level);
    EXPECT_EQ(reloaded->max_detail_level, loaded->max_detail_level);
    EXPECT_EQ(reloaded->log_level, loaded->log_level);
}

TEST(TileBuilderConfig, SerializeIncludesExpectedTopLevelFields)
{
    const json j = json::parse(tile::serialize_tile_builder_config(tile::TileBuilderConfig{}));
    EXPECT_EQ(j.at("schema_version").get<int>(), 1);
    EXPECT_EQ(j.at("tiling_scheme").get<std::string>(), "web_mercator");
    EXPECT_DOUBLE_EQ(j.at("sphere_radius_m").get<double>(), kEquatorialRadius);
    EXPECT_EQ(j.at("min_detail_level").get<uint32_t>(), kDefaultMinDetailLevel);
    EXPECT_EQ(j.at("max_detail_level").get<uint32_t>(), kDefaultMaxDetailLevel);
    EXPECT_EQ(j.at("log_level").get<std::string>(), "info");
}

TEST(TileBuilderConfig, TilingKindsResolveToSharedSchemes)
{
    EXPECT_EQ(&tile::tiling_scheme_for(tile::TilingSchemeKind::WebMercator), &geo::web_mercator_tiling_scheme());
    EXPECT_EQ(&tile::tiling_scheme_for(tile::TilingSchemeKind::Geographic), &geo::geographic_standard_tiling());
}
