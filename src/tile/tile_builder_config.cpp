#include "tile_builder_config.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace tile
{
    using json = nlohmann::json;

    namespace
    {
        constexpr int kSchemaVersion = 1;

        template<typename T>
        T json_get(const json &j, const char *key, const T &fallback)
        {
            if (j.contains(key) && !j[key].is_null())
            {
                return j[key].get<T>();
            }
            return fallback;
        }

        std::optional<TilingSchemeKind> parse_tiling_scheme(const std::string &s)
        {
            if (s == "web_mercator") return TilingSchemeKind::WebMercator;
            if (s == "geographic") return TilingSchemeKind::Geographic;
            return std::nullopt;
        }

        // Integer fields must be JSON integers; floats are not truncated.
        bool json_get_integer(const json &j, const char *key, int64_t &inout, std::string_view source)
        {
            if (!j.contains(key) || j[key].is_null())
            {
                return true;
            }
            if (!j[key].is_number_integer())
            {
                Logger::error("Config '{}': {} must be an integer, got {}", source, key, j[key].dump());
                return false;
            }
            inout = j[key].get<int64_t>();
            return true;
        }

        bool read_level(const json &root, const char *key, uint32_t &inout, std::string_view source)
        {
            int64_t value = static_cast<int64_t>(inout);
            if (!json_get_integer(root, key, value, source))
            {
                return false;
            }
            if (value < 0 || value > static_cast<int64_t>(kMaxTileLevel))
            {
                Logger::error("Config '{}': {} = {} outside [0, {}]", source, key, value, kMaxTileLevel);
                return false;
            }
            inout = static_cast<uint32_t>(value);
            return true;
        }

        std::optional<TileBuilderConfig> parse_root(const json &root, std::string_view source)
        {
            if (!root.is_object())
            {
                Logger::error("Config '{}': top-level value must be an object", source);
                return std::nullopt;
            }

            int64_t schema = kSchemaVersion;
            if (!json_get_integer(root, "schema_version", schema, source))
            {
                return std::nullopt;
            }
            if (schema != kSchemaVersion)
            {
                Logger::error("Config '{}': unsupported schema_version {}", source, schema);
                return std::nullopt;
            }

            TileBuilderConfig cfg{};

            const std::string scheme = json_get<std::string>(root, "tiling_scheme", "web_mercator");
            const auto kind = parse_tiling_scheme(scheme);
            if (!kind)
            {
                Logger::error("Config '{}': unknown tiling_scheme '{}'", source, scheme);
                return std::nullopt;
            }
            cfg.tiling_scheme = *kind;

            cfg.sphere_radius_m = json_get<double>(root, "sphere_radius_m", cfg.sphere_radius_m);
            if (!std::isfinite(cfg.sphere_radius_m) || cfg.sphere_radius_m <= 0.0)
            {
                Logger::error("Config '{}': sphere_radius_m must be positive, got {}", source, cfg.sphere_radius_m);
                return std::nullopt;
            }

            if (!read_level(root, "min_detail_level", cfg.min_detail_level, source) ||
                !read_level(root, "max_detail_level", cfg.max_detail_level, source))
            {
                return std::nullopt;
            }
            if (cfg.min_detail_level > cfg.max_detail_level)
            {
                Logger::error("Config '{}': min_detail_level {} exceeds max_detail_level {}",
                              source, cfg.min_detail_level, cfg.max_detail_level);
                return std::nullopt;
            }

            const std::string level_name = json_get<std::string>(root, "log_level", log_level_name(cfg.log_level));
            const auto level = parse_log_level(level_name);
            if (!level)
            {
                Logger::error("Config '{}': unknown log_level '{}'", source, level_name);
                return std::nullopt;
            }
            cfg.log_level = *level;

            return cfg;
        }
    } // anonymous namespace

    const geo::TilingScheme &tiling_scheme_for(TilingSchemeKind kind)
    {
        switch (kind)
        {
            case TilingSchemeKind::WebMercator: return geo::web_mercator_tiling_scheme();
            case TilingSchemeKind::Geographic: return geo::geographic_standard_tiling();
        }
        return geo::web_mercator_tiling_scheme();
    }

    const char *tiling_scheme_name(TilingSchemeKind kind)
    {
        switch (kind)
        {
            case TilingSchemeKind::WebMercator: return "web_mercator";
            case TilingSchemeKind::Geographic: return "geographic";
        }
        return "web_mercator";
    }

    std::optional<TileBuilderConfig> parse_tile_builder_config(std::string_view json_text, std::string_view source_name)
    {
        try
        {
            const json root = json::parse(json_text.begin(), json_text.end());
            return parse_root(root, source_name);
        }
        catch (const json::parse_error &e)
        {
            Logger::error("JSON parse error in '{}': {}", source_name, e.what());
        }
        catch (const json::exception &e)
        {
            Logger::error("Invalid config '{}': {}", source_name, e.what());
        }
        return std::nullopt;
    }

    std::optional<TileBuilderConfig> load_tile_builder_config(const std::string &json_path)
    {
        std::ifstream file(json_path);
        if (!file.is_open())
        {
            Logger::error("Failed to open config file: {}", json_path);
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto cfg = parse_tile_builder_config(buffer.str(), json_path);
        if (cfg)
        {
            Logger::info("Loaded config '{}': {} tiling, radius {} m, detail levels {}..{}",
                         json_path, tiling_scheme_name(cfg->tiling_scheme), cfg->sphere_radius_m,
                         cfg->min_detail_level, cfg->max_detail_level);
        }
        return cfg;
    }

    std::string serialize_tile_builder_config(const TileBuilderConfig &config)
    {
        json root;
        root["schema_version"] = kSchemaVersion;
        root["tiling_scheme"] = tiling_scheme_name(config.tiling_scheme);
        root["sphere_radius_m"] = config.sphere_radius_m;
        root["min_detail_level"] = config.min_detail_level;
        root["max_detail_level"] = config.max_detail_level;
        root["log_level"] = log_level_name(config.log_level);
        return root.dump(2);
    }

    bool save_tile_builder_config(const std::string &json_path, const TileBuilderConfig &config)
    {
        if (json_path.empty())
        {
            Logger::error("Cannot save config: empty path");
            return false;
        }

        const std::filesystem::path path(json_path);
        if (path.has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec)
            {
                Logger::error("Failed to create '{}': {}", path.parent_path().string(), ec.message());
                return false;
            }
        }

        std::ofstream out(json_path, std::ios::out | std::ios::trunc);
        if (!out.is_open())
        {
            Logger::error("Failed to open '{}' for writing", json_path);
            return false;
        }

        out << serialize_tile_builder_config(config);
        if (!out.good())
        {
            Logger::error("Failed to write config '{}'", json_path);
            return false;
        }
        return true;
    }
} // namespace tile
