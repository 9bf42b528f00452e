#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tile
{
    // Vertex streams of one patch shape. Float layouts match the renderer's
    // attributes: position/mercatorPosition/normal xyz, uv, scalar webMercatorY.
    struct GeometrySource
    {
        uint32_t vertex_count = 0;

        std::vector<float> positions;           // sphere, relative to the tile center
        std::vector<float> uvs;
        std::vector<float> web_mercator_y;
        std::vector<float> mercator_positions;  // Mercator plane, relative to the tile center
        std::vector<float> normals;             // empty for simple patches

        // Skirt vertices keep their unshifted surface position here (xyz per vertex,
        // zero for non-skirt vertices) so normals ignore the skirt drop.
        std::vector<uint8_t> skirt_flags;
        std::vector<float> skirt_surface_positions;
    };

    // Triangle list of one patch shape. Offsets are in triangles, one entry per
    // bucket plus a terminating total; bucket b owns [offsets[b], offsets[b + 1]).
    struct GeometryMaterial
    {
        uint32_t source_index = 0;
        uint32_t triangle_count = 0;

        std::vector<uint16_t> indices;

        uint32_t bucket_levels = 0;
        uint32_t bucket_count = 0;
        std::vector<uint16_t> bucket_offsets;

        bool has_buckets() const { return bucket_count > 0; }
    };

    // One cached patch shape, shared by every tile with the same cache key.
    struct GeometryMode
    {
        std::vector<GeometrySource> sources;
        std::vector<GeometryMaterial> materials;

        bool is_simple_patch = false;
        uint32_t bucket_levels = 0;
        double skirt_offset = 0.0;

        const GeometrySource &source() const { return sources.front(); }
        const GeometryMaterial &material() const { return materials.front(); }

        size_t byte_size() const;
    };
} // namespace tile
