#pragma once

#include "geometry_mode.h"

#include <cstdint>
#include <span>

namespace tile
{
    // Spreads the low 16 bits of v onto the even bit positions.
    uint32_t interleave_bits(uint32_t v);

    // Bucket of grid cell (x, y), where the cell spans vertices (x-1, y-1)..(x, y)
    // of a width x height vertex grid. With a skirt ring the outer cells clamp
    // onto the nearest interior bucket. Y is flipped so bucket rows run bottom-up.
    uint32_t bucket_index(uint32_t x, uint32_t y, uint32_t width, uint32_t height, bool has_skirt);

    struct TriangleRange
    {
        uint32_t first = 0;
        uint32_t count = 0;
    };

    // Triangles owned by a bucket; empty when the material has no buckets or the
    // bucket is out of range.
    TriangleRange bucket_triangle_range(const GeometryMaterial &material, uint32_t bucket);

    // Replaces the triangles of one bucket in a caller-owned copy of the index
    // buffer. triangles must hold exactly the bucket's triangle count * 3 indices.
    bool overwrite_bucket(std::span<uint16_t> indices,
                          std::span<const uint16_t> bucket_offsets,
                          uint32_t bucket,
                          std::span<const uint16_t> triangles);
} // namespace tile
