#include "bucket_index.h"

#include <core/util/logger.h>

#include <algorithm>

namespace tile
{
    uint32_t interleave_bits(uint32_t v)
    {
        v = (v & 0x000000FFu) + ((v & 0x0000FF00u) << 8);
        v = (v & 0x0F0F0F0Fu) + ((v & 0xF0F0F0F0u) << 4);
        v = (v & 0x33333333u) + ((v & 0xCCCCCCCCu) << 2);
        v = (v & 0x55555555u) + ((v & 0xAAAAAAAAu) << 1);
        return v;
    }

    uint32_t bucket_index(uint32_t x, uint32_t y, uint32_t width, uint32_t height, bool has_skirt)
    {
        int64_t bx = 0;
        int64_t by = 0;
        if (has_skirt)
        {
            bx = std::clamp<int64_t>(static_cast<int64_t>(x) - 2, 0, static_cast<int64_t>(width) - 4);
            by = std::clamp<int64_t>(static_cast<int64_t>(height) - 2 - static_cast<int64_t>(y),
                                     0, static_cast<int64_t>(height) - 4);
        }
        else
        {
            bx = static_cast<int64_t>(x) - 1;
            by = static_cast<int64_t>(height) - 1 - static_cast<int64_t>(y);
        }

        return (interleave_bits(static_cast<uint32_t>(bx)) << 1) + interleave_bits(static_cast<uint32_t>(by));
    }

    TriangleRange bucket_triangle_range(const GeometryMaterial &material, uint32_t bucket)
    {
        if (!material.has_buckets() || bucket >= material.bucket_count ||
            material.bucket_offsets.size() < static_cast<size_t>(material.bucket_count) + 1u)
        {
            return {};
        }

        const uint32_t first = material.bucket_offsets[bucket];
        const uint32_t last = material.bucket_offsets[bucket + 1u];
        return TriangleRange{first, (last > first) ? (last - first) : 0u};
    }

    bool overwrite_bucket(std::span<uint16_t> indices,
                          std::span<const uint16_t> bucket_offsets,
                          uint32_t bucket,
                          std::span<const uint16_t> triangles)
    {
        if (static_cast<size_t>(bucket) + 1u >= bucket_offsets.size())
        {
            Logger::error("Bucket {} out of range ({} buckets)", bucket,
                          bucket_offsets.empty() ? 0u : bucket_offsets.size() - 1u);
            return false;
        }

        const size_t first = static_cast<size_t>(bucket_offsets[bucket]) * 3u;
        const size_t last = static_cast<size_t>(bucket_offsets[bucket + 1u]) * 3u;
        if (last < first || last > indices.size() || triangles.size() != last - first)
        {
            Logger::error("Bucket {} expects {} indices, got {}", bucket,
                          (last >= first) ? last - first : 0u, triangles.size());
            return false;
        }

        std::copy(triangles.begin(), triangles.end(), indices.begin() + static_cast<std::ptrdiff_t>(first));
        return true;
    }
} // namespace tile
