#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace geo
{
    // Address of a quad in a tiling scheme. Row 0 is the first row of the
    // projection's world box (north for web Mercator, south for geographic).
    struct TileKey
    {
        uint32_t row = 0;
        uint32_t column = 0;
        uint32_t level = 0;

        static TileKey from_row_column_level(uint32_t row, uint32_t column, uint32_t level)
        {
            return TileKey{row, column, level};
        }

        // Quadtree parent; level 0 returns itself.
        TileKey parent() const;
        // Quadtree child, quadrant bits: 1 = column + 1, 2 = row + 1.
        TileKey child(uint32_t quadrant) const;
        // Bit-interleaved (row, column) prefixed by a level marker bit.
        uint64_t morton_code() const;

        std::string to_string() const;

        friend bool operator==(const TileKey &, const TileKey &) = default;
    };

    struct TileKeyHash
    {
        size_t operator()(const TileKey &k) const noexcept
        {
            const uint64_t l = static_cast<uint64_t>(k.level) & 0x3Full;
            const uint64_t r = static_cast<uint64_t>(k.row) & 0x1FFFFFFFull;
            const uint64_t c = static_cast<uint64_t>(k.column) & 0x1FFFFFFFull;

            // [level:6 | row:29 | column:29]
            const uint64_t packed = (l << 58) | (r << 29) | c;
            return std::hash<uint64_t>{}(packed);
        }
    };
} // namespace geo
