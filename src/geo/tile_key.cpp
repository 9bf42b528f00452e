#include "tile_key.h"

#include <fmt/core.h>

namespace geo
{
    namespace
    {
        uint64_t spread_bits_32(uint64_t v)
        {
            v &= 0xFFFFFFFFull;
            v = (v | (v << 16)) & 0x0000FFFF0000FFFFull;
            v = (v | (v << 8)) & 0x00FF00FF00FF00FFull;
            v = (v | (v << 4)) & 0x0F0F0F0F0F0F0F0Full;
            v = (v | (v << 2)) & 0x3333333333333333ull;
            v = (v | (v << 1)) & 0x5555555555555555ull;
            return v;
        }
    } // namespace

    TileKey TileKey::parent() const
    {
        if (level == 0)
        {
            return *this;
        }
        return TileKey{row >> 1, column >> 1, level - 1};
    }

    TileKey TileKey::child(uint32_t quadrant) const
    {
        return TileKey{(row << 1) + ((quadrant >> 1) & 1u),
                       (column << 1) + (quadrant & 1u),
                       level + 1};
    }

    uint64_t TileKey::morton_code() const
    {
        const uint64_t interleaved = (spread_bits_32(row) << 1) | spread_bits_32(column);
        return (level < 32u) ? ((1ull << (2u * level)) | interleaved) : interleaved;
    }

    std::string TileKey::to_string() const
    {
        return fmt::format("{}/{}/{}", level, row, column);
    }
} // namespace geo
