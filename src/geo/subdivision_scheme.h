#pragma once

#include <cstdint>

namespace geo
{
    // How a tile splits from one level to the next.
    class SubdivisionScheme
    {
    public:
        virtual ~SubdivisionScheme() = default;

        virtual uint32_t subdivision_x(uint32_t level) const = 0;
        virtual uint32_t subdivision_y(uint32_t level) const = 0;
        virtual uint32_t level_dimension_x(uint32_t level) const = 0;
        virtual uint32_t level_dimension_y(uint32_t level) const = 0;
    };

    class QuadTreeSubdivisionScheme final : public SubdivisionScheme
    {
    public:
        uint32_t subdivision_x(uint32_t) const override { return 2; }
        uint32_t subdivision_y(uint32_t) const override { return 2; }
        uint32_t level_dimension_x(uint32_t level) const override { return 1u << level; }
        uint32_t level_dimension_y(uint32_t level) const override { return 1u << level; }
    };

    // One root tile covering the world, then two columns for every row.
    class HalfQuadTreeSubdivisionScheme final : public SubdivisionScheme
    {
    public:
        uint32_t subdivision_x(uint32_t) const override { return 2; }
        uint32_t subdivision_y(uint32_t level) const override { return level == 0 ? 1u : 2u; }
        uint32_t level_dimension_x(uint32_t level) const override { return 1u << level; }
        uint32_t level_dimension_y(uint32_t level) const override { return level == 0 ? 1u : (1u << (level - 1u)); }
    };

    const QuadTreeSubdivisionScheme &quad_tree_subdivision_scheme();
    const HalfQuadTreeSubdivisionScheme &half_quad_tree_subdivision_scheme();
} // namespace geo
