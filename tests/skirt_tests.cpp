#include "tile/skirt.h"

#include <core/config.h>
#include <geo/projection.h>
#include <geo/subdivision_scheme.h>

#include <gtest/gtest.h>

#include <glm/gtc/constants.hpp>

TEST(Skirt, SubdivisionShrinksWithLevelDownToFloor)
{
    EXPECT_EQ(tile::subdivision_for_level(0), 7u);
    EXPECT_EQ(tile::subdivision_for_level(1), 6u);
    EXPECT_EQ(tile::subdivision_for_level(2), 5u);
    EXPECT_EQ(tile::subdivision_for_level(3), 4u);
    EXPECT_EQ(tile::subdivision_for_level(4), 4u);
    EXPECT_EQ(tile::subdivision_for_level(20), 4u);
}

TEST(Skirt, GridWidthIsPowerOfTwoPlusOne)
{
    EXPECT_EQ(tile::patch_grid_width(4), 17u);
    EXPECT_EQ(tile::patch_grid_width(7), 129u);
}

TEST(Skirt, LevelZeroErrorMatchesQuarterCircumference)
{
    const double error = tile::level_zero_geometric_error(geo::sphere_projection(), 17, 2);
    EXPECT_NEAR(error, kEquatorialRadius * 2.0 * glm::pi<double>() * 0.25 / 34.0, 1e-6);
}

TEST(Skirt, HeightIsCappedAndNonIncreasing)
{
    const geo::QuadTreeSubdivisionScheme &scheme = geo::quad_tree_subdivision_scheme();

    double previous = tile::skirt_height(geo::sphere_projection(), scheme, 0);
    EXPECT_DOUBLE_EQ(previous, kMaxSkirtHeight);

    for (uint32_t level = 1; level <= kMaxTileLevel; ++level)
    {
        const double h = tile::skirt_height(geo::sphere_projection(), scheme, level);
        EXPECT_LE(h, previous) << "level " << level;
        EXPECT_LE(h, kMaxSkirtHeight);
        EXPECT_GT(h, 0.0);
        previous = h;
    }
}

TEST(Skirt, HeightBelowCapFollowsErrorFormula)
{
    const geo::QuadTreeSubdivisionScheme &scheme = geo::quad_tree_subdivision_scheme();
    const double error0 = kEquatorialRadius * 2.0 * glm::pi<double>() * 0.25 / (17.0 * 2.0);

    EXPECT_NEAR(tile::skirt_height(geo::sphere_projection(), scheme, 12), error0 / 4096.0 * 4.0, 1e-6);
    EXPECT_NEAR(tile::skirt_height(geo::sphere_projection(), scheme, 16), error0 / 65536.0 * 4.0, 1e-6);
}

TEST(Skirt, PatchOffsetHalvesPerLevel)
{
    EXPECT_DOUBLE_EQ(tile::patch_skirt_offset(0), 0.2);
    EXPECT_DOUBLE_EQ(tile::patch_skirt_offset(1), 0.1);
    EXPECT_DOUBLE_EQ(tile::patch_skirt_offset(10), 0.2 / 1024.0);
}
