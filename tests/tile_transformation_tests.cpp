#include "tile/tile_transformation.h"

#include <gtest/gtest.h>

namespace
{
    glm::dmat4 filled(double base)
    {
        glm::dmat4 m(0.0);
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                m[c][r] = base + c * 4 + r;
            }
        }
        return m;
    }

    tile::TileTransformation make(std::optional<glm::dmat4> sphere_rotation,
                                  std::optional<glm::dmat4> mercator_rotation)
    {
        return tile::TileTransformation(WorldVec3(100.0, -50.0, 25.0), sphere_rotation,
                                        WorldVec3(-20.0, 10.0, 0.0), mercator_rotation);
    }
} // namespace

TEST(TileTransformation, EndpointsReproduceInputsExactly)
{
    const tile::TileTransformation tr = make(filled(1.0), filled(100.0));

    const auto at0 = tr.interpolate(0.0);
    EXPECT_EQ(at0.position, tr.sphere_position());
    ASSERT_TRUE(at0.rotation.has_value());
    EXPECT_EQ(*at0.rotation, filled(1.0));

    const auto at1 = tr.interpolate(1.0);
    EXPECT_EQ(at1.position, tr.mercator_position());
    ASSERT_TRUE(at1.rotation.has_value());
    EXPECT_EQ(*at1.rotation, filled(100.0));
}

TEST(TileTransformation, FactorIsClamped)
{
    const tile::TileTransformation tr = make(std::nullopt, std::nullopt);
    EXPECT_EQ(tr.interpolate(-3.0).position, tr.interpolate(0.0).position);
    EXPECT_EQ(tr.interpolate(7.5).position, tr.interpolate(1.0).position);
}

TEST(TileTransformation, PositionsAndRotationsBlendLinearly)
{
    const tile::TileTransformation tr = make(filled(0.0), filled(8.0));
    const auto blend = tr.interpolate(0.25);

    EXPECT_DOUBLE_EQ(blend.position.x, 100.0 * 0.75 + -20.0 * 0.25);
    EXPECT_DOUBLE_EQ(blend.position.y, -50.0 * 0.75 + 10.0 * 0.25);
    EXPECT_DOUBLE_EQ(blend.position.z, 25.0 * 0.75);

    ASSERT_TRUE(blend.rotation.has_value());
    for (int c = 0; c < 4; ++c)
    {
        for (int r = 0; r < 4; ++r)
        {
            EXPECT_DOUBLE_EQ((*blend.rotation)[c][r], c * 4 + r + 2.0);
        }
    }
}

TEST(TileTransformation, SphereOnlyRotationHoldsBeforeMidpoint)
{
    const tile::TileTransformation tr = make(filled(1.0), std::nullopt);

    ASSERT_TRUE(tr.interpolate(0.0).rotation.has_value());
    ASSERT_TRUE(tr.interpolate(0.49).rotation.has_value());
    EXPECT_EQ(*tr.interpolate(0.49).rotation, filled(1.0));
    EXPECT_FALSE(tr.interpolate(0.5).rotation.has_value());
    EXPECT_FALSE(tr.interpolate(1.0).rotation.has_value());
}

TEST(TileTransformation, MercatorOnlyRotationAppearsAfterMidpoint)
{
    const tile::TileTransformation tr = make(std::nullopt, filled(3.0));

    EXPECT_FALSE(tr.interpolate(0.0).rotation.has_value());
    EXPECT_FALSE(tr.interpolate(0.5).rotation.has_value());
    ASSERT_TRUE(tr.interpolate(0.51).rotation.has_value());
    EXPECT_EQ(*tr.interpolate(1.0).rotation, filled(3.0));
}

TEST(TileTransformation, NoRotationStaysAbsent)
{
    const tile::TileTransformation tr = make(std::nullopt, std::nullopt);
    EXPECT_FALSE(tr.interpolate(0.0).rotation.has_value());
    EXPECT_FALSE(tr.interpolate(0.5).rotation.has_value());
    EXPECT_FALSE(tr.interpolate(1.0).rotation.has_value());
}

TEST(TileTransformation, EqualsComparesAllFields)
{
    EXPECT_TRUE(make(filled(1.0), std::nullopt).equals(make(filled(1.0), std::nullopt)));
    EXPECT_FALSE(make(filled(1.0), std::nullopt).equals(make(filled(2.0), std::nullopt)));
    EXPECT_FALSE(make(filled(1.0), std::nullopt).equals(make(std::nullopt, std::nullopt)));
    EXPECT_FALSE(make(std::nullopt, std::nullopt).equals(
            tile::TileTransformation(WorldVec3(0.0), std::nullopt, WorldVec3(-20.0, 10.0, 0.0), std::nullopt)));
}
