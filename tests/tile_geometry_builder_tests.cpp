#include "tile/tile_geometry_builder.h"

#include <core/config.h>
#include <geo/projection.h>
#include <geo/tiling_scheme.h>

#include <gtest/gtest.h>

#include <cmath>

#include <glm/geometric.hpp>

namespace
{
    tile::TileGeometryBuilder make_builder(tile::TileGeometryBuilder::Settings settings = {})
    {
        return tile::TileGeometryBuilder(geo::web_mercator_tiling_scheme(), geo::sphere_projection(), settings);
    }
} // namespace

TEST(TileGeometryBuilder, CacheKeysFollowPatchKind)
{
    EXPECT_EQ(tile::TileGeometryBuilder::cache_key(5, 3, false), "5/3/patch");
    EXPECT_EQ(tile::TileGeometryBuilder::cache_key(8, 123, true), "simple.patch/4");
    EXPECT_EQ(tile::TileGeometryBuilder::cache_key(1, 0, true), "simple.patch/6");
}

TEST(TileGeometryBuilder, SameKeyReturnsSameGeometry)
{
    tile::TileGeometryBuilder builder = make_builder();

    const auto first = builder.get_geometry(5, 7, false);
    const auto second = builder.get_geometry(5, 7, false);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());

    // Patches depend on the row only, so any column maps to the same entry.
    const auto via_key = builder.get_tile_geometry_with_transform(geo::TileKey::from_row_column_level(7, 19, 5));
    ASSERT_TRUE(via_key.has_value());
    EXPECT_EQ(via_key->geometry.get(), first.get());

    EXPECT_EQ(builder.stats().entries, 1u);
    EXPECT_EQ(builder.stats().misses, 1u);
    EXPECT_EQ(builder.stats().hits, 2u);
    EXPECT_EQ(builder.stats().failures, 0u);
}

TEST(TileGeometryBuilder, DifferentRowsGetDifferentGeometry)
{
    tile::TileGeometryBuilder builder = make_builder();
    const auto a = builder.get_geometry(5, 7, false);
    const auto b = builder.get_geometry(5, 8, false);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a.get(), b.get());
    EXPECT_EQ(builder.stats().entries, 2u);
}

TEST(TileGeometryBuilder, SimplePatchIsSharedAcrossDeepLevels)
{
    tile::TileGeometryBuilder builder = make_builder();

    const auto a = builder.get_tile_geometry_with_transform(geo::TileKey::from_row_column_level(200, 300, 9));
    const auto b = builder.get_tile_geometry_with_transform(geo::TileKey::from_row_column_level(5000, 4000, 14));
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->geometry.get(), b->geometry.get());
    EXPECT_TRUE(a->geometry->is_simple_patch);
    EXPECT_EQ(a->geometry->material().triangle_count, 2442u);
    EXPECT_EQ(builder.stats().entries, 1u);
}

TEST(TileGeometryBuilder, PatchKindFollowsDetailLevels)
{
    tile::TileGeometryBuilder builder = make_builder();

    // Below min_detail_level: bucketed, no skirt.
    const auto coarse = builder.get_geometry(2, 1, false);
    ASSERT_NE(coarse, nullptr);
    EXPECT_EQ(coarse->source().vertex_count, 33u * 33u);
    EXPECT_DOUBLE_EQ(coarse->skirt_offset, 0.0);
    EXPECT_EQ(coarse->material().bucket_levels, 5u);

    // From min_detail_level on: skirted.
    const auto skirted = builder.get_geometry(5, 1, false);
    ASSERT_NE(skirted, nullptr);
    EXPECT_EQ(skirted->source().vertex_count, 19u * 19u);
    EXPECT_DOUBLE_EQ(skirted->skirt_offset, 0.2 / 32.0);

    EXPECT_EQ(coarse->source().normals.size(), coarse->source().positions.size());
    EXPECT_EQ(skirted->source().normals.size(), skirted->source().positions.size());
}

TEST(TileGeometryBuilder, SettingsMoveDetailBoundaries)
{
    tile::TileGeometryBuilder::Settings settings{};
    settings.min_detail_level = 2;
    settings.max_detail_level = 6;
    tile::TileGeometryBuilder builder = make_builder(settings);

    EXPECT_FALSE(builder.is_simple_patch_level(5));
    EXPECT_TRUE(builder.is_simple_patch_level(6));

    const auto skirted = builder.get_geometry(2, 0, false);
    ASSERT_NE(skirted, nullptr);
    EXPECT_GT(skirted->skirt_offset, 0.0);
}

TEST(TileGeometryBuilder, InvertedSettingsAreClamped)
{
    tile::TileGeometryBuilder::Settings settings{};
    settings.min_detail_level = 10;
    settings.max_detail_level = 6;
    const tile::TileGeometryBuilder builder = make_builder(settings);
    EXPECT_EQ(builder.settings().min_detail_level, 6u);
    EXPECT_EQ(builder.settings().max_detail_level, 6u);
}

TEST(TileGeometryBuilder, RejectsLevelsBeyondLimit)
{
    tile::TileGeometryBuilder builder = make_builder();
    EXPECT_EQ(builder.get_geometry(kMaxTileLevel + 1u, 0, true), nullptr);
    EXPECT_FALSE(builder.get_tile_geometry_with_transform(
            geo::TileKey::from_row_column_level(0, 0, kMaxTileLevel + 1u)).has_value());
    EXPECT_EQ(builder.stats().failures, 2u);
    EXPECT_EQ(builder.stats().entries, 0u);
}

TEST(TileGeometryBuilder, LevelZeroTransformIsAtOrigin)
{
    tile::TileGeometryBuilder builder = make_builder();
    const tile::TileTransformation tr = builder.compute_transformation(geo::TileKey{});

    EXPECT_TRUE(is_zero(tr.sphere_position()));
    EXPECT_TRUE(is_zero(tr.mercator_position()));
    EXPECT_FALSE(tr.sphere_rotation().has_value());
    EXPECT_FALSE(tr.mercator_rotation().has_value());
}

TEST(TileGeometryBuilder, TransformPositionsAreProjectedBoxCenter)
{
    tile::TileGeometryBuilder builder = make_builder();
    const geo::TileKey key = geo::TileKey::from_row_column_level(11, 21, 5);
    const tile::TileTransformation tr = builder.compute_transformation(key);

    const geo::GeoCoordinates center = geo::web_mercator_tiling_scheme().geo_box(key).center();
    EXPECT_EQ(tr.sphere_position(), geo::sphere_projection().project_point(center));
    EXPECT_EQ(tr.mercator_position(), geo::mercator_projection().project_point(center));
    // Coarse tiles carry no corner basis.
    EXPECT_FALSE(tr.sphere_rotation().has_value());
    EXPECT_FALSE(tr.mercator_rotation().has_value());
}

TEST(TileGeometryBuilder, SimplePatchTilesCarryCornerBasis)
{
    tile::TileGeometryBuilder builder = make_builder();
    const geo::TileKey key = geo::TileKey::from_row_column_level(100, 140, 8);
    const tile::TileTransformation tr = builder.compute_transformation(key);

    ASSERT_TRUE(tr.sphere_rotation().has_value());
    ASSERT_TRUE(tr.mercator_rotation().has_value());

    const glm::dmat4 &m = *tr.mercator_rotation();
    const geo::GeoBox box = geo::web_mercator_tiling_scheme().geo_box(key);
    const WorldVec3 sw = geo::mercator_projection().project_point(geo::GeoCoordinates::from_degrees(box.south(), box.west()));
    const WorldVec3 se = geo::mercator_projection().project_point(geo::GeoCoordinates::from_degrees(box.south(), box.east()));

    EXPECT_EQ(WorldVec3(m[0]), sw - tr.mercator_position());
    EXPECT_EQ(WorldVec3(m[1]), se - sw);
    EXPECT_DOUBLE_EQ(m[0][3], 1.0);
    EXPECT_DOUBLE_EQ(m[1][3], 0.0);
    EXPECT_DOUBLE_EQ(m[2][3], 0.0);
    EXPECT_DOUBLE_EQ(m[3][3], 0.0);
    // The Mercator SE - SW edge runs east only.
    EXPECT_GT(m[1][0], 0.0);
    EXPECT_NEAR(m[1][1], 0.0, 1e-9);
}

TEST(TileGeometryBuilder, ChildKeyEncodesScaleAndOffsets)
{
    tile::TileGeometryBuilder builder = make_builder();
    const geo::TileKey key = geo::TileKey::from_row_column_level(10, 20, 9);
    const geo::TileKey child = geo::TileKey::from_row_column_level(10 * 4 + 3, 20 * 4 + 1, 11);
    const WorldVec3 position = builder.tile_base_position(key, geo::sphere_projection());

    const auto m = builder.tile_rotation_matrix(key, position, geo::sphere_projection(), child);
    ASSERT_TRUE(m.has_value());
    EXPECT_DOUBLE_EQ((*m)[0][3], 0.25);
    EXPECT_DOUBLE_EQ((*m)[3][3], 0.75);
    EXPECT_DOUBLE_EQ((*m)[2][3], 0.25);
}

TEST(TileGeometryBuilder, RejectsChildOutsideTile)
{
    tile::TileGeometryBuilder builder = make_builder();
    const geo::TileKey key = geo::TileKey::from_row_column_level(10, 20, 9);
    const WorldVec3 position = builder.tile_base_position(key, geo::sphere_projection());

    // Deeper than any supported level; the row/column shift would overflow.
    const geo::TileKey too_deep = geo::TileKey::from_row_column_level(10, 20, 9 + 32);
    EXPECT_FALSE(builder.tile_rotation_matrix(key, position, geo::sphere_projection(), too_deep).has_value());

    // Right depth, wrong quadrant.
    const geo::TileKey elsewhere = geo::TileKey::from_row_column_level(11 * 4, 20 * 4, 11);
    EXPECT_FALSE(builder.tile_rotation_matrix(key, position, geo::sphere_projection(), elsewhere).has_value());

    // Shallower than the tile itself.
    EXPECT_FALSE(builder.tile_rotation_matrix(key, position, geo::sphere_projection(), key.parent()).has_value());

    // The tile itself is its own trivial descendant.
    const auto self = builder.tile_rotation_matrix(key, position, geo::sphere_projection(), key);
    ASSERT_TRUE(self.has_value());
    EXPECT_DOUBLE_EQ((*self)[0][3], 1.0);
}

TEST(TileGeometryBuilder, SkirtHeightIsReportedPerTile)
{
    tile::TileGeometryBuilder builder = make_builder();
    const auto coarse = builder.get_tile_geometry_with_transform(geo::TileKey::from_row_column_level(3, 3, 3));
    const auto fine = builder.get_tile_geometry_with_transform(geo::TileKey::from_row_column_level(300, 300, 12));
    ASSERT_TRUE(coarse.has_value());
    ASSERT_TRUE(fine.has_value());
    EXPECT_DOUBLE_EQ(coarse->skirt_height, builder.skirt_height(3));
    EXPECT_GE(coarse->skirt_height, fine->skirt_height);
    EXPECT_LE(coarse->skirt_height, kMaxSkirtHeight);
}
