#pragma once

#include <cstdint>

// Earth model shared by the sphere and Mercator projections (meters).
inline constexpr double kEquatorialRadius = 6378137.0;

// Mercator latitude limit: atan(sinh(pi)) in radians (~85.05112878 deg).
inline constexpr double kMaxMercatorLatitude = 1.4844222297453324;

// Tiles at or above this level share one planar "simple" patch.
inline constexpr uint32_t kDefaultMaxDetailLevel = 8;
// Tiles at or above this level (and below the max) get a skirt ring.
inline constexpr uint32_t kDefaultMinDetailLevel = 4;

// Patch subdivision for a level is max(kSubdivisionBase - level, kMinPatchSubdivision).
inline constexpr uint32_t kSubdivisionBase = 7;
inline constexpr uint32_t kMinPatchSubdivision = 4;
// (2^7 + 3)^2 vertices is the largest skirted grid that still fits 16-bit indices.
inline constexpr uint32_t kMaxPatchSubdivision = 7;
// Deepest tile level the 32-bit row/column math supports together with the subdivision.
inline constexpr uint32_t kMaxTileLevel = 24;

// Skirt ring depth of a bucketed patch, as a fraction of one tile column at level 0.
inline constexpr double kPatchSkirtFraction = 0.2;
// Skirt ring depth of the planar simple patch, in unit-square space.
inline constexpr float kSimplePatchSkirtValue = -1.0f;
// Upper bound on the reported skirt height (world units).
inline constexpr double kMaxSkirtHeight = 1000.0;
// Multiplier applied to the level-scaled geometric error to get the skirt height.
inline constexpr double kSkirtErrorScale = 4.0;
