#pragma once

#include "geometry_mode.h"

#include <geo/projection.h>
#include <geo/tile_key.h>
#include <geo/tiling_scheme.h>

#include <core/world.h>

#include <cstdint>

namespace tile
{
    // Builds the vertex/index buffers of a tile patch. Every vertex is projected
    // twice, onto the sphere and onto the Mercator plane, so the renderer can
    // morph between globe and flat map. Output is a pure function of the inputs.
    class PatchGenerator
    {
    public:
        PatchGenerator(const geo::TilingScheme &tiling,
                       const geo::Projection &sphere,
                       const geo::Projection &mercator = geo::mercator_projection());

        const geo::TilingScheme &tiling_scheme() const { return *_tiling; }
        const geo::Projection &sphere() const { return *_sphere; }
        const geo::Projection &mercator() const { return *_mercator; }

        bool is_y_axis_down() const { return _y_axis_down; }
        // webMercatorY is derived from latitude unless the tiling is already web Mercator.
        bool uv_web_mercator() const { return _uv_web_mercator; }

        // (2^subdivision + 1)^2 vertices covering key, no skirt. Each cell's two
        // triangles sit at bucket_index * 6. normal_offset pushes sphere
        // positions along the surface normal.
        bool generate_patch_with_buckets(GeometryMode &out,
                                         uint32_t subdivision,
                                         const geo::TileKey &key,
                                         bool centered,
                                         double normal_offset = 0.0) const;

        // (2^subdivision + 3)^2 vertices: the bucketed grid plus a one-cell skirt
        // ring dropped below the surface by patch_skirt_offset(level). Skirt
        // cells share the bucket of their nearest interior cell.
        bool generate_patch_with_buckets_and_skirt(GeometryMode &out,
                                                   uint32_t subdivision,
                                                   const geo::TileKey &key,
                                                   bool centered) const;

        // Planar unit square of (segments_x + 2) x (segments_y + 2) vertices with
        // the skirt ring at z = -1. The four corner cells carry no triangles.
        bool generate_simple_patch_with_skirt(GeometryMode &out,
                                              uint32_t segments_x,
                                              uint32_t segments_y) const;

    private:
        struct PatchCenter
        {
            WorldVec3 sphere{0.0};
            WorldVec3 mercator{0.0};
        };

        PatchCenter patch_center(const geo::GeoBox &box, uint32_t level, bool centered) const;
        bool validate(uint32_t subdivision, const geo::TileKey &key) const;

        const geo::TilingScheme *_tiling = nullptr;
        const geo::Projection *_sphere = nullptr;
        const geo::Projection *_mercator = nullptr;
        bool _y_axis_down = false;
        bool _uv_web_mercator = false;
    };
} // namespace tile
