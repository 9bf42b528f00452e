#pragma once

#include "geometry_mode.h"

namespace tile
{
    // Area-weighted smooth normals over the material's triangles, written to
    // source.normals (xyz per vertex). Skirt vertices are placed at their
    // surface position and share the normal of the vertex they hang from.
    void compute_vertex_normals(GeometrySource &source, const GeometryMaterial &material);
} // namespace tile
