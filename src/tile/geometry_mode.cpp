#include "geometry_mode.h"

namespace tile
{
    size_t GeometryMode::byte_size() const
    {
        size_t bytes = 0;
        for (const GeometrySource &s : sources)
        {
            bytes += (s.positions.size() + s.uvs.size() + s.web_mercator_y.size() +
                      s.mercator_positions.size() + s.normals.size() +
                      s.skirt_surface_positions.size()) * sizeof(float);
            bytes += s.skirt_flags.size();
        }
        for (const GeometryMaterial &m : materials)
        {
            bytes += (m.indices.size() + m.bucket_offsets.size()) * sizeof(uint16_t);
        }
        return bytes;
    }
} // namespace tile
