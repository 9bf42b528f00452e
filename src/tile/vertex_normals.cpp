#include "vertex_normals.h"

#include <array>
#include <bit>
#include <functional>
#include <unordered_map>

#include <glm/glm.hpp>

namespace tile
{
    namespace
    {
        using PositionBits = std::array<uint32_t, 3>;

        struct PositionBitsHash
        {
            size_t operator()(const PositionBits &p) const noexcept
            {
                // [x:32 | y:32], z folded in separately
                const uint64_t xy = (static_cast<uint64_t>(p[0]) << 32) | static_cast<uint64_t>(p[1]);
                return std::hash<uint64_t>{}(xy) ^ (std::hash<uint32_t>{}(p[2]) << 1);
            }
        };

        glm::vec3 read_vec3(const std::vector<float> &data, size_t vertex)
        {
            const size_t i = vertex * 3u;
            return glm::vec3(data[i], data[i + 1], data[i + 2]);
        }

        glm::vec3 surface_position(const GeometrySource &src, size_t vertex)
        {
            const bool use_surface = vertex < src.skirt_flags.size() && src.skirt_flags[vertex] != 0 &&
                                     src.skirt_surface_positions.size() >= (vertex + 1u) * 3u;
            return use_surface ? read_vec3(src.skirt_surface_positions, vertex) : read_vec3(src.positions, vertex);
        }

        // Maps every vertex to a slot shared by all vertices at the same surface
        // position, so a skirt vertex ends up with the normal of its edge vertex.
        std::vector<uint32_t> weld_by_position(const std::vector<glm::vec3> &surface)
        {
            std::vector<uint32_t> slot(surface.size(), 0u);
            std::unordered_map<PositionBits, uint32_t, PositionBitsHash> seen;
            seen.reserve(surface.size());

            for (size_t v = 0; v < surface.size(); ++v)
            {
                // +0.0f folds -0.0f onto +0.0f.
                const PositionBits bits{std::bit_cast<uint32_t>(surface[v].x + 0.0f),
                                        std::bit_cast<uint32_t>(surface[v].y + 0.0f),
                                        std::bit_cast<uint32_t>(surface[v].z + 0.0f)};
                const uint32_t next = static_cast<uint32_t>(seen.size());
                slot[v] = seen.emplace(bits, next).first->second;
            }
            return slot;
        }
    } // namespace

    void compute_vertex_normals(GeometrySource &source, const GeometryMaterial &material)
    {
        const size_t vertex_count = source.positions.size() / 3u;

        std::vector<glm::vec3> surface(vertex_count);
        for (size_t v = 0; v < vertex_count; ++v)
        {
            surface[v] = surface_position(source, v);
        }

        const std::vector<uint32_t> slot = weld_by_position(surface);
        std::vector<glm::vec3> accum(vertex_count, glm::vec3(0.0f));

        const std::vector<uint16_t> &idx = material.indices;
        for (size_t i = 0; i + 2 < idx.size(); i += 3)
        {
            const size_t ia = idx[i + 0];
            const size_t ib = idx[i + 1];
            const size_t ic = idx[i + 2];
            if (ia >= vertex_count || ib >= vertex_count || ic >= vertex_count)
            {
                continue;
            }

            const glm::vec3 &a = surface[ia];
            const glm::vec3 &b = surface[ib];
            const glm::vec3 &c = surface[ic];

            // Area weighted; collapsed skirt faces add nothing.
            const glm::vec3 face = glm::cross(c - b, a - b);
            accum[slot[ia]] += face;
            accum[slot[ib]] += face;
            accum[slot[ic]] += face;
        }

        source.normals.assign(vertex_count * 3u, 0.0f);
        for (size_t v = 0; v < vertex_count; ++v)
        {
            glm::vec3 n = accum[slot[v]];
            const float len = glm::length(n);
            if (len > 0.0f)
            {
                n /= len;
            }
            source.normals[v * 3u + 0] = n.x;
            source.normals[v * 3u + 1] = n.y;
            source.normals[v * 3u + 2] = n.z;
        }
    }
} // namespace tile
