#ifndef PLASTER_TRIANGLE_MESH_HPP_INCLUDED
#define PLASTER_TRIANGLE_MESH_HPP_INCLUDED

#include <cstddef>
#include <cstdint>
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include <vector>

namespace plaster
{
    /**
     * @brief GPU vertex layout: location 0 = position (vec2), location 1 = color (vec4).
     */
    struct Vertex
    {
        glm::vec2 position = {0.0f, 0.0f};
        glm::vec4 color    = {0.0f, 0.0f, 0.0f, 1.0f};
    };

    static_assert(sizeof(Vertex) == 24, "Vertex must stay tightly packed (2 + 4 floats)");
    static_assert(offsetof(Vertex, color) == 8, "Vertex color must follow the position");

    /**
     * @brief Indexed triangle list.
     *
     * Invariants (for meshes produced by the Tessellator):
     *  - every index < vertices.size()
     *  - indices.size() % 3 == 0
     *  - every triangle is counter-clockwise in y-up NDC
     */
    struct TriangleMesh
    {
        std::vector<Vertex>   vertices;
        std::vector<uint32_t> indices;

        [[nodiscard]] bool empty() const noexcept
        {
            return indices.empty();
        }

        [[nodiscard]] uint32_t triangleCount() const noexcept
        {
            return static_cast<uint32_t>(indices.size() / 3);
        }

        void clear() noexcept
        {
            vertices.clear();
            indices.clear();
        }
    };

    namespace geom
    {
        /// True when all indices are in range and form whole triangles.
        [[nodiscard]] bool isWellFormed(const TriangleMesh& mesh) noexcept;

        /// Sum of absolute triangle areas.
        [[nodiscard]] double coveredArea(const TriangleMesh& mesh) noexcept;

        /// Signed area of triangle t (positive = counter-clockwise).
        [[nodiscard]] double signedTriangleArea(const TriangleMesh& mesh, uint32_t t) noexcept;

        /// Byte-for-byte comparison of vertex and index storage.
        [[nodiscard]] bool bytewiseEqual(const TriangleMesh& a, const TriangleMesh& b) noexcept;

        /// Overwrite the color of every vertex.
        void recolor(TriangleMesh& mesh, const glm::vec4& color) noexcept;

    } // namespace geom

} // namespace plaster

#endif // PLASTER_TRIANGLE_MESH_HPP_INCLUDED
