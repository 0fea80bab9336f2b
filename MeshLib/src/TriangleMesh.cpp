#include "TriangleMesh.hpp"

#include <cmath>
#include <cstring>

namespace plaster::geom
{
    bool isWellFormed(const TriangleMesh& mesh) noexcept
    {
        if (mesh.indices.size() % 3 != 0)
            return false;

        const std::size_t vcount = mesh.vertices.size();
        for (uint32_t i : mesh.indices)
        {
            if (i >= vcount)
                return false;
        }
        return true;
    }

    double signedTriangleArea(const TriangleMesh& mesh, uint32_t t) noexcept
    {
        const glm::vec2& a = mesh.vertices[mesh.indices[t * 3 + 0]].position;
        const glm::vec2& b = mesh.vertices[mesh.indices[t * 3 + 1]].position;
        const glm::vec2& c = mesh.vertices[mesh.indices[t * 3 + 2]].position;

        const double abx = double(b.x) - double(a.x);
        const double aby = double(b.y) - double(a.y);
        const double acx = double(c.x) - double(a.x);
        const double acy = double(c.y) - double(a.y);

        return 0.5 * (abx * acy - aby * acx);
    }

    double coveredArea(const TriangleMesh& mesh) noexcept
    {
        double area = 0.0;
        for (uint32_t t = 0; t < mesh.triangleCount(); ++t)
            area += std::abs(signedTriangleArea(mesh, t));
        return area;
    }

    bool bytewiseEqual(const TriangleMesh& a, const TriangleMesh& b) noexcept
    {
        if (a.vertices.size() != b.vertices.size() || a.indices.size() != b.indices.size())
            return false;

        if (!a.vertices.empty() &&
            std::memcmp(a.vertices.data(), b.vertices.data(), a.vertices.size() * sizeof(Vertex)) != 0)
            return false;

        if (!a.indices.empty() &&
            std::memcmp(a.indices.data(), b.indices.data(), a.indices.size() * sizeof(uint32_t)) != 0)
            return false;

        return true;
    }

    void recolor(TriangleMesh& mesh, const glm::vec4& color) noexcept
    {
        for (Vertex& v : mesh.vertices)
            v.color = color;
    }

} // namespace plaster::geom
