#include "MeshCache.hpp"

namespace plaster
{
    MeshCache::MeshCache(const OutlineOptions& options) noexcept : m_tessellator{options}
    {
    }

    bool MeshCache::matches(const Entry& e, const ShapeDescriptor& shape, Extent2D extent) noexcept
    {
        if (e.geometryVersion != shape.geometryVersion || e.winding != shape.winding || e.space != shape.space)
            return false;

        // Pixel geometry maps to different NDC once the surface size changes.
        if (shape.space == CoordinateSpace::Pixels && !(e.extent == extent))
            return false;

        return true;
    }

    const TriangleMesh& MeshCache::lookup(const ShapeDescriptor& shape, Extent2D extent)
    {
        if (shape.id == 0)
        {
            ++m_misses;
            m_scratch = m_tessellator.tessellate(shape, extent);
            return m_scratch;
        }

        auto it = m_entries.find(shape.id);
        if (it != m_entries.end() && matches(it->second, shape, extent))
        {
            ++m_hits;

            Entry& e = it->second;
            if (e.color != shape.color)
            {
                geom::recolor(e.mesh, shape.color);
                e.color = shape.color;
            }
            return e.mesh;
        }

        ++m_misses;

        Entry e;
        e.geometryVersion = shape.geometryVersion;
        e.winding         = shape.winding;
        e.space           = shape.space;
        e.extent          = extent;
        e.color           = shape.color;
        e.mesh            = m_tessellator.tessellate(shape, extent);

        auto pos = m_entries.insert_or_assign(shape.id, std::move(e)).first;
        return pos->second.mesh;
    }

    bool MeshCache::contains(ShapeId id, uint64_t geometryVersion) const noexcept
    {
        auto it = m_entries.find(id);
        return it != m_entries.end() && it->second.geometryVersion == geometryVersion;
    }

    void MeshCache::erase(ShapeId id) noexcept
    {
        m_entries.erase(id);
    }

    void MeshCache::clear() noexcept
    {
        m_entries.clear();
        m_scratch.clear();
    }

} // namespace plaster
