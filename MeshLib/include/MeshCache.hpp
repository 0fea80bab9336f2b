#ifndef PLASTER_MESH_CACHE_HPP_INCLUDED
#define PLASTER_MESH_CACHE_HPP_INCLUDED

#include <cstdint>
#include <unordered_map>

#include "ShapeDescriptor.hpp"
#include "Tessellator.hpp"
#include "TriangleMesh.hpp"

namespace plaster
{
    /**
     * @brief Memoizes tessellation per shape identity and geometry version.
     *
     * One entry is kept per ShapeId. A lookup is a hit when the stored entry has
     * the same geometry version and winding rule (and, for pixel-space shapes,
     * the same surface extent). Any mismatch re-tessellates and replaces the
     * entry. A color change on an otherwise valid entry recolors the cached
     * vertices in place without tessellating.
     *
     * Anonymous shapes (id 0) are tessellated on every lookup into a scratch
     * mesh that stays valid until the next lookup.
     *
     * Not thread-safe.
     */
    class MeshCache
    {
    public:
        MeshCache() = default;
        explicit MeshCache(const OutlineOptions& options) noexcept;

        /// Mesh for the shape's current version. Reference valid until the entry changes.
        [[nodiscard]] const TriangleMesh& lookup(const ShapeDescriptor& shape, Extent2D extent);

        [[nodiscard]] bool contains(ShapeId id, uint64_t geometryVersion) const noexcept;

        void erase(ShapeId id) noexcept;
        void clear() noexcept;

        [[nodiscard]] std::size_t size() const noexcept
        {
            return m_entries.size();
        }

        [[nodiscard]] uint64_t hits() const noexcept
        {
            return m_hits;
        }

        [[nodiscard]] uint64_t misses() const noexcept
        {
            return m_misses;
        }

        [[nodiscard]] const Tessellator& tessellator() const noexcept
        {
            return m_tessellator;
        }

    private:
        struct Entry
        {
            uint64_t        geometryVersion = 0;
            WindingRule     winding         = WindingRule::NonZero;
            CoordinateSpace space           = CoordinateSpace::Ndc;
            Extent2D        extent          = {};
            glm::vec4       color           = {};
            TriangleMesh    mesh            = {};
        };

        [[nodiscard]] static bool matches(const Entry& e, const ShapeDescriptor& shape, Extent2D extent) noexcept;

    private:
        Tessellator                         m_tessellator = {};
        std::unordered_map<ShapeId, Entry> m_entries     = {};
        TriangleMesh                        m_scratch     = {};

        uint64_t m_hits   = 0;
        uint64_t m_misses = 0;
    };

} // namespace plaster

#endif // PLASTER_MESH_CACHE_HPP_INCLUDED
