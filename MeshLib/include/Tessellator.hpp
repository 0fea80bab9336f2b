#ifndef PLASTER_TESSELLATOR_HPP_INCLUDED
#define PLASTER_TESSELLATOR_HPP_INCLUDED

#include "ShapeDescriptor.hpp"
#include "TriangleMesh.hpp"

namespace plaster
{
    /**
     * @brief Converts closed outlines into filled triangle meshes.
     *
     * Two strategies are used:
     *  - Simple outlines (no edge crossings, no touching vertices) are ear
     *    clipped. Vertices map 1:1 to the outline points, so a convex outline
     *    of n points yields exactly n - 2 triangles.
     *  - Outlines that cross or touch themselves go through a slab sweep: the
     *    plane is cut at every vertex and crossing height, and each slab is
     *    filled span by span according to the winding rule.
     *
     * Degenerate outlines (fewer than 3 distinct points, zero enclosed area or
     * non-finite coordinates) give an empty mesh. Output is a pure function of
     * the input, so the same outline always yields a byte-identical mesh.
     */
    class Tessellator
    {
    public:
        Tessellator() = default;
        explicit Tessellator(const OutlineOptions& options) noexcept;

        [[nodiscard]] TriangleMesh tessellate(const Outline& outline) const;

        /// Normalize a shape (any kind, any space) and tessellate it.
        [[nodiscard]] TriangleMesh tessellate(const ShapeDescriptor& shape, Extent2D extent) const;

        [[nodiscard]] const OutlineOptions& options() const noexcept
        {
            return m_options;
        }

    private:
        OutlineOptions m_options = {};
    };

} // namespace plaster

#endif // PLASTER_TESSELLATOR_HPP_INCLUDED
