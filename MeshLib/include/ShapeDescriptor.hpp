#ifndef PLASTER_SHAPE_DESCRIPTOR_HPP_INCLUDED
#define PLASTER_SHAPE_DESCRIPTOR_HPP_INCLUDED

#include <cstdint>
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include <variant>
#include <vector>

#include "GeomTypes.hpp"

namespace plaster
{
    /// Caller-chosen identity of a shape. 0 marks an anonymous shape that is never cached.
    using ShapeId = std::uint64_t;

    /// Free-form closed outline. The last point connects back to the first.
    struct Polygon
    {
        std::vector<glm::vec2> points;
    };

    /// Axis-aligned rectangle given by two opposite corners.
    struct Rect
    {
        glm::vec2 topLeft     = {0.0f, 0.0f};
        glm::vec2 bottomRight = {0.0f, 0.0f};
    };

    struct Circle
    {
        glm::vec2 center = {0.0f, 0.0f};
        float     radius = 0.0f;
    };

    using ShapeGeometry = std::variant<Polygon, Rect, Circle>;

    /**
     * @brief Value description of one filled shape.
     *
     * The descriptor is copied into the engine on submission; the engine never
     * keeps references to caller memory. Whenever the geometry of a shape with a
     * given id changes, the caller must bump geometryVersion so cached meshes
     * are recomputed.
     */
    struct ShapeDescriptor
    {
        ShapeId         id              = 0;
        uint64_t        geometryVersion = 0;
        ShapeGeometry   geometry        = Polygon{};
        glm::vec4       color           = {0.0f, 0.0f, 0.0f, 1.0f};
        WindingRule     winding         = WindingRule::NonZero;
        CoordinateSpace space           = CoordinateSpace::Ndc;
        int32_t         layer           = 0;
    };

    /**
     * @brief Shape normalized to the Tessellator input: NDC points + color + rule.
     */
    struct Outline
    {
        std::vector<glm::vec2> points;
        glm::vec4              color   = {0.0f, 0.0f, 0.0f, 1.0f};
        WindingRule            winding = WindingRule::NonZero;
    };

    struct OutlineOptions
    {
        /// Maximum distance between a curved edge and its flattened chord.
        float tolerance = 0.02f;

        uint32_t minCircleSegments = 8;
        uint32_t maxCircleSegments = 256;
    };

    /**
     * @brief Number of segments used to flatten a circle of the given radius.
     *
     * Chosen so the sagitta of each segment stays within options.tolerance,
     * then clamped to [minCircleSegments, maxCircleSegments]. Returns 0 for a
     * non-positive or non-finite radius.
     */
    [[nodiscard]] uint32_t circleSegmentCount(float radius, const OutlineOptions& options) noexcept;

    /**
     * @brief Flatten any shape kind to a point outline in NDC.
     *
     * Pixel-space shapes are converted with the given surface extent; an empty
     * extent yields an empty outline for them.
     */
    [[nodiscard]] Outline normalizeOutline(const ShapeDescriptor& shape,
                                           Extent2D               extent,
                                           const OutlineOptions&  options = {});

} // namespace plaster

#endif // PLASTER_SHAPE_DESCRIPTOR_HPP_INCLUDED
