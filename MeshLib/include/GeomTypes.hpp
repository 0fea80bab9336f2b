#ifndef PLASTER_GEOM_TYPES_HPP_INCLUDED
#define PLASTER_GEOM_TYPES_HPP_INCLUDED

#include <cstdint>
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

namespace plaster
{
    /**
     * @brief Rule deciding which regions of an outline count as inside.
     */
    enum class WindingRule : uint8_t
    {
        NonZero = 0,
        EvenOdd = 1
    };

    /**
     * @brief Space the points of a shape are expressed in.
     *
     * Ndc    : normalized device coordinates, x right and y up, [-1, 1].
     * Pixels : surface pixels, origin top-left, y down.
     */
    enum class CoordinateSpace : uint8_t
    {
        Ndc    = 0,
        Pixels = 1
    };

    /**
     * @brief Render target dimensions in pixels.
     */
    struct Extent2D
    {
        uint32_t width  = 0;
        uint32_t height = 0;

        [[nodiscard]] bool empty() const noexcept
        {
            return width == 0 || height == 0;
        }

        bool operator==(const Extent2D&) const = default;
    };

    /// Pixel-space point to normalized device coordinates (y flipped).
    [[nodiscard]] glm::vec2 toNdc(const glm::vec2& px, Extent2D extent) noexcept;

    /// Normalized device coordinates back to pixel space.
    [[nodiscard]] glm::vec2 toPixels(const glm::vec2& ndc, Extent2D extent) noexcept;

} // namespace plaster

#endif // PLASTER_GEOM_TYPES_HPP_INCLUDED
