#include "ShapeDescriptor.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>
#include <type_traits>

namespace plaster
{
    glm::vec2 toNdc(const glm::vec2& px, Extent2D extent) noexcept
    {
        if (extent.empty())
            return {0.0f, 0.0f};

        const float w = static_cast<float>(extent.width);
        const float h = static_cast<float>(extent.height);

        return {(px.x / w) * 2.0f - 1.0f, -((px.y / h) * 2.0f - 1.0f)};
    }

    glm::vec2 toPixels(const glm::vec2& ndc, Extent2D extent) noexcept
    {
        if (extent.empty())
            return {0.0f, 0.0f};

        const float w = static_cast<float>(extent.width);
        const float h = static_cast<float>(extent.height);

        return {(ndc.x + 1.0f) * 0.5f * w, (1.0f - ndc.y) * 0.5f * h};
    }

    uint32_t circleSegmentCount(float radius, const OutlineOptions& options) noexcept
    {
        if (!std::isfinite(radius) || radius <= 0.0f)
            return 0;

        const uint32_t lo = std::max(3u, options.minCircleSegments);
        const uint32_t hi = std::max(lo, options.maxCircleSegments);

        const float tol = options.tolerance;
        if (!std::isfinite(tol) || tol <= 0.0f || tol >= radius)
            return lo;

        // Sagitta of a chord spanning angle a: r * (1 - cos(a / 2)).
        const double halfAngle = std::acos(1.0 - static_cast<double>(tol) / static_cast<double>(radius));
        if (halfAngle <= 0.0)
            return hi;

        const double n = std::ceil(glm::pi<double>() / halfAngle);
        if (n >= static_cast<double>(hi))
            return hi;

        return std::clamp(static_cast<uint32_t>(n), lo, hi);
    }

    namespace
    {
        std::vector<glm::vec2> rectPoints(const Rect& r)
        {
            // tl, bl, br, tr: counter-clockwise in y-up NDC when topLeft is the upper corner.
            return {
                r.topLeft,
                {r.topLeft.x, r.bottomRight.y},
                r.bottomRight,
                {r.bottomRight.x, r.topLeft.y},
            };
        }

        std::vector<glm::vec2> circlePoints(const Circle& c, uint32_t segments)
        {
            std::vector<glm::vec2> pts;
            pts.reserve(segments);

            const double step = glm::two_pi<double>() / static_cast<double>(segments);
            for (uint32_t i = 0; i < segments; ++i)
            {
                const double a = step * static_cast<double>(i);
                pts.emplace_back(c.center.x + static_cast<float>(std::cos(a) * c.radius),
                                 c.center.y + static_cast<float>(std::sin(a) * c.radius));
            }
            return pts;
        }

        // Radius expressed in NDC units, along the axis that stretches it most.
        float ndcRadius(const Circle& c, CoordinateSpace space, Extent2D extent) noexcept
        {
            if (space == CoordinateSpace::Ndc)
                return c.radius;

            const float minSide = static_cast<float>(std::min(extent.width, extent.height));
            return c.radius * 2.0f / minSide;
        }

    } // namespace

    Outline normalizeOutline(const ShapeDescriptor& shape, Extent2D extent, const OutlineOptions& options)
    {
        Outline out;
        out.color   = shape.color;
        out.winding = shape.winding;

        if (shape.space == CoordinateSpace::Pixels && extent.empty())
            return out;

        out.points = std::visit(
            [&](const auto& g) -> std::vector<glm::vec2> {
                using T = std::decay_t<decltype(g)>;
                if constexpr (std::is_same_v<T, Polygon>)
                {
                    return g.points;
                }
                else if constexpr (std::is_same_v<T, Rect>)
                {
                    return rectPoints(g);
                }
                else
                {
                    const uint32_t n = circleSegmentCount(ndcRadius(g, shape.space, extent), options);
                    if (n == 0)
                        return {};
                    return circlePoints(g, n);
                }
            },
            shape.geometry);

        if (shape.space == CoordinateSpace::Pixels)
        {
            for (glm::vec2& p : out.points)
                p = toNdc(p, extent);
        }

        return out;
    }

} // namespace plaster
