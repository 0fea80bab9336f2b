#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <numbers>

#include "Colors.hpp"
#include "Tessellator.hpp"

using namespace plaster;

namespace
{
    Outline outlineOf(std::vector<glm::vec2> pts, WindingRule rule = WindingRule::NonZero, glm::vec4 color = colors::WHITE)
    {
        Outline o;
        o.points  = std::move(pts);
        o.winding = rule;
        o.color   = color;
        return o;
    }

    void expectCounterClockwise(const TriangleMesh& mesh)
    {
        for (uint32_t t = 0; t < mesh.triangleCount(); ++t)
            EXPECT_GT(geom::signedTriangleArea(mesh, t), 0.0) << "triangle " << t;
    }

    std::vector<glm::vec2> regularPolygon(int n, float radius)
    {
        std::vector<glm::vec2> pts;
        for (int i = 0; i < n; ++i)
        {
            const float a = 2.0f * std::numbers::pi_v<float> * float(i) / float(n);
            pts.emplace_back(radius * std::cos(a), radius * std::sin(a));
        }
        return pts;
    }

    /// Five-pointed star drawn in one stroke; the edges cross around a pentagon.
    std::vector<glm::vec2> pentagram(float radius)
    {
        std::vector<glm::vec2> pts;
        for (int i = 0; i < 5; ++i)
        {
            const float a = std::numbers::pi_v<float> * 0.5f + float(i * 2) * 2.0f * std::numbers::pi_v<float> / 5.0f;
            pts.emplace_back(radius * std::cos(a), radius * std::sin(a));
        }
        return pts;
    }
} // namespace

// ------------------------------------------------------------
// Simple outlines
// ------------------------------------------------------------

TEST(Tessellator, SingleTriangle)
{
    const Tessellator  tess;
    const glm::vec4    red  = {1.0f, 0.0f, 0.0f, 1.0f};
    const TriangleMesh mesh = tess.tessellate(outlineOf({{0.0f, 0.0f}, {1.0f, 0.0f}, {0.0f, 1.0f}}, WindingRule::NonZero, red));

    ASSERT_TRUE(geom::isWellFormed(mesh));
    EXPECT_EQ(mesh.vertices.size(), 3u);
    EXPECT_EQ(mesh.indices.size(), 3u);
    EXPECT_NEAR(geom::coveredArea(mesh), 0.5, 1e-6);

    for (const Vertex& v : mesh.vertices)
        EXPECT_EQ(v.color, red);
}

TEST(Tessellator, UnitSquare)
{
    const Tessellator  tess;
    const TriangleMesh mesh = tess.tessellate(outlineOf({{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}}));

    ASSERT_TRUE(geom::isWellFormed(mesh));
    EXPECT_EQ(mesh.vertices.size(), 4u);
    EXPECT_EQ(mesh.indices.size(), 6u);
    EXPECT_NEAR(geom::coveredArea(mesh), 1.0, 1e-6);
    expectCounterClockwise(mesh);
}

TEST(Tessellator, ConvexPolygonGivesNMinusTwoTriangles)
{
    const Tessellator tess;

    for (int n : {5, 6, 12, 64})
    {
        const TriangleMesh mesh = tess.tessellate(outlineOf(regularPolygon(n, 0.8f)));

        ASSERT_TRUE(geom::isWellFormed(mesh)) << n;
        EXPECT_EQ(mesh.vertices.size(), std::size_t(n));
        EXPECT_EQ(mesh.triangleCount(), uint32_t(n - 2));
        expectCounterClockwise(mesh);

        const double expected = 0.5 * n * 0.64 * std::sin(2.0 * std::numbers::pi / n);
        EXPECT_NEAR(geom::coveredArea(mesh), expected, 1e-4) << n;
    }
}

TEST(Tessellator, ClockwiseInputYieldsCounterClockwiseTriangles)
{
    const Tessellator  tess;
    const TriangleMesh mesh = tess.tessellate(outlineOf({{0.0f, 0.0f}, {0.0f, 1.0f}, {1.0f, 1.0f}, {1.0f, 0.0f}}));

    EXPECT_EQ(mesh.triangleCount(), 2u);
    EXPECT_NEAR(geom::coveredArea(mesh), 1.0, 1e-6);
    expectCounterClockwise(mesh);
}

TEST(Tessellator, ConcaveLShape)
{
    const Tessellator  tess;
    const TriangleMesh mesh = tess.tessellate(outlineOf({{0.0f, 0.0f},
                                                         {2.0f, 0.0f},
                                                         {2.0f, 1.0f},
                                                         {1.0f, 1.0f},
                                                         {1.0f, 2.0f},
                                                         {0.0f, 2.0f}}));

    ASSERT_TRUE(geom::isWellFormed(mesh));
    EXPECT_EQ(mesh.vertices.size(), 6u);
    EXPECT_EQ(mesh.triangleCount(), 4u);
    EXPECT_NEAR(geom::coveredArea(mesh), 3.0, 1e-6);
    expectCounterClockwise(mesh);
}

TEST(Tessellator, ClosingPointIsIgnored)
{
    const Tessellator  tess;
    const TriangleMesh mesh =
        tess.tessellate(outlineOf({{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}, {0.0f, 0.0f}}));

    EXPECT_EQ(mesh.vertices.size(), 4u);
    EXPECT_EQ(mesh.triangleCount(), 2u);
}

TEST(Tessellator, CollinearPointOnEdgeAddsNoArea)
{
    const Tessellator  tess;
    const TriangleMesh mesh =
        tess.tessellate(outlineOf({{0.0f, 0.0f}, {0.5f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}}));

    ASSERT_TRUE(geom::isWellFormed(mesh));
    EXPECT_NEAR(geom::coveredArea(mesh), 1.0, 1e-6);
    expectCounterClockwise(mesh);
}

// ------------------------------------------------------------
// Degenerate input
// ------------------------------------------------------------

TEST(Tessellator, DegenerateOutlinesAreEmpty)
{
    const Tessellator tess;

    EXPECT_TRUE(tess.tessellate(outlineOf({})).empty());
    EXPECT_TRUE(tess.tessellate(outlineOf({{0.0f, 0.0f}, {1.0f, 1.0f}})).empty());
    EXPECT_TRUE(tess.tessellate(outlineOf({{0.0f, 0.0f}, {0.5f, 0.5f}, {1.0f, 1.0f}})).empty());
    EXPECT_TRUE(tess.tessellate(outlineOf({{0.3f, 0.3f}, {0.3f, 0.3f}, {0.3f, 0.3f}, {0.3f, 0.3f}})).empty());
}

TEST(Tessellator, NonFiniteCoordinatesAreEmpty)
{
    const Tessellator tess;
    const float       nan = std::numeric_limits<float>::quiet_NaN();
    const float       inf = std::numeric_limits<float>::infinity();

    const TriangleMesh a = tess.tessellate(outlineOf({{0.0f, 0.0f}, {nan, 0.0f}, {0.0f, 1.0f}}));
    const TriangleMesh b = tess.tessellate(outlineOf({{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, inf}, {0.0f, 1.0f}}));

    EXPECT_TRUE(a.empty());
    EXPECT_TRUE(a.vertices.empty());
    EXPECT_TRUE(b.empty());
}

// ------------------------------------------------------------
// Self-intersecting outlines
// ------------------------------------------------------------

TEST(Tessellator, BowtieFillsBothLobes)
{
    const Tessellator tess;

    for (WindingRule rule : {WindingRule::NonZero, WindingRule::EvenOdd})
    {
        const TriangleMesh mesh = tess.tessellate(outlineOf({{0.0f, 0.0f}, {2.0f, 2.0f}, {2.0f, 0.0f}, {0.0f, 2.0f}}, rule));

        ASSERT_TRUE(geom::isWellFormed(mesh));
        EXPECT_NEAR(geom::coveredArea(mesh), 2.0, 1e-6);
        expectCounterClockwise(mesh);
    }
}

TEST(Tessellator, DoubleLoopDependsOnWindingRule)
{
    const Tessellator             tess;
    const std::vector<glm::vec2> twice = {{0.0f, 0.0f},
                                          {1.0f, 0.0f},
                                          {1.0f, 1.0f},
                                          {0.0f, 1.0f},
                                          {0.0f, 0.0f},
                                          {1.0f, 0.0f},
                                          {1.0f, 1.0f},
                                          {0.0f, 1.0f}};

    const TriangleMesh nonZero = tess.tessellate(outlineOf(twice, WindingRule::NonZero));
    const TriangleMesh evenOdd = tess.tessellate(outlineOf(twice, WindingRule::EvenOdd));

    EXPECT_NEAR(geom::coveredArea(nonZero), 1.0, 1e-6);
    expectCounterClockwise(nonZero);

    EXPECT_TRUE(evenOdd.empty());
}

TEST(Tessellator, PentagramCenterFollowsWindingRule)
{
    const Tessellator tess;

    const TriangleMesh nonZero = tess.tessellate(outlineOf(pentagram(1.0f), WindingRule::NonZero));
    const TriangleMesh evenOdd = tess.tessellate(outlineOf(pentagram(1.0f), WindingRule::EvenOdd));

    ASSERT_TRUE(geom::isWellFormed(nonZero));
    ASSERT_TRUE(geom::isWellFormed(evenOdd));
    ASSERT_FALSE(evenOdd.empty());

    expectCounterClockwise(nonZero);
    expectCounterClockwise(evenOdd);

    // Even-odd leaves the inner pentagon open.
    EXPECT_GT(geom::coveredArea(nonZero), geom::coveredArea(evenOdd) + 0.1);
}

// ------------------------------------------------------------
// Determinism + shape descriptors
// ------------------------------------------------------------

TEST(Tessellator, SameInputGivesIdenticalMesh)
{
    const Tessellator tess;

    const Outline simple  = outlineOf(regularPolygon(17, 0.5f));
    const Outline crossed = outlineOf(pentagram(0.7f));

    EXPECT_TRUE(geom::bytewiseEqual(tess.tessellate(simple), tess.tessellate(simple)));
    EXPECT_TRUE(geom::bytewiseEqual(tess.tessellate(crossed), tess.tessellate(crossed)));
}

TEST(Tessellator, TessellatesShapeDescriptors)
{
    const Tessellator tess;

    ShapeDescriptor rect;
    rect.geometry = Rect{{0.0f, 0.0f}, {100.0f, 50.0f}};
    rect.space    = CoordinateSpace::Pixels;
    rect.color    = colors::GREEN;

    const TriangleMesh r = tess.tessellate(rect, Extent2D{200, 100});
    EXPECT_EQ(r.triangleCount(), 2u);
    EXPECT_NEAR(geom::coveredArea(r), 1.0, 1e-6); // a quarter of the 2x2 NDC square
    expectCounterClockwise(r);

    ShapeDescriptor circle;
    circle.geometry = Circle{{0.0f, 0.0f}, 0.5f};

    const uint32_t     n = circleSegmentCount(0.5f, tess.options());
    const TriangleMesh c = tess.tessellate(circle, {});
    EXPECT_EQ(c.triangleCount(), n - 2);

    // Area of the inscribed n-gon
    const double inscribed = 0.5 * n * 0.25 * std::sin(2.0 * std::numbers::pi / n);
    EXPECT_NEAR(geom::coveredArea(c), inscribed, 1e-4);
}
