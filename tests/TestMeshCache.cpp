#include <gtest/gtest.h>

#include "Colors.hpp"
#include "MeshCache.hpp"

using namespace plaster;

namespace
{
    ShapeDescriptor square(ShapeId id, uint64_t version, float size = 1.0f)
    {
        ShapeDescriptor s;
        s.id              = id;
        s.geometryVersion = version;
        s.geometry        = Polygon{{{0.0f, 0.0f}, {size, 0.0f}, {size, size}, {0.0f, size}}};
        s.color           = colors::BLUE;
        return s;
    }

    ShapeDescriptor pixelSquare(ShapeId id)
    {
        ShapeDescriptor s;
        s.id       = id;
        s.geometry = Rect{{0.0f, 0.0f}, {50.0f, 50.0f}};
        s.space    = CoordinateSpace::Pixels;
        return s;
    }
} // namespace

TEST(MeshCache, RepeatedLookupIsAHit)
{
    MeshCache             cache;
    const ShapeDescriptor s = square(7, 1);

    const TriangleMesh first = cache.lookup(s, {});
    const TriangleMesh& again = cache.lookup(s, {});

    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(geom::bytewiseEqual(first, again));
    EXPECT_TRUE(cache.contains(7, 1));
}

TEST(MeshCache, VersionBumpRetessellates)
{
    MeshCache cache;

    const double small = geom::coveredArea(cache.lookup(square(7, 1, 0.5f), {}));
    const double large = geom::coveredArea(cache.lookup(square(7, 2, 1.0f), {}));

    EXPECT_NEAR(small, 0.25, 1e-6);
    EXPECT_NEAR(large, 1.0, 1e-6);
    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(cache.contains(7, 1));
    EXPECT_TRUE(cache.contains(7, 2));
}

TEST(MeshCache, SameVersionKeepsCachedGeometry)
{
    MeshCache cache;

    (void)cache.lookup(square(7, 1, 0.5f), {});

    // Geometry changed without a version bump: the cached mesh is served.
    const TriangleMesh& mesh = cache.lookup(square(7, 1, 1.0f), {});
    EXPECT_NEAR(geom::coveredArea(mesh), 0.25, 1e-6);
    EXPECT_EQ(cache.hits(), 1u);
}

TEST(MeshCache, ColorChangeRecolorsWithoutTessellating)
{
    MeshCache       cache;
    ShapeDescriptor s = square(3, 1);

    (void)cache.lookup(s, {});

    s.color                  = colors::YELLOW;
    const TriangleMesh& mesh = cache.lookup(s, {});

    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.hits(), 1u);
    ASSERT_FALSE(mesh.vertices.empty());
    for (const Vertex& v : mesh.vertices)
        EXPECT_EQ(v.color, colors::YELLOW);
}

TEST(MeshCache, WindingChangeIsAMiss)
{
    MeshCache       cache;
    ShapeDescriptor s = square(3, 1);

    (void)cache.lookup(s, {});
    s.winding = WindingRule::EvenOdd;
    (void)cache.lookup(s, {});

    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_EQ(cache.hits(), 0u);
}

TEST(MeshCache, AnonymousShapesAreNeverStored)
{
    MeshCache             cache;
    const ShapeDescriptor s = square(0, 0);

    const TriangleMesh& a = cache.lookup(s, {});
    EXPECT_EQ(a.triangleCount(), 2u);

    (void)cache.lookup(s, {});

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_EQ(cache.hits(), 0u);
}

TEST(MeshCache, PixelShapesAreKeyedOnExtent)
{
    MeshCache             cache;
    const ShapeDescriptor px = pixelSquare(9);

    const double a = geom::coveredArea(cache.lookup(px, Extent2D{100, 100}));
    const double b = geom::coveredArea(cache.lookup(px, Extent2D{100, 100}));
    const double c = geom::coveredArea(cache.lookup(px, Extent2D{200, 200}));

    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_DOUBLE_EQ(a, b);
    EXPECT_NEAR(a, 1.0, 1e-6);  // quarter of the 2x2 NDC square
    EXPECT_NEAR(c, 0.25, 1e-6);
}

TEST(MeshCache, NdcShapesIgnoreExtent)
{
    MeshCache             cache;
    const ShapeDescriptor s = square(4, 1);

    (void)cache.lookup(s, Extent2D{100, 100});
    (void)cache.lookup(s, Extent2D{300, 200});

    EXPECT_EQ(cache.hits(), 1u);
}

TEST(MeshCache, EraseAndClear)
{
    MeshCache cache;

    (void)cache.lookup(square(1, 1), {});
    (void)cache.lookup(square(2, 1), {});
    ASSERT_EQ(cache.size(), 2u);

    cache.erase(1);
    EXPECT_FALSE(cache.contains(1, 1));
    EXPECT_TRUE(cache.contains(2, 1));

    cache.erase(42); // unknown id is a no-op
    EXPECT_EQ(cache.size(), 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}
