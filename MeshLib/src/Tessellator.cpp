#include "Tessellator.hpp"

#include <algorithm>
#include <cmath>
#include <glm/vec2.hpp>
#include <map>
#include <utility>

namespace plaster
{
    namespace
    {
        using DVec = glm::dvec2;

        // Twice the enclosed area below which an outline is treated as degenerate.
        constexpr double kDegenerateArea2 = 1e-12;

        // Slabs thinner than this are skipped by the sweep.
        constexpr double kMinSlabHeight = 1e-12;

        // ------------------------------------------------------------
        // Primitive predicates
        // ------------------------------------------------------------

        double cross(const DVec& o, const DVec& a, const DVec& b) noexcept
        {
            return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
        }

        double cross(const DVec& a, const DVec& b) noexcept
        {
            return a.x * b.y - a.y * b.x;
        }

        int orient(const DVec& a, const DVec& b, const DVec& c) noexcept
        {
            const double v = cross(a, b, c);
            if (v > 0.0)
                return 1;
            if (v < 0.0)
                return -1;
            return 0;
        }

        // Assumes a, b, p are collinear.
        bool onSegment(const DVec& a, const DVec& b, const DVec& p) noexcept
        {
            return std::min(a.x, b.x) <= p.x && p.x <= std::max(a.x, b.x) &&
                   std::min(a.y, b.y) <= p.y && p.y <= std::max(a.y, b.y);
        }

        // Closed segments, touching counts.
        bool segmentsIntersect(const DVec& a, const DVec& b, const DVec& c, const DVec& d) noexcept
        {
            const int o1 = orient(a, b, c);
            const int o2 = orient(a, b, d);
            const int o3 = orient(c, d, a);
            const int o4 = orient(c, d, b);

            if (o1 * o2 < 0 && o3 * o4 < 0)
                return true;

            if (o1 == 0 && onSegment(a, b, c))
                return true;
            if (o2 == 0 && onSegment(a, b, d))
                return true;
            if (o3 == 0 && onSegment(c, d, a))
                return true;
            if (o4 == 0 && onSegment(c, d, b))
                return true;

            return false;
        }

        // Inclusive: points on the boundary count as inside.
        bool pointInTriangle(const DVec& p, const DVec& a, const DVec& b, const DVec& c) noexcept
        {
            const int o1 = orient(a, b, p);
            const int o2 = orient(b, c, p);
            const int o3 = orient(c, a, p);
            return o1 >= 0 && o2 >= 0 && o3 >= 0;
        }

        // ------------------------------------------------------------
        // Input cleanup
        // ------------------------------------------------------------

        /// Drop consecutive duplicates (including the closing point). False on non-finite input.
        bool cleanOutline(const std::vector<glm::vec2>& in, std::vector<glm::vec2>& out)
        {
            out.clear();
            out.reserve(in.size());

            for (const glm::vec2& p : in)
            {
                if (!std::isfinite(p.x) || !std::isfinite(p.y))
                {
                    out.clear();
                    return false;
                }

                if (out.empty() || out.back() != p)
                    out.push_back(p);
            }

            while (out.size() > 1 && out.front() == out.back())
                out.pop_back();

            return true;
        }

        double signedArea2(const std::vector<DVec>& pts) noexcept
        {
            double a = 0.0;
            const std::size_t n = pts.size();
            for (std::size_t i = 0; i < n; ++i)
            {
                const DVec& p = pts[i];
                const DVec& q = pts[(i + 1) % n];
                a += p.x * q.y - q.x * p.y;
            }
            return a;
        }

        /// No crossings, no touching edges, no collinear fold-backs.
        bool isSimple(const std::vector<DVec>& pts) noexcept
        {
            const std::size_t n = pts.size();

            for (std::size_t i = 0; i < n; ++i)
            {
                const DVec& a = pts[i];
                const DVec& b = pts[(i + 1) % n];
                const DVec& c = pts[(i + 2) % n];

                // Edge doubling back over its predecessor.
                if (orient(a, b, c) == 0)
                {
                    const DVec ba = a - b;
                    const DVec bc = c - b;
                    if (ba.x * bc.x + ba.y * bc.y > 0.0)
                        return false;
                }
            }

            for (std::size_t i = 0; i < n; ++i)
            {
                const DVec& a = pts[i];
                const DVec& b = pts[(i + 1) % n];

                for (std::size_t j = i + 2; j < n; ++j)
                {
                    if (i == 0 && j == n - 1)
                        continue; // adjacent through the closing edge

                    const DVec& c = pts[j];
                    const DVec& d = pts[(j + 1) % n];

                    if (segmentsIntersect(a, b, c, d))
                        return false;
                }
            }

            return true;
        }

        // ------------------------------------------------------------
        // Ear clipping
        // ------------------------------------------------------------

        /**
         * Triangulates a simple polygon. Emits counter-clockwise triangles indexing
         * straight into pts. Collinear vertices are dropped without a triangle.
         * Returns false if no ear can be found, leaving indices untouched.
         */
        bool earClip(const std::vector<DVec>& pts, bool ccw, std::vector<uint32_t>& indices)
        {
            const uint32_t n = static_cast<uint32_t>(pts.size());

            std::vector<uint32_t> rem;
            rem.reserve(n);
            if (ccw)
            {
                for (uint32_t i = 0; i < n; ++i)
                    rem.push_back(i);
            }
            else
            {
                for (uint32_t i = n; i-- > 0;)
                    rem.push_back(i);
            }

            std::vector<uint32_t> out;
            out.reserve((n - 2) * 3);

            std::size_t cursor = 0;
            std::size_t stall  = 0;

            while (rem.size() > 3)
            {
                const std::size_t m = rem.size();
                if (cursor >= m)
                    cursor = 0;

                const uint32_t prev = rem[(cursor + m - 1) % m];
                const uint32_t cur  = rem[cursor];
                const uint32_t next = rem[(cursor + 1) % m];

                const int o = orient(pts[prev], pts[cur], pts[next]);

                bool clip = false;
                bool emit = false;

                if (o == 0)
                {
                    clip = true;
                }
                else if (o > 0)
                {
                    clip = true;
                    for (uint32_t k : rem)
                    {
                        if (k == prev || k == cur || k == next)
                            continue;
                        if (pointInTriangle(pts[k], pts[prev], pts[cur], pts[next]))
                        {
                            clip = false;
                            break;
                        }
                    }
                    emit = clip;
                }

                if (!clip)
                {
                    ++cursor;
                    if (++stall >= m)
                        return false;
                    continue;
                }

                if (emit)
                {
                    out.push_back(prev);
                    out.push_back(cur);
                    out.push_back(next);
                }

                rem.erase(rem.begin() + static_cast<std::ptrdiff_t>(cursor));
                stall = 0;
            }

            if (rem.size() == 3 && orient(pts[rem[0]], pts[rem[1]], pts[rem[2]]) > 0)
            {
                out.push_back(rem[0]);
                out.push_back(rem[1]);
                out.push_back(rem[2]);
            }

            indices.insert(indices.end(), out.begin(), out.end());
            return true;
        }

        // ------------------------------------------------------------
        // Slab sweep for self-intersecting outlines
        // ------------------------------------------------------------

        struct SweepEdge
        {
            DVec     lo    = {};
            DVec     hi    = {};
            int      dir   = 0;
            uint32_t order = 0;

            double xAt(double y) const noexcept
            {
                if (y == lo.y)
                    return lo.x;
                if (y == hi.y)
                    return hi.x;
                return lo.x + (hi.x - lo.x) * (y - lo.y) / (hi.y - lo.y);
            }
        };

        struct SlabEdge
        {
            double   x0    = 0.0;
            double   x1    = 0.0;
            int      dir   = 0;
            uint32_t order = 0;
        };

        bool isInside(int winding, WindingRule rule) noexcept
        {
            if (rule == WindingRule::EvenOdd)
                return (winding & 1) != 0;
            return winding != 0;
        }

        class MeshBuilder
        {
        public:
            MeshBuilder(TriangleMesh& mesh, const glm::vec4& color) : m_mesh{mesh}, m_color{color}
            {
            }

            void triangle(const DVec& a, const DVec& b, const DVec& c)
            {
                const glm::vec2 fa{static_cast<float>(a.x), static_cast<float>(a.y)};
                const glm::vec2 fb{static_cast<float>(b.x), static_cast<float>(b.y)};
                const glm::vec2 fc{static_cast<float>(c.x), static_cast<float>(c.y)};

                // Rounded positions decide orientation, since they are what gets drawn.
                if (orient(DVec(fa), DVec(fb), DVec(fc)) <= 0)
                    return;

                m_mesh.indices.push_back(vertex(fa));
                m_mesh.indices.push_back(vertex(fb));
                m_mesh.indices.push_back(vertex(fc));
            }

        private:
            uint32_t vertex(const glm::vec2& p)
            {
                const auto key = std::make_pair(p.x, p.y);
                auto       it  = m_lookup.find(key);
                if (it != m_lookup.end())
                    return it->second;

                const uint32_t idx = static_cast<uint32_t>(m_mesh.vertices.size());
                m_mesh.vertices.push_back(Vertex{p, m_color});
                m_lookup.emplace(key, idx);
                return idx;
            }

        private:
            TriangleMesh&                              m_mesh;
            glm::vec4                                  m_color;
            std::map<std::pair<float, float>, uint32_t> m_lookup;
        };

        void sweepFill(const std::vector<DVec>& pts, WindingRule rule, MeshBuilder& builder)
        {
            const std::size_t n = pts.size();

            std::vector<SweepEdge> edges;
            edges.reserve(n);

            std::vector<double> ys;
            ys.reserve(n * 2);

            for (std::size_t i = 0; i < n; ++i)
            {
                const DVec& a = pts[i];
                const DVec& b = pts[(i + 1) % n];
                ys.push_back(a.y);

                if (a.y == b.y)
                    continue; // horizontal edges never change the winding across a slab

                SweepEdge e;
                e.order = static_cast<uint32_t>(edges.size());
                if (a.y < b.y)
                {
                    e.lo  = a;
                    e.hi  = b;
                    e.dir = 1;
                }
                else
                {
                    e.lo  = b;
                    e.hi  = a;
                    e.dir = -1;
                }
                edges.push_back(e);
            }

            // Crossing heights split slabs so edges never swap order inside one.
            for (std::size_t i = 0; i < edges.size(); ++i)
            {
                const SweepEdge& ea = edges[i];
                const DVec       r  = ea.hi - ea.lo;

                for (std::size_t j = i + 1; j < edges.size(); ++j)
                {
                    const SweepEdge& eb = edges[j];
                    if (eb.hi.y <= ea.lo.y || eb.lo.y >= ea.hi.y)
                        continue;

                    const DVec   s     = eb.hi - eb.lo;
                    const double denom = cross(r, s);
                    if (denom == 0.0)
                        continue;

                    const DVec   qp = eb.lo - ea.lo;
                    const double t  = cross(qp, s) / denom;
                    const double u  = cross(qp, r) / denom;

                    if (t > 0.0 && t < 1.0 && u > 0.0 && u < 1.0)
                        ys.push_back(ea.lo.y + t * r.y);
                }
            }

            std::sort(ys.begin(), ys.end());
            ys.erase(std::unique(ys.begin(), ys.end()), ys.end());

            std::vector<SlabEdge> slab;
            slab.reserve(edges.size());

            for (std::size_t s = 0; s + 1 < ys.size(); ++s)
            {
                const double y0 = ys[s];
                const double y1 = ys[s + 1];
                if (y1 - y0 <= kMinSlabHeight)
                    continue;

                slab.clear();
                for (const SweepEdge& e : edges)
                {
                    if (e.lo.y <= y0 && e.hi.y >= y1)
                        slab.push_back(SlabEdge{e.xAt(y0), e.xAt(y1), e.dir, e.order});
                }

                if (slab.size() < 2)
                    continue;

                std::sort(slab.begin(), slab.end(), [](const SlabEdge& a, const SlabEdge& b) {
                    const double ma = a.x0 + a.x1;
                    const double mb = b.x0 + b.x1;
                    if (ma != mb)
                        return ma < mb;
                    if (a.x0 != b.x0)
                        return a.x0 < b.x0;
                    return a.order < b.order;
                });

                // Walk left to right, merging adjacent inside spans into one trapezoid.
                int         winding   = 0;
                std::size_t spanStart = 0;
                bool        open      = false;

                for (std::size_t k = 0; k + 1 < slab.size(); ++k)
                {
                    winding += slab[k].dir;
                    if (!isInside(winding, rule))
                        continue;

                    if (!open)
                    {
                        spanStart = k;
                        open      = true;
                    }

                    const bool continues = k + 2 < slab.size() && isInside(winding + slab[k + 1].dir, rule);
                    if (continues)
                        continue;

                    const SlabEdge& l = slab[spanStart];
                    const SlabEdge& r = slab[k + 1];

                    const DVec bl{l.x0, y0};
                    const DVec br{r.x0, y0};
                    const DVec tr{r.x1, y1};
                    const DVec tl{l.x1, y1};

                    builder.triangle(bl, br, tr);
                    builder.triangle(bl, tr, tl);
                    open = false;
                }
            }
        }

    } // namespace

    Tessellator::Tessellator(const OutlineOptions& options) noexcept : m_options{options}
    {
    }

    TriangleMesh Tessellator::tessellate(const Outline& outline) const
    {
        TriangleMesh mesh;

        std::vector<glm::vec2> clean;
        if (!cleanOutline(outline.points, clean) || clean.size() < 3)
            return mesh;

        std::vector<DVec> pts;
        pts.reserve(clean.size());
        for (const glm::vec2& p : clean)
            pts.emplace_back(p);

        const double area2 = signedArea2(pts);

        if (isSimple(pts))
        {
            if (std::abs(area2) <= kDegenerateArea2)
                return mesh;

            std::vector<uint32_t> indices;
            if (earClip(pts, area2 > 0.0, indices))
            {
                mesh.vertices.reserve(clean.size());
                for (const glm::vec2& p : clean)
                    mesh.vertices.push_back(Vertex{p, outline.color});
                mesh.indices = std::move(indices);

                if (mesh.indices.empty())
                    mesh.clear();
                return mesh;
            }
        }

        MeshBuilder builder{mesh, outline.color};
        sweepFill(pts, outline.winding, builder);

        return mesh;
    }

    TriangleMesh Tessellator::tessellate(const ShapeDescriptor& shape, Extent2D extent) const
    {
        return tessellate(normalizeOutline(shape, extent, m_options));
    }

} // namespace plaster
