#include "Engine.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>

#include "GraphicsContext.hpp"

namespace plaster
{
    DeviceInitError Engine::create(const SurfaceTarget&     target,
                                   Extent2D                 extent,
                                   const EngineSettings&    settings,
                                   std::unique_ptr<Engine>& out)
    {
        out.reset();

        const EngineSettings s = settings.sanitized();

        std::unique_ptr<GraphicsContext> ctx;
        if (const DeviceInitError err = GraphicsContext::create(target, extent, s, ctx); err != DeviceInitError::None)
        {
            std::cerr << "Engine: create failed (" << toString(err) << ")\n";
            return err;
        }

        out = std::make_unique<Engine>(std::move(ctx), s);
        return DeviceInitError::None;
    }

    Engine::Engine(std::unique_ptr<FrameBackend> backend, const EngineSettings& settings)
        : m_backend{std::move(backend)},
          m_settings{settings.sanitized()},
          m_cache{m_settings.outlineOptions()},
          m_renderer{*m_backend, m_settings.verbose},
          m_layoutExtent{m_backend->extent()}
    {
        // The surface can change size on its own (an out-of-date swapchain is rebuilt at acquire).
        m_renderer.setTargetListener([this](Extent2D extent) { relayout(extent); });
    }

    Engine::~Engine() = default;

    // --------------------------------------------------------
    // Batches
    // --------------------------------------------------------

    Engine::BatchRecord Engine::makeRecord(std::span<const ShapeDescriptor> shapes)
    {
        BatchRecord rec;
        rec.shapes.assign(shapes.begin(), shapes.end());
        rec.hasPixelShapes = std::any_of(shapes.begin(), shapes.end(), [](const ShapeDescriptor& s) {
            return s.space == CoordinateSpace::Pixels;
        });
        return rec;
    }

    bool Engine::sameComposition(const std::vector<ShapeDescriptor>& a, std::span<const ShapeDescriptor> b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            const ShapeDescriptor& x = a[i];
            const ShapeDescriptor& y = b[i];

            // Anonymous shapes carry no version to compare against.
            if (x.id == 0 || y.id == 0)
                return false;

            if (x.id != y.id || x.geometryVersion != y.geometryVersion || x.color != y.color ||
                x.winding != y.winding || x.layer != y.layer || x.space != y.space)
                return false;
        }
        return true;
    }

    PackedBatch Engine::pack(const std::vector<ShapeDescriptor>& shapes)
    {
        // Layers ascend; submission order breaks ties.
        std::vector<std::size_t> order(shapes.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return shapes[a].layer < shapes[b].layer;
        });

        PackedBatch batch;
        for (std::size_t i : order)
            batch.append(m_cache.lookup(shapes[i], m_layoutExtent));

        return batch;
    }

    BatchHandle Engine::submitShapes(std::span<const ShapeDescriptor> shapes)
    {
        BatchRecord       rec    = makeRecord(shapes);
        PackedBatch       packed = pack(rec.shapes);
        const BatchHandle handle = m_geometry.addBatch(std::move(packed));

        if (m_settings.verbose)
            std::cerr << "Engine: batch " << handle << " submitted with " << rec.shapes.size() << " shape(s)\n";

        m_batches.emplace(handle, std::move(rec));
        return handle;
    }

    bool Engine::updateBatch(BatchHandle handle, std::span<const ShapeDescriptor> shapes)
    {
        auto it = m_batches.find(handle);
        if (it == m_batches.end())
            return false;

        if (sameComposition(it->second.shapes, shapes))
            return true;

        it->second = makeRecord(shapes);
        return m_geometry.replaceBatch(handle, pack(it->second.shapes));
    }

    bool Engine::releaseBatch(BatchHandle handle)
    {
        auto it = m_batches.find(handle);
        if (it == m_batches.end())
            return false;

        for (const ShapeDescriptor& s : it->second.shapes)
        {
            if (s.id != 0)
                m_cache.erase(s.id);
        }

        m_batches.erase(it);
        return m_geometry.removeBatch(handle);
    }

    void Engine::clear()
    {
        m_batches.clear();
        m_geometry.clear();
        m_cache.clear();
    }

    // --------------------------------------------------------
    // Frames
    // --------------------------------------------------------

    SurfaceAcquireError Engine::renderFrame(const glm::vec4& clearColor)
    {
        return m_renderer.render(m_geometry, clearColor);
    }

    SurfaceAcquireError Engine::renderFrame()
    {
        return renderFrame(m_settings.clearColor);
    }

    ReconfigureError Engine::resize(Extent2D extent)
    {
        if (extent.empty())
            return ReconfigureError::ZeroExtent;

        if (extent != m_backend->extent())
        {
            if (const ReconfigureError err = m_backend->reconfigure(extent); err != ReconfigureError::None)
            {
                std::cerr << "Engine: resize to " << extent.width << "x" << extent.height << " failed ("
                          << toString(err) << ")\n";
                return err;
            }
        }

        // The surface may settle on a clamped size, or may already have been rebuilt at acquire.
        relayout(m_backend->extent());
        return ReconfigureError::None;
    }

    void Engine::relayout(Extent2D extent)
    {
        if (extent.empty() || extent == m_layoutExtent)
            return;

        if (m_settings.verbose)
            std::cerr << "Engine: repacking pixel-space batches for " << extent.width << "x" << extent.height << "\n";

        m_layoutExtent = extent;

        // Pixel-space geometry maps to new NDC positions.
        for (auto& [handle, rec] : m_batches)
        {
            if (rec.hasPixelShapes)
                m_geometry.replaceBatch(handle, pack(rec.shapes));
        }
    }

    Extent2D Engine::extent() const noexcept
    {
        return m_backend->extent();
    }

} // namespace plaster
