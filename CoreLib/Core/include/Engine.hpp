#pragma once

#include <cstdint>
#include <glm/vec4.hpp>
#include <memory>
#include <span>
#include <unordered_map>
#include <vector>
#include <vulkan/vulkan.h>

#include "EngineErrors.hpp"
#include "EngineSettings.hpp"
#include "FrameBackend.hpp"
#include "FrameRenderer.hpp"
#include "GeometryBuffer.hpp"
#include "MeshCache.hpp"
#include "ShapeDescriptor.hpp"

namespace plaster
{
    /**
     * @brief Platform surface the engine draws into. Both handles stay owned by
     * the embedder and must outlive the Engine.
     */
    struct SurfaceTarget
    {
        VkInstance   instance = VK_NULL_HANDLE;
        VkSurfaceKHR surface  = VK_NULL_HANDLE;
    };

    /**
     * @brief Draw-only 2D fill renderer.
     *
     * Usage:
     * @code
     * std::unique_ptr<plaster::Engine> engine;
     * if (plaster::Engine::create(target, {w, h}, {}, engine) != plaster::DeviceInitError::None)
     *     return;
     * engine->submitShapes(shapes);
     * (void)engine->renderFrame(plaster::colors::BLACK);
     * @endcode
     *
     * All calls come from one thread. The engine starts no threads of its own.
     */
    class Engine
    {
    public:
        [[nodiscard]] static DeviceInitError create(const SurfaceTarget&   target,
                                                    Extent2D               extent,
                                                    const EngineSettings&  settings,
                                                    std::unique_ptr<Engine>& out);

        /// Engine over an arbitrary presentation backend.
        Engine(std::unique_ptr<FrameBackend> backend, const EngineSettings& settings);
        ~Engine();

        Engine(const Engine&)            = delete;
        Engine& operator=(const Engine&) = delete;

        /// Tessellate (or fetch from cache) and pack the shapes as a new batch.
        BatchHandle submitShapes(std::span<const ShapeDescriptor> shapes);

        /// Replace the shapes of a batch. Returns false for an unknown handle.
        bool updateBatch(BatchHandle handle, std::span<const ShapeDescriptor> shapes);

        bool releaseBatch(BatchHandle handle);
        void clear();

        [[nodiscard]] SurfaceAcquireError renderFrame(const glm::vec4& clearColor);
        [[nodiscard]] SurfaceAcquireError renderFrame();

        /// Zero extents are rejected without touching any state.
        [[nodiscard]] ReconfigureError resize(Extent2D extent);

        [[nodiscard]] Extent2D extent() const noexcept;

        [[nodiscard]] const EngineSettings& settings() const noexcept
        {
            return m_settings;
        }

        [[nodiscard]] const MeshCache& meshCache() const noexcept
        {
            return m_cache;
        }

        [[nodiscard]] const GeometryBuffer& geometry() const noexcept
        {
            return m_geometry;
        }

        [[nodiscard]] const FrameRenderer& renderer() const noexcept
        {
            return m_renderer;
        }

    private:
        struct BatchRecord
        {
            std::vector<ShapeDescriptor> shapes;
            bool                         hasPixelShapes = false;
        };

        [[nodiscard]] PackedBatch pack(const std::vector<ShapeDescriptor>& shapes);

        /// Repack pixel-space batches when the surface extent differs from the one they were packed for.
        void relayout(Extent2D extent);
        [[nodiscard]] static BatchRecord makeRecord(std::span<const ShapeDescriptor> shapes);
        [[nodiscard]] static bool        sameComposition(const std::vector<ShapeDescriptor>& a,
                                                         std::span<const ShapeDescriptor>    b) noexcept;

    private:
        std::unique_ptr<FrameBackend> m_backend;
        EngineSettings                m_settings;

        MeshCache      m_cache;
        GeometryBuffer m_geometry;
        FrameRenderer  m_renderer;

        std::unordered_map<BatchHandle, BatchRecord> m_batches;

        Extent2D m_layoutExtent = {}; // extent pixel-space batches are packed against
    };

} // namespace plaster
