#pragma once

#include <array>
#include <memory>
#include <vector>
#include <vulkan/vulkan.h>

#include "Engine.hpp"
#include "EngineErrors.hpp"
#include "EngineSettings.hpp"
#include "FrameBackend.hpp"
#include "GpuArena.hpp"
#include "VulkanContext.hpp"

namespace plaster
{
    /**
     * @brief Vulkan device, swapchain and fill pipeline for one surface.
     *
     * Creation order: physical device -> logical device -> surface policy
     * (sRGB / FIFO / opaque) -> render pass -> frame resources -> swapchain ->
     * pipeline. The render pass and pipeline live as long as the context;
     * reconfigure() only rebuilds the swapchain, its views and framebuffers.
     *
     * The VkInstance and VkSurfaceKHR are borrowed from the embedder.
     */
    class GraphicsContext final : public FrameBackend
    {
    public:
        [[nodiscard]] static DeviceInitError create(const SurfaceTarget&              target,
                                                    Extent2D                          extent,
                                                    const EngineSettings&             settings,
                                                    std::unique_ptr<GraphicsContext>& out);

        ~GraphicsContext() override;

        GraphicsContext(const GraphicsContext&)            = delete;
        GraphicsContext(GraphicsContext&&)                 = delete;
        GraphicsContext& operator=(const GraphicsContext&) = delete;
        GraphicsContext& operator=(GraphicsContext&&)      = delete;

        // ------------------------------------------------------------
        // FrameBackend
        // ------------------------------------------------------------
        SurfaceAcquireError acquireTarget(FrameTarget& target) override;
        bool                uploadGeometry(const FrameTarget& target, const GeometryUploadPlan& plan) override;
        void                beginPass(const FrameTarget& target, const glm::vec4& clearColor) override;
        void                bindPipelineAndBuffers(const FrameTarget& target) override;
        void                drawIndexed(const FrameTarget& target, const DrawCall& draw) override;
        void                endPass(const FrameTarget& target) override;
        bool                submit(const FrameTarget& target) override;
        SurfaceAcquireError present(const FrameTarget& target) override;
        ReconfigureError    reconfigure(Extent2D extent) override;
        Extent2D            extent() const override;

    private:
        GraphicsContext(const SurfaceTarget& target, const EngineSettings& settings);

        struct FrameSlot
        {
            VkCommandBuffer cmd            = VK_NULL_HANDLE;
            VkFence         fence          = VK_NULL_HANDLE;
            VkSemaphore     imageAvailable = VK_NULL_HANDLE;
        };

        DeviceInitError pickPhysicalDevice();
        DeviceInitError createDevice();
        DeviceInitError chooseSurfacePolicy();
        bool            createRenderPass();
        bool            createFrameResources();
        bool            createFrameSync();
        void            destroyFrameSync() noexcept;
        DeviceInitError createPipeline();

        /// False with zeroExtent set when the surface is currently 0x0 (minimized).
        bool createSwapchain(Extent2D requested, bool& zeroExtent);
        void destroySwapchainObjects() noexcept;
        bool rebuildSwapchain(Extent2D requested, bool& zeroExtent);

        void shutdown() noexcept;

        [[nodiscard]] VkExtent2D chooseExtent(const VkSurfaceCapabilitiesKHR& caps, Extent2D requested) const noexcept;

    private:
        SurfaceTarget  m_target;
        EngineSettings m_settings;
        VulkanContext  m_ctx = {};

        // Surface policy, fixed at creation
        VkSurfaceFormatKHR m_surfaceFormat = {};
        VkPresentModeKHR   m_presentMode   = VK_PRESENT_MODE_FIFO_KHR;

        // Surface-dependent state
        VkSwapchainKHR             m_swapchain      = VK_NULL_HANDLE;
        VkExtent2D                 m_swapExtent     = {};
        std::vector<VkImage>       m_images         = {};
        std::vector<VkImageView>   m_views          = {};
        std::vector<VkFramebuffer> m_framebuffers   = {};
        std::vector<VkSemaphore>   m_renderFinished = {}; // one per swapchain image

        Extent2D m_requestedExtent = {};
        bool     m_stale           = false;

        // Context-lifetime state
        VkRenderPass     m_renderPass     = VK_NULL_HANDLE;
        VkPipelineLayout m_pipelineLayout = VK_NULL_HANDLE;
        VkPipeline       m_pipeline       = VK_NULL_HANDLE;

        VkCommandPool                                     m_cmdPool    = VK_NULL_HANDLE;
        std::array<FrameSlot, vkcfg::kMaxFramesInFlight> m_frames     = {};
        uint32_t                                          m_frameIndex = 0;
        DeferredDeletion                                  m_deferred   = {};

        GpuArena m_vertexArena;
        GpuArena m_indexArena;
    };

} // namespace plaster
