#pragma once

#include <cstdint>
#include <functional>
#include <vector>
#include <vulkan/vulkan.h>

namespace plaster
{
    /**
     * @brief Vulkan configuration constants shared by the engine and its backends.
     */
    namespace vkcfg
    {
        /**
         * @brief Maximum number of frames-in-flight supported by the engine.
         *
         * Per-frame resources are sized to this constant. The runtime value in
         * EngineSettings::framesInFlight is clamped to [1, kMaxFramesInFlight]
         * before it is used for indexing.
         */
        static constexpr std::uint32_t kMaxFramesInFlight = 3;

        /// Index buffers are always 32-bit.
        static constexpr VkIndexType kIndexType = VK_INDEX_TYPE_UINT32;

    } // namespace vkcfg

    /**
     * @brief Per-frame deferred destruction queue.
     *
     * Delays destruction of Vulkan resources until the GPU can no longer use them.
     * The queue is indexed by frame-in-flight slot, not by swapchain image:
     *  - after waiting for the fence of slot fi, call flush(fi) to destroy what
     *    was queued the last time fi was recorded;
     *  - while recording slot fi, enqueue(fi, ...) anything the recorded commands
     *    still reference.
     *
     * Not thread-safe.
     */
    struct DeferredDeletion
    {
        std::vector<std::vector<std::move_only_function<void()>>> perFrame;

        void init(uint32_t framesInFlight)
        {
            perFrame.clear();
            perFrame.resize(framesInFlight);
        }

        void enqueue(uint32_t frameIndex, std::move_only_function<void()>&& fn)
        {
            if (frameIndex >= perFrame.size())
                return;
            perFrame[frameIndex].push_back(std::move(fn));
        }

        void flush(uint32_t frameIndex)
        {
            if (frameIndex >= perFrame.size())
                return;

            auto& q = perFrame[frameIndex];
            for (auto& fn : q)
                fn();
            q.clear();
        }

        void flushAll()
        {
            for (uint32_t i = 0; i < perFrame.size(); ++i)
                flush(i);
        }
    };

    /**
     * @brief Long-lived device handles shared by the GPU helpers.
     *
     * Owned by GraphicsContext. The instance is borrowed from the embedder.
     */
    struct VulkanContext
    {
        VkInstance       instance       = VK_NULL_HANDLE;
        VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
        VkDevice         device         = VK_NULL_HANDLE;

        VkQueue  graphicsQueue            = VK_NULL_HANDLE;
        uint32_t graphicsQueueFamilyIndex = 0;

        /// Already clamped to [1, vkcfg::kMaxFramesInFlight].
        uint32_t framesInFlight = 2;

        VkPhysicalDeviceProperties deviceProps{};
    };

    [[nodiscard]] inline bool deviceReady(const VulkanContext& ctx) noexcept
    {
        return ctx.device != VK_NULL_HANDLE && ctx.physicalDevice != VK_NULL_HANDLE;
    }

} // namespace plaster
