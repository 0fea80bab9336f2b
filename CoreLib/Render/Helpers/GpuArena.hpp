#pragma once

#include <cstdint>
#include <span>
#include <vulkan/vulkan.h>

#include "GpuBuffer.hpp"
#include "VulkanContext.hpp"

namespace plaster
{
    /// One CPU range to land at a byte offset in the arena.
    struct ArenaWrite
    {
        VkDeviceSize dstOffset = 0;
        const void*  data      = nullptr;
        VkDeviceSize size      = 0;
    };

    /**
     * @brief Growable DEVICE_LOCAL buffer fed through staging copies recorded
     * into the frame command buffer.
     *
     * Growth keeps existing contents: a new buffer of geom::grownCapacity()
     * bytes is created, the old one is copied into it on the GPU, and the old
     * buffer is handed to the deferred deletion queue of the recording frame.
     */
    class GpuArena
    {
    public:
        GpuArena() = default;

        GpuArena(const GpuArena&)            = delete;
        GpuArena& operator=(const GpuArena&) = delete;

        void init(const VulkanContext* ctx,
                  VkBufferUsageFlags   usage,
                  VkDeviceSize         initialCapacity,
                  const char*          name,
                  bool                 verbose = false) noexcept;

        void destroy();

        /**
         * @brief Ensure at least required bytes of capacity.
         *
         * On growth, records old -> new copy plus a transfer barrier into cmd.
         * On failure the current buffer is left intact.
         */
        bool reserve(VkCommandBuffer cmd, DeferredDeletion& deferred, uint32_t frameIndex, VkDeviceSize required);

        /// Stage all writes through one host-visible buffer and record the copies.
        bool write(VkCommandBuffer cmd, DeferredDeletion& deferred, uint32_t frameIndex, std::span<const ArenaWrite> writes);

        [[nodiscard]] bool valid() const noexcept
        {
            return m_buffer.valid();
        }

        [[nodiscard]] VkBuffer buffer() const noexcept
        {
            return m_buffer.buffer();
        }

        [[nodiscard]] VkDeviceSize capacity() const noexcept
        {
            return m_buffer.size();
        }

    private:
        const VulkanContext* m_ctx             = nullptr;
        VkBufferUsageFlags   m_usage           = 0;
        VkDeviceSize         m_initialCapacity = 0;
        const char*          m_name            = "GpuArena";
        bool                 m_verbose         = false;

        GpuBuffer m_buffer;
    };

} // namespace plaster
