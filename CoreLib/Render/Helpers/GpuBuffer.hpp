#pragma once

#include <cstdint>
#include <vulkan/vulkan.h>

namespace plaster
{
    /**
     * Lightweight RAII wrapper around a Vulkan buffer + its device memory.
     *
     * - No implicit allocation in default ctor.
     * - Explicit create() / destroy().
     * - Move-only (no accidental copies).
     * - Optional persistent mapping for HOST_VISIBLE buffers (staging).
     */
    class GpuBuffer
    {
    public:
        GpuBuffer() = default;
        ~GpuBuffer();

        GpuBuffer(const GpuBuffer&)            = delete;
        GpuBuffer& operator=(const GpuBuffer&) = delete;
        GpuBuffer(GpuBuffer&& other) noexcept;
        GpuBuffer& operator=(GpuBuffer&& other) noexcept;

        bool create(VkDevice              device,
                    VkPhysicalDevice      physicalDevice,
                    VkDeviceSize          size,
                    VkBufferUsageFlags    usage,
                    VkMemoryPropertyFlags memoryFlags,
                    bool                  persistentMap = false);

        void destroy();

        /// Write into a HOST_VISIBLE buffer. Fails if [offset, offset+size) does not fit.
        bool upload(const void* data, VkDeviceSize size, VkDeviceSize offset = 0);

        [[nodiscard]] bool valid() const
        {
            return m_buffer != VK_NULL_HANDLE;
        }

        [[nodiscard]] VkBuffer buffer() const
        {
            return m_buffer;
        }

        [[nodiscard]] VkDeviceSize size() const
        {
            return m_size;
        }

    private:
        void moveFrom(GpuBuffer&& other);

    private:
        VkDevice              m_device     = VK_NULL_HANDLE;
        VkPhysicalDevice      m_physDevice = VK_NULL_HANDLE;
        VkBuffer              m_buffer     = VK_NULL_HANDLE;
        VkDeviceMemory        m_memory     = VK_NULL_HANDLE;
        void*                 m_mapped     = nullptr;
        VkDeviceSize          m_size       = 0;
        VkBufferUsageFlags    m_usage      = 0;
        VkMemoryPropertyFlags m_memFlags   = 0;
        bool                  m_persistent = false;
    };

} // namespace plaster
