#include "GpuBuffer.hpp"

#include <cstring>
#include <iostream>
#include <utility>

#include "VkUtilities.hpp"

namespace plaster
{
    // --------------------------------------------------------
    // Create / destroy
    // --------------------------------------------------------

    bool GpuBuffer::create(VkDevice              device,
                           VkPhysicalDevice      physicalDevice,
                           VkDeviceSize          size,
                           VkBufferUsageFlags    usage,
                           VkMemoryPropertyFlags memoryFlags,
                           bool                  persistentMap)
    {
        destroy();

        if (!device || !physicalDevice || size == 0)
            return false;

        m_device     = device;
        m_physDevice = physicalDevice;
        m_size       = size;
        m_usage      = usage;
        m_memFlags   = memoryFlags;
        m_persistent = persistentMap;

        VkBufferCreateInfo bi{};
        bi.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bi.size        = m_size;
        bi.usage       = m_usage;
        bi.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        if (const VkResult r = vkCreateBuffer(m_device, &bi, nullptr, &m_buffer); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "GpuBuffer: vkCreateBuffer");
            m_buffer = VK_NULL_HANDLE;
            destroy();
            return false;
        }

        VkMemoryRequirements req{};
        vkGetBufferMemoryRequirements(m_device, m_buffer, &req);

        const uint32_t memType = vkutil::findMemoryType(m_physDevice, req.memoryTypeBits, m_memFlags);
        if (memType == UINT32_MAX)
        {
            std::cerr << "GpuBuffer: no memory type matches the requested properties\n";
            destroy();
            return false;
        }

        VkMemoryAllocateInfo ai{};
        ai.sType           = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        ai.allocationSize  = req.size;
        ai.memoryTypeIndex = memType;

        if (const VkResult r = vkAllocateMemory(m_device, &ai, nullptr, &m_memory); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "GpuBuffer: vkAllocateMemory");
            m_memory = VK_NULL_HANDLE;
            destroy();
            return false;
        }

        if (const VkResult r = vkBindBufferMemory(m_device, m_buffer, m_memory, 0); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "GpuBuffer: vkBindBufferMemory");
            destroy();
            return false;
        }

        if (m_persistent)
        {
            if (const VkResult r = vkMapMemory(m_device, m_memory, 0, m_size, 0, &m_mapped); r != VK_SUCCESS)
            {
                vkutil::printVkResult(r, "GpuBuffer: vkMapMemory");
                m_mapped = nullptr;
                destroy();
                return false;
            }
        }

        return true;
    }

    void GpuBuffer::destroy()
    {
        if (!m_device)
            return;

        if (m_persistent && m_mapped)
        {
            vkUnmapMemory(m_device, m_memory);
            m_mapped = nullptr;
        }

        if (m_buffer)
        {
            vkDestroyBuffer(m_device, m_buffer, nullptr);
            m_buffer = VK_NULL_HANDLE;
        }

        if (m_memory)
        {
            vkFreeMemory(m_device, m_memory, nullptr);
            m_memory = VK_NULL_HANDLE;
        }

        m_device     = VK_NULL_HANDLE;
        m_physDevice = VK_NULL_HANDLE;
        m_size       = 0;
        m_usage      = 0;
        m_memFlags   = 0;
        m_persistent = false;
    }

    // --------------------------------------------------------
    // Upload (HOST_VISIBLE only)
    // --------------------------------------------------------

    bool GpuBuffer::upload(const void* data, VkDeviceSize size, VkDeviceSize offset)
    {
        if (!data || size == 0)
            return true;

        if (!valid())
        {
            std::cerr << "GpuBuffer::upload: buffer not created yet.\n";
            return false;
        }

        if ((m_memFlags & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT) == 0)
        {
            std::cerr << "GpuBuffer::upload: called on non-HOST_VISIBLE buffer. "
                         "Use staging + vkCmdCopyBuffer instead.\n";
            return false;
        }

        if (offset + size > m_size)
        {
            std::cerr << "GpuBuffer::upload: " << (offset + size) << " bytes exceed capacity " << m_size << "\n";
            return false;
        }

        void* ptr = m_persistent ? m_mapped : nullptr;

        if (!ptr)
        {
            const VkResult res = vkMapMemory(m_device, m_memory, offset, size, 0, &ptr);
            if (res != VK_SUCCESS || !ptr)
            {
                vkutil::printVkResult(res, "GpuBuffer::upload: vkMapMemory");
                return false;
            }

            std::memcpy(ptr, data, static_cast<std::size_t>(size));
            vkUnmapMemory(m_device, m_memory);
            return true;
        }

        std::memcpy(static_cast<char*>(ptr) + static_cast<std::size_t>(offset),
                    data,
                    static_cast<std::size_t>(size));
        return true;
    }

    // --------------------------------------------------------
    // Move / dtor
    // --------------------------------------------------------

    GpuBuffer::GpuBuffer(GpuBuffer&& o) noexcept
    {
        moveFrom(std::move(o));
    }

    GpuBuffer& GpuBuffer::operator=(GpuBuffer&& o) noexcept
    {
        if (this != &o)
        {
            destroy();
            moveFrom(std::move(o));
        }
        return *this;
    }

    void GpuBuffer::moveFrom(GpuBuffer&& o)
    {
        m_device     = std::exchange(o.m_device, VK_NULL_HANDLE);
        m_physDevice = std::exchange(o.m_physDevice, VK_NULL_HANDLE);
        m_buffer     = std::exchange(o.m_buffer, VK_NULL_HANDLE);
        m_memory     = std::exchange(o.m_memory, VK_NULL_HANDLE);
        m_mapped     = std::exchange(o.m_mapped, nullptr);
        m_size       = std::exchange(o.m_size, 0);
        m_usage      = std::exchange(o.m_usage, 0);
        m_memFlags   = std::exchange(o.m_memFlags, 0);
        m_persistent = std::exchange(o.m_persistent, false);
    }

    GpuBuffer::~GpuBuffer()
    {
        destroy();
    }

} // namespace plaster
