#include "GpuArena.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <vector>

#include "GeometryBuffer.hpp"
#include "VkUtilities.hpp"

namespace plaster
{
    void GpuArena::init(const VulkanContext* ctx,
                        VkBufferUsageFlags   usage,
                        VkDeviceSize         initialCapacity,
                        const char*          name,
                        bool                 verbose) noexcept
    {
        m_ctx             = ctx;
        m_usage           = usage | VK_BUFFER_USAGE_TRANSFER_SRC_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
        m_initialCapacity = initialCapacity;
        m_name            = name;
        m_verbose         = verbose;
    }

    void GpuArena::destroy()
    {
        m_buffer.destroy();
    }

    bool GpuArena::reserve(VkCommandBuffer cmd, DeferredDeletion& deferred, uint32_t frameIndex, VkDeviceSize required)
    {
        if (!m_ctx || !deviceReady(*m_ctx) || !cmd)
            return false;

        if (m_buffer.valid() && required <= m_buffer.size())
            return true;

        const VkDeviceSize newCapacity = m_buffer.valid()
                                             ? geom::grownCapacity(m_buffer.size(), required)
                                             : std::max(m_initialCapacity, required);

        GpuBuffer grown;
        if (!grown.create(m_ctx->device,
                          m_ctx->physicalDevice,
                          newCapacity,
                          m_usage,
                          VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT))
        {
            std::cerr << m_name << ": failed to grow to " << newCapacity << " bytes\n";
            return false;
        }

        if (m_verbose)
            std::cerr << m_name << ": capacity " << m_buffer.size() << " -> " << newCapacity << " bytes\n";

        if (m_buffer.valid())
        {
            VkBufferCopy cpy = {};
            cpy.srcOffset    = 0;
            cpy.dstOffset    = 0;
            cpy.size         = m_buffer.size();

            vkCmdCopyBuffer(cmd, m_buffer.buffer(), grown.buffer(), 1, &cpy);
            vkutil::barrierTransferToTransfer(cmd);

            // The recorded copy still reads the old buffer; release it once this slot comes back.
            deferred.enqueue(frameIndex, [old = std::move(m_buffer)]() mutable {
                old.destroy();
            });
        }

        m_buffer = std::move(grown);
        return true;
    }

    bool GpuArena::write(VkCommandBuffer cmd, DeferredDeletion& deferred, uint32_t frameIndex, std::span<const ArenaWrite> writes)
    {
        if (!m_ctx || !deviceReady(*m_ctx) || !cmd || !m_buffer.valid())
            return false;

        VkDeviceSize total = 0;
        for (const ArenaWrite& w : writes)
        {
            if (w.dstOffset + w.size > m_buffer.size())
            {
                std::cerr << m_name << ": write [" << w.dstOffset << ", " << (w.dstOffset + w.size)
                          << ") exceeds capacity " << m_buffer.size() << "\n";
                return false;
            }
            total += w.size;
        }

        if (total == 0)
            return true;

        GpuBuffer staging;
        if (!staging.create(m_ctx->device,
                            m_ctx->physicalDevice,
                            total,
                            VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                            VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                            /*persistentMap*/ true))
        {
            std::cerr << m_name << ": staging allocation of " << total << " bytes failed\n";
            return false;
        }

        std::vector<VkBufferCopy> regions;
        regions.reserve(writes.size());

        VkDeviceSize cursor = 0;
        for (const ArenaWrite& w : writes)
        {
            if (w.size == 0)
                continue;

            if (!staging.upload(w.data, w.size, cursor))
                return false;

            VkBufferCopy cpy = {};
            cpy.srcOffset    = cursor;
            cpy.dstOffset    = w.dstOffset;
            cpy.size         = w.size;
            regions.push_back(cpy);

            cursor += w.size;
        }

        vkCmdCopyBuffer(cmd, staging.buffer(), m_buffer.buffer(), static_cast<uint32_t>(regions.size()), regions.data());

        deferred.enqueue(frameIndex, [st = std::move(staging)]() mutable {
            st.destroy();
        });

        return true;
    }

} // namespace plaster
