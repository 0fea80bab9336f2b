//============================================================
// VkUtilities.cpp
//============================================================
#include "VkUtilities.hpp"

#include <iostream>

namespace plaster::vkutil
{
    VkClearColorValue toVkClearColor(const glm::vec4& color) noexcept
    {
        VkClearColorValue v = {};
        v.float32[0]        = color.r;
        v.float32[1]        = color.g;
        v.float32[2]        = color.b;
        v.float32[3]        = color.a;
        return v;
    }

    const char* vkResultName(VkResult r) noexcept
    {
        switch (r)
        {
            case VK_SUCCESS:
                return "VK_SUCCESS";
            case VK_NOT_READY:
                return "VK_NOT_READY";
            case VK_TIMEOUT:
                return "VK_TIMEOUT";
            case VK_ERROR_DEVICE_LOST:
                return "VK_ERROR_DEVICE_LOST";
            case VK_ERROR_OUT_OF_DEVICE_MEMORY:
                return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
            case VK_ERROR_OUT_OF_HOST_MEMORY:
                return "VK_ERROR_OUT_OF_HOST_MEMORY";
            case VK_ERROR_INITIALIZATION_FAILED:
                return "VK_ERROR_INITIALIZATION_FAILED";
            case VK_ERROR_EXTENSION_NOT_PRESENT:
                return "VK_ERROR_EXTENSION_NOT_PRESENT";
            case VK_ERROR_FEATURE_NOT_PRESENT:
                return "VK_ERROR_FEATURE_NOT_PRESENT";
            case VK_ERROR_SURFACE_LOST_KHR:
                return "VK_ERROR_SURFACE_LOST_KHR";
            case VK_ERROR_NATIVE_WINDOW_IN_USE_KHR:
                return "VK_ERROR_NATIVE_WINDOW_IN_USE_KHR";
            case VK_ERROR_OUT_OF_DATE_KHR:
                return "VK_ERROR_OUT_OF_DATE_KHR";
            case VK_SUBOPTIMAL_KHR:
                return "VK_SUBOPTIMAL_KHR";
            case VK_ERROR_INVALID_SHADER_NV:
                return "VK_ERROR_INVALID_SHADER_NV";
            default:
                return "VK_UNDEFINED";
        }
    }

    void printVkResult(VkResult r, const char* where)
    {
        std::cerr << "[Vulkan] " << where << " -> " << vkResultName(r) << " (" << int(r) << ")\n";
    }

    uint32_t findMemoryType(VkPhysicalDevice      phys,
                            uint32_t              typeBits,
                            VkMemoryPropertyFlags props) noexcept
    {
        VkPhysicalDeviceMemoryProperties mp = {};
        vkGetPhysicalDeviceMemoryProperties(phys, &mp);

        for (uint32_t i = 0; i < mp.memoryTypeCount; ++i)
        {
            const bool supported = (typeBits & (1u << i)) != 0u;
            const bool matches   = (mp.memoryTypes[i].propertyFlags & props) == props;

            if (supported && matches)
                return i;
        }

        return UINT32_MAX;
    }

    // ============================================================================
    // Per-frame dynamic state
    // ============================================================================

    void setFlippedViewportAndScissor(VkCommandBuffer cmd, uint32_t width, uint32_t height)
    {
        VkViewport vp = {};
        vp.x          = 0.0f;
        vp.y          = static_cast<float>(height);
        vp.width      = static_cast<float>(width);
        vp.height     = -static_cast<float>(height);
        vp.minDepth   = 0.0f;
        vp.maxDepth   = 1.0f;

        VkRect2D sc = {};
        sc.offset   = {0, 0};
        sc.extent   = {width, height};

        vkCmdSetViewport(cmd, 0, 1, &vp);
        vkCmdSetScissor(cmd, 0, 1, &sc);
    }

    // ============================================================================
    // Barriers
    // ============================================================================

    namespace
    {
        void memoryBarrier(VkCommandBuffer      cmd,
                           VkAccessFlags        srcAccess,
                           VkAccessFlags        dstAccess,
                           VkPipelineStageFlags srcStage,
                           VkPipelineStageFlags dstStage)
        {
            VkMemoryBarrier mb = {};
            mb.sType           = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
            mb.srcAccessMask   = srcAccess;
            mb.dstAccessMask   = dstAccess;

            vkCmdPipelineBarrier(cmd,
                                 srcStage,
                                 dstStage,
                                 0,
                                 1,
                                 &mb,
                                 0,
                                 nullptr,
                                 0,
                                 nullptr);
        }

    } // namespace

    void barrierVertexInputToTransfer(VkCommandBuffer cmd)
    {
        memoryBarrier(cmd,
                      VK_ACCESS_VERTEX_ATTRIBUTE_READ_BIT | VK_ACCESS_INDEX_READ_BIT,
                      VK_ACCESS_TRANSFER_WRITE_BIT,
                      VK_PIPELINE_STAGE_VERTEX_INPUT_BIT,
                      VK_PIPELINE_STAGE_TRANSFER_BIT);
    }

    void barrierTransferToTransfer(VkCommandBuffer cmd)
    {
        memoryBarrier(cmd,
                      VK_ACCESS_TRANSFER_WRITE_BIT,
                      VK_ACCESS_TRANSFER_READ_BIT | VK_ACCESS_TRANSFER_WRITE_BIT,
                      VK_PIPELINE_STAGE_TRANSFER_BIT,
                      VK_PIPELINE_STAGE_TRANSFER_BIT);
    }

    void barrierTransferToVertexInput(VkCommandBuffer cmd)
    {
        memoryBarrier(cmd,
                      VK_ACCESS_TRANSFER_WRITE_BIT,
                      VK_ACCESS_VERTEX_ATTRIBUTE_READ_BIT | VK_ACCESS_INDEX_READ_BIT,
                      VK_PIPELINE_STAGE_TRANSFER_BIT,
                      VK_PIPELINE_STAGE_VERTEX_INPUT_BIT);
    }

} // namespace plaster::vkutil
