#pragma once

#include <cstdint>
#include <glm/vec4.hpp>
#include <vulkan/vulkan.h>

namespace plaster::vkutil
{
    // ============================================================================
    // Common helpers
    // ============================================================================

    VkClearColorValue toVkClearColor(const glm::vec4& color) noexcept;

    [[nodiscard]] const char* vkResultName(VkResult r) noexcept;

    /// Logs "[Vulkan] where -> NAME (code)" to stderr.
    void printVkResult(VkResult r, const char* where);

    /// UINT32_MAX when no memory type matches.
    uint32_t findMemoryType(VkPhysicalDevice phys, uint32_t typeBits, VkMemoryPropertyFlags props) noexcept;

    // ============================================================================
    // Per-frame dynamic state
    // ============================================================================

    /**
     * @brief Full-surface viewport with negative height, so NDC +y points up.
     */
    void setFlippedViewportAndScissor(VkCommandBuffer cmd, uint32_t width, uint32_t height);

    // ============================================================================
    // Barriers
    // ============================================================================

    /// Previous frames' vertex/index reads finish before transfer writes.
    void barrierVertexInputToTransfer(VkCommandBuffer cmd);

    /// Growth copy finishes before the dirty-range copies overwrite it.
    void barrierTransferToTransfer(VkCommandBuffer cmd);

    /// Transfer writes become visible to vertex attribute + index fetch.
    void barrierTransferToVertexInput(VkCommandBuffer cmd);

} // namespace plaster::vkutil
