#pragma once

#include <cstdint>
#include <glm/vec4.hpp>

#include "EngineErrors.hpp"
#include "GeomTypes.hpp"
#include "GeometryBuffer.hpp"

namespace plaster
{
    /**
     * @brief The image a frame renders into, as handed out by acquireTarget().
     */
    struct FrameTarget
    {
        uint32_t imageIndex = 0; ///< swapchain image
        uint32_t frameIndex = 0; ///< frame-in-flight slot
        Extent2D extent     = {};
    };

    /**
     * @brief Presentation backend driven by the FrameRenderer.
     *
     * GraphicsContext implements this on top of a Vulkan swapchain. The interface
     * exists so frame sequencing can be exercised without a device.
     *
     * Call order per frame:
     *   acquireTarget -> [uploadGeometry] -> beginPass -> [bindPipelineAndBuffers
     *   -> drawIndexed*] -> endPass -> submit -> present
     *
     * If acquireTarget fails, no other call is made for that frame.
     */
    class FrameBackend
    {
    public:
        virtual ~FrameBackend() = default;

        [[nodiscard]] virtual SurfaceAcquireError acquireTarget(FrameTarget& target) = 0;

        /// Copy the plan's dirty ranges to the GPU, growing buffers as needed.
        [[nodiscard]] virtual bool uploadGeometry(const FrameTarget& target, const GeometryUploadPlan& plan) = 0;

        virtual void beginPass(const FrameTarget& target, const glm::vec4& clearColor) = 0;
        virtual void bindPipelineAndBuffers(const FrameTarget& target)                 = 0;
        virtual void drawIndexed(const FrameTarget& target, const DrawCall& draw)      = 0;
        virtual void endPass(const FrameTarget& target)                                = 0;

        [[nodiscard]] virtual bool                submit(const FrameTarget& target)  = 0;
        [[nodiscard]] virtual SurfaceAcquireError present(const FrameTarget& target) = 0;

        /// Rebuild surface-dependent state for a new extent.
        [[nodiscard]] virtual ReconfigureError reconfigure(Extent2D extent) = 0;

        [[nodiscard]] virtual Extent2D extent() const = 0;
    };

} // namespace plaster
