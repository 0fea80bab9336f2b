#pragma once

#include <cstdint>

namespace plaster
{
    /**
     * @brief Why Engine::create could not bring up a device and surface.
     *
     * The first five reasons map to the surface configuration the engine
     * insists on (sRGB format, FIFO present, opaque alpha).
     */
    enum class DeviceInitError : uint8_t
    {
        None = 0,
        InvalidSurfaceTarget,
        NoAdapterFound,
        DeviceCreationFailed,
        NoTextureFormatFound,
        NoFifoPresentModeFound,
        NoAlphaModeFound,
        SwapchainCreationFailed,
        ShaderLoadFailed,
        PipelineCreationFailed
    };

    /**
     * @brief Why a frame was skipped. Every value other than None is transient:
     * the engine stays usable and the next renderFrame may succeed.
     */
    enum class SurfaceAcquireError : uint8_t
    {
        None = 0,
        Timeout,
        OutOfDate,
        SurfaceLost,
        DeviceLost,
        ZeroExtent,
        SubmitFailed
    };

    enum class ReconfigureError : uint8_t
    {
        None = 0,
        ZeroExtent,
        SwapchainCreationFailed
    };

    [[nodiscard]] const char* toString(DeviceInitError e) noexcept;
    [[nodiscard]] const char* toString(SurfaceAcquireError e) noexcept;
    [[nodiscard]] const char* toString(ReconfigureError e) noexcept;

} // namespace plaster
