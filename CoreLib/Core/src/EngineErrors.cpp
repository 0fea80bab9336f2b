#include "EngineErrors.hpp"

namespace plaster
{
    const char* toString(DeviceInitError e) noexcept
    {
        switch (e)
        {
            case DeviceInitError::None:
                return "None";
            case DeviceInitError::InvalidSurfaceTarget:
                return "InvalidSurfaceTarget";
            case DeviceInitError::NoAdapterFound:
                return "NoAdapterFound";
            case DeviceInitError::DeviceCreationFailed:
                return "DeviceCreationFailed";
            case DeviceInitError::NoTextureFormatFound:
                return "NoTextureFormatFound";
            case DeviceInitError::NoFifoPresentModeFound:
                return "NoFifoPresentModeFound";
            case DeviceInitError::NoAlphaModeFound:
                return "NoAlphaModeFound";
            case DeviceInitError::SwapchainCreationFailed:
                return "SwapchainCreationFailed";
            case DeviceInitError::ShaderLoadFailed:
                return "ShaderLoadFailed";
            case DeviceInitError::PipelineCreationFailed:
                return "PipelineCreationFailed";
        }
        return "Unknown";
    }

    const char* toString(SurfaceAcquireError e) noexcept
    {
        switch (e)
        {
            case SurfaceAcquireError::None:
                return "None";
            case SurfaceAcquireError::Timeout:
                return "Timeout";
            case SurfaceAcquireError::OutOfDate:
                return "OutOfDate";
            case SurfaceAcquireError::SurfaceLost:
                return "SurfaceLost";
            case SurfaceAcquireError::DeviceLost:
                return "DeviceLost";
            case SurfaceAcquireError::ZeroExtent:
                return "ZeroExtent";
            case SurfaceAcquireError::SubmitFailed:
                return "SubmitFailed";
        }
        return "Unknown";
    }

    const char* toString(ReconfigureError e) noexcept
    {
        switch (e)
        {
            case ReconfigureError::None:
                return "None";
            case ReconfigureError::ZeroExtent:
                return "ZeroExtent";
            case ReconfigureError::SwapchainCreationFailed:
                return "SwapchainCreationFailed";
        }
        return "Unknown";
    }

} // namespace plaster
