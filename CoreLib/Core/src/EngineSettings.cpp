#include "EngineSettings.hpp"

#include <algorithm>
#include <cmath>

#include "VulkanContext.hpp"

#ifndef PLASTER_SHADER_DIR
#define PLASTER_SHADER_DIR "shaders"
#endif

namespace plaster
{
    namespace
    {
        constexpr uint64_t kMinBufferCapacity = 256;
        constexpr float    kMinTolerance      = 1e-5f;

        float clamp01(float v) noexcept
        {
            if (!std::isfinite(v))
                return 0.0f;
            return std::clamp(v, 0.0f, 1.0f);
        }

    } // namespace

    std::filesystem::path EngineSettings::defaultShaderDir()
    {
        return std::filesystem::path(PLASTER_SHADER_DIR);
    }

    EngineSettings EngineSettings::sanitized() const
    {
        EngineSettings s = *this;

        s.framesInFlight = std::clamp(s.framesInFlight, 1u, vkcfg::kMaxFramesInFlight);

        if (s.acquireTimeoutNs == 0)
            s.acquireTimeoutNs = 1;

        s.clearColor = {clamp01(s.clearColor.r), clamp01(s.clearColor.g), clamp01(s.clearColor.b), clamp01(s.clearColor.a)};

        if (!std::isfinite(s.tolerance) || s.tolerance < kMinTolerance)
            s.tolerance = kMinTolerance;

        s.minCircleSegments = std::max(3u, s.minCircleSegments);
        s.maxCircleSegments = std::max(s.minCircleSegments, s.maxCircleSegments);

        s.initialVertexCapacity = std::max(s.initialVertexCapacity, kMinBufferCapacity);
        s.initialIndexCapacity  = std::max(s.initialIndexCapacity, kMinBufferCapacity);

        if (s.shaderDir.empty())
            s.shaderDir = defaultShaderDir();

        return s;
    }

} // namespace plaster
