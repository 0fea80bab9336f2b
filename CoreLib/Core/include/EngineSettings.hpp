#pragma once

#include <cstdint>
#include <filesystem>
#include <glm/vec4.hpp>

#include "ShapeDescriptor.hpp"

namespace plaster
{
    struct EngineSettings
    {
        // --------------------------------------------------------
        // Presentation
        // --------------------------------------------------------
        enum class PresentMode : uint8_t
        {
            Fifo    = 0,
            Mailbox = 1 // falls back to Fifo when the surface lacks it
        };

        PresentMode presentMode = PresentMode::Fifo;
        bool        requireSrgb = true;

        uint32_t framesInFlight   = 2;             // clamped to [1, vkcfg::kMaxFramesInFlight]
        uint64_t acquireTimeoutNs = 1000000000ull; // 1 s

        // --------------------------------------------------------
        // Rendering
        // --------------------------------------------------------
        glm::vec4 clearColor    = {0.0f, 0.0f, 0.0f, 1.0f};
        bool      cullBackFaces = true;

        // --------------------------------------------------------
        // Tessellation
        // --------------------------------------------------------
        float    tolerance         = 0.02f;
        uint32_t minCircleSegments = 8;
        uint32_t maxCircleSegments = 256;

        // --------------------------------------------------------
        // Buffers (bytes, grown on demand)
        // --------------------------------------------------------
        uint64_t initialVertexCapacity = 64 * 1024;
        uint64_t initialIndexCapacity  = 64 * 1024;

        // --------------------------------------------------------
        // Diagnostics
        // --------------------------------------------------------
        bool                  verbose   = false;
        std::filesystem::path shaderDir = defaultShaderDir();

        /// Copy with every out-of-range value pulled back into range.
        [[nodiscard]] EngineSettings sanitized() const;

        [[nodiscard]] OutlineOptions outlineOptions() const noexcept
        {
            return OutlineOptions{tolerance, minCircleSegments, maxCircleSegments};
        }

        [[nodiscard]] static std::filesystem::path defaultShaderDir();
    };

} // namespace plaster
