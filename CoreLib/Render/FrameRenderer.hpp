#pragma once

#include <cstdint>
#include <functional>
#include <glm/vec4.hpp>

#include "EngineErrors.hpp"
#include "FrameBackend.hpp"
#include "GeometryBuffer.hpp"

namespace plaster
{
    /**
     * @brief Drives one frame through the backend.
     *
     * Stages run in order:
     *   AcquireTarget -> UploadGeometry -> BeginPass -> BindPipelineAndBuffers -> IssueDrawCalls -> Submit -> Present
     *
     * A failed acquire aborts the frame before anything is recorded or uploaded,
     * so the GeometryBuffer stays exactly as it was and the next call retries.
     * A failed submit may drop an arena copy the GPU never ran, so every batch
     * is uploaded again on the next frame.
     */
    class FrameRenderer
    {
    public:
        enum class Stage : uint8_t
        {
            Idle = 0,
            AcquireTarget,
            UploadGeometry,
            BeginPass,
            BindPipelineAndBuffers,
            IssueDrawCalls,
            Submit,
            Present
        };

        /// Called with the extent of every acquired target, before the upload is planned.
        using TargetListener = std::function<void(Extent2D)>;

        explicit FrameRenderer(FrameBackend& backend, bool verbose = false) noexcept;

        void setTargetListener(TargetListener listener)
        {
            m_targetListener = std::move(listener);
        }

        [[nodiscard]] SurfaceAcquireError render(GeometryBuffer& geometry, const glm::vec4& clearColor);

        /// Stage at which the most recent failed frame stopped (Idle if it succeeded).
        [[nodiscard]] Stage failedStage() const noexcept
        {
            return m_failedStage;
        }

        [[nodiscard]] uint64_t framesPresented() const noexcept
        {
            return m_framesPresented;
        }

        [[nodiscard]] uint64_t framesSkipped() const noexcept
        {
            return m_framesSkipped;
        }

        [[nodiscard]] static const char* stageName(Stage stage) noexcept;

    private:
        /// Counts the skipped frame; logs only when the error differs from the last one logged.
        SurfaceAcquireError fail(Stage stage, SurfaceAcquireError error, const char* what = nullptr);

    private:
        FrameBackend*  m_backend = nullptr;
        bool           m_verbose = false;
        TargetListener m_targetListener;

        Stage               m_failedStage = Stage::Idle;
        SurfaceAcquireError m_lastLogged  = SurfaceAcquireError::None;

        uint64_t m_framesPresented = 0;
        uint64_t m_framesSkipped   = 0;
    };

} // namespace plaster
