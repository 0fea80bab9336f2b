#include "FrameRenderer.hpp"

#include <iostream>

namespace plaster
{
    FrameRenderer::FrameRenderer(FrameBackend& backend, bool verbose) noexcept : m_backend{&backend}, m_verbose{verbose}
    {
    }

    const char* FrameRenderer::stageName(Stage stage) noexcept
    {
        switch (stage)
        {
            case Stage::Idle:
                return "Idle";
            case Stage::AcquireTarget:
                return "AcquireTarget";
            case Stage::UploadGeometry:
                return "UploadGeometry";
            case Stage::BeginPass:
                return "BeginPass";
            case Stage::BindPipelineAndBuffers:
                return "BindPipelineAndBuffers";
            case Stage::IssueDrawCalls:
                return "IssueDrawCalls";
            case Stage::Submit:
                return "Submit";
            case Stage::Present:
                return "Present";
        }
        return "Unknown";
    }

    SurfaceAcquireError FrameRenderer::fail(Stage stage, SurfaceAcquireError error, const char* what)
    {
        m_failedStage = stage;
        ++m_framesSkipped;

        // A minimized window fails every frame; report each new condition once.
        if (error != m_lastLogged)
        {
            if (what)
                std::cerr << "FrameRenderer: " << what << " (" << toString(error) << ")\n";
            else
                std::cerr << "FrameRenderer: frame skipped at " << stageName(stage) << " (" << toString(error) << ")\n";
            m_lastLogged = error;
        }
        return error;
    }

    SurfaceAcquireError FrameRenderer::render(GeometryBuffer& geometry, const glm::vec4& clearColor)
    {
        FrameTarget target = {};

        // ------------------------------------------------------------
        // AcquireTarget
        // ------------------------------------------------------------
        if (const SurfaceAcquireError err = m_backend->acquireTarget(target); err != SurfaceAcquireError::None)
            return fail(Stage::AcquireTarget, err);

        if (m_targetListener)
            m_targetListener(target.extent);

        // ------------------------------------------------------------
        // UploadGeometry (recorded ahead of the pass)
        // ------------------------------------------------------------
        const bool pending  = geometry.needsUpload();
        bool       uploaded = true;

        if (pending)
        {
            const GeometryUploadPlan plan = geometry.uploadPlan();

            uploaded = m_backend->uploadGeometry(target, plan);
            if (uploaded && m_verbose)
                std::cerr << "FrameRenderer: uploaded " << plan.vertexRanges.size() << " vertex range(s), "
                          << plan.indexRanges.size() << " index range(s)\n";
        }

        // ------------------------------------------------------------
        // BeginPass
        // ------------------------------------------------------------
        m_backend->beginPass(target, clearColor);

        const std::vector<DrawCall> draws = uploaded ? geometry.drawCalls() : std::vector<DrawCall>{};

        if (!draws.empty())
        {
            // --------------------------------------------------------
            // BindPipelineAndBuffers
            // --------------------------------------------------------
            m_backend->bindPipelineAndBuffers(target);

            // --------------------------------------------------------
            // IssueDrawCalls (one per batch)
            // --------------------------------------------------------
            for (const DrawCall& dc : draws)
                m_backend->drawIndexed(target, dc);
        }

        m_backend->endPass(target);

        // ------------------------------------------------------------
        // Submit
        // ------------------------------------------------------------
        if (!m_backend->submit(target))
        {
            // A grown arena's copy of the old contents never ran.
            if (pending)
                geometry.markAllDirty();
            return fail(Stage::Submit, SurfaceAcquireError::SubmitFailed);
        }

        if (pending && uploaded)
            geometry.markUploaded();

        // ------------------------------------------------------------
        // Present
        // ------------------------------------------------------------
        if (const SurfaceAcquireError err = m_backend->present(target); err != SurfaceAcquireError::None)
            return fail(Stage::Present, err);

        if (!uploaded)
            return fail(Stage::UploadGeometry, SurfaceAcquireError::SubmitFailed, "geometry upload failed, drew background only");

        ++m_framesPresented;
        m_failedStage = Stage::Idle;
        m_lastLogged  = SurfaceAcquireError::None;
        return SurfaceAcquireError::None;
    }

} // namespace plaster
