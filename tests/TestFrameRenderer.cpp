#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>

#include "Colors.hpp"
#include "FrameRenderer.hpp"
#include "MockFrameBackend.hpp"

using namespace plaster;
using plaster::test::MockFrameBackend;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;

namespace
{
    PackedBatch triangleBatch()
    {
        TriangleMesh tri;
        tri.vertices = {Vertex{{0.0f, 0.0f}, colors::RED}, Vertex{{1.0f, 0.0f}, colors::RED}, Vertex{{0.0f, 1.0f}, colors::RED}};
        tri.indices  = {0, 1, 2};

        PackedBatch b;
        b.append(tri);
        return b;
    }

    const Extent2D kExtent{640, 480};
} // namespace

TEST(FrameRenderer, FullFrameRunsEveryStageInOrder)
{
    NiceMock<MockFrameBackend> backend;
    backend.actAsHealthySurface(kExtent);

    GeometryBuffer gb;
    (void)gb.addBatch(triangleBatch());
    (void)gb.addBatch(triangleBatch());

    {
        InSequence seq;
        EXPECT_CALL(backend, acquireTarget(_));
        EXPECT_CALL(backend, uploadGeometry(_, Field(&GeometryUploadPlan::vertices, ::testing::SizeIs(6))));
        EXPECT_CALL(backend, beginPass(_, colors::BLACK));
        EXPECT_CALL(backend, bindPipelineAndBuffers(_));
        EXPECT_CALL(backend, drawIndexed(_, DrawCall{3, 0, 0}));
        EXPECT_CALL(backend, drawIndexed(_, DrawCall{3, 3, 3}));
        EXPECT_CALL(backend, endPass(_));
        EXPECT_CALL(backend, submit(_));
        EXPECT_CALL(backend, present(_));
    }

    FrameRenderer renderer{backend};
    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::None);

    EXPECT_EQ(renderer.framesPresented(), 1u);
    EXPECT_EQ(renderer.failedStage(), FrameRenderer::Stage::Idle);
    EXPECT_FALSE(gb.needsUpload());
}

TEST(FrameRenderer, CleanGeometryIsNotUploadedAgain)
{
    NiceMock<MockFrameBackend> backend;
    backend.actAsHealthySurface(kExtent);

    GeometryBuffer gb;
    (void)gb.addBatch(triangleBatch());

    FrameRenderer renderer{backend};
    ASSERT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::None);

    EXPECT_CALL(backend, uploadGeometry(_, _)).Times(0);
    EXPECT_CALL(backend, drawIndexed(_, _)).Times(1);
    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::None);
}

TEST(FrameRenderer, EmptySceneClearsOnly)
{
    NiceMock<MockFrameBackend> backend;
    backend.actAsHealthySurface(kExtent);

    EXPECT_CALL(backend, beginPass(_, colors::CYAN));
    EXPECT_CALL(backend, bindPipelineAndBuffers(_)).Times(0);
    EXPECT_CALL(backend, drawIndexed(_, _)).Times(0);
    EXPECT_CALL(backend, present(_));

    GeometryBuffer gb;
    FrameRenderer  renderer{backend};
    EXPECT_EQ(renderer.render(gb, colors::CYAN), SurfaceAcquireError::None);
}

TEST(FrameRenderer, FailedAcquireTouchesNothing)
{
    StrictMock<MockFrameBackend> backend;

    GeometryBuffer gb;
    (void)gb.addBatch(triangleBatch());
    const std::vector<Vertex> before(gb.vertices().begin(), gb.vertices().end());

    EXPECT_CALL(backend, acquireTarget(_)).WillOnce(Return(SurfaceAcquireError::OutOfDate));

    FrameRenderer renderer{backend};
    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::OutOfDate);

    EXPECT_EQ(renderer.failedStage(), FrameRenderer::Stage::AcquireTarget);
    EXPECT_EQ(renderer.framesSkipped(), 1u);
    EXPECT_EQ(renderer.framesPresented(), 0u);

    EXPECT_TRUE(gb.needsUpload());
    ASSERT_EQ(gb.vertices().size(), before.size());
    for (std::size_t i = 0; i < before.size(); ++i)
        EXPECT_EQ(gb.vertices()[i].position, before[i].position);
}

TEST(FrameRenderer, RecoversAfterUnavailableSurface)
{
    NiceMock<MockFrameBackend> backend;
    backend.actAsHealthySurface(kExtent);

    GeometryBuffer gb;
    (void)gb.addBatch(triangleBatch());

    FrameRenderer renderer{backend};

    EXPECT_CALL(backend, acquireTarget(_))
        .WillOnce(Return(SurfaceAcquireError::Timeout))
        .WillRepeatedly(::testing::DoDefault());
    EXPECT_CALL(backend, uploadGeometry(_, _)).Times(1);
    EXPECT_CALL(backend, drawIndexed(_, DrawCall{3, 0, 0})).Times(1);
    EXPECT_CALL(backend, present(_)).Times(1);

    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::Timeout);
    EXPECT_TRUE(gb.needsUpload());

    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::None);
    EXPECT_FALSE(gb.needsUpload());
    EXPECT_EQ(renderer.failedStage(), FrameRenderer::Stage::Idle);
}

TEST(FrameRenderer, FailedUploadDrawsBackgroundAndRetries)
{
    NiceMock<MockFrameBackend> backend;
    backend.actAsHealthySurface(kExtent);

    GeometryBuffer gb;
    (void)gb.addBatch(triangleBatch());

    EXPECT_CALL(backend, uploadGeometry(_, _)).WillOnce(Return(false));
    EXPECT_CALL(backend, drawIndexed(_, _)).Times(0);
    EXPECT_CALL(backend, beginPass(_, _));
    EXPECT_CALL(backend, endPass(_));
    EXPECT_CALL(backend, submit(_));
    EXPECT_CALL(backend, present(_));

    FrameRenderer renderer{backend};
    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::SubmitFailed);
    EXPECT_EQ(renderer.failedStage(), FrameRenderer::Stage::UploadGeometry);
    EXPECT_TRUE(gb.needsUpload());
}

TEST(FrameRenderer, PersistentUploadFailureIsLoggedOnce)
{
    NiceMock<MockFrameBackend> backend;
    backend.actAsHealthySurface(kExtent);
    ON_CALL(backend, uploadGeometry(_, _)).WillByDefault(Return(false));

    GeometryBuffer gb;
    (void)gb.addBatch(triangleBatch());

    FrameRenderer renderer{backend};

    ::testing::internal::CaptureStderr();
    for (int i = 0; i < 3; ++i)
        EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::SubmitFailed);
    const std::string log = ::testing::internal::GetCapturedStderr();

    const std::string needle = "geometry upload failed";
    std::size_t       count  = 0;
    for (std::size_t pos = log.find(needle); pos != std::string::npos; pos = log.find(needle, pos + 1))
        ++count;

    EXPECT_EQ(count, 1u);
    EXPECT_EQ(renderer.framesSkipped(), 3u);
}

TEST(FrameRenderer, FailedSubmitSkipsPresentAndKeepsGeometryDirty)
{
    NiceMock<MockFrameBackend> backend;
    backend.actAsHealthySurface(kExtent);

    GeometryBuffer gb;
    (void)gb.addBatch(triangleBatch());

    EXPECT_CALL(backend, submit(_)).WillOnce(Return(false));
    EXPECT_CALL(backend, present(_)).Times(0);

    FrameRenderer renderer{backend};
    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::SubmitFailed);
    EXPECT_EQ(renderer.failedStage(), FrameRenderer::Stage::Submit);
    EXPECT_TRUE(gb.needsUpload());
}

TEST(FrameRenderer, FailedSubmitReuploadsBatchesAlreadyOnTheGpu)
{
    NiceMock<MockFrameBackend> backend;
    backend.actAsHealthySurface(kExtent);

    GeometryBuffer    gb;
    const BatchHandle a = gb.addBatch(triangleBatch());

    FrameRenderer renderer{backend};
    ASSERT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::None);
    ASSERT_FALSE(gb.info(a)->dirty);

    // The second batch grows the arenas; that frame never reaches the GPU.
    (void)gb.addBatch(triangleBatch());
    EXPECT_CALL(backend, submit(_)).WillOnce(Return(false)).WillRepeatedly(Return(true));
    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::SubmitFailed);
    EXPECT_TRUE(gb.info(a)->dirty);

    EXPECT_CALL(backend, uploadGeometry(_, Field(&GeometryUploadPlan::vertexRanges, ElementsAre(ElementRange{0, 6}))))
        .WillOnce(Return(true));
    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::None);
    EXPECT_FALSE(gb.needsUpload());
}

TEST(FrameRenderer, OutOfDatePresentStillCommitsUpload)
{
    NiceMock<MockFrameBackend> backend;
    backend.actAsHealthySurface(kExtent);

    GeometryBuffer gb;
    (void)gb.addBatch(triangleBatch());

    EXPECT_CALL(backend, present(_)).WillOnce(Return(SurfaceAcquireError::OutOfDate));

    FrameRenderer renderer{backend};
    EXPECT_EQ(renderer.render(gb, colors::BLACK), SurfaceAcquireError::OutOfDate);
    EXPECT_EQ(renderer.failedStage(), FrameRenderer::Stage::Present);

    // The copy was submitted, so the GPU already holds it.
    EXPECT_FALSE(gb.needsUpload());
}

TEST(FrameRenderer, StageNames)
{
    EXPECT_STREQ(FrameRenderer::stageName(FrameRenderer::Stage::AcquireTarget), "AcquireTarget");
    EXPECT_STREQ(FrameRenderer::stageName(FrameRenderer::Stage::UploadGeometry), "UploadGeometry");
    EXPECT_STREQ(FrameRenderer::stageName(FrameRenderer::Stage::Present), "Present");
    EXPECT_STREQ(FrameRenderer::stageName(FrameRenderer::Stage::Idle), "Idle");
}
