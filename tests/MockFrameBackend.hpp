#pragma once

#include <gmock/gmock.h>

#include "FrameBackend.hpp"

namespace plaster::test
{
    class MockFrameBackend : public FrameBackend
    {
    public:
        MOCK_METHOD(SurfaceAcquireError, acquireTarget, (FrameTarget & target), (override));
        MOCK_METHOD(bool, uploadGeometry, (const FrameTarget& target, const GeometryUploadPlan& plan), (override));
        MOCK_METHOD(void, beginPass, (const FrameTarget& target, const glm::vec4& clearColor), (override));
        MOCK_METHOD(void, bindPipelineAndBuffers, (const FrameTarget& target), (override));
        MOCK_METHOD(void, drawIndexed, (const FrameTarget& target, const DrawCall& draw), (override));
        MOCK_METHOD(void, endPass, (const FrameTarget& target), (override));
        MOCK_METHOD(bool, submit, (const FrameTarget& target), (override));
        MOCK_METHOD(SurfaceAcquireError, present, (const FrameTarget& target), (override));
        MOCK_METHOD(ReconfigureError, reconfigure, (Extent2D extent), (override));
        MOCK_METHOD(Extent2D, extent, (), (const, override));

        /**
         * @brief Behave like a healthy surface of the given size.
         *
         * acquireTarget hands out the current extent, reconfigure adopts the new
         * one, every other call succeeds.
         */
        void actAsHealthySurface(Extent2D initial)
        {
            m_extent = initial;

            using ::testing::_;
            using ::testing::Invoke;
            using ::testing::Return;
            using ::testing::ReturnPointee;

            ON_CALL(*this, acquireTarget(_)).WillByDefault(Invoke([this](FrameTarget& t) {
                t.imageIndex = m_acquired % 3;
                t.frameIndex = m_acquired % 2;
                t.extent     = m_extent;
                ++m_acquired;
                return SurfaceAcquireError::None;
            }));
            ON_CALL(*this, uploadGeometry(_, _)).WillByDefault(Return(true));
            ON_CALL(*this, submit(_)).WillByDefault(Return(true));
            ON_CALL(*this, present(_)).WillByDefault(Return(SurfaceAcquireError::None));
            ON_CALL(*this, reconfigure(_)).WillByDefault(Invoke([this](Extent2D e) {
                if (e.empty())
                    return ReconfigureError::ZeroExtent;
                m_extent = e;
                return ReconfigureError::None;
            }));
            ON_CALL(*this, extent()).WillByDefault(ReturnPointee(&m_extent));
        }

        [[nodiscard]] Extent2D currentExtent() const noexcept
        {
            return m_extent;
        }

        /// Change size without a reconfigure, as a swapchain rebuilt at acquire does.
        void setSurfaceExtent(Extent2D extent) noexcept
        {
            m_extent = extent;
        }

    private:
        Extent2D m_extent   = {};
        uint32_t m_acquired = 0;
    };

    /// FrameTarget field matcher used when checking the extent a frame rendered at.
    MATCHER_P(TargetExtentIs, expected, "")
    {
        return arg.extent == expected;
    }

} // namespace plaster::test
