#include <cmath>
#include <gtest/gtest.h>
#include <limits>

#include "EngineErrors.hpp"
#include "EngineSettings.hpp"
#include "VulkanContext.hpp"

using namespace plaster;

TEST(EngineSettings, DefaultsAreAlreadySane)
{
    const EngineSettings s = EngineSettings{}.sanitized();
    const EngineSettings d;

    EXPECT_EQ(s.framesInFlight, d.framesInFlight);
    EXPECT_EQ(s.presentMode, EngineSettings::PresentMode::Fifo);
    EXPECT_TRUE(s.requireSrgb);
    EXPECT_FLOAT_EQ(s.tolerance, d.tolerance);
    EXPECT_EQ(s.clearColor, d.clearColor);
    EXPECT_FALSE(s.shaderDir.empty());
}

TEST(EngineSettings, FramesInFlightClamped)
{
    EngineSettings s;

    s.framesInFlight = 0;
    EXPECT_EQ(s.sanitized().framesInFlight, 1u);

    s.framesInFlight = 99;
    EXPECT_EQ(s.sanitized().framesInFlight, vkcfg::kMaxFramesInFlight);
}

TEST(EngineSettings, ClearColorClampedToUnitRange)
{
    EngineSettings s;
    s.clearColor = {2.0f, -1.0f, std::numeric_limits<float>::quiet_NaN(), 0.5f};

    const glm::vec4 c = s.sanitized().clearColor;
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 0.5f);
}

TEST(EngineSettings, TessellationLimits)
{
    EngineSettings s;
    s.tolerance         = -3.0f;
    s.minCircleSegments = 1;
    s.maxCircleSegments = 2;

    EngineSettings fixed = s.sanitized();
    EXPECT_GT(fixed.tolerance, 0.0f);
    EXPECT_EQ(fixed.minCircleSegments, 3u);
    EXPECT_EQ(fixed.maxCircleSegments, 3u);

    s.tolerance = std::numeric_limits<float>::quiet_NaN();
    fixed       = s.sanitized();
    EXPECT_TRUE(std::isfinite(fixed.tolerance));

    const OutlineOptions o = fixed.outlineOptions();
    EXPECT_FLOAT_EQ(o.tolerance, fixed.tolerance);
    EXPECT_EQ(o.minCircleSegments, 3u);
    EXPECT_EQ(o.maxCircleSegments, 3u);
}

TEST(EngineSettings, ZeroTimeoutAndTinyBuffersAreRaised)
{
    EngineSettings s;
    s.acquireTimeoutNs      = 0;
    s.initialVertexCapacity = 0;
    s.initialIndexCapacity  = 16;
    s.shaderDir.clear();

    const EngineSettings fixed = s.sanitized();
    EXPECT_GT(fixed.acquireTimeoutNs, 0u);
    EXPECT_GE(fixed.initialVertexCapacity, 256u);
    EXPECT_GE(fixed.initialIndexCapacity, 256u);
    EXPECT_EQ(fixed.shaderDir, EngineSettings::defaultShaderDir());
}

// ------------------------------------------------------------
// Error names
// ------------------------------------------------------------

TEST(EngineErrors, NamesMatchEnumerators)
{
    EXPECT_STREQ(toString(DeviceInitError::None), "None");
    EXPECT_STREQ(toString(DeviceInitError::NoFifoPresentModeFound), "NoFifoPresentModeFound");
    EXPECT_STREQ(toString(SurfaceAcquireError::OutOfDate), "OutOfDate");
    EXPECT_STREQ(toString(SurfaceAcquireError::SubmitFailed), "SubmitFailed");
    EXPECT_STREQ(toString(ReconfigureError::ZeroExtent), "ZeroExtent");
}

TEST(EngineErrors, OutOfRangeValuesAreUnknown)
{
    EXPECT_STREQ(toString(static_cast<DeviceInitError>(200)), "Unknown");
    EXPECT_STREQ(toString(static_cast<SurfaceAcquireError>(200)), "Unknown");
    EXPECT_STREQ(toString(static_cast<ReconfigureError>(200)), "Unknown");
}
