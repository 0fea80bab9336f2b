#include <cstddef>
#include <cstring>
#include <gtest/gtest.h>
#include <vector>

#include "FillPipeline.hpp"
#include "TriangleMesh.hpp"

using namespace plaster;

TEST(FillPipelineConfig, DefaultsMatchVertexLayout)
{
    const FillPipelineConfig c;

    EXPECT_EQ(c.vertexStride, sizeof(Vertex));
    EXPECT_EQ(c.positionOffset, offsetof(Vertex, position));
    EXPECT_EQ(c.colorOffset, offsetof(Vertex, color));
    EXPECT_EQ(c.positionFormat, VK_FORMAT_R32G32_SFLOAT);
    EXPECT_EQ(c.colorFormat, VK_FORMAT_R32G32B32A32_SFLOAT);
}

TEST(FillPipelineConfig, SolidOpaqueTriangles)
{
    const FillPipelineConfig c = FillPipelineConfig::make(true);

    EXPECT_EQ(c.topology, VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST);
    EXPECT_EQ(c.polygonMode, VK_POLYGON_MODE_FILL);
    EXPECT_EQ(c.cullMode, VK_CULL_MODE_BACK_BIT);
    EXPECT_EQ(c.frontFace, VK_FRONT_FACE_COUNTER_CLOCKWISE);
    EXPECT_EQ(c.samples, VK_SAMPLE_COUNT_1_BIT);
    EXPECT_FALSE(c.blendEnable);
    EXPECT_FALSE(c.depthTest);
    EXPECT_FALSE(c.depthWrite);
}

TEST(FillPipelineConfig, ViewportAndScissorAreDynamic)
{
    // The viewport state carries counts only, so both must come from dynamic state.
    ASSERT_EQ(kFillDynamicStates.size(), 2u);
    EXPECT_EQ(kFillDynamicStates[0], VK_DYNAMIC_STATE_VIEWPORT);
    EXPECT_EQ(kFillDynamicStates[1], VK_DYNAMIC_STATE_SCISSOR);
}

TEST(FillPipelineConfig, CullingCanBeDisabled)
{
    EXPECT_EQ(FillPipelineConfig::make(false).cullMode, VkCullModeFlags(VK_CULL_MODE_NONE));
}

TEST(FillVertexInput, DescribesBindingZero)
{
    const FillVertexInput in = makeFillVertexInput(FillPipelineConfig{});

    EXPECT_EQ(in.binding.binding, 0u);
    EXPECT_EQ(in.binding.stride, 24u);
    EXPECT_EQ(in.binding.inputRate, VK_VERTEX_INPUT_RATE_VERTEX);

    EXPECT_EQ(in.attributes[0].location, 0u);
    EXPECT_EQ(in.attributes[0].offset, 0u);
    EXPECT_EQ(in.attributes[1].location, 1u);
    EXPECT_EQ(in.attributes[1].offset, 8u);

    const VkPipelineVertexInputStateCreateInfo vi = in.info();
    EXPECT_EQ(vi.vertexBindingDescriptionCount, 1u);
    EXPECT_EQ(vi.vertexAttributeDescriptionCount, 2u);
    EXPECT_EQ(vi.pVertexBindingDescriptions, &in.binding);
    EXPECT_EQ(vi.pVertexAttributeDescriptions, in.attributes.data());
}

// ------------------------------------------------------------
// SPIR-V loading
// ------------------------------------------------------------

namespace
{
    std::vector<char> bytesOf(const std::vector<uint32_t>& words)
    {
        std::vector<char> bytes(words.size() * sizeof(uint32_t));
        std::memcpy(bytes.data(), words.data(), bytes.size());
        return bytes;
    }
} // namespace

TEST(SpirvWords, AcceptsModuleWithMagic)
{
    const std::vector<uint32_t> module = {kSpirvMagic, 0x00010000u, 0u, 8u, 0u};
    const std::vector<char>     bytes  = bytesOf(module);

    EXPECT_EQ(spirvWordsFromBytes(bytes), module);
}

TEST(SpirvWords, RejectsBadInput)
{
    EXPECT_TRUE(spirvWordsFromBytes({}).empty());

    std::vector<char> truncated = bytesOf({kSpirvMagic, 1u});
    truncated.pop_back();
    EXPECT_TRUE(spirvWordsFromBytes(truncated).empty());

    EXPECT_TRUE(spirvWordsFromBytes(bytesOf({0xdeadbeefu, 1u})).empty());
}
