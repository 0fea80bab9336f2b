#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <vulkan/vulkan.h>

#include "ShaderStage.hpp"
#include "VulkanContext.hpp"

namespace plaster
{
    /// Viewport and scissor are always dynamic; the frame sets them from the swap extent.
    inline constexpr std::array<VkDynamicState, 2> kFillDynamicStates = {VK_DYNAMIC_STATE_VIEWPORT,
                                                                         VK_DYNAMIC_STATE_SCISSOR};

    /**
     * @brief Every fixed-function choice of the solid fill pipeline, spelled out.
     *
     * The defaults are the only configuration the engine builds: triangle lists
     * of (vec2 position, vec4 color), counter-clockwise front faces, replace
     * blending, no depth, single sample, dynamic viewport + scissor.
     */
    struct FillPipelineConfig
    {
        // --------------------------------------------------------
        // Shaders
        // --------------------------------------------------------
        const char* vertexShader   = "FillDraw.vert.spv";
        const char* fragmentShader = "FillDraw.frag.spv";
        const char* entryPoint     = "main";

        // --------------------------------------------------------
        // Vertex input (binding 0, per-vertex)
        // --------------------------------------------------------
        uint32_t vertexStride   = 24;
        VkFormat positionFormat = VK_FORMAT_R32G32_SFLOAT;       // location 0
        uint32_t positionOffset = 0;
        VkFormat colorFormat    = VK_FORMAT_R32G32B32A32_SFLOAT; // location 1
        uint32_t colorOffset    = 8;

        // --------------------------------------------------------
        // Input assembly
        // --------------------------------------------------------
        VkPrimitiveTopology topology         = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        bool                primitiveRestart = false;

        // --------------------------------------------------------
        // Rasterization
        // --------------------------------------------------------
        VkPolygonMode   polygonMode       = VK_POLYGON_MODE_FILL;
        VkCullModeFlags cullMode          = VK_CULL_MODE_BACK_BIT;
        VkFrontFace     frontFace         = VK_FRONT_FACE_COUNTER_CLOCKWISE;
        bool            depthClamp        = false;
        bool            rasterizerDiscard = false;
        float           lineWidth         = 1.0f;

        // --------------------------------------------------------
        // Multisample
        // --------------------------------------------------------
        VkSampleCountFlagBits samples         = VK_SAMPLE_COUNT_1_BIT;
        bool                  sampleShading   = false;
        bool                  alphaToCoverage = false;
        bool                  alphaToOne      = false;

        // --------------------------------------------------------
        // Depth / stencil
        // --------------------------------------------------------
        bool        depthTest      = false;
        bool        depthWrite     = false;
        VkCompareOp depthCompareOp = VK_COMPARE_OP_ALWAYS;
        bool        stencilTest    = false;

        // --------------------------------------------------------
        // Color blend
        // --------------------------------------------------------
        bool                  blendEnable    = false;
        VkBlendFactor         srcColorFactor = VK_BLEND_FACTOR_ONE;
        VkBlendFactor         dstColorFactor = VK_BLEND_FACTOR_ZERO;
        VkBlendOp             colorBlendOp   = VK_BLEND_OP_ADD;
        VkBlendFactor         srcAlphaFactor = VK_BLEND_FACTOR_ONE;
        VkBlendFactor         dstAlphaFactor = VK_BLEND_FACTOR_ZERO;
        VkBlendOp             alphaBlendOp   = VK_BLEND_OP_ADD;
        VkColorComponentFlags writeMask      = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                                          VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
        bool     logicOpEnable = false;
        VkLogicOp logicOp      = VK_LOGIC_OP_COPY;

        /// Defaults, with culling switched off when cullBackFaces is false.
        [[nodiscard]] static FillPipelineConfig make(bool cullBackFaces) noexcept;
    };

    /**
     * @brief Vertex input description owned by value; info() points into it.
     */
    struct FillVertexInput
    {
        VkVertexInputBindingDescription                  binding    = {};
        std::array<VkVertexInputAttributeDescription, 2> attributes = {};

        [[nodiscard]] VkPipelineVertexInputStateCreateInfo info() const noexcept;
    };

    [[nodiscard]] FillVertexInput makeFillVertexInput(const FillPipelineConfig& config) noexcept;

    namespace vkutil
    {
        ShaderStage loadStage(VkDevice                     device,
                              const std::filesystem::path& dir,
                              const char*                  filename,
                              VkShaderStageFlagBits        stage,
                              const char*                  entryPoint = "main");

        /// Layout with no descriptor sets and no push constants.
        VkPipelineLayout createEmptyPipelineLayout(VkDevice device);

    } // namespace vkutil

    /// Returns VK_NULL_HANDLE on failure.
    VkPipeline createFillPipeline(const VulkanContext&                   ctx,
                                  VkRenderPass                           renderPass,
                                  VkPipelineLayout                       layout,
                                  const VkPipelineShaderStageCreateInfo* stages,
                                  uint32_t                               stageCount,
                                  const FillPipelineConfig&              config);

} // namespace plaster
