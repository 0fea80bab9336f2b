#include "FillPipeline.hpp"

#include <cstddef>
#include <iostream>

#include "TriangleMesh.hpp"
#include "VkUtilities.hpp"

namespace plaster
{
    static_assert(sizeof(Vertex) == 24 && offsetof(Vertex, color) == 8,
                  "FillPipelineConfig defaults assume the packed Vertex layout");

    FillPipelineConfig FillPipelineConfig::make(bool cullBackFaces) noexcept
    {
        FillPipelineConfig c;
        c.cullMode = cullBackFaces ? VK_CULL_MODE_BACK_BIT : VK_CULL_MODE_NONE;
        return c;
    }

    // ---------------------------------------------------------
    // Vertex input
    // ---------------------------------------------------------

    VkPipelineVertexInputStateCreateInfo FillVertexInput::info() const noexcept
    {
        VkPipelineVertexInputStateCreateInfo vi = {};
        vi.sType                                = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vi.vertexBindingDescriptionCount        = 1;
        vi.pVertexBindingDescriptions           = &binding;
        vi.vertexAttributeDescriptionCount      = static_cast<uint32_t>(attributes.size());
        vi.pVertexAttributeDescriptions         = attributes.data();
        return vi;
    }

    FillVertexInput makeFillVertexInput(const FillPipelineConfig& config) noexcept
    {
        FillVertexInput in;

        in.binding.binding   = 0;
        in.binding.stride    = config.vertexStride;
        in.binding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;

        // location 0 = position
        in.attributes[0].location = 0;
        in.attributes[0].binding  = 0;
        in.attributes[0].format   = config.positionFormat;
        in.attributes[0].offset   = config.positionOffset;

        // location 1 = color
        in.attributes[1].location = 1;
        in.attributes[1].binding  = 0;
        in.attributes[1].format   = config.colorFormat;
        in.attributes[1].offset   = config.colorOffset;

        return in;
    }

    // ---------------------------------------------------------
    // Shader loading + layout
    // ---------------------------------------------------------

    namespace vkutil
    {
        ShaderStage loadStage(VkDevice                     device,
                              const std::filesystem::path& dir,
                              const char*                  filename,
                              VkShaderStageFlagBits        stage,
                              const char*                  entryPoint)
        {
            return ShaderStage::fromSpirvFile(device, dir / filename, stage, entryPoint);
        }

        VkPipelineLayout createEmptyPipelineLayout(VkDevice device)
        {
            VkPipelineLayoutCreateInfo ci = {};
            ci.sType                      = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;

            VkPipelineLayout layout = VK_NULL_HANDLE;
            if (const VkResult r = vkCreatePipelineLayout(device, &ci, nullptr, &layout); r != VK_SUCCESS)
            {
                printVkResult(r, "vkCreatePipelineLayout");
                return VK_NULL_HANDLE;
            }
            return layout;
        }

    } // namespace vkutil

    // ---------------------------------------------------------
    // Fixed-function state, one builder per block of the config
    // ---------------------------------------------------------

    namespace
    {
        VkBool32 vkBool(bool b) noexcept
        {
            return b ? VK_TRUE : VK_FALSE;
        }

        VkPipelineInputAssemblyStateCreateInfo inputAssembly(const FillPipelineConfig& c)
        {
            VkPipelineInputAssemblyStateCreateInfo ia = {};
            ia.sType                                  = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
            ia.topology                               = c.topology;
            ia.primitiveRestartEnable                 = vkBool(c.primitiveRestart);
            return ia;
        }

        VkPipelineRasterizationStateCreateInfo rasterization(const FillPipelineConfig& c)
        {
            VkPipelineRasterizationStateCreateInfo rs = {};
            rs.sType                                  = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
            rs.depthClampEnable                       = vkBool(c.depthClamp);
            rs.rasterizerDiscardEnable                = vkBool(c.rasterizerDiscard);
            rs.polygonMode                            = c.polygonMode;
            rs.cullMode                               = c.cullMode;
            rs.frontFace                              = c.frontFace;
            rs.lineWidth                              = c.lineWidth;
            return rs;
        }

        VkPipelineMultisampleStateCreateInfo multisample(const FillPipelineConfig& c)
        {
            VkPipelineMultisampleStateCreateInfo ms = {};
            ms.sType                                = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
            ms.rasterizationSamples                 = c.samples;
            ms.sampleShadingEnable                  = vkBool(c.sampleShading);
            ms.minSampleShading                     = 1.0f;
            ms.alphaToCoverageEnable                = vkBool(c.alphaToCoverage);
            ms.alphaToOneEnable                     = vkBool(c.alphaToOne);
            return ms;
        }

        VkPipelineDepthStencilStateCreateInfo depthStencil(const FillPipelineConfig& c)
        {
            VkPipelineDepthStencilStateCreateInfo ds = {};
            ds.sType                                 = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
            ds.depthTestEnable                       = vkBool(c.depthTest);
            ds.depthWriteEnable                      = vkBool(c.depthWrite);
            ds.depthCompareOp                        = c.depthCompareOp;
            ds.stencilTestEnable                     = vkBool(c.stencilTest);
            return ds;
        }

        VkPipelineColorBlendAttachmentState blendAttachment(const FillPipelineConfig& c)
        {
            VkPipelineColorBlendAttachmentState att = {};
            att.blendEnable                         = vkBool(c.blendEnable);
            att.srcColorBlendFactor                 = c.srcColorFactor;
            att.dstColorBlendFactor                 = c.dstColorFactor;
            att.colorBlendOp                        = c.colorBlendOp;
            att.srcAlphaBlendFactor                 = c.srcAlphaFactor;
            att.dstAlphaBlendFactor                 = c.dstAlphaFactor;
            att.alphaBlendOp                        = c.alphaBlendOp;
            att.colorWriteMask                      = c.writeMask;
            return att;
        }

    } // namespace

    // ---------------------------------------------------------
    // Pipeline
    // ---------------------------------------------------------

    VkPipeline createFillPipeline(const VulkanContext&                   ctx,
                                  VkRenderPass                           renderPass,
                                  VkPipelineLayout                       layout,
                                  const VkPipelineShaderStageCreateInfo* stages,
                                  uint32_t                               stageCount,
                                  const FillPipelineConfig&              config)
    {
        if (!ctx.device || !renderPass || !layout || !stages || stageCount == 0)
            return VK_NULL_HANDLE;

        const FillVertexInput                      vin = makeFillVertexInput(config);
        const VkPipelineVertexInputStateCreateInfo vi  = vin.info();

        const VkPipelineInputAssemblyStateCreateInfo ia  = inputAssembly(config);
        const VkPipelineRasterizationStateCreateInfo rs  = rasterization(config);
        const VkPipelineMultisampleStateCreateInfo   ms  = multisample(config);
        const VkPipelineDepthStencilStateCreateInfo  ds  = depthStencil(config);
        const VkPipelineColorBlendAttachmentState    att = blendAttachment(config);

        // Viewport + scissor are set per frame (see setFlippedViewportAndScissor).
        VkPipelineViewportStateCreateInfo vp = {};
        vp.sType                             = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        vp.viewportCount                     = 1;
        vp.scissorCount                      = 1;

        VkPipelineColorBlendStateCreateInfo cb = {};
        cb.sType                               = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        cb.logicOpEnable                       = vkBool(config.logicOpEnable);
        cb.logicOp                             = config.logicOp;
        cb.attachmentCount                     = 1;
        cb.pAttachments                        = &att;

        VkPipelineDynamicStateCreateInfo dyn = {};
        dyn.sType                            = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dyn.dynamicStateCount                = static_cast<uint32_t>(kFillDynamicStates.size());
        dyn.pDynamicStates                   = kFillDynamicStates.data();

        VkGraphicsPipelineCreateInfo ci = {};
        ci.sType                        = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        ci.stageCount                   = stageCount;
        ci.pStages                      = stages;
        ci.pVertexInputState            = &vi;
        ci.pInputAssemblyState          = &ia;
        ci.pViewportState               = &vp;
        ci.pRasterizationState          = &rs;
        ci.pMultisampleState            = &ms;
        ci.pDepthStencilState           = &ds;
        ci.pColorBlendState             = &cb;
        ci.pDynamicState                = &dyn;
        ci.layout                       = layout;
        ci.renderPass                   = renderPass;
        ci.subpass                      = 0;
        ci.basePipelineIndex            = -1;

        VkPipeline pipeline = VK_NULL_HANDLE;
        if (const VkResult r = vkCreateGraphicsPipelines(ctx.device, VK_NULL_HANDLE, 1, &ci, nullptr, &pipeline);
            r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkCreateGraphicsPipelines");
            std::cerr << "FillPipeline: pipeline creation failed\n";
            return VK_NULL_HANDLE;
        }

        return pipeline;
    }

} // namespace plaster
