#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

namespace plaster
{
    /// First word of every SPIR-V module.
    inline constexpr uint32_t kSpirvMagic = 0x07230203u;

    /**
     * @brief Repack raw file bytes into SPIR-V words.
     *
     * Fails (empty result) unless the size is a non-zero multiple of 4 and the
     * first word is the SPIR-V magic number.
     */
    [[nodiscard]] std::vector<uint32_t> spirvWordsFromBytes(std::span<const char> bytes);

    class ShaderStage
    {
    public:
        ShaderStage() = default;
        ~ShaderStage();

        // Factory: load SPIR-V + create module
        static ShaderStage fromSpirvFile(VkDevice                     device,
                                         const std::filesystem::path& path,
                                         VkShaderStageFlagBits        stage,
                                         const char*                  entryPoint = "main");

        // non-copyable, move-only
        ShaderStage(const ShaderStage&)            = delete;
        ShaderStage& operator=(const ShaderStage&) = delete;

        ShaderStage(ShaderStage&& other) noexcept;
        ShaderStage& operator=(ShaderStage&& other) noexcept;

        bool isValid() const
        {
            return m_module != VK_NULL_HANDLE;
        }

        /// pName points into this object; keep it alive until the pipeline is built.
        VkPipelineShaderStageCreateInfo stageInfo() const
        {
            VkPipelineShaderStageCreateInfo info{};
            info.sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
            info.stage  = m_stage;
            info.module = m_module;
            info.pName  = m_entryPoint.c_str();
            return info;
        }

    private:
        ShaderStage(VkDevice              device,
                    VkShaderModule        module,
                    VkShaderStageFlagBits stage,
                    std::string           entryPoint);

        void destroy();
        void moveFrom(ShaderStage&& other) noexcept;

        VkDevice              m_device     = VK_NULL_HANDLE;
        VkShaderModule        m_module     = VK_NULL_HANDLE;
        VkShaderStageFlagBits m_stage      = VK_SHADER_STAGE_FLAG_BITS_MAX_ENUM;
        std::string           m_entryPoint = "main";
    };

} // namespace plaster
