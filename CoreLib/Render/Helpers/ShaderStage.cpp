#include "ShaderStage.hpp"

#include <cstdio>
#include <cstring>
#include <fstream>
#include <utility>

#include "VkUtilities.hpp"

namespace plaster
{
    std::vector<uint32_t> spirvWordsFromBytes(std::span<const char> bytes)
    {
        if (bytes.empty() || bytes.size() % sizeof(uint32_t) != 0)
            return {};

        std::vector<uint32_t> words(bytes.size() / sizeof(uint32_t));
        std::memcpy(words.data(), bytes.data(), bytes.size());

        if (words.front() != kSpirvMagic)
            return {};

        return words;
    }

    static std::vector<char> loadFileBytes(const std::filesystem::path& path)
    {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file)
        {
            std::fprintf(stderr, "ShaderStage: failed to open %s\n", path.string().c_str());
            return {};
        }

        const std::streamsize size = file.tellg();
        if (size <= 0)
            return {};

        std::vector<char> code(static_cast<size_t>(size));

        file.seekg(0, std::ios::beg);
        if (!file.read(code.data(), size))
        {
            std::fprintf(stderr, "ShaderStage: failed to read %s\n", path.string().c_str());
            return {};
        }

        return code;
    }

    ShaderStage::ShaderStage(VkDevice              device,
                             VkShaderModule        module,
                             VkShaderStageFlagBits stage,
                             std::string           entryPoint) : m_device(device),
                                                       m_module(module),
                                                       m_stage(stage),
                                                       m_entryPoint(std::move(entryPoint))
    {
    }

    ShaderStage::~ShaderStage()
    {
        destroy();
    }

    void ShaderStage::destroy()
    {
        if (m_module != VK_NULL_HANDLE && m_device != VK_NULL_HANDLE)
        {
            vkDestroyShaderModule(m_device, m_module, nullptr);
            m_module = VK_NULL_HANDLE;
        }
    }

    ShaderStage ShaderStage::fromSpirvFile(VkDevice                     device,
                                           const std::filesystem::path& path,
                                           VkShaderStageFlagBits        stage,
                                           const char*                  entryPoint)
    {
        const std::vector<char> bytes = loadFileBytes(path);
        if (bytes.empty())
            return {}; // invalid, caller checks isValid()

        const std::vector<uint32_t> words = spirvWordsFromBytes(bytes);
        if (words.empty())
        {
            std::fprintf(stderr, "ShaderStage: %s is not a SPIR-V module\n", path.string().c_str());
            return {};
        }

        VkShaderModuleCreateInfo ci{};
        ci.sType    = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        ci.codeSize = words.size() * sizeof(uint32_t);
        ci.pCode    = words.data();

        VkShaderModule module = VK_NULL_HANDLE;
        if (const VkResult r = vkCreateShaderModule(device, &ci, nullptr, &module); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "ShaderStage: vkCreateShaderModule");
            std::fprintf(stderr, "ShaderStage: vkCreateShaderModule failed for %s\n", path.string().c_str());
            return {};
        }

        return ShaderStage(device, module, stage, entryPoint);
    }

    void ShaderStage::moveFrom(ShaderStage&& other) noexcept
    {
        m_device     = other.m_device;
        m_module     = other.m_module;
        m_stage      = other.m_stage;
        m_entryPoint = std::move(other.m_entryPoint);

        other.m_device = VK_NULL_HANDLE;
        other.m_module = VK_NULL_HANDLE;
    }

    ShaderStage::ShaderStage(ShaderStage&& other) noexcept
    {
        moveFrom(std::move(other));
    }

    ShaderStage& ShaderStage::operator=(ShaderStage&& other) noexcept
    {
        if (this != &other)
        {
            destroy();
            moveFrom(std::move(other));
        }
        return *this;
    }

} // namespace plaster
