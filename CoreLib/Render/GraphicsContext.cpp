#include "GraphicsContext.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>

#include "FillPipeline.hpp"
#include "ShaderStage.hpp"
#include "TriangleMesh.hpp"
#include "VkUtilities.hpp"

namespace plaster
{
    namespace
    {
        const char* deviceTypeStr(VkPhysicalDeviceType t) noexcept
        {
            switch (t)
            {
                case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:
                    return "Discrete";
                case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU:
                    return "Integrated";
                case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU:
                    return "Virtual";
                case VK_PHYSICAL_DEVICE_TYPE_CPU:
                    return "CPU";
                default:
                    return "Other";
            }
        }

        std::string versionStr(uint32_t v)
        {
            return std::to_string(VK_VERSION_MAJOR(v)) + "." +
                   std::to_string(VK_VERSION_MINOR(v)) + "." +
                   std::to_string(VK_VERSION_PATCH(v));
        }

        bool hasSwapchainExtension(VkPhysicalDevice pd)
        {
            uint32_t extCount = 0;
            vkEnumerateDeviceExtensionProperties(pd, nullptr, &extCount, nullptr);

            std::vector<VkExtensionProperties> exts(extCount);
            if (extCount)
                vkEnumerateDeviceExtensionProperties(pd, nullptr, &extCount, exts.data());

            for (const auto& e : exts)
            {
                if (std::strcmp(e.extensionName, VK_KHR_SWAPCHAIN_EXTENSION_NAME) == 0)
                    return true;
            }
            return false;
        }

        /// Graphics family that can also present to the surface.
        bool findPresentableGraphicsFamily(VkPhysicalDevice pd, VkSurfaceKHR surface, uint32_t& outFamily)
        {
            outFamily = 0xFFFFFFFFu;

            uint32_t qCount = 0;
            vkGetPhysicalDeviceQueueFamilyProperties(pd, &qCount, nullptr);

            std::vector<VkQueueFamilyProperties> qprops(qCount);
            if (qCount)
                vkGetPhysicalDeviceQueueFamilyProperties(pd, &qCount, qprops.data());

            for (uint32_t i = 0; i < qCount; ++i)
            {
                if ((qprops[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) == 0)
                    continue;

                VkBool32 present = VK_FALSE;
                if (vkGetPhysicalDeviceSurfaceSupportKHR(pd, i, surface, &present) != VK_SUCCESS)
                    continue;

                if (present)
                {
                    outFamily = i;
                    return true;
                }
            }
            return false;
        }

        int scoreDevice(const VkPhysicalDeviceProperties& props) noexcept
        {
            int score = 0;
            switch (props.deviceType)
            {
                case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:
                    score += 1000;
                    break;
                case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU:
                    score += 300;
                    break;
                case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU:
                    score += 150;
                    break;
                case VK_PHYSICAL_DEVICE_TYPE_CPU:
                    score += 10;
                    break;
                default:
                    score += 50;
                    break;
            }

            // Newer API as a tie-breaker
            score += int(VK_VERSION_MAJOR(props.apiVersion)) * 100;
            score += int(VK_VERSION_MINOR(props.apiVersion)) * 10;
            return score;
        }

        bool isSrgbFormat(const VkSurfaceFormatKHR& f) noexcept
        {
            return (f.format == VK_FORMAT_B8G8R8A8_SRGB || f.format == VK_FORMAT_R8G8B8A8_SRGB) &&
                   f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
        }

    } // namespace

    // ============================================================
    // Lifetime
    // ============================================================

    GraphicsContext::GraphicsContext(const SurfaceTarget& target, const EngineSettings& settings)
        : m_target{target},
          m_settings{settings}
    {
        m_ctx.instance       = target.instance;
        m_ctx.framesInFlight = settings.framesInFlight;
    }

    GraphicsContext::~GraphicsContext()
    {
        shutdown();
    }

    DeviceInitError GraphicsContext::create(const SurfaceTarget&              target,
                                            Extent2D                          extent,
                                            const EngineSettings&             settings,
                                            std::unique_ptr<GraphicsContext>& out)
    {
        out.reset();

        if (target.instance == VK_NULL_HANDLE || target.surface == VK_NULL_HANDLE)
            return DeviceInitError::InvalidSurfaceTarget;

        std::unique_ptr<GraphicsContext> gc{new GraphicsContext(target, settings.sanitized())};

        if (const DeviceInitError err = gc->pickPhysicalDevice(); err != DeviceInitError::None)
            return err;

        if (const DeviceInitError err = gc->createDevice(); err != DeviceInitError::None)
            return err;

        if (const DeviceInitError err = gc->chooseSurfacePolicy(); err != DeviceInitError::None)
            return err;

        if (!gc->createRenderPass() || !gc->createFrameResources())
            return DeviceInitError::DeviceCreationFailed;

        // A minimized window is not an error: the swapchain is built on the
        // first acquire with a non-empty extent.
        gc->m_requestedExtent = extent;
        if (!extent.empty())
        {
            bool zeroExtent = false;
            if (!gc->createSwapchain(extent, zeroExtent))
            {
                if (!zeroExtent)
                    return DeviceInitError::SwapchainCreationFailed;
                gc->m_stale = true;
            }
        }
        else
        {
            gc->m_stale = true;
        }

        if (const DeviceInitError err = gc->createPipeline(); err != DeviceInitError::None)
            return err;

        const EngineSettings& s = gc->m_settings;
        gc->m_vertexArena.init(&gc->m_ctx, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, s.initialVertexCapacity, "VertexArena", s.verbose);
        gc->m_indexArena.init(&gc->m_ctx, VK_BUFFER_USAGE_INDEX_BUFFER_BIT, s.initialIndexCapacity, "IndexArena", s.verbose);

        out = std::move(gc);
        return DeviceInitError::None;
    }

    void GraphicsContext::shutdown() noexcept
    {
        if (!m_ctx.device)
            return;

        vkDeviceWaitIdle(m_ctx.device);

        m_deferred.flushAll();

        m_vertexArena.destroy();
        m_indexArena.destroy();

        if (m_pipeline)
        {
            vkDestroyPipeline(m_ctx.device, m_pipeline, nullptr);
            m_pipeline = VK_NULL_HANDLE;
        }

        if (m_pipelineLayout)
        {
            vkDestroyPipelineLayout(m_ctx.device, m_pipelineLayout, nullptr);
            m_pipelineLayout = VK_NULL_HANDLE;
        }

        destroySwapchainObjects();

        if (m_renderPass)
        {
            vkDestroyRenderPass(m_ctx.device, m_renderPass, nullptr);
            m_renderPass = VK_NULL_HANDLE;
        }

        destroyFrameSync();

        if (m_cmdPool)
        {
            // Frees the per-frame command buffers with it.
            vkDestroyCommandPool(m_ctx.device, m_cmdPool, nullptr);
            m_cmdPool = VK_NULL_HANDLE;
        }

        vkDestroyDevice(m_ctx.device, nullptr);
        m_ctx.device = VK_NULL_HANDLE;

        // Surface and instance belong to the embedder.
    }

    // ============================================================
    // Device
    // ============================================================

    DeviceInitError GraphicsContext::pickPhysicalDevice()
    {
        uint32_t devCount = 0;
        vkEnumeratePhysicalDevices(m_ctx.instance, &devCount, nullptr);
        if (devCount == 0)
        {
            std::cerr << "GraphicsContext: No Vulkan physical devices found.\n";
            return DeviceInitError::NoAdapterFound;
        }

        std::vector<VkPhysicalDevice> devices(devCount);
        vkEnumeratePhysicalDevices(m_ctx.instance, &devCount, devices.data());

        VkPhysicalDevice best       = VK_NULL_HANDLE;
        uint32_t         bestFamily = 0;
        int              bestScore  = -1;

        for (VkPhysicalDevice pd : devices)
        {
            uint32_t family = 0;
            if (!findPresentableGraphicsFamily(pd, m_target.surface, family))
                continue;

            if (!hasSwapchainExtension(pd))
                continue;

            VkPhysicalDeviceProperties props = {};
            vkGetPhysicalDeviceProperties(pd, &props);

            const int score = scoreDevice(props);
            if (score > bestScore)
            {
                best       = pd;
                bestFamily = family;
                bestScore  = score;
            }
        }

        if (!best)
        {
            std::cerr << "GraphicsContext: No device can render to and present on this surface.\n";
            return DeviceInitError::NoAdapterFound;
        }

        m_ctx.physicalDevice           = best;
        m_ctx.graphicsQueueFamilyIndex = bestFamily;
        vkGetPhysicalDeviceProperties(best, &m_ctx.deviceProps);

        std::cerr << "GraphicsContext: Selected device: " << m_ctx.deviceProps.deviceName << " ("
                  << deviceTypeStr(m_ctx.deviceProps.deviceType) << "), Vulkan "
                  << versionStr(m_ctx.deviceProps.apiVersion) << "\n";

        return DeviceInitError::None;
    }

    DeviceInitError GraphicsContext::createDevice()
    {
        const float queuePriority = 1.0f;

        VkDeviceQueueCreateInfo qci = {};
        qci.sType                   = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        qci.queueFamilyIndex        = m_ctx.graphicsQueueFamilyIndex;
        qci.queueCount              = 1;
        qci.pQueuePriorities        = &queuePriority;

        const char* extensions[] = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

        VkPhysicalDeviceFeatures features = {};

        VkDeviceCreateInfo dci      = {};
        dci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        dci.queueCreateInfoCount    = 1;
        dci.pQueueCreateInfos       = &qci;
        dci.enabledExtensionCount   = 1;
        dci.ppEnabledExtensionNames = extensions;
        dci.pEnabledFeatures        = &features;

        if (const VkResult r = vkCreateDevice(m_ctx.physicalDevice, &dci, nullptr, &m_ctx.device); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkCreateDevice");
            m_ctx.device = VK_NULL_HANDLE;
            return DeviceInitError::DeviceCreationFailed;
        }

        vkGetDeviceQueue(m_ctx.device, m_ctx.graphicsQueueFamilyIndex, 0, &m_ctx.graphicsQueue);
        return DeviceInitError::None;
    }

    DeviceInitError GraphicsContext::chooseSurfacePolicy()
    {
        // ------------------------------------------------------------
        // Format: sRGB with non-linear color space
        // ------------------------------------------------------------
        uint32_t fmtCount = 0;
        vkGetPhysicalDeviceSurfaceFormatsKHR(m_ctx.physicalDevice, m_target.surface, &fmtCount, nullptr);
        std::vector<VkSurfaceFormatKHR> formats(fmtCount);
        if (fmtCount)
            vkGetPhysicalDeviceSurfaceFormatsKHR(m_ctx.physicalDevice, m_target.surface, &fmtCount, formats.data());

        if (formats.empty())
            return DeviceInitError::NoTextureFormatFound;

        auto srgb = std::find_if(formats.begin(), formats.end(), isSrgbFormat);
        if (srgb != formats.end())
        {
            m_surfaceFormat = *srgb;
        }
        else if (m_settings.requireSrgb)
        {
            std::cerr << "GraphicsContext: Surface offers no sRGB format.\n";
            return DeviceInitError::NoTextureFormatFound;
        }
        else
        {
            m_surfaceFormat = formats.front();
        }

        // ------------------------------------------------------------
        // Present mode: FIFO is mandatory, MAILBOX only on request
        // ------------------------------------------------------------
        uint32_t pmCount = 0;
        vkGetPhysicalDeviceSurfacePresentModesKHR(m_ctx.physicalDevice, m_target.surface, &pmCount, nullptr);
        std::vector<VkPresentModeKHR> modes(pmCount);
        if (pmCount)
            vkGetPhysicalDeviceSurfacePresentModesKHR(m_ctx.physicalDevice, m_target.surface, &pmCount, modes.data());

        auto hasMode = [&](VkPresentModeKHR m) {
            return std::find(modes.begin(), modes.end(), m) != modes.end();
        };

        if (!hasMode(VK_PRESENT_MODE_FIFO_KHR))
            return DeviceInitError::NoFifoPresentModeFound;

        m_presentMode = VK_PRESENT_MODE_FIFO_KHR;
        if (m_settings.presentMode == EngineSettings::PresentMode::Mailbox && hasMode(VK_PRESENT_MODE_MAILBOX_KHR))
            m_presentMode = VK_PRESENT_MODE_MAILBOX_KHR;

        // ------------------------------------------------------------
        // Alpha: opaque
        // ------------------------------------------------------------
        VkSurfaceCapabilitiesKHR caps = {};
        if (const VkResult r = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_ctx.physicalDevice, m_target.surface, &caps);
            r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");
            return DeviceInitError::NoAlphaModeFound;
        }

        if ((caps.supportedCompositeAlpha & VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR) == 0)
            return DeviceInitError::NoAlphaModeFound;

        if (m_settings.verbose)
        {
            std::cerr << "GraphicsContext: format " << int(m_surfaceFormat.format) << ", present mode "
                      << (m_presentMode == VK_PRESENT_MODE_MAILBOX_KHR ? "MAILBOX" : "FIFO") << "\n";
        }

        return DeviceInitError::None;
    }

    bool GraphicsContext::createRenderPass()
    {
        VkAttachmentDescription color = {};
        color.format                  = m_surfaceFormat.format;
        color.samples                 = VK_SAMPLE_COUNT_1_BIT;
        color.loadOp                  = VK_ATTACHMENT_LOAD_OP_CLEAR;
        color.storeOp                 = VK_ATTACHMENT_STORE_OP_STORE;
        color.stencilLoadOp           = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        color.stencilStoreOp          = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        color.initialLayout           = VK_IMAGE_LAYOUT_UNDEFINED;
        color.finalLayout             = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

        VkAttachmentReference colorRef = {};
        colorRef.attachment            = 0;
        colorRef.layout                = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

        VkSubpassDescription subpass = {};
        subpass.pipelineBindPoint    = VK_PIPELINE_BIND_POINT_GRAPHICS;
        subpass.colorAttachmentCount = 1;
        subpass.pColorAttachments    = &colorRef;

        VkSubpassDependency dep = {};
        dep.srcSubpass          = VK_SUBPASS_EXTERNAL;
        dep.dstSubpass          = 0;
        dep.srcStageMask        = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        dep.dstStageMask        = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        dep.srcAccessMask       = 0;
        dep.dstAccessMask       = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

        VkRenderPassCreateInfo rpci = {};
        rpci.sType                  = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
        rpci.attachmentCount        = 1;
        rpci.pAttachments           = &color;
        rpci.subpassCount           = 1;
        rpci.pSubpasses             = &subpass;
        rpci.dependencyCount        = 1;
        rpci.pDependencies          = &dep;

        if (const VkResult r = vkCreateRenderPass(m_ctx.device, &rpci, nullptr, &m_renderPass); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkCreateRenderPass");
            m_renderPass = VK_NULL_HANDLE;
            return false;
        }
        return true;
    }

    bool GraphicsContext::createFrameResources()
    {
        VkCommandPoolCreateInfo pci = {};
        pci.sType                   = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        pci.flags                   = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        pci.queueFamilyIndex        = m_ctx.graphicsQueueFamilyIndex;

        if (const VkResult r = vkCreateCommandPool(m_ctx.device, &pci, nullptr, &m_cmdPool); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkCreateCommandPool");
            m_cmdPool = VK_NULL_HANDLE;
            return false;
        }

        for (uint32_t i = 0; i < m_ctx.framesInFlight; ++i)
        {
            VkCommandBufferAllocateInfo ai = {};
            ai.sType                       = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            ai.commandPool                 = m_cmdPool;
            ai.level                       = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            ai.commandBufferCount          = 1;

            if (const VkResult r = vkAllocateCommandBuffers(m_ctx.device, &ai, &m_frames[i].cmd); r != VK_SUCCESS)
            {
                vkutil::printVkResult(r, "vkAllocateCommandBuffers");
                return false;
            }
        }

        m_deferred.init(m_ctx.framesInFlight);
        m_frameIndex = 0;

        return createFrameSync();
    }

    bool GraphicsContext::createFrameSync()
    {
        VkSemaphoreCreateInfo sci = {};
        sci.sType                 = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

        VkFenceCreateInfo fci = {};
        fci.sType             = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fci.flags             = VK_FENCE_CREATE_SIGNALED_BIT;

        for (uint32_t i = 0; i < m_ctx.framesInFlight; ++i)
        {
            FrameSlot& fr = m_frames[i];

            if (vkCreateFence(m_ctx.device, &fci, nullptr, &fr.fence) != VK_SUCCESS ||
                vkCreateSemaphore(m_ctx.device, &sci, nullptr, &fr.imageAvailable) != VK_SUCCESS)
            {
                std::cerr << "GraphicsContext: Failed to create frame sync objects.\n";
                return false;
            }
        }
        return true;
    }

    void GraphicsContext::destroyFrameSync() noexcept
    {
        for (FrameSlot& fr : m_frames)
        {
            if (fr.fence)
                vkDestroyFence(m_ctx.device, fr.fence, nullptr);
            if (fr.imageAvailable)
                vkDestroySemaphore(m_ctx.device, fr.imageAvailable, nullptr);

            fr.fence          = VK_NULL_HANDLE;
            fr.imageAvailable = VK_NULL_HANDLE;
        }
    }

    DeviceInitError GraphicsContext::createPipeline()
    {
        const FillPipelineConfig config = FillPipelineConfig::make(m_settings.cullBackFaces);

        ShaderStage vert = vkutil::loadStage(m_ctx.device,
                                             m_settings.shaderDir,
                                             config.vertexShader,
                                             VK_SHADER_STAGE_VERTEX_BIT,
                                             config.entryPoint);
        ShaderStage frag = vkutil::loadStage(m_ctx.device,
                                             m_settings.shaderDir,
                                             config.fragmentShader,
                                             VK_SHADER_STAGE_FRAGMENT_BIT,
                                             config.entryPoint);

        if (!vert.isValid() || !frag.isValid())
        {
            std::cerr << "GraphicsContext: Fill shaders not found in " << m_settings.shaderDir.string() << "\n";
            return DeviceInitError::ShaderLoadFailed;
        }

        m_pipelineLayout = vkutil::createEmptyPipelineLayout(m_ctx.device);
        if (!m_pipelineLayout)
            return DeviceInitError::PipelineCreationFailed;

        const VkPipelineShaderStageCreateInfo stages[] = {vert.stageInfo(), frag.stageInfo()};

        m_pipeline = createFillPipeline(m_ctx, m_renderPass, m_pipelineLayout, stages, 2, config);
        if (!m_pipeline)
            return DeviceInitError::PipelineCreationFailed;

        // Shader modules are no longer needed once the pipeline exists.
        return DeviceInitError::None;
    }

    // ============================================================
    // Swapchain
    // ============================================================

    VkExtent2D GraphicsContext::chooseExtent(const VkSurfaceCapabilitiesKHR& caps, Extent2D requested) const noexcept
    {
        if (caps.currentExtent.width != 0xFFFFFFFFu)
            return caps.currentExtent;

        VkExtent2D e = {requested.width, requested.height};
        e.width      = std::clamp(e.width, caps.minImageExtent.width, caps.maxImageExtent.width);
        e.height     = std::clamp(e.height, caps.minImageExtent.height, caps.maxImageExtent.height);
        return e;
    }

    bool GraphicsContext::createSwapchain(Extent2D requested, bool& zeroExtent)
    {
        zeroExtent = false;
        destroySwapchainObjects();

        VkSurfaceCapabilitiesKHR caps = {};
        if (const VkResult r = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_ctx.physicalDevice, m_target.surface, &caps);
            r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");
            return false;
        }

        const VkExtent2D ex = chooseExtent(caps, requested);
        if (ex.width == 0 || ex.height == 0)
        {
            zeroExtent = true;
            return false;
        }

        uint32_t imageCount = std::max(caps.minImageCount + 1u, 2u);
        if (caps.maxImageCount > 0)
            imageCount = std::min(imageCount, caps.maxImageCount);

        VkSwapchainCreateInfoKHR sci = {};
        sci.sType                    = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
        sci.surface                  = m_target.surface;
        sci.minImageCount            = imageCount;
        sci.imageFormat              = m_surfaceFormat.format;
        sci.imageColorSpace          = m_surfaceFormat.colorSpace;
        sci.imageExtent              = ex;
        sci.imageArrayLayers         = 1;
        sci.imageUsage               = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
        sci.imageSharingMode         = VK_SHARING_MODE_EXCLUSIVE;
        sci.preTransform             = caps.currentTransform;
        sci.compositeAlpha           = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
        sci.presentMode              = m_presentMode;
        sci.clipped                  = VK_TRUE;
        sci.oldSwapchain             = VK_NULL_HANDLE;

        if (const VkResult r = vkCreateSwapchainKHR(m_ctx.device, &sci, nullptr, &m_swapchain); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkCreateSwapchainKHR");
            m_swapchain = VK_NULL_HANDLE;
            return false;
        }

        m_swapExtent = ex;

        uint32_t count = 0;
        vkGetSwapchainImagesKHR(m_ctx.device, m_swapchain, &count, nullptr);
        m_images.resize(count);
        vkGetSwapchainImagesKHR(m_ctx.device, m_swapchain, &count, m_images.data());

        m_views.assign(count, VK_NULL_HANDLE);
        m_framebuffers.assign(count, VK_NULL_HANDLE);
        m_renderFinished.assign(count, VK_NULL_HANDLE);

        VkSemaphoreCreateInfo semInfo = {};
        semInfo.sType                 = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

        for (uint32_t i = 0; i < count; ++i)
        {
            VkImageViewCreateInfo vci           = {};
            vci.sType                           = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            vci.image                           = m_images[i];
            vci.viewType                        = VK_IMAGE_VIEW_TYPE_2D;
            vci.format                          = m_surfaceFormat.format;
            vci.subresourceRange.aspectMask     = VK_IMAGE_ASPECT_COLOR_BIT;
            vci.subresourceRange.baseMipLevel   = 0;
            vci.subresourceRange.levelCount     = 1;
            vci.subresourceRange.baseArrayLayer = 0;
            vci.subresourceRange.layerCount     = 1;

            if (vkCreateImageView(m_ctx.device, &vci, nullptr, &m_views[i]) != VK_SUCCESS)
            {
                std::cerr << "GraphicsContext: Failed to create swapchain image view " << i << "\n";
                destroySwapchainObjects();
                return false;
            }

            VkFramebufferCreateInfo fci = {};
            fci.sType                   = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
            fci.renderPass              = m_renderPass;
            fci.attachmentCount         = 1;
            fci.pAttachments            = &m_views[i];
            fci.width                   = ex.width;
            fci.height                  = ex.height;
            fci.layers                  = 1;

            if (vkCreateFramebuffer(m_ctx.device, &fci, nullptr, &m_framebuffers[i]) != VK_SUCCESS)
            {
                std::cerr << "GraphicsContext: Failed to create framebuffer " << i << "\n";
                destroySwapchainObjects();
                return false;
            }

            if (vkCreateSemaphore(m_ctx.device, &semInfo, nullptr, &m_renderFinished[i]) != VK_SUCCESS)
            {
                std::cerr << "GraphicsContext: Failed to create present semaphore " << i << "\n";
                destroySwapchainObjects();
                return false;
            }
        }

        if (m_settings.verbose)
            std::cerr << "GraphicsContext: swapchain " << ex.width << "x" << ex.height << ", " << count << " images\n";

        return true;
    }

    void GraphicsContext::destroySwapchainObjects() noexcept
    {
        if (!m_ctx.device)
            return;

        for (VkSemaphore s : m_renderFinished)
        {
            if (s)
                vkDestroySemaphore(m_ctx.device, s, nullptr);
        }
        m_renderFinished.clear();

        for (VkFramebuffer fb : m_framebuffers)
        {
            if (fb)
                vkDestroyFramebuffer(m_ctx.device, fb, nullptr);
        }
        m_framebuffers.clear();

        for (VkImageView v : m_views)
        {
            if (v)
                vkDestroyImageView(m_ctx.device, v, nullptr);
        }
        m_views.clear();

        // Swapchain images are owned by the swapchain.
        m_images.clear();

        if (m_swapchain)
        {
            vkDestroySwapchainKHR(m_ctx.device, m_swapchain, nullptr);
            m_swapchain = VK_NULL_HANDLE;
        }

        m_swapExtent = {};
    }

    bool GraphicsContext::rebuildSwapchain(Extent2D requested, bool& zeroExtent)
    {
        vkDeviceWaitIdle(m_ctx.device);

        // A failed submit can leave an acquire semaphore signaled with nobody
        // waiting on it. Fresh sync objects put every slot back in a known state.
        destroyFrameSync();
        if (!createFrameSync())
        {
            zeroExtent = false;
            m_stale    = true;
            return false;
        }

        const bool ok = createSwapchain(requested, zeroExtent);
        m_stale       = !ok;
        return ok;
    }

    // ============================================================
    // FrameBackend
    // ============================================================

    SurfaceAcquireError GraphicsContext::acquireTarget(FrameTarget& target)
    {
        if (m_requestedExtent.empty())
            return SurfaceAcquireError::ZeroExtent;

        if (m_stale || !m_swapchain)
        {
            bool zeroExtent = false;
            if (!rebuildSwapchain(m_requestedExtent, zeroExtent))
                return zeroExtent ? SurfaceAcquireError::ZeroExtent : SurfaceAcquireError::OutOfDate;
        }

        const uint32_t fi = m_frameIndex;
        FrameSlot&     fr = m_frames[fi];

        const VkResult wr = vkWaitForFences(m_ctx.device, 1, &fr.fence, VK_TRUE, m_settings.acquireTimeoutNs);
        if (wr == VK_TIMEOUT)
            return SurfaceAcquireError::Timeout;
        if (wr == VK_ERROR_DEVICE_LOST)
            return SurfaceAcquireError::DeviceLost;
        if (wr != VK_SUCCESS)
        {
            vkutil::printVkResult(wr, "vkWaitForFences");
            return SurfaceAcquireError::DeviceLost;
        }

        // The slot's previous submission is done; release what it referenced.
        m_deferred.flush(fi);

        uint32_t       imageIndex = 0;
        const VkResult acq        = vkAcquireNextImageKHR(m_ctx.device,
                                                   m_swapchain,
                                                   m_settings.acquireTimeoutNs,
                                                   fr.imageAvailable,
                                                   VK_NULL_HANDLE,
                                                   &imageIndex);
        switch (acq)
        {
            case VK_SUCCESS:
                break;
            case VK_SUBOPTIMAL_KHR:
                // Still presentable; rebuild after this frame.
                m_stale = true;
                break;
            case VK_ERROR_OUT_OF_DATE_KHR:
                m_stale = true;
                return SurfaceAcquireError::OutOfDate;
            case VK_TIMEOUT:
            case VK_NOT_READY:
                return SurfaceAcquireError::Timeout;
            case VK_ERROR_SURFACE_LOST_KHR:
                return SurfaceAcquireError::SurfaceLost;
            case VK_ERROR_DEVICE_LOST:
                return SurfaceAcquireError::DeviceLost;
            default:
                vkutil::printVkResult(acq, "vkAcquireNextImageKHR");
                return SurfaceAcquireError::SurfaceLost;
        }

        vkResetCommandBuffer(fr.cmd, 0);

        VkCommandBufferBeginInfo bi = {};
        bi.sType                    = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        bi.flags                    = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

        if (const VkResult r = vkBeginCommandBuffer(fr.cmd, &bi); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkBeginCommandBuffer");
            m_stale = true;
            return SurfaceAcquireError::SubmitFailed;
        }

        target.imageIndex = imageIndex;
        target.frameIndex = fi;
        target.extent     = Extent2D{m_swapExtent.width, m_swapExtent.height};
        return SurfaceAcquireError::None;
    }

    bool GraphicsContext::uploadGeometry(const FrameTarget& target, const GeometryUploadPlan& plan)
    {
        const uint32_t  fi  = target.frameIndex;
        VkCommandBuffer cmd = m_frames[fi].cmd;

        vkutil::barrierVertexInputToTransfer(cmd);

        if (!m_vertexArena.reserve(cmd, m_deferred, fi, plan.requiredVertexBytes()) ||
            !m_indexArena.reserve(cmd, m_deferred, fi, plan.requiredIndexBytes()))
        {
            std::cerr << "GraphicsContext: Failed to grow geometry buffers.\n";
            return false;
        }

        std::vector<ArenaWrite> vertexWrites;
        vertexWrites.reserve(plan.vertexRanges.size());
        for (const ElementRange& r : plan.vertexRanges)
        {
            vertexWrites.push_back(ArenaWrite{VkDeviceSize(r.first) * sizeof(Vertex),
                                              plan.vertices.data() + r.first,
                                              VkDeviceSize(r.count) * sizeof(Vertex)});
        }

        std::vector<ArenaWrite> indexWrites;
        indexWrites.reserve(plan.indexRanges.size());
        for (const ElementRange& r : plan.indexRanges)
        {
            indexWrites.push_back(ArenaWrite{VkDeviceSize(r.first) * sizeof(uint32_t),
                                             plan.indices.data() + r.first,
                                             VkDeviceSize(r.count) * sizeof(uint32_t)});
        }

        if (!m_vertexArena.write(cmd, m_deferred, fi, vertexWrites) ||
            !m_indexArena.write(cmd, m_deferred, fi, indexWrites))
        {
            std::cerr << "GraphicsContext: Failed to stage geometry.\n";
            return false;
        }

        vkutil::barrierTransferToVertexInput(cmd);
        return true;
    }

    void GraphicsContext::beginPass(const FrameTarget& target, const glm::vec4& clearColor)
    {
        VkCommandBuffer cmd = m_frames[target.frameIndex].cmd;

        VkClearValue clear = {};
        clear.color        = vkutil::toVkClearColor(clearColor);

        VkRenderPassBeginInfo rbi = {};
        rbi.sType                 = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
        rbi.renderPass            = m_renderPass;
        rbi.framebuffer           = m_framebuffers[target.imageIndex];
        rbi.renderArea.offset     = {0, 0};
        rbi.renderArea.extent     = m_swapExtent;
        rbi.clearValueCount       = 1;
        rbi.pClearValues          = &clear;

        vkCmdBeginRenderPass(cmd, &rbi, VK_SUBPASS_CONTENTS_INLINE);
        vkutil::setFlippedViewportAndScissor(cmd, m_swapExtent.width, m_swapExtent.height);
    }

    void GraphicsContext::bindPipelineAndBuffers(const FrameTarget& target)
    {
        VkCommandBuffer cmd = m_frames[target.frameIndex].cmd;

        vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_pipeline);

        const VkBuffer     vb     = m_vertexArena.buffer();
        const VkDeviceSize offset = 0;
        vkCmdBindVertexBuffers(cmd, 0, 1, &vb, &offset);
        vkCmdBindIndexBuffer(cmd, m_indexArena.buffer(), 0, vkcfg::kIndexType);
    }

    void GraphicsContext::drawIndexed(const FrameTarget& target, const DrawCall& draw)
    {
        vkCmdDrawIndexed(m_frames[target.frameIndex].cmd, draw.indexCount, 1, draw.firstIndex, draw.baseVertex, 0);
    }

    void GraphicsContext::endPass(const FrameTarget& target)
    {
        vkCmdEndRenderPass(m_frames[target.frameIndex].cmd);
    }

    bool GraphicsContext::submit(const FrameTarget& target)
    {
        FrameSlot& fr = m_frames[target.frameIndex];

        if (const VkResult r = vkEndCommandBuffer(fr.cmd); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkEndCommandBuffer");
            m_stale = true;
            return false;
        }

        const VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

        VkSubmitInfo si         = {};
        si.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        si.waitSemaphoreCount   = 1;
        si.pWaitSemaphores      = &fr.imageAvailable;
        si.pWaitDstStageMask    = &waitStage;
        si.commandBufferCount   = 1;
        si.pCommandBuffers      = &fr.cmd;
        si.signalSemaphoreCount = 1;
        si.pSignalSemaphores    = &m_renderFinished[target.imageIndex];

        vkResetFences(m_ctx.device, 1, &fr.fence);

        if (const VkResult r = vkQueueSubmit(m_ctx.graphicsQueue, 1, &si, fr.fence); r != VK_SUCCESS)
        {
            vkutil::printVkResult(r, "vkQueueSubmit");
            // The fence stays unsignaled; the rebuild on the next acquire recreates it.
            m_stale = true;
            return false;
        }

        return true;
    }

    SurfaceAcquireError GraphicsContext::present(const FrameTarget& target)
    {
        VkPresentInfoKHR pi   = {};
        pi.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
        pi.waitSemaphoreCount = 1;
        pi.pWaitSemaphores    = &m_renderFinished[target.imageIndex];
        pi.swapchainCount     = 1;
        pi.pSwapchains        = &m_swapchain;
        pi.pImageIndices      = &target.imageIndex;

        const VkResult pr = vkQueuePresentKHR(m_ctx.graphicsQueue, &pi);

        m_frameIndex = (m_frameIndex + 1) % m_ctx.framesInFlight;

        switch (pr)
        {
            case VK_SUCCESS:
                return SurfaceAcquireError::None;
            case VK_SUBOPTIMAL_KHR:
                m_stale = true;
                return SurfaceAcquireError::None;
            case VK_ERROR_OUT_OF_DATE_KHR:
                m_stale = true;
                return SurfaceAcquireError::OutOfDate;
            case VK_ERROR_SURFACE_LOST_KHR:
                return SurfaceAcquireError::SurfaceLost;
            case VK_ERROR_DEVICE_LOST:
                return SurfaceAcquireError::DeviceLost;
            default:
                vkutil::printVkResult(pr, "vkQueuePresentKHR");
                m_stale = true;
                return SurfaceAcquireError::SurfaceLost;
        }
    }

    ReconfigureError GraphicsContext::reconfigure(Extent2D extent)
    {
        if (extent.empty())
            return ReconfigureError::ZeroExtent;

        m_requestedExtent = extent;

        bool zeroExtent = false;
        if (!rebuildSwapchain(extent, zeroExtent))
        {
            if (zeroExtent)
                return ReconfigureError::ZeroExtent;

            std::cerr << "GraphicsContext: Swapchain rebuild failed for " << extent.width << "x" << extent.height << "\n";
            return ReconfigureError::SwapchainCreationFailed;
        }

        return ReconfigureError::None;
    }

    Extent2D GraphicsContext::extent() const
    {
        if (m_swapchain)
            return Extent2D{m_swapExtent.width, m_swapExtent.height};
        return m_requestedExtent;
    }

} // namespace plaster
