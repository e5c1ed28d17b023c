#include "app/particle_app.hpp"
#include "app/trace.hpp"
#include "app/vulkan_api.hpp"

#include <stdexcept>

namespace pointsprite::app {

void ParticleApp::CreateRenderTargets() {
    TRACE_FUNCTION();
    SurfaceSupport support = QuerySurfaceSupport(physicalDevice_);

    int pixelWidth = 0;
    int pixelHeight = 0;
    if (!SDL_GetWindowSizeInPixels(window_, &pixelWidth, &pixelHeight)) {
        pixelWidth = static_cast<int>(config_.width);
        pixelHeight = static_cast<int>(config_.height);
    }
    swapChainExtent_ = vulkan::ChooseSwapExtent(support.capabilities, pixelWidth, pixelHeight);
    TRACE_VAR(swapChainExtent_.width);
    TRACE_VAR(swapChainExtent_.height);

    uint32_t queueFamilies[] = {graphicsComputeFamily_, presentFamily_};
    bool sharedQueues = graphicsComputeFamily_ != presentFamily_;

    VkSwapchainCreateInfoKHR swapchainInfo{};
    swapchainInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    swapchainInfo.surface = surface_;
    swapchainInfo.minImageCount = vulkan::ChooseImageCount(support.capabilities);
    swapchainInfo.imageFormat = surfaceFormat_.format;
    swapchainInfo.imageColorSpace = surfaceFormat_.colorSpace;
    swapchainInfo.imageExtent = swapChainExtent_;
    swapchainInfo.imageArrayLayers = 1;
    swapchainInfo.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    swapchainInfo.imageSharingMode = sharedQueues ? VK_SHARING_MODE_CONCURRENT : VK_SHARING_MODE_EXCLUSIVE;
    swapchainInfo.queueFamilyIndexCount = sharedQueues ? 2 : 0;
    swapchainInfo.pQueueFamilyIndices = sharedQueues ? queueFamilies : nullptr;
    swapchainInfo.preTransform = support.capabilities.currentTransform;
    swapchainInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    swapchainInfo.presentMode = vulkan::ChoosePresentMode(support.presentModes);
    swapchainInfo.clipped = VK_TRUE;

    vulkan::CheckResult(vkCreateSwapchainKHR(device_, &swapchainInfo, nullptr, &swapChain_), "vkCreateSwapchainKHR");

    swapChainImages_ = vulkan::Enumerate<VkImage>(
        [&](uint32_t* count, VkImage* images) { return vkGetSwapchainImagesKHR(device_, swapChain_, count, images); },
        "vkGetSwapchainImagesKHR");
    TRACE_VAR(swapChainImages_.size());

    // Each swapchain image gets a color view and a framebuffer over it.
    swapChainImageViews_.reserve(swapChainImages_.size());
    swapChainFramebuffers_.reserve(swapChainImages_.size());
    for (VkImage image : swapChainImages_) {
        VkImageViewCreateInfo viewInfo{};
        viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewInfo.image = image;
        viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format = surfaceFormat_.format;
        viewInfo.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

        VkImageView view = VK_NULL_HANDLE;
        vulkan::CheckResult(vkCreateImageView(device_, &viewInfo, nullptr, &view), "vkCreateImageView");
        swapChainImageViews_.push_back(view);

        VkFramebufferCreateInfo framebufferInfo{};
        framebufferInfo.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        framebufferInfo.renderPass = renderPass_;
        framebufferInfo.attachmentCount = 1;
        framebufferInfo.pAttachments = &view;
        framebufferInfo.width = swapChainExtent_.width;
        framebufferInfo.height = swapChainExtent_.height;
        framebufferInfo.layers = 1;

        VkFramebuffer framebuffer = VK_NULL_HANDLE;
        vulkan::CheckResult(vkCreateFramebuffer(device_, &framebufferInfo, nullptr, &framebuffer),
                            "vkCreateFramebuffer");
        swapChainFramebuffers_.push_back(framebuffer);
    }
}

void ParticleApp::DestroyRenderTargets() {
    for (VkFramebuffer framebuffer : swapChainFramebuffers_) {
        vkDestroyFramebuffer(device_, framebuffer, nullptr);
    }
    for (VkImageView view : swapChainImageViews_) {
        vkDestroyImageView(device_, view, nullptr);
    }
    swapChainFramebuffers_.clear();
    swapChainImageViews_.clear();
    swapChainImages_.clear();
    vkDestroySwapchainKHR(device_, swapChain_, nullptr);
    swapChain_ = VK_NULL_HANDLE;
}

// The surface format is fixed at device selection, so the render pass and
// pipelines outlive the swapchain; only the targets are rebuilt.
void ParticleApp::RecreateRenderTargets() {
    TRACE_FUNCTION();
    int width = 0;
    int height = 0;
    // A minimized window reports 0x0; wait for it to come back.
    while (true) {
        if (!SDL_GetWindowSizeInPixels(window_, &width, &height)) {
            throw std::runtime_error(std::string("SDL_GetWindowSizeInPixels failed: ") + SDL_GetError());
        }
        if (width > 0 && height > 0) {
            break;
        }
        if (!SDL_WaitEvent(nullptr)) {
            throw std::runtime_error(std::string("SDL_WaitEvent failed: ") + SDL_GetError());
        }
    }

    vulkan::CheckResult(vkDeviceWaitIdle(device_), "vkDeviceWaitIdle");
    DestroyRenderTargets();
    CreateRenderTargets();
    framebufferResized_ = false;
}

} // namespace pointsprite::app
