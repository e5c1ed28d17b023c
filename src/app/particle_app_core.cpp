#include "app/particle_app.hpp"
#include "app/trace.hpp"
#include "app/vulkan_api.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace pointsprite::app {

namespace {

// Upper bound on the step handed to the compute pass.
constexpr float kMaxFrameDelta = 0.1f;

std::string BuildSdlErrorMessage(const char* context) {
    std::ostringstream oss;
    oss << context;
    const char* sdlError = SDL_GetError();
    if (sdlError && *sdlError != '\0') {
        oss << ": " << sdlError;
    } else {
        oss << ": (SDL_GetError returned an empty string)";
    }
    return oss.str();
}

void ThrowSdlErrorIfFailed(bool success, const char* context) {
    if (!success) {
        throw std::runtime_error(BuildSdlErrorMessage(context));
    }
}

} // namespace

ParticleApp::ParticleApp(const RuntimeConfig& config, bool luaDebug)
    : config_(config),
      particleScript_(config.scriptPath, luaDebug) {
    TRACE_FUNCTION();
    TRACE_VAR(config.scriptPath);
}

void ParticleApp::Run() {
    TRACE_FUNCTION();
    try {
        InitSDL();
        InitVulkan();
        MainLoop();
    } catch (const std::exception&) {
        Cleanup();
        throw;
    }
    Cleanup();
}

void ParticleApp::InitSDL() {
    TRACE_FUNCTION();
    TRACE_VAR(config_.width);
    TRACE_VAR(config_.height);
    ThrowSdlErrorIfFailed(SDL_Init(SDL_INIT_VIDEO), "SDL_Init failed");
    ThrowSdlErrorIfFailed(SDL_Vulkan_LoadLibrary(nullptr), "SDL_Vulkan_LoadLibrary failed");
    window_ = SDL_CreateWindow("Vulkan Particle Demo", static_cast<int>(config_.width),
                               static_cast<int>(config_.height), SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE);
    if (!window_) {
        throw std::runtime_error(BuildSdlErrorMessage("SDL_CreateWindow failed"));
    }
    TRACE_VAR(window_);
}

void ParticleApp::InitVulkan() {
    TRACE_FUNCTION();
    // The particle count decides which devices qualify, so the scene loads first.
    LoadSceneData();
    CreateInstance();
    CreateSurface();
    PickPhysicalDevice();
    CreateLogicalDevice();
    CreateRenderPass();
    CreateRenderTargets();
    CreateParticleBuffer();
    CreateDescriptorSet();
    CreateGraphicsPipeline();
    CreateComputePipeline();
    CreateFrameResources();
    std::cout << "Vulkan initialized; running particle system with " << particles_.size()
              << " particles.\n";
}

void ParticleApp::MainLoop() {
    TRACE_FUNCTION();
    bool running = true;
    auto last = std::chrono::steady_clock::now();
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_EVENT_QUIT || event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED) {
                running = false;
            } else if (event.type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED) {
                framebufferResized_ = true;
            }
        }
        if (!running) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        float deltaTime = std::min(std::chrono::duration<float>(now - last).count(), kMaxFrameDelta);
        last = now;
        DrawFrame(deltaTime);
    }

    vulkan::CheckResult(vkDeviceWaitIdle(device_), "vkDeviceWaitIdle");
}

void ParticleApp::Cleanup() {
    TRACE_FUNCTION();
    if (device_ != VK_NULL_HANDLE) {
        // Teardown continues after a failed wait; the error is reported only.
        VkResult idle = vkDeviceWaitIdle(device_);
        if (idle != VK_SUCCESS) {
            std::cerr << "vkDeviceWaitIdle failed during cleanup (VkResult " << idle << ")\n";
        }

        vkDestroyFence(device_, inFlightFence_, nullptr);
        vkDestroySemaphore(device_, renderFinishedSemaphore_, nullptr);
        vkDestroySemaphore(device_, imageAvailableSemaphore_, nullptr);
        vkDestroyCommandPool(device_, commandPool_, nullptr);
        inFlightFence_ = VK_NULL_HANDLE;
        renderFinishedSemaphore_ = VK_NULL_HANDLE;
        imageAvailableSemaphore_ = VK_NULL_HANDLE;
        commandPool_ = VK_NULL_HANDLE;
        commandBuffer_ = VK_NULL_HANDLE;

        vkDestroyPipeline(device_, computePipeline_, nullptr);
        vkDestroyPipelineLayout(device_, computePipelineLayout_, nullptr);
        vkDestroyPipeline(device_, graphicsPipeline_, nullptr);
        vkDestroyPipelineLayout(device_, graphicsPipelineLayout_, nullptr);
        computePipeline_ = VK_NULL_HANDLE;
        computePipelineLayout_ = VK_NULL_HANDLE;
        graphicsPipeline_ = VK_NULL_HANDLE;
        graphicsPipelineLayout_ = VK_NULL_HANDLE;

        vkDestroyDescriptorPool(device_, descriptorPool_, nullptr);
        vkDestroyDescriptorSetLayout(device_, computeDescriptorSetLayout_, nullptr);
        vkDestroyBuffer(device_, particleBuffer_, nullptr);
        vkFreeMemory(device_, particleBufferMemory_, nullptr);
        descriptorPool_ = VK_NULL_HANDLE;
        computeDescriptorSetLayout_ = VK_NULL_HANDLE;
        particleBuffer_ = VK_NULL_HANDLE;
        particleBufferMemory_ = VK_NULL_HANDLE;

        DestroyRenderTargets();
        vkDestroyRenderPass(device_, renderPass_, nullptr);
        renderPass_ = VK_NULL_HANDLE;

        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
    }
    if (instance_ != VK_NULL_HANDLE) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
        vkDestroyInstance(instance_, nullptr);
        surface_ = VK_NULL_HANDLE;
        instance_ = VK_NULL_HANDLE;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    SDL_Vulkan_UnloadLibrary();
    SDL_Quit();
}

} // namespace pointsprite::app
