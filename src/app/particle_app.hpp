#ifndef POINTSPRITE_APP_PARTICLE_APP_HPP
#define POINTSPRITE_APP_PARTICLE_APP_HPP

#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <SDL3/SDL.h>
#include <SDL3/SDL_vulkan.h>
#include <vulkan/vulkan.h>

#include "app/runtime_config.hpp"
#include "core/particle.hpp"
#include "script/particle_script.hpp"

namespace pointsprite::app {

struct SurfaceSupport {
    VkSurfaceCapabilitiesKHR capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> presentModes;
};

// Everything device selection needs to know about one physical device.
struct DeviceCandidate {
    VkPhysicalDevice device = VK_NULL_HANDLE;
    std::string name;
    // One family runs both the compute pass and the draw, so the particle
    // buffer never changes queue ownership.
    std::optional<uint32_t> graphicsComputeFamily;
    std::optional<uint32_t> presentFamily;
    std::string rejection;

    bool usable() const { return rejection.empty(); }
};

class ParticleApp {
public:
    explicit ParticleApp(const RuntimeConfig& config, bool luaDebug = false);
    ParticleApp(const ParticleApp&) = delete;
    ParticleApp& operator=(const ParticleApp&) = delete;

    void Run();

private:
    void InitSDL();
    void InitVulkan();
    void MainLoop();
    void Cleanup();

    void CreateInstance();
    void CreateSurface();
    void PickPhysicalDevice();
    DeviceCandidate InspectDevice(VkPhysicalDevice device) const;
    SurfaceSupport QuerySurfaceSupport(VkPhysicalDevice device) const;
    void CreateLogicalDevice();

    void CreateRenderTargets();
    void DestroyRenderTargets();
    void RecreateRenderTargets();

    void CreateRenderPass();
    void CreateGraphicsPipeline();
    void CreateComputePipeline();

    void LoadSceneData();
    void CreateParticleBuffer();
    void CreateDescriptorSet();

    void CreateFrameResources();
    void RecordFrame(uint32_t imageIndex, float deltaTime);
    void DrawFrame(float deltaTime);

    RuntimeConfig config_;
    script::ParticleScript particleScript_;
    script::ParticleScript::ShaderPaths shaderPaths_;
    std::vector<core::Particle> particles_;
    std::array<float, 4> clearColor_{0.0f, 0.0f, 0.0f, 1.0f};

    SDL_Window* window_ = nullptr;
    VkInstance instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    uint32_t graphicsComputeFamily_ = 0;
    uint32_t presentFamily_ = 0;
    VkSurfaceFormatKHR surfaceFormat_{};
    VkDevice device_ = VK_NULL_HANDLE;
    VkQueue graphicsQueue_ = VK_NULL_HANDLE;
    VkQueue presentQueue_ = VK_NULL_HANDLE;

    // Render targets, rebuilt when the window size changes.
    VkSwapchainKHR swapChain_ = VK_NULL_HANDLE;
    VkExtent2D swapChainExtent_{};
    std::vector<VkImage> swapChainImages_;
    std::vector<VkImageView> swapChainImageViews_;
    std::vector<VkFramebuffer> swapChainFramebuffers_;
    bool framebufferResized_ = false;

    VkRenderPass renderPass_ = VK_NULL_HANDLE;
    VkPipelineLayout graphicsPipelineLayout_ = VK_NULL_HANDLE;
    VkPipeline graphicsPipeline_ = VK_NULL_HANDLE;
    VkPipelineLayout computePipelineLayout_ = VK_NULL_HANDLE;
    VkPipeline computePipeline_ = VK_NULL_HANDLE;

    VkBuffer particleBuffer_ = VK_NULL_HANDLE;
    VkDeviceMemory particleBufferMemory_ = VK_NULL_HANDLE;
    VkDescriptorSetLayout computeDescriptorSetLayout_ = VK_NULL_HANDLE;
    VkDescriptorPool descriptorPool_ = VK_NULL_HANDLE;
    VkDescriptorSet computeDescriptorSet_ = VK_NULL_HANDLE;

    // One frame in flight: a single command buffer guarded by one fence.
    VkCommandPool commandPool_ = VK_NULL_HANDLE;
    VkCommandBuffer commandBuffer_ = VK_NULL_HANDLE;
    VkSemaphore imageAvailableSemaphore_ = VK_NULL_HANDLE;
    VkSemaphore renderFinishedSemaphore_ = VK_NULL_HANDLE;
    VkFence inFlightFence_ = VK_NULL_HANDLE;
};

} // namespace pointsprite::app

#endif // POINTSPRITE_APP_PARTICLE_APP_HPP
