#ifndef POINTSPRITE_APP_VULKAN_API_HPP
#define POINTSPRITE_APP_VULKAN_API_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <vulkan/vulkan.h>

namespace pointsprite::app::vulkan {

inline const std::vector<const char*> kDeviceExtensions = {
    VK_KHR_SWAPCHAIN_EXTENSION_NAME,
};

// Throws std::runtime_error naming the call unless result is VK_SUCCESS.
void CheckResult(VkResult result, const char* what);

// Runs a two-call Vulkan enumeration (count, then data), retrying while the
// driver reports VK_INCOMPLETE. Any other failure throws.
template <typename T, typename Query>
std::vector<T> Enumerate(Query&& query, const char* what) {
    std::vector<T> items;
    VkResult result = VK_INCOMPLETE;
    while (result == VK_INCOMPLETE) {
        uint32_t count = 0;
        CheckResult(query(&count, nullptr), what);
        items.resize(count);
        if (count == 0) {
            return items;
        }
        result = query(&count, items.data());
        items.resize(count);
    }
    CheckResult(result, what);
    return items;
}

std::vector<char> ReadFile(const std::string& path);

VkExtent2D ChooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities, int width, int height);
VkSurfaceFormatKHR ChooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats);
VkPresentModeKHR ChoosePresentMode(const std::vector<VkPresentModeKHR>& presentModes);
uint32_t ChooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities);

uint32_t FindMemoryType(VkPhysicalDevice physicalDevice, uint32_t typeFilter, VkMemoryPropertyFlags properties);

void CreateBuffer(VkDevice device, VkPhysicalDevice physicalDevice, VkDeviceSize size, VkBufferUsageFlags usage,
                  VkMemoryPropertyFlags properties, VkBuffer& buffer, VkDeviceMemory& bufferMemory);

VkShaderModule CreateShaderModule(VkDevice device, const std::vector<char>& code);

// Vertex input state for the particle buffer: binding 0 walks whole
// core::Particle records, location 0 reads the position only.
VkVertexInputBindingDescription ParticleBindingDescription();
std::array<VkVertexInputAttributeDescription, 1> ParticleAttributeDescriptions();

bool SupportsPointSize(const VkPhysicalDeviceFeatures& features, const VkPhysicalDeviceLimits& limits,
                       float pointSize);

// Largest particle buffer one dispatch and one storage descriptor can cover.
uint64_t MaxParticleCount(const VkPhysicalDeviceLimits& limits);

// Empty when the device can simulate particleCount particles, otherwise the
// limit that is exceeded.
std::string ParticleCapacityError(const VkPhysicalDeviceLimits& limits, uint32_t particleCount);

} // namespace pointsprite::app::vulkan

#endif // POINTSPRITE_APP_VULKAN_API_HPP
