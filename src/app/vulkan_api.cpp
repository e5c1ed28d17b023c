#include "app/vulkan_api.hpp"
#include "app/trace.hpp"
#include "core/particle.hpp"
#include "core/vertex_stage.hpp"

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace pointsprite::app::vulkan {

void CheckResult(VkResult result, const char* what) {
    if (result != VK_SUCCESS) {
        throw std::runtime_error(std::string(what) + " failed (VkResult " + std::to_string(result) + ")");
    }
}

std::vector<char> ReadFile(const std::string& path) {
    TRACE_FUNCTION();
    TRACE_VAR(path);
    std::ifstream file(path, std::ios::ate | std::ios::binary);
    if (!file) {
        throw std::runtime_error("failed to open file: " + path);
    }
    size_t size = static_cast<size_t>(file.tellg());
    std::vector<char> buffer(size);
    file.seekg(0);
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    return buffer;
}

VkExtent2D ChooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities, int width, int height) {
    if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max()) {
        return capabilities.currentExtent;
    }
    return VkExtent2D{
        static_cast<uint32_t>(std::clamp(width, static_cast<int>(capabilities.minImageExtent.width),
                                          static_cast<int>(capabilities.maxImageExtent.width))),
        static_cast<uint32_t>(std::clamp(height, static_cast<int>(capabilities.minImageExtent.height),
                                          static_cast<int>(capabilities.maxImageExtent.height)))
    };
}

VkSurfaceFormatKHR ChooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats) {
    if (formats.empty()) {
        throw std::runtime_error("Surface reports no formats");
    }
    auto preferred = std::find_if(formats.begin(), formats.end(), [](const VkSurfaceFormatKHR& format) {
        return format.format == VK_FORMAT_B8G8R8A8_UNORM &&
               format.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    });
    return preferred != formats.end() ? *preferred : formats.front();
}

VkPresentModeKHR ChoosePresentMode(const std::vector<VkPresentModeKHR>& presentModes) {
    if (std::find(presentModes.begin(), presentModes.end(), VK_PRESENT_MODE_MAILBOX_KHR) != presentModes.end()) {
        return VK_PRESENT_MODE_MAILBOX_KHR;
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

uint32_t ChooseImageCount(const VkSurfaceCapabilitiesKHR& capabilities) {
    uint32_t imageCount = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0) {
        imageCount = std::min(imageCount, capabilities.maxImageCount);
    }
    return imageCount;
}

uint32_t FindMemoryType(VkPhysicalDevice physicalDevice, uint32_t typeFilter, VkMemoryPropertyFlags properties) {
    VkPhysicalDeviceMemoryProperties memProperties;
    vkGetPhysicalDeviceMemoryProperties(physicalDevice, &memProperties);

    for (uint32_t i = 0; i < memProperties.memoryTypeCount; ++i) {
        if ((typeFilter & (1u << i)) &&
            (memProperties.memoryTypes[i].propertyFlags & properties) == properties) {
            return i;
        }
    }

    throw std::runtime_error("Failed to find suitable memory type");
}

void CreateBuffer(VkDevice device, VkPhysicalDevice physicalDevice, VkDeviceSize size, VkBufferUsageFlags usage,
                  VkMemoryPropertyFlags properties, VkBuffer& buffer, VkDeviceMemory& bufferMemory) {
    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = size;
    bufferInfo.usage = usage;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    if (vkCreateBuffer(device, &bufferInfo, nullptr, &buffer) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create buffer");
    }

    VkMemoryRequirements memRequirements;
    vkGetBufferMemoryRequirements(device, buffer, &memRequirements);

    VkMemoryAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = memRequirements.size;
    allocInfo.memoryTypeIndex =
        FindMemoryType(physicalDevice, memRequirements.memoryTypeBits, properties);

    if (vkAllocateMemory(device, &allocInfo, nullptr, &bufferMemory) != VK_SUCCESS) {
        vkDestroyBuffer(device, buffer, nullptr);
        buffer = VK_NULL_HANDLE;
        throw std::runtime_error("Failed to allocate buffer memory");
    }

    CheckResult(vkBindBufferMemory(device, buffer, bufferMemory, 0), "vkBindBufferMemory");
}

VkShaderModule CreateShaderModule(VkDevice device, const std::vector<char>& code) {
    if (code.empty() || code.size() % sizeof(uint32_t) != 0) {
        throw std::runtime_error("Shader bytecode size is not a multiple of 4");
    }

    VkShaderModuleCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    createInfo.codeSize = code.size();
    createInfo.pCode = reinterpret_cast<const uint32_t*>(code.data());

    VkShaderModule shaderModule;
    if (vkCreateShaderModule(device, &createInfo, nullptr, &shaderModule) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create shader module");
    }
    return shaderModule;
}

VkVertexInputBindingDescription ParticleBindingDescription() {
    VkVertexInputBindingDescription bindingDescription{};
    bindingDescription.binding = 0;
    bindingDescription.stride = sizeof(core::Particle);
    bindingDescription.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
    return bindingDescription;
}

std::array<VkVertexInputAttributeDescription, 1> ParticleAttributeDescriptions() {
    std::array<VkVertexInputAttributeDescription, 1> attributeDescriptions{};
    attributeDescriptions[0].binding = 0;
    attributeDescriptions[0].location = core::kPositionLocation;
    attributeDescriptions[0].format = VK_FORMAT_R32G32_SFLOAT;
    attributeDescriptions[0].offset = offsetof(core::Particle, position);
    return attributeDescriptions;
}

bool SupportsPointSize(const VkPhysicalDeviceFeatures& features, const VkPhysicalDeviceLimits& limits,
                       float pointSize) {
    if (pointSize != 1.0f && features.largePoints != VK_TRUE) {
        return false;
    }
    return pointSize >= limits.pointSizeRange[0] && pointSize <= limits.pointSizeRange[1];
}

uint64_t MaxParticleCount(const VkPhysicalDeviceLimits& limits) {
    uint64_t byDispatch = static_cast<uint64_t>(limits.maxComputeWorkGroupCount[0]) * core::kComputeWorkgroupSize;
    uint64_t byDescriptor = limits.maxStorageBufferRange / sizeof(core::Particle);
    return std::min(byDispatch, byDescriptor);
}

std::string ParticleCapacityError(const VkPhysicalDeviceLimits& limits, uint32_t particleCount) {
    std::ostringstream oss;
    if (core::DispatchGroupCount(particleCount) > limits.maxComputeWorkGroupCount[0]) {
        oss << particleCount << " particles need " << core::DispatchGroupCount(particleCount)
            << " workgroups, maxComputeWorkGroupCount[0] is " << limits.maxComputeWorkGroupCount[0];
    } else if (static_cast<uint64_t>(particleCount) * sizeof(core::Particle) > limits.maxStorageBufferRange) {
        oss << particleCount << " particles need " << static_cast<uint64_t>(particleCount) * sizeof(core::Particle)
            << " bytes of storage buffer, maxStorageBufferRange is " << limits.maxStorageBufferRange;
    }
    return oss.str();
}

} // namespace pointsprite::app::vulkan
