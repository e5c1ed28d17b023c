#include "app/particle_app.hpp"
#include "app/trace.hpp"
#include "app/vulkan_api.hpp"
#include "core/vertex_stage.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pointsprite::app {

void ParticleApp::CreateInstance() {
    TRACE_FUNCTION();
    uint32_t sdlExtensionCount = 0;
    const char* const* sdlExtensions = SDL_Vulkan_GetInstanceExtensions(&sdlExtensionCount);
    if (!sdlExtensions) {
        throw std::runtime_error(std::string("SDL_Vulkan_GetInstanceExtensions failed: ") + SDL_GetError());
    }
    std::vector<const char*> instanceExtensions(sdlExtensions, sdlExtensions + sdlExtensionCount);
    for (const char* extension : instanceExtensions) {
        TRACE_VAR(extension);
    }

    VkApplicationInfo appInfo{};
    appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName = "pointsprite";
    appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
    appInfo.pEngineName = "pointsprite";
    appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
    appInfo.apiVersion = VK_API_VERSION_1_1;

    VkInstanceCreateInfo instanceInfo{};
    instanceInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    instanceInfo.pApplicationInfo = &appInfo;
    instanceInfo.enabledExtensionCount = static_cast<uint32_t>(instanceExtensions.size());
    instanceInfo.ppEnabledExtensionNames = instanceExtensions.data();

    vulkan::CheckResult(vkCreateInstance(&instanceInfo, nullptr, &instance_), "vkCreateInstance");
}

void ParticleApp::CreateSurface() {
    TRACE_FUNCTION();
    if (!SDL_Vulkan_CreateSurface(window_, instance_, nullptr, &surface_)) {
        throw std::runtime_error(std::string("SDL_Vulkan_CreateSurface failed: ") + SDL_GetError());
    }
}

SurfaceSupport ParticleApp::QuerySurfaceSupport(VkPhysicalDevice device) const {
    SurfaceSupport support;
    vulkan::CheckResult(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device, surface_, &support.capabilities),
                        "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");
    support.formats = vulkan::Enumerate<VkSurfaceFormatKHR>(
        [&](uint32_t* count, VkSurfaceFormatKHR* formats) {
            return vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface_, count, formats);
        },
        "vkGetPhysicalDeviceSurfaceFormatsKHR");
    support.presentModes = vulkan::Enumerate<VkPresentModeKHR>(
        [&](uint32_t* count, VkPresentModeKHR* modes) {
            return vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface_, count, modes);
        },
        "vkGetPhysicalDeviceSurfacePresentModesKHR");
    return support;
}

DeviceCandidate ParticleApp::InspectDevice(VkPhysicalDevice device) const {
    DeviceCandidate candidate;
    candidate.device = device;

    VkPhysicalDeviceProperties properties{};
    vkGetPhysicalDeviceProperties(device, &properties);
    VkPhysicalDeviceFeatures features{};
    vkGetPhysicalDeviceFeatures(device, &features);
    candidate.name = properties.deviceName;

    uint32_t familyCount = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &familyCount, nullptr);
    std::vector<VkQueueFamilyProperties> families(familyCount);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &familyCount, families.data());

    constexpr VkQueueFlags kRequiredFlags = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT;
    for (uint32_t family = 0; family < familyCount; ++family) {
        VkBool32 presentSupport = VK_FALSE;
        vulkan::CheckResult(vkGetPhysicalDeviceSurfaceSupportKHR(device, family, surface_, &presentSupport),
                            "vkGetPhysicalDeviceSurfaceSupportKHR");
        bool graphicsCompute = (families[family].queueFlags & kRequiredFlags) == kRequiredFlags;
        // Prefer one family for graphics, compute and present.
        if (graphicsCompute && presentSupport) {
            candidate.graphicsComputeFamily = family;
            candidate.presentFamily = family;
            break;
        }
        if (graphicsCompute && !candidate.graphicsComputeFamily) {
            candidate.graphicsComputeFamily = family;
        }
        if (presentSupport && !candidate.presentFamily) {
            candidate.presentFamily = family;
        }
    }

    auto available = vulkan::Enumerate<VkExtensionProperties>(
        [&](uint32_t* count, VkExtensionProperties* extensions) {
            return vkEnumerateDeviceExtensionProperties(device, nullptr, count, extensions);
        },
        "vkEnumerateDeviceExtensionProperties");
    std::set<std::string> missingExtensions(vulkan::kDeviceExtensions.begin(), vulkan::kDeviceExtensions.end());
    for (const auto& extension : available) {
        missingExtensions.erase(extension.extensionName);
    }

    if (!candidate.graphicsComputeFamily) {
        candidate.rejection = "no queue family with graphics and compute";
    } else if (!candidate.presentFamily) {
        candidate.rejection = "cannot present to the window surface";
    } else if (!missingExtensions.empty()) {
        candidate.rejection = "missing extension " + *missingExtensions.begin();
    } else if (!vulkan::SupportsPointSize(features, properties.limits, core::kPointSize)) {
        candidate.rejection = "point size " + std::to_string(core::kPointSize) +
                              " unsupported (largePoints or pointSizeRange)";
    } else {
        candidate.rejection = vulkan::ParticleCapacityError(properties.limits,
                                                            static_cast<uint32_t>(particles_.size()));
    }
    if (candidate.rejection.empty()) {
        SurfaceSupport support = QuerySurfaceSupport(device);
        if (support.formats.empty() || support.presentModes.empty()) {
            candidate.rejection = "surface has no formats or present modes";
        }
    }
    return candidate;
}

void ParticleApp::PickPhysicalDevice() {
    TRACE_FUNCTION();
    auto devices = vulkan::Enumerate<VkPhysicalDevice>(
        [&](uint32_t* count, VkPhysicalDevice* out) { return vkEnumeratePhysicalDevices(instance_, count, out); },
        "vkEnumeratePhysicalDevices");
    if (devices.empty()) {
        throw std::runtime_error("No GPU with Vulkan support found");
    }

    std::ostringstream rejections;
    for (VkPhysicalDevice device : devices) {
        DeviceCandidate candidate = InspectDevice(device);
        if (!candidate.usable()) {
            TraceLogger::LogVariable(candidate.name.c_str(), candidate.rejection);
            rejections << "\n  " << candidate.name << ": " << candidate.rejection;
            continue;
        }
        physicalDevice_ = candidate.device;
        graphicsComputeFamily_ = *candidate.graphicsComputeFamily;
        presentFamily_ = *candidate.presentFamily;
        surfaceFormat_ = vulkan::ChooseSurfaceFormat(QuerySurfaceSupport(device).formats);
        std::cout << "Using GPU: " << candidate.name << '\n';
        return;
    }
    throw std::runtime_error("No suitable GPU for " + std::to_string(particles_.size()) + " particles:" +
                             rejections.str());
}

void ParticleApp::CreateLogicalDevice() {
    TRACE_FUNCTION();
    float queuePriority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queueInfos;
    for (uint32_t family : std::set<uint32_t>{graphicsComputeFamily_, presentFamily_}) {
        VkDeviceQueueCreateInfo queueInfo{};
        queueInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueInfo.queueFamilyIndex = family;
        queueInfo.queueCount = 1;
        queueInfo.pQueuePriorities = &queuePriority;
        queueInfos.push_back(queueInfo);
    }

    // gl_PointSize above 1 needs largePoints.
    VkPhysicalDeviceFeatures enabledFeatures{};
    enabledFeatures.largePoints = VK_TRUE;

    VkDeviceCreateInfo deviceInfo{};
    deviceInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    deviceInfo.queueCreateInfoCount = static_cast<uint32_t>(queueInfos.size());
    deviceInfo.pQueueCreateInfos = queueInfos.data();
    deviceInfo.pEnabledFeatures = &enabledFeatures;
    deviceInfo.enabledExtensionCount = static_cast<uint32_t>(vulkan::kDeviceExtensions.size());
    deviceInfo.ppEnabledExtensionNames = vulkan::kDeviceExtensions.data();

    vulkan::CheckResult(vkCreateDevice(physicalDevice_, &deviceInfo, nullptr, &device_), "vkCreateDevice");
    vkGetDeviceQueue(device_, graphicsComputeFamily_, 0, &graphicsQueue_);
    vkGetDeviceQueue(device_, presentFamily_, 0, &presentQueue_);
}

} // namespace pointsprite::app
