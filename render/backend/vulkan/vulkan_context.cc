#include "render/backend/vulkan/vulkan_context.h"

#include "core/log.h"

#include "core/options.h"

#include <cstdlib>
#include <cstring>
#include <limits>
#include <vector>

namespace bimview::render::vulkan {

namespace {

constexpr const char* kValidationLayerName = "VK_LAYER_KHRONOS_validation";

bool validationLayerAvailable() {
    std::uint32_t layerCount = 0;
    vkEnumerateInstanceLayerProperties(&layerCount, nullptr);
    std::vector<VkLayerProperties> layers(layerCount);
    vkEnumerateInstanceLayerProperties(&layerCount, layers.data());
    for (const VkLayerProperties& layer : layers) {
        if (std::strcmp(layer.layerName, kValidationLayerName) == 0) {
            return true;
        }
    }
    return false;
}

int scorePhysicalDevice(const VkPhysicalDeviceProperties& properties, const VkPhysicalDeviceFeatures& features) {
    int score = 0;
    if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
        score += 1000;
    } else if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) {
        score += 100;
    }
    if (features.multiDrawIndirect == VK_TRUE && features.drawIndirectFirstInstance == VK_TRUE) {
        score += 50;
    }
    if (features.occlusionQueryPrecise == VK_TRUE) {
        score += 10;
    }
    return score;
}

} // namespace

const char* vkResultName(VkResult result) {
    switch (result) {
    case VK_SUCCESS: return "VK_SUCCESS";
    case VK_NOT_READY: return "VK_NOT_READY";
    case VK_TIMEOUT: return "VK_TIMEOUT";
    case VK_INCOMPLETE: return "VK_INCOMPLETE";
    case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
    case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
    case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
    case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
    case VK_ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
    case VK_ERROR_LAYER_NOT_PRESENT: return "VK_ERROR_LAYER_NOT_PRESENT";
    case VK_ERROR_EXTENSION_NOT_PRESENT: return "VK_ERROR_EXTENSION_NOT_PRESENT";
    case VK_ERROR_FEATURE_NOT_PRESENT: return "VK_ERROR_FEATURE_NOT_PRESENT";
    case VK_ERROR_INCOMPATIBLE_DRIVER: return "VK_ERROR_INCOMPATIBLE_DRIVER";
    case VK_ERROR_TOO_MANY_OBJECTS: return "VK_ERROR_TOO_MANY_OBJECTS";
    case VK_ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
    case VK_ERROR_FRAGMENTED_POOL: return "VK_ERROR_FRAGMENTED_POOL";
    case VK_ERROR_OUT_OF_POOL_MEMORY: return "VK_ERROR_OUT_OF_POOL_MEMORY";
    default: return "VK_RESULT_UNKNOWN";
    }
}

void logVkFailure(const char* context, VkResult result) {
    BIM_LOGE("vulkan") << context << " failed: " << vkResultName(result) << " (" << static_cast<int>(result) << ")";
}

bool validationRequestedByEnvironment() {
    const char* value = std::getenv("BIMVIEW_VK_VALIDATION");
    if (value == nullptr) {
        return false;
    }
    const std::optional<bool> parsed = core::parseBoolOption(value);
    return parsed.value_or(false);
}

VulkanContext::~VulkanContext() {
    shutdown();
}

bool VulkanContext::init(const VulkanContextConfig& config) {
    if (!createInstance(config) || !pickPhysicalDevice() || !createDevice() || !createAllocator()) {
        shutdown();
        return false;
    }
    return true;
}

void VulkanContext::shutdown() {
    if (m_allocator != VK_NULL_HANDLE) {
        vmaDestroyAllocator(m_allocator);
        m_allocator = VK_NULL_HANDLE;
    }
    if (m_device != VK_NULL_HANDLE) {
        vkDestroyDevice(m_device, nullptr);
        m_device = VK_NULL_HANDLE;
        m_queue = VK_NULL_HANDLE;
    }
    if (m_instance != VK_NULL_HANDLE) {
        vkDestroyInstance(m_instance, nullptr);
        m_instance = VK_NULL_HANDLE;
    }
    m_physicalDevice = VK_NULL_HANDLE;
}

bool VulkanContext::createInstance(const VulkanContextConfig& config) {
    VkApplicationInfo appInfo{};
    appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName = config.applicationName;
    appInfo.applicationVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    appInfo.pEngineName = "bimview";
    appInfo.engineVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    appInfo.apiVersion = VK_API_VERSION_1_3;

    VkInstanceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    createInfo.pApplicationInfo = &appInfo;

    m_validationEnabled = false;
    if (config.validation) {
        if (validationLayerAvailable()) {
            createInfo.enabledLayerCount = 1;
            createInfo.ppEnabledLayerNames = &kValidationLayerName;
            m_validationEnabled = true;
        } else {
            BIM_LOGW("vulkan") << "validation requested but " << kValidationLayerName << " is not installed";
        }
    }

    const VkResult result = vkCreateInstance(&createInfo, nullptr, &m_instance);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateInstance", result);
        return false;
    }
    return true;
}

bool VulkanContext::pickPhysicalDevice() {
    std::uint32_t deviceCount = 0;
    vkEnumeratePhysicalDevices(m_instance, &deviceCount, nullptr);
    if (deviceCount == 0) {
        BIM_LOGE("vulkan") << "no Vulkan physical devices available";
        return false;
    }

    std::vector<VkPhysicalDevice> devices(deviceCount);
    vkEnumeratePhysicalDevices(m_instance, &deviceCount, devices.data());

    int bestScore = -1;
    for (VkPhysicalDevice candidate : devices) {
        VkPhysicalDeviceProperties properties{};
        vkGetPhysicalDeviceProperties(candidate, &properties);
        if (properties.apiVersion < VK_API_VERSION_1_3) {
            BIM_LOGD("vulkan") << "skipping " << properties.deviceName << ": Vulkan 1.3 required";
            continue;
        }

        std::uint32_t queueFamilyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(candidate, &queueFamilyCount, nullptr);
        std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(candidate, &queueFamilyCount, queueFamilies.data());

        std::uint32_t family = std::numeric_limits<std::uint32_t>::max();
        for (std::uint32_t i = 0; i < queueFamilyCount; ++i) {
            const VkQueueFlags flags = queueFamilies[i].queueFlags;
            if ((flags & VK_QUEUE_GRAPHICS_BIT) != 0 && (flags & VK_QUEUE_COMPUTE_BIT) != 0) {
                family = i;
                break;
            }
        }
        if (family == std::numeric_limits<std::uint32_t>::max()) {
            BIM_LOGD("vulkan") << "skipping " << properties.deviceName << ": no graphics+compute queue";
            continue;
        }

        VkPhysicalDeviceFeatures features{};
        vkGetPhysicalDeviceFeatures(candidate, &features);
        const int score = scorePhysicalDevice(properties, features);
        if (score <= bestScore) {
            continue;
        }

        bestScore = score;
        m_physicalDevice = candidate;
        m_queueFamilyIndex = family;
        m_deviceName = properties.deviceName;
        m_timestampPeriod = properties.limits.timestampPeriod;
        m_features.multiDrawIndirect = features.multiDrawIndirect == VK_TRUE;
        m_features.drawIndirectFirstInstance = features.drawIndirectFirstInstance == VK_TRUE;
        m_features.occlusionQueryPrecise = features.occlusionQueryPrecise == VK_TRUE;
        m_features.fillModeNonSolid = features.fillModeNonSolid == VK_TRUE;
        m_features.timestampQueries = queueFamilies[family].timestampValidBits > 0;
    }

    if (m_physicalDevice == VK_NULL_HANDLE) {
        BIM_LOGE("vulkan") << "no Vulkan 1.3 device with a graphics+compute queue";
        return false;
    }
    BIM_LOGI("vulkan") << "using GPU: " << m_deviceName;
    BIM_LOGI("vulkan") << "graphics/compute queue family: " << m_queueFamilyIndex
                       << ", multiDrawIndirect=" << (m_features.multiDrawIndirect ? "yes" : "no")
                       << ", drawIndirectFirstInstance=" << (m_features.drawIndirectFirstInstance ? "yes" : "no")
                       << ", occlusionQueryPrecise=" << (m_features.occlusionQueryPrecise ? "yes" : "no");
    return true;
}

bool VulkanContext::createDevice() {
    const float queuePriority = 1.0f;
    VkDeviceQueueCreateInfo queueCreateInfo{};
    queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    queueCreateInfo.queueFamilyIndex = m_queueFamilyIndex;
    queueCreateInfo.queueCount = 1;
    queueCreateInfo.pQueuePriorities = &queuePriority;

    VkPhysicalDeviceVulkan13Features vulkan13Features{};
    vulkan13Features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    vulkan13Features.synchronization2 = VK_TRUE;
    vulkan13Features.dynamicRendering = VK_TRUE;

    VkPhysicalDeviceVulkan12Features vulkan12Features{};
    vulkan12Features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
    vulkan12Features.timelineSemaphore = VK_TRUE;
    vulkan12Features.hostQueryReset = VK_TRUE;
    vulkan12Features.pNext = &vulkan13Features;

    VkPhysicalDeviceFeatures2 features2{};
    features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features2.features.multiDrawIndirect = m_features.multiDrawIndirect ? VK_TRUE : VK_FALSE;
    features2.features.drawIndirectFirstInstance = m_features.drawIndirectFirstInstance ? VK_TRUE : VK_FALSE;
    features2.features.occlusionQueryPrecise = m_features.occlusionQueryPrecise ? VK_TRUE : VK_FALSE;
    features2.features.fillModeNonSolid = m_features.fillModeNonSolid ? VK_TRUE : VK_FALSE;
    features2.pNext = &vulkan12Features;

    VkDeviceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    createInfo.pQueueCreateInfos = &queueCreateInfo;
    createInfo.queueCreateInfoCount = 1;
    createInfo.pNext = &features2;

    const VkResult result = vkCreateDevice(m_physicalDevice, &createInfo, nullptr, &m_device);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateDevice", result);
        return false;
    }
    vkGetDeviceQueue(m_device, m_queueFamilyIndex, 0, &m_queue);
    return true;
}

bool VulkanContext::createAllocator() {
    VmaAllocatorCreateInfo allocatorInfo{};
    allocatorInfo.instance = m_instance;
    allocatorInfo.physicalDevice = m_physicalDevice;
    allocatorInfo.device = m_device;
    allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;

    const VkResult result = vmaCreateAllocator(&allocatorInfo, &m_allocator);
    if (result != VK_SUCCESS) {
        logVkFailure("vmaCreateAllocator", result);
        return false;
    }
    return true;
}

} // namespace bimview::render::vulkan
