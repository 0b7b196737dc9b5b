#pragma once

#include <cstdint>
#include <string>

#include <vk_mem_alloc.h>
#include <vulkan/vulkan.h>

// Render Vulkan context subsystem
// Responsible for: instance, physical/logical device, the graphics+compute queue and the VMA allocator.
// Should NOT do: per-frame resources or pipelines.
namespace bimview::render::vulkan {

struct VulkanFeatureSupport {
    bool multiDrawIndirect = false;
    bool drawIndirectFirstInstance = false;
    bool timestampQueries = false;
    bool occlusionQueryPrecise = false;
    bool fillModeNonSolid = false;
};

struct VulkanContextConfig {
    const char* applicationName = "bimview";
    // Enables VK_LAYER_KHRONOS_validation when the layer is installed.
    bool validation = false;
};

[[nodiscard]] const char* vkResultName(VkResult result);
// Logs "<context> failed: VK_ERROR_... (code)" under the vulkan category.
void logVkFailure(const char* context, VkResult result);

// Reads BIMVIEW_VK_VALIDATION.
[[nodiscard]] bool validationRequestedByEnvironment();

class VulkanContext {
public:
    VulkanContext() = default;
    ~VulkanContext();

    VulkanContext(const VulkanContext&) = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;

    bool init(const VulkanContextConfig& config);
    void shutdown();

    [[nodiscard]] VkInstance instance() const { return m_instance; }
    [[nodiscard]] VkPhysicalDevice physicalDevice() const { return m_physicalDevice; }
    [[nodiscard]] VkDevice device() const { return m_device; }
    [[nodiscard]] VkQueue queue() const { return m_queue; }
    [[nodiscard]] std::uint32_t queueFamilyIndex() const { return m_queueFamilyIndex; }
    [[nodiscard]] VmaAllocator allocator() const { return m_allocator; }
    [[nodiscard]] const std::string& deviceName() const { return m_deviceName; }
    [[nodiscard]] const VulkanFeatureSupport& features() const { return m_features; }
    [[nodiscard]] float timestampPeriod() const { return m_timestampPeriod; }
    [[nodiscard]] bool validationEnabled() const { return m_validationEnabled; }

private:
    bool createInstance(const VulkanContextConfig& config);
    bool pickPhysicalDevice();
    bool createDevice();
    bool createAllocator();

    VkInstance m_instance = VK_NULL_HANDLE;
    VkPhysicalDevice m_physicalDevice = VK_NULL_HANDLE;
    VkDevice m_device = VK_NULL_HANDLE;
    VkQueue m_queue = VK_NULL_HANDLE;
    std::uint32_t m_queueFamilyIndex = 0;
    VmaAllocator m_allocator = VK_NULL_HANDLE;
    std::string m_deviceName;
    VulkanFeatureSupport m_features{};
    float m_timestampPeriod = 1.0f;
    bool m_validationEnabled = false;
};

} // namespace bimview::render::vulkan
