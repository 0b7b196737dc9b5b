#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <vulkan/vulkan.h>

#include "core/options.h"

namespace bimview::render::vulkan {

constexpr VkFormat kColorFormat = VK_FORMAT_R8G8B8A8_UNORM;
constexpr VkFormat kDepthFormat = VK_FORMAT_D32_SFLOAT;

// Matches the [[vk::binding]] declarations in shaders/common.slang.
enum DescriptorBinding : std::uint32_t {
    kBindingFrame = 0,
    kBindingGroups = 1,
    kBindingMeshes = 2,
    kBindingSubmeshes = 3,
    kBindingInstances = 4,
    kBindingCommands = 5,
    kBindingExecuted = 6,
    kBindingPyramid = 7,
    kBindingCount = 8
};

struct ProxyPushConstants {
    float boundsMin[4];
    float boundsMax[4];
};

struct PyramidPushConstants {
    std::uint32_t srcOffset;
    std::uint32_t srcWidth;
    std::uint32_t srcHeight;
    std::uint32_t dstOffset;
    std::uint32_t dstWidth;
    std::uint32_t dstHeight;
};

constexpr std::uint32_t kPushConstantBytes = sizeof(ProxyPushConstants);
static_assert(sizeof(PyramidPushConstants) <= kPushConstantBytes);

struct PipelineConfig {
    std::string shaderDirectory;
    core::CullMode cullMode = core::CullMode::Back;
    bool wireFrame = false;
    bool xRay = false;
};

// Every pipeline shares one descriptor set layout and one push constant range.
struct PipelineSet {
    VkDescriptorSetLayout setLayout = VK_NULL_HANDLE;
    VkPipelineLayout layout = VK_NULL_HANDLE;
    VkPipeline scene = VK_NULL_HANDLE;
    VkPipeline proxy = VK_NULL_HANDLE;
    // Optional; VK_NULL_HANDLE when the shader is missing or fails to build.
    VkPipeline encode = VK_NULL_HANDLE;
    VkPipeline pyramid = VK_NULL_HANDLE;
};

[[nodiscard]] std::vector<char> loadBinaryFile(const std::string& path);
[[nodiscard]] VkShaderModule createShaderModuleFromSpv(VkDevice device, const std::string& path);

// Fails only when the scene or proxy pipeline cannot be built.
bool createPipelines(VkDevice device, const PipelineConfig& config, bool fillModeNonSolid, PipelineSet& out);
void destroyPipelines(VkDevice device, PipelineSet& pipelines);

} // namespace bimview::render::vulkan
