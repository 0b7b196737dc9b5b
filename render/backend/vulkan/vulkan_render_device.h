#pragma once

#include <cstdint>
#include <deque>
#include <span>
#include <string>
#include <vector>

#include <vk_mem_alloc.h>
#include <vulkan/vulkan.h>

#include "core/options.h"
#include "render/backend/vulkan/buffer_allocator.h"
#include "render/backend/vulkan/pipelines.h"
#include "render/backend/vulkan/vulkan_context.h"
#include "render/render_device.h"

// Render Vulkan device subsystem
// Responsible for: offscreen targets, per-slot command/query/buffer resources, pipelines and timeline-based completion.
// Should NOT do: visibility decisions; it records what the renderer asks for.
namespace bimview::render::vulkan {

struct VulkanDeviceConfig {
    std::string shaderDirectory;
    ViewportSize viewport{};
    core::CullMode cullMode = core::CullMode::Back;
    bool wireFrame = false;
    bool xRay = false;
    bool validation = false;
};

class VulkanRenderDevice final : public RenderDevice {
public:
    VulkanRenderDevice() = default;
    ~VulkanRenderDevice() override;

    VulkanRenderDevice(const VulkanRenderDevice&) = delete;
    VulkanRenderDevice& operator=(const VulkanRenderDevice&) = delete;

    bool init(const VulkanDeviceConfig& config);
    void shutdown();

    [[nodiscard]] const DeviceCapabilities& capabilities() const override { return m_capabilities; }
    bool resizeFrameResources(const FrameResourceLayout& layout) override;
    bool uploadScene(const GpuSceneTables& tables, std::span<const float> positions, std::span<const std::uint32_t> indices) override;
    bool updateInstances(std::span<const GpuInstance> instances) override;

    bool beginFrame(const FrameTicket& ticket, const GpuFrameUniforms& uniforms) override;
    bool updateGroupTable(std::span<const GpuInstancedMesh> groups) override;
    void drawProxy(std::uint32_t group, const scene::Aabb& bounds) override;
    void drawIndexed(const DrawIndexedCommand& command) override;
    void dispatchCommandGeneration(const DispatchSize& dispatch) override;
    bool uploadCommands(std::span<const DrawIndexedCommand> commands) override;
    void executeIndirect(std::uint32_t commandCount) override;

    bool submitFrame(const FrameTicket& ticket, FrameCompletionHandler onComplete) override;
    std::uint32_t pollCompletions(std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::span<const std::uint32_t> occlusionResults(std::uint32_t slot) const override;
    [[nodiscard]] std::span<const std::uint32_t> executedFlags(std::uint32_t slot) const override;
    [[nodiscard]] DepthPyramidExtent depthPyramidExtent() const override;

    void waitIdle() override;

    // GPU time of the newest completed frame, 0 without timestamp support.
    [[nodiscard]] double gpuFrameMs() const { return m_gpuFrameMs; }

private:
    struct FrameSlot {
        VkCommandPool commandPool = VK_NULL_HANDLE;
        VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
        VkQueryPool occlusionQueries = VK_NULL_HANDLE;
        VkQueryPool timestampQueries = VK_NULL_HANDLE;
        VkDescriptorSet descriptorSet = VK_NULL_HANDLE;
        BufferHandle uniforms = kInvalidBufferHandle;
        BufferHandle groups = kInvalidBufferHandle;
        BufferHandle commands = kInvalidBufferHandle;
        BufferHandle executed = kInvalidBufferHandle;
        BufferHandle occlusionResults = kInvalidBufferHandle;
        std::uint64_t submittedValue = 0;
    };

    struct FrameResourceSet {
        std::vector<FrameSlot> slots;
        VkDescriptorPool descriptorPool = VK_NULL_HANDLE;
        FrameResourceLayout layout{};
        std::uint32_t commandCapacity = 0;
    };

    struct SceneBuffers {
        BufferHandle positions = kInvalidBufferHandle;
        BufferHandle indices = kInvalidBufferHandle;
        BufferHandle meshes = kInvalidBufferHandle;
        BufferHandle submeshes = kInvalidBufferHandle;
        BufferHandle instances = kInvalidBufferHandle;
    };

    struct RenderTargets {
        VkImage color = VK_NULL_HANDLE;
        VmaAllocation colorAllocation = VK_NULL_HANDLE;
        VkImageView colorView = VK_NULL_HANDLE;
        VkImage depth = VK_NULL_HANDLE;
        VmaAllocation depthAllocation = VK_NULL_HANDLE;
        VkImageView depthView = VK_NULL_HANDLE;
        BufferHandle pyramid = kInvalidBufferHandle;
        DepthPyramidExtent pyramidExtent{};
        std::vector<std::uint32_t> mipOffsets;
        ViewportSize viewport{};
    };

    // Resources replaced while frames that bound them may still be executing.
    struct RetiredResources {
        std::uint64_t releaseValue = 0;
        std::vector<FrameResourceSet> frames;
        std::vector<SceneBuffers> scenes;
        std::vector<RenderTargets> targets;
    };

    struct PendingFrame {
        std::uint64_t timelineValue = 0;
        FrameTicket ticket{};
        FrameCompletionHandler onComplete;
    };

    bool createTimelineSemaphore();
    bool createFrameResources(const FrameResourceLayout& layout, FrameResourceSet& out);
    void destroyFrameResources(FrameResourceSet& frames);
    bool createSceneBuffers(const GpuSceneTables& tables, std::span<const float> positions, std::span<const std::uint32_t> indices, SceneBuffers& out);
    void destroySceneBuffers(SceneBuffers& scene);
    bool createRenderTargets(ViewportSize viewport, RenderTargets& out);
    void destroyRenderTargets(RenderTargets& targets);
    void releaseRetired(std::uint64_t completedValue);
    void destroyAll();

    [[nodiscard]] FrameSlot* recordingSlot();
    void writeDescriptors(FrameSlot& slot);
    void ensureRendering();
    void endRendering();
    void bindPipeline(VkPipeline pipeline, VkPipelineBindPoint bindPoint);
    void recordDepthPyramid(VkCommandBuffer commandBuffer);
    void readTimestamps(const FrameSlot& slot);

    VulkanContext m_context;
    BufferAllocator m_buffers;
    PipelineSet m_pipelines;
    VulkanDeviceConfig m_config{};
    DeviceCapabilities m_capabilities{};

    FrameResourceSet m_frames;
    SceneBuffers m_scene;
    RenderTargets m_targets;
    std::vector<RetiredResources> m_retired;

    VkSemaphore m_timeline = VK_NULL_HANDLE;
    std::uint64_t m_timelineValue = 0;
    std::deque<PendingFrame> m_pending;

    // Recording state of the frame opened by beginFrame().
    std::uint32_t m_recordingSlot = 0;
    bool m_recording = false;
    bool m_renderingActive = false;
    bool m_renderedThisFrame = false;
    VkPipeline m_boundPipeline = VK_NULL_HANDLE;
    std::uint32_t m_indexCount = 0;
    bool m_pyramidReady = false;
    double m_gpuFrameMs = 0.0;
};

} // namespace bimview::render::vulkan
