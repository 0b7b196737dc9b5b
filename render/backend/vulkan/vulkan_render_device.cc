#include "render/backend/vulkan/vulkan_render_device.h"

#include "core/log.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>

namespace bimview::render::vulkan {

namespace {

constexpr VkDeviceSize kMinBufferBytes = 16;
constexpr std::uint32_t kTimestampCount = 2;
constexpr std::uint32_t kPyramidThreadGroupSize = 8;
constexpr std::uint32_t kProxyVertexCount = 36;

VkDeviceSize bufferBytes(std::size_t bytes) {
    return std::max<VkDeviceSize>(kMinBufferBytes, static_cast<VkDeviceSize>(bytes));
}

VkImageMemoryBarrier2 imageBarrier(
    VkImage image,
    VkImageAspectFlags aspect,
    VkImageLayout oldLayout,
    VkImageLayout newLayout,
    VkPipelineStageFlags2 srcStage,
    VkAccessFlags2 srcAccess,
    VkPipelineStageFlags2 dstStage,
    VkAccessFlags2 dstAccess
) {
    VkImageMemoryBarrier2 barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
    barrier.srcStageMask = srcStage;
    barrier.srcAccessMask = srcAccess;
    barrier.dstStageMask = dstStage;
    barrier.dstAccessMask = dstAccess;
    barrier.oldLayout = oldLayout;
    barrier.newLayout = newLayout;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange.aspectMask = aspect;
    barrier.subresourceRange.levelCount = 1;
    barrier.subresourceRange.layerCount = 1;
    return barrier;
}

void memoryBarrier(
    VkCommandBuffer commandBuffer,
    VkPipelineStageFlags2 srcStage,
    VkAccessFlags2 srcAccess,
    VkPipelineStageFlags2 dstStage,
    VkAccessFlags2 dstAccess
) {
    VkMemoryBarrier2 barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
    barrier.srcStageMask = srcStage;
    barrier.srcAccessMask = srcAccess;
    barrier.dstStageMask = dstStage;
    barrier.dstAccessMask = dstAccess;

    VkDependencyInfo dependency{};
    dependency.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    dependency.memoryBarrierCount = 1;
    dependency.pMemoryBarriers = &barrier;
    vkCmdPipelineBarrier2(commandBuffer, &dependency);
}

void imageBarriers(VkCommandBuffer commandBuffer, std::span<const VkImageMemoryBarrier2> barriers) {
    VkDependencyInfo dependency{};
    dependency.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    dependency.imageMemoryBarrierCount = static_cast<std::uint32_t>(barriers.size());
    dependency.pImageMemoryBarriers = barriers.data();
    vkCmdPipelineBarrier2(commandBuffer, &dependency);
}

bool createImage(
    VmaAllocator allocator,
    VkDevice device,
    VkFormat format,
    VkImageUsageFlags usage,
    VkImageAspectFlags aspect,
    ViewportSize size,
    VkImage& outImage,
    VmaAllocation& outAllocation,
    VkImageView& outView
) {
    VkImageCreateInfo imageInfo{};
    imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageInfo.imageType = VK_IMAGE_TYPE_2D;
    imageInfo.format = format;
    imageInfo.extent = VkExtent3D{size.width, size.height, 1};
    imageInfo.mipLevels = 1;
    imageInfo.arrayLayers = 1;
    imageInfo.samples = VK_SAMPLE_COUNT_1_BIT;
    imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
    imageInfo.usage = usage;
    imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    VmaAllocationCreateInfo allocationInfo{};
    allocationInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
    if (vmaCreateImage(allocator, &imageInfo, &allocationInfo, &outImage, &outAllocation, nullptr) != VK_SUCCESS) {
        return false;
    }

    VkImageViewCreateInfo viewInfo{};
    viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    viewInfo.image = outImage;
    viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
    viewInfo.format = format;
    viewInfo.subresourceRange.aspectMask = aspect;
    viewInfo.subresourceRange.levelCount = 1;
    viewInfo.subresourceRange.layerCount = 1;
    if (vkCreateImageView(device, &viewInfo, nullptr, &outView) != VK_SUCCESS) {
        vmaDestroyImage(allocator, outImage, outAllocation);
        outImage = VK_NULL_HANDLE;
        outAllocation = VK_NULL_HANDLE;
        return false;
    }
    return true;
}

template <typename T>
BufferHandle createTableBuffer(BufferAllocator& buffers, std::span<const T> values, VkBufferUsageFlags usage, const char* name) {
    BufferCreateDesc desc;
    desc.size = bufferBytes(values.size_bytes());
    desc.usage = usage;
    desc.access = BufferAccess::HostWrite;
    desc.debugName = name;
    const BufferHandle handle = buffers.createBuffer(desc);
    if (handle != kInvalidBufferHandle && !values.empty()) {
        std::memcpy(buffers.mappedData(handle), values.data(), values.size_bytes());
    }
    return handle;
}

} // namespace

VulkanRenderDevice::~VulkanRenderDevice() {
    shutdown();
}

bool VulkanRenderDevice::init(const VulkanDeviceConfig& config) {
    m_config = config;

    VulkanContextConfig contextConfig;
    contextConfig.applicationName = "bimview";
    contextConfig.validation = config.validation;
    if (!m_context.init(contextConfig)) {
        return false;
    }
    if (!m_buffers.init(m_context.device(), m_context.allocator())) {
        BIM_LOGE("vulkan") << "buffer allocator init failed";
        shutdown();
        return false;
    }

    PipelineConfig pipelineConfig;
    pipelineConfig.shaderDirectory = config.shaderDirectory;
    pipelineConfig.cullMode = config.cullMode;
    pipelineConfig.wireFrame = config.wireFrame;
    pipelineConfig.xRay = config.xRay;
    if (!createPipelines(m_context.device(), pipelineConfig, m_context.features().fillModeNonSolid, m_pipelines) ||
        !createTimelineSemaphore() ||
        !createRenderTargets(config.viewport, m_targets) ||
        !createSceneBuffers(GpuSceneTables{}, {}, {}, m_scene)) {
        shutdown();
        return false;
    }

    const VulkanFeatureSupport& features = m_context.features();
    m_capabilities.deviceName = m_context.deviceName();
    m_capabilities.indirectDraw = features.multiDrawIndirect && features.drawIndirectFirstInstance;
    m_capabilities.deviceCommandGeneration = m_capabilities.indirectDraw && m_pipelines.encode != VK_NULL_HANDLE;
    m_capabilities.occlusionQueries = true;
    m_capabilities.timestampQueries = features.timestampQueries;
    m_capabilities.depthPyramid = m_pipelines.pyramid != VK_NULL_HANDLE;
    BIM_LOGI("vulkan") << "device capabilities: indirect=" << (m_capabilities.indirectDraw ? "yes" : "no")
                       << ", commandGeneration=" << (m_capabilities.deviceCommandGeneration ? "yes" : "no")
                       << ", depthPyramid=" << (m_capabilities.depthPyramid ? "yes" : "no")
                       << ", timestamps=" << (m_capabilities.timestampQueries ? "yes" : "no");
    return true;
}

void VulkanRenderDevice::shutdown() {
    if (m_context.device() == VK_NULL_HANDLE) {
        m_context.shutdown();
        return;
    }
    vkDeviceWaitIdle(m_context.device());
    if (!m_pending.empty()) {
        BIM_LOGD("vulkan") << "dropping " << m_pending.size() << " completion callbacks at shutdown";
    }
    m_pending.clear();
    destroyAll();
    m_context.shutdown();
    m_capabilities = DeviceCapabilities{};
}

void VulkanRenderDevice::destroyAll() {
    const VkDevice device = m_context.device();
    releaseRetired(std::numeric_limits<std::uint64_t>::max());
    destroyFrameResources(m_frames);
    destroySceneBuffers(m_scene);
    destroyRenderTargets(m_targets);
    destroyPipelines(device, m_pipelines);
    if (m_timeline != VK_NULL_HANDLE) {
        vkDestroySemaphore(device, m_timeline, nullptr);
        m_timeline = VK_NULL_HANDLE;
    }
    m_buffers.shutdown();
}

bool VulkanRenderDevice::createTimelineSemaphore() {
    VkSemaphoreTypeCreateInfo typeInfo{};
    typeInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO;
    typeInfo.semaphoreType = VK_SEMAPHORE_TYPE_TIMELINE;
    typeInfo.initialValue = 0;

    VkSemaphoreCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    createInfo.pNext = &typeInfo;

    const VkResult result = vkCreateSemaphore(m_context.device(), &createInfo, nullptr, &m_timeline);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateSemaphore(timeline)", result);
        return false;
    }
    m_timelineValue = 0;
    return true;
}

bool VulkanRenderDevice::createFrameResources(const FrameResourceLayout& layout, FrameResourceSet& out) {
    const VkDevice device = m_context.device();
    out.layout = layout;
    out.commandCapacity = encodableGroupCount(layout.groupCount, layout.maxSubmeshesPerMesh) * layout.maxSubmeshesPerMesh;
    out.slots.assign(layout.slotCount, FrameSlot{});

    const std::array<VkDescriptorPoolSize, 2> poolSizes = {
        VkDescriptorPoolSize{VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, layout.slotCount},
        VkDescriptorPoolSize{VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, layout.slotCount * (kBindingCount - 1)}
    };
    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.maxSets = layout.slotCount;
    poolInfo.poolSizeCount = static_cast<std::uint32_t>(poolSizes.size());
    poolInfo.pPoolSizes = poolSizes.data();
    const VkResult poolResult = vkCreateDescriptorPool(device, &poolInfo, nullptr, &out.descriptorPool);
    if (poolResult != VK_SUCCESS) {
        logVkFailure("vkCreateDescriptorPool(frame)", poolResult);
        return false;
    }

    for (FrameSlot& slot : out.slots) {
        VkCommandPoolCreateInfo commandPoolInfo{};
        commandPoolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        commandPoolInfo.queueFamilyIndex = m_context.queueFamilyIndex();
        commandPoolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
        VkResult result = vkCreateCommandPool(device, &commandPoolInfo, nullptr, &slot.commandPool);
        if (result != VK_SUCCESS) {
            logVkFailure("vkCreateCommandPool(frame)", result);
            return false;
        }

        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = slot.commandPool;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = 1;
        result = vkAllocateCommandBuffers(device, &allocInfo, &slot.commandBuffer);
        if (result != VK_SUCCESS) {
            logVkFailure("vkAllocateCommandBuffers(frame)", result);
            return false;
        }

        VkQueryPoolCreateInfo occlusionInfo{};
        occlusionInfo.sType = VK_STRUCTURE_TYPE_QUERY_POOL_CREATE_INFO;
        occlusionInfo.queryType = VK_QUERY_TYPE_OCCLUSION;
        occlusionInfo.queryCount = std::max(1u, layout.groupCount);
        result = vkCreateQueryPool(device, &occlusionInfo, nullptr, &slot.occlusionQueries);
        if (result != VK_SUCCESS) {
            logVkFailure("vkCreateQueryPool(occlusion)", result);
            return false;
        }

        if (m_capabilities.timestampQueries) {
            VkQueryPoolCreateInfo timestampInfo{};
            timestampInfo.sType = VK_STRUCTURE_TYPE_QUERY_POOL_CREATE_INFO;
            timestampInfo.queryType = VK_QUERY_TYPE_TIMESTAMP;
            timestampInfo.queryCount = kTimestampCount;
            if (vkCreateQueryPool(device, &timestampInfo, nullptr, &slot.timestampQueries) != VK_SUCCESS) {
                BIM_LOGW("vulkan") << "failed to create timestamp query pool";
                slot.timestampQueries = VK_NULL_HANDLE;
            }
        }

        const std::size_t groupBytes = static_cast<std::size_t>(layout.groupCount) * sizeof(std::uint32_t);
        BufferCreateDesc uniformDesc;
        uniformDesc.size = sizeof(GpuFrameUniforms);
        uniformDesc.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
        uniformDesc.access = BufferAccess::HostWrite;
        uniformDesc.debugName = "frame.uniforms";
        slot.uniforms = m_buffers.createBuffer(uniformDesc);

        BufferCreateDesc groupDesc;
        groupDesc.size = bufferBytes(static_cast<std::size_t>(layout.groupCount) * sizeof(GpuInstancedMesh));
        groupDesc.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
        groupDesc.access = BufferAccess::HostWrite;
        groupDesc.debugName = "frame.groups";
        slot.groups = m_buffers.createBuffer(groupDesc);

        BufferCreateDesc commandDesc;
        commandDesc.size = bufferBytes(static_cast<std::size_t>(out.commandCapacity) * sizeof(DrawIndexedCommand));
        commandDesc.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT;
        commandDesc.access = BufferAccess::HostWrite;
        commandDesc.debugName = "frame.commands";
        slot.commands = m_buffers.createBuffer(commandDesc);

        BufferCreateDesc executedDesc;
        executedDesc.size = bufferBytes(groupBytes);
        executedDesc.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
        executedDesc.access = BufferAccess::HostRead;
        executedDesc.debugName = "frame.executed";
        slot.executed = m_buffers.createBuffer(executedDesc);

        BufferCreateDesc resultDesc;
        resultDesc.size = bufferBytes(groupBytes);
        resultDesc.usage = VK_BUFFER_USAGE_TRANSFER_DST_BIT;
        resultDesc.access = BufferAccess::HostRead;
        resultDesc.debugName = "frame.occlusion";
        slot.occlusionResults = m_buffers.createBuffer(resultDesc);

        if (slot.uniforms == kInvalidBufferHandle || slot.groups == kInvalidBufferHandle ||
            slot.commands == kInvalidBufferHandle || slot.executed == kInvalidBufferHandle ||
            slot.occlusionResults == kInvalidBufferHandle) {
            BIM_LOGE("vulkan") << "failed to allocate frame buffers";
            return false;
        }

        VkDescriptorSetAllocateInfo setInfo{};
        setInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        setInfo.descriptorPool = out.descriptorPool;
        setInfo.descriptorSetCount = 1;
        setInfo.pSetLayouts = &m_pipelines.setLayout;
        result = vkAllocateDescriptorSets(device, &setInfo, &slot.descriptorSet);
        if (result != VK_SUCCESS) {
            logVkFailure("vkAllocateDescriptorSets(frame)", result);
            return false;
        }
    }
    return true;
}

void VulkanRenderDevice::destroyFrameResources(FrameResourceSet& frames) {
    const VkDevice device = m_context.device();
    for (FrameSlot& slot : frames.slots) {
        if (slot.commandPool != VK_NULL_HANDLE) {
            vkDestroyCommandPool(device, slot.commandPool, nullptr);
        }
        if (slot.occlusionQueries != VK_NULL_HANDLE) {
            vkDestroyQueryPool(device, slot.occlusionQueries, nullptr);
        }
        if (slot.timestampQueries != VK_NULL_HANDLE) {
            vkDestroyQueryPool(device, slot.timestampQueries, nullptr);
        }
        for (BufferHandle handle : {slot.uniforms, slot.groups, slot.commands, slot.executed, slot.occlusionResults}) {
            m_buffers.destroyBuffer(handle);
        }
        slot = FrameSlot{};
    }
    frames.slots.clear();
    if (frames.descriptorPool != VK_NULL_HANDLE) {
        vkDestroyDescriptorPool(device, frames.descriptorPool, nullptr);
        frames.descriptorPool = VK_NULL_HANDLE;
    }
    frames.layout = FrameResourceLayout{};
    frames.commandCapacity = 0;
}

bool VulkanRenderDevice::createSceneBuffers(
    const GpuSceneTables& tables,
    std::span<const float> positions,
    std::span<const std::uint32_t> indices,
    SceneBuffers& out
) {
    out.positions = createTableBuffer(m_buffers, positions, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, "scene.positions");
    out.indices = createTableBuffer(m_buffers, indices, VK_BUFFER_USAGE_INDEX_BUFFER_BIT, "scene.indices");
    out.meshes = createTableBuffer(m_buffers, std::span<const GpuMesh>(tables.meshes), VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, "scene.meshes");
    out.submeshes = createTableBuffer(m_buffers, std::span<const GpuSubmesh>(tables.submeshes), VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, "scene.submeshes");
    out.instances = createTableBuffer(m_buffers, std::span<const GpuInstance>(tables.instances), VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, "scene.instances");
    if (out.positions == kInvalidBufferHandle || out.indices == kInvalidBufferHandle ||
        out.meshes == kInvalidBufferHandle || out.submeshes == kInvalidBufferHandle ||
        out.instances == kInvalidBufferHandle) {
        BIM_LOGE("vulkan") << "failed to allocate scene buffers";
        destroySceneBuffers(out);
        return false;
    }
    m_indexCount = static_cast<std::uint32_t>(indices.size());
    return true;
}

void VulkanRenderDevice::destroySceneBuffers(SceneBuffers& scene) {
    for (BufferHandle handle : {scene.positions, scene.indices, scene.meshes, scene.submeshes, scene.instances}) {
        m_buffers.destroyBuffer(handle);
    }
    scene = SceneBuffers{};
}

bool VulkanRenderDevice::createRenderTargets(ViewportSize viewport, RenderTargets& out) {
    const VkDevice device = m_context.device();
    const VmaAllocator allocator = m_context.allocator();
    out.viewport = viewport;
    if (!createImage(allocator, device, kColorFormat,
            VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT,
            VK_IMAGE_ASPECT_COLOR_BIT, viewport, out.color, out.colorAllocation, out.colorView) ||
        !createImage(allocator, device, kDepthFormat,
            VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT,
            VK_IMAGE_ASPECT_DEPTH_BIT, viewport, out.depth, out.depthAllocation, out.depthView)) {
        BIM_LOGE("vulkan") << "failed to create " << viewport.width << "x" << viewport.height << " render targets";
        destroyRenderTargets(out);
        return false;
    }

    // Same linear mip layout as DepthPyramid.
    out.pyramidExtent.width = viewport.width;
    out.pyramidExtent.height = viewport.height;
    out.pyramidExtent.mipCount = DepthPyramid::mipCountFor(viewport.width, viewport.height);
    out.mipOffsets.clear();
    std::uint32_t total = 0;
    std::uint32_t w = viewport.width;
    std::uint32_t h = viewport.height;
    for (std::uint32_t mip = 0; mip < out.pyramidExtent.mipCount; ++mip) {
        out.mipOffsets.push_back(total);
        total += w * h;
        w = std::max(1u, w >> 1);
        h = std::max(1u, h >> 1);
    }

    BufferCreateDesc pyramidDesc;
    pyramidDesc.size = bufferBytes(static_cast<std::size_t>(total) * sizeof(float));
    pyramidDesc.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    pyramidDesc.access = BufferAccess::DeviceOnly;
    pyramidDesc.debugName = "depth.pyramid";
    out.pyramid = m_buffers.createBuffer(pyramidDesc);
    if (out.pyramid == kInvalidBufferHandle) {
        BIM_LOGE("vulkan") << "failed to allocate the depth pyramid";
        destroyRenderTargets(out);
        return false;
    }
    return true;
}

void VulkanRenderDevice::destroyRenderTargets(RenderTargets& targets) {
    const VkDevice device = m_context.device();
    const VmaAllocator allocator = m_context.allocator();
    if (targets.colorView != VK_NULL_HANDLE) {
        vkDestroyImageView(device, targets.colorView, nullptr);
    }
    if (targets.color != VK_NULL_HANDLE) {
        vmaDestroyImage(allocator, targets.color, targets.colorAllocation);
    }
    if (targets.depthView != VK_NULL_HANDLE) {
        vkDestroyImageView(device, targets.depthView, nullptr);
    }
    if (targets.depth != VK_NULL_HANDLE) {
        vmaDestroyImage(allocator, targets.depth, targets.depthAllocation);
    }
    m_buffers.destroyBuffer(targets.pyramid);
    targets = RenderTargets{};
}

void VulkanRenderDevice::releaseRetired(std::uint64_t completedValue) {
    auto it = m_retired.begin();
    while (it != m_retired.end()) {
        if (it->releaseValue > completedValue) {
            ++it;
            continue;
        }
        for (FrameResourceSet& frames : it->frames) {
            destroyFrameResources(frames);
        }
        for (SceneBuffers& scene : it->scenes) {
            destroySceneBuffers(scene);
        }
        for (RenderTargets& targets : it->targets) {
            destroyRenderTargets(targets);
        }
        it = m_retired.erase(it);
    }
}

bool VulkanRenderDevice::resizeFrameResources(const FrameResourceLayout& layout) {
    if (m_recording) {
        BIM_LOGE("vulkan") << "frame resources resized while a frame is being recorded";
        return false;
    }
    RetiredResources retired;
    retired.releaseValue = m_timelineValue;
    retired.frames.push_back(m_frames);
    m_frames = FrameResourceSet{};

    const bool viewportChanged =
        layout.viewport.width != m_targets.viewport.width || layout.viewport.height != m_targets.viewport.height;
    if (viewportChanged) {
        retired.targets.push_back(m_targets);
        m_targets = RenderTargets{};
        m_pyramidReady = false;
    }
    m_retired.push_back(std::move(retired));

    if (viewportChanged && !createRenderTargets(layout.viewport, m_targets)) {
        return false;
    }
    if (!createFrameResources(layout, m_frames)) {
        destroyFrameResources(m_frames);
        return false;
    }
    BIM_LOGD("vulkan") << "frame resources: slots=" << layout.slotCount << ", groups=" << layout.groupCount
                       << ", commands=" << m_frames.commandCapacity
                       << ", viewport=" << layout.viewport.width << "x" << layout.viewport.height;
    return true;
}

bool VulkanRenderDevice::uploadScene(
    const GpuSceneTables& tables,
    std::span<const float> positions,
    std::span<const std::uint32_t> indices
) {
    RetiredResources retired;
    retired.releaseValue = m_timelineValue;
    retired.scenes.push_back(m_scene);
    m_retired.push_back(std::move(retired));
    m_scene = SceneBuffers{};

    if (!createSceneBuffers(tables, positions, indices, m_scene)) {
        return false;
    }
    BIM_LOGI("vulkan") << "scene uploaded: " << positions.size() / 3 << " vertices, " << indices.size()
                       << " indices, " << tables.instances.size() << " instances";
    return true;
}

bool VulkanRenderDevice::updateInstances(std::span<const GpuInstance> instances) {
    if (m_recording) {
        BIM_LOGE("vulkan") << "instance table replaced while a frame is being recorded";
        return false;
    }
    const BufferHandle replacement =
        createTableBuffer(m_buffers, instances, VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, "scene.instances");
    if (replacement == kInvalidBufferHandle) {
        BIM_LOGE("vulkan") << "failed to allocate an instance table of " << instances.size() << " entries";
        return false;
    }

    // The old table stays alive until every frame that bound it has finished.
    SceneBuffers previous;
    previous.instances = m_scene.instances;
    RetiredResources retired;
    retired.releaseValue = m_timelineValue;
    retired.scenes.push_back(previous);
    m_retired.push_back(std::move(retired));
    m_scene.instances = replacement;
    return true;
}

VulkanRenderDevice::FrameSlot* VulkanRenderDevice::recordingSlot() {
    if (!m_recording || m_recordingSlot >= m_frames.slots.size()) {
        return nullptr;
    }
    return &m_frames.slots[m_recordingSlot];
}

void VulkanRenderDevice::writeDescriptors(FrameSlot& slot) {
    const std::array<BufferHandle, kBindingCount> handles = {
        slot.uniforms,
        slot.groups,
        m_scene.meshes,
        m_scene.submeshes,
        m_scene.instances,
        slot.commands,
        slot.executed,
        m_targets.pyramid
    };

    std::array<VkDescriptorBufferInfo, kBindingCount> bufferInfos{};
    std::array<VkWriteDescriptorSet, kBindingCount> writes{};
    for (std::uint32_t i = 0; i < kBindingCount; ++i) {
        bufferInfos[i].buffer = m_buffers.getBuffer(handles[i]);
        bufferInfos[i].offset = 0;
        bufferInfos[i].range = VK_WHOLE_SIZE;

        writes[i].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        writes[i].dstSet = slot.descriptorSet;
        writes[i].dstBinding = i;
        writes[i].descriptorCount = 1;
        writes[i].descriptorType = (i == kBindingFrame) ? VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER : VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        writes[i].pBufferInfo = &bufferInfos[i];
    }
    vkUpdateDescriptorSets(m_context.device(), static_cast<std::uint32_t>(writes.size()), writes.data(), 0, nullptr);
}

bool VulkanRenderDevice::beginFrame(const FrameTicket& ticket, const GpuFrameUniforms& uniforms) {
    if (m_recording) {
        BIM_LOGE("vulkan") << "beginFrame while frame " << ticket.frameNumber - 1 << " is still recording";
        return false;
    }
    if (ticket.slot >= m_frames.slots.size()) {
        BIM_LOGE("vulkan") << "frame slot " << ticket.slot << " out of range (" << m_frames.slots.size() << " slots)";
        return false;
    }
    FrameSlot& slot = m_frames.slots[ticket.slot];
    const VkDevice device = m_context.device();

    if (slot.submittedValue != 0) {
        std::uint64_t reached = 0;
        if (vkGetSemaphoreCounterValue(device, m_timeline, &reached) != VK_SUCCESS || reached < slot.submittedValue) {
            BIM_LOGE("vulkan") << "frame slot " << ticket.slot << " reused before its previous frame completed";
            return false;
        }
    }

    std::memcpy(m_buffers.mappedData(slot.uniforms), &uniforms, sizeof(GpuFrameUniforms));
    const std::uint32_t groupCount = m_frames.layout.groupCount;
    if (groupCount > 0) {
        std::memset(m_buffers.mappedData(slot.executed), 0, groupCount * sizeof(std::uint32_t));
        // Queries that never ran leave these untouched: a missing result reads as visible.
        auto* results = static_cast<std::uint32_t*>(m_buffers.mappedData(slot.occlusionResults));
        std::fill(results, results + groupCount, 1u);
    }
    writeDescriptors(slot);

    VkResult result = vkResetCommandPool(device, slot.commandPool, 0);
    if (result != VK_SUCCESS) {
        logVkFailure("vkResetCommandPool", result);
        return false;
    }
    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    result = vkBeginCommandBuffer(slot.commandBuffer, &beginInfo);
    if (result != VK_SUCCESS) {
        logVkFailure("vkBeginCommandBuffer", result);
        return false;
    }

    const VkCommandBuffer commandBuffer = slot.commandBuffer;
    vkCmdResetQueryPool(commandBuffer, slot.occlusionQueries, 0, std::max(1u, groupCount));
    if (slot.timestampQueries != VK_NULL_HANDLE) {
        vkCmdResetQueryPool(commandBuffer, slot.timestampQueries, 0, kTimestampCount);
        vkCmdWriteTimestamp2(commandBuffer, VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT, slot.timestampQueries, 0);
    }

    const std::array<VkImageMemoryBarrier2, 2> barriers = {
        imageBarrier(
            m_targets.color, VK_IMAGE_ASPECT_COLOR_BIT,
            VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
            VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, 0,
            VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT),
        imageBarrier(
            m_targets.depth, VK_IMAGE_ASPECT_DEPTH_BIT,
            VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL,
            VK_PIPELINE_STAGE_2_COPY_BIT | VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT, 0,
            VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT,
            VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT | VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT)
    };
    imageBarriers(commandBuffer, barriers);

    m_recordingSlot = ticket.slot;
    m_recording = true;
    m_renderingActive = false;
    m_renderedThisFrame = false;
    m_boundPipeline = VK_NULL_HANDLE;
    return true;
}

bool VulkanRenderDevice::updateGroupTable(std::span<const GpuInstancedMesh> groups) {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr) {
        return false;
    }
    if (groups.size_bytes() > m_buffers.getSize(slot->groups)) {
        BIM_LOGE("vulkan") << "group table of " << groups.size() << " entries exceeds the frame buffer";
        return false;
    }
    if (!groups.empty()) {
        std::memcpy(m_buffers.mappedData(slot->groups), groups.data(), groups.size_bytes());
    }
    return true;
}

void VulkanRenderDevice::ensureRendering() {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr || m_renderingActive) {
        return;
    }
    const VkCommandBuffer commandBuffer = slot->commandBuffer;

    VkRenderingAttachmentInfo colorAttachment{};
    colorAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    colorAttachment.imageView = m_targets.colorView;
    colorAttachment.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    colorAttachment.loadOp = m_renderedThisFrame ? VK_ATTACHMENT_LOAD_OP_LOAD : VK_ATTACHMENT_LOAD_OP_CLEAR;
    colorAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    colorAttachment.clearValue.color = VkClearColorValue{{0.08f, 0.09f, 0.11f, 1.0f}};

    VkRenderingAttachmentInfo depthAttachment{};
    depthAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    depthAttachment.imageView = m_targets.depthView;
    depthAttachment.imageLayout = VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL;
    depthAttachment.loadOp = m_renderedThisFrame ? VK_ATTACHMENT_LOAD_OP_LOAD : VK_ATTACHMENT_LOAD_OP_CLEAR;
    depthAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    depthAttachment.clearValue.depthStencil = VkClearDepthStencilValue{1.0f, 0};

    VkRenderingInfo renderingInfo{};
    renderingInfo.sType = VK_STRUCTURE_TYPE_RENDERING_INFO;
    renderingInfo.renderArea.extent = VkExtent2D{m_targets.viewport.width, m_targets.viewport.height};
    renderingInfo.layerCount = 1;
    renderingInfo.colorAttachmentCount = 1;
    renderingInfo.pColorAttachments = &colorAttachment;
    renderingInfo.pDepthAttachment = &depthAttachment;
    vkCmdBeginRendering(commandBuffer, &renderingInfo);

    VkViewport viewport{};
    viewport.width = static_cast<float>(m_targets.viewport.width);
    viewport.height = static_cast<float>(m_targets.viewport.height);
    viewport.maxDepth = 1.0f;
    VkRect2D scissor{};
    scissor.extent = renderingInfo.renderArea.extent;
    vkCmdSetViewport(commandBuffer, 0, 1, &viewport);
    vkCmdSetScissor(commandBuffer, 0, 1, &scissor);

    vkCmdBindDescriptorSets(
        commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, m_pipelines.layout, 0, 1, &slot->descriptorSet, 0, nullptr);
    const VkBuffer vertexBuffer = m_buffers.getBuffer(m_scene.positions);
    const VkDeviceSize vertexOffset = 0;
    vkCmdBindVertexBuffers(commandBuffer, 0, 1, &vertexBuffer, &vertexOffset);
    vkCmdBindIndexBuffer(commandBuffer, m_buffers.getBuffer(m_scene.indices), 0, VK_INDEX_TYPE_UINT32);

    m_renderingActive = true;
    m_renderedThisFrame = true;
}

void VulkanRenderDevice::endRendering() {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr || !m_renderingActive) {
        return;
    }
    vkCmdEndRendering(slot->commandBuffer);
    m_renderingActive = false;
}

void VulkanRenderDevice::bindPipeline(VkPipeline pipeline, VkPipelineBindPoint bindPoint) {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr || pipeline == m_boundPipeline) {
        return;
    }
    vkCmdBindPipeline(slot->commandBuffer, bindPoint, pipeline);
    m_boundPipeline = pipeline;
}

void VulkanRenderDevice::drawProxy(std::uint32_t group, const scene::Aabb& bounds) {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr || group >= m_frames.layout.groupCount) {
        return;
    }
    ensureRendering();
    bindPipeline(m_pipelines.proxy, VK_PIPELINE_BIND_POINT_GRAPHICS);

    ProxyPushConstants push{};
    push.boundsMin[0] = bounds.min.x;
    push.boundsMin[1] = bounds.min.y;
    push.boundsMin[2] = bounds.min.z;
    push.boundsMax[0] = bounds.max.x;
    push.boundsMax[1] = bounds.max.y;
    push.boundsMax[2] = bounds.max.z;
    vkCmdPushConstants(
        slot->commandBuffer, m_pipelines.layout,
        VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_COMPUTE_BIT, 0, sizeof(push), &push);

    const VkQueryControlFlags control = m_context.features().occlusionQueryPrecise ? VK_QUERY_CONTROL_PRECISE_BIT : 0;
    vkCmdBeginQuery(slot->commandBuffer, slot->occlusionQueries, group, control);
    vkCmdDraw(slot->commandBuffer, kProxyVertexCount, 1, 0, 0);
    vkCmdEndQuery(slot->commandBuffer, slot->occlusionQueries, group);
}

void VulkanRenderDevice::drawIndexed(const DrawIndexedCommand& command) {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr || command.instanceCount == 0 || command.indexCount == 0) {
        return;
    }
    if (command.firstIndex + command.indexCount > m_indexCount) {
        BIM_LOGW("vulkan") << "draw skipped: indices " << command.firstIndex << "+" << command.indexCount
                           << " exceed the index buffer (" << m_indexCount << ")";
        return;
    }
    ensureRendering();
    bindPipeline(m_pipelines.scene, VK_PIPELINE_BIND_POINT_GRAPHICS);
    vkCmdDrawIndexed(
        slot->commandBuffer, command.indexCount, command.instanceCount,
        command.firstIndex, command.vertexOffset, command.firstInstance);
}

void VulkanRenderDevice::dispatchCommandGeneration(const DispatchSize& dispatch) {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr || dispatch.empty() || m_pipelines.encode == VK_NULL_HANDLE) {
        return;
    }
    if (dispatch.invocationsX * dispatch.invocationsY > m_frames.commandCapacity) {
        BIM_LOGE("vulkan") << "dispatch of " << dispatch.invocationsX << "x" << dispatch.invocationsY
                           << " exceeds the command buffer capacity " << m_frames.commandCapacity;
        return;
    }
    endRendering();
    const VkCommandBuffer commandBuffer = slot->commandBuffer;

    // Depth pyramid written by the previous frame.
    memoryBarrier(
        commandBuffer,
        VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
        VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_READ_BIT);

    bindPipeline(m_pipelines.encode, VK_PIPELINE_BIND_POINT_COMPUTE);
    vkCmdBindDescriptorSets(
        commandBuffer, VK_PIPELINE_BIND_POINT_COMPUTE, m_pipelines.layout, 0, 1, &slot->descriptorSet, 0, nullptr);
    vkCmdDispatch(commandBuffer, dispatch.groupCountX, dispatch.groupCountY, 1);

    memoryBarrier(
        commandBuffer,
        VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
        VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT, VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT);
}

bool VulkanRenderDevice::uploadCommands(std::span<const DrawIndexedCommand> commands) {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr) {
        return false;
    }
    if (commands.size() > m_frames.commandCapacity) {
        BIM_LOGE("vulkan") << commands.size() << " commands exceed the command buffer capacity " << m_frames.commandCapacity;
        return false;
    }
    if (!commands.empty()) {
        std::memcpy(m_buffers.mappedData(slot->commands), commands.data(), commands.size_bytes());
    }
    return true;
}

void VulkanRenderDevice::executeIndirect(std::uint32_t commandCount) {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr || commandCount == 0 || !m_capabilities.indirectDraw) {
        return;
    }
    commandCount = std::min(commandCount, m_frames.commandCapacity);
    ensureRendering();
    bindPipeline(m_pipelines.scene, VK_PIPELINE_BIND_POINT_GRAPHICS);
    vkCmdDrawIndexedIndirect(
        slot->commandBuffer, m_buffers.getBuffer(slot->commands), 0, commandCount, sizeof(DrawIndexedCommand));
}

void VulkanRenderDevice::recordDepthPyramid(VkCommandBuffer commandBuffer) {
    const VkImageMemoryBarrier2 toTransfer = imageBarrier(
        m_targets.depth, VK_IMAGE_ASPECT_DEPTH_BIT,
        VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
        VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT, VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
        VK_PIPELINE_STAGE_2_COPY_BIT, VK_ACCESS_2_TRANSFER_READ_BIT);
    imageBarriers(commandBuffer, std::span<const VkImageMemoryBarrier2>(&toTransfer, 1));

    // Previous frame's encode kernel may still be reading mip data.
    memoryBarrier(
        commandBuffer,
        VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_READ_BIT,
        VK_PIPELINE_STAGE_2_COPY_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT);

    VkBufferImageCopy region{};
    region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_DEPTH_BIT;
    region.imageSubresource.layerCount = 1;
    region.imageExtent = VkExtent3D{m_targets.viewport.width, m_targets.viewport.height, 1};
    vkCmdCopyImageToBuffer(
        commandBuffer, m_targets.depth, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
        m_buffers.getBuffer(m_targets.pyramid), 1, &region);

    memoryBarrier(
        commandBuffer,
        VK_PIPELINE_STAGE_2_COPY_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
        VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_READ_BIT | VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT);

    FrameSlot* slot = recordingSlot();
    bindPipeline(m_pipelines.pyramid, VK_PIPELINE_BIND_POINT_COMPUTE);
    vkCmdBindDescriptorSets(
        commandBuffer, VK_PIPELINE_BIND_POINT_COMPUTE, m_pipelines.layout, 0, 1, &slot->descriptorSet, 0, nullptr);

    std::uint32_t srcWidth = m_targets.viewport.width;
    std::uint32_t srcHeight = m_targets.viewport.height;
    for (std::uint32_t mip = 1; mip < m_targets.pyramidExtent.mipCount; ++mip) {
        PyramidPushConstants push{};
        push.srcOffset = m_targets.mipOffsets[mip - 1];
        push.srcWidth = srcWidth;
        push.srcHeight = srcHeight;
        push.dstOffset = m_targets.mipOffsets[mip];
        push.dstWidth = std::max(1u, srcWidth >> 1);
        push.dstHeight = std::max(1u, srcHeight >> 1);
        vkCmdPushConstants(
            commandBuffer, m_pipelines.layout,
            VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_COMPUTE_BIT, 0, sizeof(push), &push);
        vkCmdDispatch(
            commandBuffer,
            (push.dstWidth + kPyramidThreadGroupSize - 1) / kPyramidThreadGroupSize,
            (push.dstHeight + kPyramidThreadGroupSize - 1) / kPyramidThreadGroupSize,
            1);
        memoryBarrier(
            commandBuffer,
            VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
            VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_READ_BIT | VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT);
        srcWidth = push.dstWidth;
        srcHeight = push.dstHeight;
    }
}

bool VulkanRenderDevice::submitFrame(const FrameTicket& ticket, FrameCompletionHandler onComplete) {
    FrameSlot* slot = recordingSlot();
    if (slot == nullptr || ticket.slot != m_recordingSlot) {
        BIM_LOGE("vulkan") << "submit of frame " << ticket.frameNumber << " without a matching beginFrame";
        return false;
    }
    const VkCommandBuffer commandBuffer = slot->commandBuffer;
    // Clears the targets even when nothing was drawn.
    ensureRendering();
    endRendering();

    const std::uint32_t groupCount = m_frames.layout.groupCount;
    if (groupCount > 0) {
        vkCmdCopyQueryPoolResults(
            commandBuffer, slot->occlusionQueries, 0, groupCount,
            m_buffers.getBuffer(slot->occlusionResults), 0, sizeof(std::uint32_t), 0);
    }
    if (m_pipelines.pyramid != VK_NULL_HANDLE && m_targets.pyramidExtent.mipCount > 0) {
        recordDepthPyramid(commandBuffer);
    }
    memoryBarrier(
        commandBuffer,
        VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, VK_ACCESS_2_MEMORY_WRITE_BIT,
        VK_PIPELINE_STAGE_2_HOST_BIT, VK_ACCESS_2_HOST_READ_BIT);
    if (slot->timestampQueries != VK_NULL_HANDLE) {
        vkCmdWriteTimestamp2(commandBuffer, VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT, slot->timestampQueries, 1);
    }

    m_recording = false;
    const VkResult endResult = vkEndCommandBuffer(commandBuffer);
    if (endResult != VK_SUCCESS) {
        logVkFailure("vkEndCommandBuffer", endResult);
        return false;
    }

    const std::uint64_t signalValue = m_timelineValue + 1;
    VkCommandBufferSubmitInfo commandInfo{};
    commandInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    commandInfo.commandBuffer = commandBuffer;

    VkSemaphoreSubmitInfo signalInfo{};
    signalInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    signalInfo.semaphore = m_timeline;
    signalInfo.value = signalValue;
    signalInfo.stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;

    VkSubmitInfo2 submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submitInfo.commandBufferInfoCount = 1;
    submitInfo.pCommandBufferInfos = &commandInfo;
    submitInfo.signalSemaphoreInfoCount = 1;
    submitInfo.pSignalSemaphoreInfos = &signalInfo;

    const VkResult result = vkQueueSubmit2(m_context.queue(), 1, &submitInfo, VK_NULL_HANDLE);
    if (result != VK_SUCCESS) {
        logVkFailure("vkQueueSubmit2", result);
        return false;
    }

    m_timelineValue = signalValue;
    slot->submittedValue = signalValue;
    if (m_pipelines.pyramid != VK_NULL_HANDLE) {
        m_pyramidReady = true;
    }
    m_pending.push_back(PendingFrame{signalValue, ticket, std::move(onComplete)});
    return true;
}

void VulkanRenderDevice::readTimestamps(const FrameSlot& slot) {
    if (slot.timestampQueries == VK_NULL_HANDLE) {
        return;
    }
    std::array<std::uint64_t, kTimestampCount> values{};
    const VkResult result = vkGetQueryPoolResults(
        m_context.device(), slot.timestampQueries, 0, kTimestampCount,
        sizeof(values), values.data(), sizeof(std::uint64_t), VK_QUERY_RESULT_64_BIT);
    if (result != VK_SUCCESS) {
        return;
    }
    const double nsToMs = static_cast<double>(m_context.timestampPeriod()) * 1e-6;
    m_gpuFrameMs = static_cast<double>(values[1] - values[0]) * nsToMs;
}

std::uint32_t VulkanRenderDevice::pollCompletions(std::chrono::milliseconds timeout) {
    const VkDevice device = m_context.device();
    if (device == VK_NULL_HANDLE) {
        return 0;
    }
    if (!m_pending.empty() && timeout.count() > 0) {
        VkSemaphoreWaitInfo waitInfo{};
        waitInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO;
        waitInfo.semaphoreCount = 1;
        waitInfo.pSemaphores = &m_timeline;
        waitInfo.pValues = &m_pending.front().timelineValue;
        const auto timeoutNs = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(timeout).count());
        const VkResult waitResult = vkWaitSemaphores(device, &waitInfo, timeoutNs);
        if (waitResult != VK_SUCCESS && waitResult != VK_TIMEOUT) {
            logVkFailure("vkWaitSemaphores", waitResult);
        }
    }

    std::uint64_t reached = 0;
    const VkResult counterResult = vkGetSemaphoreCounterValue(device, m_timeline, &reached);
    if (counterResult != VK_SUCCESS) {
        logVkFailure("vkGetSemaphoreCounterValue", counterResult);
        return 0;
    }

    std::uint32_t completed = 0;
    while (!m_pending.empty() && m_pending.front().timelineValue <= reached) {
        PendingFrame frame = std::move(m_pending.front());
        m_pending.pop_front();
        if (frame.ticket.slot < m_frames.slots.size() &&
            m_frames.slots[frame.ticket.slot].submittedValue == frame.timelineValue) {
            readTimestamps(m_frames.slots[frame.ticket.slot]);
        }
        if (frame.onComplete) {
            frame.onComplete(frame.ticket);
        }
        ++completed;
    }
    releaseRetired(reached);
    return completed;
}

std::span<const std::uint32_t> VulkanRenderDevice::occlusionResults(std::uint32_t slot) const {
    if (slot >= m_frames.slots.size() || m_frames.layout.groupCount == 0) {
        return {};
    }
    const auto* data = static_cast<const std::uint32_t*>(m_buffers.mappedData(m_frames.slots[slot].occlusionResults));
    return std::span<const std::uint32_t>(data, m_frames.layout.groupCount);
}

std::span<const std::uint32_t> VulkanRenderDevice::executedFlags(std::uint32_t slot) const {
    if (slot >= m_frames.slots.size() || m_frames.layout.groupCount == 0) {
        return {};
    }
    const auto* data = static_cast<const std::uint32_t*>(m_buffers.mappedData(m_frames.slots[slot].executed));
    return std::span<const std::uint32_t>(data, m_frames.layout.groupCount);
}

DepthPyramidExtent VulkanRenderDevice::depthPyramidExtent() const {
    return m_pyramidReady ? m_targets.pyramidExtent : DepthPyramidExtent{};
}

void VulkanRenderDevice::waitIdle() {
    if (m_context.device() != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(m_context.device());
    }
}

} // namespace bimview::render::vulkan
