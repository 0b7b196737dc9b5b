#include "render/backend/vulkan/pipelines.h"

#include "core/log.h"
#include "render/backend/vulkan/vulkan_context.h"

#include <array>
#include <fstream>

namespace bimview::render::vulkan {

namespace {

constexpr const char* kSceneVertexShader = "scene.vert.slang.spv";
constexpr const char* kSceneFragmentShader = "scene.frag.slang.spv";
constexpr const char* kProxyVertexShader = "proxy.vert.slang.spv";
constexpr const char* kEncodeShader = "encode_commands.comp.slang.spv";
constexpr const char* kPyramidShader = "depth_pyramid.comp.slang.spv";

VkCullModeFlags toVkCullMode(core::CullMode mode) {
    switch (mode) {
    case core::CullMode::None:
        return VK_CULL_MODE_NONE;
    case core::CullMode::Front:
        return VK_CULL_MODE_FRONT_BIT;
    case core::CullMode::Back:
    default:
        return VK_CULL_MODE_BACK_BIT;
    }
}

bool createSetLayout(VkDevice device, PipelineSet& out) {
    std::array<VkDescriptorSetLayoutBinding, kBindingCount> bindings{};
    for (std::uint32_t i = 0; i < kBindingCount; ++i) {
        bindings[i].binding = i;
        bindings[i].descriptorType = (i == kBindingFrame) ? VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER : VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        bindings[i].descriptorCount = 1;
        bindings[i].stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT | VK_SHADER_STAGE_COMPUTE_BIT;
    }

    VkDescriptorSetLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutInfo.bindingCount = static_cast<std::uint32_t>(bindings.size());
    layoutInfo.pBindings = bindings.data();
    VkResult result = vkCreateDescriptorSetLayout(device, &layoutInfo, nullptr, &out.setLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateDescriptorSetLayout", result);
        return false;
    }

    VkPushConstantRange pushRange{};
    pushRange.stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_COMPUTE_BIT;
    pushRange.offset = 0;
    pushRange.size = kPushConstantBytes;

    VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
    pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    pipelineLayoutInfo.setLayoutCount = 1;
    pipelineLayoutInfo.pSetLayouts = &out.setLayout;
    pipelineLayoutInfo.pushConstantRangeCount = 1;
    pipelineLayoutInfo.pPushConstantRanges = &pushRange;
    result = vkCreatePipelineLayout(device, &pipelineLayoutInfo, nullptr, &out.layout);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreatePipelineLayout", result);
        return false;
    }
    return true;
}

struct GraphicsPipelineDesc {
    VkShaderModule vertexModule = VK_NULL_HANDLE;
    VkShaderModule fragmentModule = VK_NULL_HANDLE;
    bool positionInput = false;
    bool depthWrite = true;
    bool colorWrite = true;
    bool blend = false;
    VkCullModeFlags cullMode = VK_CULL_MODE_BACK_BIT;
    VkPolygonMode polygonMode = VK_POLYGON_MODE_FILL;
};

VkPipeline createGraphicsPipeline(VkDevice device, VkPipelineLayout layout, const GraphicsPipelineDesc& desc) {
    std::array<VkPipelineShaderStageCreateInfo, 2> stages{};
    std::uint32_t stageCount = 0;
    stages[stageCount].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[stageCount].stage = VK_SHADER_STAGE_VERTEX_BIT;
    stages[stageCount].module = desc.vertexModule;
    stages[stageCount].pName = "main";
    ++stageCount;
    if (desc.fragmentModule != VK_NULL_HANDLE) {
        stages[stageCount].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        stages[stageCount].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
        stages[stageCount].module = desc.fragmentModule;
        stages[stageCount].pName = "main";
        ++stageCount;
    }

    VkVertexInputBindingDescription vertexBinding{};
    vertexBinding.binding = 0;
    vertexBinding.stride = sizeof(float) * 3;
    vertexBinding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;

    VkVertexInputAttributeDescription positionAttribute{};
    positionAttribute.location = 0;
    positionAttribute.binding = 0;
    positionAttribute.format = VK_FORMAT_R32G32B32_SFLOAT;
    positionAttribute.offset = 0;

    VkPipelineVertexInputStateCreateInfo vertexInput{};
    vertexInput.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    if (desc.positionInput) {
        vertexInput.vertexBindingDescriptionCount = 1;
        vertexInput.pVertexBindingDescriptions = &vertexBinding;
        vertexInput.vertexAttributeDescriptionCount = 1;
        vertexInput.pVertexAttributeDescriptions = &positionAttribute;
    }

    VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
    inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    inputAssembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount = 1;

    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.polygonMode = desc.polygonMode;
    rasterizer.cullMode = desc.cullMode;
    rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
    rasterizer.lineWidth = 1.0f;

    VkPipelineMultisampleStateCreateInfo multisample{};
    multisample.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisample.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    VkPipelineDepthStencilStateCreateInfo depthStencil{};
    depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    depthStencil.depthTestEnable = VK_TRUE;
    depthStencil.depthWriteEnable = desc.depthWrite ? VK_TRUE : VK_FALSE;
    depthStencil.depthCompareOp = VK_COMPARE_OP_LESS_OR_EQUAL;

    VkPipelineColorBlendAttachmentState colorAttachment{};
    colorAttachment.colorWriteMask = desc.colorWrite
        ? (VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT)
        : 0;
    if (desc.blend) {
        colorAttachment.blendEnable = VK_TRUE;
        colorAttachment.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
        colorAttachment.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        colorAttachment.colorBlendOp = VK_BLEND_OP_ADD;
        colorAttachment.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
        colorAttachment.dstAlphaBlendFactor = VK_BLEND_FACTOR_ZERO;
        colorAttachment.alphaBlendOp = VK_BLEND_OP_ADD;
    }

    VkPipelineColorBlendStateCreateInfo colorBlend{};
    colorBlend.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    colorBlend.attachmentCount = 1;
    colorBlend.pAttachments = &colorAttachment;

    const std::array<VkDynamicState, 2> dynamicStates = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
    VkPipelineDynamicStateCreateInfo dynamicState{};
    dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamicState.dynamicStateCount = static_cast<std::uint32_t>(dynamicStates.size());
    dynamicState.pDynamicStates = dynamicStates.data();

    const VkFormat colorFormat = kColorFormat;
    VkPipelineRenderingCreateInfo renderingInfo{};
    renderingInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
    renderingInfo.colorAttachmentCount = 1;
    renderingInfo.pColorAttachmentFormats = &colorFormat;
    renderingInfo.depthAttachmentFormat = kDepthFormat;

    VkGraphicsPipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineInfo.pNext = &renderingInfo;
    pipelineInfo.stageCount = stageCount;
    pipelineInfo.pStages = stages.data();
    pipelineInfo.pVertexInputState = &vertexInput;
    pipelineInfo.pInputAssemblyState = &inputAssembly;
    pipelineInfo.pViewportState = &viewportState;
    pipelineInfo.pRasterizationState = &rasterizer;
    pipelineInfo.pMultisampleState = &multisample;
    pipelineInfo.pDepthStencilState = &depthStencil;
    pipelineInfo.pColorBlendState = &colorBlend;
    pipelineInfo.pDynamicState = &dynamicState;
    pipelineInfo.layout = layout;

    VkPipeline pipeline = VK_NULL_HANDLE;
    const VkResult result = vkCreateGraphicsPipelines(device, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline);
    if (result != VK_SUCCESS) {
        logVkFailure("vkCreateGraphicsPipelines", result);
        return VK_NULL_HANDLE;
    }
    return pipeline;
}

VkPipeline createComputePipeline(VkDevice device, VkPipelineLayout layout, const std::string& path) {
    VkShaderModule module = createShaderModuleFromSpv(device, path);
    if (module == VK_NULL_HANDLE) {
        return VK_NULL_HANDLE;
    }

    VkPipelineShaderStageCreateInfo stage{};
    stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    stage.module = module;
    stage.pName = "main";

    VkComputePipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    pipelineInfo.stage = stage;
    pipelineInfo.layout = layout;

    VkPipeline pipeline = VK_NULL_HANDLE;
    const VkResult result = vkCreateComputePipelines(device, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline);
    if (result != VK_SUCCESS) {
        logVkFailure(path.c_str(), result);
        pipeline = VK_NULL_HANDLE;
    }
    vkDestroyShaderModule(device, module, nullptr);
    return pipeline;
}

} // namespace

std::vector<char> loadBinaryFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return {};
    }

    const std::streamsize size = file.tellg();
    if (size <= 0) {
        return {};
    }

    std::vector<char> bytes(static_cast<std::size_t>(size));
    file.seekg(0, std::ios::beg);
    file.read(bytes.data(), size);
    return bytes;
}

VkShaderModule createShaderModuleFromSpv(VkDevice device, const std::string& path) {
    const std::vector<char> bytes = loadBinaryFile(path);
    if (bytes.empty() || (bytes.size() % 4) != 0) {
        BIM_LOGE("vulkan") << "failed to read shader or invalid size: " << path;
        return VK_NULL_HANDLE;
    }

    VkShaderModuleCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    createInfo.codeSize = bytes.size();
    createInfo.pCode = reinterpret_cast<const std::uint32_t*>(bytes.data());

    VkShaderModule module = VK_NULL_HANDLE;
    const VkResult result = vkCreateShaderModule(device, &createInfo, nullptr, &module);
    if (result != VK_SUCCESS) {
        logVkFailure(path.c_str(), result);
        return VK_NULL_HANDLE;
    }
    return module;
}

bool createPipelines(VkDevice device, const PipelineConfig& config, bool fillModeNonSolid, PipelineSet& out) {
    if (!createSetLayout(device, out)) {
        destroyPipelines(device, out);
        return false;
    }

    const std::string dir = config.shaderDirectory + "/";
    VkShaderModule sceneVertex = createShaderModuleFromSpv(device, dir + kSceneVertexShader);
    VkShaderModule sceneFragment = createShaderModuleFromSpv(device, dir + kSceneFragmentShader);
    VkShaderModule proxyVertex = createShaderModuleFromSpv(device, dir + kProxyVertexShader);
    const auto destroyModules = [&]() {
        for (VkShaderModule module : {sceneVertex, sceneFragment, proxyVertex}) {
            if (module != VK_NULL_HANDLE) {
                vkDestroyShaderModule(device, module, nullptr);
            }
        }
    };
    if (sceneVertex == VK_NULL_HANDLE || sceneFragment == VK_NULL_HANDLE || proxyVertex == VK_NULL_HANDLE) {
        destroyModules();
        destroyPipelines(device, out);
        return false;
    }

    GraphicsPipelineDesc sceneDesc;
    sceneDesc.vertexModule = sceneVertex;
    sceneDesc.fragmentModule = sceneFragment;
    sceneDesc.positionInput = true;
    sceneDesc.cullMode = toVkCullMode(config.cullMode);
    sceneDesc.blend = config.xRay;
    sceneDesc.depthWrite = !config.xRay;
    if (config.wireFrame) {
        if (fillModeNonSolid) {
            sceneDesc.polygonMode = VK_POLYGON_MODE_LINE;
        } else {
            BIM_LOGW("vulkan") << "wireframe requested but fillModeNonSolid is unsupported";
        }
    }
    out.scene = createGraphicsPipeline(device, out.layout, sceneDesc);

    GraphicsPipelineDesc proxyDesc;
    proxyDesc.vertexModule = proxyVertex;
    proxyDesc.depthWrite = false;
    proxyDesc.colorWrite = false;
    proxyDesc.cullMode = VK_CULL_MODE_NONE;
    out.proxy = createGraphicsPipeline(device, out.layout, proxyDesc);

    destroyModules();
    if (out.scene == VK_NULL_HANDLE || out.proxy == VK_NULL_HANDLE) {
        BIM_LOGE("vulkan") << "failed to create scene/proxy graphics pipelines";
        destroyPipelines(device, out);
        return false;
    }

    out.encode = createComputePipeline(device, out.layout, dir + kEncodeShader);
    out.pyramid = createComputePipeline(device, out.layout, dir + kPyramidShader);
    if (out.encode == VK_NULL_HANDLE) {
        BIM_LOGW("vulkan") << "command-generation kernel unavailable";
    }
    if (out.pyramid == VK_NULL_HANDLE) {
        BIM_LOGW("vulkan") << "depth pyramid kernel unavailable";
    }
    return true;
}

void destroyPipelines(VkDevice device, PipelineSet& pipelines) {
    for (VkPipeline* pipeline : {&pipelines.scene, &pipelines.proxy, &pipelines.encode, &pipelines.pyramid}) {
        if (*pipeline != VK_NULL_HANDLE) {
            vkDestroyPipeline(device, *pipeline, nullptr);
            *pipeline = VK_NULL_HANDLE;
        }
    }
    if (pipelines.layout != VK_NULL_HANDLE) {
        vkDestroyPipelineLayout(device, pipelines.layout, nullptr);
        pipelines.layout = VK_NULL_HANDLE;
    }
    if (pipelines.setLayout != VK_NULL_HANDLE) {
        vkDestroyDescriptorSetLayout(device, pipelines.setLayout, nullptr);
        pipelines.setLayout = VK_NULL_HANDLE;
    }
}

} // namespace bimview::render::vulkan
