#include "render/renderer.h"

#include "core/log.h"
#include "render/frame_limiter.h"
#include "render/occlusion.h"
#include "render/render_pass.h"

#include <algorithm>
#include <chrono>
#include <memory>

namespace bimview::render {

namespace {

constexpr std::chrono::milliseconds kCompletionPollSlice{2};
constexpr std::chrono::milliseconds kFrameWaitTimeout{5000};

} // namespace

const char* drawPathName(DrawPath path) {
    switch (path) {
    case DrawPath::Direct:
        return "direct";
    case DrawPath::Indirect:
        return "indirect";
    case DrawPath::None:
    default:
        return "none";
    }
}

struct Renderer::Impl {
    using Clock = std::chrono::steady_clock;

    RenderDevice* device = nullptr;
    const scene::GeometryStore* geometry = nullptr;
    core::RenderOptions options{};
    ViewportSize viewport{};

    FrameLimiter limiter;
    OcclusionCuller occlusion;
    FrameStats stats;
    VisibilityRenderPass visibilityPass{occlusion};
    DirectRenderPass directPass;
    std::unique_ptr<IndirectRenderPass> indirectPass;
    DrawPath path = DrawPath::None;

    std::uint64_t geometryGeneration = 0;
    std::uint64_t instanceStateGeneration = 0;
    std::uint64_t frameIndex = 0;
    std::vector<std::uint32_t> candidates;
    std::vector<std::uint32_t> visible;
    std::vector<std::uint32_t> lastVisible;

    bool selectPath();
    bool uploadGeometry();
    bool uploadInstanceStates();
    bool resetFrameResources();
    bool acquireFrame();
    void drainCompletions();
    void abandonFrame(const FrameTicket& ticket);
    void onFrameCompleted(const FrameTicket& ticket, Clock::time_point submittedAt);
};

bool Renderer::Impl::selectPath() {
    indirectPass.reset();
    const DeviceCapabilities& caps = device->capabilities();
    if (options.occlusionTesting && !caps.occlusionQueries) {
        BIM_LOGW("render") << caps.deviceName << " has no occlusion queries; every frustum candidate is drawn";
    }

    if (options.forceDirectPath) {
        BIM_LOGI("render") << "direct path forced by options";
        path = DrawPath::Direct;
    } else {
        indirectPass = IndirectRenderPass::create(*device, *geometry);
        path = indirectPass ? DrawPath::Indirect : DrawPath::Direct;
    }
    BIM_LOGI("render") << "draw path: " << drawPathName(path);
    return true;
}

bool Renderer::Impl::uploadGeometry() {
    if (!geometry->isReady()) {
        return true;
    }
    const std::uint64_t stateGeneration = geometry->stateGeneration();
    const GpuSceneTables tables = buildGpuSceneTables(*geometry);
    if (!device->uploadScene(tables, geometry->positions(), geometry->indices())) {
        BIM_LOGE("render") << "scene upload failed";
        return false;
    }
    instanceStateGeneration = stateGeneration;
    if (indirectPass) {
        indirectPass->rebuildTables(*geometry);
    }
    return true;
}

bool Renderer::Impl::uploadInstanceStates() {
    const std::uint64_t stateGeneration = geometry->stateGeneration();
    const std::vector<GpuInstance> instances = buildGpuInstances(*geometry);
    if (!device->updateInstances(instances)) {
        BIM_LOGW("render") << "instance state upload failed; retrying next frame";
        return false;
    }
    instanceStateGeneration = stateGeneration;
    return true;
}

bool Renderer::Impl::resetFrameResources() {
    const std::uint32_t slotCount = options.pipelineDepth + 1u;
    const auto groupCount = geometry->isReady() ? static_cast<std::uint32_t>(geometry->instancedMeshes().size()) : 0u;

    FrameResourceLayout layout;
    layout.slotCount = slotCount;
    layout.groupCount = groupCount;
    layout.maxSubmeshesPerMesh = geometry->maxSubmeshesPerMesh();
    layout.viewport = viewport;
    if (!device->resizeFrameResources(layout)) {
        BIM_LOGE("render") << "failed to allocate frame resources for " << groupCount << " instanced meshes";
        return false;
    }

    occlusion.reset(slotCount, groupCount);
    stats.reset(geometry->counts());
    candidates.clear();
    visible.clear();
    lastVisible.clear();
    geometryGeneration = geometry->generation();
    return true;
}

bool Renderer::Impl::acquireFrame() {
    const Clock::time_point deadline = Clock::now() + kFrameWaitTimeout;
    while (!limiter.tryAcquire()) {
        const std::uint32_t completed = device->pollCompletions(kCompletionPollSlice);
        if (completed == 0 && Clock::now() >= deadline) {
            BIM_LOGE("render") << "timed out waiting for a frame slot; " << limiter.inFlight() << " frames in flight";
            return false;
        }
    }
    return true;
}

void Renderer::Impl::drainCompletions() {
    device->waitIdle();
    (void)device->pollCompletions(std::chrono::milliseconds{0});
}

// Retires a frame that never reached the device. Earlier frames have to
// complete first so the ring sees completions in order.
void Renderer::Impl::abandonFrame(const FrameTicket& ticket) {
    drainCompletions();
    (void)occlusion.frameCompleted(ticket, {});
    limiter.release();
}

void Renderer::Impl::onFrameCompleted(const FrameTicket& ticket, Clock::time_point submittedAt) {
    const std::chrono::duration<double, std::milli> latency = Clock::now() - submittedAt;
    stats.recordLatency(latency.count());
    if (ticket.epoch == occlusion.ring().epoch()) {
        (void)occlusion.frameCompleted(ticket, device->occlusionResults(ticket.slot));
    }
    limiter.release();
}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init(
    RenderDevice& device,
    const scene::GeometryStore& geometry,
    const core::RenderOptions& options,
    ViewportSize viewport
) {
    if (m_impl != nullptr) {
        shutdown();
    }
    m_impl = new Impl();
    m_impl->device = &device;
    m_impl->geometry = &geometry;
    m_impl->options = options;
    m_impl->viewport = viewport;
    if (!core::sanitizeRenderOptions(m_impl->options)) {
        BIM_LOGW("render") << "render options were out of range and have been clamped";
    }

    if (!m_impl->limiter.setCapacity(m_impl->options.pipelineDepth) ||
        !m_impl->selectPath() ||
        !m_impl->resetFrameResources() ||
        !m_impl->uploadGeometry()) {
        BIM_LOGE("render") << "renderer initialization failed";
        shutdown();
        return false;
    }

    const DeviceCapabilities& caps = device.capabilities();
    BIM_LOGI("render") << "renderer ready on " << caps.deviceName
                       << ": pipeline depth " << m_impl->options.pipelineDepth
                       << ", viewport " << viewport.width << "x" << viewport.height;
    return true;
}

bool Renderer::renderFrame(const core::Camera& camera) {
    if (m_impl == nullptr) {
        return false;
    }
    Impl& impl = *m_impl;
    if (impl.geometry->generation() != impl.geometryGeneration && !onGeometryReloaded()) {
        return false;
    }
    if (!impl.geometry->isReady()) {
        return true;
    }
    if (impl.geometry->stateGeneration() != impl.instanceStateGeneration) {
        (void)impl.uploadInstanceStates();
    }
    if (!impl.acquireFrame()) {
        return false;
    }

    const std::optional<FrameTicket> ticket = impl.occlusion.beginFrame();
    if (!ticket.has_value()) {
        BIM_LOGE("render") << "frame ring full with a free limiter slot";
        impl.limiter.release();
        return false;
    }

    core::Camera frameCamera = camera;
    if (impl.viewport.height > 0) {
        frameCamera.aspectRatio = static_cast<float>(impl.viewport.width) / static_cast<float>(impl.viewport.height);
    }
    const auto groupCount = static_cast<std::uint32_t>(impl.geometry->instancedMeshes().size());
    const GpuFrameUniforms uniforms = makeFrameUniforms(
        frameCamera,
        impl.viewport,
        impl.options,
        groupCount,
        impl.geometry->maxSubmeshesPerMesh(),
        impl.device->depthPyramidExtent());

    scene::SpatialQueryStats queryStats;
    collectFrustumCandidates(*impl.geometry, frustumFromUniforms(uniforms), impl.options, impl.candidates, &queryStats);
    BIM_LOGT("render") << "frame " << ticket->frameNumber << ": visited " << queryStats.visitedNodeCount
                       << " nodes, " << impl.candidates.size() << " candidates";

    if (!impl.device->beginFrame(*ticket, uniforms)) {
        BIM_LOGE("render") << "device failed to begin frame " << ticket->frameNumber;
        impl.abandonFrame(*ticket);
        return false;
    }

    FrameCounters counters;
    FrameContext context{
        *impl.device,
        *impl.geometry,
        impl.options,
        *ticket,
        uniforms,
        impl.candidates,
        impl.visible,
        counters
    };

    RenderPass* passes[2] = {nullptr, nullptr};
    std::size_t passCount = 0;
    if (impl.path == DrawPath::Indirect) {
        passes[passCount++] = impl.indirectPass.get();
    } else {
        // Proxies test against the depth the direct pass just wrote.
        passes[passCount++] = &impl.directPass;
        passes[passCount++] = &impl.visibilityPass;
    }
    for (std::size_t i = 0; i < passCount; ++i) {
        passes[i]->willDraw(context);
    }
    for (std::size_t i = 0; i < passCount; ++i) {
        passes[i]->draw(context);
    }
    for (std::size_t i = 0; i < passCount; ++i) {
        passes[i]->didDraw(context);
    }

    const Impl::Clock::time_point submittedAt = Impl::Clock::now();
    Impl* owner = m_impl;
    const bool submitted = impl.device->submitFrame(*ticket, [owner, submittedAt](const FrameTicket& done) {
        owner->onFrameCompleted(done, submittedAt);
    });
    if (!submitted) {
        BIM_LOGE("render") << "device failed to submit frame " << ticket->frameNumber;
        impl.abandonFrame(*ticket);
        return false;
    }

    (void)impl.device->pollCompletions(std::chrono::milliseconds{0});
    impl.lastVisible = impl.visible;
    impl.stats.recordFrame(counters);
    (void)impl.stats.publishIfDue(Impl::Clock::now());
    ++impl.frameIndex;
    return true;
}

void Renderer::shutdown() {
    if (m_impl == nullptr) {
        return;
    }
    if (m_impl->device != nullptr) {
        m_impl->drainCompletions();
    }
    delete m_impl;
    m_impl = nullptr;
}

bool Renderer::onGeometryReloaded() {
    if (m_impl == nullptr) {
        return false;
    }
    BIM_LOGI("render") << "geometry " << scene::geometryStateName(m_impl->geometry->state())
                       << ", generation " << m_impl->geometry->generation() << "; resetting frame resources";
    return m_impl->resetFrameResources() && m_impl->uploadGeometry();
}

bool Renderer::onResize(ViewportSize viewport) {
    if (m_impl == nullptr) {
        return false;
    }
    if (viewport.width == 0 || viewport.height == 0) {
        BIM_LOGD("render") << "ignoring resize to an empty viewport";
        return true;
    }
    m_impl->viewport = viewport;
    return m_impl->resetFrameResources();
}

bool Renderer::setOptions(const core::RenderOptions& options) {
    if (m_impl == nullptr) {
        return false;
    }
    Impl& impl = *m_impl;
    core::RenderOptions next = options;
    (void)core::sanitizeRenderOptions(next);

    const bool depthChanged = next.pipelineDepth != impl.options.pipelineDepth;
    const bool pathChanged = next.forceDirectPath != impl.options.forceDirectPath;
    impl.options = next;
    if (!depthChanged && !pathChanged) {
        return true;
    }

    impl.drainCompletions();
    if (depthChanged && !impl.limiter.setCapacity(impl.options.pipelineDepth)) {
        BIM_LOGE("render") << "could not change pipeline depth with frames in flight";
        return false;
    }
    return impl.selectPath() && impl.resetFrameResources() && impl.uploadGeometry();
}

DrawPath Renderer::activePath() const {
    return m_impl != nullptr ? m_impl->path : DrawPath::None;
}

const core::RenderOptions& Renderer::options() const {
    static const core::RenderOptions kDefaults{};
    return m_impl != nullptr ? m_impl->options : kDefaults;
}

const std::vector<std::uint32_t>& Renderer::lastCandidates() const {
    static const std::vector<std::uint32_t> kEmpty;
    return m_impl != nullptr ? m_impl->candidates : kEmpty;
}

const std::vector<std::uint32_t>& Renderer::lastVisibleSet() const {
    static const std::vector<std::uint32_t> kEmpty;
    return m_impl != nullptr ? m_impl->lastVisible : kEmpty;
}

const FrameStats& Renderer::stats() const {
    static const FrameStats kEmpty{};
    return m_impl != nullptr ? m_impl->stats : kEmpty;
}

std::uint64_t Renderer::frameIndex() const {
    return m_impl != nullptr ? m_impl->frameIndex : 0u;
}

std::uint32_t Renderer::framesInFlight() const {
    return m_impl != nullptr ? m_impl->limiter.inFlight() : 0u;
}

} // namespace bimview::render
