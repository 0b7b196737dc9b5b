#include "app/app.h"

#include "core/log.h"
#include "scene/synthetic_scene.h"

#include <algorithm>
#include <chrono>
#include <cmath>

#ifndef BIMVIEW_SHADER_DIR
#define BIMVIEW_SHADER_DIR "shaders"
#endif

namespace bimview::app {
namespace {

// Fixed step so every run walks the same camera path regardless of frame time.
constexpr float kCameraStepSeconds = 1.0f / 60.0f;

} // namespace

bool App::init(const AppArgs& args) {
    m_args = args;
    core::loadRenderOptionsFromEnvironment(m_options);

    scene::SyntheticBuildingParams building;
    building.floors = args.floors;
    building.gridX = args.grid;
    building.gridZ = args.grid;
    if (!m_geometry.load(scene::makeSyntheticBuilding(building))) {
        BIM_LOGE("app") << "synthetic building failed to load";
        return false;
    }
    const scene::GeometryCounts counts = m_geometry.counts();
    BIM_LOGI("app") << "scene: " << counts.instanceCount << " instances, " << counts.meshCount << " meshes, "
                    << counts.submeshCount << " submeshes, " << counts.instancedMeshCount << " instanced meshes";

    render::vulkan::VulkanDeviceConfig deviceConfig;
    deviceConfig.shaderDirectory = BIMVIEW_SHADER_DIR;
    deviceConfig.cullMode = m_options.cullMode;
    deviceConfig.wireFrame = m_options.wireFrame;
    deviceConfig.xRay = m_options.xRay;
    deviceConfig.validation = render::vulkan::validationRequestedByEnvironment();
    if (!m_device.init(deviceConfig)) {
        BIM_LOGE("app") << "Vulkan device init failed";
        return false;
    }

    if (!m_renderer.init(m_device, m_geometry, m_options, deviceConfig.viewport)) {
        BIM_LOGE("app") << "renderer init failed";
        return false;
    }
    BIM_LOGI("app") << "device " << m_device.capabilities().deviceName << ", draw path "
                    << render::drawPathName(m_renderer.activePath());

    const float extentX = static_cast<float>(args.grid) * building.spacing;
    const float extentY = static_cast<float>(args.floors) * building.floorHeight;
    m_orbitCenter = math::Vector3{extentX * 0.5f, extentY * 0.5f, extentX * 0.5f};
    m_orbitRadius = std::max(extentX, extentY) * 1.1f + 10.0f;
    m_orbitHeight = extentY * 0.75f + 4.0f;
    m_camera.fovDegrees = 60.0f;
    m_camera.farPlane = std::max(m_camera.farPlane, m_orbitRadius * 4.0f);
    updateOrbitCamera(0.0f);
    return true;
}

void App::updateOrbitCamera(float dtSeconds) {
    m_orbitAngle += m_orbitSpeed * dtSeconds;
    if (m_orbitAngle > 2.0f * math::kPi) {
        m_orbitAngle -= 2.0f * math::kPi;
    }
    m_camera.position = math::Vector3{
        m_orbitCenter.x + std::cos(m_orbitAngle) * m_orbitRadius,
        m_orbitHeight,
        m_orbitCenter.z + std::sin(m_orbitAngle) * m_orbitRadius
    };
    m_camera.lookAt(m_orbitCenter);
}

void App::run() {
    using clock = std::chrono::steady_clock;
    const auto start = clock::now();

    std::uint32_t rendered = 0;
    for (; rendered < m_args.frames; ++rendered) {
        if (!m_renderer.renderFrame(m_camera)) {
            BIM_LOGE("app") << "render frame " << rendered << " failed";
            break;
        }
        updateOrbitCamera(kCameraStepSeconds);
        if ((rendered + 1) % 100 == 0) {
            logStats();
        }
    }
    m_device.waitIdle();
    m_device.pollCompletions(std::chrono::milliseconds{0});

    const double seconds = std::chrono::duration<double>(clock::now() - start).count();
    BIM_LOGI("app") << "rendered " << rendered << " frames in " << seconds << " s ("
                    << (seconds > 0.0 ? static_cast<double>(rendered) / seconds : 0.0) << " fps)";
    logStats();
}

void App::logStats() const {
    const render::FrameStats& stats = m_renderer.stats();
    const render::FrameCounters& last = stats.lastFrame();
    BIM_LOGI("stats") << "frame " << m_renderer.frameIndex()
                      << ": candidates=" << last.candidateCount
                      << " visible=" << last.visibleCount
                      << " occluded=" << last.occludedCount
                      << " draws=" << last.drawCallCount
                      << " skipped=" << last.budgetSkippedCount
                      << (last.indirect ? " indirect" : " direct")
                      << " latency avg=" << stats.averageLatencyMs() << "ms max=" << stats.maxLatencyMs() << "ms"
                      << " gpu=" << m_device.gpuFrameMs() << "ms";
}

void App::shutdown() {
    m_renderer.shutdown();
    m_device.shutdown();
    m_geometry.clear();
}

} // namespace bimview::app
