#pragma once

#include "app/app_args.h"
#include "core/camera.h"
#include "core/options.h"
#include "render/backend/vulkan/vulkan_render_device.h"
#include "render/renderer.h"
#include "scene/geometry.h"

#include <cstdint>

namespace bimview::app {

// Headless benchmark: a synthetic building rendered offscreen along an orbit.
class App {
public:
    bool init(const AppArgs& args);
    void run();
    void shutdown();

private:
    void updateOrbitCamera(float dtSeconds);
    void logStats() const;

    AppArgs m_args{};
    core::RenderOptions m_options{};
    scene::GeometryStore m_geometry;
    render::vulkan::VulkanRenderDevice m_device;
    render::Renderer m_renderer;
    core::Camera m_camera{};

    math::Vector3 m_orbitCenter{};
    float m_orbitAngle = 0.0f;
    float m_orbitRadius = 40.0f;
    float m_orbitHeight = 12.0f;
    float m_orbitSpeed = 0.30f;
};

} // namespace bimview::app
