#pragma once

#include "core/camera.h"
#include "core/options.h"
#include "render/frame_stats.h"
#include "render/gpu_scene.h"
#include "render/render_device.h"
#include "scene/geometry.h"

#include <cstdint>
#include <vector>

// Render Renderer subsystem
// Responsible for: the per-frame pipeline (frame limiter, ring slots, spatial query, draw path, submission).
// Should NOT do: own graphics API objects; everything device-side goes through RenderDevice.
namespace bimview::render {

enum class DrawPath : std::uint8_t {
    None = 0,
    Direct,
    Indirect
};

[[nodiscard]] const char* drawPathName(DrawPath path);

class Renderer {
public:
    Renderer() = default;
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // The device and geometry must outlive the renderer.
    bool init(
        RenderDevice& device,
        const scene::GeometryStore& geometry,
        const core::RenderOptions& options,
        ViewportSize viewport = ViewportSize{});
    bool renderFrame(const core::Camera& camera);
    void shutdown();

    // Re-sizes and resets every per-frame buffer for the current geometry.
    bool onGeometryReloaded();
    bool onResize(ViewportSize viewport);
    // Pipeline depth changes wait for the device to go idle.
    bool setOptions(const core::RenderOptions& options);

    [[nodiscard]] DrawPath activePath() const;
    [[nodiscard]] const core::RenderOptions& options() const;
    [[nodiscard]] const std::vector<std::uint32_t>& lastCandidates() const;
    [[nodiscard]] const std::vector<std::uint32_t>& lastVisibleSet() const;
    [[nodiscard]] const FrameStats& stats() const;
    [[nodiscard]] std::uint64_t frameIndex() const;
    [[nodiscard]] std::uint32_t framesInFlight() const;

private:
    struct Impl;
    Impl* m_impl = nullptr;
};

} // namespace bimview::render
