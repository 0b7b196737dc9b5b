#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <string>

#include "render/command_generation.h"
#include "render/depth_pyramid.h"
#include "render/frame_ring.h"
#include "render/gpu_scene.h"
#include "render/gpu_types.h"
#include "scene/bounds.h"

namespace bimview::render {

struct DeviceCapabilities {
    std::string deviceName;
    // Multi-draw indexed indirect with a non-zero first instance.
    bool indirectDraw = false;
    // A compute kernel can write the indirect command list on the device.
    bool deviceCommandGeneration = false;
    bool occlusionQueries = false;
    bool timestampQueries = false;
    // The device maintains a depth pyramid of the previous frame for the kernel.
    bool depthPyramid = false;
};

struct FrameResourceLayout {
    std::uint32_t slotCount = 0;
    std::uint32_t groupCount = 0;
    std::uint32_t maxSubmeshesPerMesh = 0;
    ViewportSize viewport{};
};

using FrameCompletionHandler = std::function<void(const FrameTicket& ticket)>;

// What the culling pipeline needs from a graphics device. All recording calls
// apply to the frame opened by the last beginFrame().
class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    [[nodiscard]] virtual const DeviceCapabilities& capabilities() const = 0;

    // Re-creates every per-slot resource (uniforms, query results, command
    // lists). Frames already submitted keep the resources they bound.
    virtual bool resizeFrameResources(const FrameResourceLayout& layout) = 0;
    // Static geometry: vertex/index data and the mesh/submesh/instance tables.
    virtual bool uploadScene(const GpuSceneTables& tables, std::span<const float> positions, std::span<const std::uint32_t> indices) = 0;

    virtual bool beginFrame(const FrameTicket& ticket, const GpuFrameUniforms& uniforms) = 0;
    // Replaces the per-instance table after hide/select changes. Frames already
    // submitted keep the table they bound.
    virtual bool updateInstances(std::span<const GpuInstance> instances) = 0;
    // Per-frame group table (flags change with hidden state and spatial query).
    virtual bool updateGroupTable(std::span<const GpuInstancedMesh> groups) = 0;

    // Bounding-box draw with depth test, no writes, inside the group's occlusion query.
    virtual void drawProxy(std::uint32_t group, const scene::Aabb& bounds) = 0;
    virtual void drawIndexed(const DrawIndexedCommand& command) = 0;
    virtual void dispatchCommandGeneration(const DispatchSize& dispatch) = 0;
    // Replaces the frame's command list with CPU-encoded commands.
    virtual bool uploadCommands(std::span<const DrawIndexedCommand> commands) = 0;
    virtual void executeIndirect(std::uint32_t commandCount) = 0;

    // `onComplete` runs from pollCompletions() once the device has finished the frame.
    virtual bool submitFrame(const FrameTicket& ticket, FrameCompletionHandler onComplete) = 0;
    // Fires handlers of finished frames, waiting up to `timeout` for the oldest
    // outstanding one. Returns the number of frames completed.
    virtual std::uint32_t pollCompletions(std::chrono::milliseconds timeout) = 0;

    // Occlusion results written by the frame in `slot`; read only after it completed.
    [[nodiscard]] virtual std::span<const std::uint32_t> occlusionResults(std::uint32_t slot) const = 0;
    // Executed flags written by the command-generation kernel in `slot`.
    [[nodiscard]] virtual std::span<const std::uint32_t> executedFlags(std::uint32_t slot) const = 0;
    [[nodiscard]] virtual DepthPyramidExtent depthPyramidExtent() const = 0;
    // CPU copy of the previous frame's depth, when the device keeps one.
    [[nodiscard]] virtual const DepthPyramid* depthPyramid() const { return nullptr; }

    virtual void waitIdle() = 0;
};

} // namespace bimview::render
