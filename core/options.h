#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bimview::core {

enum class CullMode : uint8_t {
    None = 0,
    Front = 1,
    Back = 2
};

enum class DepthTestStrategy : uint8_t {
    BoundingBox = 0,
    DepthPyramid = 1
};

struct RenderOptions {
    // Occlusion queries feed the visible set; off means frustum candidates are final.
    bool occlusionTesting = true;
    // Skips readback and leaves proxy boxes on screen.
    bool visualizeOcclusion = false;
    // Scenes with fewer instanced meshes skip the spatial query.
    uint32_t frustumCullingThreshold = 1024;
    double frameTimeLimitSeconds = 0.3;

    bool enableDepthTesting = true;
    bool enableContributionTesting = true;
    float minContributionPixels = 4.0f;
    DepthTestStrategy depthTestStrategy = DepthTestStrategy::DepthPyramid;

    uint32_t pipelineDepth = 3;
    bool forceDirectPath = false;

    CullMode cullMode = CullMode::Back;
    bool wireFrame = false;
    bool xRay = false;
};

constexpr uint32_t kMinPipelineDepth = 1;
constexpr uint32_t kMaxPipelineDepth = 4;

[[nodiscard]] std::optional<bool> parseBoolOption(std::string_view text);
[[nodiscard]] std::optional<DepthTestStrategy> parseDepthTestStrategy(std::string_view text);

// Overrides fields from BIMVIEW_* variables; malformed values keep the current value.
void loadRenderOptionsFromEnvironment(RenderOptions& options);

// Clamps out-of-range values in place and returns false if anything changed.
bool sanitizeRenderOptions(RenderOptions& options);

} // namespace bimview::core
