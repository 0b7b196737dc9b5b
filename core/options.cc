#include "core/options.h"

#include "core/log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace bimview::core {
namespace {

std::string toLower(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

const char* readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return nullptr;
    }
    return value;
}

void applyBool(const char* name, bool& field) {
    const char* text = readEnv(name);
    if (text == nullptr) {
        return;
    }
    const std::optional<bool> parsed = parseBoolOption(text);
    if (!parsed.has_value()) {
        BIM_LOGW("options") << "ignoring " << name << "=" << text << " (expected on/off)";
        return;
    }
    field = *parsed;
}

template <typename NumberT>
void applyNumber(const char* name, NumberT& field) {
    const char* text = readEnv(name);
    if (text == nullptr) {
        return;
    }
    char* end = nullptr;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || value < 0.0) {
        BIM_LOGW("options") << "ignoring " << name << "=" << text << " (expected non-negative number)";
        return;
    }
    field = static_cast<NumberT>(value);
}

} // namespace

std::optional<bool> parseBoolOption(std::string_view text) {
    const std::string normalized = toLower(text);
    if (normalized == "1" || normalized == "on" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "off" || normalized == "false" || normalized == "no") {
        return false;
    }
    return std::nullopt;
}

std::optional<DepthTestStrategy> parseDepthTestStrategy(std::string_view text) {
    const std::string normalized = toLower(text);
    if (normalized == "box" || normalized == "boundingbox" || normalized == "bounding-box") {
        return DepthTestStrategy::BoundingBox;
    }
    if (normalized == "pyramid" || normalized == "hiz" || normalized == "depthpyramid") {
        return DepthTestStrategy::DepthPyramid;
    }
    return std::nullopt;
}

void loadRenderOptionsFromEnvironment(RenderOptions& options) {
    applyBool("BIMVIEW_OCCLUSION", options.occlusionTesting);
    applyBool("BIMVIEW_VISUALIZE_OCCLUSION", options.visualizeOcclusion);
    applyNumber("BIMVIEW_FRUSTUM_THRESHOLD", options.frustumCullingThreshold);
    applyNumber("BIMVIEW_FRAME_TIME_LIMIT", options.frameTimeLimitSeconds);
    applyBool("BIMVIEW_DEPTH_TEST", options.enableDepthTesting);
    applyBool("BIMVIEW_CONTRIBUTION_TEST", options.enableContributionTesting);
    applyNumber("BIMVIEW_MIN_CONTRIBUTION", options.minContributionPixels);
    applyNumber("BIMVIEW_PIPELINE_DEPTH", options.pipelineDepth);
    applyBool("BIMVIEW_FORCE_DIRECT", options.forceDirectPath);

    if (const char* strategy = readEnv("BIMVIEW_DEPTH_STRATEGY")) {
        const std::optional<DepthTestStrategy> parsed = parseDepthTestStrategy(strategy);
        if (parsed.has_value()) {
            options.depthTestStrategy = *parsed;
        } else {
            BIM_LOGW("options") << "ignoring BIMVIEW_DEPTH_STRATEGY=" << strategy << " (expected box/pyramid)";
        }
    }

    if (!sanitizeRenderOptions(options)) {
        BIM_LOGW("options") << "clamped out-of-range render options";
    }
}

bool sanitizeRenderOptions(RenderOptions& options) {
    bool unchanged = true;
    const uint32_t depth = std::clamp(options.pipelineDepth, kMinPipelineDepth, kMaxPipelineDepth);
    if (depth != options.pipelineDepth) {
        options.pipelineDepth = depth;
        unchanged = false;
    }
    if (options.frameTimeLimitSeconds < 0.0) {
        options.frameTimeLimitSeconds = 0.0;
        unchanged = false;
    }
    if (options.minContributionPixels < 0.0f) {
        options.minContributionPixels = 0.0f;
        unchanged = false;
    }
    return unchanged;
}

} // namespace bimview::core
