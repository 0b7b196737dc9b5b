#include <gtest/gtest.h>

#include <cstdlib>

#include "core/options.h"

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : m_name(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        ::unsetenv(m_name);
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* m_name;
};

} // namespace

TEST(OptionsTest, DefaultsMatchTheViewerConfiguration) {
    const bimview::core::RenderOptions options;
    EXPECT_TRUE(options.occlusionTesting);
    EXPECT_FALSE(options.visualizeOcclusion);
    EXPECT_EQ(options.frustumCullingThreshold, 1024u);
    EXPECT_DOUBLE_EQ(options.frameTimeLimitSeconds, 0.3);
    EXPECT_EQ(options.pipelineDepth, 3u);
    EXPECT_EQ(options.depthTestStrategy, bimview::core::DepthTestStrategy::DepthPyramid);
    EXPECT_EQ(options.cullMode, bimview::core::CullMode::Back);
    EXPECT_FALSE(options.forceDirectPath);
}

TEST(OptionsTest, ParseBoolOptionAcceptsCommonSpellings) {
    using bimview::core::parseBoolOption;
    EXPECT_EQ(parseBoolOption("on"), true);
    EXPECT_EQ(parseBoolOption("TRUE"), true);
    EXPECT_EQ(parseBoolOption("1"), true);
    EXPECT_EQ(parseBoolOption("Off"), false);
    EXPECT_EQ(parseBoolOption("no"), false);
    EXPECT_FALSE(parseBoolOption("maybe").has_value());
}

TEST(OptionsTest, ParseDepthTestStrategy) {
    using bimview::core::DepthTestStrategy;
    using bimview::core::parseDepthTestStrategy;
    EXPECT_EQ(parseDepthTestStrategy("box"), DepthTestStrategy::BoundingBox);
    EXPECT_EQ(parseDepthTestStrategy("Bounding-Box"), DepthTestStrategy::BoundingBox);
    EXPECT_EQ(parseDepthTestStrategy("hiz"), DepthTestStrategy::DepthPyramid);
    EXPECT_EQ(parseDepthTestStrategy("pyramid"), DepthTestStrategy::DepthPyramid);
    EXPECT_FALSE(parseDepthTestStrategy("plane").has_value());
}

TEST(OptionsTest, SanitizeClampsOutOfRangeValues) {
    bimview::core::RenderOptions options;
    options.pipelineDepth = 9;
    options.frameTimeLimitSeconds = -1.0;
    options.minContributionPixels = -3.0f;

    EXPECT_FALSE(bimview::core::sanitizeRenderOptions(options));
    EXPECT_EQ(options.pipelineDepth, bimview::core::kMaxPipelineDepth);
    EXPECT_DOUBLE_EQ(options.frameTimeLimitSeconds, 0.0);
    EXPECT_FLOAT_EQ(options.minContributionPixels, 0.0f);

    options.pipelineDepth = 0;
    EXPECT_FALSE(bimview::core::sanitizeRenderOptions(options));
    EXPECT_EQ(options.pipelineDepth, bimview::core::kMinPipelineDepth);

    EXPECT_TRUE(bimview::core::sanitizeRenderOptions(options));
}

TEST(OptionsTest, ZeroFrameTimeLimitIsKept) {
    bimview::core::RenderOptions options;
    options.frameTimeLimitSeconds = 0.0;
    EXPECT_TRUE(bimview::core::sanitizeRenderOptions(options));
    EXPECT_DOUBLE_EQ(options.frameTimeLimitSeconds, 0.0);
}

TEST(OptionsTest, EnvironmentOverridesValidFieldsOnly) {
    const ScopedEnv occlusion("BIMVIEW_OCCLUSION", "off");
    const ScopedEnv threshold("BIMVIEW_FRUSTUM_THRESHOLD", "16");
    const ScopedEnv strategy("BIMVIEW_DEPTH_STRATEGY", "box");
    const ScopedEnv depth("BIMVIEW_PIPELINE_DEPTH", "seven");
    const ScopedEnv limit("BIMVIEW_FRAME_TIME_LIMIT", "-2");

    bimview::core::RenderOptions options;
    bimview::core::loadRenderOptionsFromEnvironment(options);

    EXPECT_FALSE(options.occlusionTesting);
    EXPECT_EQ(options.frustumCullingThreshold, 16u);
    EXPECT_EQ(options.depthTestStrategy, bimview::core::DepthTestStrategy::BoundingBox);
    EXPECT_EQ(options.pipelineDepth, 3u);
    EXPECT_DOUBLE_EQ(options.frameTimeLimitSeconds, 0.3);
}

TEST(OptionsTest, EnvironmentPipelineDepthIsClamped) {
    const ScopedEnv depth("BIMVIEW_PIPELINE_DEPTH", "12");

    bimview::core::RenderOptions options;
    bimview::core::loadRenderOptionsFromEnvironment(options);
    EXPECT_EQ(options.pipelineDepth, bimview::core::kMaxPipelineDepth);
}
