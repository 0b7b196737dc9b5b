#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

#include "core/camera.h"
#include "core/options.h"
#include "render/command_generation.h"
#include "render/depth_pyramid.h"
#include "render/gpu_scene.h"
#include "scene/geometry.h"
#include "scene/synthetic_scene.h"

namespace {

using bimview::render::CommandGenerationInput;
using bimview::render::DrawIndexedCommand;
using bimview::render::InvocationOutcome;

// Cube row at x = 0 and x = 3, seen head-on from z = 20.
class CommandGenerationTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::array<std::uint32_t, 2> submeshCounts{3u, 5u};
        ASSERT_TRUE(m_geometry.load(bimview::scene::makeCubeRow(submeshCounts, 3.0f)));
        m_tables = bimview::render::buildGpuSceneTables(m_geometry);
        m_camera.position = bimview::math::Vector3{1.5f, 0.0f, 20.0f};
    }

    CommandGenerationInput MakeInput(bimview::render::DepthPyramidExtent depth = {}) {
        CommandGenerationInput input;
        input.groups = m_tables.groups;
        input.meshes = m_tables.meshes;
        input.submeshes = m_tables.submeshes;
        input.uniforms = bimview::render::makeFrameUniforms(
            m_camera,
            bimview::render::ViewportSize{},
            m_options,
            static_cast<std::uint32_t>(m_tables.groups.size()),
            m_tables.maxSubmeshesPerMesh,
            depth);
        return input;
    }

    bimview::scene::GeometryStore m_geometry;
    bimview::render::GpuSceneTables m_tables;
    bimview::core::Camera m_camera;
    bimview::core::RenderOptions m_options;
};

} // namespace

TEST(CommandGenerationDispatchTest, DispatchCoversEveryGroupAndSubmeshSlot) {
    const bimview::render::DispatchSize size = bimview::render::computeDispatchSize(100, 4);
    EXPECT_EQ(size.invocationsX, 100u);
    EXPECT_EQ(size.invocationsY, 4u);
    EXPECT_EQ(size.groupCountX, 2u);
    EXPECT_EQ(size.groupCountY, 4u);
    EXPECT_FALSE(size.empty());

    EXPECT_TRUE(bimview::render::computeDispatchSize(0, 4).empty());
    EXPECT_TRUE(bimview::render::computeDispatchSize(10, 0).empty());
}

TEST(CommandGenerationDispatchTest, CommandListCapacityLimitsEncodableGroups) {
    EXPECT_EQ(bimview::render::encodableGroupCount(30000, 3), bimview::render::kMaxCommandCount / 3);
    EXPECT_EQ(bimview::render::encodableGroupCount(10, 3), 10u);
    EXPECT_EQ(bimview::render::encodableGroupCount(10, 0), 0u);
    EXPECT_EQ(bimview::render::commandSlot(2, 1, 5), 11u);
}

TEST(CommandGenerationDispatchTest, UniformCapacityMatchesTheClampedCommandList) {
    constexpr std::uint32_t kGroups = 30000;
    constexpr std::uint32_t kSubmeshes = 3;
    const bimview::render::GpuFrameUniforms uniforms = bimview::render::makeFrameUniforms(
        bimview::core::Camera{},
        bimview::render::ViewportSize{},
        bimview::core::RenderOptions{},
        kGroups,
        kSubmeshes,
        bimview::render::DepthPyramidExtent{});

    const std::uint32_t encodable = bimview::render::encodableGroupCount(kGroups, kSubmeshes);
    EXPECT_EQ(uniforms.commandCapacity, encodable * kSubmeshes);
    EXPECT_LE(uniforms.commandCapacity, bimview::render::kMaxCommandCount);

    // The dispatch is rounded up to whole thread groups; the kernel's group
    // bound has to stop at the last encodable group.
    const bimview::render::DispatchSize dispatch = bimview::render::computeDispatchSize(kGroups, kSubmeshes);
    EXPECT_GT(dispatch.groupCountX * bimview::render::kEncodeThreadGroupSizeX, dispatch.invocationsX);
    EXPECT_EQ(uniforms.commandCapacity / uniforms.maxSubmeshesPerMesh, dispatch.invocationsX);
    const std::uint32_t lastGroup = dispatch.invocationsX - 1;
    EXPECT_LT(bimview::render::commandSlot(lastGroup, kSubmeshes - 1, kSubmeshes), uniforms.commandCapacity);
}

TEST_F(CommandGenerationTest, OnlyExistingSubmeshSlotsRecordCommands) {
    const CommandGenerationInput input = MakeInput();
    ASSERT_EQ(input.uniforms.maxSubmeshesPerMesh, 5u);

    std::uint32_t recorded = 0;
    for (std::uint32_t slot = 0; slot < 5; ++slot) {
        DrawIndexedCommand command;
        const InvocationOutcome outcome = bimview::render::encodeInvocation(input, 0, slot, command);
        if (outcome == InvocationOutcome::Recorded) {
            ++recorded;
            EXPECT_GT(command.indexCount, 0u);
        } else {
            EXPECT_EQ(outcome, InvocationOutcome::NoSubmesh);
            EXPECT_EQ(command.instanceCount, 0u);
        }
    }
    EXPECT_EQ(recorded, 3u);
}

TEST_F(CommandGenerationTest, ReferenceEncoderFillsTheCommandGrid) {
    bimview::render::CommandList list;
    bimview::render::encodeCommandsReference(MakeInput(), list);

    EXPECT_EQ(list.groupCount, 2u);
    EXPECT_EQ(list.maxSubmeshesPerMesh, 5u);
    ASSERT_EQ(list.commands.size(), 10u);
    EXPECT_EQ(list.recordedCount(), 8u);
    EXPECT_EQ(list.executed, (std::vector<std::uint32_t>{1u, 1u}));

    const bimview::scene::InstancedMesh& group = m_geometry.instancedMeshes()[1];
    const bimview::scene::Mesh& mesh = m_geometry.meshes()[group.meshIndex];
    const bimview::scene::Submesh& submesh = m_geometry.submeshes()[mesh.submeshBegin + 4];
    const DrawIndexedCommand& command = list.commands[bimview::render::commandSlot(1, 4, 5)];
    EXPECT_EQ(command.indexCount, submesh.indexCount);
    EXPECT_EQ(command.firstIndex, submesh.indexOffset);
    EXPECT_EQ(command.vertexOffset, submesh.vertexOffset);
    EXPECT_EQ(command.instanceCount, group.instanceCount);
    EXPECT_EQ(command.firstInstance, group.baseInstance);

    // Group 0 has three submeshes; slots 3 and 4 stay empty.
    EXPECT_EQ(list.commands[bimview::render::commandSlot(0, 3, 5)].instanceCount, 0u);
    EXPECT_EQ(list.commands[bimview::render::commandSlot(0, 4, 5)].instanceCount, 0u);
}

TEST_F(CommandGenerationTest, GroupFlagsSkipHiddenAndNonCandidateGroups) {
    ASSERT_TRUE(m_geometry.setInstanceState(100, bimview::scene::InstanceState::Hidden));
    const std::vector<std::uint32_t> candidates{0u};
    bimview::render::refreshGroupFlags(m_geometry, candidates, m_tables.groups);
    EXPECT_NE(m_tables.groups[0].flags & bimview::render::kGpuGroupHidden, 0u);
    EXPECT_NE(m_tables.groups[1].flags & bimview::render::kGpuGroupNotCandidate, 0u);

    const CommandGenerationInput input = MakeInput();
    EXPECT_EQ(bimview::render::evaluateGroup(input, 0), InvocationOutcome::Hidden);
    EXPECT_EQ(bimview::render::evaluateGroup(input, 1), InvocationOutcome::NotCandidate);
    EXPECT_EQ(bimview::render::evaluateGroup(input, 2), InvocationOutcome::OutOfRange);

    bimview::render::CommandList list;
    bimview::render::encodeCommandsReference(input, list);
    EXPECT_EQ(list.recordedCount(), 0u);
    EXPECT_EQ(list.executed, (std::vector<std::uint32_t>{0u, 0u}));
}

TEST_F(CommandGenerationTest, GroupsBehindTheCameraAreFrustumCulled) {
    m_camera.yawDegrees = 90.0f;
    const CommandGenerationInput input = MakeInput();
    EXPECT_EQ(bimview::render::evaluateGroup(input, 0), InvocationOutcome::FrustumCulled);
    EXPECT_EQ(bimview::render::evaluateGroup(input, 1), InvocationOutcome::FrustumCulled);
}

TEST_F(CommandGenerationTest, ContributionThresholdCullsSmallGroups) {
    m_options.minContributionPixels = 1.0e6f;
    EXPECT_EQ(bimview::render::evaluateGroup(MakeInput(), 0), InvocationOutcome::ContributionCulled);

    m_options.enableContributionTesting = false;
    EXPECT_EQ(bimview::render::evaluateGroup(MakeInput(), 0), InvocationOutcome::Recorded);
}

TEST_F(CommandGenerationTest, PreviousDepthCullsOccludedGroups) {
    const bimview::render::ViewportSize viewport;
    bimview::render::DepthPyramid pyramid;
    ASSERT_TRUE(pyramid.fill(viewport.width, viewport.height, 0.0f));

    CommandGenerationInput input = MakeInput(pyramid.extent());
    EXPECT_NE(input.uniforms.cullFlags & bimview::render::kGpuCullDepthPyramid, 0u);
    input.depth = &pyramid;
    EXPECT_EQ(bimview::render::evaluateGroup(input, 0), InvocationOutcome::DepthCulled);

    m_options.depthTestStrategy = bimview::core::DepthTestStrategy::BoundingBox;
    input = MakeInput(pyramid.extent());
    input.depth = &pyramid;
    EXPECT_NE(input.uniforms.cullFlags & bimview::render::kGpuCullDepthBoundingBox, 0u);
    EXPECT_EQ(bimview::render::evaluateGroup(input, 1), InvocationOutcome::DepthCulled);

    ASSERT_TRUE(pyramid.fill(viewport.width, viewport.height, 1.0f));
    EXPECT_EQ(bimview::render::evaluateGroup(input, 1), InvocationOutcome::Recorded);
}

TEST_F(CommandGenerationTest, DepthFlagsNeedAPyramid) {
    const CommandGenerationInput input = MakeInput();
    EXPECT_EQ(input.uniforms.cullFlags & (bimview::render::kGpuCullDepthPyramid | bimview::render::kGpuCullDepthBoundingBox), 0u);
    EXPECT_NE(input.uniforms.cullFlags & bimview::render::kGpuCullFrustum, 0u);
    EXPECT_EQ(input.uniforms.commandCapacity, 10u);
}
