#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "math/math.h"
#include "scene/bounds.h"
#include "scene/bvh.h"

// Scene GeometryStore subsystem
// Responsible for: instance/mesh records, instanced-mesh grouping, world bounds and the spatial index.
// Should NOT do: file parsing or any GPU work.
namespace bimview::scene {

enum class InstanceState : std::uint32_t {
    Default = 0,
    Hidden = 1,
    Selected = 2
};

enum class GeometryState : std::uint8_t {
    Unknown = 0,
    Loading,
    Indexing,
    Ready,
    Error
};

[[nodiscard]] const char* geometryStateName(GeometryState state);

constexpr std::int32_t kNoMesh = -1;
constexpr std::uint32_t kNoGroup = 0xFFFFFFFFu;

struct Instance {
    std::uint32_t id = 0;
    std::int32_t meshIndex = kNoMesh;
    math::Matrix4 transform{};
    // World space, recomputed from the mesh's local bounds.
    Aabb bounds{};
    InstanceState state = InstanceState::Default;
};

struct Submesh {
    std::uint32_t indexOffset = 0;
    std::uint32_t indexCount = 0;
    std::int32_t vertexOffset = 0;
    std::uint32_t material = 0;
};

struct Mesh {
    std::uint32_t submeshBegin = 0;
    std::uint32_t submeshCount = 0;
    Aabb localBounds{};
};

struct Material {
    std::array<float, 4> color{1.0f, 1.0f, 1.0f, 1.0f};
    bool transparent = false;
};

struct InstancedMesh {
    std::uint32_t meshIndex = 0;
    std::uint32_t baseInstance = 0;
    std::uint32_t instanceCount = 0;
    bool transparent = false;
    Aabb bounds{};
};

// Everything the scene parser hands over on load.
struct GeometryData {
    std::vector<Instance> instances;
    std::vector<Mesh> meshes;
    std::vector<Submesh> submeshes;
    std::vector<Material> materials;
    // Interleaved xyz positions and the shared index buffer.
    std::vector<float> positions;
    std::vector<std::uint32_t> indices;
};

struct GeometryCounts {
    std::uint32_t instanceCount = 0;
    std::uint32_t meshCount = 0;
    std::uint32_t submeshCount = 0;
    std::uint32_t instancedMeshCount = 0;
};

class GeometryStore {
public:
    GeometryStore() = default;
    GeometryStore(const GeometryStore&) = delete;
    GeometryStore& operator=(const GeometryStore&) = delete;

    // Validates, computes world bounds, groups instances and builds the spatial index.
    // Publishes Ready on success; on failure the store is left in Error with no groups.
    bool load(GeometryData data);
    void clear();

    [[nodiscard]] GeometryState state() const;
    [[nodiscard]] bool isReady() const;
    // Bumped on every successful load or re-index.
    [[nodiscard]] std::uint64_t generation() const;
    // Bumped whenever an instance's hide/select state changes.
    [[nodiscard]] std::uint64_t stateGeneration() const;

    [[nodiscard]] const std::vector<Instance>& instances() const { return m_data.instances; }
    [[nodiscard]] const std::vector<Mesh>& meshes() const { return m_data.meshes; }
    [[nodiscard]] const std::vector<Submesh>& submeshes() const { return m_data.submeshes; }
    [[nodiscard]] const std::vector<Material>& materials() const { return m_data.materials; }
    [[nodiscard]] const std::vector<float>& positions() const { return m_data.positions; }
    [[nodiscard]] const std::vector<std::uint32_t>& indices() const { return m_data.indices; }
    [[nodiscard]] const std::vector<InstancedMesh>& instancedMeshes() const { return m_instancedMeshes; }
    // instanceOrder()[baseInstance + k] is the instance index drawn at that position.
    [[nodiscard]] const std::vector<std::uint32_t>& instanceOrder() const { return m_instanceOrder; }
    // nullptr until the index has been built for the current geometry.
    [[nodiscard]] const BoundingVolumeHierarchy* spatialIndex() const;

    [[nodiscard]] GeometryCounts counts() const;
    [[nodiscard]] std::uint32_t maxSubmeshesPerMesh() const { return m_maxSubmeshesPerMesh; }
    [[nodiscard]] std::uint32_t groupOfInstance(std::uint32_t instanceIndex) const;
    [[nodiscard]] bool isGroupHidden(std::uint32_t group) const;
    [[nodiscard]] bool isGroupTransparent(std::uint32_t group) const;
    [[nodiscard]] std::optional<std::uint32_t> findInstance(std::uint32_t instanceId) const;

    bool setInstanceState(std::uint32_t instanceId, InstanceState state);
    // Moving an instance invalidates bounds; the store re-indexes before returning.
    bool setInstanceTransform(std::uint32_t instanceId, const math::Matrix4& transform);

    // Appends the groups hit by the frustum, sorted and without duplicates.
    // Falls back to every group when no index has been built.
    void queryGroups(const Frustum& frustum, std::vector<std::uint32_t>& out, SpatialQueryStats* outStats = nullptr) const;

private:
    bool validate(const GeometryData& data) const;
    void recomputeBounds();
    void buildInstancedMeshes();
    void rebuildIndex();

    std::atomic<GeometryState> m_state{GeometryState::Unknown};
    std::atomic<std::uint64_t> m_generation{0};
    std::atomic<std::uint64_t> m_stateGeneration{0};
    GeometryData m_data;
    std::vector<InstancedMesh> m_instancedMeshes;
    std::vector<std::uint32_t> m_instanceOrder;
    std::vector<std::uint32_t> m_instanceGroup;
    std::vector<std::uint32_t> m_hiddenCountPerGroup;
    std::unordered_map<std::uint32_t, std::uint32_t> m_instanceById;
    BoundingVolumeHierarchy m_index;
    std::uint32_t m_maxSubmeshesPerMesh = 0;
};

} // namespace bimview::scene
