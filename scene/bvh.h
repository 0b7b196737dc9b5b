#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "scene/bounds.h"

// Scene BoundingVolumeHierarchy subsystem
// Responsible for: broad-phase frustum lookup over instanced-mesh bounds.
// Should NOT do: visibility policy (thresholds, hidden state) or occlusion.
namespace bimview::scene {

struct SpatialQueryStats {
    std::uint32_t visitedNodeCount = 0;
    std::uint32_t testedPrimitiveCount = 0;
    std::uint32_t candidateCount = 0;
};

class BoundingVolumeHierarchy {
public:
    static constexpr std::size_t kMaxLeafItems = 8;

    struct Node {
        Aabb bounds{};
        std::uint32_t childA = 0;
        std::uint32_t childB = 0;
        std::uint32_t firstItem = 0;
        std::uint32_t itemCount = 0;
        bool leaf = false;
    };

    void clear();
    // Primitive i of the index is bounds[i]; queries return those indices.
    void build(std::span<const Aabb> bounds);

    [[nodiscard]] bool valid() const;
    [[nodiscard]] std::size_t primitiveCount() const;
    [[nodiscard]] const Aabb& worldBounds() const;
    [[nodiscard]] const std::vector<Node>& nodes() const;

    // Appends every primitive whose box is not fully outside one frustum plane,
    // sorted ascending. `out` is cleared first.
    void query(const Frustum& frustum, std::vector<std::uint32_t>& out, SpatialQueryStats* outStats = nullptr) const;

private:
    std::uint32_t buildNode(std::size_t begin, std::size_t count);

    std::vector<Node> m_nodes;
    std::vector<std::uint32_t> m_sortedItems;
    std::vector<Aabb> m_itemBounds;
    Aabb m_worldBounds{};
    bool m_valid = false;
};

} // namespace bimview::scene
