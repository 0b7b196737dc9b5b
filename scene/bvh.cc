#include "scene/bvh.h"

#include "core/log.h"

#include <algorithm>

namespace bimview::scene {

void BoundingVolumeHierarchy::clear() {
    m_nodes.clear();
    m_sortedItems.clear();
    m_itemBounds.clear();
    m_worldBounds = {};
    m_valid = false;
}

void BoundingVolumeHierarchy::build(std::span<const Aabb> bounds) {
    clear();
    if (bounds.empty()) {
        return;
    }

    m_itemBounds.assign(bounds.begin(), bounds.end());
    m_sortedItems.resize(bounds.size());
    for (std::size_t i = 0; i < bounds.size(); ++i) {
        m_sortedItems[i] = static_cast<std::uint32_t>(i);
        m_worldBounds.expand(bounds[i]);
    }

    m_nodes.reserve(2 * (bounds.size() / kMaxLeafItems + 1));
    buildNode(0, m_sortedItems.size());
    m_valid = !m_nodes.empty();
    BIM_LOGD("bvh") << "built: primitives=" << bounds.size() << ", nodes=" << m_nodes.size();
}

bool BoundingVolumeHierarchy::valid() const {
    return m_valid;
}

std::size_t BoundingVolumeHierarchy::primitiveCount() const {
    return m_itemBounds.size();
}

const Aabb& BoundingVolumeHierarchy::worldBounds() const {
    return m_worldBounds;
}

const std::vector<BoundingVolumeHierarchy::Node>& BoundingVolumeHierarchy::nodes() const {
    return m_nodes;
}

void BoundingVolumeHierarchy::query(
    const Frustum& frustum,
    std::vector<std::uint32_t>& out,
    SpatialQueryStats* outStats
) const {
    out.clear();
    if (outStats != nullptr) {
        *outStats = SpatialQueryStats{};
    }
    if (!m_valid) {
        return;
    }

    std::vector<std::uint32_t> stack;
    stack.push_back(0u);
    while (!stack.empty()) {
        const std::uint32_t nodeIndex = stack.back();
        stack.pop_back();
        if (outStats != nullptr) {
            ++outStats->visitedNodeCount;
        }

        const Node& node = m_nodes[nodeIndex];
        if (!frustum.intersects(node.bounds)) {
            continue;
        }
        if (node.leaf) {
            for (std::uint32_t i = 0; i < node.itemCount; ++i) {
                const std::uint32_t item = m_sortedItems[node.firstItem + i];
                if (outStats != nullptr) {
                    ++outStats->testedPrimitiveCount;
                }
                if (frustum.intersects(m_itemBounds[item])) {
                    out.push_back(item);
                }
            }
        } else {
            stack.push_back(node.childA);
            stack.push_back(node.childB);
        }
    }

    std::sort(out.begin(), out.end());
    if (outStats != nullptr) {
        outStats->candidateCount = static_cast<std::uint32_t>(out.size());
    }
}

std::uint32_t BoundingVolumeHierarchy::buildNode(std::size_t begin, std::size_t count) {
    const std::uint32_t nodeIndex = static_cast<std::uint32_t>(m_nodes.size());
    m_nodes.push_back(Node{});

    Aabb nodeBounds{};
    for (std::size_t i = 0; i < count; ++i) {
        nodeBounds.expand(m_itemBounds[m_sortedItems[begin + i]]);
    }
    m_nodes[nodeIndex].bounds = nodeBounds;

    const auto makeLeaf = [&]() {
        Node& leaf = m_nodes[nodeIndex];
        leaf.leaf = true;
        leaf.firstItem = static_cast<std::uint32_t>(begin);
        leaf.itemCount = static_cast<std::uint32_t>(count);
        return nodeIndex;
    };

    if (count <= kMaxLeafItems || nodeBounds.isEmpty()) {
        return makeLeaf();
    }

    // Split along the longest axis of the item centres.
    Aabb centroidBounds{};
    for (std::size_t i = 0; i < count; ++i) {
        const Aabb& itemBounds = m_itemBounds[m_sortedItems[begin + i]];
        if (!itemBounds.isEmpty()) {
            centroidBounds.expand(itemBounds.center());
        }
    }
    const math::Vector3 extent = centroidBounds.extent();
    int splitAxis = 0;
    for (int axis = 1; axis < 3; ++axis) {
        if (extent[axis] > extent[splitAxis]) {
            splitAxis = axis;
        }
    }

    auto startIt = m_sortedItems.begin() + static_cast<std::ptrdiff_t>(begin);
    auto endIt = startIt + static_cast<std::ptrdiff_t>(count);
    std::stable_sort(startIt, endIt, [&](std::uint32_t lhsItem, std::uint32_t rhsItem) {
        const float lhsCenter = m_itemBounds[lhsItem].center()[splitAxis];
        const float rhsCenter = m_itemBounds[rhsItem].center()[splitAxis];
        if (lhsCenter != rhsCenter) {
            return lhsCenter < rhsCenter;
        }
        return lhsItem < rhsItem;
    });

    const std::size_t leftCount = count / 2u;
    const std::size_t rightCount = count - leftCount;
    const std::uint32_t childA = buildNode(begin, leftCount);
    const std::uint32_t childB = buildNode(begin + leftCount, rightCount);
    m_nodes[nodeIndex].leaf = false;
    m_nodes[nodeIndex].childA = childA;
    m_nodes[nodeIndex].childB = childB;
    return nodeIndex;
}

} // namespace bimview::scene
