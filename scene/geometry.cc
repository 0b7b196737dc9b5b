#include "scene/geometry.h"

#include "core/log.h"

#include <algorithm>
#include <utility>

namespace bimview::scene {

const char* geometryStateName(GeometryState state) {
    switch (state) {
    case GeometryState::Unknown:
        return "unknown";
    case GeometryState::Loading:
        return "loading";
    case GeometryState::Indexing:
        return "indexing";
    case GeometryState::Ready:
        return "ready";
    case GeometryState::Error:
        return "error";
    }
    return "unknown";
}

bool GeometryStore::load(GeometryData data) {
    m_state.store(GeometryState::Loading);
    m_instancedMeshes.clear();
    m_instanceOrder.clear();
    m_instanceGroup.clear();
    m_hiddenCountPerGroup.clear();
    m_instanceById.clear();
    m_index.clear();
    m_maxSubmeshesPerMesh = 0;

    if (!validate(data)) {
        m_data = GeometryData{};
        m_state.store(GeometryState::Error);
        return false;
    }
    m_data = std::move(data);

    m_instanceById.reserve(m_data.instances.size());
    for (std::uint32_t i = 0; i < m_data.instances.size(); ++i) {
        const auto [it, inserted] = m_instanceById.emplace(m_data.instances[i].id, i);
        if (!inserted) {
            BIM_LOGW("geometry") << "duplicate instance id " << m_data.instances[i].id
                                 << " (instances " << it->second << " and " << i << "), lookups use the first";
        }
    }
    for (const Mesh& mesh : m_data.meshes) {
        m_maxSubmeshesPerMesh = std::max(m_maxSubmeshesPerMesh, mesh.submeshCount);
    }

    recomputeBounds();
    buildInstancedMeshes();
    rebuildIndex();

    const GeometryCounts c = counts();
    BIM_LOGI("geometry") << "ready: instances=" << c.instanceCount << ", meshes=" << c.meshCount
                         << ", submeshes=" << c.submeshCount << ", instancedMeshes=" << c.instancedMeshCount
                         << ", maxSubmeshesPerMesh=" << m_maxSubmeshesPerMesh;
    return true;
}

void GeometryStore::clear() {
    m_state.store(GeometryState::Unknown);
    m_data = GeometryData{};
    m_instancedMeshes.clear();
    m_instanceOrder.clear();
    m_instanceGroup.clear();
    m_hiddenCountPerGroup.clear();
    m_instanceById.clear();
    m_index.clear();
    m_maxSubmeshesPerMesh = 0;
    m_generation.fetch_add(1);
}

GeometryState GeometryStore::state() const {
    return m_state.load();
}

bool GeometryStore::isReady() const {
    return m_state.load() == GeometryState::Ready;
}

std::uint64_t GeometryStore::generation() const {
    return m_generation.load();
}

std::uint64_t GeometryStore::stateGeneration() const {
    return m_stateGeneration.load();
}

const BoundingVolumeHierarchy* GeometryStore::spatialIndex() const {
    return m_index.valid() ? &m_index : nullptr;
}

GeometryCounts GeometryStore::counts() const {
    GeometryCounts c;
    c.instanceCount = static_cast<std::uint32_t>(m_data.instances.size());
    c.meshCount = static_cast<std::uint32_t>(m_data.meshes.size());
    c.submeshCount = static_cast<std::uint32_t>(m_data.submeshes.size());
    c.instancedMeshCount = static_cast<std::uint32_t>(m_instancedMeshes.size());
    return c;
}

std::uint32_t GeometryStore::groupOfInstance(std::uint32_t instanceIndex) const {
    if (instanceIndex >= m_instanceGroup.size()) {
        return kNoGroup;
    }
    return m_instanceGroup[instanceIndex];
}

bool GeometryStore::isGroupHidden(std::uint32_t group) const {
    if (group >= m_instancedMeshes.size()) {
        return false;
    }
    return m_hiddenCountPerGroup[group] >= m_instancedMeshes[group].instanceCount;
}

bool GeometryStore::isGroupTransparent(std::uint32_t group) const {
    return group < m_instancedMeshes.size() && m_instancedMeshes[group].transparent;
}

std::optional<std::uint32_t> GeometryStore::findInstance(std::uint32_t instanceId) const {
    const auto it = m_instanceById.find(instanceId);
    if (it == m_instanceById.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool GeometryStore::setInstanceState(std::uint32_t instanceId, InstanceState state) {
    const std::optional<std::uint32_t> index = findInstance(instanceId);
    if (!index.has_value()) {
        BIM_LOGW("geometry") << "setInstanceState: unknown instance id " << instanceId;
        return false;
    }
    Instance& instance = m_data.instances[*index];
    if (instance.state == state) {
        return true;
    }
    const bool wasHidden = instance.state == InstanceState::Hidden;
    const bool isHidden = state == InstanceState::Hidden;
    instance.state = state;

    const std::uint32_t group = groupOfInstance(*index);
    if (group != kNoGroup && wasHidden != isHidden) {
        if (isHidden) {
            ++m_hiddenCountPerGroup[group];
        } else {
            --m_hiddenCountPerGroup[group];
        }
    }
    m_stateGeneration.fetch_add(1);
    return true;
}

bool GeometryStore::setInstanceTransform(std::uint32_t instanceId, const math::Matrix4& transform) {
    if (m_state.load() != GeometryState::Ready) {
        BIM_LOGW("geometry") << "setInstanceTransform while geometry is "
                             << geometryStateName(m_state.load());
        return false;
    }
    const std::optional<std::uint32_t> index = findInstance(instanceId);
    if (!index.has_value()) {
        BIM_LOGW("geometry") << "setInstanceTransform: unknown instance id " << instanceId;
        return false;
    }
    m_data.instances[*index].transform = transform;
    recomputeBounds();
    for (InstancedMesh& group : m_instancedMeshes) {
        group.bounds = Aabb{};
        for (std::uint32_t k = 0; k < group.instanceCount; ++k) {
            group.bounds.expand(m_data.instances[m_instanceOrder[group.baseInstance + k]].bounds);
        }
    }
    rebuildIndex();
    return true;
}

void GeometryStore::queryGroups(
    const Frustum& frustum,
    std::vector<std::uint32_t>& out,
    SpatialQueryStats* outStats
) const {
    out.clear();
    const BoundingVolumeHierarchy* index = spatialIndex();
    if (index == nullptr) {
        out.resize(m_instancedMeshes.size());
        for (std::uint32_t group = 0; group < out.size(); ++group) {
            out[group] = group;
        }
        if (outStats != nullptr) {
            *outStats = SpatialQueryStats{};
            outStats->candidateCount = static_cast<std::uint32_t>(out.size());
        }
        return;
    }

    std::vector<std::uint32_t> hitInstances;
    index->query(frustum, hitInstances, outStats);
    out.reserve(hitInstances.size());
    for (const std::uint32_t instanceIndex : hitInstances) {
        const std::uint32_t group = m_instanceGroup[instanceIndex];
        if (group != kNoGroup) {
            out.push_back(group);
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    if (outStats != nullptr) {
        outStats->candidateCount = static_cast<std::uint32_t>(out.size());
    }
}

bool GeometryStore::validate(const GeometryData& data) const {
    if (data.positions.size() % 3 != 0) {
        BIM_LOGE("geometry") << "position buffer is not xyz triples (" << data.positions.size() << " floats)";
        return false;
    }
    for (std::size_t i = 0; i < data.meshes.size(); ++i) {
        const Mesh& mesh = data.meshes[i];
        if (static_cast<std::size_t>(mesh.submeshBegin) + mesh.submeshCount > data.submeshes.size()) {
            BIM_LOGE("geometry") << "mesh " << i << " submesh range [" << mesh.submeshBegin << ", +"
                                 << mesh.submeshCount << ") exceeds " << data.submeshes.size() << " submeshes";
            return false;
        }
    }
    for (std::size_t i = 0; i < data.submeshes.size(); ++i) {
        const Submesh& submesh = data.submeshes[i];
        if (static_cast<std::uint64_t>(submesh.indexOffset) + submesh.indexCount > data.indices.size()) {
            BIM_LOGE("geometry") << "submesh " << i << " index range exceeds index buffer (" << data.indices.size() << ")";
            return false;
        }
        if (submesh.material >= data.materials.size()) {
            BIM_LOGE("geometry") << "submesh " << i << " references missing material " << submesh.material;
            return false;
        }
    }
    for (std::size_t i = 0; i < data.instances.size(); ++i) {
        const std::int32_t meshIndex = data.instances[i].meshIndex;
        if (meshIndex != kNoMesh && (meshIndex < 0 || static_cast<std::size_t>(meshIndex) >= data.meshes.size())) {
            BIM_LOGE("geometry") << "instance " << i << " references missing mesh " << meshIndex;
            return false;
        }
    }
    return true;
}

void GeometryStore::recomputeBounds() {
    for (Instance& instance : m_data.instances) {
        if (instance.meshIndex == kNoMesh) {
            instance.bounds = Aabb{};
            continue;
        }
        const Mesh& mesh = m_data.meshes[static_cast<std::size_t>(instance.meshIndex)];
        instance.bounds = transformBounds(mesh.localBounds, instance.transform);
    }
}

void GeometryStore::buildInstancedMeshes() {
    const std::size_t meshCount = m_data.meshes.size();
    std::vector<std::vector<std::uint32_t>> instancesPerMesh(meshCount);
    for (std::uint32_t i = 0; i < m_data.instances.size(); ++i) {
        const std::int32_t meshIndex = m_data.instances[i].meshIndex;
        if (meshIndex != kNoMesh) {
            instancesPerMesh[static_cast<std::size_t>(meshIndex)].push_back(i);
        }
    }

    std::vector<bool> meshTransparent(meshCount, false);
    std::vector<std::uint32_t> meshOrder;
    for (std::uint32_t meshIndex = 0; meshIndex < meshCount; ++meshIndex) {
        if (instancesPerMesh[meshIndex].empty()) {
            continue;
        }
        const Mesh& mesh = m_data.meshes[meshIndex];
        for (std::uint32_t s = 0; s < mesh.submeshCount; ++s) {
            const Submesh& submesh = m_data.submeshes[mesh.submeshBegin + s];
            if (m_data.materials[submesh.material].transparent) {
                meshTransparent[meshIndex] = true;
                break;
            }
        }
        meshOrder.push_back(meshIndex);
    }
    // Opaque groups first so they fill depth before transparent ones blend.
    std::stable_partition(meshOrder.begin(), meshOrder.end(), [&](std::uint32_t meshIndex) {
        return !meshTransparent[meshIndex];
    });

    m_instanceGroup.assign(m_data.instances.size(), kNoGroup);
    m_instanceOrder.reserve(m_data.instances.size());
    m_instancedMeshes.reserve(meshOrder.size());
    for (const std::uint32_t meshIndex : meshOrder) {
        const std::uint32_t group = static_cast<std::uint32_t>(m_instancedMeshes.size());
        InstancedMesh instanced;
        instanced.meshIndex = meshIndex;
        instanced.baseInstance = static_cast<std::uint32_t>(m_instanceOrder.size());
        instanced.instanceCount = static_cast<std::uint32_t>(instancesPerMesh[meshIndex].size());
        instanced.transparent = meshTransparent[meshIndex];
        for (const std::uint32_t instanceIndex : instancesPerMesh[meshIndex]) {
            m_instanceOrder.push_back(instanceIndex);
            m_instanceGroup[instanceIndex] = group;
            instanced.bounds.expand(m_data.instances[instanceIndex].bounds);
        }
        m_instancedMeshes.push_back(instanced);
    }

    m_hiddenCountPerGroup.assign(m_instancedMeshes.size(), 0);
    for (std::uint32_t i = 0; i < m_data.instances.size(); ++i) {
        const std::uint32_t group = m_instanceGroup[i];
        if (group != kNoGroup && m_data.instances[i].state == InstanceState::Hidden) {
            ++m_hiddenCountPerGroup[group];
        }
    }
}

void GeometryStore::rebuildIndex() {
    m_state.store(GeometryState::Indexing);
    std::vector<Aabb> bounds;
    bounds.reserve(m_data.instances.size());
    for (const Instance& instance : m_data.instances) {
        bounds.push_back(instance.bounds);
    }
    m_index.build(bounds);
    m_generation.fetch_add(1);
    m_state.store(GeometryState::Ready);
}

} // namespace bimview::scene
