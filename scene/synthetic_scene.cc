#include "scene/synthetic_scene.h"

#include <algorithm>
#include <array>

namespace bimview::scene {
namespace {

constexpr std::array<float, 24> kCubePositions = {
    -0.5f, -0.5f, -0.5f,
     0.5f, -0.5f, -0.5f,
    -0.5f,  0.5f, -0.5f,
     0.5f,  0.5f, -0.5f,
    -0.5f, -0.5f,  0.5f,
     0.5f, -0.5f,  0.5f,
    -0.5f,  0.5f,  0.5f,
     0.5f,  0.5f,  0.5f
};

// Corner indices follow Aabb::corner bit order; counter-clockwise from outside.
constexpr std::array<std::uint32_t, 36> kCubeIndices = {
    0, 2, 1, 1, 2, 3, // -z
    4, 5, 6, 5, 7, 6, // +z
    0, 4, 2, 2, 4, 6, // -x
    1, 3, 5, 3, 7, 5, // +x
    0, 1, 4, 1, 5, 4, // -y
    2, 6, 3, 3, 6, 7  // +y
};

// Appends a cube mesh whose 36 indices are split across `submeshCount` submeshes
// of whole triangles. Returns the new mesh index.
std::uint32_t appendCubeMesh(GeometryData& data, std::uint32_t submeshCount, std::uint32_t material) {
    const std::int32_t vertexOffset = static_cast<std::int32_t>(data.positions.size() / 3);
    data.positions.insert(data.positions.end(), kCubePositions.begin(), kCubePositions.end());

    const std::uint32_t indexOffset = static_cast<std::uint32_t>(data.indices.size());
    data.indices.insert(data.indices.end(), kCubeIndices.begin(), kCubeIndices.end());

    constexpr std::uint32_t kTriangleCount = static_cast<std::uint32_t>(kCubeIndices.size() / 3);
    submeshCount = std::clamp<std::uint32_t>(submeshCount, 1u, kTriangleCount);

    Mesh mesh;
    mesh.submeshBegin = static_cast<std::uint32_t>(data.submeshes.size());
    mesh.submeshCount = submeshCount;
    mesh.localBounds.min = math::Vector3{-0.5f, -0.5f, -0.5f};
    mesh.localBounds.max = math::Vector3{0.5f, 0.5f, 0.5f};

    std::uint32_t firstTriangle = 0;
    for (std::uint32_t s = 0; s < submeshCount; ++s) {
        const std::uint32_t lastTriangle = ((s + 1) * kTriangleCount) / submeshCount;
        Submesh submesh;
        submesh.indexOffset = indexOffset + firstTriangle * 3;
        submesh.indexCount = (lastTriangle - firstTriangle) * 3;
        submesh.vertexOffset = vertexOffset;
        submesh.material = material;
        data.submeshes.push_back(submesh);
        firstTriangle = lastTriangle;
    }

    data.meshes.push_back(mesh);
    return static_cast<std::uint32_t>(data.meshes.size() - 1);
}

std::uint32_t nextRandom(std::uint32_t& state) {
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

} // namespace

GeometryData makeSyntheticBuilding(const SyntheticBuildingParams& params) {
    GeometryData data;
    data.materials.push_back(Material{{0.8f, 0.8f, 0.78f, 1.0f}, false});
    data.materials.push_back(Material{{0.55f, 0.7f, 0.85f, 0.35f}, true});

    std::uint32_t rng = params.seed == 0 ? 1u : params.seed;
    const std::uint32_t variants = std::max(1u, params.meshVariants);
    std::vector<math::Vector3> variantScale;
    for (std::uint32_t v = 0; v < variants; ++v) {
        const bool glazing = params.transparentEvery != 0 && (v % params.transparentEvery) == params.transparentEvery - 1;
        const std::uint32_t submeshCount = 1 + (nextRandom(rng) % 4);
        appendCubeMesh(data, submeshCount, glazing ? 1u : 0u);
        const float sx = 0.5f + static_cast<float>(nextRandom(rng) % 100) * 0.03f;
        const float sy = 0.5f + static_cast<float>(nextRandom(rng) % 100) * 0.02f;
        const float sz = 0.5f + static_cast<float>(nextRandom(rng) % 100) * 0.03f;
        variantScale.push_back(math::Vector3{sx, sy, sz});
    }

    std::uint32_t nextId = 1;
    for (std::uint32_t floor = 0; floor < params.floors; ++floor) {
        for (std::uint32_t gx = 0; gx < params.gridX; ++gx) {
            for (std::uint32_t gz = 0; gz < params.gridZ; ++gz) {
                const std::uint32_t variant = nextRandom(rng) % variants;
                const math::Vector3 position{
                    static_cast<float>(gx) * params.spacing,
                    static_cast<float>(floor) * params.floorHeight + variantScale[variant].y * 0.5f,
                    static_cast<float>(gz) * params.spacing
                };
                Instance instance;
                instance.id = nextId++;
                instance.meshIndex = static_cast<std::int32_t>(variant);
                instance.transform = math::Matrix4::translation(position) * math::Matrix4::scale(variantScale[variant]);
                data.instances.push_back(instance);
            }
        }
    }
    return data;
}

GeometryData makeCubeRow(std::span<const std::uint32_t> submeshCounts, float spacing) {
    GeometryData data;
    data.materials.push_back(Material{});
    for (std::uint32_t i = 0; i < submeshCounts.size(); ++i) {
        appendCubeMesh(data, submeshCounts[i], 0u);
        Instance instance;
        instance.id = 100 + i;
        instance.meshIndex = static_cast<std::int32_t>(i);
        instance.transform = math::Matrix4::translation(math::Vector3{spacing * static_cast<float>(i), 0.0f, 0.0f});
        data.instances.push_back(instance);
    }
    return data;
}

} // namespace bimview::scene
