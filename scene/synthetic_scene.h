#pragma once

#include <cstdint>
#include <span>

#include "scene/geometry.h"

namespace bimview::scene {

// A floor-by-floor lattice of boxes standing in for a parsed building model.
struct SyntheticBuildingParams {
    std::uint32_t floors = 4;
    std::uint32_t gridX = 8;
    std::uint32_t gridZ = 8;
    float spacing = 6.0f;
    float floorHeight = 3.5f;
    // Distinct meshes; instances cycle through them.
    std::uint32_t meshVariants = 16;
    // Every n-th variant uses a transparent material (glazing); 0 disables.
    std::uint32_t transparentEvery = 5;
    std::uint32_t seed = 1;
};

[[nodiscard]] GeometryData makeSyntheticBuilding(const SyntheticBuildingParams& params);

// One unit cube mesh per entry, each with `submeshCounts[i]` submeshes, and
// one instance per mesh translated along +x by `spacing * i`.
[[nodiscard]] GeometryData makeCubeRow(std::span<const std::uint32_t> submeshCounts, float spacing);

} // namespace bimview::scene
