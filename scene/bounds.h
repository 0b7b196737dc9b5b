#pragma once

#include "math/math.h"

#include <array>
#include <cstdint>
#include <limits>

namespace bimview::scene {

struct Aabb {
    math::Vector3 min{
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::max()
    };
    math::Vector3 max{
        std::numeric_limits<float>::lowest(),
        std::numeric_limits<float>::lowest(),
        std::numeric_limits<float>::lowest()
    };

    [[nodiscard]] bool isEmpty() const {
        return min.x > max.x || min.y > max.y || min.z > max.z;
    }

    [[nodiscard]] math::Vector3 center() const {
        return (min + max) * 0.5f;
    }

    [[nodiscard]] math::Vector3 extent() const {
        return max - min;
    }

    void expand(const math::Vector3& point) {
        min = math::min(min, point);
        max = math::max(max, point);
    }

    void expand(const Aabb& other) {
        if (other.isEmpty()) {
            return;
        }
        min = math::min(min, other.min);
        max = math::max(max, other.max);
    }

    // Corner i selects max on axis a when bit a of i is set.
    [[nodiscard]] math::Vector3 corner(uint32_t i) const {
        return math::Vector3{
            (i & 1u) != 0 ? max.x : min.x,
            (i & 2u) != 0 ? max.y : min.y,
            (i & 4u) != 0 ? max.z : min.z
        };
    }
};

[[nodiscard]] Aabb transformBounds(const Aabb& local, const math::Matrix4& transform);

// ax + by + cz + d >= 0 is inside.
struct Plane {
    math::Vector3 normal{};
    float distance = 0.0f;

    [[nodiscard]] float signedDistance(const math::Vector3& point) const {
        return math::dot(normal, point) + distance;
    }
};

enum class FrustumPlane : uint8_t {
    Left = 0,
    Right,
    Bottom,
    Top,
    Near,
    Far
};

struct Frustum {
    std::array<Plane, 6> planes{};

    // Conservative test: the box is outside only when all eight corners are
    // behind one plane. May report boxes near frustum edges as inside.
    [[nodiscard]] bool intersects(const Aabb& box) const {
        if (box.isEmpty()) {
            return false;
        }
        for (const Plane& plane : planes) {
            uint32_t outside = 0;
            for (uint32_t i = 0; i < 8; ++i) {
                if (plane.signedDistance(box.corner(i)) < 0.0f) {
                    ++outside;
                }
            }
            if (outside == 8) {
                return false;
            }
        }
        return true;
    }
};

// Extracts inward-facing planes from a Vulkan-convention (depth [0, 1]) clip transform.
[[nodiscard]] Frustum frustumFromViewProjection(const math::Matrix4& viewProjection);

} // namespace bimview::scene
