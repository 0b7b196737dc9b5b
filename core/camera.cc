#include "core/camera.h"

#include <algorithm>
#include <cmath>

namespace bimview::core {
namespace {

constexpr math::Vector3 kWorldUp{0.0f, 1.0f, 0.0f};

} // namespace

math::Vector3 Camera::forward() const {
    const float yaw = math::radians(yawDegrees);
    const float pitch = math::radians(std::clamp(pitchDegrees, -89.0f, 89.0f));
    const float cp = std::cos(pitch);
    return math::normalize(math::Vector3{std::cos(yaw) * cp, std::sin(pitch), std::sin(yaw) * cp});
}

math::Vector3 Camera::right() const {
    return math::normalize(math::cross(forward(), kWorldUp));
}

math::Matrix4 Camera::viewMatrix() const {
    return math::lookDirection(position, forward(), kWorldUp);
}

math::Matrix4 Camera::projectionMatrix() const {
    return math::perspectiveVulkan(math::radians(fovDegrees), aspectRatio, nearPlane, farPlane);
}

math::Matrix4 Camera::viewProjectionMatrix() const {
    return projectionMatrix() * viewMatrix();
}

scene::Frustum Camera::frustum() const {
    return scene::frustumFromViewProjection(viewProjectionMatrix());
}

void Camera::lookAt(const math::Vector3& target) {
    const math::Vector3 dir = math::normalize(target - position);
    if (math::length(dir) <= 0.0f) {
        return;
    }
    pitchDegrees = std::asin(std::clamp(dir.y, -1.0f, 1.0f)) * (180.0f / math::kPi);
    yawDegrees = std::atan2(dir.z, dir.x) * (180.0f / math::kPi);
}

} // namespace bimview::core
