#pragma once

#include "math/math.h"
#include "scene/bounds.h"

namespace bimview::core {

struct Camera {
    math::Vector3 position{0.0f, 0.0f, 3.0f};
    float yawDegrees = -90.0f;
    float pitchDegrees = 0.0f;
    float fovDegrees = 60.0f;
    float nearPlane = 0.1f;
    float farPlane = 2000.0f;
    float aspectRatio = 16.0f / 9.0f;

    [[nodiscard]] math::Vector3 forward() const;
    [[nodiscard]] math::Vector3 right() const;

    [[nodiscard]] math::Matrix4 viewMatrix() const;
    [[nodiscard]] math::Matrix4 projectionMatrix() const;
    [[nodiscard]] math::Matrix4 viewProjectionMatrix() const;
    [[nodiscard]] scene::Frustum frustum() const;

    // Points the camera at `target`, updating yaw and pitch.
    void lookAt(const math::Vector3& target);
};

} // namespace bimview::core
