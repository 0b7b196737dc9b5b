#include "scene/bounds.h"

namespace bimview::scene {
namespace {

Plane makePlane(const math::Vector4& coefficients) {
    const math::Vector3 normal{coefficients.x, coefficients.y, coefficients.z};
    const float len = math::length(normal);
    if (len <= 0.0f) {
        return Plane{};
    }
    return Plane{normal / len, coefficients.w / len};
}

} // namespace

Aabb transformBounds(const Aabb& local, const math::Matrix4& transform) {
    Aabb result;
    if (local.isEmpty()) {
        return result;
    }
    for (uint32_t i = 0; i < 8; ++i) {
        result.expand(math::transformPoint(transform, local.corner(i)));
    }
    return result;
}

Frustum frustumFromViewProjection(const math::Matrix4& viewProjection) {
    const math::Vector4 r0 = viewProjection.row(0);
    const math::Vector4 r1 = viewProjection.row(1);
    const math::Vector4 r2 = viewProjection.row(2);
    const math::Vector4 r3 = viewProjection.row(3);

    Frustum frustum;
    frustum.planes[static_cast<int>(FrustumPlane::Left)] = makePlane(r3 + r0);
    frustum.planes[static_cast<int>(FrustumPlane::Right)] = makePlane(r3 - r0);
    frustum.planes[static_cast<int>(FrustumPlane::Bottom)] = makePlane(r3 + r1);
    frustum.planes[static_cast<int>(FrustumPlane::Top)] = makePlane(r3 - r1);
    frustum.planes[static_cast<int>(FrustumPlane::Near)] = makePlane(r2);
    frustum.planes[static_cast<int>(FrustumPlane::Far)] = makePlane(r3 - r2);
    return frustum;
}

} // namespace bimview::scene
