#pragma once

#include <algorithm>
#include <cmath>

namespace bimview::math {

constexpr float kPi = 3.14159265358979323846f;

inline float radians(float degreesValue) {
    return degreesValue * (kPi / 180.0f);
}

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float xIn, float yIn, float zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr Vector3 operator+(const Vector3& rhs) const { return Vector3{x + rhs.x, y + rhs.y, z + rhs.z}; }
    constexpr Vector3 operator-(const Vector3& rhs) const { return Vector3{x - rhs.x, y - rhs.y, z - rhs.z}; }
    constexpr Vector3 operator-() const { return Vector3{-x, -y, -z}; }
    constexpr Vector3 operator*(float scalar) const { return Vector3{x * scalar, y * scalar, z * scalar}; }
    constexpr Vector3 operator/(float scalar) const { return Vector3{x / scalar, y / scalar, z / scalar}; }

    Vector3& operator+=(const Vector3& rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    constexpr float operator[](int axis) const { return axis == 0 ? x : (axis == 1 ? y : z); }
};

inline constexpr Vector3 operator*(float scalar, const Vector3& v) {
    return v * scalar;
}

inline float dot(const Vector3& a, const Vector3& b) {
    return (a.x * b.x) + (a.y * b.y) + (a.z * b.z);
}

inline Vector3 cross(const Vector3& a, const Vector3& b) {
    return Vector3{
        (a.y * b.z) - (a.z * b.y),
        (a.z * b.x) - (a.x * b.z),
        (a.x * b.y) - (a.y * b.x)
    };
}

inline float length(const Vector3& v) {
    return std::sqrt(dot(v, v));
}

inline Vector3 normalize(const Vector3& v) {
    const float len = length(v);
    if (len <= 0.0f) {
        return Vector3{};
    }
    return v / len;
}

inline Vector3 min(const Vector3& a, const Vector3& b) {
    return Vector3{std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z)};
}

inline Vector3 max(const Vector3& a, const Vector3& b) {
    return Vector3{std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z)};
}

struct Vector4 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 0.0f;

    constexpr Vector4() = default;
    constexpr Vector4(float xIn, float yIn, float zIn, float wIn) : x(xIn), y(yIn), z(zIn), w(wIn) {}
    constexpr explicit Vector4(const Vector3& xyz, float wIn) : x(xyz.x), y(xyz.y), z(xyz.z), w(wIn) {}

    constexpr Vector4 operator+(const Vector4& rhs) const { return Vector4{x + rhs.x, y + rhs.y, z + rhs.z, w + rhs.w}; }
    constexpr Vector4 operator-(const Vector4& rhs) const { return Vector4{x - rhs.x, y - rhs.y, z - rhs.z, w - rhs.w}; }
    constexpr Vector4 operator*(float scalar) const { return Vector4{x * scalar, y * scalar, z * scalar, w * scalar}; }
};

struct Matrix4 {
    // Row-major storage, column vectors (p' = M * p).
    float m[16] = {
        1.0f, 0.0f, 0.0f, 0.0f,
        0.0f, 1.0f, 0.0f, 0.0f,
        0.0f, 0.0f, 1.0f, 0.0f,
        0.0f, 0.0f, 0.0f, 1.0f
    };

    static Matrix4 identity() {
        return Matrix4{};
    }

    static Matrix4 zero() {
        Matrix4 result{};
        for (float& value : result.m) {
            value = 0.0f;
        }
        return result;
    }

    static Matrix4 translation(const Vector3& t) {
        Matrix4 result = identity();
        result(0, 3) = t.x;
        result(1, 3) = t.y;
        result(2, 3) = t.z;
        return result;
    }

    static Matrix4 scale(const Vector3& s) {
        Matrix4 result = identity();
        result(0, 0) = s.x;
        result(1, 1) = s.y;
        result(2, 2) = s.z;
        return result;
    }

    static Matrix4 rotationY(float radians) {
        Matrix4 result = identity();
        const float c = std::cos(radians);
        const float s = std::sin(radians);
        result(0, 0) = c;
        result(0, 2) = s;
        result(2, 0) = -s;
        result(2, 2) = c;
        return result;
    }

    float& operator()(int row, int col) {
        return m[(row * 4) + col];
    }

    const float& operator()(int row, int col) const {
        return m[(row * 4) + col];
    }

    [[nodiscard]] Vector4 row(int r) const {
        return Vector4{m[r * 4 + 0], m[r * 4 + 1], m[r * 4 + 2], m[r * 4 + 3]};
    }
};

// Vulkan perspective with depth range [0, 1], near -> 0, far -> 1.
inline Matrix4 perspectiveVulkan(float fovYRadians, float aspectRatio, float nearPlane, float farPlane) {
    Matrix4 result = Matrix4::zero();
    const float f = 1.0f / std::tan(fovYRadians * 0.5f);
    result(0, 0) = f / aspectRatio;
    result(1, 1) = -f;
    result(2, 2) = farPlane / (nearPlane - farPlane);
    result(2, 3) = (farPlane * nearPlane) / (nearPlane - farPlane);
    result(3, 2) = -1.0f;
    return result;
}

// Right-handed view matrix looking along `forward` from `eye`.
inline Matrix4 lookDirection(const Vector3& eye, const Vector3& forward, const Vector3& worldUp) {
    const Vector3 f = normalize(forward);
    const Vector3 s = normalize(cross(f, worldUp));
    const Vector3 u = cross(s, f);

    Matrix4 result = Matrix4::identity();
    result(0, 0) = s.x;
    result(0, 1) = s.y;
    result(0, 2) = s.z;
    result(1, 0) = u.x;
    result(1, 1) = u.y;
    result(1, 2) = u.z;
    result(2, 0) = -f.x;
    result(2, 1) = -f.y;
    result(2, 2) = -f.z;
    result(0, 3) = -dot(s, eye);
    result(1, 3) = -dot(u, eye);
    result(2, 3) = dot(f, eye);
    return result;
}

inline Matrix4 multiply(const Matrix4& a, const Matrix4& b) {
    Matrix4 result = Matrix4::zero();
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            float sum = 0.0f;
            for (int k = 0; k < 4; ++k) {
                sum += a(row, k) * b(k, col);
            }
            result(row, col) = sum;
        }
    }
    return result;
}

inline Vector4 multiply(const Matrix4& m, const Vector4& v) {
    return Vector4{
        (m(0, 0) * v.x) + (m(0, 1) * v.y) + (m(0, 2) * v.z) + (m(0, 3) * v.w),
        (m(1, 0) * v.x) + (m(1, 1) * v.y) + (m(1, 2) * v.z) + (m(1, 3) * v.w),
        (m(2, 0) * v.x) + (m(2, 1) * v.y) + (m(2, 2) * v.z) + (m(2, 3) * v.w),
        (m(3, 0) * v.x) + (m(3, 1) * v.y) + (m(3, 2) * v.z) + (m(3, 3) * v.w)
    };
}

inline Matrix4 operator*(const Matrix4& a, const Matrix4& b) {
    return multiply(a, b);
}

inline Vector4 operator*(const Matrix4& m, const Vector4& v) {
    return multiply(m, v);
}

inline Vector3 transformPoint(const Matrix4& m, const Vector3& p) {
    const Vector4 result = m * Vector4{p, 1.0f};
    if (result.w == 0.0f) {
        return Vector3{result.x, result.y, result.z};
    }
    return Vector3{result.x / result.w, result.y / result.w, result.z / result.w};
}

// GPU buffers take column-major matrices.
inline void storeColumnMajor(const Matrix4& matrix, float* out) {
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            out[col * 4 + row] = matrix(row, col);
        }
    }
}

inline Matrix4 loadColumnMajor(const float* in) {
    Matrix4 result = Matrix4::zero();
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            result(row, col) = in[col * 4 + row];
        }
    }
    return result;
}

} // namespace bimview::math
