// src/Math/Vector3.h

#pragma once

#include <cmath>

// World positions live on the x/y plane; z is carried for renderers only.
class Vector3 {
public:
    float x, y, z;

    Vector3() : x(0.0f), y(0.0f), z(0.0f) {}
    Vector3(float x_, float y_, float z_ = 0.0f) : x(x_), y(y_), z(z_) {}

    Vector3 operator+(const Vector3& other) const {
        return Vector3(x + other.x, y + other.y, z + other.z);
    }

    Vector3 operator-(const Vector3& other) const {
        return Vector3(x - other.x, y - other.y, z - other.z);
    }

    Vector3 operator*(float scalar) const {
        return Vector3(x * scalar, y * scalar, z * scalar);
    }

    Vector3 operator/(float scalar) const {
        return Vector3(x / scalar, y / scalar, z / scalar);
    }

    Vector3& operator+=(const Vector3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    Vector3& operator-=(const Vector3& other) {
        x -= other.x; y -= other.y; z -= other.z;
        return *this;
    }

    Vector3& operator*=(float scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    bool operator==(const Vector3& other) const {
        return std::abs(x - other.x) < 1e-5f &&
               std::abs(y - other.y) < 1e-5f &&
               std::abs(z - other.z) < 1e-5f;
    }

    bool operator!=(const Vector3& other) const {
        return !(*this == other);
    }

    float Length() const {
        return std::sqrt(x * x + y * y + z * z);
    }

    float LengthSquared() const {
        return x * x + y * y + z * z;
    }

    Vector3 Normalized() const {
        float len = Length();
        if (len < 1e-6f) return Vector3(0, 0, 0);
        return *this / len;
    }

    float Distance(const Vector3& other) const {
        return (*this - other).Length();
    }

    // Planar distance, ignores height
    float Distance2D(const Vector3& other) const {
        float dx = x - other.x;
        float dy = y - other.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    float DistanceSquared2D(const Vector3& other) const {
        float dx = x - other.x;
        float dy = y - other.y;
        return dx * dx + dy * dy;
    }

    // Heading in radians from this point toward target, 0 = +x axis
    float YawTo(const Vector3& target) const {
        return std::atan2(target.y - y, target.x - x);
    }

    Vector3 Lerp(const Vector3& target, float t) const {
        return *this + (target - *this) * t;
    }

    bool IsZero() const {
        return std::abs(x) < 1e-6f && std::abs(y) < 1e-6f && std::abs(z) < 1e-6f;
    }

    static Vector3 Zero() { return Vector3(0, 0, 0); }
};

inline Vector3 operator*(float scalar, const Vector3& vec) {
    return vec * scalar;
}
