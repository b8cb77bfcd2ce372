#ifndef PAGECURL_MATH_VEC2_HPP
#define PAGECURL_MATH_VEC2_HPP

#include <cmath>
#include <cstddef>

namespace pagecurl {

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}

    // Arithmetic operators
    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(float scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(float scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }

    // Compound assignment
    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x; y += other.y;
        return *this;
    }

    constexpr Vec2& operator-=(const Vec2& other) {
        x -= other.x; y -= other.y;
        return *this;
    }

    constexpr Vec2& operator*=(float scalar) {
        x *= scalar; y *= scalar;
        return *this;
    }

    constexpr float dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // Magnitude squared (no sqrt)
    constexpr float length_squared() const {
        return x * x + y * y;
    }

    float length() const {
        return std::sqrt(length_squared());
    }

    // Normalized vector, zero when the vector has no length
    Vec2 normalized() const {
        float len = length();
        if (len > 0.0f) {
            return *this / len;
        }
        return {0.0f, 0.0f};
    }

    float distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }

    constexpr float& operator[](size_t i) {
        return i == 0 ? x : y;
    }

    constexpr float operator[](size_t i) const {
        return i == 0 ? x : y;
    }
};

constexpr Vec2 operator*(float scalar, const Vec2& v) {
    return v * scalar;
}

constexpr Vec2 lerp(const Vec2& a, const Vec2& b, float t) {
    return a * (1.0f - t) + b * t;
}

namespace vec2 {
    constexpr Vec2 zero() { return {0.0f, 0.0f}; }
    constexpr Vec2 unit_x() { return {1.0f, 0.0f}; }
    constexpr Vec2 unit_y() { return {0.0f, 1.0f}; }
}

}  // namespace pagecurl

#endif // PAGECURL_MATH_VEC2_HPP
