#ifndef __MATH_HPP
#define __MATH_HPP

#include <cmath>

namespace flock {

/**
 * @brief Plain 2D float vector used for agent state.
 */
struct Vec2 {
    float x = 0.f;
    float y = 0.f;

    inline Vec2 &operator+=(Vec2 o) noexcept {
        x += o.x;
        y += o.y;
        return *this;
    }

    inline Vec2 &operator-=(Vec2 o) noexcept {
        x -= o.x;
        y -= o.y;
        return *this;
    }

    inline Vec2 &operator*=(float k) noexcept {
        x *= k;
        y *= k;
        return *this;
    }

    inline Vec2 &operator/=(float k) noexcept {
        x /= k;
        y /= k;
        return *this;
    }

    bool operator==(const Vec2 &) const = default;
};

inline Vec2 operator+(Vec2 a, Vec2 b) noexcept { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) noexcept { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 v, float k) noexcept { return {v.x * k, v.y * k}; }
inline Vec2 operator*(float k, Vec2 v) noexcept { return {v.x * k, v.y * k}; }
inline Vec2 operator/(Vec2 v, float k) noexcept { return {v.x / k, v.y / k}; }

inline float dot(Vec2 a, Vec2 b) noexcept { return a.x * b.x + a.y * b.y; }

inline float length_sq(Vec2 v) noexcept { return dot(v, v); }

inline float length(Vec2 v) noexcept { return std::sqrt(length_sq(v)); }

// -1, 0 or +1
inline float sign(float v) noexcept {
    return (v > 0.f) ? 1.f : ((v < 0.f) ? -1.f : 0.f);
}

} // namespace flock

#endif
