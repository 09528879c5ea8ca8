#pragma once

#include <cmath>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace BouncePit {

/**
 * Templated 2D vector used for positions (px) and velocities (px/s).
 *
 * All operations are inline. Screen convention: +x right, +y down.
 */
template <typename T>
struct Vector2 {
    T x = T{};
    T y = T{};

    // =================================================================
    // BASIC OPERATIONS
    // =================================================================

    Vector2 add(const Vector2& other) const { return { x + other.x, y + other.y }; }

    Vector2 subtract(const Vector2& other) const { return { x - other.x, y - other.y }; }

    Vector2 times(T scalar) const { return { x * scalar, y * scalar }; }

    T dot(const Vector2& other) const { return x * other.x + y * other.y; }

    T magnitudeSquared() const { return x * x + y * y; }

    std::string toString() const
    {
        return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
    }

    // =================================================================
    // MAGNITUDE AND NORMALIZATION
    // =================================================================

    // Always floating-point, also for integer vectors.
    auto mag() const
    {
        if constexpr (std::is_integral_v<T>) {
            return std::hypot(static_cast<double>(x), static_cast<double>(y));
        }
        else {
            return std::hypot(x, y);
        }
    }

    auto length() const { return mag(); }

    // Zero vectors are returned unchanged.
    template <typename U = T>
    std::enable_if_t<std::is_floating_point_v<U>, Vector2> normalize() const
    {
        const T magnitude = mag();
        if (magnitude > T{ 0 }) {
            return times(T{ 1 } / magnitude);
        }
        return *this;
    }

    template <typename U = T>
    std::enable_if_t<std::is_floating_point_v<U>, bool> isFinite() const
    {
        return std::isfinite(x) && std::isfinite(y);
    }

    // =================================================================
    // OPERATOR OVERLOADS
    // =================================================================

    Vector2 operator+(const Vector2& other) const { return add(other); }

    Vector2 operator-(const Vector2& other) const { return subtract(other); }

    Vector2 operator*(T scalar) const { return times(scalar); }

    Vector2 operator/(T scalar) const
    {
        if (scalar == T{ 0 }) {
            throw std::runtime_error("Vector2::operator/: Division by zero");
        }
        return { x / scalar, y / scalar };
    }

    bool operator==(const Vector2& other) const { return x == other.x && y == other.y; }

    bool operator!=(const Vector2& other) const { return !(*this == other); }

    Vector2& operator+=(const Vector2& other)
    {
        x += other.x;
        y += other.y;
        return *this;
    }

    Vector2& operator-=(const Vector2& other)
    {
        x -= other.x;
        y -= other.y;
        return *this;
    }

    Vector2& operator*=(T scalar)
    {
        x *= scalar;
        y *= scalar;
        return *this;
    }

    Vector2 operator-() const { return { -x, -y }; }

    // =================================================================
    // JSON SERIALIZATION
    // =================================================================

    nlohmann::json toJson() const { return nlohmann::json{ { "x", x }, { "y", y } }; }

    static Vector2 fromJson(const nlohmann::json& json)
    {
        return { json.at("x").get<T>(), json.at("y").get<T>() };
    }
};

using Vector2d = Vector2<double>;

// Scalar multiplication from left side: scalar * vector.
template <typename T>
inline Vector2<T> operator*(T scalar, const Vector2<T>& v)
{
    return v * scalar;
}

// =================================================================
// JSON ADL FUNCTIONS
// =================================================================

template <typename T>
inline void to_json(nlohmann::json& j, const Vector2<T>& v)
{
    j = v.toJson();
}

template <typename T>
inline void from_json(const nlohmann::json& j, Vector2<T>& v)
{
    v = Vector2<T>::fromJson(j);
}

} // namespace BouncePit
