#pragma once

#include "Vector2.h"

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace BouncePit {

/**
 * \file
 * Body is one circular rigid object in the sandbox.
 *
 * Note: Direct member access is public. Use the helpers when invariants matter
 * (setRadius keeps inv_mass consistent with the radius).
 */

/**
 * @brief Generational handle into the BodyStore arena.
 *
 * index selects a slot; generation detects a handle that outlived its body.
 */
struct BodyHandle {
    uint32_t index = 0;
    uint32_t generation = 0;

    bool operator==(const BodyHandle& other) const
    {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const BodyHandle& other) const { return !(*this == other); }

    std::string toString() const
    {
        return std::to_string(index) + "#" + std::to_string(generation);
    }
};

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;

    bool operator==(const Color& other) const
    {
        return r == other.r && g == other.g && b == other.b;
    }

    // HSL to RGB. hue in degrees, saturation and lightness in [0,1].
    static Color fromHsl(double hue, double saturation, double lightness);
};

struct Body {
    // Bodies are painted with a random hue at these HSL values.
    static constexpr double COLOR_SATURATION = 0.7;
    static constexpr double COLOR_LIGHTNESS = 0.6;

    // =================================================================
    // PUBLIC DATA MEMBERS
    // =================================================================

    BodyHandle handle = {};
    Vector2d position = {}; // Centre, px.
    Vector2d velocity = {}; // px/s.
    double radius = 1.0;
    double inv_mass = 0.0; // 1 / (pi r^2); larger bodies are heavier.
    Color color = {};
    bool kinematic = false; // Position driven by a pointer drag, not by forces.

    // Updates inv_mass together with the radius.
    void setRadius(double r);

    double getMass() const { return 1.0 / inv_mass; }
    double getKineticEnergy() const { return 0.5 * getMass() * velocity.magnitudeSquared(); }

    // Inclusive: a point on the rim is inside.
    bool containsPoint(const Vector2d& point) const;

    // Inverse mass of a disc of unit areal density.
    static double inverseMassForRadius(double r);
};

/**
 * @brief Read-only view handed to renderers.
 */
struct BodySnapshot {
    BodyHandle handle;
    Vector2d position;
    double radius;
    Color color;
};

void to_json(nlohmann::json& j, const BodyHandle& handle);
void from_json(const nlohmann::json& j, BodyHandle& handle);
void to_json(nlohmann::json& j, const Color& color);
void to_json(nlohmann::json& j, const Body& body);
void to_json(nlohmann::json& j, const BodySnapshot& snapshot);

} // namespace BouncePit

namespace std {
template <>
struct hash<BouncePit::BodyHandle> {
    std::size_t operator()(const BouncePit::BodyHandle& h) const noexcept
    {
        return std::hash<uint64_t>{}((static_cast<uint64_t>(h.generation) << 32) | h.index);
    }
};
} // namespace std
