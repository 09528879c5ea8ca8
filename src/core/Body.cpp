#include "Body.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace BouncePit {

Color Color::fromHsl(double hue, double saturation, double lightness)
{
    // Standard HSL conversion, same as CSS hsl().
    const double h = std::fmod(std::fmod(hue, 360.0) + 360.0, 360.0);
    const double s = std::clamp(saturation, 0.0, 1.0);
    const double l = std::clamp(lightness, 0.0, 1.0);

    const double chroma = (1.0 - std::abs(2.0 * l - 1.0)) * s;
    const double sector = h / 60.0;
    const double x = chroma * (1.0 - std::abs(std::fmod(sector, 2.0) - 1.0));
    const double m = l - chroma / 2.0;

    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    if (sector < 1.0) {
        r = chroma;
        g = x;
    }
    else if (sector < 2.0) {
        r = x;
        g = chroma;
    }
    else if (sector < 3.0) {
        g = chroma;
        b = x;
    }
    else if (sector < 4.0) {
        g = x;
        b = chroma;
    }
    else if (sector < 5.0) {
        r = x;
        b = chroma;
    }
    else {
        r = chroma;
        b = x;
    }

    auto toByte = [m](double channel) {
        return static_cast<uint8_t>(std::lround(std::clamp(channel + m, 0.0, 1.0) * 255.0));
    };
    return Color{ toByte(r), toByte(g), toByte(b) };
}

void Body::setRadius(double r)
{
    radius = r;
    inv_mass = inverseMassForRadius(r);
}

bool Body::containsPoint(const Vector2d& point) const
{
    return (point - position).magnitudeSquared() <= radius * radius;
}

double Body::inverseMassForRadius(double r)
{
    return 1.0 / (std::numbers::pi * r * r);
}

void to_json(nlohmann::json& j, const BodyHandle& handle)
{
    j = nlohmann::json{ { "index", handle.index }, { "generation", handle.generation } };
}

void from_json(const nlohmann::json& j, BodyHandle& handle)
{
    handle.index = j.at("index").get<uint32_t>();
    handle.generation = j.at("generation").get<uint32_t>();
}

void to_json(nlohmann::json& j, const Color& color)
{
    j = nlohmann::json::array({ color.r, color.g, color.b });
}

void to_json(nlohmann::json& j, const Body& body)
{
    j = nlohmann::json{ { "handle", body.handle },     { "position", body.position },
                        { "velocity", body.velocity }, { "radius", body.radius },
                        { "inv_mass", body.inv_mass }, { "color", body.color },
                        { "kinematic", body.kinematic } };
}

void to_json(nlohmann::json& j, const BodySnapshot& snapshot)
{
    j = nlohmann::json{ { "handle", snapshot.handle },
                        { "position", snapshot.position },
                        { "radius", snapshot.radius },
                        { "color", snapshot.color } };
}

} // namespace BouncePit
