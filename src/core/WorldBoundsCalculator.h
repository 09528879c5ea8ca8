#pragma once

#include "WorldCalculatorBase.h"

#include <cstdint>
#include <vector>

namespace BouncePit {

struct Body;

/**
 * @brief Which playfield walls a body touched in one bounds pass.
 */
struct WallContacts {
    bool left = false;
    bool right = false;
    bool top = false;
    bool bottom = false;

    bool any() const { return left || right || top || bottom; }
    uint32_t count() const { return left + right + top + bottom; }
};

/**
 * @brief Keeps circles inside the [0,W] x [0,H] playfield.
 *
 * Each wall is checked on its own, in the order left, right, top, bottom. A
 * crossing clamps the centre so the circle is tangent to the wall and sets
 * the perpendicular velocity to -v * restitution. A body in a corner gets
 * both of its axes handled in the same pass.
 */
class WorldBoundsCalculator : public WorldCalculatorBase {
public:
    WorldBoundsCalculator() = default;

    WallContacts applyBounds(Body& body, double width, double height, double restitution) const;

    // Returns the number of wall contacts across all bodies.
    uint32_t applyBoundsToAll(
        std::vector<Body>& bodies, double width, double height, double restitution) const;
};

} // namespace BouncePit
