#pragma once

#include "WorldCalculatorBase.h"

#include <cstddef>
#include <vector>

namespace BouncePit {

struct Body;

/**
 * @brief Semi-implicit Euler integration under uniform gravity.
 *
 * Velocity is updated first (v.y += g dt) and the new velocity moves the
 * body (p += v dt). Kinematic bodies are skipped; their position and velocity
 * come from the pointer.
 */
class WorldIntegrationCalculator : public WorldCalculatorBase {
public:
    WorldIntegrationCalculator() = default;

    void integrateBody(Body& body, double gravity, double deltaTime) const;

    // Returns how many bodies were integrated.
    size_t integrate(std::vector<Body>& bodies, double gravity, double deltaTime) const;
};

} // namespace BouncePit
