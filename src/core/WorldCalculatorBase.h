#pragma once

namespace BouncePit {

struct Body;

/**
 * @brief Base class for the per-step World calculators.
 *
 * Calculators are stateless; each step the World hands them the body list and
 * the current settings. The base holds the constants and helpers shared by
 * the integration, collision and bounds passes.
 */
class WorldCalculatorBase {
public:
    WorldCalculatorBase() = default;
    virtual ~WorldCalculatorBase() = default;

    // Smallest centre distance used to build a contact normal.
    static constexpr double DISTANCE_EPSILON = 1e-6;

protected:
    /**
     * @brief Inverse mass as seen by contact response.
     * @return 0 for a kinematic (dragged) body, its inv_mass otherwise.
     */
    static double effectiveInverseMass(const Body& body);
};

} // namespace BouncePit
