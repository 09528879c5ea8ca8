#pragma once

#include "WorldCalculatorBase.h"

#include <cstdint>
#include <vector>

namespace BouncePit {

struct Body;
class SpatialHash;

/**
 * @brief Outcome of testing one candidate pair.
 */
struct ContactResult {
    bool overlapping = false;     // Circles interpenetrated and were pushed apart.
    bool impulse_applied = false; // Bodies were approaching and exchanged momentum.
    double overlap = 0.0;         // Penetration depth before correction, px.
};

/**
 * @brief Counters for one broadphase resolution pass.
 */
struct CollisionPassStats {
    uint32_t pair_tests = 0;
    uint32_t contacts = 0;
    uint32_t impulses = 0;
    uint32_t duplicate_pairs_skipped = 0;
};

/**
 * @brief Circle-circle contact resolution.
 *
 * For each overlapping pair the calculator
 * - removes the penetration immediately by moving both centres along the
 *   contact normal, each in proportion to its inverse mass (no dt scaling),
 * - and, if the bodies are still approaching along the normal, applies the
 *   impulse j = -(1 + e) vn / (invA + invB) with the world restitution e.
 *
 * Separating pairs keep their velocities, so no energy is added. Coincident
 * centres fall back to a +x normal at DISTANCE_EPSILON instead of dividing by
 * zero. Kinematic bodies have an effective inverse mass of 0.
 */
class WorldCollisionCalculator : public WorldCalculatorBase {
public:
    WorldCollisionCalculator() = default;

    /**
     * @brief Resolve a single pair.
     * @param a First body (moved against the normal).
     * @param b Second body (moved along the normal, from a towards b).
     * @param restitution World restitution shared by both bodies.
     */
    ContactResult resolveCircleCircle(Body& a, Body& b, double restitution) const;

    /**
     * @brief Resolve every same-cell pair in the hash.
     *
     * Pairs are visited cell by cell in insertion order, (i, j > i) within a
     * cell. When @p dedupePairs is false a pair sharing several cells is
     * resolved once per shared cell; the repeat is a near no-op because the
     * first pass removed the overlap.
     */
    CollisionPassStats resolveHashedPairs(
        std::vector<Body>& bodies,
        const SpatialHash& hash,
        double restitution,
        bool dedupePairs) const;
};

} // namespace BouncePit
