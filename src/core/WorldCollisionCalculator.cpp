#include "WorldCollisionCalculator.h"
#include "Body.h"
#include "LoggingChannels.h"
#include "SpatialHash.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace BouncePit {

ContactResult WorldCollisionCalculator::resolveCircleCircle(
    Body& a, Body& b, double restitution) const
{
    ContactResult result;

    const double invA = effectiveInverseMass(a);
    const double invB = effectiveInverseMass(b);
    const double invMassSum = invA + invB;
    if (invMassSum <= 0.0) {
        // Two dragged bodies: both positions are owned by the pointer.
        return result;
    }

    const Vector2d delta = b.position - a.position;
    double dist = delta.mag();
    Vector2d normal;
    if (dist < DISTANCE_EPSILON) {
        dist = DISTANCE_EPSILON;
        normal = Vector2d{ 1.0, 0.0 };
    }
    else {
        normal = delta * (1.0 / dist);
    }

    const double overlap = a.radius + b.radius - dist;
    if (overlap <= 0.0) {
        return result;
    }

    result.overlapping = true;
    result.overlap = overlap;

    // Positional correction.
    const double push = overlap / invMassSum;
    a.position -= normal * (push * invA);
    b.position += normal * (push * invB);

    // Velocity response.
    const Vector2d relativeVelocity = b.velocity - a.velocity;
    const double velocityAlongNormal = relativeVelocity.dot(normal);
    if (velocityAlongNormal > 0.0) {
        return result;
    }

    const double j = -(1.0 + restitution) * velocityAlongNormal / invMassSum;
    const Vector2d impulse = normal * j;
    a.velocity -= impulse * invA;
    b.velocity += impulse * invB;
    result.impulse_applied = true;

    return result;
}

CollisionPassStats WorldCollisionCalculator::resolveHashedPairs(
    std::vector<Body>& bodies,
    const SpatialHash& hash,
    double restitution,
    bool dedupePairs) const
{
    CollisionPassStats stats;
    std::unordered_set<uint64_t> visitedPairs;
    auto logger = LoggingChannels::collision();

    hash.forEachCell([&](const CellKey& key, const std::vector<uint32_t>& ids) {
        const size_t n = ids.size();
        for (size_t i = 0; i < n; ++i) {
            for (size_t k = i + 1; k < n; ++k) {
                const uint32_t first = ids[i];
                const uint32_t second = ids[k];

                if (dedupePairs) {
                    const uint64_t lo = std::min(first, second);
                    const uint64_t hi = std::max(first, second);
                    if (!visitedPairs.insert((hi << 32) | lo).second) {
                        stats.duplicate_pairs_skipped++;
                        continue;
                    }
                }

                stats.pair_tests++;
                const ContactResult contact =
                    resolveCircleCircle(bodies[first], bodies[second], restitution);
                if (contact.overlapping) {
                    stats.contacts++;
                }
                if (contact.overlapping && logger->should_log(spdlog::level::trace)) {
                    logger->trace(
                        "cell ({},{}): bodies {} and {} overlap {:.4f}px",
                        key.x,
                        key.y,
                        bodies[first].handle.toString(),
                        bodies[second].handle.toString(),
                        contact.overlap);
                }
                if (contact.impulse_applied) {
                    stats.impulses++;
                }
            }
        }
    });

    return stats;
}

} // namespace BouncePit
