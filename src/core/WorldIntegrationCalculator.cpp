#include "WorldIntegrationCalculator.h"
#include "Body.h"

namespace BouncePit {

void WorldIntegrationCalculator::integrateBody(Body& body, double gravity, double deltaTime) const
{
    if (body.kinematic) {
        return;
    }
    body.velocity.y += gravity * deltaTime;
    body.position += body.velocity * deltaTime;
}

size_t WorldIntegrationCalculator::integrate(
    std::vector<Body>& bodies, double gravity, double deltaTime) const
{
    size_t integrated = 0;
    for (Body& body : bodies) {
        if (body.kinematic) {
            continue;
        }
        integrateBody(body, gravity, deltaTime);
        integrated++;
    }
    return integrated;
}

} // namespace BouncePit
