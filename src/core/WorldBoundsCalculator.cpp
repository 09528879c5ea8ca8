#include "WorldBoundsCalculator.h"
#include "Body.h"

namespace BouncePit {

WallContacts WorldBoundsCalculator::applyBounds(
    Body& body, double width, double height, double restitution) const
{
    WallContacts contacts;
    const double r = body.radius;

    if (body.position.x - r < 0.0) {
        body.position.x = r;
        body.velocity.x = -body.velocity.x * restitution;
        contacts.left = true;
    }
    if (body.position.x + r > width) {
        body.position.x = width - r;
        body.velocity.x = -body.velocity.x * restitution;
        contacts.right = true;
    }
    if (body.position.y - r < 0.0) {
        body.position.y = r;
        body.velocity.y = -body.velocity.y * restitution;
        contacts.top = true;
    }
    if (body.position.y + r > height) {
        body.position.y = height - r;
        body.velocity.y = -body.velocity.y * restitution;
        contacts.bottom = true;
    }

    return contacts;
}

uint32_t WorldBoundsCalculator::applyBoundsToAll(
    std::vector<Body>& bodies, double width, double height, double restitution) const
{
    uint32_t total = 0;
    for (Body& body : bodies) {
        total += applyBounds(body, width, height, restitution).count();
    }
    return total;
}

} // namespace BouncePit
