#include "PointerController.h"
#include "LoggingChannels.h"
#include "Sandbox.h"

#include <cmath>

namespace BouncePit {

PointerController::PointerController(Sandbox& sandbox) : sandbox_(sandbox)
{}

Result<BodyHandle, SandboxError> PointerController::pointerDown(double x, double y)
{
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return SandboxError::invalidArgument("pointer position must be finite");
    }

    // A press without a matching release drops the previous drag first.
    if (dragged_.has_value()) {
        pointerUp();
    }

    auto logger = LoggingChannels::input();
    BodyHandle handle;
    if (auto hit = sandbox_.hitTest(x, y)) {
        handle = *hit;
        logger->debug("Pointer grabbed body {} at ({:.1f}, {:.1f})", handle.toString(), x, y);
    }
    else {
        auto spawned = sandbox_.spawnAtPoint(x, y);
        if (spawned.isError()) {
            return spawned;
        }
        handle = spawned.value();
        logger->debug("Pointer spawned body {} at ({:.1f}, {:.1f})", handle.toString(), x, y);
    }

    // Grabbing pins the body in place until the first move.
    auto pinned = sandbox_.setBodyKinematic(handle, x, y, 0.0, 0.0);
    if (pinned.isError()) {
        return pinned.errorValue();
    }

    dragged_ = handle;
    last_position_ = Vector2d{ x, y };
    return handle;
}

Result<Okay, SandboxError> PointerController::pointerMove(double x, double y, double dtSeconds)
{
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return SandboxError::invalidArgument("pointer position must be finite");
    }

    const Vector2d position{ x, y };
    const Vector2d displacement = position - last_position_;
    last_position_ = position;

    if (!dragged_.has_value()) {
        return Okay{};
    }

    const Vector2d velocity = (std::isfinite(dtSeconds) && dtSeconds > 0.0)
        ? displacement / dtSeconds
        : displacement * FALLBACK_MOVES_PER_SECOND;

    auto result = sandbox_.setBodyKinematic(*dragged_, x, y, velocity.x, velocity.y);
    if (result.isError()) {
        // The body went away under the pointer (cleared or removed).
        LoggingChannels::input()->debug(
            "Dropping drag of {}: {}", dragged_->toString(), result.errorValue().message);
        dragged_.reset();
    }
    return result;
}

void PointerController::pointerUp()
{
    if (!dragged_.has_value()) {
        return;
    }

    auto released = sandbox_.releaseBody(*dragged_);
    if (released.isError()) {
        LoggingChannels::input()->debug(
            "Released body {} was already gone", dragged_->toString());
    }
    dragged_.reset();
}

} // namespace BouncePit
