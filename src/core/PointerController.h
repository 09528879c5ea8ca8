#pragma once

#include "Body.h"
#include "Result.h"
#include "SandboxError.h"
#include "Vector2.h"

#include <optional>

namespace BouncePit {

class Sandbox;

/**
 * PointerController: spawn-or-drag gesture on top of a Sandbox.
 *
 * Pressing on a body grabs the last-spawned one under the pointer; pressing
 * on empty space spawns a body at rest there and grabs it. While held the
 * body follows the pointer kinematically with a velocity estimated from the
 * pointer motion, so releasing it throws it.
 */
class PointerController {
public:
    // Velocity estimate per pixel of motion when no frame time is known.
    static constexpr double FALLBACK_MOVES_PER_SECOND = 60.0;

    explicit PointerController(Sandbox& sandbox);

    // Returns the handle of the grabbed body.
    Result<BodyHandle, SandboxError> pointerDown(double x, double y);

    // dtSeconds is the time since the previous pointer position.
    // Without a held body this only records the position.
    Result<Okay, SandboxError> pointerMove(double x, double y, double dtSeconds);

    void pointerUp();

    bool isDragging() const { return dragged_.has_value(); }
    std::optional<BodyHandle> getDraggedBody() const { return dragged_; }
    const Vector2d& getLastPosition() const { return last_position_; }

private:
    Sandbox& sandbox_;
    std::optional<BodyHandle> dragged_;
    Vector2d last_position_;
};

} // namespace BouncePit
