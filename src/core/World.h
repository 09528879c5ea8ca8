#pragma once

#include "Body.h"
#include "Pimpl.h"
#include "Result.h"
#include "SandboxError.h"
#include "SimulationStats.h"
#include "Vector2.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace BouncePit {

class BodyStore;
class Timers;
struct WorldSettings;

/**
 * World: the body collection plus the scalars that act on it.
 *
 * One call to advanceTime() runs a full physics step:
 *   integrate -> rebuild broadphase -> resolve same-cell pairs -> apply bounds.
 * Several worlds can coexist; nothing here is global.
 */
class World {
public:
    // Spawn ranges used by the "add ball" action and the pointer.
    static constexpr double RANDOM_RADIUS_MIN = 8.0;
    static constexpr double RANDOM_RADIUS_MAX = 36.0;
    static constexpr double RANDOM_SPAWN_MARGIN = 60.0;
    static constexpr double RANDOM_SPEED_MAX = 100.0;
    static constexpr double POINTER_RADIUS_MIN = 10.0;
    static constexpr double POINTER_RADIUS_MAX = 34.0;

    World();

    // Throws std::invalid_argument when the settings do not validate.
    explicit World(const WorldSettings& settings);
    ~World();

    World(World&&) noexcept;
    World& operator=(World&&) noexcept;
    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // =================================================================
    // CORE SIMULATION
    // =================================================================

    // Runs one physics step of deltaTimeSeconds. Non-positive deltas are ignored.
    void advanceTime(double deltaTimeSeconds);

    // Recomputes the broadphase cell size from the average radius.
    // Returns the new size, or std::nullopt when the world is empty.
    std::optional<double> tuneCellSize();

    // =================================================================
    // BODIES
    // =================================================================

    Result<BodyHandle, SandboxError> addBody(
        const Vector2d& position, double radius, const Vector2d& velocity = {});

    // Random radius, position inside the spawn margin and velocity.
    Result<BodyHandle, SandboxError> addRandomBody();

    // Random radius at rest, centred on the point.
    Result<BodyHandle, SandboxError> addBodyAtPoint(const Vector2d& position);

    // Returns how many bodies were added.
    uint32_t fillRandom(uint32_t count);

    Result<Okay, SandboxError> removeBody(const BodyHandle& handle);
    void clear();

    // Last-spawned body containing the point, boundary inclusive.
    std::optional<BodyHandle> hitTest(const Vector2d& point) const;

    const Body* findBody(const BodyHandle& handle) const;

    // Pins the body to the given state until releaseBody().
    Result<Okay, SandboxError> setBodyKinematic(
        const BodyHandle& handle, const Vector2d& position, const Vector2d& velocity);
    Result<Okay, SandboxError> releaseBody(const BodyHandle& handle);

    size_t getBodyCount() const;
    const BodyStore& getBodyStore() const;
    std::vector<BodySnapshot> getSnapshots() const;

    // =================================================================
    // SETTINGS
    // =================================================================

    const WorldSettings& getSettings() const;
    Result<Okay, SandboxError> applySettings(const WorldSettings& settings);
    Result<Okay, SandboxError> setGravity(double gravity);
    Result<Okay, SandboxError> setRestitution(double restitution);

    // =================================================================
    // DIAGNOSTICS
    // =================================================================

    SimulationStats getStats() const;
    Timers& getTimers();
    const Timers& getTimers() const;
    void dumpTimerStats() const;

    void setRandomSeed(uint32_t seed);

    nlohmann::json toJSON() const;

    // Coarse character picture of the playfield, one glyph per grid cell.
    std::string toAsciiDiagram(uint32_t columns = 60) const;

private:
    struct Impl;
    Pimpl<Impl> pImpl;

    // Shared spawn path after the radius is known.
    Result<BodyHandle, SandboxError> spawn(
        const Vector2d& position, double radius, const Vector2d& velocity);
    Body* findMutableBody(const BodyHandle& handle);
};

} // namespace BouncePit
