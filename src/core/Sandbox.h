#pragma once

#include "Body.h"
#include "Result.h"
#include "SandboxError.h"
#include "SimulationStats.h"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace BouncePit {

class SimulationStepper;
class World;
struct WorldSettings;

/**
 * Sandbox: the interface a rendering shell drives.
 *
 * Owns one World and the SimulationStepper that advances it. Input is
 * validated here; rejected calls return a SandboxError and leave the state
 * untouched.
 *
 * Usage:
 *   Sandbox sandbox;
 *   sandbox.fillRandom(Sandbox::INITIAL_BODY_COUNT);
 *   while (running) {
 *       sandbox.tick(secondsSinceLastFrame);
 *       draw(sandbox.getBodies());
 *   }
 */
class Sandbox {
public:
    // Bodies spawned by the playground at startup.
    static constexpr uint32_t INITIAL_BODY_COUNT = 14;

    Sandbox();

    // Throws std::invalid_argument when the settings do not validate.
    explicit Sandbox(const WorldSettings& settings);
    ~Sandbox();

    Sandbox(Sandbox&&) noexcept;
    Sandbox& operator=(Sandbox&&) noexcept;
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // =================================================================
    // BODIES
    // =================================================================

    Result<BodyHandle, SandboxError> spawn(
        double x, double y, double radius, double vx = 0.0, double vy = 0.0);
    Result<BodyHandle, SandboxError> spawnRandom();

    // Random radius at rest, centred on the point (pointer spawn).
    Result<BodyHandle, SandboxError> spawnAtPoint(double x, double y);

    // Returns how many bodies were added.
    uint32_t fillRandom(uint32_t count);

    void clearAll();
    Result<Okay, SandboxError> removeBody(const BodyHandle& handle);

    std::vector<BodySnapshot> getBodies() const;
    size_t getBodyCount() const;
    bool contains(const BodyHandle& handle) const;

    std::optional<BodyHandle> hitTest(double x, double y) const;

    Result<Okay, SandboxError> setBodyKinematic(
        const BodyHandle& handle, double x, double y, double vx, double vy);
    Result<Okay, SandboxError> releaseBody(const BodyHandle& handle);

    // =================================================================
    // SETTINGS
    // =================================================================

    Result<Okay, SandboxError> setGravity(double value);
    Result<Okay, SandboxError> setRestitution(double value);

    const WorldSettings& getSettings() const;
    Result<Okay, SandboxError> applySettings(const WorldSettings& settings);

    // =================================================================
    // STEPPING
    // =================================================================

    void setPaused(bool paused);
    void togglePause();
    bool isPaused() const;

    void tick(double elapsedSeconds);

    // =================================================================
    // DIAGNOSTICS
    // =================================================================

    SimulationStats getStats() const;
    double getFramesPerSecond() const;
    void setRandomSeed(uint32_t seed);
    nlohmann::json toJSON() const;
    std::string toAsciiDiagram() const;
    void dumpTimerStats() const;

    World& getWorld();
    const World& getWorld() const;
    SimulationStepper& getStepper();
    const SimulationStepper& getStepper() const;

private:
    std::unique_ptr<World> world_;
    std::unique_ptr<SimulationStepper> stepper_;
};

} // namespace BouncePit
