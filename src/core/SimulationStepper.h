#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace BouncePit {

class World;

namespace StepperState {

/**
 * @brief Physics advances; frame time accumulates into fixed steps.
 */
struct Running {
    double accumulator_seconds = 0.0; // Frame time not yet consumed by a step.

    static constexpr const char* name() { return "Running"; }
};

/**
 * @brief No physics steps; keeps the Running context so resuming keeps its phase.
 */
struct Paused {
    Running previous_state;

    static constexpr const char* name() { return "Paused"; }
};

using Any = std::variant<Running, Paused>;

} // namespace StepperState

/**
 * SimulationStepper: fixed-timestep driver for a World.
 *
 * The shell calls tick() once per display refresh with the real elapsed
 * time. The delta is clamped to max_frame_delta and, while running, added to
 * the accumulator; whole time_step slices are then run as physics steps, at
 * most max_substeps per tick, and the remainder carries to the next tick.
 *
 * The frame-rate counter and the periodic cell-size tuner run on frame time
 * in both states.
 */
class SimulationStepper {
public:
    static constexpr double FPS_WINDOW_SECONDS = 0.5;

    explicit SimulationStepper(World& world);

    // Returns the number of physics steps run.
    uint32_t tick(double elapsedSeconds);

    void setPaused(bool paused);
    void togglePause();
    bool isPaused() const;

    // Unconsumed frame time, frozen while paused.
    double getAccumulatorSeconds() const;

    // Frames per second over the last completed counting window.
    double getFramesPerSecond() const { return fps_; }

    uint64_t getFrameCount() const { return frame_count_; }
    uint32_t getLastSubstepCount() const { return last_substeps_; }

    const StepperState::Any& getState() const { return state_; }
    std::string getStateName() const;

    // Negative or non-finite deltas become 0; larger ones are capped at maxDelta.
    static double clampFrameDelta(double elapsedSeconds, double maxDelta);

private:
    uint32_t runSteps(StepperState::Running& running, double frameDelta);
    void updateFrameCounter(double elapsedSeconds);
    void updateCellSizeTuner(double elapsedSeconds);

    World& world_;
    StepperState::Any state_;

    uint64_t frame_count_ = 0;
    uint32_t last_substeps_ = 0;

    double fps_ = 0.0;
    double fps_window_seconds_ = 0.0;
    uint32_t fps_window_frames_ = 0;

    double tune_elapsed_seconds_ = 0.0;
};

} // namespace BouncePit
