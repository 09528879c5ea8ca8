#include "SimulationStepper.h"
#include "LoggingChannels.h"
#include "ScopeTimer.h"
#include "Timers.h"
#include "World.h"
#include "WorldSettings.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace BouncePit {

SimulationStepper::SimulationStepper(World& world) : world_(world), state_(StepperState::Running{})
{}

double SimulationStepper::clampFrameDelta(double elapsedSeconds, double maxDelta)
{
    if (!std::isfinite(elapsedSeconds) || elapsedSeconds <= 0.0) {
        return 0.0;
    }
    return std::min(elapsedSeconds, maxDelta);
}

uint32_t SimulationStepper::tick(double elapsedSeconds)
{
    ScopeTimer frameTimer(world_.getTimers(), "frame_tick");

    const double frameDelta = clampFrameDelta(elapsedSeconds, world_.getSettings().max_frame_delta);

    last_substeps_ = std::visit(
        [&](auto& state) -> uint32_t {
            using T = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<T, StepperState::Running>) {
                return runSteps(state, frameDelta);
            }
            else {
                return 0;
            }
        },
        state_);

    // Wall-clock bookkeeping uses the unclamped (but sanitized) delta.
    const double frameTime =
        (std::isfinite(elapsedSeconds) && elapsedSeconds > 0.0) ? elapsedSeconds : 0.0;
    frame_count_++;
    updateFrameCounter(frameTime);
    updateCellSizeTuner(frameTime);

    return last_substeps_;
}

uint32_t SimulationStepper::runSteps(StepperState::Running& running, double frameDelta)
{
    const WorldSettings& settings = world_.getSettings();

    running.accumulator_seconds += frameDelta;

    uint32_t substeps = 0;
    while (running.accumulator_seconds >= settings.time_step && substeps < settings.max_substeps) {
        world_.advanceTime(settings.time_step);
        running.accumulator_seconds -= settings.time_step;
        substeps++;
    }

    auto logger = LoggingChannels::stepper();
    if (substeps == settings.max_substeps && running.accumulator_seconds >= settings.time_step) {
        logger->debug(
            "Substep ceiling ({}) reached, {:.4f}s carried to next frame",
            settings.max_substeps,
            running.accumulator_seconds);
    }
    else {
        logger->trace(
            "Frame {}: {} substeps, accumulator {:.5f}s",
            frame_count_,
            substeps,
            running.accumulator_seconds);
    }

    return substeps;
}

void SimulationStepper::updateFrameCounter(double elapsedSeconds)
{
    fps_window_frames_++;
    fps_window_seconds_ += elapsedSeconds;
    if (fps_window_seconds_ >= FPS_WINDOW_SECONDS) {
        fps_ = std::round(fps_window_frames_ / fps_window_seconds_);
        LoggingChannels::stepper()->trace("FPS: {}", fps_);
        fps_window_frames_ = 0;
        fps_window_seconds_ = 0.0;
    }
}

void SimulationStepper::updateCellSizeTuner(double elapsedSeconds)
{
    const double interval = world_.getSettings().cell_size_tune_interval;
    tune_elapsed_seconds_ += elapsedSeconds;
    if (tune_elapsed_seconds_ >= interval) {
        world_.tuneCellSize();
        tune_elapsed_seconds_ = std::fmod(tune_elapsed_seconds_, interval);
    }
}

void SimulationStepper::setPaused(bool paused)
{
    if (paused == isPaused()) {
        return;
    }

    if (paused) {
        state_ = StepperState::Paused{ std::get<StepperState::Running>(state_) };
    }
    else {
        state_ = std::get<StepperState::Paused>(state_).previous_state;
    }
    LoggingChannels::stepper()->info("Stepper {}", getStateName());
}

void SimulationStepper::togglePause()
{
    setPaused(!isPaused());
}

bool SimulationStepper::isPaused() const
{
    return std::holds_alternative<StepperState::Paused>(state_);
}

double SimulationStepper::getAccumulatorSeconds() const
{
    if (const auto* running = std::get_if<StepperState::Running>(&state_)) {
        return running->accumulator_seconds;
    }
    return std::get<StepperState::Paused>(state_).previous_state.accumulator_seconds;
}

std::string SimulationStepper::getStateName() const
{
    return std::visit([](const auto& s) { return std::string(s.name()); }, state_);
}

} // namespace BouncePit
