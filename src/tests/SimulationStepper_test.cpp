#include "core/SimulationStepper.h"
#include "core/Timers.h"
#include "core/World.h"
#include "core/WorldSettings.h"

#include <gtest/gtest.h>
#include <limits>
#include <spdlog/spdlog.h>

using namespace BouncePit;

// Power-of-two step sizes keep the accumulator arithmetic exact.
class SimulationStepperTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        WorldSettings settings = getDefaultWorldSettings();
        settings.gravity = 0.0;
        settings.time_step = 1.0 / 64.0;
        settings.max_frame_delta = 0.125;
        settings.max_substeps = 6;
        world = std::make_unique<World>(settings);
        stepper = std::make_unique<SimulationStepper>(*world);
    }

    uint64_t stepCount() const { return world->getStats().step_count; }

    std::unique_ptr<World> world;
    std::unique_ptr<SimulationStepper> stepper;
};

TEST_F(SimulationStepperTest, ClampFrameDelta)
{
    spdlog::info("Starting SimulationStepperTest::ClampFrameDelta test");
    EXPECT_EQ(SimulationStepper::clampFrameDelta(0.01, 0.05), 0.01);
    EXPECT_EQ(SimulationStepper::clampFrameDelta(0.2, 0.05), 0.05);
    EXPECT_EQ(SimulationStepper::clampFrameDelta(0.0, 0.05), 0.0);
    EXPECT_EQ(SimulationStepper::clampFrameDelta(-1.0, 0.05), 0.0);
    EXPECT_EQ(SimulationStepper::clampFrameDelta(std::numeric_limits<double>::quiet_NaN(), 0.05), 0.0);
    EXPECT_EQ(SimulationStepper::clampFrameDelta(std::numeric_limits<double>::infinity(), 0.05), 0.0);
}

TEST_F(SimulationStepperTest, AccumulatesUntilAWholeStep)
{
    spdlog::info("Starting SimulationStepperTest::AccumulatesUntilAWholeStep test");
    EXPECT_EQ(stepper->tick(1.0 / 128.0), 0u);
    EXPECT_EQ(stepper->getAccumulatorSeconds(), 1.0 / 128.0);

    EXPECT_EQ(stepper->tick(1.0 / 128.0), 1u);
    EXPECT_EQ(stepper->getAccumulatorSeconds(), 0.0);

    EXPECT_EQ(stepper->tick(3.0 / 64.0), 3u);
    EXPECT_EQ(stepCount(), 4u);
    EXPECT_EQ(stepper->getFrameCount(), 3u);
}

TEST_F(SimulationStepperTest, LongFrameIsClampedAndCeilinged)
{
    spdlog::info("Starting SimulationStepperTest::LongFrameIsClampedAndCeilinged test");
    // 1 s clamps to 0.125 s = 8 steps; the ceiling of 6 leaves 2 in the accumulator.
    EXPECT_EQ(stepper->tick(1.0), 6u);
    EXPECT_EQ(stepper->getLastSubstepCount(), 6u);
    EXPECT_EQ(stepper->getAccumulatorSeconds(), 2.0 / 64.0);
    EXPECT_EQ(stepCount(), 6u);

    // The carried time is consumed on the next tick.
    EXPECT_EQ(stepper->tick(0.0), 2u);
    EXPECT_EQ(stepper->getAccumulatorSeconds(), 0.0);
}

TEST_F(SimulationStepperTest, InvalidDeltasRunNothing)
{
    spdlog::info("Starting SimulationStepperTest::InvalidDeltasRunNothing test");
    EXPECT_EQ(stepper->tick(-0.5), 0u);
    EXPECT_EQ(stepper->tick(std::numeric_limits<double>::quiet_NaN()), 0u);
    EXPECT_EQ(stepper->tick(std::numeric_limits<double>::infinity()), 0u);
    EXPECT_EQ(stepper->getAccumulatorSeconds(), 0.0);
    EXPECT_EQ(stepCount(), 0u);
    EXPECT_EQ(world->getTimers().getCallCount("frame_tick"), 3u);
}

TEST_F(SimulationStepperTest, PauseFreezesAccumulator)
{
    spdlog::info("Starting SimulationStepperTest::PauseFreezesAccumulator test");
    stepper->tick(1.0 / 128.0 + 1.0 / 64.0);
    ASSERT_EQ(stepCount(), 1u);

    stepper->setPaused(true);
    EXPECT_TRUE(stepper->isPaused());
    EXPECT_EQ(stepper->getStateName(), "Paused");

    EXPECT_EQ(stepper->tick(0.125), 0u);
    EXPECT_EQ(stepper->tick(0.125), 0u);
    EXPECT_EQ(stepCount(), 1u);
    EXPECT_EQ(stepper->getAccumulatorSeconds(), 1.0 / 128.0);

    stepper->setPaused(false);
    EXPECT_EQ(stepper->getStateName(), "Running");
    EXPECT_EQ(stepper->tick(1.0 / 128.0), 1u);
    EXPECT_EQ(stepper->getAccumulatorSeconds(), 0.0);
}

TEST_F(SimulationStepperTest, TogglePauseAndRedundantCalls)
{
    spdlog::info("Starting SimulationStepperTest::TogglePauseAndRedundantCalls test");
    EXPECT_TRUE(std::holds_alternative<StepperState::Running>(stepper->getState()));

    stepper->togglePause();
    EXPECT_TRUE(std::holds_alternative<StepperState::Paused>(stepper->getState()));
    stepper->setPaused(true);
    EXPECT_TRUE(stepper->isPaused());

    stepper->togglePause();
    EXPECT_FALSE(stepper->isPaused());
    stepper->setPaused(false);
    EXPECT_FALSE(stepper->isPaused());
}

TEST_F(SimulationStepperTest, FramesPerSecondOverHalfSecondWindow)
{
    spdlog::info("Starting SimulationStepperTest::FramesPerSecondOverHalfSecondWindow test");
    for (int i = 0; i < 3; ++i) {
        stepper->tick(0.125);
    }
    EXPECT_EQ(stepper->getFramesPerSecond(), 0.0);

    stepper->tick(0.125);
    EXPECT_EQ(stepper->getFramesPerSecond(), 8.0);

    // The counter keeps running while paused.
    stepper->setPaused(true);
    for (int i = 0; i < 2; ++i) {
        stepper->tick(0.25);
    }
    EXPECT_EQ(stepper->getFramesPerSecond(), 4.0);
}

TEST_F(SimulationStepperTest, CellSizeTunerRunsOnFrameTime)
{
    spdlog::info("Starting SimulationStepperTest::CellSizeTunerRunsOnFrameTime test");
    ASSERT_TRUE(world->addBody(Vector2d{ 200.0, 200.0 }, 25.0).isValue());
    ASSERT_TRUE(world->addBody(Vector2d{ 500.0, 200.0 }, 25.0).isValue());

    stepper->tick(0.5);
    stepper->tick(0.5);
    EXPECT_EQ(world->getSettings().cell_size, 80.0);

    stepper->tick(0.5);
    EXPECT_EQ(world->getSettings().cell_size, 100.0);
}

TEST_F(SimulationStepperTest, CellSizeTunerRunsWhilePaused)
{
    spdlog::info("Starting SimulationStepperTest::CellSizeTunerRunsWhilePaused test");
    ASSERT_TRUE(world->addBody(Vector2d{ 200.0, 200.0 }, 25.0).isValue());
    stepper->setPaused(true);

    for (int i = 0; i < 3; ++i) {
        stepper->tick(0.5);
    }
    EXPECT_EQ(world->getSettings().cell_size, 100.0);
    EXPECT_EQ(stepCount(), 0u);
}
