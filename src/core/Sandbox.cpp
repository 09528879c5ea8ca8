#include "Sandbox.h"
#include "BodyStore.h"
#include "LoggingChannels.h"
#include "SimulationStepper.h"
#include "World.h"
#include "WorldSettings.h"

namespace BouncePit {

namespace {

// Logs a rejected call on the input channel and passes the result through.
template <typename T>
Result<T, SandboxError> logRejection(const char* operation, Result<T, SandboxError> result)
{
    if (result.isError()) {
        LoggingChannels::input()->warn(
            "{} rejected ({}): {}",
            operation,
            getErrorCodeName(result.errorValue().code),
            result.errorValue().message);
    }
    return result;
}

} // namespace

Sandbox::Sandbox() : Sandbox(getDefaultWorldSettings())
{}

Sandbox::Sandbox(const WorldSettings& settings)
    : world_(std::make_unique<World>(settings)),
      stepper_(std::make_unique<SimulationStepper>(*world_))
{}

Sandbox::~Sandbox() = default;
Sandbox::Sandbox(Sandbox&&) noexcept = default;
Sandbox& Sandbox::operator=(Sandbox&&) noexcept = default;

Result<BodyHandle, SandboxError> Sandbox::spawn(
    double x, double y, double radius, double vx, double vy)
{
    return logRejection("spawn", world_->addBody(Vector2d{ x, y }, radius, Vector2d{ vx, vy }));
}

Result<BodyHandle, SandboxError> Sandbox::spawnRandom()
{
    return logRejection("spawnRandom", world_->addRandomBody());
}

Result<BodyHandle, SandboxError> Sandbox::spawnAtPoint(double x, double y)
{
    return logRejection("spawnAtPoint", world_->addBodyAtPoint(Vector2d{ x, y }));
}

uint32_t Sandbox::fillRandom(uint32_t count)
{
    return world_->fillRandom(count);
}

void Sandbox::clearAll()
{
    world_->clear();
}

Result<Okay, SandboxError> Sandbox::removeBody(const BodyHandle& handle)
{
    return logRejection("removeBody", world_->removeBody(handle));
}

std::vector<BodySnapshot> Sandbox::getBodies() const
{
    return world_->getSnapshots();
}

size_t Sandbox::getBodyCount() const
{
    return world_->getBodyCount();
}

bool Sandbox::contains(const BodyHandle& handle) const
{
    return world_->getBodyStore().contains(handle);
}

std::optional<BodyHandle> Sandbox::hitTest(double x, double y) const
{
    return world_->hitTest(Vector2d{ x, y });
}

Result<Okay, SandboxError> Sandbox::setBodyKinematic(
    const BodyHandle& handle, double x, double y, double vx, double vy)
{
    return logRejection(
        "setBodyKinematic", world_->setBodyKinematic(handle, Vector2d{ x, y }, Vector2d{ vx, vy }));
}

Result<Okay, SandboxError> Sandbox::releaseBody(const BodyHandle& handle)
{
    return logRejection("releaseBody", world_->releaseBody(handle));
}

Result<Okay, SandboxError> Sandbox::setGravity(double value)
{
    return world_->setGravity(value);
}

Result<Okay, SandboxError> Sandbox::setRestitution(double value)
{
    return world_->setRestitution(value);
}

const WorldSettings& Sandbox::getSettings() const
{
    return world_->getSettings();
}

Result<Okay, SandboxError> Sandbox::applySettings(const WorldSettings& settings)
{
    return world_->applySettings(settings);
}

void Sandbox::setPaused(bool paused)
{
    stepper_->setPaused(paused);
}

void Sandbox::togglePause()
{
    stepper_->togglePause();
}

bool Sandbox::isPaused() const
{
    return stepper_->isPaused();
}

void Sandbox::tick(double elapsedSeconds)
{
    stepper_->tick(elapsedSeconds);
}

SimulationStats Sandbox::getStats() const
{
    SimulationStats stats = world_->getStats();
    stats.fps = stepper_->getFramesPerSecond();
    return stats;
}

double Sandbox::getFramesPerSecond() const
{
    return stepper_->getFramesPerSecond();
}

void Sandbox::setRandomSeed(uint32_t seed)
{
    world_->setRandomSeed(seed);
}

nlohmann::json Sandbox::toJSON() const
{
    nlohmann::json doc = world_->toJSON();
    doc["stats"] = getStats();
    doc["paused"] = isPaused();
    doc["accumulator_seconds"] = stepper_->getAccumulatorSeconds();
    return doc;
}

std::string Sandbox::toAsciiDiagram() const
{
    return world_->toAsciiDiagram();
}

void Sandbox::dumpTimerStats() const
{
    world_->dumpTimerStats();
}

World& Sandbox::getWorld()
{
    return *world_;
}

const World& Sandbox::getWorld() const
{
    return *world_;
}

SimulationStepper& Sandbox::getStepper()
{
    return *stepper_;
}

const SimulationStepper& Sandbox::getStepper() const
{
    return *stepper_;
}

} // namespace BouncePit
