#include "World.h"
#include "BodyStore.h"
#include "LoggingChannels.h"
#include "ScopeTimer.h"
#include "SpatialHash.h"
#include "Timers.h"
#include "WorldBoundsCalculator.h"
#include "WorldCollisionCalculator.h"
#include "WorldIntegrationCalculator.h"
#include "WorldSettings.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <stdexcept>

namespace BouncePit {

// =================================================================
// PIMPL IMPLEMENTATION STRUCT
// =================================================================

struct World::Impl {
    BodyStore store_;
    WorldSettings settings_;

    WorldIntegrationCalculator integration_calculator_;
    WorldCollisionCalculator collision_calculator_;
    WorldBoundsCalculator bounds_calculator_;

    // Counters from the most recent step, merged into getStats().
    SimulationStats step_stats_;

    mutable Timers timers_;
    std::mt19937 rng_;

    Impl() : Impl(getDefaultWorldSettings()) {}

    explicit Impl(const WorldSettings& settings)
        : settings_(settings), rng_(std::random_device{}())
    {
        step_stats_.cell_size = settings.cell_size;
    }
};

namespace {

bool isFinite(const Vector2d& v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

double uniform(std::mt19937& rng, double lo, double hi)
{
    if (hi <= lo) {
        return lo;
    }
    return std::uniform_real_distribution<double>(lo, hi)(rng);
}

} // namespace

World::World() : pImpl()
{
    LoggingChannels::physics()->info(
        "Creating World: {}x{} playfield",
        pImpl->settings_.width,
        pImpl->settings_.height);
}

World::World(const WorldSettings& settings) : pImpl(settings)
{
    auto valid = validateWorldSettings(settings);
    if (valid.isError()) {
        throw std::invalid_argument("World: " + valid.errorValue().message);
    }
    LoggingChannels::physics()->info(
        "Creating World: {}x{} playfield", settings.width, settings.height);
}

World::~World() = default;
World::World(World&&) noexcept = default;
World& World::operator=(World&&) noexcept = default;

// =================================================================
// CORE SIMULATION
// =================================================================

void World::advanceTime(double deltaTimeSeconds)
{
    if (!(deltaTimeSeconds > 0.0) || !std::isfinite(deltaTimeSeconds)) {
        return;
    }

    ScopeTimer timer(pImpl->timers_, "physics_step");
    const auto stepStart = std::chrono::steady_clock::now();

    const WorldSettings& settings = pImpl->settings_;
    std::vector<Body>& bodies = pImpl->store_.getBodies();

    {
        ScopeTimer integrateTimer(pImpl->timers_, "integrate");
        pImpl->integration_calculator_.integrate(bodies, settings.gravity, deltaTimeSeconds);
    }

    SpatialHash hash(settings.cell_size);
    {
        ScopeTimer broadphaseTimer(pImpl->timers_, "broadphase_build");
        hash.build(bodies);
    }

    CollisionPassStats pass;
    {
        ScopeTimer collisionTimer(pImpl->timers_, "collision_resolve");
        pass = pImpl->collision_calculator_.resolveHashedPairs(
            bodies, hash, settings.restitution, settings.dedupe_pairs);
    }

    uint32_t wallContacts = 0;
    {
        ScopeTimer boundsTimer(pImpl->timers_, "world_bounds");
        wallContacts = pImpl->bounds_calculator_.applyBoundsToAll(
            bodies, settings.width, settings.height, settings.restitution);
    }

    SimulationStats& stats = pImpl->step_stats_;
    stats.step_count++;
    stats.simulation_time += deltaTimeSeconds;
    stats.cell_count = static_cast<uint32_t>(hash.cellCount());
    stats.pair_tests = pass.pair_tests;
    stats.contacts = pass.contacts;
    stats.wall_contacts = wallContacts;
    stats.cell_size = settings.cell_size;
    stats.last_step_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - stepStart)
                             .count();

    auto broadphaseLogger = LoggingChannels::broadphase();
    if (broadphaseLogger->should_log(spdlog::level::trace)) {
        broadphaseLogger->trace(
            "step {}: {} bodies in {} cells ({} entries, cell size {:.1f})",
            stats.step_count,
            bodies.size(),
            hash.cellCount(),
            hash.entryCount(),
            settings.cell_size);
    }
    LoggingChannels::physics()->trace(
        "step {}: {} pair tests, {} contacts, {} impulses, {} duplicates skipped, {} wall "
        "contacts",
        stats.step_count,
        pass.pair_tests,
        pass.contacts,
        pass.impulses,
        pass.duplicate_pairs_skipped,
        wallContacts);
}

std::optional<double> World::tuneCellSize()
{
    auto tuned = SpatialHash::computeTunedCellSize(pImpl->store_.getBodies(), pImpl->settings_);
    if (!tuned.has_value()) {
        return std::nullopt;
    }

    if (*tuned != pImpl->settings_.cell_size) {
        LoggingChannels::broadphase()->debug(
            "Cell size {:.1f} -> {:.1f} ({} bodies)",
            pImpl->settings_.cell_size,
            *tuned,
            pImpl->store_.size());
    }
    pImpl->settings_.cell_size = *tuned;
    return tuned;
}

// =================================================================
// BODIES
// =================================================================

Result<BodyHandle, SandboxError> World::addBody(
    const Vector2d& position, double radius, const Vector2d& velocity)
{
    return spawn(position, radius, velocity);
}

Result<BodyHandle, SandboxError> World::addRandomBody()
{
    const WorldSettings& settings = pImpl->settings_;
    const double maxFit = std::min(settings.width, settings.height) / 2.0;

    const double radius =
        std::min(uniform(pImpl->rng_, RANDOM_RADIUS_MIN, RANDOM_RADIUS_MAX), maxFit);

    // The margin shrinks to the centre line on playfields narrower than two margins.
    const double marginX = std::min(RANDOM_SPAWN_MARGIN, settings.width / 2.0);
    const double marginY = std::min(RANDOM_SPAWN_MARGIN, settings.height / 2.0);
    const Vector2d position{ uniform(pImpl->rng_, marginX, settings.width - marginX),
                             uniform(pImpl->rng_, marginY, settings.height - marginY) };
    const Vector2d velocity{ uniform(pImpl->rng_, -RANDOM_SPEED_MAX, RANDOM_SPEED_MAX),
                             uniform(pImpl->rng_, -RANDOM_SPEED_MAX, RANDOM_SPEED_MAX) };

    return spawn(position, radius, velocity);
}

Result<BodyHandle, SandboxError> World::addBodyAtPoint(const Vector2d& position)
{
    const WorldSettings& settings = pImpl->settings_;
    const double maxFit = std::min(settings.width, settings.height) / 2.0;
    const double radius =
        std::min(uniform(pImpl->rng_, POINTER_RADIUS_MIN, POINTER_RADIUS_MAX), maxFit);
    return spawn(position, radius, Vector2d{});
}

uint32_t World::fillRandom(uint32_t count)
{
    uint32_t added = 0;
    for (uint32_t i = 0; i < count; ++i) {
        auto result = addRandomBody();
        if (result.isError()) {
            LoggingChannels::input()->warn(
                "fillRandom stopped after {} bodies: {}", added, result.errorValue().message);
            break;
        }
        added++;
    }
    LoggingChannels::physics()->debug("Filled world with {} random bodies", added);
    return added;
}

Result<BodyHandle, SandboxError> World::spawn(
    const Vector2d& position, double radius, const Vector2d& velocity)
{
    const WorldSettings& settings = pImpl->settings_;

    if (!std::isfinite(radius) || radius <= 0.0) {
        return SandboxError::invalidArgument(
            fmt::format("radius must be positive and finite, got {}", radius));
    }
    if (2.0 * radius > std::min(settings.width, settings.height)) {
        return SandboxError::invalidArgument(
            fmt::format(
                "radius {} does not fit a {}x{} playfield", radius, settings.width, settings.height));
    }
    if (!isFinite(position)) {
        return SandboxError::invalidArgument("spawn position must be finite");
    }
    if (!isFinite(velocity)) {
        return SandboxError::invalidArgument("spawn velocity must be finite");
    }

    Body body;
    body.position = position;
    body.velocity = velocity;
    body.setRadius(radius);
    const double hue = std::floor(uniform(pImpl->rng_, 0.0, 360.0));
    body.color = Color::fromHsl(hue, Body::COLOR_SATURATION, Body::COLOR_LIGHTNESS);

    const BodyHandle handle = pImpl->store_.add(body);
    LoggingChannels::physics()->debug(
        "Spawned body {} at ({:.1f}, {:.1f}) r={:.1f}",
        handle.toString(),
        position.x,
        position.y,
        radius);
    return handle;
}

Result<Okay, SandboxError> World::removeBody(const BodyHandle& handle)
{
    if (!pImpl->store_.remove(handle)) {
        return SandboxError::staleHandle(
            fmt::format("body {} does not exist", handle.toString()));
    }
    LoggingChannels::physics()->debug("Removed body {}", handle.toString());
    return Okay{};
}

void World::clear()
{
    const size_t count = pImpl->store_.size();
    pImpl->store_.clear();
    LoggingChannels::physics()->info("Cleared {} bodies", count);
}

std::optional<BodyHandle> World::hitTest(const Vector2d& point) const
{
    const auto& bodies = pImpl->store_.getBodies();
    for (auto it = bodies.rbegin(); it != bodies.rend(); ++it) {
        if (it->containsPoint(point)) {
            return it->handle;
        }
    }
    return std::nullopt;
}

const Body* World::findBody(const BodyHandle& handle) const
{
    return pImpl->store_.find(handle);
}

Body* World::findMutableBody(const BodyHandle& handle)
{
    return pImpl->store_.find(handle);
}

Result<Okay, SandboxError> World::setBodyKinematic(
    const BodyHandle& handle, const Vector2d& position, const Vector2d& velocity)
{
    if (!isFinite(position) || !isFinite(velocity)) {
        return SandboxError::invalidArgument("kinematic position and velocity must be finite");
    }

    Body* body = findMutableBody(handle);
    if (!body) {
        return SandboxError::staleHandle(
            fmt::format("body {} does not exist", handle.toString()));
    }

    body->position = position;
    body->velocity = velocity;
    body->kinematic = true;
    return Okay{};
}

Result<Okay, SandboxError> World::releaseBody(const BodyHandle& handle)
{
    Body* body = findMutableBody(handle);
    if (!body) {
        return SandboxError::staleHandle(
            fmt::format("body {} does not exist", handle.toString()));
    }
    body->kinematic = false;
    return Okay{};
}

size_t World::getBodyCount() const
{
    return pImpl->store_.size();
}

const BodyStore& World::getBodyStore() const
{
    return pImpl->store_;
}

std::vector<BodySnapshot> World::getSnapshots() const
{
    std::vector<BodySnapshot> snapshots;
    snapshots.reserve(pImpl->store_.size());
    for (const Body& body : pImpl->store_) {
        snapshots.push_back(BodySnapshot{ body.handle, body.position, body.radius, body.color });
    }
    return snapshots;
}

// =================================================================
// SETTINGS
// =================================================================

const WorldSettings& World::getSettings() const
{
    return pImpl->settings_;
}

Result<Okay, SandboxError> World::applySettings(const WorldSettings& settings)
{
    auto valid = validateWorldSettings(settings);
    if (valid.isError()) {
        LoggingChannels::config()->warn("Rejected settings: {}", valid.errorValue().message);
        return valid;
    }

    // Every live body must still fit between opposite walls.
    const double span = std::min(settings.width, settings.height);
    for (const Body& body : pImpl->store_) {
        if (2.0 * body.radius > span) {
            LoggingChannels::config()->warn(
                "Rejected settings: body {} (r={}) does not fit a {}x{} playfield",
                body.handle.toString(),
                body.radius,
                settings.width,
                settings.height);
            return SandboxError::invalidArgument(
                fmt::format(
                    "body {} with radius {} does not fit a {}x{} playfield",
                    body.handle.toString(),
                    body.radius,
                    settings.width,
                    settings.height));
        }
    }

    pImpl->settings_ = settings;
    LoggingChannels::config()->info(
        "Applied settings: gravity={}, restitution={}, step={:.5f}s, playfield {}x{}",
        settings.gravity,
        settings.restitution,
        settings.time_step,
        settings.width,
        settings.height);
    return Okay{};
}

Result<Okay, SandboxError> World::setGravity(double gravity)
{
    if (!std::isfinite(gravity)) {
        LoggingChannels::input()->warn("Rejected non-finite gravity");
        return SandboxError::invalidArgument("gravity must be finite");
    }
    pImpl->settings_.gravity = gravity;
    LoggingChannels::input()->debug("Gravity set to {}", gravity);
    return Okay{};
}

Result<Okay, SandboxError> World::setRestitution(double restitution)
{
    if (!std::isfinite(restitution)) {
        LoggingChannels::input()->warn("Rejected non-finite restitution");
        return SandboxError::invalidArgument("restitution must be finite");
    }
    pImpl->settings_.restitution = restitution;
    LoggingChannels::input()->debug("Restitution set to {}", restitution);
    return Okay{};
}

// =================================================================
// DIAGNOSTICS
// =================================================================

SimulationStats World::getStats() const
{
    SimulationStats stats = pImpl->step_stats_;
    stats.cell_size = pImpl->settings_.cell_size;
    stats.body_count = static_cast<uint32_t>(pImpl->store_.size());
    stats.kinematic_count = 0;
    stats.total_kinetic_energy = 0.0;
    stats.max_speed = 0.0;

    double speedSum = 0.0;
    for (const Body& body : pImpl->store_) {
        const double speed = body.velocity.mag();
        speedSum += speed;
        stats.max_speed = std::max(stats.max_speed, speed);
        stats.total_kinetic_energy += body.getKineticEnergy();
        if (body.kinematic) {
            stats.kinematic_count++;
        }
    }
    stats.avg_speed = stats.body_count > 0 ? speedSum / stats.body_count : 0.0;
    return stats;
}

Timers& World::getTimers()
{
    return pImpl->timers_;
}

const Timers& World::getTimers() const
{
    return pImpl->timers_;
}

void World::dumpTimerStats() const
{
    pImpl->timers_.dumpTimerStats();
}

void World::setRandomSeed(uint32_t seed)
{
    pImpl->rng_.seed(seed);
    LoggingChannels::physics()->debug("World RNG seed set to {}", seed);
}

nlohmann::json World::toJSON() const
{
    nlohmann::json bodies = nlohmann::json::array();
    for (const Body& body : pImpl->store_) {
        bodies.push_back(body);
    }
    return nlohmann::json{ { "settings", pImpl->settings_ },
                           { "bodies", bodies },
                           { "stats", getStats() } };
}

std::string World::toAsciiDiagram(uint32_t columns) const
{
    const WorldSettings& settings = pImpl->settings_;
    columns = std::max<uint32_t>(columns, 1);

    // Glyphs are about twice as tall as they are wide.
    const double cellWidth = settings.width / columns;
    const double cellHeight = cellWidth * 2.0;
    const uint32_t rows =
        std::max<uint32_t>(1, static_cast<uint32_t>(std::ceil(settings.height / cellHeight)));

    std::vector<std::string> grid(rows, std::string(columns, ' '));

    for (const Body& body : pImpl->store_) {
        const char glyph = body.kinematic ? '@' : 'o';
        for (uint32_t row = 0; row < rows; ++row) {
            for (uint32_t col = 0; col < columns; ++col) {
                const Vector2d centre{ (col + 0.5) * cellWidth, (row + 0.5) * cellHeight };
                const double dx = std::abs(centre.x - body.position.x);
                const double dy = std::abs(centre.y - body.position.y);
                // Mark every glyph whose cell the circle touches.
                const double nearX = std::max(0.0, dx - cellWidth / 2.0);
                const double nearY = std::max(0.0, dy - cellHeight / 2.0);
                if (nearX * nearX + nearY * nearY <= body.radius * body.radius) {
                    grid[row][col] = glyph;
                }
            }
        }
    }

    std::ostringstream out;
    const std::string border = "+" + std::string(columns, '-') + "+\n";
    out << border;
    for (const auto& line : grid) {
        out << "|" << line << "|\n";
    }
    out << border;
    out << fmt::format(
        "{} bodies, gravity {}, restitution {}\n",
        pImpl->store_.size(),
        settings.gravity,
        settings.restitution);
    return out.str();
}

} // namespace BouncePit
