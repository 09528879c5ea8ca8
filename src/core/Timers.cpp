#include "Timers.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace BouncePit {

void Timers::startTimer(const std::string& name)
{
    auto& timer = timers[name];
    if (!timer.isRunning) {
        timer.startTime = std::chrono::steady_clock::now();
        timer.isRunning = true;
        timer.callCount++;
    }
}

double Timers::stopTimer(const std::string& name)
{
    auto it = timers.find(name);
    if (it == timers.end()) {
        return -1.0;
    }

    auto& timer = it->second;
    if (!timer.isRunning) {
        return timer.accumulatedTime;
    }

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - timer.startTime);
    timer.accumulatedTime += duration.count() / 1000.0;
    timer.isRunning = false;
    return timer.accumulatedTime;
}

bool Timers::hasTimer(const std::string& name) const
{
    return timers.find(name) != timers.end();
}

double Timers::getAccumulatedTime(const std::string& name) const
{
    auto it = timers.find(name);
    if (it == timers.end()) {
        return -1.0;
    }

    const auto& timer = it->second;
    if (!timer.isRunning) {
        return timer.accumulatedTime;
    }

    auto current = std::chrono::steady_clock::now();
    auto running = std::chrono::duration_cast<std::chrono::microseconds>(current - timer.startTime);
    return timer.accumulatedTime + (running.count() / 1000.0);
}

uint32_t Timers::getCallCount(const std::string& name) const
{
    auto it = timers.find(name);
    if (it == timers.end()) {
        return 0;
    }
    return it->second.callCount;
}

void Timers::resetTimer(const std::string& name)
{
    auto it = timers.find(name);
    if (it != timers.end()) {
        it->second.accumulatedTime = 0.0;
        it->second.callCount = 0;
        if (it->second.isRunning) {
            it->second.startTime = std::chrono::steady_clock::now();
        }
    }
}

void Timers::resetAll()
{
    timers.clear();
}

void Timers::dumpTimerStats() const
{
    auto logger = LoggingChannels::physics();

    const double frameTime = std::max(getAccumulatedTime("frame_tick"), 0.0);
    const uint32_t frameCalls = getCallCount("frame_tick");
    logger->info(
        "Frame ticks: {:.2f}ms total, {:.4f}ms avg, {} calls",
        frameTime,
        frameCalls > 0 ? frameTime / frameCalls : 0.0,
        frameCalls);

    const double stepTime = std::max(getAccumulatedTime("physics_step"), 0.0);
    const uint32_t stepCalls = getCallCount("physics_step");
    logger->info(
        "Physics steps: {:.2f}ms total, {:.4f}ms avg, {} calls",
        stepTime,
        stepCalls > 0 ? stepTime / stepCalls : 0.0,
        stepCalls);

    // Phases of a physics step, in execution order.
    const std::vector<std::string> phaseTimers = {
        "integrate", "broadphase_build", "collision_resolve", "world_bounds"
    };

    for (const auto& timerName : phaseTimers) {
        const double time = getAccumulatedTime(timerName);
        const uint32_t calls = getCallCount(timerName);
        if (calls == 0) {
            continue;
        }
        logger->info(
            "  {}: {:.2f}ms ({:.1f}% of physics, {:.4f}ms avg, {} calls)",
            timerName,
            time,
            stepTime > 0.0 ? time / stepTime * 100.0 : 0.0,
            time / calls,
            calls);
    }
}

std::vector<std::string> Timers::getAllTimerNames() const
{
    std::vector<std::string> names;
    names.reserve(timers.size());
    for (const auto& pair : timers) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json Timers::exportAllTimersAsJson() const
{
    nlohmann::json j = nlohmann::json::object();

    for (const auto& [name, timerData] : timers) {
        double total_ms = getAccumulatedTime(name);
        uint32_t calls = timerData.callCount;
        double avg_ms = calls > 0 ? total_ms / calls : 0.0;

        j[name] = { { "total_ms", total_ms }, { "avg_ms", avg_ms }, { "calls", calls } };
    }

    return j;
}

} // namespace BouncePit
