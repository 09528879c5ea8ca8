#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace BouncePit {

/**
 * @brief Named accumulating wall-clock timers for step profiling.
 *
 * Times are reported in milliseconds. A timer that is already running ignores
 * a second start; stopping adds the elapsed time to the total.
 */
class Timers {
public:
    Timers() = default;

    void startTimer(const std::string& name);

    // Returns the accumulated time, or -1.0 for an unknown timer.
    double stopTimer(const std::string& name);

    bool hasTimer(const std::string& name) const;

    // Includes the current run if the timer is running. -1.0 for an unknown timer.
    double getAccumulatedTime(const std::string& name) const;

    uint32_t getCallCount(const std::string& name) const;

    void resetTimer(const std::string& name);
    void resetAll();

    // Logs a breakdown of the physics step timers.
    void dumpTimerStats() const;
    std::vector<std::string> getAllTimerNames() const;

    nlohmann::json exportAllTimersAsJson() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct TimerData {
        TimePoint startTime;
        double accumulatedTime = 0.0;
        bool isRunning = false;
        uint32_t callCount = 0;
    };

    std::unordered_map<std::string, TimerData> timers;
};

} // namespace BouncePit
