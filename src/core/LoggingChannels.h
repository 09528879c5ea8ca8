#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace BouncePit {

/**
 * @brief Named logging channels for the sandbox subsystems.
 *
 * Every channel writes to the same console and file sinks, so one subsystem
 * can be turned up to trace while the rest stay quiet. The contact trace
 * sink additionally copies the collision and broadphase channels into a
 * separate file when enabled.
 *
 * Config file layout (logging-config.json):
 *   {
 *     "pattern": "...",
 *     "flush_interval_ms": 1000,
 *     "console": { "enabled": true, "level": "info" },
 *     "file": { "enabled": true, "level": "debug", "path": "bounce-pit.log" },
 *     "contact_trace": { "enabled": false, "path": "contact-trace.log",
 *                        "channels": ["collision", "broadphase"] },
 *     "channels": { "physics": "info", ... }
 *   }
 */
class LoggingChannels {
public:
    // Channels created by initializeFromConfig().
    static const std::vector<std::string>& channelNames();

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>, and
     * writes the default config to <configPath> when neither exists.
     * @return true if a config file was applied, false if built-in defaults were used
     */
    static bool initializeFromConfig(const std::string& configPath = "logging-config.json");

    // Logger for the channel, or the default logger if it does not exist.
    static std::shared_ptr<spdlog::logger> get(const std::string& channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "collision:trace,stepper:debug"
     *   "*:off,broadphase:trace"
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    // Unknown names map to info.
    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    static bool isInitialized() { return initialized_; }

    // Drops all channel loggers so the system can be initialized again.
    static void shutdown();

    static nlohmann::json defaultConfig();

    static std::shared_ptr<spdlog::logger> physics() { return get("physics"); }
    static std::shared_ptr<spdlog::logger> broadphase() { return get("broadphase"); }
    static std::shared_ptr<spdlog::logger> collision() { return get("collision"); }
    static std::shared_ptr<spdlog::logger> stepper() { return get("stepper"); }
    static std::shared_ptr<spdlog::logger> input() { return get("input"); }
    static std::shared_ptr<spdlog::logger> config() { return get("config"); }

private:
    static nlohmann::json loadConfigFile(const std::string& configPath, bool& loaded);

    static std::vector<spdlog::sink_ptr> createSharedSinks(const nlohmann::json& config);

    static void attachContactTraceSink(const nlohmann::json& traceConfig);

    static void applyConfig(const nlohmann::json& config);

    static bool initialized_;
};

} // namespace BouncePit
