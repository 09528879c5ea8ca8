#include "LoggingChannels.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sstream>

namespace BouncePit {

namespace {

constexpr const char* DEFAULT_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
constexpr const char* DEFAULT_LOG_FILE = "bounce-pit.log";
constexpr const char* DEFAULT_TRACE_FILE = "contact-trace.log";

std::string trim(const std::string& text)
{
    const size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

// Section of the config, or an empty object when it is missing or not an object.
nlohmann::json section(const nlohmann::json& config, const char* key)
{
    if (config.contains(key) && config[key].is_object()) {
        return config[key];
    }
    return nlohmann::json::object();
}

} // namespace

bool LoggingChannels::initialized_ = false;

const std::vector<std::string>& LoggingChannels::channelNames()
{
    static const std::vector<std::string> names = {
        "physics", "broadphase", "collision", "stepper", "input", "config"
    };
    return names;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    nlohmann::json channels = nlohmann::json::object();
    for (const auto& name : channelNames()) {
        channels[name] = "info";
    }
    channels["stepper"] = "debug";

    return {
        { "pattern", DEFAULT_PATTERN },
        { "flush_interval_ms", 1000 },
        { "console", { { "enabled", true }, { "level", "info" } } },
        { "file",
          { { "enabled", true }, { "level", "debug" }, { "path", DEFAULT_LOG_FILE } } },
        { "contact_trace",
          { { "enabled", false },
            { "path", DEFAULT_TRACE_FILE },
            { "channels", nlohmann::json::array({ "collision", "broadphase" }) } } },
        { "channels", channels }
    };
}

bool LoggingChannels::initializeFromConfig(const std::string& configPath)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, ignoring {}", configPath);
        return false;
    }

    bool loaded = false;
    const nlohmann::json config = loadConfigFile(configPath, loaded);
    applyConfig(config);

    initialized_ = true;
    return loaded;
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath, bool& loaded)
{
    namespace fs = std::filesystem;
    loaded = false;

    const std::string localPath = configPath + ".local";
    std::string path = configPath;
    if (fs::exists(localPath)) {
        path = localPath;
    }
    else if (!fs::exists(configPath)) {
        std::ofstream out(configPath);
        if (!out) {
            spdlog::warn("Cannot write {}, using built-in logging defaults", configPath);
            return defaultConfig();
        }
        out << defaultConfig().dump(2) << std::endl;
        spdlog::info("Wrote default logging config to {}", configPath);
    }

    std::ifstream in(path);
    if (!in) {
        spdlog::error("Cannot open logging config {}, using built-in defaults", path);
        return defaultConfig();
    }

    try {
        nlohmann::json config = nlohmann::json::parse(in);
        loaded = true;
        spdlog::info("Loaded logging config from {}", path);
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Malformed logging config {} ({}), using built-in defaults", path, e.what());
        return defaultConfig();
    }
}

std::vector<spdlog::sink_ptr> LoggingChannels::createSharedSinks(const nlohmann::json& config)
{
    std::vector<spdlog::sink_ptr> sinks;

    const nlohmann::json console = section(config, "console");
    if (console.value("enabled", true)) {
        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        sink->set_level(parseLevelString(console.value("level", "info")));
        sinks.push_back(sink);
    }

    const nlohmann::json file = section(config, "file");
    if (file.value("enabled", true)) {
        const std::string path = file.value("path", DEFAULT_LOG_FILE);
        try {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
            sink->set_level(parseLevelString(file.value("level", "debug")));
            sinks.push_back(sink);
        }
        catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", path, e.what());
        }
    }

    return sinks;
}

void LoggingChannels::attachContactTraceSink(const nlohmann::json& traceConfig)
{
    if (!traceConfig.value("enabled", false)) {
        return;
    }

    const std::string path = traceConfig.value("path", DEFAULT_TRACE_FILE);
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
    try {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
    }
    catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Cannot open contact trace file {}: {}", path, e.what());
        return;
    }
    sink->set_level(spdlog::level::trace);

    std::vector<std::string> channels = { "collision", "broadphase" };
    if (traceConfig.contains("channels")) {
        channels = traceConfig["channels"].get<std::vector<std::string>>();
    }

    for (const auto& channel : channels) {
        auto logger = spdlog::get(channel);
        if (!logger) {
            spdlog::warn("Contact trace: unknown channel '{}'", channel);
            continue;
        }
        logger->sinks().push_back(sink);
        spdlog::debug("Contact trace attached to '{}' -> {}", channel, path);
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config)
{
    std::string pattern = DEFAULT_PATTERN;
    int flushIntervalMs = 1000;
    std::vector<spdlog::sink_ptr> sinks;

    try {
        pattern = config.value("pattern", std::string(DEFAULT_PATTERN));
        flushIntervalMs = config.value("flush_interval_ms", 1000);
        sinks = createSharedSinks(config);
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::error("Bad logging config value ({}), using console only", e.what());
        sinks = { std::make_shared<spdlog::sinks::stdout_color_sink_mt>() };
    }

    // Channels pass everything; sinks and per-channel levels filter.
    for (const auto& name : channelNames()) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::trace);
        spdlog::register_logger(logger);
    }

    try {
        attachContactTraceSink(section(config, "contact_trace"));
        const nlohmann::json levels = section(config, "channels");
        for (const auto& [channel, level] : levels.items()) {
            setChannelLevel(channel, parseLevelString(level.get<std::string>()));
        }
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring bad channel settings in logging config: {}", e.what());
    }

    auto fallback = std::make_shared<spdlog::logger>("default", sinks.begin(), sinks.end());
    fallback->set_level(spdlog::level::info);
    spdlog::set_default_logger(fallback);
    spdlog::set_pattern(pattern);
    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
}

void LoggingChannels::shutdown()
{
    for (const auto& name : channelNames()) {
        spdlog::drop(name);
    }
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(const std::string& channel)
{
    if (auto logger = spdlog::get(channel)) {
        return logger;
    }
    return spdlog::default_logger();
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    std::stringstream stream(spec);
    std::string entry;
    while (std::getline(stream, entry, ',')) {
        entry = trim(entry);
        if (entry.empty()) {
            continue;
        }

        const size_t colon = entry.find(':');
        if (colon == std::string::npos) {
            spdlog::warn("Ignoring channel override '{}' (expected channel:level)", entry);
            continue;
        }

        const std::string channel = trim(entry.substr(0, colon));
        const auto level = parseLevelString(trim(entry.substr(colon + 1)));
        if (channel != "*") {
            setChannelLevel(channel, level);
            continue;
        }
        for (const auto& name : channelNames()) {
            if (auto logger = spdlog::get(name)) {
                logger->set_level(level);
            }
        }
    }
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string name = levelStr;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (name == "warning") {
        return spdlog::level::warn;
    }
    if (name == "error") {
        return spdlog::level::err;
    }

    // from_str maps unknown names to off; the sandbox treats them as info.
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', using info", levelStr);
        return spdlog::level::info;
    }
    return level;
}

} // namespace BouncePit
