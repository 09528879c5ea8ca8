#include "WorldSettings.h"
#include "LoggingChannels.h"

#include <cmath>
#include <fstream>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace BouncePit {

WorldSettings getDefaultWorldSettings()
{
    return WorldSettings{ .gravity = 800.0,
                          .restitution = 0.8,
                          .time_step = 1.0 / 120.0,
                          .max_substeps = 6,
                          .max_frame_delta = 0.05,
                          .cell_size = 80.0,
                          .min_cell_size = 40.0,
                          .max_cell_size = 120.0,
                          .cell_size_radius_factor = 4.0,
                          .cell_size_tune_interval = 1.2,
                          .dedupe_pairs = false,
                          .width = 960.0,
                          .height = 600.0 };
}

namespace {

bool isPositiveFinite(double value)
{
    return std::isfinite(value) && value > 0.0;
}

} // namespace

Result<Okay, SandboxError> validateWorldSettings(const WorldSettings& settings)
{
    if (!std::isfinite(settings.gravity)) {
        return SandboxError::invalidArgument("gravity must be finite");
    }
    if (!std::isfinite(settings.restitution)) {
        return SandboxError::invalidArgument("restitution must be finite");
    }
    if (!isPositiveFinite(settings.time_step)) {
        return SandboxError::invalidArgument("time_step must be positive");
    }
    if (settings.max_substeps == 0) {
        return SandboxError::invalidArgument("max_substeps must be at least 1");
    }
    if (!isPositiveFinite(settings.max_frame_delta)) {
        return SandboxError::invalidArgument("max_frame_delta must be positive");
    }
    if (!isPositiveFinite(settings.cell_size) || !isPositiveFinite(settings.min_cell_size)
        || !isPositiveFinite(settings.max_cell_size)) {
        return SandboxError::invalidArgument("cell sizes must be positive");
    }
    if (settings.min_cell_size > settings.max_cell_size) {
        return SandboxError::invalidArgument(
            fmt::format(
                "min_cell_size ({}) exceeds max_cell_size ({})",
                settings.min_cell_size,
                settings.max_cell_size));
    }
    if (!isPositiveFinite(settings.cell_size_radius_factor)
        || !isPositiveFinite(settings.cell_size_tune_interval)) {
        return SandboxError::invalidArgument("cell size tuning parameters must be positive");
    }
    if (!isPositiveFinite(settings.width) || !isPositiveFinite(settings.height)) {
        return SandboxError::invalidArgument("playfield width and height must be positive");
    }
    return Okay{};
}

Result<WorldSettings, SandboxError> worldSettingsFromJson(
    const nlohmann::json& doc, const WorldSettings& base)
{
    if (!doc.is_object()) {
        return SandboxError(SandboxError::Code::ConfigFile, "settings document is not an object");
    }

    WorldSettings settings = base;
    try {
        settings = ReflectSerializer::from_json<WorldSettings>(doc, base);
    }
    catch (const nlohmann::json::exception& e) {
        return SandboxError(
            SandboxError::Code::ConfigFile, fmt::format("bad settings value: {}", e.what()));
    }

    auto valid = validateWorldSettings(settings);
    if (valid.isError()) {
        return valid.errorValue();
    }
    return settings;
}

Result<WorldSettings, SandboxError> loadWorldSettingsFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return SandboxError(
            SandboxError::Code::ConfigFile, fmt::format("cannot open settings file: {}", path));
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e) {
        return SandboxError(
            SandboxError::Code::ConfigFile,
            fmt::format("failed to parse settings file {}: {}", path, e.what()));
    }

    auto result = worldSettingsFromJson(doc, getDefaultWorldSettings());
    if (result.isValue()) {
        LoggingChannels::config()->info("Loaded world settings from {}", path);
    }
    return result;
}

} // namespace BouncePit
