#pragma once

#include "ReflectSerializer.h"
#include "Result.h"
#include "SandboxError.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace BouncePit {

/**
 * @brief Process-wide simulation parameters.
 *
 * Gravity and restitution apply identically to every body and every
 * surface; there are no per-body materials. Serializable via
 * ReflectSerializer, so member names are the JSON keys.
 *
 * Use getDefaultWorldSettings() for default values.
 */
struct WorldSettings {
    double gravity;                 // px/s^2, +y is down.
    double restitution;             // Shared by body-body and body-wall contacts.
    double time_step;               // Fixed physics step in seconds.
    uint32_t max_substeps;          // Physics steps allowed per frame tick.
    double max_frame_delta;         // Ceiling applied to each tick's elapsed time.
    double cell_size;               // Spatial hash cell side in px (tuned at runtime).
    double min_cell_size;           // Lower clamp for the tuner.
    double max_cell_size;           // Upper clamp for the tuner.
    double cell_size_radius_factor; // Tuned size = average radius * factor.
    double cell_size_tune_interval; // Seconds of frame time between tunings.
    bool dedupe_pairs;              // Skip pairs already resolved this step.
    double width;                   // Playfield width in px.
    double height;                  // Playfield height in px.
};

/**
 * @brief Defaults matching the playground's feel (800 px/s^2, e = 0.8, 120 Hz).
 *
 * Defined in WorldSettings.cpp to keep tweaks from recompiling every user.
 */
WorldSettings getDefaultWorldSettings();

/**
 * @brief Check that settings describe a runnable world.
 *
 * Rejects non-finite scalars, a non-positive time step, zero substeps, a
 * non-positive frame ceiling, non-positive or inverted cell-size bounds and
 * an empty playfield. Restitution is only required to be finite.
 */
Result<Okay, SandboxError> validateWorldSettings(const WorldSettings& settings);

/**
 * @brief Overlay a JSON document onto @p base and validate the result.
 */
Result<WorldSettings, SandboxError> worldSettingsFromJson(
    const nlohmann::json& doc, const WorldSettings& base);

/**
 * @brief Load settings from a JSON file, using the defaults for missing keys.
 */
Result<WorldSettings, SandboxError> loadWorldSettingsFile(const std::string& path);

inline void to_json(nlohmann::json& j, const WorldSettings& settings)
{
    j = ReflectSerializer::to_json(settings);
}

inline void from_json(const nlohmann::json& j, WorldSettings& settings)
{
    settings = ReflectSerializer::from_json<WorldSettings>(j, getDefaultWorldSettings());
}

} // namespace BouncePit
