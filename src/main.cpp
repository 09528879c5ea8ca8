#include "core/LoggingChannels.h"
#include "core/PointerController.h"
#include "core/Sandbox.h"
#include "core/WorldSettings.h"
#include <args.hxx>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

using namespace BouncePit;

static std::atomic<bool> g_shouldExit{ false };

void signalHandler(int /*signum*/)
{
    g_shouldExit = true;
}

namespace {

// Parses "x,y x,y ..." into pointer positions.
bool parseDragPath(const std::string& text, std::vector<Vector2d>& points)
{
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        const size_t comma = token.find(',');
        if (comma == std::string::npos) {
            return false;
        }
        try {
            points.push_back(
                Vector2d{ std::stod(token.substr(0, comma)), std::stod(token.substr(comma + 1)) });
        }
        catch (const std::exception&) {
            return false;
        }
    }
    return !points.empty();
}

// Logs and reports a rejected setting override.
bool check(const Result<Okay, SandboxError>& result, const char* what)
{
    if (result.isError()) {
        spdlog::error("Invalid {}: {}", what, result.errorValue().message);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Bounce Pit", "Headless driver for the 2D rigid-circle physics sandbox.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., collision:trace,stepper:debug,*:off)",
        { 'C', "channels" });
    args::ValueFlag<std::string> configArg(
        parser, "config", "World settings JSON file (missing keys use defaults)", { 'c', "config" });
    args::ValueFlag<uint32_t> framesArg(
        parser, "frames", "Frames to run (default: 600, 0 = until Ctrl+C)", { 'f', "frames" });
    args::ValueFlag<double> fpsArg(
        parser, "fps", "Display refresh rate driving the ticks (default: 60)", { "fps" });
    args::ValueFlag<uint32_t> bodiesArg(
        parser, "bodies", "Random bodies spawned at startup (default: 14)", { 'b', "bodies" });
    args::ValueFlag<uint32_t> seedArg(parser, "seed", "Random seed", { 's', "seed" });
    args::ValueFlag<double> gravityArg(parser, "gravity", "Gravity in px/s^2", { 'g', "gravity" });
    args::ValueFlag<double> restitutionArg(
        parser, "restitution", "Restitution coefficient", { 'e', "restitution" });
    args::ValueFlag<double> widthArg(parser, "width", "Playfield width in px", { "width" });
    args::ValueFlag<double> heightArg(parser, "height", "Playfield height in px", { "height" });
    args::Flag dedupePairs(
        parser, "dedupe-pairs", "Resolve each pair once per step", { "dedupe-pairs" });
    args::ValueFlag<std::string> dragArg(
        parser,
        "drag",
        "Pointer path \"x,y x,y ...\": press at the first point, one move per frame, release "
        "after the last",
        { "drag" });
    args::ValueFlag<uint32_t> pauseAtArg(
        parser, "pause-at", "Pause after this many frames", { "pause-at" });
    args::Flag realtime(
        parser, "realtime", "Tick from the wall clock instead of a fixed frame time", { "realtime" });
    args::Flag printStats(
        parser, "print-stats", "Print timer statistics on exit", { "print-stats" });
    args::Flag dumpJson(parser, "dump-json", "Print the final state as JSON", { "dump-json" });
    args::Flag diagram(parser, "diagram", "Print an ASCII picture of the final state", { "diagram" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Initialize logging from config file (supports .local override).
    LoggingChannels::initializeFromConfig(args::get(logConfig));
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        spdlog::info("Applied channel overrides: {}", args::get(logChannels));
    }

    WorldSettings settings = getDefaultWorldSettings();
    if (configArg) {
        auto loaded = loadWorldSettingsFile(args::get(configArg));
        if (loaded.isError()) {
            spdlog::error(
                "{}: {}",
                getErrorCodeName(loaded.errorValue().code),
                loaded.errorValue().message);
            return 1;
        }
        settings = loaded.value();
    }
    if (widthArg) settings.width = args::get(widthArg);
    if (heightArg) settings.height = args::get(heightArg);
    if (dedupePairs) settings.dedupe_pairs = true;

    if (!check(validateWorldSettings(settings), "settings")) {
        return 1;
    }

    Sandbox sandbox(settings);
    if (gravityArg && !check(sandbox.setGravity(args::get(gravityArg)), "gravity")) {
        return 1;
    }
    if (restitutionArg
        && !check(sandbox.setRestitution(args::get(restitutionArg)), "restitution")) {
        return 1;
    }
    if (seedArg) {
        sandbox.setRandomSeed(args::get(seedArg));
    }

    std::vector<Vector2d> dragPath;
    if (dragArg && !parseDragPath(args::get(dragArg), dragPath)) {
        spdlog::error("Invalid drag path: '{}'", args::get(dragArg));
        return 1;
    }

    const uint32_t bodyCount = bodiesArg ? args::get(bodiesArg) : Sandbox::INITIAL_BODY_COUNT;
    const uint32_t maxFrames = framesArg ? args::get(framesArg) : 600;
    const double fps = fpsArg ? args::get(fpsArg) : 60.0;
    if (!(fps > 0.0)) {
        spdlog::error("fps must be positive");
        return 1;
    }
    const double frameSeconds = 1.0 / fps;

    sandbox.fillRandom(bodyCount);
    spdlog::info(
        "Starting Bounce Pit: {} bodies, {}x{} playfield, {} frames at {} fps",
        sandbox.getBodyCount(),
        settings.width,
        settings.height,
        maxFrames > 0 ? std::to_string(maxFrames) : "unlimited",
        fps);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    PointerController pointer(sandbox);
    auto lastFrame = std::chrono::steady_clock::now();

    for (uint32_t frame = 0; (maxFrames == 0 || frame < maxFrames) && !g_shouldExit; ++frame) {
        double elapsed = frameSeconds;
        if (realtime) {
            std::this_thread::sleep_until(
                lastFrame + std::chrono::duration<double>(frameSeconds));
            const auto now = std::chrono::steady_clock::now();
            elapsed = std::chrono::duration<double>(now - lastFrame).count();
            lastFrame = now;
        }

        if (!dragPath.empty()) {
            if (frame == 0) {
                auto grabbed = pointer.pointerDown(dragPath.front().x, dragPath.front().y);
                if (grabbed.isError()) {
                    spdlog::warn("Pointer press failed: {}", grabbed.errorValue().message);
                }
            }
            else if (frame < dragPath.size()) {
                auto moved = pointer.pointerMove(dragPath[frame].x, dragPath[frame].y, elapsed);
                if (moved.isError()) {
                    spdlog::warn("Pointer move failed: {}", moved.errorValue().message);
                }
            }
            else if (frame == dragPath.size()) {
                pointer.pointerUp();
            }
        }

        if (pauseAtArg && frame == args::get(pauseAtArg)) {
            sandbox.setPaused(true);
        }

        sandbox.tick(elapsed);
    }

    if (g_shouldExit) {
        spdlog::info("Interrupted, shutting down");
    }

    const SimulationStats stats = sandbox.getStats();
    spdlog::info(
        "Finished: {} bodies, {} steps, {:.2f}s simulated, KE {:.1f}, max speed {:.1f} px/s",
        stats.body_count,
        stats.step_count,
        stats.simulation_time,
        stats.total_kinetic_energy,
        stats.max_speed);

    if (diagram) {
        std::cout << sandbox.toAsciiDiagram();
    }
    if (dumpJson) {
        std::cout << sandbox.toJSON().dump(2) << std::endl;
    }
    if (printStats) {
        std::cout << "\n=== Timer Statistics ===" << std::endl;
        sandbox.dumpTimerStats();
    }

    return 0;
}
