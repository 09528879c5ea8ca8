#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace BouncePit {

/**
 * @brief Aggregate statistics about the sandbox.
 *
 * Body aggregates are recomputed on request; the step counters are updated
 * by World after every physics step.
 */
struct SimulationStats {
    // Population.
    uint32_t body_count = 0;      ///< Live bodies.
    uint32_t kinematic_count = 0; ///< Bodies currently held by a pointer.

    // Motion.
    double total_kinetic_energy = 0.0; ///< Sum of 0.5 m |v|^2 over all bodies.
    double avg_speed = 0.0;            ///< Average velocity magnitude, px/s.
    double max_speed = 0.0;            ///< Largest velocity magnitude, px/s.

    // Simulation progress.
    uint64_t step_count = 0;      ///< Physics steps run since construction.
    double simulation_time = 0.0; ///< Simulated seconds since construction.

    // Last step.
    double last_step_ms = 0.0;  ///< Wall time of the last physics step.
    uint32_t cell_count = 0;    ///< Occupied broadphase cells.
    uint32_t pair_tests = 0;    ///< Candidate pairs tested.
    uint32_t contacts = 0;      ///< Pairs that overlapped.
    uint32_t wall_contacts = 0; ///< Body-wall contacts.
    double cell_size = 0.0;     ///< Broadphase cell size in use.

    // Frame driver.
    double fps = 0.0; ///< Frames per second over the last counting window.
};

inline void to_json(nlohmann::json& j, const SimulationStats& stats)
{
    j = nlohmann::json{ { "body_count", stats.body_count },
                        { "kinematic_count", stats.kinematic_count },
                        { "total_kinetic_energy", stats.total_kinetic_energy },
                        { "avg_speed", stats.avg_speed },
                        { "max_speed", stats.max_speed },
                        { "step_count", stats.step_count },
                        { "simulation_time", stats.simulation_time },
                        { "last_step_ms", stats.last_step_ms },
                        { "cell_count", stats.cell_count },
                        { "pair_tests", stats.pair_tests },
                        { "contacts", stats.contacts },
                        { "wall_contacts", stats.wall_contacts },
                        { "cell_size", stats.cell_size },
                        { "fps", stats.fps } };
}

} // namespace BouncePit
