// src/control/tick_record.hpp
#pragma once

#include <cstdint>
#include <string>

#include "motion/motion_run.hpp"
#include "motion/velocity_command.hpp"

namespace control {

enum class Authority : uint8_t {
    Manual = 0,
    Scripted = 1
};

inline const char* to_string(Authority a) {
    return a == Authority::Manual ? "manual" : "scripted";
}

// Result of one arbiter tick: what was emitted and why.
// Units are embedded in field names.
struct TickRecord {
    uint64_t tick = 0;
    double t_s = 0.0;

    motion::VelocityCommand cmd;
    Authority authority = Authority::Manual;   // source that produced cmd
    std::string label = "idle";
    bool help_visible = false;
    bool operator_override = false;            // scripted run interrupted this tick

    // Scripted run bookkeeping (zero / 0 when no run exists)
    uint32_t run_id = 0;
    motion::RunStatus run_status = motion::RunStatus::Running;
    bool has_run = false;
    double run_elapsed_time_s = 0.0;
    double run_elapsed_distance_m = 0.0;

    /**
     * Enumerate the numeric fields (CSV columns, telemetry fields).
     * The label is a string and is handled by callers directly.
     */
    template<typename Visitor>
    void accept_fields(Visitor& visitor) const {
        visitor.visit("tick", tick);
        visitor.visit("t_s", t_s);
        visitor.visit("lin_vel_x", cmd.lin_vel_x);
        visitor.visit("lin_vel_y", cmd.lin_vel_y);
        visitor.visit("ang_vel", cmd.ang_vel);
        visitor.visit("authority", static_cast<int>(authority));
        visitor.visit("help_visible", help_visible);
        visitor.visit("operator_override", operator_override);
        visitor.visit("run_id", run_id);
        visitor.visit("run_status", has_run ? static_cast<int>(run_status) : -1);
        visitor.visit("run_elapsed_time_s", run_elapsed_time_s);
        visitor.visit("run_elapsed_distance_m", run_elapsed_distance_m);
    }
};

} // namespace control
