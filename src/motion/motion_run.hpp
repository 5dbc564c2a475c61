// src/motion/motion_run.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "motion/velocity_command.hpp"

namespace motion {

/**
 * MoveRequest - parameters of one scripted "drive on heading" primitive
 *
 * heading is measured in the body frame (0 = forward, +pi/2 = left).
 * time_s / distance_m are optional termination bounds. With both set the
 * first one reached ends the run; with neither the run lasts until cancelled.
 */
struct MoveRequest {
    double speed = 0.0;                    // m/s, >= 0
    double heading_rad = 0.0;
    std::optional<double> time_s;          // s, >= 0
    std::optional<double> distance_m;      // m, >= 0

    /**
     * validate() - reject configuration errors
     * @throws std::invalid_argument on negative or non-finite parameters
     */
    void validate() const;

    bool bounded() const { return time_s.has_value() || distance_m.has_value(); }

    // speed/heading resolved into body-frame translation, zero yaw rate
    VelocityCommand resolve() const;
};

enum class RunStatus : uint8_t {
    Running = 0,
    Paused = 1,      // interrupted by the operator, may resume
    Completed = 2,
    Cancelled = 3
};

const char* to_string(RunStatus s);

// Runtime state of one scripted motion. Dead-reckoned: distance is the
// integral of commanded speed, there is no odometry feedback.
struct MotionRun {
    uint32_t id = 0;
    MoveRequest request;
    VelocityCommand resolved;
    double elapsed_time_s = 0.0;
    double elapsed_distance_m = 0.0;
    uint64_t ticks = 0;
    RunStatus status = RunStatus::Running;

    // Kahan compensation terms of the two sums above
    double time_carry_s = 0.0;
    double distance_carry_m = 0.0;

    void reset_progress() {
        elapsed_time_s = 0.0;
        elapsed_distance_m = 0.0;
        time_carry_s = 0.0;
        distance_carry_m = 0.0;
        ticks = 0;
    }

    bool finished() const {
        return status == RunStatus::Completed || status == RunStatus::Cancelled;
    }
};

/**
 * CancelToken - cooperative cancellation handle for one MotionRun
 *
 * Returned by Agent::move(). Copies share the same flag. A cancel request
 * is observed by the sequencer on its next tick, never mid-tick.
 */
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<bool>(false)) {}

    void cancel() { *flag_ = true; }
    bool cancelled() const { return *flag_; }

private:
    std::shared_ptr<bool> flag_;
};

// What happens to a running scripted motion when the operator takes over.
enum class InterruptPolicy : uint8_t {
    Pause = 0,   // keep elapsed progress, resume() continues where it stopped
    Reset = 1,   // zero elapsed progress, resume() restarts the request
    Cancel = 2   // drop the run
};

const char* to_string(InterruptPolicy p);

/**
 * advance_run() - one control tick of a RUNNING motion
 *
 * Accumulates elapsed time and distance (compensated, so fifty 0.1 s steps
 * sum to exactly 5.0), applies the termination policy with plain >= and
 * returns the command for this tick: the resolved command while running, the
 * zero command on the tick that completes the run.
 * Runs that are not RUNNING are left untouched and yield the zero command.
 */
VelocityCommand advance_run(MotionRun& run, double dt_s);

} // namespace motion
