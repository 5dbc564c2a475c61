// src/motion/motion_run.cpp
#include "motion/motion_run.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace motion {

namespace {

void kahan_add(double& sum, double& carry, double value) {
    const double y = value - carry;
    const double t = sum + y;
    carry = (t - sum) - y;
    sum = t;
}

} // namespace

void MoveRequest::validate() const {
    if (!std::isfinite(speed)) {
        throw std::invalid_argument("Invalid move speed: must be finite");
    }
    if (speed < 0.0) {
        throw std::invalid_argument("Invalid move speed: must be >= 0 (use heading to reverse)");
    }
    if (!std::isfinite(heading_rad)) {
        throw std::invalid_argument("Invalid move heading: must be finite");
    }
    if (time_s) {
        if (!std::isfinite(*time_s) || *time_s < 0.0) {
            throw std::invalid_argument("Invalid move time: must be finite and >= 0, got " +
                                        std::to_string(*time_s));
        }
    }
    if (distance_m) {
        if (!std::isfinite(*distance_m) || *distance_m < 0.0) {
            throw std::invalid_argument("Invalid move distance: must be finite and >= 0, got " +
                                        std::to_string(*distance_m));
        }
    }
}

VelocityCommand MoveRequest::resolve() const {
    VelocityCommand cmd;
    cmd.lin_vel_x = speed * std::cos(heading_rad);
    cmd.lin_vel_y = speed * std::sin(heading_rad);
    cmd.ang_vel = 0.0;
    return cmd;
}

const char* to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Running:   return "running";
        case RunStatus::Paused:    return "paused";
        case RunStatus::Completed: return "completed";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(InterruptPolicy p) {
    switch (p) {
        case InterruptPolicy::Pause:  return "pause";
        case InterruptPolicy::Reset:  return "reset";
        case InterruptPolicy::Cancel: return "cancel";
    }
    return "unknown";
}

VelocityCommand advance_run(MotionRun& run, double dt_s) {
    if (run.status != RunStatus::Running) {
        return VelocityCommand::zero();
    }

    kahan_add(run.elapsed_time_s, run.time_carry_s, dt_s);
    kahan_add(run.elapsed_distance_m, run.distance_carry_m, run.request.speed * dt_s);
    run.ticks++;

    const auto& req = run.request;
    if (req.time_s && run.elapsed_time_s >= *req.time_s) {
        run.status = RunStatus::Completed;
    } else if (req.distance_m && run.elapsed_distance_m >= *req.distance_m) {
        run.status = RunStatus::Completed;
    }

    if (run.status == RunStatus::Completed) {
        return VelocityCommand::zero();
    }
    return run.resolved;
}

} // namespace motion
