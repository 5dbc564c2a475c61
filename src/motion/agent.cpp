// src/motion/agent.cpp
#include "motion/agent.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace motion {

namespace {

double finite_or_zero(double v, const char* axis) {
    if (std::isfinite(v)) return v;
    LOG_WARN("[Agent] step_command: non-finite %s replaced by 0", axis);
    return 0.0;
}

} // namespace

Agent::Agent(CommandSink* sink) : sink_(sink) {}

VelocityCommand Agent::step_command(double lin_vel_x, double lin_vel_y, double ang_vel) {
    VelocityCommand cmd;
    cmd.lin_vel_x = finite_or_zero(lin_vel_x, "lin_vel_x");
    cmd.lin_vel_y = finite_or_zero(lin_vel_y, "lin_vel_y");
    cmd.ang_vel = finite_or_zero(ang_vel, "ang_vel");

    LOG_TRACE("[Agent] step_command x=%.3f y=%.3f yaw=%.3f",
              cmd.lin_vel_x, cmd.lin_vel_y, cmd.ang_vel);

    if (sink_) {
        sink_->apply(cmd);
    }
    return cmd;
}

CancelToken Agent::move(double speed,
                        std::optional<double> time_s,
                        std::optional<double> distance_m,
                        double heading_rad) {
    MoveRequest req;
    req.speed = speed;
    req.heading_rad = heading_rad;
    req.time_s = time_s;
    req.distance_m = distance_m;
    return move(req);
}

CancelToken Agent::move(const MoveRequest& req) {
    req.validate();

    if (active()) {
        LOG_INFO("[Agent] Run #%u replaced (%s, t=%.2fs, d=%.2fm)",
                 run_->id, to_string(run_->status),
                 run_->elapsed_time_s, run_->elapsed_distance_m);
    }

    MotionRun run;
    run.id = next_id_++;
    run.request = req;
    run.resolved = req.resolve();
    run.status = RunStatus::Running;
    run_ = run;

    CancelToken token;
    token_ = token;

    if (!req.bounded()) {
        LOG_INFO("[Agent] Run #%u: speed=%.2f m/s heading=%.3f rad, no time/distance bound "
                 "(runs until cancelled)", run.id, req.speed, req.heading_rad);
    } else {
        const std::string time_str = req.time_s ? std::to_string(*req.time_s) + "s" : "-";
        const std::string dist_str = req.distance_m ? std::to_string(*req.distance_m) + "m" : "-";
        LOG_INFO("[Agent] Run #%u: speed=%.2f m/s heading=%.3f rad time=%s distance=%s",
                 run.id, req.speed, req.heading_rad, time_str.c_str(), dist_str.c_str());
    }

    return token;
}

VelocityCommand Agent::advance(double dt_s) {
    if (!std::isfinite(dt_s) || dt_s <= 0.0) {
        throw std::invalid_argument("Invalid control timestep: dt must be finite and > 0");
    }

    if (!run_) {
        return VelocityCommand::zero();
    }

    // Cancellation requested through the token since the last tick
    if (token_ && token_->cancelled() && !run_->finished()) {
        run_->status = RunStatus::Cancelled;
        LOG_INFO("[Agent] Run #%u cancelled by token", run_->id);
    }

    if (run_->status == RunStatus::Cancelled) {
        retire_();
        return VelocityCommand::zero();
    }

    if (run_->status == RunStatus::Paused) {
        return VelocityCommand::zero();
    }

    const VelocityCommand cmd = advance_run(*run_, dt_s);

    if (run_->status == RunStatus::Completed) {
        LOG_INFO("[Agent] Run #%u completed after %llu ticks (t=%.3fs, d=%.3fm)",
                 run_->id, static_cast<unsigned long long>(run_->ticks),
                 run_->elapsed_time_s, run_->elapsed_distance_m);
        retire_();
    }

    return cmd;
}

bool Agent::cancel(bool emit_stop) {
    if (!active()) {
        LOG_DEBUG("[Agent] cancel() with no active run (no-op)");
        return false;
    }

    run_->status = RunStatus::Cancelled;
    LOG_INFO("[Agent] Run #%u cancelled (t=%.3fs, d=%.3fm)",
             run_->id, run_->elapsed_time_s, run_->elapsed_distance_m);

    if (emit_stop && sink_) {
        sink_->apply(VelocityCommand::zero());
    }
    return true;
}

bool Agent::pause(bool reset_progress) {
    if (!running()) return false;

    run_->status = RunStatus::Paused;
    if (reset_progress) {
        run_->reset_progress();
    }
    LOG_INFO("[Agent] Run #%u paused%s", run_->id, reset_progress ? " (progress reset)" : "");
    return true;
}

bool Agent::resume() {
    if (!paused()) return false;

    run_->status = RunStatus::Running;
    LOG_INFO("[Agent] Run #%u resumed at t=%.3fs, d=%.3fm",
             run_->id, run_->elapsed_time_s, run_->elapsed_distance_m);
    return true;
}

bool Agent::active() const {
    return run_.has_value() && !run_->finished();
}

bool Agent::running() const {
    return run_.has_value() && run_->status == RunStatus::Running;
}

bool Agent::paused() const {
    return run_.has_value() && run_->status == RunStatus::Paused;
}

void Agent::retire_() {
    last_finished_ = run_;
    run_.reset();
    token_.reset();
}

} // namespace motion
