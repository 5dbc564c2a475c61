// src/control/command_arbiter.cpp
#include "control/command_arbiter.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace control {

CommandArbiter::CommandArbiter(teleop::KeySource& keys,
                               const teleop::TeleopParams& teleop_params,
                               const ArbiterParams& params,
                               motion::CommandSink* sink)
    : keys_(keys),
      mapper_(teleop_params),
      agent_(nullptr),
      params_(params),
      sink_(sink)
{
    LOG_INFO("[Arbiter] Key source=%s, interrupt policy=%s, speeds: x=%.2f y=%.2f m/s, yaw=%.2f rad/s",
             keys_.name(), motion::to_string(params_.interrupt_policy),
             teleop_params.linear_speed_mps, teleop_params.lateral_speed_mps,
             teleop_params.yaw_rate_radps);
}

TickRecord CommandArbiter::tick(double dt_s) {
    if (!std::isfinite(dt_s) || dt_s <= 0.0) {
        throw std::invalid_argument("Invalid control timestep: dt must be finite and > 0");
    }

    // The manual source is polled every tick, authoritative or not, so its
    // edge detection and help toggle stay in step with the device.
    const teleop::ManualOutput& manual = mapper_.update(keys_.poll());

    TickRecord rec;
    rec.tick = ++ticks_;
    t_s_ += dt_s;
    rec.t_s = t_s_;
    rec.help_visible = manual.help_visible;

    if (authority_ == Authority::Scripted && manual.override_requested) {
        interrupt_();
        rec.operator_override = true;
    }

    bool retired = false;
    if (authority_ == Authority::Scripted) {
        rec.cmd = agent_.advance(dt_s);
        rec.authority = Authority::Scripted;

        if (agent_.active()) {
            rec.label = "moving";
        } else {
            // Final scripted tick: its zero command goes out, manual owns the next one
            retired = true;
            rec.label = "idle";
            authority_ = Authority::Manual;
            LOG_INFO("[Arbiter] t=%.3fs scripted run finished, authority -> manual", t_s_);
        }
    } else {
        // Paused runs hold; cancelled ones are retired here
        (void)agent_.advance(dt_s);
        rec.cmd = manual.cmd;
        rec.authority = Authority::Manual;
        rec.label = manual.label;
    }

    fill_run_info_(rec);
    if (retired && agent_.last_finished()) {
        rec.has_run = true;
        rec.run_id = agent_.last_finished()->id;
        rec.run_status = agent_.last_finished()->status;
        rec.run_elapsed_time_s = agent_.last_finished()->elapsed_time_s;
        rec.run_elapsed_distance_m = agent_.last_finished()->elapsed_distance_m;
    }

    if (pending_step_) {
        if (rec.authority == Authority::Manual && !manual.cmd.is_zero()) {
            LOG_DEBUG("[Arbiter] t=%.3fs step_command dropped, operator is driving", t_s_);
        } else {
            rec.cmd = *pending_step_;
            rec.label = rec.cmd.is_zero() ? "idle" : "moving";
        }
        pending_step_.reset();
    }

    if (sink_) {
        sink_->apply(rec.cmd);
    }

    last_ = rec;
    return rec;
}

motion::CancelToken CommandArbiter::move(double speed,
                                         std::optional<double> time_s,
                                         std::optional<double> distance_m,
                                         double heading_rad) {
    motion::MoveRequest req;
    req.speed = speed;
    req.heading_rad = heading_rad;
    req.time_s = time_s;
    req.distance_m = distance_m;
    return move(req);
}

motion::CancelToken CommandArbiter::move(const motion::MoveRequest& req) {
    motion::CancelToken token = agent_.move(req);

    if (authority_ != Authority::Scripted) {
        LOG_INFO("[Arbiter] t=%.3fs move() accepted, authority -> scripted", t_s_);
    }
    authority_ = Authority::Scripted;
    return token;
}

bool CommandArbiter::cancel() {
    if (!agent_.cancel(false)) {
        return false;
    }
    // A scripted run's stop must not be masked by an earlier queued step
    if (authority_ == Authority::Scripted) {
        pending_step_.reset();
    }
    return true;
}

bool CommandArbiter::resume() {
    if (!agent_.resume()) {
        LOG_DEBUG("[Arbiter] resume() with no paused run (no-op)");
        return false;
    }
    authority_ = Authority::Scripted;
    LOG_INFO("[Arbiter] t=%.3fs run resumed, authority -> scripted", t_s_);
    return true;
}

motion::VelocityCommand CommandArbiter::step_command(double lin_vel_x, double lin_vel_y, double ang_vel) {
    const motion::VelocityCommand cmd = agent_.step_command(lin_vel_x, lin_vel_y, ang_vel);
    if (pending_step_) {
        LOG_DEBUG("[Arbiter] t=%.3fs queued step_command replaced", t_s_);
    }
    pending_step_ = cmd;
    return cmd;
}

void CommandArbiter::interrupt_() {
    LOG_INFO("[Arbiter] t=%.3fs operator override, authority -> manual (policy=%s)",
             t_s_, motion::to_string(params_.interrupt_policy));

    switch (params_.interrupt_policy) {
        case motion::InterruptPolicy::Pause:
            agent_.pause(false);
            break;
        case motion::InterruptPolicy::Reset:
            agent_.pause(true);
            break;
        case motion::InterruptPolicy::Cancel:
            // manual command goes out this tick, no separate stop
            agent_.cancel(false);
            break;
    }
    authority_ = Authority::Manual;
}

void CommandArbiter::fill_run_info_(TickRecord& rec) const {
    const auto& run = agent_.run();
    if (!run) return;

    rec.has_run = true;
    rec.run_id = run->id;
    rec.run_status = run->status;
    rec.run_elapsed_time_s = run->elapsed_time_s;
    rec.run_elapsed_distance_m = run->elapsed_distance_m;
}

} // namespace control
