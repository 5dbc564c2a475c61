// src/control/command_arbiter.hpp
#pragma once

#include <cstdint>
#include <optional>

#include "control/tick_record.hpp"
#include "motion/agent.hpp"
#include "motion/command_sink.hpp"
#include "motion/motion_run.hpp"
#include "teleop/keys.hpp"
#include "teleop/manual_input_mapper.hpp"

namespace control {

struct ArbiterParams {
    motion::InterruptPolicy interrupt_policy = motion::InterruptPolicy::Pause;
};

/**
 * CommandArbiter - decides each tick whether manual input or the scripted
 * sequencer owns the output command
 *
 * State machine (initial MANUAL):
 *   MANUAL   → SCRIPTED  move() accepted, or resume() of an interrupted run
 *   SCRIPTED → MANUAL    run completed / cancelled, or a motion key pressed
 *                        (operator interrupt, handled per InterruptPolicy)
 *
 * Usage (external control loop):
 *   control::CommandArbiter arb(keys, teleop_params, {}, &sink);
 *   arb.move(1.0, std::nullopt, 5.0);
 *   for (;;) {
 *       auto rec = arb.tick(dt);   // rec.cmd already handed to sink
 *       ...step physics...
 *   }
 *
 * Single-threaded; all calls must come from the control loop.
 */
class CommandArbiter {
public:
    CommandArbiter(teleop::KeySource& keys,
                   const teleop::TeleopParams& teleop_params = {},
                   const ArbiterParams& params = {},
                   motion::CommandSink* sink = nullptr);

    CommandArbiter(const CommandArbiter&) = delete;
    CommandArbiter& operator=(const CommandArbiter&) = delete;

    /**
     * tick() - one control step
     *
     * Polls the key source, advances the sequencer and emits exactly one
     * command (to the sink, if attached, and in the returned record).
     *
     * @throws std::invalid_argument if dt_s is not finite and > 0
     */
    TickRecord tick(double dt_s);

    // ---- Scripting surface ----

    // @throws std::invalid_argument on a configuration error (state unchanged)
    motion::CancelToken move(double speed,
                             std::optional<double> time_s = std::nullopt,
                             std::optional<double> distance_m = std::nullopt,
                             double heading_rad = 0.0);
    motion::CancelToken move(const motion::MoveRequest& req);

    // Marks the run CANCELLED. Its stop goes out as the next tick's command.
    bool cancel();

    // Continue a run interrupted by the operator. False if none is paused.
    bool resume();

    /**
     * step_command() - queue one command for the next tick
     *
     * The next tick() emits it in place of the arbitrated command, unless the
     * operator is driving on that tick. Authority, the tick count and run
     * counters are left alone. A later call before the tick replaces it.
     */
    motion::VelocityCommand step_command(double lin_vel_x, double lin_vel_y, double ang_vel);

    // ---- Queries ----

    Authority authority() const { return authority_; }
    const motion::VelocityCommand& current() const { return last_.cmd; }
    const TickRecord& last_record() const { return last_; }
    uint64_t tick_count() const { return ticks_; }
    double time_s() const { return t_s_; }

    const motion::Agent& agent() const { return agent_; }
    const teleop::ManualInputMapper& mapper() const { return mapper_; }

    const ArbiterParams& params() const { return params_; }
    void set_interrupt_policy(motion::InterruptPolicy p) { params_.interrupt_policy = p; }

private:
    void interrupt_();
    void fill_run_info_(TickRecord& rec) const;

    teleop::KeySource& keys_;
    teleop::ManualInputMapper mapper_;
    motion::Agent agent_;
    ArbiterParams params_;
    motion::CommandSink* sink_ = nullptr;

    Authority authority_ = Authority::Manual;
    uint64_t ticks_ = 0;
    double t_s_ = 0.0;
    TickRecord last_;
    std::optional<motion::VelocityCommand> pending_step_;
};

} // namespace control
