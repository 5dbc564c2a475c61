// src/motion/agent.hpp
#pragma once

#include <cstdint>
#include <optional>

#include "motion/command_sink.hpp"
#include "motion/motion_run.hpp"
#include "motion/velocity_command.hpp"

namespace motion {

/**
 * Agent - scripted motion sequencer
 *
 * Executes one motion primitive at a time:
 *   - step_command(): one command, right now, no bookkeeping
 *   - move():         a bounded (or cancel-terminated) run, progressed by advance()
 *
 * move() never blocks. It registers the run and returns; every later call to
 * advance(dt) from the control loop moves it forward by one tick.
 *
 * Usage:
 *   motion::Agent agent(&sink);
 *   agent.move(1.0, std::nullopt, 5.0);   // 1 m/s for 5 m, heading 0
 *   while (agent.active()) {
 *       sink.apply(agent.advance(0.02));
 *   }
 */
class Agent {
public:
    explicit Agent(CommandSink* sink = nullptr);

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    /**
     * step_command() - emit exactly one command, to the sink if one is attached
     *
     * Does not touch the current MotionRun. Non-finite components are
     * replaced by 0. Under a CommandArbiter the Agent has no sink and the
     * arbiter emits the returned command on its next tick.
     */
    VelocityCommand step_command(double lin_vel_x, double lin_vel_y, double ang_vel);

    /**
     * move() - start (or replace) a scripted motion
     *
     * @throws std::invalid_argument on a configuration error; in that case
     *         no run is created and the current run is left as it was.
     * @return token that cancels this run on the next tick
     */
    CancelToken move(double speed,
                     std::optional<double> time_s = std::nullopt,
                     std::optional<double> distance_m = std::nullopt,
                     double heading_rad = 0.0);
    CancelToken move(const MoveRequest& req);

    /**
     * advance() - one control tick
     *
     * Returns the command the sequencer wants applied this tick. Runs that
     * complete or were cancelled yield the zero command and are retired
     * (see last_finished()).
     *
     * @throws std::invalid_argument if dt_s is not finite and > 0
     */
    VelocityCommand advance(double dt_s);

    /**
     * cancel() - cancel the current run
     *
     * The run becomes CANCELLED and, with emit_stop, the zero command goes
     * to the sink at once. The run is retired on the next advance(). Returns
     * false (no-op) when no run is active.
     */
    bool cancel(bool emit_stop = true);

    // Freeze the current run. reset_progress zeroes its counters.
    bool pause(bool reset_progress);
    bool resume();

    // A run exists and has not finished (running or paused)
    bool active() const;
    bool running() const;
    bool paused() const;

    const std::optional<MotionRun>& run() const { return run_; }
    const std::optional<MotionRun>& last_finished() const { return last_finished_; }

    void set_sink(CommandSink* sink) { sink_ = sink; }

private:
    void retire_();

    CommandSink* sink_ = nullptr;
    std::optional<MotionRun> run_;
    std::optional<MotionRun> last_finished_;
    std::optional<CancelToken> token_;
    uint32_t next_id_ = 1;
};

} // namespace motion
