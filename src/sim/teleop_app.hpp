// src/sim/teleop_app.hpp
#pragma once

#include <cstdint>
#include <memory>

#include "config/teleop_config.hpp"
#include "teleop/keys.hpp"

namespace sim {

/**
 * TeleopApp - the teleop control loop
 *
 * Per tick:
 *   1. Lua scenario_step(t, state)   (may call move / cancel / step_command)
 *   2. arbiter tick                   (poll keys, pick source, emit command)
 *   3. console label / help, CSV, InfluxDB
 *   4. real-time pacing (optional)
 *
 * duration_s == 0 runs until SIGINT / SIGTERM.
 */
class TeleopApp {
public:
    explicit TeleopApp(const config::TeleopConfig& cfg);
    ~TeleopApp();

    TeleopApp(const TeleopApp&) = delete;
    TeleopApp& operator=(const TeleopApp&) = delete;

    // Returns the process exit code
    int run();

    // Async-signal-safe stop request
    static void request_stop();

private:
    std::unique_ptr<teleop::KeySource> make_key_source_();

    config::TeleopConfig cfg_;
};

} // namespace sim
