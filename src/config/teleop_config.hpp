// src/config/teleop_config.hpp
#pragma once

#include <string>

#include "control/command_arbiter.hpp"
#include "teleop/manual_input_mapper.hpp"
#include "utils/influx.hpp"

namespace config {

struct InputConfig {
    std::string backend = "scripted";            // "scripted" | "evdev"
    std::string device = "/dev/input/event0";    // evdev device node
    std::string key_script;                      // CSV for the scripted backend
    bool hold_last = false;                      // keep last scripted keys after the end
};

/**
 * TeleopConfig - Loads control loop / teleop parameters from YAML
 *
 * Usage:
 *   auto cfg = TeleopConfig::load("config/teleop.yaml");
 *   control::CommandArbiter arb(keys, cfg.teleop, cfg.arbiter, &sink);
 *
 * Falls back to built-in defaults if the file is not found.
 */
class TeleopConfig {
public:
    std::string name = "default";

    // Control loop
    double dt_s = 0.02;
    double duration_s = 20.0;    // 0 = run until interrupted
    bool real_time = false;
    double log_hz = 50.0;

    teleop::TeleopParams teleop;
    control::ArbiterParams arbiter;
    InputConfig input;

    std::string lua_script_path;     // empty = no scripted scenario

    std::string csv_log_path = "teleop_out.csv";
    std::string debug_log_path = "teleop_debug.log";
    bool enable_debug_log_file = false;
    std::string log_level = "info";

    utils::InfluxClient::Config influx;

    /**
     * Load config from YAML file
     * @throws std::runtime_error if file exists but is invalid
     *
     * If the file doesn't exist, returns the default configuration with a warning.
     */
    static TeleopConfig load(const std::string& yaml_path);

    static TeleopConfig get_default();

    /**
     * Validate parameters
     * @throws std::runtime_error if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;
};

// "pause" | "reset" | "cancel"
bool parse_interrupt_policy(const std::string& name, motion::InterruptPolicy& out);

} // namespace config
