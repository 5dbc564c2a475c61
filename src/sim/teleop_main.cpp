// src/sim/teleop_main.cpp
#include "sim/teleop_app.hpp"
#include "config/teleop_config.hpp"
#include "utils/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <getopt.h>

namespace {

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nCommand sources:\n");
    printf("  Manual:    key script (default) or a Linux input device (--evdev)\n");
    printf("  Scripted:  Lua scenario calling move() / step_command() / cancel()\n");
    printf("\nOptions:\n");
    printf("  --config PATH         Teleop config YAML (default: config/teleop.yaml)\n");
    printf("  --keys PATH           Key script CSV (tick,keys) for the scripted backend\n");
    printf("  --evdev DEV           Read keys from an event device, e.g. /dev/input/event3\n");
    printf("  --lua SCRIPT          Lua scenario script\n");
    printf("  --dt SEC              Control timestep in seconds\n");
    printf("  --duration SEC        Run duration in seconds (0 = until Ctrl-C)\n");
    printf("  --real-time           Pace ticks to the wall clock\n");
    printf("  --fast                Run as fast as possible (no pacing)\n");
    printf("  --influx              Enable InfluxDB telemetry\n");
    printf("  --log-level LEVEL     trace | debug | info | warn | error\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # Replay keys and a Lua square path, fast-forward:\n");
    printf("  %s --keys config/keys/demo.csv --lua config/lua/square.lua --fast\n\n", prog_name);
    printf("  # Drive from the keyboard in real time until Ctrl-C:\n");
    printf("  %s --evdev /dev/input/event3 --real-time --duration 0\n\n", prog_name);
}

bool parse_seconds(const char* arg, double& out) {
    char* end = nullptr;
    const double v = std::strtod(arg, &end);
    if (end == arg || *end != '\0') return false;
    out = v;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/teleop.yaml";

    // Overrides applied on top of the YAML file
    std::string keys_path, evdev_path, lua_path, log_level;
    double dt_s = 0.0, duration_s = -1.0;
    int real_time = -1;
    bool influx = false;

    static struct option long_options[] = {
        {"config",    required_argument, 0, 'c'},
        {"keys",      required_argument, 0, 'k'},
        {"evdev",     required_argument, 0, 'e'},
        {"lua",       required_argument, 0, 'l'},
        {"dt",        required_argument, 0, 'd'},
        {"duration",  required_argument, 0, 'D'},
        {"real-time", no_argument,       0, 'R'},
        {"fast",      no_argument,       0, 'F'},
        {"influx",    no_argument,       0, 'I'},
        {"log-level", required_argument, 0, 'L'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'k':
                keys_path = optarg;
                break;
            case 'e':
                evdev_path = optarg;
                break;
            case 'l':
                lua_path = optarg;
                break;
            case 'd':
                if (!parse_seconds(optarg, dt_s) || dt_s <= 0 || dt_s > 1.0) {
                    fprintf(stderr, "Error: Invalid timestep: %s (must be 0 < dt <= 1.0)\n", optarg);
                    return 1;
                }
                break;
            case 'D':
                if (!parse_seconds(optarg, duration_s) || duration_s < 0) {
                    fprintf(stderr, "Error: Invalid duration: %s\n", optarg);
                    return 1;
                }
                break;
            case 'R':
                real_time = 1;
                break;
            case 'F':
                real_time = 0;
                break;
            case 'I':
                influx = true;
                break;
            case 'L':
                log_level = optarg;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (!keys_path.empty() && !evdev_path.empty()) {
        fprintf(stderr, "Error: --keys and --evdev are mutually exclusive\n");
        return 1;
    }

    utils::set_level(utils::LogLevel::Info);

    // ========================================================================
    // Load configuration, then apply command-line overrides
    // ========================================================================
    config::TeleopConfig cfg;
    try {
        cfg = config::TeleopConfig::load(config_path);

        if (!keys_path.empty()) {
            cfg.input.backend = "scripted";
            cfg.input.key_script = keys_path;
        }
        if (!evdev_path.empty()) {
            cfg.input.backend = "evdev";
            cfg.input.device = evdev_path;
        }
        if (!lua_path.empty()) cfg.lua_script_path = lua_path;
        if (dt_s > 0.0) cfg.dt_s = dt_s;
        if (duration_s >= 0.0) cfg.duration_s = duration_s;
        if (real_time >= 0) cfg.real_time = (real_time == 1);
        if (influx) cfg.influx.enabled = true;
        if (!log_level.empty()) cfg.log_level = log_level;

        cfg.validate();
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    utils::LogLevel lvl = utils::LogLevel::Info;
    if (utils::parse_level(cfg.log_level, lvl)) {
        utils::set_level(lvl);
    }

    cfg.print_summary();

    // ========================================================================
    // Print configuration summary
    // ========================================================================
    char timestep_str[50], duration_str[50];
    snprintf(timestep_str, sizeof(timestep_str), "%.4f seconds (%.0f Hz)", cfg.dt_s, 1.0 / cfg.dt_s);
    if (cfg.duration_s > 0.0) {
        snprintf(duration_str, sizeof(duration_str), "%.1f seconds", cfg.duration_s);
    } else {
        snprintf(duration_str, sizeof(duration_str), "until Ctrl-C");
    }
    const std::string input = (cfg.input.backend == "evdev")
        ? "evdev " + cfg.input.device
        : "scripted " + (cfg.input.key_script.empty() ? std::string("(no keys)") : cfg.input.key_script);

    printf("\n");
    printf("╔════════════════════════════════════════════════════════════╗\n");
    printf("║            QUADRUPED TELEOP COMMAND CONFIGURATION          ║\n");
    printf("╠════════════════════════════════════════════════════════════╣\n");
    printf("║ Config:     %-48s║\n", cfg.name.c_str());
    printf("║ Input:      %-48s║\n", input.c_str());
    printf("║ Scenario:   %-48s║\n", cfg.lua_script_path.empty() ? "(none)" : cfg.lua_script_path.c_str());
    printf("║ Interrupt:  %-48s║\n", motion::to_string(cfg.arbiter.interrupt_policy));
    printf("║ Timestep:   %-48s║\n", timestep_str);
    printf("║ Duration:   %-48s║\n", duration_str);
    printf("║ Real-time:  %-48s║\n", cfg.real_time ? "yes (1:1 wall clock)" : "no (fast-forward)");
    printf("║ InfluxDB:   %-48s║\n", cfg.influx.enabled ? cfg.influx.url.c_str() : "disabled");
    printf("╚════════════════════════════════════════════════════════════╝\n");
    printf("\n");

    try {
        sim::TeleopApp app(cfg);
        return app.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: %s", e.what());
        return 1;
    }
}
