// src/config/teleop_config.cpp
#include "config/teleop_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace config {

bool parse_interrupt_policy(const std::string& name, motion::InterruptPolicy& out) {
    if (name == "pause") {
        out = motion::InterruptPolicy::Pause;
    } else if (name == "reset") {
        out = motion::InterruptPolicy::Reset;
    } else if (name == "cancel") {
        out = motion::InterruptPolicy::Cancel;
    } else {
        return false;
    }
    return true;
}

TeleopConfig TeleopConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[TeleopConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[TeleopConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[TeleopConfig] Loading config from: %s", yaml_path.c_str());

    TeleopConfig cfg = get_default();

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        cfg.name = root["name"].as<std::string>(cfg.name);

        if (root["control"]) {
            auto c = root["control"];
            cfg.dt_s = c["dt_s"].as<double>(cfg.dt_s);
            cfg.duration_s = c["duration_s"].as<double>(cfg.duration_s);
            cfg.real_time = c["real_time"].as<bool>(cfg.real_time);
            cfg.log_hz = c["log_hz"].as<double>(cfg.log_hz);
        }

        if (root["teleop"]) {
            auto t = root["teleop"];
            cfg.teleop.linear_speed_mps = t["linear_speed_mps"].as<double>(cfg.teleop.linear_speed_mps);
            cfg.teleop.lateral_speed_mps = t["lateral_speed_mps"].as<double>(cfg.teleop.lateral_speed_mps);
            cfg.teleop.yaw_rate_radps = t["yaw_rate_radps"].as<double>(cfg.teleop.yaw_rate_radps);
        }

        if (root["arbiter"]) {
            const std::string policy = root["arbiter"]["interrupt_policy"].as<std::string>("pause");
            if (!parse_interrupt_policy(policy, cfg.arbiter.interrupt_policy)) {
                throw std::runtime_error("Invalid interrupt_policy '" + policy +
                                         "': expected pause, reset or cancel");
            }
        }

        if (root["input"]) {
            auto in = root["input"];
            cfg.input.backend = in["backend"].as<std::string>(cfg.input.backend);
            cfg.input.device = in["device"].as<std::string>(cfg.input.device);
            cfg.input.key_script = in["key_script"].as<std::string>(cfg.input.key_script);
            cfg.input.hold_last = in["hold_last"].as<bool>(cfg.input.hold_last);
        }

        if (root["scenario"]) {
            cfg.lua_script_path = root["scenario"]["lua_script"].as<std::string>(cfg.lua_script_path);
        }

        if (root["output"]) {
            auto out = root["output"];
            cfg.csv_log_path = out["csv_path"].as<std::string>(cfg.csv_log_path);
            cfg.debug_log_path = out["debug_log_path"].as<std::string>(cfg.debug_log_path);
            cfg.enable_debug_log_file = out["debug_log"].as<bool>(cfg.enable_debug_log_file);
            cfg.log_level = out["log_level"].as<std::string>(cfg.log_level);
        }

        if (root["influx"]) {
            auto inf = root["influx"];
            cfg.influx.enabled = inf["enabled"].as<bool>(cfg.influx.enabled);
            cfg.influx.url = inf["url"].as<std::string>(cfg.influx.url);
            cfg.influx.token = inf["token"].as<std::string>(cfg.influx.token);
            cfg.influx.org = inf["org"].as<std::string>(cfg.influx.org);
            cfg.influx.bucket = inf["bucket"].as<std::string>(cfg.influx.bucket);
            cfg.influx.write_interval_s = inf["write_interval_s"].as<double>(cfg.influx.write_interval_s);
            cfg.influx.batch_size = inf["batch_size"].as<int>(cfg.influx.batch_size);
        }

        cfg.validate();

        LOG_INFO("[TeleopConfig] Successfully loaded: %s", cfg.name.c_str());
        return cfg;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[TeleopConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[TeleopConfig] Load error: ") + e.what()
        );
    }
}

TeleopConfig TeleopConfig::get_default() {
    TeleopConfig cfg;
    cfg.name = "default";
    return cfg;
}

void TeleopConfig::validate() const {
    if (!std::isfinite(dt_s) || dt_s <= 0.0 || dt_s > 1.0) {
        throw std::runtime_error("Invalid dt_s: must be 0 < dt <= 1.0");
    }
    if (!std::isfinite(duration_s) || duration_s < 0.0) {
        throw std::runtime_error("Invalid duration_s: must be >= 0");
    }
    if (!std::isfinite(log_hz) || log_hz < 0.0) {
        throw std::runtime_error("Invalid log_hz: must be >= 0");
    }

    if (!std::isfinite(teleop.linear_speed_mps) || teleop.linear_speed_mps < 0.0) {
        throw std::runtime_error("Invalid linear_speed_mps: must be >= 0");
    }
    if (!std::isfinite(teleop.lateral_speed_mps) || teleop.lateral_speed_mps < 0.0) {
        throw std::runtime_error("Invalid lateral_speed_mps: must be >= 0");
    }
    if (!std::isfinite(teleop.yaw_rate_radps) || teleop.yaw_rate_radps < 0.0) {
        throw std::runtime_error("Invalid yaw_rate_radps: must be >= 0");
    }

    if (input.backend != "scripted" && input.backend != "evdev") {
        throw std::runtime_error("Invalid input backend '" + input.backend +
                                 "': expected scripted or evdev");
    }
    if (input.backend == "evdev" && input.device.empty()) {
        throw std::runtime_error("Invalid input device: evdev backend needs a device path");
    }

    utils::LogLevel lvl;
    if (!utils::parse_level(log_level, lvl)) {
        throw std::runtime_error("Invalid log_level '" + log_level + "'");
    }

    if (influx.enabled && influx.write_interval_s <= 0.0) {
        throw std::runtime_error("Invalid influx write_interval_s: must be > 0");
    }
    if (influx.enabled && influx.batch_size < 1) {
        throw std::runtime_error("Invalid influx batch_size: must be >= 1");
    }

    LOG_DEBUG("[TeleopConfig] Validation passed");
}

void TeleopConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Teleop Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    LOG_INFO("----------------------------------------");
    LOG_INFO("Control: dt=%.4fs (%.0f Hz), duration=%.1fs, real-time=%s",
             dt_s, 1.0 / dt_s, duration_s, real_time ? "yes" : "no");
    LOG_INFO("Manual speeds: x=%.2f m/s, y=%.2f m/s, yaw=%.2f rad/s",
             teleop.linear_speed_mps, teleop.lateral_speed_mps, teleop.yaw_rate_radps);
    LOG_INFO("Interrupt policy: %s", motion::to_string(arbiter.interrupt_policy));
    if (input.backend == "evdev") {
        LOG_INFO("Input: evdev %s", input.device.c_str());
    } else {
        LOG_INFO("Input: scripted %s", input.key_script.empty() ? "(no keys)" : input.key_script.c_str());
    }
    if (!lua_script_path.empty()) {
        LOG_INFO("Lua scenario: %s", lua_script_path.c_str());
    }
    LOG_INFO("CSV log: %s", csv_log_path.c_str());
    LOG_INFO("InfluxDB: %s", influx.enabled ? influx.url.c_str() : "disabled");
    LOG_INFO("========================================");
}

} // namespace config
