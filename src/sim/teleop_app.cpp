// src/sim/teleop_app.cpp
#include "sim/teleop_app.hpp"
#include "sim/command_recorder.hpp"
#include "sim/command_telemetry.hpp"
#include "sim/console_display.hpp"
#include "sim/lua_runtime.hpp"
#include "sim/tick_log.hpp"
#include "sim/tick_pacer.hpp"
#include "control/command_arbiter.hpp"
#include "teleop/evdev_key_source.hpp"
#include "teleop/scripted_key_source.hpp"
#include "utils/influx.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <csignal>
#include <stdexcept>

namespace sim {

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) { g_stop = 1; }

} // namespace

TeleopApp::TeleopApp(const config::TeleopConfig& cfg) : cfg_(cfg) {
    if (cfg_.enable_debug_log_file) {
        utils::open_log_file(cfg_.debug_log_path);
    }
}

TeleopApp::~TeleopApp() {
    if (cfg_.enable_debug_log_file) {
        utils::close_log_file();
    }
}

void TeleopApp::request_stop() { g_stop = 1; }

std::unique_ptr<teleop::KeySource> TeleopApp::make_key_source_() {
    if (cfg_.input.backend == "evdev") {
        auto src = std::make_unique<teleop::EvdevKeySource>();
        if (!src->open(cfg_.input.device)) {
            return nullptr;
        }
        return src;
    }

    auto src = std::make_unique<teleop::ScriptedKeySource>();
    src->set_hold_last(cfg_.input.hold_last);
    if (!cfg_.input.key_script.empty()) {
        try {
            if (!src->load_csv(cfg_.input.key_script)) {
                return nullptr;
            }
        } catch (const std::runtime_error& e) {
            LOG_ERROR("[TeleopApp] %s", e.what());
            return nullptr;
        }
    } else {
        LOG_INFO("[TeleopApp] No key script, manual source stays idle");
    }
    return src;
}

int TeleopApp::run() {
    const double dt = cfg_.dt_s;

    std::unique_ptr<teleop::KeySource> keys = make_key_source_();
    if (!keys) {
        LOG_ERROR("[TeleopApp] Failed to set up %s input", cfg_.input.backend.c_str());
        return 1;
    }

    CommandRecorder sink;
    control::CommandArbiter arbiter(*keys, cfg_.teleop, cfg_.arbiter, &sink);

    // ---- Lua scenario ----
    LuaRuntime lua;
    bool lua_ready = false;
    if (!cfg_.lua_script_path.empty()) {
        lua_ready = lua.init(cfg_.lua_script_path, arbiter);
        if (!lua_ready) {
            LOG_WARN("[TeleopApp] Lua scenario disabled, manual input only");
        }
    }

    // ---- Outputs ----
    TickLog tick_log(cfg_.log_hz);
    if (!cfg_.csv_log_path.empty() && !tick_log.open(cfg_.csv_log_path)) {
        return 1;
    }

    utils::InfluxClient influx(cfg_.influx);
    ConsoleDisplay display;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    g_stop = 0;

    const uint64_t max_ticks = (cfg_.duration_s > 0.0)
        ? static_cast<uint64_t>(std::llround(cfg_.duration_s / dt))
        : 0;

    LOG_INFO("[TeleopApp] Starting control loop (duration=%.1fs, dt=%.4fs, %s)",
             cfg_.duration_s, dt, cfg_.real_time ? "real-time" : "fast-forward");
    if (max_ticks == 0) {
        LOG_INFO("[TeleopApp] Running until Ctrl-C");
    }

    TickPacer pacer(dt);
    size_t lua_errors = 0;
    uint64_t overrides = 0;

    for (uint64_t n = 0; (max_ticks == 0 || n < max_ticks) && !g_stop; ++n) {
        pacer.begin_tick();

        if (lua_ready && !lua.step(arbiter.time_s(), arbiter.last_record())) {
            lua_errors++;
            lua_ready = false;
            LOG_WARN("[TeleopApp] t=%.3fs Lua scenario stopped after error", arbiter.time_s());
        }

        const control::TickRecord rec = arbiter.tick(dt);
        if (rec.operator_override) overrides++;

        display.update(rec);
        tick_log.write(rec);
        influx.write_point(rec.t_s, command_point(rec));

        if (cfg_.real_time && !pacer.wait_next()) {
            const auto& st = pacer.stats();
            if (st.deadline_misses == 1 || st.deadline_misses % 1000 == 0) {
                LOG_WARN("[t=%.2f] Deadline miss! Total misses: %zu, Max lateness: %.1f us",
                         rec.t_s, st.deadline_misses, st.max_lateness_us);
            }
        }
    }

    if (g_stop) {
        LOG_INFO("[TeleopApp] Stop requested at t=%.3fs", arbiter.time_s());
    }
    if (arbiter.agent().active()) {
        arbiter.cancel();
    }
    // The loop is gone, so the final stop goes to the consumer directly
    if (!arbiter.current().is_zero()) {
        sink.apply(motion::VelocityCommand::zero());
    }

    tick_log.close();

    // ---- Summary ----
    LOG_INFO("========================================");
    LOG_INFO("Run Summary");
    LOG_INFO("========================================");
    LOG_INFO("Ticks: %llu (%.3f s control time)",
             static_cast<unsigned long long>(arbiter.tick_count()), arbiter.time_s());
    LOG_INFO("Commands applied: %zu", sink.count());
    LOG_INFO("Operator overrides: %llu", static_cast<unsigned long long>(overrides));
    if (lua_errors > 0) {
        LOG_INFO("Lua errors: %zu", lua_errors);
    }
    if (cfg_.real_time) {
        const auto& st = pacer.stats();
        LOG_INFO("Deadline misses: %zu (%.2f%%)", st.deadline_misses,
                 st.ticks > 0 ? 100.0 * st.deadline_misses / st.ticks : 0.0);
        LOG_INFO("Max tick work: %.1f us (%.1f%% of dt)", st.max_work_us,
                 100.0 * st.max_work_us / (dt * 1e6));
        if (st.deadline_misses > 0) {
            LOG_INFO("Avg lateness: %.1f us", st.avg_lateness_us);
        }
        LOG_INFO("Final time drift: %.3f ms", pacer.drift_s() * 1000.0);
    }
    LOG_INFO("========================================");

    if (tick_log.rows() > 0) {
        LOG_INFO("CSV written to: %s (%zu rows)", cfg_.csv_log_path.c_str(), tick_log.rows());
    }
    return 0;
}

} // namespace sim
