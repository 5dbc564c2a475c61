// src/sim/lua_runtime.hpp
#pragma once

#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "control/command_arbiter.hpp"
#include "control/tick_record.hpp"

namespace sim {

/**
 * LuaRuntime - scripting harness for scripted motions
 *
 * The script may define scenario_init() and must define
 * scenario_step(t, state), called once per control tick before the arbiter
 * ticks. It drives the robot through these globals:
 *
 *   move(speed [, time [, distance [, heading]]])   -- nil = no bound
 *   step_command(x, y, yaw)
 *   cancel()
 *   resume()
 *
 * state = { tick, t_s, authority, label, active, paused,
 *           run_id, elapsed_time_s, elapsed_distance_m,
 *           lin_vel_x, lin_vel_y, ang_vel }
 */
class LuaRuntime {
public:
    LuaRuntime() = default;
    ~LuaRuntime();

    LuaRuntime(const LuaRuntime&) = delete;
    LuaRuntime& operator=(const LuaRuntime&) = delete;

    // arbiter must outlive this runtime
    bool init(const std::string& lua_script_path, control::CommandArbiter& arbiter);

    bool step(double t_s, const control::TickRecord& last);

    bool ready() const { return L_ != nullptr; }

private:
    lua_State* L_{nullptr};
    control::CommandArbiter* arbiter_{nullptr};

    void register_bindings_();
    void push_state_table_(double t_s, const control::TickRecord& last);
};

} // namespace sim
