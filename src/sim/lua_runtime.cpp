// src/sim/lua_runtime.cpp
#include "lua_runtime.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <exception>

namespace sim {

namespace {

control::CommandArbiter* arbiter_of(lua_State* L) {
    return static_cast<control::CommandArbiter*>(lua_touserdata(L, lua_upvalueindex(1)));
}

// C++ exceptions must not cross the Lua C frames; this runs the call and
// hands back the message so the binding can raise a Lua error afterwards.
bool try_move(control::CommandArbiter& arb, const motion::MoveRequest& req,
              uint32_t& run_id, char* err, size_t err_len) {
    try {
        arb.move(req);
        run_id = arb.agent().run() ? arb.agent().run()->id : 0;
        return true;
    } catch (const std::exception& e) {
        std::snprintf(err, err_len, "%s", e.what());
        return false;
    }
}

int l_move(lua_State* L) {
    control::CommandArbiter* arb = arbiter_of(L);

    motion::MoveRequest req;
    req.speed = luaL_checknumber(L, 1);
    if (!lua_isnoneornil(L, 2)) req.time_s = luaL_checknumber(L, 2);
    if (!lua_isnoneornil(L, 3)) req.distance_m = luaL_checknumber(L, 3);
    if (!lua_isnoneornil(L, 4)) req.heading_rad = luaL_checknumber(L, 4);

    char err[256] = {0};
    uint32_t run_id = 0;
    if (!try_move(*arb, req, run_id, err, sizeof(err))) {
        return luaL_error(L, "move: %s", err);
    }
    lua_pushinteger(L, static_cast<lua_Integer>(run_id));
    return 1;
}

int l_step_command(lua_State* L) {
    control::CommandArbiter* arb = arbiter_of(L);
    const double x = luaL_checknumber(L, 1);
    const double y = luaL_checknumber(L, 2);
    const double yaw = luaL_checknumber(L, 3);
    arb->step_command(x, y, yaw);
    return 0;
}

int l_cancel(lua_State* L) {
    lua_pushboolean(L, arbiter_of(L)->cancel());
    return 1;
}

int l_resume(lua_State* L) {
    lua_pushboolean(L, arbiter_of(L)->resume());
    return 1;
}

} // namespace

LuaRuntime::~LuaRuntime() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaRuntime::init(const std::string& lua_script_path, control::CommandArbiter& arbiter) {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    arbiter_ = &arbiter;

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);
    register_bindings_();

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    lua_getglobal(L_, "scenario_step");
    const bool has_step = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    if (!has_step) {
        LOG_ERROR("[Lua] %s does not define scenario_step(t, state)", lua_script_path.c_str());
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    // Optional scenario_init()
    lua_getglobal(L_, "scenario_init");
    if (lua_isfunction(L_, -1)) {
        if (lua_pcall(L_, 0, 0, 0) != LUA_OK) {
            LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
            lua_close(L_);
            L_ = nullptr;
            return false;
        }
    } else {
        lua_pop(L_, 1);
    }

    LOG_INFO("[Lua] Scenario loaded: %s", lua_script_path.c_str());
    return true;
}

void LuaRuntime::register_bindings_() {
    auto reg = [&](const char* name, lua_CFunction fn) {
        lua_pushlightuserdata(L_, arbiter_);
        lua_pushcclosure(L_, fn, 1);
        lua_setglobal(L_, name);
    };

    reg("move", l_move);
    reg("step_command", l_step_command);
    reg("cancel", l_cancel);
    reg("resume", l_resume);
}

void LuaRuntime::push_state_table_(double t_s, const control::TickRecord& last) {
    lua_newtable(L_);

    auto set_num = [&](const char* k, double v) {
        lua_pushnumber(L_, v);
        lua_setfield(L_, -2, k);
    };
    auto set_bool = [&](const char* k, bool v) {
        lua_pushboolean(L_, v ? 1 : 0);
        lua_setfield(L_, -2, k);
    };
    auto set_str = [&](const char* k, const char* v) {
        lua_pushstring(L_, v);
        lua_setfield(L_, -2, k);
    };

    const motion::Agent& agent = arbiter_->agent();

    set_num("tick", static_cast<double>(last.tick));
    set_num("t_s", t_s);
    set_str("authority", control::to_string(arbiter_->authority()));
    set_str("label", last.label.c_str());
    set_bool("active", agent.active());
    set_bool("paused", agent.paused());

    if (agent.run()) {
        set_num("run_id", agent.run()->id);
        set_num("elapsed_time_s", agent.run()->elapsed_time_s);
        set_num("elapsed_distance_m", agent.run()->elapsed_distance_m);
    } else {
        set_num("run_id", 0);
        set_num("elapsed_time_s", 0.0);
        set_num("elapsed_distance_m", 0.0);
    }

    set_num("lin_vel_x", last.cmd.lin_vel_x);
    set_num("lin_vel_y", last.cmd.lin_vel_y);
    set_num("ang_vel", last.cmd.ang_vel);
}

bool LuaRuntime::step(double t_s, const control::TickRecord& last) {
    if (!L_) return false;

    lua_getglobal(L_, "scenario_step");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] scenario_step() missing");
        return false;
    }

    lua_pushnumber(L_, t_s);
    push_state_table_(t_s, last);

    if (lua_pcall(L_, 2, 0, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_step failed at t=%.3fs: %s", t_s, lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }
    return true;
}

} // namespace sim
