// test/test_lua_runtime.cpp
// Unit tests for the Lua scenario bindings

#include "sim/lua_runtime.hpp"
#include "teleop/scripted_key_source.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <vector>

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

using control::Authority;
using motion::VelocityCommand;

class RecordingSink : public motion::CommandSink {
public:
    void apply(const VelocityCommand& cmd) override { commands.push_back(cmd); }
    std::vector<VelocityCommand> commands;
};

void write_script(const char* path, const char* text) {
    std::ofstream f(path);
    f << text;
}

bool is_cmd(const VelocityCommand& c, double x, double y, double yaw) {
    return std::abs(c.lin_vel_x - x) < 1e-9 && std::abs(c.lin_vel_y - y) < 1e-9 &&
           std::abs(c.ang_vel - yaw) < 1e-9;
}

// One Lua step then one arbiter tick, like the application loop
void step_and_tick(sim::LuaRuntime& lua, control::CommandArbiter& arb, bool& lua_ok) {
    lua_ok = lua.step(arb.time_s(), arb.last_record()) && lua_ok;
    arb.tick(0.1);
}

// ============================================================================
// Test Cases
// ============================================================================

bool test_move_and_step_command() {
    const char* path = "/tmp/test_lua_move.lua";
    write_script(path, R"(
calls = 0
function scenario_step(t, state)
  calls = calls + 1
  if calls == 1 then
    local id = move(1.0, nil, 0.3)
    step_command(id, 0.0, 0.0)
  elseif calls == 2 then
    local ok, err = pcall(move, 1.0, -1.0)
    if not ok and string.find(err, "move:") then
      step_command(0.0, 0.0, 0.25)
    end
  elseif state.authority == "manual" and not done then
    done = true
    step_command(0.0, 0.0, -0.25)
  end
end
)");

    teleop::ScriptedKeySource keys;
    RecordingSink sink;
    control::CommandArbiter arb(keys, {}, {}, &sink);
    sim::LuaRuntime lua;

    TEST_ASSERT(lua.init(path, arb), "Script should load");
    TEST_ASSERT(lua.ready(), "Runtime ready after init");

    bool lua_ok = true;
    for (int i = 0; i < 4; ++i) step_and_tick(lua, arb, lua_ok);

    TEST_ASSERT(lua_ok, "No Lua errors expected");
    TEST_ASSERT(sink.commands.size() == 4, "Expected one sink command per tick, got " << sink.commands.size());
    TEST_ASSERT(is_cmd(sink.commands[0], 1.0, 0.0, 0.0), "move() returns run id 1");
    TEST_ASSERT(is_cmd(sink.commands[1], 0.0, 0.0, 0.25), "Bad move raised a catchable Lua error");
    TEST_ASSERT(sink.commands[2].is_zero(), "Tick 3 completes the 0.3 m run with a stop");
    TEST_ASSERT(is_cmd(sink.commands[3], 0.0, 0.0, -0.25), "Script saw authority return to manual");
    TEST_ASSERT(arb.agent().last_finished()->ticks == 3, "Stepped ticks still advance the run");
    TEST_ASSERT(arb.authority() == Authority::Manual, "Arbiter back in MANUAL");
    return true;
}

bool test_cancel_and_resume() {
    const char* path = "/tmp/test_lua_cancel.lua";
    write_script(path, R"(
calls = 0
function scenario_step(t, state)
  calls = calls + 1
  if calls == 1 then
    move(0.5)
  elseif calls == 3 then
    if state.active and cancel() then step_command(0.0, 0.0, 1.0) end
  elseif calls == 5 then
    if not cancel() and not resume() then step_command(0.0, 0.0, 2.0) end
  end
end
)");

    teleop::ScriptedKeySource keys;
    RecordingSink sink;
    control::CommandArbiter arb(keys, {}, {}, &sink);
    sim::LuaRuntime lua;
    TEST_ASSERT(lua.init(path, arb), "Script should load");

    bool lua_ok = true;
    for (int i = 0; i < 5; ++i) step_and_tick(lua, arb, lua_ok);

    TEST_ASSERT(lua_ok, "No Lua errors expected");
    TEST_ASSERT(!arb.agent().active(), "Run cancelled from Lua");
    TEST_ASSERT(arb.agent().last_finished() &&
                arb.agent().last_finished()->status == motion::RunStatus::Cancelled,
                "Run retired as CANCELLED");

    bool saw_cancel_marker = false, saw_noop_marker = false;
    for (const auto& c : sink.commands) {
        if (is_cmd(c, 0.0, 0.0, 1.0)) saw_cancel_marker = true;
        if (is_cmd(c, 0.0, 0.0, 2.0)) saw_noop_marker = true;
    }
    TEST_ASSERT(saw_cancel_marker, "cancel() returned true while active");
    TEST_ASSERT(saw_noop_marker, "cancel() / resume() return false with nothing to act on");
    return true;
}

bool test_state_table() {
    const char* path = "/tmp/test_lua_state.lua";
    write_script(path, R"(
function scenario_init()
  step_command(0.0, 0.0, 7.0)
end

function scenario_step(t, state)
  if state.tick == 0 then
    move(1.0, 1.0)
  elseif state.tick == 3 then
    if state.label == "moving" and state.authority == "scripted" and state.active
       and math.abs(state.elapsed_time_s - 0.3) < 1e-9 and state.lin_vel_x == 1.0
       and math.abs(state.t_s - t) < 1e-12 then
      step_command(0.0, 0.0, 3.0)
    end
  end
end
)");

    teleop::ScriptedKeySource keys;
    RecordingSink sink;
    control::CommandArbiter arb(keys, {}, {}, &sink);
    sim::LuaRuntime lua;
    TEST_ASSERT(lua.init(path, arb), "Script should load");
    TEST_ASSERT(sink.commands.empty(), "Nothing reaches the sink outside a tick");

    bool lua_ok = true;
    for (int i = 0; i < 5; ++i) step_and_tick(lua, arb, lua_ok);
    TEST_ASSERT(sink.commands.size() == 5, "One sink command per tick");
    TEST_ASSERT(is_cmd(sink.commands[0], 0.0, 0.0, 7.0), "scenario_init() step goes out on the first tick");

    bool saw = false;
    for (const auto& c : sink.commands) {
        if (is_cmd(c, 0.0, 0.0, 3.0)) saw = true;
    }
    TEST_ASSERT(lua_ok, "No Lua errors expected");
    TEST_ASSERT(saw, "State table fields match the arbiter");
    return true;
}

bool test_missing_step_function() {
    const char* path = "/tmp/test_lua_no_step.lua";
    write_script(path, "function scenario_init() end\n");

    teleop::ScriptedKeySource keys;
    control::CommandArbiter arb(keys);
    sim::LuaRuntime lua;

    TEST_ASSERT(!lua.init(path, arb), "Script without scenario_step must be rejected");
    TEST_ASSERT(!lua.ready(), "Runtime not ready");
    TEST_ASSERT(!lua.step(0.0, arb.last_record()), "step() fails when not ready");
    return true;
}

bool test_load_errors() {
    teleop::ScriptedKeySource keys;
    control::CommandArbiter arb(keys);
    sim::LuaRuntime lua;

    TEST_ASSERT(!lua.init("/tmp/does_not_exist_scenario.lua", arb), "Missing file rejected");

    const char* path = "/tmp/test_lua_syntax.lua";
    write_script(path, "function scenario_step(t, state\n");
    TEST_ASSERT(!lua.init(path, arb), "Syntax error rejected");
    return true;
}

bool test_runtime_error() {
    const char* path = "/tmp/test_lua_runtime_error.lua";
    write_script(path, R"(
function scenario_step(t, state)
  if t > 0.15 then error("boom") end
end
)");

    teleop::ScriptedKeySource keys;
    control::CommandArbiter arb(keys);
    sim::LuaRuntime lua;
    TEST_ASSERT(lua.init(path, arb), "Script should load");

    TEST_ASSERT(lua.step(0.0, arb.last_record()), "First step succeeds");
    TEST_ASSERT(!lua.step(0.2, arb.last_record()), "error() surfaces as a failed step");
    TEST_ASSERT(lua.ready(), "Runtime stays usable after a step error");
    TEST_ASSERT(lua.step(0.1, arb.last_record()), "Later steps still run");
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Lua Runtime Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    utils::set_level(utils::LogLevel::Warn);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_move_and_step_command);
    RUN_TEST(test_cancel_and_resume);
    RUN_TEST(test_state_table);
    RUN_TEST(test_missing_step_function);
    RUN_TEST(test_load_errors);
    RUN_TEST(test_runtime_error);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    if (failed == 0) {
        std::cout << "✓ All tests passed!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ Some tests failed!" << std::endl;
        return 1;
    }
}
