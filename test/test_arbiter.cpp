// test/test_arbiter.cpp
/**
 * Unit Test: CommandArbiter
 *
 * Drives the arbiter with a scripted key sequence and checks which source
 * owns each emitted command.
 *
 * Test Coverage:
 *   1. MANUAL → SCRIPTED → MANUAL round trip
 *   2. Operator override with pause / reset / cancel policies
 *   3. Explicit cancel
 *   4. Configuration errors leave the arbiter in MANUAL
 *   5. step_command isolation
 *   6. One sink command per tick, in tick order
 */

#include "control/command_arbiter.hpp"
#include "teleop/scripted_key_source.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void check(bool ok, const std::string& msg) {
        if (ok) pass(msg); else fail(msg);
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

using control::Authority;
using control::CommandArbiter;
using control::TickRecord;
using motion::InterruptPolicy;
using motion::VelocityCommand;
using teleop::Key;
using teleop::KeySet;
using teleop::ScriptedKeySource;

class RecordingSink : public motion::CommandSink {
public:
    void apply(const VelocityCommand& cmd) override { commands.push_back(cmd); }
    std::vector<VelocityCommand> commands;
};

bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

const double kDt = 0.1;

// Test 1: round trip with Up held the whole time
void test_round_trip(TestResult& result) {
    std::cout << "\n=== Test 1: MANUAL → SCRIPTED → MANUAL ===\n";

    ScriptedKeySource keys({KeySet{Key::Up}}, true);
    RecordingSink sink;
    CommandArbiter arb(keys, {}, {}, &sink);

    TickRecord rec = arb.tick(kDt);
    result.check(rec.authority == Authority::Manual && near(rec.cmd.lin_vel_x, 0.5),
                 "Initial MANUAL, Up gives forward 0.5 m/s");
    result.check(rec.label == "forward", "Manual label is the direction name");

    arb.move(1.0, std::nullopt, 0.5);
    result.check(arb.authority() == Authority::Scripted, "move() switches to SCRIPTED");

    std::vector<TickRecord> scripted;
    for (int i = 0; i < 5; ++i) scripted.push_back(arb.tick(kDt));

    bool all_scripted = true;
    for (int i = 0; i < 4; ++i) {
        all_scripted = all_scripted && scripted[i].authority == Authority::Scripted &&
                       near(scripted[i].cmd.lin_vel_x, 1.0) && scripted[i].label == "moving";
    }
    result.check(all_scripted, "Ticks 1-4 of the run emit the scripted command with label 'moving'");
    result.check(scripted[4].authority == Authority::Scripted && scripted[4].cmd.is_zero(),
                 "Completing tick emits the zero command");
    result.check(scripted[4].has_run && scripted[4].run_status == motion::RunStatus::Completed,
                 "Completing tick reports the COMPLETED run");
    result.check(arb.authority() == Authority::Manual, "Authority back to MANUAL after completion");

    rec = arb.tick(kDt);
    result.check(rec.authority == Authority::Manual && rec.cmd == arb.mapper().latched() &&
                 near(rec.cmd.lin_vel_x, 0.5),
                 "First command after return equals the latched manual command");
    result.check(sink.commands.size() == 7, "Sink received one command per tick");
    result.check(sink.commands.back() == rec.cmd, "Sink commands are in tick order");
}

// Keys: nothing for 5 ticks, Left for 3, then nothing
ScriptedKeySource override_keys() {
    ScriptedKeySource keys;
    keys.append(KeySet{}, 5);
    keys.append(KeySet{Key::Left}, 3);
    return keys;
}

// Runs 5 scripted ticks of a 1 m move, then the operator presses Left
TickRecord run_until_override(CommandArbiter& arb) {
    arb.move(1.0, std::nullopt, 1.0);
    for (int i = 0; i < 5; ++i) arb.tick(kDt);
    return arb.tick(kDt);
}

int ticks_to_finish(CommandArbiter& arb) {
    int n = 0;
    while (arb.authority() == Authority::Scripted && n < 1000) {
        arb.tick(kDt);
        ++n;
    }
    return n;
}

// Test 2: default pause policy
void test_override_pause(TestResult& result) {
    std::cout << "\n=== Test 2: Operator Override (pause) ===\n";

    ScriptedKeySource keys = override_keys();
    CommandArbiter arb(keys);

    const TickRecord rec = run_until_override(arb);
    result.check(rec.operator_override, "Override flagged on the tick the key goes down");
    result.check(rec.authority == Authority::Manual && near(rec.cmd.lin_vel_y, 0.5),
                 "Manual command wins on that same tick");
    result.check(arb.agent().paused(), "Run is paused");
    result.check(near(arb.agent().run()->elapsed_distance_m, 0.5), "Progress kept at 0.5 m");

    arb.tick(kDt);
    arb.tick(kDt);
    const TickRecord idle = arb.tick(kDt);
    result.check(idle.authority == Authority::Manual && idle.cmd.is_zero() && idle.label == "idle",
                 "Released keys give manual idle, not the paused run");
    result.check(near(arb.agent().run()->elapsed_distance_m, 0.5), "Paused run did not advance");

    result.check(arb.resume(), "resume() continues the paused run");
    result.check(arb.authority() == Authority::Scripted, "resume() switches to SCRIPTED");
    result.check(ticks_to_finish(arb) == 5, "Remaining 0.5 m finishes in 5 ticks");
    result.check(!arb.resume(), "Nothing left to resume");
}

// Test 3: reset policy
void test_override_reset(TestResult& result) {
    std::cout << "\n=== Test 3: Operator Override (reset) ===\n";

    ScriptedKeySource keys = override_keys();
    control::ArbiterParams params;
    params.interrupt_policy = InterruptPolicy::Reset;
    CommandArbiter arb(keys, {}, params);

    run_until_override(arb);
    result.check(arb.agent().paused(), "Run is paused");
    result.check(arb.agent().run()->elapsed_distance_m == 0.0, "Progress reset to zero");

    for (int i = 0; i < 3; ++i) arb.tick(kDt);
    arb.resume();
    result.check(ticks_to_finish(arb) == 10, "Resumed run covers the full 1 m again");
}

// Test 4: cancel policy
void test_override_cancel(TestResult& result) {
    std::cout << "\n=== Test 4: Operator Override (cancel) ===\n";

    ScriptedKeySource keys = override_keys();
    RecordingSink sink;
    control::ArbiterParams params;
    params.interrupt_policy = InterruptPolicy::Cancel;
    CommandArbiter arb(keys, {}, params, &sink);

    const TickRecord rec = run_until_override(arb);
    result.check(rec.authority == Authority::Manual && near(rec.cmd.lin_vel_y, 0.5),
                 "Manual command emitted on the override tick");
    result.check(sink.commands.size() == 6, "No extra stop command besides the per-tick one");
    result.check(!arb.agent().active(), "Run dropped");
    result.check(arb.agent().last_finished() &&
                 arb.agent().last_finished()->status == motion::RunStatus::Cancelled,
                 "Run retired as CANCELLED");
    result.check(!arb.resume(), "Cancelled run cannot be resumed");
}

// Test 5: explicit cancel
void test_explicit_cancel(TestResult& result) {
    std::cout << "\n=== Test 5: Explicit Cancel ===\n";

    ScriptedKeySource keys;
    RecordingSink sink;
    CommandArbiter arb(keys, {}, {}, &sink);

    result.check(!arb.cancel(), "cancel() with no run is a no-op");

    arb.move(0.8);
    arb.tick(kDt);
    arb.step_command(0.0, 0.0, 1.0);
    arb.tick(kDt);
    arb.step_command(0.0, 0.0, 1.0);
    const size_t before = sink.commands.size();

    result.check(arb.cancel(), "cancel() on the unbounded run");
    result.check(sink.commands.size() == before, "Nothing reaches the sink between ticks");
    result.check(arb.authority() == Authority::Scripted, "Authority changes on the next tick, not mid-tick");

    const TickRecord rec = arb.tick(kDt);
    result.check(rec.cmd.is_zero() && rec.run_status == motion::RunStatus::Cancelled,
                 "Next tick emits the stop and reports CANCELLED");
    result.check(sink.commands.size() == before + 1 && sink.commands.back().is_zero(),
                 "The stop is that tick's only sink command");
    result.check(arb.authority() == Authority::Manual, "Back to MANUAL");
    result.check(!arb.cancel(), "Second cancel is a no-op");

    // Cancelling a run paused by the operator does not stop the operator
    ScriptedKeySource held = override_keys();
    RecordingSink held_sink;
    CommandArbiter held_arb(held, {}, {}, &held_sink);
    run_until_override(held_arb);
    result.check(held_arb.cancel(), "cancel() on the paused run");
    const TickRecord manual = held_arb.tick(kDt);
    result.check(manual.authority == Authority::Manual && near(manual.cmd.lin_vel_y, 0.5),
                 "Held Left key still drives after the cancel");
    result.check(held_sink.commands.size() == 7 && held_sink.commands.back() == manual.cmd,
                 "One sink command per tick across the cancel");
}

// Test 6: configuration error
void test_config_error(TestResult& result) {
    std::cout << "\n=== Test 6: Configuration Error ===\n";

    ScriptedKeySource keys;
    CommandArbiter arb(keys);

    bool threw = false;
    try {
        arb.move(1.0, -1.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    result.check(threw, "move(1.0, time=-1.0) reports a configuration error");
    result.check(arb.authority() == Authority::Manual, "Arbiter stays MANUAL");
    result.check(!arb.agent().run().has_value(), "No run created");

    threw = false;
    try {
        arb.tick(-0.1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    result.check(threw, "Negative dt rejected");
    result.check(arb.tick_count() == 0, "Rejected tick not counted");
}

// Test 7: step_command
void test_step_command(TestResult& result) {
    std::cout << "\n=== Test 7: step_command Isolation ===\n";

    ScriptedKeySource keys;
    RecordingSink sink;
    CommandArbiter arb(keys, {}, {}, &sink);

    const VelocityCommand queued = arb.step_command(0.2, 0.0, 0.5);
    result.check(near(queued.ang_vel, 0.5), "step_command returns the command");
    result.check(arb.authority() == Authority::Manual, "step_command does not switch authority");
    result.check(sink.commands.empty(), "Nothing reaches the sink before the tick");

    TickRecord rec = arb.tick(kDt);
    result.check(sink.commands.size() == 1 && sink.commands[0] == queued,
                 "The tick emits the stepped command as its only command");
    result.check(arb.current() == queued && rec.authority == Authority::Manual,
                 "Stepped command is the current command, authority still MANUAL");

    rec = arb.tick(kDt);
    result.check(rec.cmd.is_zero() && sink.commands.size() == 2,
                 "A step lasts one tick, then manual idle");

    arb.move(1.0, 2.0);
    arb.tick(kDt);
    const double t_before = arb.agent().run()->elapsed_time_s;
    const uint64_t ticks_before = arb.tick_count();

    arb.step_command(0.0, 0.3, 0.0);
    result.check(arb.authority() == Authority::Scripted, "Authority unchanged during a run");
    result.check(arb.agent().run()->elapsed_time_s == t_before, "Run counters unchanged");
    result.check(arb.tick_count() == ticks_before, "Tick count unchanged");
    result.check(sink.commands.size() == 3, "No extra sink command");

    rec = arb.tick(kDt);
    result.check(sink.commands.size() == 4 && near(rec.cmd.lin_vel_y, 0.3) && near(rec.cmd.lin_vel_x, 0.0),
                 "Stepped command replaces the scripted one on the next tick");
    result.check(near(arb.agent().run()->elapsed_time_s, 0.2), "The run itself still ticks");

    rec = arb.tick(kDt);
    result.check(near(rec.cmd.lin_vel_x, 1.0), "Scripted command returns afterwards");

    // The operator driving in MANUAL wins over a queued step
    ScriptedKeySource up({KeySet{Key::Up}}, true);
    RecordingSink up_sink;
    CommandArbiter up_arb(up, {}, {}, &up_sink);
    up_arb.step_command(0.0, 0.0, 0.9);
    rec = up_arb.tick(kDt);
    result.check(near(rec.cmd.lin_vel_x, 0.5) && rec.cmd.ang_vel == 0.0 && up_sink.commands.size() == 1,
                 "Step dropped while the operator holds a motion key");
}

// Test 8: help overlay follows the key in either state
void test_help_in_scripted(TestResult& result) {
    std::cout << "\n=== Test 8: Help Toggle While Scripted ===\n";

    ScriptedKeySource keys({KeySet{}, KeySet{Key::Help}, KeySet{}});
    CommandArbiter arb(keys);
    arb.move(0.5, 5.0);

    arb.tick(kDt);
    const TickRecord rec = arb.tick(kDt);
    result.check(rec.help_visible, "Help shown while scripted");
    result.check(!rec.operator_override && rec.authority == Authority::Scripted,
                 "Help key is not an operator override");
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            CommandArbiter Unit Tests                         ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_round_trip(result);
    test_override_pause(result);
    test_override_reset(result);
    test_override_cancel(result);
    test_explicit_cancel(result);
    test_config_error(result);
    test_step_command(result);
    test_help_in_scripted(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
