// src/teleop/manual_input_mapper.hpp
#pragma once

#include <string>
#include <vector>

#include "motion/velocity_command.hpp"
#include "teleop/keys.hpp"

namespace teleop {

struct TeleopParams {
    double linear_speed_mps = 0.5;    // Up / Down
    double lateral_speed_mps = 0.5;   // Left / Right
    double yaw_rate_radps = 1.0;      // RotateLeft / RotateRight
};

struct ManualOutput {
    motion::VelocityCommand cmd;
    std::string label = "idle";
    bool help_visible = false;
    bool override_requested = false;  // a motion key went down this poll
};

struct KeyBinding {
    Key key;
    const char* device_keys;   // physical keys on keyboard / gamepad
    const char* action;
};

/**
 * ManualInputMapper - held keys → latched velocity command + label
 *
 * Level-triggered: the command is a function of the keys held at this poll
 * only, so a stuck key gives a stuck command. The only edge detection is
 * for the help toggle and for the operator-override signal.
 */
class ManualInputMapper {
public:
    explicit ManualInputMapper(const TeleopParams& params = {});

    // Pure mapping of held keys to a command
    static motion::VelocityCommand map(const KeySet& held, const TeleopParams& params);

    // "idle" or e.g. "forward+rotate_left"
    static std::string label_for(const KeySet& held);

    // Static key → action table for the help overlay
    static const std::vector<KeyBinding>& key_bindings();

    /**
     * update() - consume one poll of the input device
     *
     * Overwrites the latched command and label.
     */
    const ManualOutput& update(const KeySet& held);

    const ManualOutput& output() const { return out_; }
    const motion::VelocityCommand& latched() const { return out_.cmd; }
    const std::string& label() const { return out_.label; }
    bool help_visible() const { return out_.help_visible; }

    const TeleopParams& params() const { return params_; }
    void set_params(const TeleopParams& params) { params_ = params; }

private:
    TeleopParams params_;
    ManualOutput out_;
    KeySet prev_;
};

} // namespace teleop
