// src/teleop/manual_input_mapper.cpp
#include "teleop/manual_input_mapper.hpp"
#include "utils/logging.hpp"

namespace teleop {

ManualInputMapper::ManualInputMapper(const TeleopParams& params) : params_(params) {}

motion::VelocityCommand ManualInputMapper::map(const KeySet& held, const TeleopParams& params) {
    double x = 0.0;
    double y = 0.0;
    double yaw = 0.0;

    if (held.held(Key::Up))          x += params.linear_speed_mps;
    if (held.held(Key::Down))        x -= params.linear_speed_mps;
    if (held.held(Key::Left))        y += params.lateral_speed_mps;
    if (held.held(Key::Right))       y -= params.lateral_speed_mps;
    if (held.held(Key::RotateLeft))  yaw += params.yaw_rate_radps;
    if (held.held(Key::RotateRight)) yaw -= params.yaw_rate_radps;

    motion::VelocityCommand cmd;
    cmd.lin_vel_x = x;
    cmd.lin_vel_y = y;
    cmd.ang_vel = yaw;
    return cmd;
}

std::string ManualInputMapper::label_for(const KeySet& held) {
    static const struct { Key key; const char* name; } kOrder[] = {
        {Key::Up, "forward"},
        {Key::Down, "backward"},
        {Key::Left, "left"},
        {Key::Right, "right"},
        {Key::RotateLeft, "rotate_left"},
        {Key::RotateRight, "rotate_right"},
    };

    std::string label;
    for (const auto& e : kOrder) {
        if (!held.held(e.key)) continue;
        if (!label.empty()) label += '+';
        label += e.name;
    }
    return label.empty() ? "idle" : label;
}

const std::vector<KeyBinding>& ManualInputMapper::key_bindings() {
    static const std::vector<KeyBinding> kBindings = {
        {Key::Up,          "Up arrow / D-pad up",       "walk forward"},
        {Key::Down,        "Down arrow / D-pad down",   "walk backward"},
        {Key::Left,        "Left arrow / D-pad left",   "strafe left"},
        {Key::Right,       "Right arrow / D-pad right", "strafe right"},
        {Key::RotateLeft,  "Q / left bumper",           "turn left"},
        {Key::RotateRight, "E / right bumper",          "turn right"},
        {Key::Help,        "H / mode button",           "toggle this help"},
    };
    return kBindings;
}

const ManualOutput& ManualInputMapper::update(const KeySet& held) {
    const KeySet pressed = held.pressed_since(prev_);
    prev_ = held;

    out_.cmd = map(held, params_);
    out_.label = label_for(held);
    out_.override_requested = pressed.any_motion();

    if (pressed.held(Key::Help)) {
        out_.help_visible = !out_.help_visible;
        LOG_DEBUG("[ManualInput] Help overlay %s", out_.help_visible ? "on" : "off");
    }

    return out_;
}

} // namespace teleop
