// src/motion/velocity_command.hpp
#pragma once

#include <cmath>

namespace motion {

// 3-DOF body-frame velocity command handed to the robot / simulator once per
// control tick. x forward, y left, yaw counter-clockwise.
// Magnitude is not clamped here; the consumer owns its limits.
struct VelocityCommand {
    double lin_vel_x = 0.0;   // m/s
    double lin_vel_y = 0.0;   // m/s
    double ang_vel = 0.0;     // rad/s

    static constexpr VelocityCommand zero() { return VelocityCommand{}; }

    bool is_zero() const {
        return lin_vel_x == 0.0 && lin_vel_y == 0.0 && ang_vel == 0.0;
    }

    bool is_finite() const {
        return std::isfinite(lin_vel_x) && std::isfinite(lin_vel_y) && std::isfinite(ang_vel);
    }

    bool operator==(const VelocityCommand& o) const {
        return lin_vel_x == o.lin_vel_x && lin_vel_y == o.lin_vel_y && ang_vel == o.ang_vel;
    }
    bool operator!=(const VelocityCommand& o) const { return !(*this == o); }
};

} // namespace motion
