// src/motion/command_sink.hpp
#pragma once

#include "motion/velocity_command.hpp"

namespace motion {

// Consumer of emitted velocity commands (simulator, robot bridge, log).
// Called from the control thread only.
class CommandSink {
public:
    virtual ~CommandSink() = default;

    virtual void apply(const VelocityCommand& cmd) = 0;
};

} // namespace motion
