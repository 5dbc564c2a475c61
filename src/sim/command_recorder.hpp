// src/sim/command_recorder.hpp
#pragma once

#include <cstddef>

#include "motion/command_sink.hpp"
#include "utils/logging.hpp"

namespace sim {

// Stand-in consumer for the simulator / robot bridge. Keeps the last
// applied command and how many were applied.
class CommandRecorder : public motion::CommandSink {
public:
    void apply(const motion::VelocityCommand& cmd) override {
        last_ = cmd;
        count_++;
        LOG_TRACE("[Sink] #%zu x=%+.3f y=%+.3f yaw=%+.3f",
                  count_, cmd.lin_vel_x, cmd.lin_vel_y, cmd.ang_vel);
    }

    const motion::VelocityCommand& last() const { return last_; }
    size_t count() const { return count_; }

private:
    motion::VelocityCommand last_;
    size_t count_ = 0;
};

} // namespace sim
