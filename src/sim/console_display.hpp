// src/sim/console_display.hpp
#pragma once

#include <cstdio>
#include <string>

#include "control/tick_record.hpp"

namespace sim {

// Text stand-in for the on-screen command label / help overlay.
// Prints only on change so it can be called every tick.
class ConsoleDisplay {
public:
    explicit ConsoleDisplay(std::FILE* out = stdout) : out_(out) {}

    void update(const control::TickRecord& rec);

    void print_help() const;

private:
    std::FILE* out_;
    std::string last_label_;
    bool last_help_ = false;
    bool first_ = true;
};

} // namespace sim
