// src/sim/console_display.cpp
#include "sim/console_display.hpp"
#include "teleop/manual_input_mapper.hpp"

namespace sim {

void ConsoleDisplay::update(const control::TickRecord& rec) {
    if (first_ || rec.label != last_label_) {
        std::fprintf(out_, "[t=%7.2fs] %-8s %-28s x=%+.2f y=%+.2f yaw=%+.2f\n",
                     rec.t_s, control::to_string(rec.authority), rec.label.c_str(),
                     rec.cmd.lin_vel_x, rec.cmd.lin_vel_y, rec.cmd.ang_vel);
        last_label_ = rec.label;
    }

    if (rec.help_visible && !last_help_) {
        print_help();
    }
    last_help_ = rec.help_visible;
    first_ = false;
}

void ConsoleDisplay::print_help() const {
    std::fprintf(out_, "+------------------------------+-------------------+\n");
    std::fprintf(out_, "| %-28s | %-17s |\n", "Key", "Action");
    std::fprintf(out_, "+------------------------------+-------------------+\n");
    for (const auto& b : teleop::ManualInputMapper::key_bindings()) {
        std::fprintf(out_, "| %-28s | %-17s |\n", b.device_keys, b.action);
    }
    std::fprintf(out_, "+------------------------------+-------------------+\n");
    std::fflush(out_);
}

} // namespace sim
