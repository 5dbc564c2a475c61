// src/sim/command_telemetry.cpp
#include "sim/command_telemetry.hpp"
#include "utils/field_visitor.hpp"

namespace sim {

utils::InfluxPoint command_point(const control::TickRecord& rec) {
    utils::InfluxPoint point;
    point.measurement = "teleop_command";
    point.tags.emplace_back("source", control::to_string(rec.authority));

    auto visitor = utils::make_visitor([&point](const char* name, double value) {
        point.fields.emplace_back(name, value);
    });
    rec.accept_fields(visitor);

    point.string_fields.emplace_back("label", rec.label);
    return point;
}

} // namespace sim
