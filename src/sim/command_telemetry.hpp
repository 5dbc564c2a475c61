// src/sim/command_telemetry.hpp
#pragma once

#include "control/tick_record.hpp"
#include "utils/influx.hpp"

namespace sim {

/**
 * InfluxDB point for one control tick
 *   teleop_command,source=manual tick=..,lin_vel_x=..,...,label="forward"
 *
 * Numeric fields follow TickRecord::accept_fields, so the telemetry and the
 * CSV log carry the same columns.
 */
utils::InfluxPoint command_point(const control::TickRecord& rec);

} // namespace sim
