// src/sim/tick_log.hpp
#pragma once

#include <string>
#include <vector>

#include "control/tick_record.hpp"
#include "utils/csv.hpp"

namespace sim {

/**
 * TickLog - per-tick CSV of the arbiter output
 *
 * Columns are the TickRecord numeric fields in accept_fields() order,
 * followed by the label. Rows are decimated to log_hz of control time
 * (log_hz <= 0 logs every tick).
 */
class TickLog {
public:
    explicit TickLog(double log_hz = 0.0);

    bool open(const std::string& path);
    void close();
    bool is_open() const { return writer_.is_open(); }

    // Returns true if a row was written
    bool write(const control::TickRecord& rec);

    size_t rows() const { return rows_; }

    static std::vector<std::string> header();

private:
    utils::CsvWriter writer_;
    double period_s_;
    double next_t_s_ = 0.0;
    size_t rows_ = 0;
};

} // namespace sim
