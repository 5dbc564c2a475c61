// src/sim/tick_log.cpp
#include "sim/tick_log.hpp"
#include "utils/field_visitor.hpp"
#include "utils/logging.hpp"

namespace sim {

TickLog::TickLog(double log_hz)
    : period_s_(log_hz > 0.0 ? 1.0 / log_hz : 0.0) {}

std::vector<std::string> TickLog::header() {
    std::vector<std::string> cols;
    utils::FieldVisitor v([&](const char* name, double) { cols.emplace_back(name); });
    control::TickRecord{}.accept_fields(v);
    cols.emplace_back("label");
    return cols;
}

bool TickLog::open(const std::string& path) {
    if (!writer_.open(path, header())) {
        LOG_ERROR("[TickLog] Failed to open CSV: %s", path.c_str());
        return false;
    }
    next_t_s_ = 0.0;
    rows_ = 0;
    LOG_DEBUG("[TickLog] Writing %s", path.c_str());
    return true;
}

void TickLog::close() {
    if (writer_.is_open()) {
        writer_.flush();
        writer_.close();
    }
}

bool TickLog::write(const control::TickRecord& rec) {
    if (!writer_.is_open()) return false;

    // Small tolerance so accumulated dt doesn't skip a logging slot
    if (period_s_ > 0.0 && rec.t_s + 1e-9 < next_t_s_) {
        return false;
    }

    utils::FieldVisitor v([&](const char*, double value) { writer_.cell(value); });
    rec.accept_fields(v);
    writer_.cell(rec.label);
    writer_.end_row();

    if (period_s_ > 0.0) {
        next_t_s_ += period_s_;
        if (next_t_s_ <= rec.t_s) next_t_s_ = rec.t_s + period_s_;
    }
    rows_++;
    return true;
}

} // namespace sim
