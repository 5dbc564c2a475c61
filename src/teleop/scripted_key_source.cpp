// src/teleop/scripted_key_source.cpp
#include "teleop/scripted_key_source.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace teleop {

ScriptedKeySource::ScriptedKeySource(std::vector<KeySet> sequence, bool hold_last)
    : sequence_(std::move(sequence)), hold_last_(hold_last) {}

KeySet ScriptedKeySource::poll() {
    if (cursor_ < sequence_.size()) {
        return sequence_[cursor_++];
    }
    if (hold_last_ && !sequence_.empty()) {
        return sequence_.back();
    }
    return KeySet{};
}

void ScriptedKeySource::append(const KeySet& keys, size_t repeat) {
    sequence_.insert(sequence_.end(), repeat, keys);
}

bool ScriptedKeySource::load_csv(const std::string& path) {
    utils::CsvReader csv;
    if (!csv.open(path)) {
        LOG_ERROR("[KeyScript] Failed to open key script: %s", path.c_str());
        return false;
    }
    if (csv.col("tick") < 0 || csv.col("keys") < 0) {
        LOG_ERROR("[KeyScript] %s: header must contain 'tick' and 'keys' columns", path.c_str());
        return false;
    }

    std::vector<std::pair<long, KeySet>> rows;
    std::vector<std::string> row;
    while (csv.read_row(row)) {
        long tick = 0;
        try {
            tick = utils::CsvReader::to_long(csv.get(row, "tick"), -1);
        } catch (const std::exception&) {
            throw std::runtime_error("[KeyScript] " + path + ":" +
                                     std::to_string(csv.line_number()) +
                                     ": invalid tick '" + csv.get(row, "tick") + "'");
        }
        if (tick < 0) {
            throw std::runtime_error("[KeyScript] " + path + ":" +
                                     std::to_string(csv.line_number()) + ": missing tick");
        }
        if (!rows.empty() && tick <= rows.back().first) {
            throw std::runtime_error("[KeyScript] " + path + ":" +
                                     std::to_string(csv.line_number()) +
                                     ": ticks must be strictly increasing");
        }

        size_t unknown = 0;
        KeySet keys = KeySet::parse(csv.get(row, "keys"), &unknown);
        if (unknown > 0) {
            LOG_WARN("[KeyScript] %s:%zu: %zu unknown key name(s) ignored",
                     path.c_str(), csv.line_number(), unknown);
        }
        rows.emplace_back(tick, keys);
    }

    sequence_.clear();
    cursor_ = 0;

    // Expand "from tick N" rows into one entry per tick. Ticks before the
    // first row have no keys held.
    long next_tick = 0;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].first > next_tick) {
            KeySet gap = (i == 0) ? KeySet{} : rows[i - 1].second;
            append(gap, static_cast<size_t>(rows[i].first - next_tick));
        }
        append(rows[i].second);
        next_tick = rows[i].first + 1;
    }

    LOG_INFO("[KeyScript] Loaded %zu rows (%zu ticks) from %s",
             rows.size(), sequence_.size(), path.c_str());
    return true;
}

} // namespace teleop
