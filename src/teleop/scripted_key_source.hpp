// src/teleop/scripted_key_source.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "teleop/keys.hpp"

namespace teleop {

/**
 * ScriptedKeySource - replays a fixed key-state sequence, one entry per poll
 *
 * Used by tests and for reproducible runs. After the sequence is exhausted
 * the last entry is held (hold_last) or no keys are reported.
 *
 * CSV format (see load_csv):
 *   tick,keys
 *   0,
 *   10,up
 *   40,up+rotate_left
 *   60,
 * Each row holds until the next listed tick.
 */
class ScriptedKeySource : public KeySource {
public:
    ScriptedKeySource() = default;
    explicit ScriptedKeySource(std::vector<KeySet> sequence, bool hold_last = false);

    KeySet poll() override;
    const char* name() const override { return "scripted"; }

    /**
     * load_csv() - replace the sequence with the contents of a key script
     * @return false if the file can't be opened or has no tick/keys columns
     * @throws std::runtime_error on malformed rows (bad tick, decreasing tick)
     */
    bool load_csv(const std::string& path);

    void append(const KeySet& keys, size_t repeat = 1);
    void rewind() { cursor_ = 0; }

    size_t size() const { return sequence_.size(); }
    size_t cursor() const { return cursor_; }
    bool exhausted() const { return cursor_ >= sequence_.size(); }
    void set_hold_last(bool hold) { hold_last_ = hold; }

private:
    std::vector<KeySet> sequence_;
    size_t cursor_ = 0;
    bool hold_last_ = false;
};

} // namespace teleop
