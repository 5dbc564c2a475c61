// src/teleop/evdev_key_source.hpp
#pragma once

#include <cstdint>
#include <string>

#include <linux/input.h>

#include "teleop/keys.hpp"

namespace teleop {

/**
 * EvdevKeySource - keyboard / gamepad input from a Linux event device
 *
 * Reads /dev/input/eventN without blocking and keeps the held-key state from
 * EV_KEY press / repeat / release events, plus the gamepad D-pad hat axes.
 *
 *   Keyboard: arrows, Q / E (rotate), H (help)
 *   Gamepad:  D-pad, left / right bumper (rotate), mode button (help)
 *
 * The device must be readable by the process (usually group "input").
 */
class EvdevKeySource : public KeySource {
public:
    EvdevKeySource() = default;
    ~EvdevKeySource() override;

    EvdevKeySource(const EvdevKeySource&) = delete;
    EvdevKeySource& operator=(const EvdevKeySource&) = delete;

    bool open(const std::string& device_path);
    void close();
    bool is_open() const { return fd_ >= 0; }

    // Drains all pending events, then reports the held keys
    KeySet poll() override;
    const char* name() const override { return "evdev"; }

    /**
     * apply_event() - fold one input_event into the held-key state
     *
     * Exposed so the mapping can be exercised without a device.
     * Returns true if the event touched a mapped key.
     */
    bool apply_event(const struct input_event& ev);

    const KeySet& held() const { return held_; }

private:
    int fd_ = -1;
    std::string path_;
    KeySet held_;
};

} // namespace teleop
