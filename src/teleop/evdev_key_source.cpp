// src/teleop/evdev_key_source.cpp
#include "teleop/evdev_key_source.hpp"
#include "utils/logging.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace teleop {

namespace {

bool map_key_code(uint16_t code, Key& out) {
    switch (code) {
        case KEY_UP:
        case BTN_DPAD_UP:    out = Key::Up; return true;
        case KEY_DOWN:
        case BTN_DPAD_DOWN:  out = Key::Down; return true;
        case KEY_LEFT:
        case BTN_DPAD_LEFT:  out = Key::Left; return true;
        case KEY_RIGHT:
        case BTN_DPAD_RIGHT: out = Key::Right; return true;
        case KEY_Q:
        case BTN_TL:         out = Key::RotateLeft; return true;
        case KEY_E:
        case BTN_TR:         out = Key::RotateRight; return true;
        case KEY_H:
        case BTN_MODE:       out = Key::Help; return true;
        default:             return false;
    }
}

} // namespace

EvdevKeySource::~EvdevKeySource() {
    close();
}

bool EvdevKeySource::open(const std::string& device_path) {
    close();

    fd_ = ::open(device_path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        LOG_ERROR("[Evdev] open(%s) failed: %s", device_path.c_str(), std::strerror(errno));
        return false;
    }

    char dev_name[256] = "unknown";
    if (::ioctl(fd_, EVIOCGNAME(sizeof(dev_name)), dev_name) < 0) {
        LOG_WARN("[Evdev] EVIOCGNAME failed on %s: %s", device_path.c_str(), std::strerror(errno));
    }

    path_ = device_path;
    held_.clear_all();
    LOG_INFO("[Evdev] Reading keys from %s (%s)", device_path.c_str(), dev_name);
    return true;
}

void EvdevKeySource::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool EvdevKeySource::apply_event(const struct input_event& ev) {
    if (ev.type == EV_KEY) {
        Key k;
        if (!map_key_code(ev.code, k)) return false;
        // value: 0 = release, 1 = press, 2 = autorepeat
        held_.set(k, ev.value != 0);
        return true;
    }

    if (ev.type == EV_ABS) {
        if (ev.code == ABS_HAT0X) {
            held_.set(Key::Left, ev.value < 0);
            held_.set(Key::Right, ev.value > 0);
            return true;
        }
        if (ev.code == ABS_HAT0Y) {
            // hat Y is negative when pushed up
            held_.set(Key::Up, ev.value < 0);
            held_.set(Key::Down, ev.value > 0);
            return true;
        }
    }

    return false;
}

KeySet EvdevKeySource::poll() {
    if (fd_ < 0) {
        return held_;
    }

    struct input_event events[64];
    for (;;) {
        const ssize_t n = ::read(fd_, events, sizeof(events));
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;

            // Device unplugged or similar: drop everything so nothing stays latched
            LOG_ERROR("[Evdev] read(%s) failed: %s, releasing all keys",
                      path_.c_str(), std::strerror(errno));
            held_.clear_all();
            close();
            break;
        }
        if (n == 0) break;

        const size_t count = static_cast<size_t>(n) / sizeof(struct input_event);
        for (size_t i = 0; i < count; ++i) {
            apply_event(events[i]);
        }
        if (static_cast<size_t>(n) < sizeof(events)) break;
    }

    return held_;
}

} // namespace teleop
