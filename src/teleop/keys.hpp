// src/teleop/keys.hpp
#pragma once

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>

namespace teleop {

// Logical teleop keys. Backends translate device codes into these.
enum class Key : uint8_t {
    Up = 0,
    Down,
    Left,
    Right,
    RotateLeft,
    RotateRight,
    Help,
    Count
};

constexpr size_t kKeyCount = static_cast<size_t>(Key::Count);

const char* key_name(Key k);

// Parses a key_name() string ("up", "rotate_left", ...). Returns false on
// an unknown name.
bool parse_key(const std::string& name, Key& out);

/**
 * KeySet - keys currently held down
 *
 * Level-triggered snapshot: a key is in the set for every poll during which
 * it is physically held.
 */
class KeySet {
public:
    KeySet() = default;
    KeySet(std::initializer_list<Key> keys) {
        for (Key k : keys) set(k);
    }

    void set(Key k, bool held = true) { bits_.set(index(k), held); }
    void clear(Key k) { bits_.reset(index(k)); }
    void clear_all() { bits_.reset(); }

    bool held(Key k) const { return bits_.test(index(k)); }
    bool empty() const { return bits_.none(); }
    size_t size() const { return bits_.count(); }

    // Any translation or rotation key (everything except Help)
    bool any_motion() const {
        return held(Key::Up) || held(Key::Down) || held(Key::Left) ||
               held(Key::Right) || held(Key::RotateLeft) || held(Key::RotateRight);
    }

    // Keys held now that were not held in `prev`
    KeySet pressed_since(const KeySet& prev) const {
        KeySet out;
        out.bits_ = bits_ & ~prev.bits_;
        return out;
    }

    // "up+rotate_left", empty string for no keys
    std::string to_string() const;

    // Inverse of to_string(). Unknown names are skipped and counted in
    // `unknown` when given.
    static KeySet parse(const std::string& text, size_t* unknown = nullptr);

    bool operator==(const KeySet& o) const { return bits_ == o.bits_; }
    bool operator!=(const KeySet& o) const { return bits_ != o.bits_; }

private:
    static size_t index(Key k) { return static_cast<size_t>(k); }

    std::bitset<kKeyCount> bits_;
};

/**
 * KeySource - capability interface over an input device
 *
 * poll() is called once per control tick and returns the keys held at that
 * moment. Implementations must not block.
 */
class KeySource {
public:
    virtual ~KeySource() = default;

    virtual KeySet poll() = 0;

    virtual const char* name() const = 0;
};

} // namespace teleop
