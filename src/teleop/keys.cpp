// src/teleop/keys.cpp
#include "teleop/keys.hpp"

#include <cctype>

namespace teleop {

namespace {

const char* const kNames[kKeyCount] = {
    "up", "down", "left", "right", "rotate_left", "rotate_right", "help"
};

std::string trimmed_lower(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;

    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[i]))));
    }
    return out;
}

} // namespace

const char* key_name(Key k) {
    const size_t i = static_cast<size_t>(k);
    return i < kKeyCount ? kNames[i] : "unknown";
}

bool parse_key(const std::string& name, Key& out) {
    const std::string v = trimmed_lower(name);
    for (size_t i = 0; i < kKeyCount; ++i) {
        if (v == kNames[i]) {
            out = static_cast<Key>(i);
            return true;
        }
    }
    return false;
}

std::string KeySet::to_string() const {
    std::string out;
    for (size_t i = 0; i < kKeyCount; ++i) {
        if (!bits_.test(i)) continue;
        if (!out.empty()) out += '+';
        out += kNames[i];
    }
    return out;
}

KeySet KeySet::parse(const std::string& text, size_t* unknown) {
    KeySet out;
    size_t bad = 0;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('+', start);
        if (end == std::string::npos) end = text.size();

        const std::string token = trimmed_lower(text.substr(start, end - start));
        if (!token.empty()) {
            Key k;
            if (parse_key(token, k)) {
                out.set(k);
            } else {
                bad++;
            }
        }
        start = end + 1;
    }
    if (unknown) *unknown = bad;
    return out;
}

} // namespace teleop
