// utils/field_visitor.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <utility>

namespace utils {

/**
 * FieldVisitor - type-erased numeric field enumeration
 *
 * Records expose their fields through accept_fields(visitor) so CSV logging
 * and telemetry don't need field-by-field mapping.
 *
 * Usage:
 *   utils::FieldVisitor v([](const char* name, double value) {
 *       std::cout << name << " = " << value << "\n";
 *   });
 *   record.accept_fields(v);
 */
class FieldVisitor {
public:
    using Callback = std::function<void(const char*, double)>;

    explicit FieldVisitor(Callback cb) : callback_(std::move(cb)) {}

    void visit(const char* name, double value) { callback_(name, value); }
    void visit(const char* name, int value) { callback_(name, static_cast<double>(value)); }
    void visit(const char* name, uint32_t value) { callback_(name, static_cast<double>(value)); }
    void visit(const char* name, uint64_t value) { callback_(name, static_cast<double>(value)); }
    void visit(const char* name, bool value) { callback_(name, value ? 1.0 : 0.0); }

private:
    Callback callback_;
};

// Lambda-based visitor without the std::function indirection
template<typename Lambda>
class LambdaVisitor {
public:
    explicit LambdaVisitor(Lambda&& lambda) : lambda_(std::forward<Lambda>(lambda)) {}

    template<typename T>
    void visit(const char* name, T value) {
        lambda_(name, static_cast<double>(value));
    }

private:
    Lambda lambda_;
};

template<typename Lambda>
LambdaVisitor<Lambda> make_visitor(Lambda&& lambda) {
    return LambdaVisitor<Lambda>(std::forward<Lambda>(lambda));
}

} // namespace utils
