#pragma once

#include <aiiap/error.hpp>
#include <variant>

namespace aiiap {

template<typename T>
class Result {
    std::variant<T, AiiapError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from AiiapError so AIIAP_TRY can return errors across Result<T> types
    Result(AiiapError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(AiiapError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<AiiapError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    AiiapError& error() & { return std::get<AiiapError>(data_); }
    const AiiapError& error() const& { return std::get<AiiapError>(data_); }
    AiiapError&& error() && { return std::get<AiiapError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define AIIAP_TRY(expr) \
    do { \
        auto _aiiap_result = (expr); \
        if (_aiiap_result.is_err()) return std::move(_aiiap_result).error(); \
    } while(0)

} // namespace aiiap
