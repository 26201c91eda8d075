#pragma once

#include <pinlock/error.hpp>
#include <variant>
#include <functional>

namespace pinlock {

template<typename T>
class Result {
    std::variant<T, PinError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PinError so PINLOCK_TRY can return errors across Result<T> types
    Result(PinError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PinError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PinError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PinError& error() & { return std::get<PinError>(data_); }
    const PinError& error() const& { return std::get<PinError>(data_); }
    PinError&& error() && { return std::get<PinError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    // Attach the offending file to an error; no-op on Ok.
    Result&& at_file(const std::string& path) && {
        if (is_err() && error().file.empty()) {
            error().file = path;
        }
        return std::move(*this);
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PINLOCK_TRY(expr) \
    do { \
        auto _pinlock_result = (expr); \
        if (_pinlock_result.is_err()) return std::move(_pinlock_result).error(); \
    } while(0)

} // namespace pinlock
