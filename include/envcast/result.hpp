#pragma once

#include <envcast/error.hpp>
#include <utility>
#include <variant>

namespace envcast {

template<typename T>
class Result {
    std::variant<T, EnvcastError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from EnvcastError so ENVCAST_TRY can return errors across Result<T> types
    Result(EnvcastError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(EnvcastError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<EnvcastError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    EnvcastError& error() & { return std::get<EnvcastError>(data_); }
    const EnvcastError& error() const& { return std::get<EnvcastError>(data_); }
    EnvcastError&& error() && { return std::get<EnvcastError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define ENVCAST_TRY(expr) \
    do { \
        auto _envcast_result = (expr); \
        if (_envcast_result.is_err()) return std::move(_envcast_result).error(); \
    } while(0)

} // namespace envcast
