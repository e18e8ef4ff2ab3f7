#pragma once

#include <dotkeep/error.hpp>
#include <variant>

namespace dotkeep {

template<typename T>
class Result {
    std::variant<T, DotkeepError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from DotkeepError so DOTKEEP_TRY can return errors across Result<T> types
    Result(DotkeepError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(DotkeepError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<DotkeepError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    DotkeepError& error() & { return std::get<DotkeepError>(data_); }
    const DotkeepError& error() const& { return std::get<DotkeepError>(data_); }
    DotkeepError&& error() && { return std::get<DotkeepError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& { return is_ok() ? value() : std::move(fallback); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define DOTKEEP_TRY(expr) \
    do { \
        auto _dotkeep_result = (expr); \
        if (_dotkeep_result.is_err()) return std::move(_dotkeep_result).error(); \
    } while(0)

} // namespace dotkeep
