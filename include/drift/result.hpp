#pragma once

#include <drift/error.hpp>
#include <variant>
#include <utility>

namespace drift {

// Either a value or a DriftError. Library entry points report failures
// through Result instead of throwing.
template<typename T>
class Result {
    std::variant<T, DriftError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from DriftError so DRIFT_TRY can forward errors across Result<T> types
    Result(DriftError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(DriftError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<DriftError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    DriftError& error() & { return std::get<DriftError>(data_); }
    const DriftError& error() const& { return std::get<DriftError>(data_); }
    DriftError&& error() && { return std::get<DriftError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define DRIFT_TRY(expr) \
    do { \
        auto _drift_result = (expr); \
        if (_drift_result.is_err()) return std::move(_drift_result).error(); \
    } while(0)

} // namespace drift
