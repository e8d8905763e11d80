#pragma once

#include <gitsnip/error.hpp>
#include <variant>

namespace gitsnip {

template<typename T>
class Result {
    std::variant<T, SnipError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SnipError so GITSNIP_TRY can return errors across Result<T> types
    Result(SnipError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SnipError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SnipError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SnipError& error() & { return std::get<SnipError>(data_); }
    const SnipError& error() const& { return std::get<SnipError>(data_); }
    SnipError&& error() && { return std::get<SnipError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Rewrite the error (if any) into a different stage code
    Result wrap_err(SnipError::Code c, const std::string& context) && {
        if (is_ok()) return std::move(*this);
        return Result::err(error().wrap(c, context));
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define GITSNIP_TRY(expr) \
    do { \
        auto _gitsnip_result = (expr); \
        if (_gitsnip_result.is_err()) return std::move(_gitsnip_result).error(); \
    } while(0)

} // namespace gitsnip
