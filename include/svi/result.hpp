#pragma once

#include <svi/error.hpp>
#include <variant>

namespace svi {

template<typename T>
class Result {
    std::variant<T, SviError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SviError so SVI_TRY can return errors across Result<T> types
    Result(SviError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SviError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SviError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SviError& error() & { return std::get<SviError>(data_); }
    const SviError& error() const& { return std::get<SviError>(data_); }
    SviError&& error() && { return std::get<SviError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SVI_TRY(expr) \
    do { \
        auto _svi_result = (expr); \
        if (_svi_result.is_err()) return std::move(_svi_result).error(); \
    } while(0)

} // namespace svi
