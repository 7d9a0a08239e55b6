#pragma once

#include <pathmatch/error.hpp>
#include <utility>
#include <variant>

namespace pathmatch {

// Value or PathmatchError. Errors convert implicitly so a function can
// `return PathmatchError{...};` or forward another Result's error.
template<typename T>
class Result {
public:
    Result(PathmatchError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::in_place_index<0>, std::move(val)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    PathmatchError& error() & { return std::get<1>(data_); }
    const PathmatchError& error() const& { return std::get<1>(data_); }
    PathmatchError&& error() && { return std::get<1>(std::move(data_)); }

private:
    Result(std::in_place_index_t<0> tag, T val) : data_(tag, std::move(val)) {}

    std::variant<T, PathmatchError> data_;
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Return early from a Result/Status-returning function if expr failed
#define PATHMATCH_TRY(expr) \
    do { \
        auto _pathmatch_result = (expr); \
        if (_pathmatch_result.is_err()) return std::move(_pathmatch_result).error(); \
    } while(0)

} // namespace pathmatch
