#pragma once

#include <globstar/error.hpp>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <variant>

namespace globstar {

// A value or the GlobError explaining why there is none. Only entry points
// that can reject their input return one (option validation, config files,
// directory listing); an unreadable directory met during a walk is skipped,
// not reported.
template<typename T>
class Result {
public:
    // Implicit, so that `return GlobError{...};` works in any function
    // returning a Result, and GLOBSTAR_TRY can forward across value types.
    Result(GlobError err) : state_(std::in_place_index<1>, std::move(err)) {}

    static Result ok(T val) { return Result(std::in_place_index<0>, std::move(val)); }
    static Result err(GlobError err) { return Result(std::move(err)); }

    bool is_ok() const { return state_.index() == 0; }
    bool is_err() const { return state_.index() == 1; }

    T& value() & { return std::get<0>(state_); }
    const T& value() const& { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    GlobError& error() & { return std::get<1>(state_); }
    const GlobError& error() const& { return std::get<1>(state_); }
    GlobError&& error() && { return std::get<1>(std::move(state_)); }

    // Result<U> holding f(value()), or this error unchanged.
    template<typename F>
    auto map(F&& f) -> Result<std::invoke_result_t<F, T&>> {
        using U = std::invoke_result_t<F, T&>;
        if (is_err()) return Result<U>::err(error());
        return Result<U>::ok(f(value()));
    }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> idx, V&& v) : state_(idx, std::forward<V>(v)) {}

    std::variant<T, GlobError> state_;
};

// Result of an operation that yields nothing but may fail.
using Status = Result<std::monostate>;

inline Status ok_status() { return Status::ok(std::monostate{}); }

// Return the error of `expr` from the enclosing function, if any.
#define GLOBSTAR_TRY(expr) \
    do { \
        auto _globstar_result = (expr); \
        if (_globstar_result.is_err()) return std::move(_globstar_result).error(); \
    } while (0)

} // namespace globstar
