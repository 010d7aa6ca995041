#pragma once

#include <utility>
#include <variant>

// Success value of a Result
template <class T>
struct Ok {
    T val;

    explicit Ok(T v) : val(std::move(v)) {}
};

// Failure value of a Result
template <class E>
struct Err {
    E err;

    explicit Err(E e) : err(std::move(e)) {}
};

// Either a value of an operation that may fail in an expected way or the
// description of that failure. Exceptions are reserved for unexpected errors.
template <class T, class E>
class Result {
    std::variant<Ok<T>, Err<E>> var_;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Result(Ok<T> ok) : var_(std::move(ok)) {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    Result(Err<E> err) : var_(std::move(err)) {}

    [[nodiscard]] bool is_ok() const noexcept { return var_.index() == 0; }

    [[nodiscard]] bool is_err() const noexcept { return var_.index() == 1; }

    // Throws std::bad_variant_access if the Result holds an error
    T unwrap() && { return std::get<Ok<T>>(std::move(var_)).val; }

    // Throws std::bad_variant_access if the Result holds a value
    E unwrap_err() && { return std::get<Err<E>>(std::move(var_)).err; }
};
