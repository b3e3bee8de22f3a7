#pragma once

#include <string>
#include <variant>
#include "exceptions.hpp"

namespace neo {

struct Error {
    ErrorCode code;
    std::string message;
};

template<typename T>
class Result {
private:
    std::variant<T, Error> value_;

public:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    static Result<T> success(T value) {
        return Result<T>(std::move(value));
    }

    static Result<T> error(ErrorCode code, std::string message) {
        return Result<T>(Error{code, std::move(message)});
    }

    bool is_success() const {
        return std::holds_alternative<T>(value_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(value_);
    }

    const T& value() const {
        return std::get<T>(value_);
    }

    T& value() {
        return std::get<T>(value_);
    }

    const Error& error() const {
        return std::get<Error>(value_);
    }

    ErrorCode error_code() const {
        return error().code;
    }

    T value_or(T default_value) const {
        if (is_success()) {
            return value();
        }
        return default_value;
    }
};

} // namespace neo
