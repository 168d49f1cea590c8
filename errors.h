#ifndef REFNET_ERRORS_H
#define REFNET_ERRORS_H

/*!
 * @file errors.h
 * @brief Error codes and the Result type returned by all the core operations.
 *
 * Core operations never throw on a violated precondition. Instead they return a Result<T>
 * which holds either the payload of type T, or an Error with its code and a readable message.
 * A rejected operation leaves the object it was called on unchanged.
 */

#include <concepts>
#include <string>
#include <utility>
#include <variant>
#include "global.h"

enum class ErrorCode {
    InvalidInput,               // Empty or missing user identifier
    DuplicateReferrer,          // The candidate already has a referrer
    CycleDetected,              // The referral would close a cycle (including self-referral)
    InvalidProbability,         // Probability out of [0, 1]
    InvalidDuration,            // Negative number of days
    InvalidTolerance,           // Non-positive tolerance eps
    InvalidProbabilityFunction, // Adoption model returns a value out of [0, 1]
    InvalidSignature            // Adoption model missing or not callable with a bonus amount
};

constexpr const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidInput:
        return "InvalidInput";
    case ErrorCode::DuplicateReferrer:
        return "DuplicateReferrer";
    case ErrorCode::CycleDetected:
        return "CycleDetected";
    case ErrorCode::InvalidProbability:
        return "InvalidProbability";
    case ErrorCode::InvalidDuration:
        return "InvalidDuration";
    case ErrorCode::InvalidTolerance:
        return "InvalidTolerance";
    case ErrorCode::InvalidProbabilityFunction:
        return "InvalidProbabilityFunction";
    case ErrorCode::InvalidSignature:
        return "InvalidSignature";
    default:
        return "(ERROR)";
    }
}

struct Error {
    ErrorCode   code;
    std::string message;
};

inline std::string toString(const Error& error) {
    return fmt::format("{}: {}", toString(error.code), error.message);
}

/*!
 * @brief Creates an Error object, which converts implicitly to any Result<T>.
 */
inline Error fail(ErrorCode code, std::string message) {
    return Error{.code = code, .message = std::move(message)};
}

/*!
 * @brief Thrown when the payload of a failed Result (or the error of a successful one) is accessed.
 */
class BadResultAccess : public std::bad_variant_access {
    std::string _what;

public:
    explicit BadResultAccess(std::string what): _what(std::move(what)) {}

    [[nodiscard]] const char* what() const noexcept override {
        return _what.c_str();
    }
};

/*!
 * @brief Either a payload of type T or an Error.
 *
 * Result<> (i.e. T = std::monostate) is used for operations without a payload.
 *
 * @tparam T Type of the payload
 */
template <class T = std::monostate>
class Result {
    std::variant<T, Error> _content;

public:
    Result() requires std::default_initializable<T>: _content(std::in_place_index<0>) {}

    Result(T value): _content(std::in_place_index<0>, std::move(value)) {} // NOLINT(google-explicit-constructor)

    Result(Error error): _content(std::in_place_index<1>, std::move(error)) {} // NOLINT(google-explicit-constructor)

    [[nodiscard]] bool ok() const noexcept {
        return _content.index() == 0;
    }

    explicit operator bool() const noexcept {
        return ok();
    }

    T& value() & {
        checkValue();
        return std::get<0>(_content);
    }

    const T& value() const & {
        checkValue();
        return std::get<0>(_content);
    }

    T&& value() && {
        checkValue();
        return std::get<0>(std::move(_content));
    }

    [[nodiscard]] const Error& error() const {
        if (ok()) {
            throw BadResultAccess("Result::error() called on a successful result");
        }
        return std::get<1>(_content);
    }

    // Shortcut of error().code
    [[nodiscard]] ErrorCode code() const {
        return error().code;
    }

private:
    void checkValue() const {
        if (!ok()) {
            throw BadResultAccess("Result::value() called on a failed result: " + toString(std::get<1>(_content)));
        }
    }
};

#endif //REFNET_ERRORS_H
