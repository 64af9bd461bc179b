#ifndef CTXDB_CORE_RESULT_H_
#define CTXDB_CORE_RESULT_H_

#include <string>
#include <optional>
#include <utility>
#include <stdexcept>
#include "ctxdb/core/error.h"

namespace ctxdb {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * An error result carries the Error::Code identifying the failure kind and a
 * human readable message.
 *
 * Usage:
 * ```
 * Result<size_t> foo() {
 *     if (error_condition) {
 *         return Result<size_t>::error(Error::Code::NOT_FOUND, "no such model");
 *     }
 *     return Result<size_t>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     size_t value = result.value();
 * } else if (result.code() == Error::Code::NOT_FOUND) {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}

    // Conversion from a thrown/constructed ctxdb error
    explicit Result(const Error& error)
        : value_(), error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(Error::Code code, std::string error_msg, ErrorTag)
        : value_(), error_msg_(std::move(error_msg)), code_(code) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)), code_(other.code_) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code code() const { return code_; }
    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(Error::Code code, const std::string& message) {
        return Result<T>(code, message, ErrorTag{});
    }
    static Result<T> error(const std::string& message) {
        return Result<T>(Error::Code::UNKNOWN, message, ErrorTag{});
    }

    // Re-types the error of another result
    template<typename U>
    static Result<T> propagate(const Result<U>& other) {
        return Result<T>(other.code(), other.error(), ErrorTag{});
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}
    explicit Result(const Error& error)
        : error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(Error::Code code, std::string error_msg, ErrorTag)
        : error_msg_(std::move(error_msg)), code_(code) {}

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code code() const { return code_; }

    static Result<void> error(Error::Code code, const std::string& message) {
        return Result<void>(code, message, ErrorTag{});
    }
    static Result<void> error(const std::string& message) {
        return Result<void>(Error::Code::UNKNOWN, message, ErrorTag{});
    }

    template<typename U>
    static Result<void> propagate(const Result<U>& other) {
        return Result<void>(other.code(), other.error(), ErrorTag{});
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

} // namespace core
} // namespace ctxdb

#endif // CTXDB_CORE_RESULT_H_
