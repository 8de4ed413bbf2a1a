// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file result.h
/// @brief Structured error reporting for pointer and patch operations.
///
/// Every entry point of the library returns a Result<T>: either the produced
/// value or an Error describing why nothing was produced. Nothing in the
/// library throws on malformed input; only Result::get() throws, and only
/// when the caller asks for a value that is not there.
///
/// @code
///   auto doc = patch::evaluate(input, patch::remove("/users/0"));
///   if (!doc) {
///       std::cerr << to_string(doc.error()) << "\n";
///       return;
///   }
///   use(doc.value());
/// @endcode

#pragma once

#include <jsonrfc/jsonrfc_config.h>
#include <jsonrfc/api.h>

#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsonrfc {

enum class ErrorCode {
    InvalidPointer,     // Pointer text is malformed
    InvalidPath,        // Pointer parses but does not resolve against the document
    InvalidTarget,      // Parent resolves but the operation's precondition fails
    InvalidOperation,   // Operation record is malformed
    Rejected,           // Failure reported by a caller-supplied update function
};

struct Error {
    ErrorCode code = ErrorCode::InvalidPath;
    std::string message;

    bool operator==(const Error&) const = default;
};

[[nodiscard]] JSONRFC_API std::string_view error_code_name(ErrorCode code) noexcept;

/// "invalid_path: key \"foo\" not found at path position 0"
[[nodiscard]] JSONRFC_API std::string to_string(const Error& error);

[[nodiscard]] inline Error make_error(ErrorCode code, std::string message = {})
{
    return Error{code, std::move(message)};
}

/// Either a value of type T or an Error.
///
/// A bare T and a bare Error both convert implicitly, so functions returning
/// Result<T> can simply `return value;` or `return make_error(...);`.
template <typename T>
class Result {
public:
    using value_type = T;

    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /// @pre ok()
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// @pre !ok()
    [[nodiscard]] const Error& error() const& { return std::get<1>(data_); }
    [[nodiscard]] Error&& error() && { return std::get<1>(std::move(data_)); }

    /// Access the value, throwing std::runtime_error when this holds an Error
    [[nodiscard]] const T& get() const {
        if (!ok()) {
            throw std::runtime_error("jsonrfc operation failed: " + to_string(error()));
        }
        return value();
    }

    [[nodiscard]] T get_or(T default_val) const {
        return ok() ? value() : std::move(default_val);
    }

    bool operator==(const Result&) const = default;

private:
    std::variant<T, Error> data_;
};

namespace detail {

inline void log_failure(
    std::string_view func,
    const Error& error,
    std::source_location loc = std::source_location::current())
{
#if JSONRFC_VERBOSE_LOG
    std::cerr << "[" << func << "] " << to_string(error)
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)error;
    (void)loc;
#endif
}

} // namespace detail

} // namespace jsonrfc
