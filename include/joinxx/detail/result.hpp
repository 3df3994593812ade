/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Fallible joinxx operations return result<T>; the throwing layer lives in
joinxx/throwing.hpp.

*/

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <cstdint>
#include <format>
#include <utility>

namespace joinxx
{

/// Error categories for joinxx operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Input validation (700-799)
    invalid_argument = 700,

    // Internal errors (900-999)
    internal_error = 900,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::invalid_argument: return "Invalid argument";
        case error_code::internal_error: return "Internal error";
    }
    return "Unknown error";
}

/// Error value with code, message, and optional key=value detail lines
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string detail) noexcept
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        if (detail_.empty())
            return std::format("[{}] {}", static_cast<int>(code_), message_);
        return std::format("[{}] {}: {}", static_cast<int>(code_), message_, detail_);
    }

    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

private:
    error_code code_;
    std::string message_;
    std::string detail_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message, std::string detail)
{
    return std::unexpected(error(code, std::move(message), std::move(detail)));
}

} // namespace joinxx
