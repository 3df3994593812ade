/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for joinxx.
Supports multiple log levels and an optional callback sink.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>

namespace joinxx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Per-operation tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (rejected operations)
    fatal = 5,   ///< Fatal errors (contract violations)
    off = 6      ///< Logging disabled
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off
            && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    static void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] [{}] {} ({}:{})\n",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
            level_to_string(e.lvl), e.message,
            e.location.file_name(), e.location.line());
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define JOINXX_LOG(lvl, msg) \
    ::joinxx::log::logger::instance().log(lvl, msg, std::source_location::current())

#define JOINXX_TRACE(msg)  JOINXX_LOG(::joinxx::log::level::trace, msg)
#define JOINXX_DEBUG(msg)  JOINXX_LOG(::joinxx::log::level::debug, msg)
#define JOINXX_INFO(msg)   JOINXX_LOG(::joinxx::log::level::info, msg)
#define JOINXX_WARN(msg)   JOINXX_LOG(::joinxx::log::level::warn, msg)
#define JOINXX_ERROR(msg)  JOINXX_LOG(::joinxx::log::level::error, msg)
#define JOINXX_FATAL(msg)  JOINXX_LOG(::joinxx::log::level::fatal, msg)

} // namespace joinxx::log
