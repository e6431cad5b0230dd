/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for relayxx.
Supports multiple log levels, optional callbacks, and frame tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace relayxx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Frame-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for frame tracing
enum class direction : std::uint8_t
{
    send,     ///< Frame written to the peer
    receive   ///< Frame read from the peer
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string channel;   // connection id
        std::string data;      // raw frame
    };
    std::optional<trace_info_t> trace_info;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

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

/// Process-wide logger configuration (thread-safe)
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
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
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

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
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
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    /// Trace a frame exchanged on a connection
    void trace_frame(std::string_view channel, direction dir, std::string_view data,
                     std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .channel = std::string(channel),
                .data = std::string(data)
            }
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

        std::ostringstream line;
        line << '[' << std::put_time(&tm_buf, "%H:%M:%S") << '.'
             << std::setw(3) << std::setfill('0') << ms.count() << "] ";

        if (e.trace_info)
        {
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            line << e.trace_info->channel << ' ' << dir_str << ' '
                 << sanitize_trace(e.trace_info->data);
        }
        else
        {
            line << '[' << level_to_string(e.lvl) << "] " << e.message;
        }
        line << '\n';
        std::cerr << line.str();
    }

    /// Truncate long frames and hide control characters
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 500;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32)
                c = '.';
        }
        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

} // namespace relayxx::log

// Category-tagged logging with a stream expression:
//   RELAYXX_LOG_INFO("POOL", "Connection " << id << " added");
#define RELAYXX_LOG_AT(lvl, category, expr) \
    do \
    { \
        auto& relayxx_logger_ = ::relayxx::log::logger::instance(); \
        if (relayxx_logger_.is_enabled(lvl)) \
        { \
            std::ostringstream relayxx_log_os_; \
            relayxx_log_os_ << "[" << category << "] " << expr; \
            relayxx_logger_.log(lvl, relayxx_log_os_.str(), std::source_location::current()); \
        } \
    } while (0)

#define RELAYXX_LOG_TRACE(category, expr) RELAYXX_LOG_AT(::relayxx::log::level::trace, category, expr)
#define RELAYXX_LOG_DEBUG(category, expr) RELAYXX_LOG_AT(::relayxx::log::level::debug, category, expr)
#define RELAYXX_LOG_INFO(category, expr)  RELAYXX_LOG_AT(::relayxx::log::level::info, category, expr)
#define RELAYXX_LOG_WARN(category, expr)  RELAYXX_LOG_AT(::relayxx::log::level::warn, category, expr)
#define RELAYXX_LOG_ERROR(category, expr) RELAYXX_LOG_AT(::relayxx::log::level::error, category, expr)

#define RELAYXX_TRACE_SEND(channel, data) \
    ::relayxx::log::logger::instance().trace_frame(channel, ::relayxx::log::direction::send, data)

#define RELAYXX_TRACE_RECV(channel, data) \
    ::relayxx::log::logger::instance().trace_frame(channel, ::relayxx::log::direction::receive, data)
