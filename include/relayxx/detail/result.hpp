/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Network-facing failures in relayxx are returned via result<T>, never thrown.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace relayxx
{

/// Error categories for relayxx operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Transport errors (100-199)
    connection_failed = 100,
    connection_closed = 101,
    connection_timeout = 102,
    resolve_failed = 103,
    tls_handshake_failed = 104,
    handshake_failed = 105,
    send_failed = 106,
    invalid_url = 107,

    // Pool errors (200-299)
    pool_full = 200,
    duplicate_connection = 201,
    unknown_connection = 202,
    not_connected = 203,
    shut_down = 204,

    // Payload errors (300-399)
    invalid_payload = 300,

    // Internal errors (900-999)
    internal_error = 900,
    cancelled = 902,
};

[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::connection_failed: return "Connection failed";
        case error_code::connection_closed: return "Connection closed";
        case error_code::connection_timeout: return "Connection timeout";
        case error_code::resolve_failed: return "Name resolution failed";
        case error_code::tls_handshake_failed: return "TLS handshake failed";
        case error_code::handshake_failed: return "WebSocket handshake failed";
        case error_code::send_failed: return "Send failed";
        case error_code::invalid_url: return "Invalid URL";
        case error_code::pool_full: return "Maximum connections reached";
        case error_code::duplicate_connection: return "Connection already exists";
        case error_code::unknown_connection: return "Unknown connection";
        case error_code::not_connected: return "Connection not open";
        case error_code::shut_down: return "Pool is shut down";
        case error_code::invalid_payload: return "Invalid payload";
        case error_code::internal_error: return "Internal error";
        case error_code::cancelled: return "Operation cancelled";
    }
    return "Unknown error";
}

inline std::ostream& operator<<(std::ostream& os, error_code ec)
{
    return os << error_code_to_string(ec);
}

/// Error value with code and message
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    /// Transport-level failure (retryable by the reconnection scheduler)
    [[nodiscard]] bool is_transport_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 100 && c < 200;
    }

    [[nodiscard]] std::string to_string() const
    {
        return "[" + std::to_string(static_cast<int>(code_)) + "] " + message_;
    }

private:
    error_code code_;
    std::string message_;
};

inline std::ostream& operator<<(std::ostream& os, const error& err)
{
    return os << err.to_string();
}

template<typename T>
using result = std::expected<T, error>;

using result_void = std::expected<void, error>;

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

} // namespace relayxx
