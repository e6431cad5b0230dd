/*

transport.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Abstract duplex message transport consumed by the connection pool.

*/

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include <relayxx/detail/result.hpp>

namespace relayxx::net
{

/// WebSocket close codes the pool relies on (RFC 6455 section 7.4.1)
namespace close_code
{
    inline constexpr std::uint16_t normal = 1000;
    inline constexpr std::uint16_t going_away = 1001;
    inline constexpr std::uint16_t abnormal = 1006;
}

/// Ready state as reported by the underlying socket
enum class ready_state
{
    connecting,
    open,
    closing,
    closed
};

[[nodiscard]] constexpr std::string_view to_string(ready_state state) noexcept
{
    switch (state)
    {
        case ready_state::connecting: return "connecting";
        case ready_state::open: return "open";
        case ready_state::closing: return "closing";
        case ready_state::closed: return "closed";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, ready_state state)
{
    return os << to_string(state);
}

/**
 * Callbacks a transport invokes. They may be called from any thread;
 * the pool re-posts them onto its own strand.
 */
struct transport_handlers
{
    std::function<void()> on_open;
    std::function<void(std::string_view frame)> on_message;
    std::function<void(std::uint16_t code, std::string_view reason)> on_close;
    std::function<void(const error& err)> on_error;
};

/**
 * Duplex message-oriented socket.
 *
 * Implementations start connecting in open() and report the outcome through
 * the handlers. send() must not block on network I/O.
 */
class transport
{
public:
    virtual ~transport() = default;

    /// Begin connecting; handlers stay installed until the transport is destroyed
    virtual void open(transport_handlers handlers) = 0;

    /// Queue a text frame for transmission
    virtual result_void send(std::string_view frame) = 0;

    /// Start the closing handshake with the given code
    virtual void close(std::uint16_t code, std::string_view reason) = 0;

    [[nodiscard]] virtual ready_state state() const noexcept = 0;
};

/// Creates an unopened transport for the given endpoint
using transport_factory = std::function<std::unique_ptr<transport>(const std::string& url)>;

} // namespace relayxx::net
