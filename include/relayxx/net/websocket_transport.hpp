/*

websocket_transport.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

WebSocket transport over Boost.Beast, plain (ws://) or TLS (wss://).

*/

#pragma once

#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include <relayxx/detail/asio_decl.hpp>
#include <relayxx/detail/log.hpp>
#include <relayxx/detail/result.hpp>
#include <relayxx/net/tls_options.hpp>
#include <relayxx/net/transport.hpp>

namespace relayxx::net
{

/// Parsed ws:// or wss:// URL
struct ws_endpoint
{
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";   ///< Path and query

    /// Value of the Host header
    [[nodiscard]] std::string host_header() const
    {
        const bool ipv6 = host.find(':') != std::string::npos;
        std::string h = ipv6 ? "[" + host + "]" : host;
        return h + ":" + port;
    }
};

/**
 * Split a WebSocket URL into scheme, host, port and request target.
 * Accepts ws:// and wss:// (case-insensitive scheme), bracketed IPv6 hosts,
 * and defaults the port to 80 or 443.
 */
[[nodiscard]] inline result<ws_endpoint> parse_endpoint(std::string_view url)
{
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos)
        return fail<ws_endpoint>(error_code::invalid_url, "Missing scheme in " + std::string(url));

    std::string scheme(url.substr(0, scheme_end));
    for (char& c : scheme)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    ws_endpoint ep;
    if (scheme == "wss")
        ep.secure = true;
    else if (scheme != "ws")
        return fail<ws_endpoint>(error_code::invalid_url, "Unsupported scheme " + scheme);

    std::string_view rest = url.substr(scheme_end + 3);
    const auto target_pos = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, target_pos);
    if (target_pos != std::string_view::npos)
    {
        ep.target = std::string(rest.substr(target_pos));
        if (ep.target.front() == '?')
            ep.target.insert(ep.target.begin(), '/');
    }

    std::string_view port;
    if (!authority.empty() && authority.front() == '[')
    {
        const auto close = authority.find(']');
        if (close == std::string_view::npos)
            return fail<ws_endpoint>(error_code::invalid_url, "Unterminated IPv6 host in " + std::string(url));
        ep.host = std::string(authority.substr(1, close - 1));
        const auto after = authority.substr(close + 1);
        if (!after.empty())
        {
            if (after.front() != ':')
                return fail<ws_endpoint>(error_code::invalid_url, "Malformed authority in " + std::string(url));
            port = after.substr(1);
        }
    }
    else
    {
        const auto colon = authority.rfind(':');
        ep.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos)
            port = authority.substr(colon + 1);
    }

    if (ep.host.empty())
        return fail<ws_endpoint>(error_code::invalid_url, "Missing host in " + std::string(url));

    if (port.empty())
    {
        ep.port = ep.secure ? "443" : "80";
    }
    else
    {
        unsigned int value = 0;
        const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc{} || ptr != port.data() + port.size() || value == 0 || value > 65535)
            return fail<ws_endpoint>(error_code::invalid_url, "Invalid port in " + std::string(url));
        ep.port = std::string(port);
    }
    return ep;
}


struct websocket_options
{
    std::string user_agent = "relayxx";
    bool permessage_deflate = false;
    std::chrono::milliseconds connect_timeout{30000};
    tls_options tls;
};

} // namespace relayxx::net


namespace relayxx::detail
{

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

class websocket_session_base
{
public:
    virtual ~websocket_session_base() = default;

    virtual void start(net::transport_handlers handlers) = 0;
    virtual void send(std::string frame) = 0;
    virtual void close(std::uint16_t code, std::string reason) = 0;

    /// Drop the handlers and tear the socket down; the owner is going away
    virtual void abandon() = 0;

    [[nodiscard]] net::ready_state state() const noexcept
    {
        return state_.load(std::memory_order_acquire);
    }

protected:
    std::atomic<net::ready_state> state_{net::ready_state::connecting};
};


/**
 * One WebSocket connection. Every member runs on the session strand; the
 * coroutines hold a shared_ptr to the session while they are suspended.
 */
template<bool Secure>
class websocket_session
    : public websocket_session_base
    , public std::enable_shared_from_this<websocket_session<Secure>>
{
public:
    using next_layer_type = std::conditional_t<Secure,
        beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;
    using stream_type = websocket::stream<next_layer_type>;

    websocket_session(asio::any_io_executor executor, net::ws_endpoint endpoint,
                      std::shared_ptr<asio::ssl::context> tls_context, const net::websocket_options& options)
        : strand_(asio::make_strand(std::move(executor)))
        , endpoint_(std::move(endpoint))
        , tls_context_(std::move(tls_context))
        , options_(options)
    {
        if constexpr (Secure)
            ws_.emplace(strand_, *tls_context_);
        else
            ws_.emplace(strand_);
    }

    void start(net::transport_handlers handlers) override
    {
        handlers_ = std::move(handlers);
        asio::co_spawn(strand_, [self = this->shared_from_this()]() { return self->run(); }, asio::detached);
    }

    void send(std::string frame) override
    {
        asio::post(strand_, [self = this->shared_from_this(), frame = std::move(frame)]() mutable
        {
            if (self->state() != net::ready_state::open)
                return;
            self->outbox_.push_back(std::move(frame));
            if (!self->writing_)
            {
                self->writing_ = true;
                asio::co_spawn(self->strand_, [self]() { return self->write_loop(); }, asio::detached);
            }
        });
    }

    void close(std::uint16_t code, std::string reason) override
    {
        asio::post(strand_, [self = this->shared_from_this(), code, reason = std::move(reason)]() mutable
        {
            if (self->close_requested_)
                return;
            self->close_requested_ = true;
            self->close_code_ = code;
            self->close_reason_ = std::move(reason);

            switch (self->state())
            {
                case net::ready_state::connecting:
                    // run() notices the aborted step and reports the close
                    self->state_.store(net::ready_state::closing, std::memory_order_release);
                    self->shutdown_socket();
                    break;
                case net::ready_state::open:
                    self->state_.store(net::ready_state::closing, std::memory_order_release);
                    asio::co_spawn(self->strand_, [self]() { return self->close_handshake(); }, asio::detached);
                    break;
                case net::ready_state::closing:
                case net::ready_state::closed:
                    break;
            }
        });
    }

    void abandon() override
    {
        asio::post(strand_, [self = this->shared_from_this()]()
        {
            self->handlers_ = net::transport_handlers{};
            self->close_requested_ = true;
            self->shutdown_socket();
        });
    }

private:
    asio::awaitable<void> run()
    {
        asio::error_code ec;

        asio::tcp::resolver resolver(strand_);
        const auto endpoints = co_await resolver.async_resolve(endpoint_.host, endpoint_.port,
            asio::redirect_error(asio::use_awaitable, ec));
        if (close_requested_)
            co_return finish({});
        if (ec)
            co_return finish(error(error_code::resolve_failed, endpoint_.host + ": " + ec.message()));

        auto& lowest = beast::get_lowest_layer(*ws_);
        lowest.expires_after(options_.connect_timeout);
        co_await lowest.async_connect(endpoints, asio::redirect_error(asio::use_awaitable, ec));
        if (close_requested_)
            co_return finish({});
        if (ec)
            co_return finish(error(error_code::connection_failed, endpoint_.host_header() + ": " + ec.message()));

        if constexpr (Secure)
        {
            auto& tls = ws_->next_layer();
            if (!SSL_set_tlsext_host_name(tls.native_handle(), endpoint_.host.c_str()))
                co_return finish(error(error_code::tls_handshake_failed, "Cannot set SNI: " + net::openssl_error_message()));

            if (options_.tls.verify == net::verify_mode::peer)
            {
                tls.set_verify_mode(asio::ssl::verify_peer);
                if (options_.tls.verify_host)
                    tls.set_verify_callback(asio::ssl::host_name_verification(endpoint_.host));
            }
            else
            {
                tls.set_verify_mode(asio::ssl::verify_none);
            }

            co_await tls.async_handshake(asio::ssl::stream_base::client,
                asio::redirect_error(asio::use_awaitable, ec));
            if (close_requested_)
                co_return finish({});
            if (ec)
                co_return finish(error(error_code::tls_handshake_failed, ec.message()));
        }

        lowest.expires_never();
        ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_->set_option(websocket::stream_base::decorator(
            [agent = options_.user_agent](websocket::request_type& req)
            {
                req.set(beast::http::field::user_agent, agent);
            }));
        if (options_.permessage_deflate)
        {
            websocket::permessage_deflate deflate;
            deflate.client_enable = true;
            ws_->set_option(deflate);
        }

        co_await ws_->async_handshake(endpoint_.host_header(), endpoint_.target,
            asio::redirect_error(asio::use_awaitable, ec));
        if (close_requested_)
            co_return finish({});
        if (ec)
            co_return finish(error(error_code::handshake_failed, ec.message()));

        ws_->text(true);
        state_.store(net::ready_state::open, std::memory_order_release);
        RELAYXX_LOG_DEBUG("WS", "Connected to " << endpoint_.host_header() << endpoint_.target);
        if (handlers_.on_open)
            handlers_.on_open();

        co_await read_loop();
    }

    asio::awaitable<void> read_loop()
    {
        beast::flat_buffer buffer;
        asio::error_code ec;
        for (;;)
        {
            co_await ws_->async_read(buffer, asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                break;

            const std::string frame = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());
            if (handlers_.on_message)
                handlers_.on_message(frame);
        }

        if (close_requested_)
        {
            finish({});
        }
        else if (ec == websocket::error::closed)
        {
            const auto& reason = ws_->reason();
            state_.store(net::ready_state::closed, std::memory_order_release);
            notify_close(static_cast<std::uint16_t>(reason.code),
                std::string(reason.reason.data(), reason.reason.size()));
        }
        else
        {
            finish(error(error_code::connection_closed, ec.message()));
        }
    }

    asio::awaitable<void> write_loop()
    {
        while (!outbox_.empty() && state() == net::ready_state::open)
        {
            asio::error_code ec;
            co_await ws_->async_write(asio::buffer(outbox_.front()),
                asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
            {
                // The read loop observes the broken stream and reports the close
                RELAYXX_LOG_WARN("WS", "Write to " << endpoint_.host_header() << " failed: " << ec.message());
                outbox_.clear();
                break;
            }
            outbox_.pop_front();
        }
        writing_ = false;
    }

    asio::awaitable<void> close_handshake()
    {
        asio::error_code ec;
        websocket::close_reason reason(static_cast<websocket::close_code>(close_code_),
            beast::string_view(close_reason_.data(), close_reason_.size()));
        co_await ws_->async_close(reason, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            shutdown_socket();
    }

    /// Report the end of the session: an optional error, then the close
    void finish(std::optional<error> err)
    {
        state_.store(net::ready_state::closed, std::memory_order_release);
        if (err)
        {
            RELAYXX_LOG_WARN("WS", *err);
            if (handlers_.on_error)
                handlers_.on_error(*err);
        }

        if (close_requested_)
            notify_close(close_code_, close_reason_);
        else
            notify_close(net::close_code::abnormal, err ? err->message() : std::string{});
    }

    void notify_close(std::uint16_t code, const std::string& reason)
    {
        if (handlers_.on_close)
            handlers_.on_close(code, reason);
        handlers_ = net::transport_handlers{};
    }

    void shutdown_socket()
    {
        asio::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);
    }

    asio::strand<asio::any_io_executor> strand_;
    net::ws_endpoint endpoint_;
    std::shared_ptr<asio::ssl::context> tls_context_;
    net::websocket_options options_;
    std::optional<stream_type> ws_;
    net::transport_handlers handlers_;

    std::deque<std::string> outbox_;
    bool writing_ = false;

    bool close_requested_ = false;
    std::uint16_t close_code_ = net::close_code::normal;
    std::string close_reason_;
};

} // namespace relayxx::detail


namespace relayxx::net
{


/**
 * transport implementation for ws:// and wss:// URLs.
 *
 * send() queues the frame on the session strand and returns immediately.
 * Destroying the transport silently tears the socket down.
 */
class websocket_transport : public transport
{
public:
    websocket_transport(asio::any_io_executor executor, std::string url,
                        std::shared_ptr<asio::ssl::context> tls_context, websocket_options options = {})
        : executor_(std::move(executor))
        , url_(std::move(url))
        , tls_context_(std::move(tls_context))
        , options_(std::move(options))
    {
    }

    ~websocket_transport() override
    {
        if (session_)
            session_->abandon();
    }

    websocket_transport(const websocket_transport&) = delete;
    websocket_transport& operator=(const websocket_transport&) = delete;

    void open(transport_handlers handlers) override
    {
        auto endpoint = parse_endpoint(url_);
        if (!endpoint)
        {
            reject(std::move(handlers), endpoint.error());
            return;
        }

        if (endpoint->secure)
        {
            if (!tls_context_)
            {
                reject(std::move(handlers), error(error_code::tls_handshake_failed, "No TLS context for " + url_));
                return;
            }
            session_ = std::make_shared<relayxx::detail::websocket_session<true>>(
                executor_, std::move(*endpoint), tls_context_, options_);
        }
        else
        {
            session_ = std::make_shared<relayxx::detail::websocket_session<false>>(
                executor_, std::move(*endpoint), nullptr, options_);
        }
        session_->start(std::move(handlers));
    }

    result_void send(std::string_view frame) override
    {
        if (state() != ready_state::open)
            return fail(error_code::send_failed, "WebSocket is not open");
        session_->send(std::string(frame));
        return ok();
    }

    void close(std::uint16_t code, std::string_view reason) override
    {
        if (session_)
            session_->close(code, std::string(reason));
    }

    [[nodiscard]] ready_state state() const noexcept override
    {
        if (rejected_)
            return ready_state::closed;
        return session_ ? session_->state() : ready_state::connecting;
    }

    /**
     * Factory for connection pools. The TLS context is built once from
     * options.tls and shared by every wss:// transport.
     */
    [[nodiscard]] static transport_factory factory(asio::any_io_executor executor, websocket_options options = {})
    {
        std::shared_ptr<asio::ssl::context> tls_context;
        auto context = make_tls_context(options.tls);
        if (context)
            tls_context = std::move(*context);
        else
            RELAYXX_LOG_ERROR("WS", "TLS context unavailable, wss:// endpoints will fail: " << context.error());

        return [executor = std::move(executor), tls_context, options = std::move(options)](const std::string& url)
        {
            return std::make_unique<websocket_transport>(executor, url, tls_context, options);
        };
    }

private:
    void reject(transport_handlers handlers, const error& err)
    {
        rejected_ = true;
        RELAYXX_LOG_WARN("WS", err);
        if (handlers.on_error)
            handlers.on_error(err);
        if (handlers.on_close)
            handlers.on_close(close_code::abnormal, err.message());
    }

    asio::any_io_executor executor_;
    std::string url_;
    std::shared_ptr<asio::ssl::context> tls_context_;
    websocket_options options_;
    std::shared_ptr<relayxx::detail::websocket_session_base> session_;
    bool rejected_ = false;
};

} // namespace relayxx::net
