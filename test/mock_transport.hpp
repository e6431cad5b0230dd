/*

mock_transport.hpp
------------------

Scriptable in-memory transport for pool tests.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <relayxx/detail/asio_decl.hpp>
#include <relayxx/detail/result.hpp>
#include <relayxx/net/transport.hpp>

namespace relayxx::test
{

/// What a mock transport does when opened
enum class open_behavior
{
    accept,     ///< on_open right away
    reject,     ///< on_error then on_close(1006)
    hang        ///< never completes
};


/**
 * State shared between a mock_transport and the test driving it.
 * Outlives the transport, so a test can inspect a transport the pool has
 * already discarded.
 */
struct mock_endpoint
{
    std::string url;
    net::transport_handlers handlers;
    net::ready_state state = net::ready_state::connecting;
    std::vector<std::string> sent;
    bool fail_sends = false;
    std::optional<std::uint16_t> closed_with;

    void accept()
    {
        state = net::ready_state::open;
        if (handlers.on_open)
            handlers.on_open();
    }

    void reject(const std::string& why = "connection refused")
    {
        state = net::ready_state::closed;
        if (handlers.on_error)
            handlers.on_error(error(error_code::connection_failed, why));
        if (handlers.on_close)
            handlers.on_close(net::close_code::abnormal, why);
    }

    /// Peer sends a frame
    void deliver(std::string_view frame)
    {
        if (handlers.on_message)
            handlers.on_message(frame);
    }

    /// Peer or network closes the socket
    void drop(std::uint16_t code = net::close_code::abnormal, std::string_view reason = "connection lost")
    {
        state = net::ready_state::closed;
        if (handlers.on_close)
            handlers.on_close(code, reason);
    }

    /// Socket dies without any close notification
    void die_silently()
    {
        state = net::ready_state::closed;
    }

    [[nodiscard]] nlohmann::json last_sent() const
    {
        return sent.empty() ? nlohmann::json{} : nlohmann::json::parse(sent.back());
    }
};


class mock_transport : public net::transport
{
public:
    mock_transport(std::shared_ptr<mock_endpoint> endpoint, open_behavior behavior)
        : endpoint_(std::move(endpoint))
        , behavior_(behavior)
    {
    }

    void open(net::transport_handlers handlers) override
    {
        endpoint_->handlers = std::move(handlers);
        switch (behavior_)
        {
            case open_behavior::accept:
                endpoint_->accept();
                break;
            case open_behavior::reject:
                endpoint_->reject();
                break;
            case open_behavior::hang:
                break;
        }
    }

    result_void send(std::string_view frame) override
    {
        if (endpoint_->state != net::ready_state::open)
            return fail(error_code::send_failed, "mock transport is not open");
        if (endpoint_->fail_sends)
            return fail(error_code::send_failed, "mock send failure");
        endpoint_->sent.emplace_back(frame);
        return ok();
    }

    void close(std::uint16_t code, std::string_view reason) override
    {
        if (endpoint_->state == net::ready_state::closed)
            return;
        endpoint_->closed_with = code;
        endpoint_->drop(code, reason);
    }

    [[nodiscard]] net::ready_state state() const noexcept override
    {
        return endpoint_->state;
    }

private:
    std::shared_ptr<mock_endpoint> endpoint_;
    open_behavior behavior_;
};


/**
 * Factory side: hands out mock transports following a script and records
 * every endpoint it created, in creation order.
 */
class mock_network
{
public:
    /// Behaviors for the next opens; default_behavior once exhausted
    std::deque<open_behavior> script;
    open_behavior default_behavior = open_behavior::accept;
    std::vector<std::shared_ptr<mock_endpoint>> created;

    [[nodiscard]] net::transport_factory factory()
    {
        return [this](const std::string& url) -> std::unique_ptr<net::transport>
        {
            auto endpoint = std::make_shared<mock_endpoint>();
            endpoint->url = url;
            created.push_back(endpoint);

            auto behavior = default_behavior;
            if (!script.empty())
            {
                behavior = script.front();
                script.pop_front();
            }
            return std::make_unique<mock_transport>(std::move(endpoint), behavior);
        };
    }

    /// Most recent endpoint dialed for url (compression query ignored)
    [[nodiscard]] std::shared_ptr<mock_endpoint> latest(std::string_view url) const
    {
        for (auto it = created.rbegin(); it != created.rend(); ++it)
        {
            if (std::string_view((*it)->url).starts_with(url))
                return *it;
        }
        return nullptr;
    }
};


/// Suspend the calling coroutine for d
inline asio::awaitable<void> sleep_for(std::chrono::milliseconds d)
{
    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(d);
    asio::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

} // namespace relayxx::test
