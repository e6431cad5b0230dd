/*

reachability.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Network reachability input for the connection pool.

*/

#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string_view>

#include <relayxx/detail/listener_list.hpp>
#include <relayxx/detail/subscription.hpp>

namespace relayxx::net
{

/**
 * External observer reporting "network available / unavailable".
 * subscribe() delivers the current state once, then every change.
 */
class reachability_source
{
public:
    using callback_type = std::function<void(const bool&)>;

    virtual ~reachability_source() = default;

    [[nodiscard]] virtual subscription subscribe(callback_type cb) = 0;
};


/**
 * Reachability source driven by the application, e.g. from a platform
 * connectivity callback.
 */
class manual_reachability : public reachability_source
{
public:
    explicit manual_reachability(bool available = true)
        : available_(available)
    {
    }

    [[nodiscard]] subscription subscribe(callback_type cb) override
    {
        const bool current = available();
        cb(current);
        return listeners_.add(std::move(cb));
    }

    /// Publish a new state; listeners are notified on every call
    void set_available(bool available)
    {
        {
            std::lock_guard lock(mutex_);
            available_ = available;
        }
        listeners_.notify(available);
    }

    [[nodiscard]] bool available() const
    {
        std::lock_guard lock(mutex_);
        return available_;
    }

    [[nodiscard]] std::size_t subscriber_count() const
    {
        return listeners_.size();
    }

private:
    mutable std::mutex mutex_;
    bool available_;
    detail::listener_list<bool> listeners_;
};


enum class network_transition
{
    none,
    restored,
    lost
};

[[nodiscard]] constexpr std::string_view to_string(network_transition t) noexcept
{
    switch (t)
    {
        case network_transition::none: return "none";
        case network_transition::restored: return "restored";
        case network_transition::lost: return "lost";
    }
    return "unknown";
}


/**
 * Tracks the last reported reachability and turns raw reports into
 * transitions. Repeated reports of the same state are not transitions.
 */
class network_monitor
{
public:
    explicit network_monitor(bool initially_available = true) noexcept
        : available_(initially_available)
    {
    }

    [[nodiscard]] bool available() const noexcept
    {
        return available_.load(std::memory_order_acquire);
    }

    network_transition update(bool available) noexcept
    {
        const bool was = available_.exchange(available, std::memory_order_acq_rel);
        if (!was && available)
            return network_transition::restored;
        if (was && !available)
            return network_transition::lost;
        return network_transition::none;
    }

private:
    std::atomic<bool> available_;
};

} // namespace relayxx::net
