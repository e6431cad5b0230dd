/*

subscription.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <functional>
#include <utility>

namespace relayxx
{

/**
 * RAII handle returned by every subscribe() in relayxx.
 * Unsubscribes when reset or destroyed. Safe to outlive the publisher.
 */
class subscription
{
public:
    subscription() noexcept = default;

    explicit subscription(std::function<void()> cancel)
        : cancel_(std::move(cancel))
    {
    }

    subscription(subscription&& other) noexcept
        : cancel_(std::exchange(other.cancel_, nullptr))
    {
    }

    subscription& operator=(subscription&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            cancel_ = std::exchange(other.cancel_, nullptr);
        }
        return *this;
    }

    subscription(const subscription&) = delete;
    subscription& operator=(const subscription&) = delete;

    ~subscription()
    {
        reset();
    }

    /// Unsubscribe now
    void reset() noexcept
    {
        if (auto cancel = std::exchange(cancel_, nullptr))
            cancel();
    }

    /// Keep the subscription alive for the publisher's lifetime
    void release() noexcept
    {
        cancel_ = nullptr;
    }

    [[nodiscard]] bool active() const noexcept
    {
        return static_cast<bool>(cancel_);
    }

private:
    std::function<void()> cancel_;
};

} // namespace relayxx
