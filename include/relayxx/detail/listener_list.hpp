/*

listener_list.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <relayxx/detail/log.hpp>
#include <relayxx/detail/subscription.hpp>

namespace relayxx::detail
{

/**
 * Thread-safe set of callbacks.
 * notify() invokes a snapshot of the callbacks outside the lock, so a
 * callback may subscribe or unsubscribe while being notified.
 */
template<typename... Args>
class listener_list
{
public:
    using callback_type = std::function<void(const Args&...)>;

    listener_list() = default;

    listener_list(const listener_list&) = delete;
    listener_list& operator=(const listener_list&) = delete;

    [[nodiscard]] subscription add(callback_type cb)
    {
        std::uint64_t id = 0;
        {
            std::lock_guard lock(state_->mutex);
            id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(cb));
        }

        return subscription([weak = std::weak_ptr<state>(state_), id]()
        {
            if (auto s = weak.lock())
            {
                std::lock_guard lock(s->mutex);
                s->callbacks.erase(id);
            }
        });
    }

    void clear()
    {
        std::lock_guard lock(state_->mutex);
        state_->callbacks.clear();
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->callbacks.size();
    }

    void notify(const Args&... args) const
    {
        std::vector<callback_type> snapshot;
        {
            std::lock_guard lock(state_->mutex);
            snapshot.reserve(state_->callbacks.size());
            for (const auto& [id, cb] : state_->callbacks)
                snapshot.push_back(cb);
        }

        for (const auto& cb : snapshot)
        {
            try
            {
                cb(args...);
            }
            catch (const std::exception& e)
            {
                RELAYXX_LOG_WARN("EVENTS", "Listener threw: " << e.what());
            }
            catch (...)
            {
                RELAYXX_LOG_WARN("EVENTS", "Listener threw a non-standard exception");
            }
        }
    }

private:
    struct state
    {
        mutable std::mutex mutex;
        std::uint64_t next_id = 1;
        std::map<std::uint64_t, callback_type> callbacks;
    };

    std::shared_ptr<state> state_ = std::make_shared<state>();
};

} // namespace relayxx::detail
