/*

pool/message_queue.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>

#include <nlohmann/json.hpp>

namespace relayxx::pool
{

template<typename Payload>
struct basic_queued_message
{
    Payload payload;
    int priority = 1;                             ///< Higher is more urgent
    std::chrono::steady_clock::time_point enqueued_at;
    std::uint64_t sequence = 0;                   ///< Insertion order
};


/**
 * Bounded outbound buffer ordered by priority (descending), FIFO within a
 * priority. When full, the oldest entry of the lowest priority goes first.
 *
 * Not synchronized; the pool serializes access.
 */
template<typename Payload>
class basic_message_queue
{
public:
    using message_type = basic_queued_message<Payload>;

    static constexpr std::size_t default_capacity = 1000;

    explicit basic_message_queue(std::size_t capacity = default_capacity)
        : capacity_(std::max<std::size_t>(capacity, 1))
    {
    }

    /// Insert a message; returns how many entries the bound evicted
    std::size_t enqueue(Payload payload, int priority)
    {
        message_type msg{
            .payload = std::move(payload),
            .priority = priority,
            .enqueued_at = std::chrono::steady_clock::now(),
            .sequence = next_sequence_++
        };

        // After every entry of equal or higher priority
        auto pos = std::find_if(entries_.begin(), entries_.end(),
            [priority](const message_type& m) { return m.priority < priority; });
        entries_.insert(pos, std::move(msg));

        return enforce_capacity();
    }

    /**
     * Send from the head until send_fn fails or the queue is empty.
     * The message that failed stays at the head.
     *
     * @param send_fn bool(const message_type&)
     * @return number of messages still queued
     */
    template<typename SendFn>
    std::size_t drain(SendFn&& send_fn)
    {
        while (!entries_.empty())
        {
            message_type head = std::move(entries_.front());
            entries_.pop_front();
            if (!send_fn(static_cast<const message_type&>(head)))
            {
                entries_.push_front(std::move(head));
                break;
            }
        }
        return entries_.size();
    }

    /// Change the bound; returns how many entries were evicted
    std::size_t set_capacity(std::size_t capacity)
    {
        capacity_ = std::max<std::size_t>(capacity, 1);
        return enforce_capacity();
    }

    void clear() noexcept
    {
        entries_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] const message_type& front() const { return entries_.front(); }
    [[nodiscard]] const message_type& back() const { return entries_.back(); }

    [[nodiscard]] auto begin() const noexcept { return entries_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.cend(); }

private:
    std::size_t enforce_capacity()
    {
        std::size_t dropped = 0;
        while (entries_.size() > capacity_)
        {
            // The lowest band sits at the tail; its first entry is the oldest
            const int lowest = entries_.back().priority;
            auto oldest = std::find_if(entries_.begin(), entries_.end(),
                [lowest](const message_type& m) { return m.priority == lowest; });
            entries_.erase(oldest);
            ++dropped;
        }
        return dropped;
    }

    std::deque<message_type> entries_;
    std::size_t capacity_;
    std::uint64_t next_sequence_ = 0;
};


using queued_message = basic_queued_message<nlohmann::json>;
using message_queue = basic_message_queue<nlohmann::json>;

} // namespace relayxx::pool
