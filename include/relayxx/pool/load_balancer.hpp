/*

pool/load_balancer.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <relayxx/pool/connection.hpp>
#include <relayxx/pool/pool_config.hpp>

namespace relayxx::pool
{

/**
 * What a strategy sees of a pooled connection.
 */
struct selection_candidate
{
    std::string id;
    connection_state state = connection_state::connecting;
    connection_metrics metrics;
};


/**
 * Picks the connection that carries the next outbound message.
 *
 * select() receives every pooled connection in the pool's iteration order,
 * considers only the connected ones and returns the index of the chosen
 * candidate, or nullopt when none is connected. Calls are serialized by the
 * pool.
 */
class load_balancer
{
public:
    virtual ~load_balancer() = default;

    [[nodiscard]] virtual std::optional<std::size_t> select(std::span<const selection_candidate> candidates) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};


namespace balancing
{

/// Indices of the connected candidates, in order
[[nodiscard]] inline std::vector<std::size_t> connected_indices(std::span<const selection_candidate> candidates)
{
    std::vector<std::size_t> active;
    active.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        if (candidates[i].state == connection_state::connected)
            active.push_back(i);
    }
    return active;
}

/// First connected candidate with the smallest key; ties keep the earlier one
template<typename Key>
[[nodiscard]] std::optional<std::size_t> min_connected_by(std::span<const selection_candidate> candidates, Key key)
{
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        if (candidates[i].state != connection_state::connected)
            continue;
        if (!best || key(candidates[i]) < key(candidates[*best]))
            best = i;
    }
    return best;
}

} // namespace balancing


/**
 * Cycles through the connected subset. The cursor is a position in that
 * subset, so membership changes between calls are absorbed by the modulo.
 */
class round_robin_balancer : public load_balancer
{
public:
    [[nodiscard]] std::optional<std::size_t> select(std::span<const selection_candidate> candidates) override
    {
        const auto active = balancing::connected_indices(candidates);
        if (active.empty())
            return std::nullopt;

        const std::size_t chosen = active[cursor_ % active.size()];
        cursor_ = (cursor_ + 1) % active.size();
        return chosen;
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return to_string(balancing_strategy::round_robin);
    }

private:
    std::size_t cursor_ = 0;
};


class least_latency_balancer : public load_balancer
{
public:
    [[nodiscard]] std::optional<std::size_t> select(std::span<const selection_candidate> candidates) override
    {
        return balancing::min_connected_by(candidates,
            [](const selection_candidate& c) { return c.metrics.latency; });
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return to_string(balancing_strategy::least_latency);
    }
};


class least_load_balancer : public load_balancer
{
public:
    [[nodiscard]] std::optional<std::size_t> select(std::span<const selection_candidate> candidates) override
    {
        return balancing::min_connected_by(candidates,
            [](const selection_candidate& c) { return c.metrics.messages_per_second; });
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return to_string(balancing_strategy::least_load);
    }
};


[[nodiscard]] inline std::unique_ptr<load_balancer> make_load_balancer(balancing_strategy strategy)
{
    switch (strategy)
    {
        case balancing_strategy::round_robin:
            return std::make_unique<round_robin_balancer>();
        case balancing_strategy::least_load:
            return std::make_unique<least_load_balancer>();
        case balancing_strategy::least_latency:
            break;
    }
    return std::make_unique<least_latency_balancer>();
}

} // namespace relayxx::pool
