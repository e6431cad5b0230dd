/*

pool/envelope.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Wire framing: outbound envelope, heartbeat frame and the inbound timestamp
used for latency measurement.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <relayxx/detail/result.hpp>

namespace relayxx::pool::envelope
{

/// Milliseconds since the Unix epoch
[[nodiscard]] inline std::int64_t epoch_ms() noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/// Payload object plus a "timestamp" member, serialized
[[nodiscard]] inline result<std::string> make(const nlohmann::json& payload, std::int64_t timestamp)
{
    if (!payload.is_object())
        return fail<std::string>(error_code::invalid_payload, "Payload must be a JSON object");

    nlohmann::json frame = payload;
    frame["timestamp"] = timestamp;
    return frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

[[nodiscard]] inline std::string heartbeat(std::int64_t timestamp)
{
    return nlohmann::json{{"type", "ping"}, {"timestamp", timestamp}}.dump();
}

/**
 * Latency sample carried by an inbound frame: now_ms minus its "timestamp",
 * when the frame is a JSON object with a non-zero numeric timestamp.
 */
[[nodiscard]] inline std::optional<double> latency_sample(std::string_view frame, std::int64_t now_ms)
{
    const auto data = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
    if (data.is_discarded() || !data.is_object())
        return std::nullopt;

    const auto it = data.find("timestamp");
    if (it == data.end() || !it->is_number())
        return std::nullopt;

    const double sent_at = it->get<double>();
    if (sent_at == 0.0)
        return std::nullopt;
    return static_cast<double>(now_ms) - sent_at;
}

/// Endpoint actually dialed for url
[[nodiscard]] inline std::string with_compression(const std::string& url, bool compression_enabled)
{
    if (!compression_enabled)
        return url;
    const char separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + "compression=true";
}

} // namespace relayxx::pool::envelope
