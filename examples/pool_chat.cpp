/*

pool_chat.cpp
-------------

Connects a pool to two WebSocket feeds, prints every pool event and
sends a few chat messages spread by round-robin.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "example_util.hpp"
#include <relayxx/relayxx.hpp>


using std::cout;
using std::endl;


int main(int argc, char* argv[])
{
    const std::string primary = argc > 1 ? argv[1] : "wss://echo.example.com/chat";
    const std::string backup = argc > 2 ? argv[2] : "wss://backup.example.com/chat";

    boost::asio::io_context io_ctx;

    relayxx::net::websocket_options ws_options;
    ws_options.tls.use_default_verify_paths = true;
    ws_options.tls.verify = relayxx::net::verify_mode::peer;
    ws_options.tls.verify_host = true;

    relayxx::pool::pool_config config;
    config.load_balancing = relayxx::pool::balancing_strategy::round_robin;
    config.health_check_interval = std::chrono::seconds{10};

    auto pool = relayxx::pool::make_pool(io_ctx.get_executor(),
        relayxx::net::websocket_transport::factory(io_ctx.get_executor(), ws_options),
        std::make_shared<relayxx::net::manual_reachability>(), config);
    auto sub = pool->subscribe(print_event);

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            for (const auto& [id, url] : {std::pair{"primary", primary}, std::pair{"backup", backup}})
            {
                auto res = co_await pool->add_connection(id, url);
                if (!res)
                    print_error(res.error());
            }

            for (int i = 1; i <= 4; ++i)
            {
                auto status = pool->send({{"type", "chat"}, {"text", "message " + std::to_string(i)}});
                cout << "send #" << i << ": " << status << endl;
            }

            boost::asio::steady_timer timer(io_ctx, std::chrono::seconds{30});
            co_await timer.async_wait(boost::asio::use_awaitable);

            const auto stats = pool->get_statistics();
            cout << "Connections: " << stats.active_connections << "/" << stats.total_connections
                 << ", bytes: " << stats.total_bytes_transferred
                 << ", avg latency: " << stats.average_latency << "ms" << endl;
            pool->disconnect();
        },
        boost::asio::detached);

    io_ctx.run();
    return 0;
}
