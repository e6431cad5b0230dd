#pragma once

#include <relayxx/detail/asio_decl.hpp>
#include <relayxx/detail/log.hpp>
#include <relayxx/detail/result.hpp>
#include <relayxx/detail/subscription.hpp>

#include <relayxx/net/transport.hpp>
#include <relayxx/net/reachability.hpp>
#include <relayxx/net/tls_options.hpp>
#include <relayxx/net/websocket_transport.hpp>

// Connection pooling
#include <relayxx/pool.hpp>
