#pragma once

#include <iostream>
#include <relayxx/detail/result.hpp>
#include <relayxx/pool/events.hpp>

inline void print_error(const relayxx::error& err)
{
    std::cout << "Error: " << err.code() << " - " << err.message() << "\n";
}

inline void print_event(const relayxx::pool::pool_event& ev)
{
    std::cout << "[" << ev.kind << "]";
    if (!ev.connection_id.empty())
        std::cout << " " << ev.connection_id;
    if (ev.close)
        std::cout << " code=" << ev.close->code << " reason=" << ev.close->reason;
    if (ev.err)
        std::cout << " " << *ev.err;
    if (ev.reconnect)
        std::cout << " attempt=" << ev.reconnect->attempt << " delay=" << ev.reconnect->delay.count() << "ms";
    if (ev.health)
        std::cout << " total=" << ev.health->total_connections << " active=" << ev.health->active_connections
                  << " queued=" << ev.health->queued_messages;
    if (!ev.data.empty())
        std::cout << " " << ev.data;
    std::cout << "\n";
}
