/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <relayxx/detail/asio_decl.hpp>
#include <relayxx/detail/result.hpp>

namespace relayxx::net
{

enum class verify_mode
{
    none,
    peer
};

/// TLS policy for wss:// endpoints
struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    std::vector<std::string> ca_paths;
};

[[nodiscard]] inline std::string openssl_error_message()
{
    const unsigned long err = ERR_get_error();
    if (err == 0)
        return {};
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

/**
 * Client context configured from opt: trust anchors, minimum protocol
 * version and cipher list. Peer and host verification are applied per
 * stream, since they depend on the endpoint.
 */
[[nodiscard]] inline result<std::shared_ptr<asio::ssl::context>> make_tls_context(const tls_options& opt)
{
    auto context = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
    asio::error_code ec;

    if (opt.use_default_verify_paths)
    {
        context->set_default_verify_paths(ec);
        if (ec)
            return fail<std::shared_ptr<asio::ssl::context>>(error_code::tls_handshake_failed,
                "Cannot load default verify paths: " + ec.message());
    }

    for (const auto& file : opt.ca_files)
    {
        context->load_verify_file(file, ec);
        if (ec)
            return fail<std::shared_ptr<asio::ssl::context>>(error_code::tls_handshake_failed,
                "Cannot load CA file " + file + ": " + ec.message());
    }

    for (const auto& path : opt.ca_paths)
    {
        context->add_verify_path(path, ec);
        if (ec)
            return fail<std::shared_ptr<asio::ssl::context>>(error_code::tls_handshake_failed,
                "Cannot add CA path " + path + ": " + ec.message());
    }

    if (opt.min_tls_version.has_value())
    {
        if (SSL_CTX_set_min_proto_version(context->native_handle(), opt.min_tls_version.value()) != 1)
            return fail<std::shared_ptr<asio::ssl::context>>(error_code::tls_handshake_failed,
                "TLS min version configuration failed: " + openssl_error_message());
    }

    if (!opt.cipher_list.empty())
    {
        if (SSL_CTX_set_cipher_list(context->native_handle(), opt.cipher_list.c_str()) != 1)
            return fail<std::shared_ptr<asio::ssl::context>>(error_code::tls_handshake_failed,
                "TLS cipher list configuration failed: " + openssl_error_message());
    }

    return context;
}

} // namespace relayxx::net
