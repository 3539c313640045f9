/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/ssl.h>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/result.hpp>

namespace mailsync::net
{

/**
How the byte stream to the server is secured.

none      plain TCP (may still be upgraded when the server offers STARTTLS)
starttls  plain TCP, upgraded in place before authentication
implicit  TLS from the first byte
**/
enum class tls_mode
{
    none,
    starttls,
    implicit
};

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "none";
        case tls_mode::starttls: return "starttls";
        case tls_mode::implicit: return "implicit";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, tls_mode mode)
{
    return os << to_string(mode);
}

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    bool allow_self_signed = false;
};

/**
Configure the trust store and protocol floor of a context before a handshake.
**/
inline result_void configure_context(mailsync::asio::ssl::context& ctx, const tls_options& options)
{
    mailsync::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", file, ec);
    }

    if (options.min_tls_version.has_value()
        && SSL_CTX_get_min_proto_version(ctx.native_handle()) == 0
        && SSL_CTX_set_min_proto_version(ctx.native_handle(), *options.min_tls_version) != 1)
    {
        return fail<void>(errc::tls_handshake_failed, "TLS min version configuration failed.");
    }
    return ok();
}

} // namespace mailsync::net
