/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/net/tls_options.hpp>

namespace mailsync
{
namespace net
{

using mailsync::asio::any_io_executor;
using mailsync::asio::awaitable;
using mailsync::asio::tcp;
namespace ssl = mailsync::asio::ssl;

/**
Stable stream type that can be upgraded to TLS without changing the type.
A session keeps one of these for its whole life, whether it starts plain, implicit TLS or STARTTLS.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = any_io_executor;
    using lowest_layer_type = tcp::socket::lowest_layer_type;

    explicit upgradable_stream(tcp::socket socket)
        : stream_(std::move(socket))
    {
    }

    explicit upgradable_stream(executor_type executor)
        : stream_(tcp::socket(executor))
    {
    }

    executor_type get_executor()
    {
        return std::visit([](auto& stream) -> executor_type
        {
            return executor_type(stream.get_executor());
        }, stream_);
    }

    lowest_layer_type& lowest_layer()
    {
        return std::visit([](auto& stream) -> lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(stream_);
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    void close() noexcept
    {
        mailsync::asio::error_code ignored;
        lowest_layer().shutdown(tcp::socket::shutdown_both, ignored);
        lowest_layer().close(ignored);
    }

    /**
    Run the client handshake over the current TCP connection.
    The SNI host is also the name checked against the peer certificate when verify_host is set.
    **/
    awaitable<result_void> start_tls(ssl::context& context, std::string sni, const tls_options& opt,
        std::chrono::steady_clock::duration timeout)
    {
        if (is_tls())
            co_return ok();

        auto ctx_res = configure_context(context, opt);
        if (!ctx_res)
            co_return fail<void>(std::move(ctx_res).error());

        auto socket = std::move(std::get<tcp::socket>(stream_));
        stream_.template emplace<ssl_stream>(std::move(socket), context);
        auto& tls_stream = std::get<ssl_stream>(stream_);

        if (!sni.empty())
            SSL_set_tlsext_host_name(tls_stream.native_handle(), sni.c_str());

        if (opt.verify == verify_mode::peer)
        {
            tls_stream.set_verify_mode(ssl::verify_peer);
            if (opt.verify_host && sni.empty())
                co_return fail<void>(errc::tls_verify_failed,
                    "TLS hostname verification requires a host name.");
            if (opt.verify_host)
            {
                tls_stream.set_verify_callback(
                    [verifier = ssl::host_name_verification(sni), allow_self_signed = opt.allow_self_signed]
                    (bool preverified, ssl::verify_context& ctx) mutable
                    {
                        if (!relax_verify(preverified, ctx, allow_self_signed))
                            return false;
                        return verifier(true, ctx);
                    });
            }
            else if (opt.allow_self_signed)
            {
                tls_stream.set_verify_callback([](bool preverified, ssl::verify_context& ctx)
                {
                    return relax_verify(preverified, ctx, true);
                });
            }
        }
        else
        {
            tls_stream.set_verify_mode(ssl::verify_none);
        }

        struct handshake_state
        {
            bool timed_out = false;
            bool finished = false;
        };
        auto state = std::make_shared<handshake_state>();
        mailsync::asio::steady_timer timer(tls_stream.get_executor());
        timer.expires_after(timeout);
        timer.async_wait([this, state](mailsync::asio::error_code timer_ec)
        {
            if (timer_ec || state->finished)
                return;
            state->timed_out = true;
            mailsync::asio::error_code ignored;
            lowest_layer().cancel(ignored);
        });

        mailsync::asio::error_code ec;
        co_await tls_stream.async_handshake(ssl::stream_base::client,
            mailsync::asio::redirect_error(mailsync::asio::use_awaitable, ec));
        state->finished = true;
        timer.cancel();
        if (ec)
        {
            const bool verify_failure = ec.category() == mailsync::asio::error::get_ssl_category()
                && SSL_get_verify_result(tls_stream.native_handle()) != X509_V_OK;
            if (state->timed_out)
                co_return fail<void>(errc::net_timeout, "TLS handshake timed out.", ec.message(), ec);
            co_return fail<void>(verify_failure ? errc::tls_verify_failed : errc::tls_handshake_failed,
                "TLS handshake failed.", ec.message(), ec);
        }
        co_return ok();
    }

private:
    static bool relax_verify(bool preverified, ssl::verify_context& ctx, bool allow_self_signed) noexcept
    {
        if (preverified)
            return true;
        if (!allow_self_signed)
            return false;

        X509_STORE_CTX* store_ctx = ctx.native_handle();
        if (store_ctx == nullptr)
            return false;

        const int err = X509_STORE_CTX_get_error(store_ctx);
        return err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN || err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT;
    }

    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace net
} // namespace mailsync
