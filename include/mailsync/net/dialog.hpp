/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/redact.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/net/error_mapping.hpp>

namespace mailsync
{
namespace net
{

/// Size of one socket read; replies larger than this arrive over several reads.
inline constexpr std::size_t READ_CHUNK_SIZE = 16 * 1024;

/**
Byte-oriented conversation over a Boost.Asio stream (socket, ssl stream, etc.).

Framing is left to the caller: the IMAP layer scans its own buffer for tagged lines and literals,
so reads append whatever arrived and writes send exactly the bytes given.
Every operation is bounded by a timeout that cancels the lowest layer on expiry.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    explicit dialog(Stream stream)
        : stream_(std::move(stream))
    {
    }

    void set_trace_protocol(std::string protocol, std::string server = {})
    {
        trace_protocol_ = std::move(protocol);
        trace_server_ = std::move(server);
    }

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_secrets_in_trace_ = enabled;
    }

    /**
    Writing raw bytes asynchronously.

    @param payload Bytes to send, terminator included.
    @param timeout Upper bound for the whole write.
    @param token   Completion token.
    **/
    template<typename CompletionToken>
    auto write(std::string payload, duration timeout, CompletionToken&& token)
    {
        trace(mailsync::log::direction::send, payload);
        auto data = std::make_shared<std::string>(std::move(payload));
        return async_with_timeout<void(mailsync::asio::error_code, std::size_t)>(timeout,
            [this, data](auto&& handler) mutable
            {
                // The completion keeps the payload alive; this lambda may be moved from meanwhile.
                std::shared_ptr<std::string> payload = data;
                const auto bytes = mailsync::asio::buffer(*payload);
                mailsync::asio::async_write(stream_, bytes,
                    [payload, handler = std::move(handler)](mailsync::asio::error_code ec, std::size_t n) mutable
                    {
                        handler(ec, n);
                    });
            }, std::forward<CompletionToken>(token));
    }

    /**
    Receiving whatever the peer sent next, at most one chunk.

    @param timeout Upper bound for the read.
    @param token   Completion token; receives the number of bytes placed in the internal chunk.
    **/
    template<typename CompletionToken>
    auto read_some(duration timeout, CompletionToken&& token)
    {
        return async_with_timeout<void(mailsync::asio::error_code, std::size_t)>(timeout,
            [this](auto&& handler) mutable
            {
                stream_.async_read_some(mailsync::asio::buffer(chunk_), std::move(handler));
            }, std::forward<CompletionToken>(token));
    }

    /// Coroutine form of write() with errors mapped to errc.
    mailsync::asio::awaitable<result_void> write_r(std::string payload, duration timeout, const detail::error_detail& context)
    {
        mailsync::asio::error_code ec;
        co_await write(std::move(payload), timeout,
            mailsync::asio::redirect_error(mailsync::asio::use_awaitable, ec));
        if (ec)
            co_return fail<void>(make_net_error(io_stage::write, ec, false, context));
        co_return ok();
    }

    /// Coroutine form of read_some(); received bytes are appended to sink.
    mailsync::asio::awaitable<result<std::size_t>> read_some_r(std::string& sink, duration timeout,
        const detail::error_detail& context)
    {
        mailsync::asio::error_code ec;
        const std::size_t n = co_await read_some(timeout,
            mailsync::asio::redirect_error(mailsync::asio::use_awaitable, ec));
        if (ec)
            co_return fail<std::size_t>(make_net_error(io_stage::read, ec, false, context));
        const std::string_view received(chunk_.data(), n);
        trace(mailsync::log::direction::receive, received);
        sink.append(received.data(), received.size());
        co_return ok(n);
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }

    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

protected:
    template<typename Signature, typename Initiation, typename CompletionToken>
    auto async_with_timeout(duration timeout, Initiation initiation, CompletionToken&& token)
    {
        struct timeout_state
        {
            bool timed_out = false;
            bool finished = false;
        };

        return mailsync::asio::async_compose<CompletionToken, Signature>(
            [this, initiation = std::move(initiation), timeout,
                state = std::make_shared<timeout_state>(),
                timer = std::shared_ptr<mailsync::asio::steady_timer>(),
                started = false](auto& self, mailsync::asio::error_code ec = {}, std::size_t n = 0) mutable
            {
                if (!started)
                {
                    started = true;
                    timer = std::make_shared<mailsync::asio::steady_timer>(stream_.get_executor());
                    timer->expires_after(timeout);
                    timer->async_wait([this, state](mailsync::asio::error_code timer_ec)
                    {
                        if (timer_ec || state->finished)
                            return;
                        state->timed_out = true;
                        mailsync::asio::error_code ignore_ec;
                        stream_.lowest_layer().cancel(ignore_ec);
                    });
                    // self owns initiation; run a copy so moving self leaves it intact.
                    auto start = initiation;
                    start(std::move(self));
                    return;
                }
                state->finished = true;
                if (timer)
                    timer->cancel();
                if (state->timed_out && ec == mailsync::asio::error::operation_aborted)
                    ec = mailsync::asio::error::timed_out;
                self.complete(ec, n);
            }, token, stream_);
    }

    Stream stream_;
    std::array<char, READ_CHUNK_SIZE> chunk_{};

    std::string trace_protocol_{"NET"};
    std::string trace_server_;
    bool redact_secrets_in_trace_{true};

    void trace(mailsync::log::direction dir, std::string_view data) const
    {
        auto& logger = mailsync::log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        if (dir == mailsync::log::direction::send && redact_secrets_in_trace_)
        {
            logger.trace_protocol(trace_protocol_, trace_server_, dir, mailsync::detail::redact_line(data));
            return;
        }
        logger.trace_protocol(trace_protocol_, trace_server_, dir, data);
    }
};

} // namespace net
} // namespace mailsync
