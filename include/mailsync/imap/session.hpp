/*

imap/session.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/ascii.hpp>
#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/async_mutex.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/redact.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/detail/sanitize.hpp>
#include <mailsync/imap/error_mapping.hpp>
#include <mailsync/imap/reply.hpp>
#include <mailsync/imap/types.hpp>
#include <mailsync/net/dialog.hpp>
#include <mailsync/net/error_mapping.hpp>
#include <mailsync/net/upgradable_stream.hpp>

namespace mailsync::imap
{

using mailsync::asio::awaitable;
namespace ssl = mailsync::asio::ssl;

namespace session_detail
{

inline void append_arg(std::string& out, std::string_view arg)
{
    detail::append_space(out);
    detail::append_sv(out, arg);
}

template<typename T>
    requires std::is_integral_v<T>
inline void append_arg(std::string& out, T value)
{
    detail::append_space(out);
    detail::append_uint(out, static_cast<std::uint64_t>(value));
}

template<typename... Args>
[[nodiscard]] std::string format_command(std::string_view verb, const Args&... args)
{
    std::string command(verb);
    (append_arg(command, args), ...);
    return command;
}

} // namespace session_detail

/**
One authenticated (or authenticating) connection to a server.

Commands get increasing numeric tags and may be pipelined: several can be sent before any completion is
awaited. Completions are correlated strictly by tag, so a task waiting on its own tag never consumes
another task's response. Reads and writes are each serialized by a coroutine mutex.
**/
class session
{
public:
    using dialog_type = net::dialog<net::upgradable_stream>;
    using clock = std::chrono::steady_clock;

    session(mailsync::asio::any_io_executor executor, server_config config)
        : executor_(std::move(executor)),
          config_(std::move(config)),
          read_mutex_(executor_),
          write_mutex_(executor_)
    {
    }

    session(const session&) = delete;
    session& operator=(const session&) = delete;

    ~session()
    {
        close();
    }

    [[nodiscard]] const server_config& config() const noexcept { return config_; }

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }

    /// Port or service the connection was made on.
    [[nodiscard]] const std::string& port() const noexcept { return port_; }

    [[nodiscard]] bool is_open() const noexcept { return open_; }

    [[nodiscard]] bool is_tls() const
    {
        return dialog_.has_value() && dialog_->stream().is_tls();
    }

    [[nodiscard]] bool preauthenticated() const noexcept { return preauth_; }

    [[nodiscard]] line_ending ending() const noexcept { return ending_; }

    [[nodiscard]] const command_reply& greeting() const noexcept { return greeting_; }

    [[nodiscard]] const std::set<std::string>& capabilities() const noexcept { return capabilities_; }

    [[nodiscard]] bool has_capability(std::string_view name) const
    {
        return capabilities_.contains(detail::to_upper_ascii(name));
    }

    [[nodiscard]] const std::optional<std::string>& selected_mailbox() const noexcept { return selected_; }

    void set_selected_mailbox(std::optional<std::string> mailbox)
    {
        selected_ = std::move(mailbox);
    }

    [[nodiscard]] clock::time_point last_command_time() const noexcept { return last_command_time_; }

    /// Some task is reading or writing the connection right now.
    [[nodiscard]] bool busy() const noexcept { return read_mutex_.locked() || write_mutex_.locked(); }

    [[nodiscard]] std::uint64_t tag_counter() const noexcept { return tag_counter_; }

    [[nodiscard]] const std::optional<error_info>& last_error() const noexcept { return last_error_; }

    /// Error to report after a failed await_tag().
    [[nodiscard]] error_info current_error() const
    {
        if (last_error_)
            return *last_error_;
        return error_info{errc::net_eof, "Connection closed.", {}, {}, std::source_location::current()};
    }

    /**
    Resolving the server and opening the TCP connection, trying each candidate port in turn.
    Implicit TLS is negotiated here, before the greeting.

    @param tls_context Required for implicit TLS, ignored otherwise.
    **/
    awaitable<result_void> connect(ssl::context* tls_context)
    {
        if (dialog_.has_value())
            co_return fail<void>(errc::imap_invalid_state, "Connection is already established.",
                net_detail(net::io_stage::connect));
        const std::string host = config_.host();
        MAILSYNC_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(host, "host"));

        net::tcp::resolver resolver(executor_);
        std::optional<error_info> last_failure;
        for (const std::string& port : config_.candidate_ports())
        {
            port_ = port;
            mailsync::asio::error_code ec;
            auto endpoints = co_await resolver.async_resolve(host, port,
                mailsync::asio::redirect_error(mailsync::asio::use_awaitable, ec));
            if (ec)
            {
                last_failure = net::make_net_error(net::io_stage::resolve, ec, false, net_detail(net::io_stage::resolve));
                continue;
            }

            net::upgradable_stream stream(executor_);
            auto connected = co_await connect_stream(stream, endpoints);
            if (!connected)
            {
                last_failure = std::move(connected).error();
                MAILSYNC_DEBUG("IMAP " + config_.name + ": connect on " + port + " failed, " + to_string(*last_failure));
                continue;
            }

            if (config_.transport == net::tls_mode::implicit)
            {
                if (tls_context == nullptr)
                    co_return fail<void>(errc::tls_context_missing, "Implicit TLS needs a TLS context.",
                        net_detail(net::io_stage::handshake));
                auto tls = co_await stream.start_tls(*tls_context, host, config_.tls, config_.timeouts.get_starttls());
                if (!tls)
                {
                    stream.close();
                    co_return fail<void>(std::move(tls).error());
                }
            }

            dialog_.emplace(std::move(stream));
            dialog_->set_trace_protocol("IMAP", config_.name);
            dialog_->set_trace_redaction(config_.redact_secrets_in_trace);
            open_ = true;
            tag_counter_ = 0;
            last_command_time_ = clock::now();
            MAILSYNC_INFO("IMAP " + config_.name + ": connected to " + host + ":" + port);
            co_return ok();
        }
        co_return fail<void>(last_failure.value_or(error_info{errc::net_connect_failed, "No candidate port.",
            net_detail(net::io_stage::connect).str(), {}, std::source_location::current()}));
    }

    /// Reading the first line; it decides the line ending and whether the connection is preauthenticated.
    awaitable<result<command_reply>> read_greeting()
    {
        if (!open_)
            co_return fail<command_reply>(errc::imap_invalid_state, "Connection is not established.",
                net_detail(net::io_stage::read));

        auto lock = co_await read_mutex_.lock();
        const auto deadline = clock::now() + config_.timeouts.get_greeting();
        for (;;)
        {
            const std::size_t end = logical_line_end(inbox_, 0);
            if (end != std::string_view::npos)
            {
                const std::string_view raw(inbox_.data(), end);
                ending_ = config_.ending;
                if (ending_ == line_ending::detect)
                    ending_ = (end >= 2 && inbox_[end - 2] == '\r') ? line_ending::crlf : line_ending::lf;

                command_reply greeting;
                greeting.raw = std::string(raw);
                auto unfolded = unfold_literals(raw);
                result<reply_tree> tree = unfolded ? parse_reply(*unfolded) : fail<reply_tree>(unfolded.error());
                inbox_.erase(0, end);
                if (!tree || tree->items.size() < 2 || tree->items[0].text() != "*")
                {
                    close();
                    co_return fail<command_reply>(errc::imap_parse_error, "Malformed server greeting.",
                        std::string(detail::trim_view(greeting.raw)));
                }
                greeting.st = parse_status_word(tree->items[1].text());
                greeting.text = std::string(untagged_text(greeting.raw));
                greeting.untagged.push_back(std::move(*tree));
                absorb_capabilities(greeting);

                if (greeting.st == status::bye)
                {
                    close();
                    co_return fail<command_reply>(errc::imap_bye, "Server refused the connection.", greeting.text);
                }
                if (greeting.st != status::ok && greeting.st != status::preauth)
                {
                    close();
                    co_return fail<command_reply>(errc::imap_parse_error, "Unexpected server greeting.", greeting.text);
                }
                preauth_ = greeting.st == status::preauth;
                greeting_ = greeting;
                co_return greeting;
            }

            const auto now = clock::now();
            if (now >= deadline)
                co_return fail<command_reply>(timeout_error("greeting"));
            auto n = co_await dialog_->read_some_r(inbox_, deadline - now, net_detail(net::io_stage::read));
            if (!n)
            {
                record_failure(n.error());
                co_return fail<command_reply>(std::move(n).error());
            }
        }
    }

    /**
    Sending one command. Returns its tag as soon as the line is written; the reply is collected
    later with await_tag() and take_reply().

    Arguments are joined with single spaces; strings are sent verbatim (quote them with to_astring()
    or to_mailbox()), integers in decimal.
    **/
    template<typename... Args>
    awaitable<result<std::uint64_t>> send(std::string_view verb, const Args&... args)
    {
        return send_line(session_detail::format_command(verb, args...));
    }

    awaitable<result<std::uint64_t>> send_line(std::string command)
    {
        if (!open_)
            co_return fail<std::uint64_t>(errc::imap_invalid_state, "Connection is not established.",
                net_detail(net::io_stage::write));
        MAILSYNC_CO_TRY_VOID(detail::ensure_no_crlf_or_nul(command, "command"));

        const std::uint64_t tag = ++tag_counter_;
        std::string line = detail::uint_to_string(tag);
        detail::append_space(line);
        detail::append_sv(line, command);
        commands_[tag] = config_.redact_secrets_in_trace ? detail::redact_line(line) : line;
        detail::append_sv(line, terminator(ending_));

        auto lock = co_await write_mutex_.lock();
        auto written = co_await dialog_->write_r(std::move(line), config_.timeouts.get_command(),
            net_detail(net::io_stage::write));
        if (!written)
        {
            commands_.erase(tag);
            record_failure(written.error());
            co_return fail<std::uint64_t>(std::move(written).error());
        }
        last_command_time_ = clock::now();
        co_return tag;
    }

    /**
    Waiting until the completion for `tag` has been received.

    Completions for other tags read along the way are recorded against their own tags.
    The wait is bounded by the command timeout.

    @return False on timeout, on connection failure, or for a tag already taken or discarded;
            last_error() tells which. After a timeout the caller waits again or calls discard().
    **/
    awaitable<bool> await_tag(std::uint64_t tag)
    {
        return await_tag_for(tag, config_.timeouts.get_command());
    }

    /// Status of a completion already received, without consuming it.
    [[nodiscard]] std::optional<status> completion_status(std::uint64_t tag) const
    {
        auto it = completed_.find(tag);
        if (it == completed_.end())
            return std::nullopt;
        return it->second.st;
    }

    /**
    Removing the recorded reply for `tag`.

    @return The reply when tagged OK; imap_tagged_no, imap_tagged_bad otherwise.
    **/
    result<command_reply> take_reply(std::uint64_t tag)
    {
        auto it = completed_.find(tag);
        if (it == completed_.end())
            return fail<command_reply>(errc::imap_invalid_state, "No completion recorded for this tag.",
                make_imap_detail(config_.name, tag, command_of(tag), {}, 0));
        command_reply reply = std::move(it->second);
        completed_.erase(it);
        const std::string command = command_of(tag);
        commands_.erase(tag);
        if (reply.ok())
            return reply;

        std::string message = "IMAP tagged ";
        message += to_string(reply.st);
        message += ": ";
        message += reply.text;
        return fail<command_reply>(map_status(reply.st), std::move(message),
            make_imap_detail(config_.name, tag, command, reply.text, reply.untagged.size()));
    }

    /**
    Giving up on `tag`: a reply already recorded is dropped, and a completion arriving later is thrown
    away when it is read.
    **/
    void discard(std::uint64_t tag)
    {
        const bool pending = commands_.erase(tag) > 0;
        if (completed_.erase(tag) > 0)
            return;
        if (pending)
            abandoned_.insert(tag);
    }

    /// Number of tags whose reply is still owed to a caller.
    [[nodiscard]] std::size_t pending_replies() const noexcept
    {
        return commands_.size();
    }

    /// send() + await_tag() + take_reply().
    template<typename... Args>
    awaitable<result<command_reply>> run_command(std::string_view verb, const Args&... args)
    {
        return run_line(session_detail::format_command(verb, args...), config_.timeouts.get_command());
    }

    awaitable<result_void> capability()
    {
        MAILSYNC_TRY_CO_AWAIT(run_command("CAPABILITY"));
        co_return ok();
    }

    /// Plain LOGIN; a NO from the server is reported as imap_auth_failed, LOGINDISABLED as imap_invalid_state.
    awaitable<result_void> login(const credentials& cred)
    {
        if (has_capability("LOGINDISABLED"))
            co_return fail<void>(errc::imap_invalid_state, "Server disables LOGIN on this connection.",
                make_imap_detail(config_.name, 0, "LOGIN", {}, 0));
        std::string user;
        std::string secret;
        MAILSYNC_CO_TRY_ASSIGN(user, to_astring(cred.username));
        MAILSYNC_CO_TRY_ASSIGN(secret, to_astring(cred.secret));

        const std::uint64_t generation = capability_generation_;
        auto reply = co_await run_line(session_detail::format_command("LOGIN", user, secret), config_.timeouts.get_auth());
        if (!reply)
        {
            error_info err = std::move(reply).error();
            if (err.code == errc::imap_tagged_no)
                err.code = errc::imap_auth_failed;
            co_return fail<void>(std::move(err));
        }
        MAILSYNC_INFO("IMAP " + config_.name + ": logged in as " + cred.username);
        if (capability_generation_ == generation)
            MAILSYNC_TRY_CO_AWAIT(capability());
        co_return ok();
    }

    /// STARTTLS then TLS handshake on the same connection; capabilities are re-read afterwards.
    awaitable<result_void> start_tls(ssl::context& context)
    {
        if (is_tls())
            co_return ok();
        if (!has_capability("STARTTLS"))
            co_return fail<void>(errc::imap_invalid_state, "Server does not advertise STARTTLS.",
                make_imap_detail(config_.name, 0, "STARTTLS", {}, 0));
        MAILSYNC_TRY_CO_AWAIT(run_command("STARTTLS"));

        // Bytes received before the handshake were not protected.
        inbox_.clear();
        line_boundary_ = 0;
        auto tls = co_await dialog_->stream().start_tls(context, config_.host(), config_.tls,
            config_.timeouts.get_starttls());
        if (!tls)
        {
            close();
            co_return fail<void>(std::move(tls).error());
        }
        capabilities_.clear();
        MAILSYNC_TRY_CO_AWAIT(capability());
        co_return ok();
    }

    awaitable<result_void> enable(std::string_view extension)
    {
        MAILSYNC_TRY_CO_AWAIT(run_command("ENABLE", extension));
        co_return ok();
    }

    awaitable<result_void> noop()
    {
        MAILSYNC_TRY_CO_AWAIT(run_command("NOOP"));
        co_return ok();
    }

    /// LOGOUT then close; the socket is closed whatever the server answers.
    awaitable<result_void> logout()
    {
        if (!open_)
            co_return ok();
        auto reply = co_await run_command("LOGOUT");
        close();
        if (!reply)
            co_return fail<void>(std::move(reply).error());
        co_return ok();
    }

    void close() noexcept
    {
        if (dialog_.has_value())
            dialog_->stream().close();
        open_ = false;
        selected_.reset();
    }

private:
    awaitable<result<command_reply>> run_line(std::string command, clock::duration timeout)
    {
        std::uint64_t tag = 0;
        MAILSYNC_CO_TRY_ASSIGN(tag, co_await send_line(std::move(command)));
        if (!co_await await_tag_for(tag, timeout))
        {
            discard(tag);
            co_return fail<command_reply>(current_error());
        }
        co_return take_reply(tag);
    }

    awaitable<bool> await_tag_for(std::uint64_t tag, clock::duration timeout)
    {
        if (completed_.contains(tag))
            co_return true;
        if (tag == 0 || tag > tag_counter_)
        {
            last_error_ = error_info{errc::invalid_argument, "Tag was never issued.",
                make_imap_detail(config_.name, tag, {}, {}, 0).str(), {}, std::source_location::current()};
            co_return false;
        }
        if (!commands_.contains(tag))
        {
            last_error_ = error_info{errc::invalid_argument, "Tag was already taken or discarded.",
                make_imap_detail(config_.name, tag, {}, {}, 0).str(), {}, std::source_location::current()};
            co_return false;
        }

        const auto deadline = clock::now() + timeout;
        auto lock = co_await read_mutex_.lock();
        for (;;)
        {
            harvest();
            if (completed_.contains(tag))
                co_return true;
            if (!open_)
            {
                if (!last_error_)
                    last_error_ = error_info{errc::net_eof, "Connection closed.", {}, {}, std::source_location::current()};
                co_return false;
            }

            const auto now = clock::now();
            if (now >= deadline)
            {
                last_error_ = timeout_error(command_of(tag));
                co_return false;
            }
            auto n = co_await dialog_->read_some_r(inbox_, deadline - now, net_detail(net::io_stage::read));
            if (!n)
            {
                record_failure(n.error());
                co_return false;
            }
        }
    }

    /// Moves every complete response unit from the inbox into completed_.
    void harvest()
    {
        const std::size_t last_end = config_.high_throughput ? last_completion_since_boundary() : last_completion();
        if (last_end == std::string::npos)
            return;

        std::string_view prefix(inbox_.data(), last_end);
        while (!prefix.empty())
        {
            const std::size_t unit_start = isolate_last_response_unit(prefix);
            if (record_unit(prefix.substr(unit_start)))
            {
                prefix = prefix.substr(0, unit_start);
                continue;
            }
            // Last line is neither tagged nor untagged data (e.g. a stray continuation); drop it.
            const auto starts = logical_line_starts(prefix);
            if (starts.empty())
            {
                MAILSYNC_DEBUG("IMAP " + config_.name + ": ignoring unterminated bytes before a completion");
                break;
            }
            MAILSYNC_DEBUG("IMAP " + config_.name + ": ignoring line " + std::string(detail::trim_view(prefix.substr(starts.back()))));
            prefix = prefix.substr(0, starts.back());
        }
        inbox_.erase(0, last_end);
        line_boundary_ = line_boundary_ > last_end ? line_boundary_ - last_end : 0;
    }

    /// End of the last complete tagged line, scanning logical lines from the start of the buffer.
    [[nodiscard]] std::size_t last_completion() const
    {
        std::size_t last_end = std::string::npos;
        std::size_t pos = 0;
        while (pos < inbox_.size())
        {
            const std::size_t end = logical_line_end(inbox_, pos);
            if (end == std::string_view::npos)
                break;
            if (inbox_[pos] != '*' && parse_tagged_line(std::string_view(inbox_).substr(pos, end - pos)))
                last_end = end;
            pos = end;
        }
        return last_end;
    }

    /**
    Same, resuming from the end of the last complete logical line seen by an earlier scan, so bytes
    already examined are not scanned again. Literals are skipped like in last_completion().
    **/
    [[nodiscard]] std::size_t last_completion_since_boundary()
    {
        std::size_t last_end = std::string::npos;
        std::size_t pos = line_boundary_;
        while (pos < inbox_.size())
        {
            const std::size_t end = logical_line_end(inbox_, pos);
            if (end == std::string_view::npos)
                break;
            if (inbox_[pos] != '*' && parse_tagged_line(std::string_view(inbox_).substr(pos, end - pos)))
                last_end = end;
            pos = end;
        }
        line_boundary_ = pos;
        return last_end;
    }

    bool record_unit(std::string_view unit)
    {
        const auto starts = logical_line_starts(unit);
        if (starts.empty())
            return false;
        const std::string_view last = unit.substr(starts.back());
        const auto completion = parse_tagged_line(last.substr(0, last.find('\n')));
        if (!completion)
            return false;
        if (abandoned_.erase(completion->tag) > 0)
        {
            MAILSYNC_DEBUG("IMAP " + config_.name + ": dropping late reply to tag " + detail::uint_to_string(completion->tag));
            return true;
        }

        command_reply reply;
        reply.tag = completion->tag;
        reply.st = completion->st;
        reply.text = std::string(completion->text);
        reply.raw = std::string(unit);

        auto unfolded = unfold_literals(unit);
        if (!unfolded)
        {
            reply.parse_error = unfolded.error();
        }
        else
        {
            for (std::string_view line : split_logical_lines(*unfolded))
            {
                if (line.empty())
                    continue;
                auto tree = parse_reply(line);
                if (!tree)
                {
                    if (!reply.parse_error)
                        reply.parse_error = tree.error();
                    continue;
                }
                if (line.front() == '*')
                    reply.untagged.push_back(std::move(*tree));
                else
                    reply.completion = std::move(*tree);
            }
        }
        if (reply.parse_error)
            MAILSYNC_WARN("IMAP " + config_.name + ": unparsable reply to tag " + detail::uint_to_string(reply.tag)
                + ", " + to_string(*reply.parse_error));

        for (const auto& line : reply.untagged)
        {
            if (is_untagged(line, "BYE"))
                MAILSYNC_WARN("IMAP " + config_.name + ": server said BYE");
        }
        absorb_capabilities(reply);
        completed_[reply.tag] = std::move(reply);
        return true;
    }

    /// CAPABILITY data or a [CAPABILITY ...] response code replaces the known set.
    void absorb_capabilities(const command_reply& reply)
    {
        auto replace = [this](auto first, auto last)
        {
            capabilities_.clear();
            for (; first != last; ++first)
                capabilities_.insert(detail::to_upper_ascii(*first));
            ++capability_generation_;
        };

        for (const auto& line : reply.untagged)
        {
            if (is_untagged(line, "CAPABILITY"))
            {
                std::vector<std::string> names;
                for (std::size_t i = 2; i < line.items.size(); ++i)
                    names.emplace_back(line.items[i].text());
                replace(names.begin(), names.end());
            }
            else if (const reply_attrs* code = response_code(line);
                code != nullptr && !code->items.empty() && detail::iequals_ascii(code->items[0], "CAPABILITY"))
            {
                replace(code->items.begin() + 1, code->items.end());
            }
        }
        if (const reply_attrs* code = response_code(reply.completion);
            code != nullptr && !code->items.empty() && detail::iequals_ascii(code->items[0], "CAPABILITY"))
        {
            replace(code->items.begin() + 1, code->items.end());
        }
    }

    void record_failure(const error_info& err)
    {
        last_error_ = err;
        if (err.code == errc::net_timeout)
        {
            MAILSYNC_WARN("IMAP " + config_.name + ": " + to_string(err));
            return;
        }
        MAILSYNC_ERROR("IMAP " + config_.name + ": " + to_string(err) + ", closing connection");
        close();
    }

    [[nodiscard]] error_info timeout_error(std::string_view what) const
    {
        detail::error_detail d = net_detail(net::io_stage::read);
        d.add("waiting.for", what);
        return error_info{errc::net_timeout, "Timed out waiting for the server.", d.str(), {},
            std::source_location::current()};
    }

    [[nodiscard]] std::string command_of(std::uint64_t tag) const
    {
        auto it = commands_.find(tag);
        return it == commands_.end() ? std::string{} : it->second;
    }

    [[nodiscard]] detail::error_detail net_detail(net::io_stage stage) const
    {
        return net::make_net_detail(config_.name, config_.host(), port_, net::to_string(config_.transport), stage);
    }

    /// Text after "* STATUS" on an untagged line.
    [[nodiscard]] static std::string_view untagged_text(std::string_view line) noexcept
    {
        line = detail::trim_view(line);
        for (int skip = 0; skip < 2; ++skip)
        {
            const auto sp = line.find(' ');
            if (sp == std::string_view::npos)
                return {};
            line.remove_prefix(sp + 1);
        }
        return line;
    }

    awaitable<result_void> connect_stream(net::upgradable_stream& stream, const net::tcp::resolver::results_type& endpoints)
    {
        struct connect_state
        {
            bool timed_out = false;
            bool finished = false;
        };
        auto state = std::make_shared<connect_state>();
        mailsync::asio::steady_timer timer(executor_);
        timer.expires_after(config_.timeouts.get_connect());
        timer.async_wait([&stream, state](mailsync::asio::error_code timer_ec)
        {
            if (timer_ec || state->finished)
                return;
            state->timed_out = true;
            mailsync::asio::error_code ignored;
            stream.lowest_layer().cancel(ignored);
        });

        mailsync::asio::error_code ec;
        co_await mailsync::asio::async_connect(stream.lowest_layer(), endpoints,
            mailsync::asio::redirect_error(mailsync::asio::use_awaitable, ec));
        state->finished = true;
        timer.cancel();
        if (ec)
            co_return fail<void>(net::make_net_error(net::io_stage::connect, ec, state->timed_out,
                net_detail(net::io_stage::connect)));
        co_return ok();
    }

    mailsync::asio::any_io_executor executor_;
    server_config config_;
    std::optional<dialog_type> dialog_;
    detail::async_mutex read_mutex_;
    detail::async_mutex write_mutex_;

    std::string port_;
    bool open_ = false;
    bool preauth_ = false;
    line_ending ending_ = line_ending::crlf;
    command_reply greeting_;

    std::set<std::string> capabilities_;
    std::uint64_t capability_generation_ = 0;
    std::optional<std::string> selected_;

    std::uint64_t tag_counter_ = 0;
    clock::time_point last_command_time_{};

    std::string inbox_;
    std::size_t line_boundary_ = 0;
    std::map<std::uint64_t, command_reply> completed_;
    std::map<std::uint64_t, std::string> commands_;
    std::set<std::uint64_t> abandoned_;
    std::optional<error_info> last_error_;
};

} // namespace mailsync::imap
