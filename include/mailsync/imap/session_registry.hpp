/*

imap/session_registry.hpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/async_mutex.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/collaborators.hpp>
#include <mailsync/imap/session.hpp>
#include <mailsync/imap/types.hpp>

namespace mailsync::imap
{

/**
Live sessions, one per logical server, and the keepalive sweep over them.

Opening a server goes through fixed phases: probe (connect, greeting, CAPABILITY, STARTTLS when
configured), upgrade-or-continue (a plain connection advertising STARTTLS is replaced by a secured one
when that succeeds), authenticate, enable incremental resync, register.

The registry is used from a single executor. Overlapping opens of one server are serialized, so the
later ones receive the session the first one registered.

Usage:
@code
mailsync::imap::session_registry registry(io.get_executor(), credentials, tls_ctx);
auto s = co_await registry.open(config);
if (s)
    co_await registry.close(config.name);
@endcode
**/
class session_registry
{
public:
    using session_ptr = std::shared_ptr<session>;

    session_registry(mailsync::asio::any_io_executor executor, credential_provider& credentials, ssl::context& tls_context,
        keepalive_config keepalive = {})
        : executor_(std::move(executor)),
          credentials_(credentials),
          tls_context_(tls_context),
          keepalive_(keepalive),
          keepalive_timer_(executor_)
    {
    }

    session_registry(const session_registry&) = delete;
    session_registry& operator=(const session_registry&) = delete;

    /// Returning the live session of a server, or establishing and registering a new one.
    awaitable<result<session_ptr>> open(server_config config)
    {
        if (session_ptr live = find(config.name))
            co_return live;

        std::shared_ptr<detail::async_mutex> gate = opening_gate(config.name);
        auto lock = co_await gate->lock();
        if (session_ptr live = find(config.name))
            co_return live;
        co_return co_await establish(config);
    }

    /// Live session of a server, or null. Entries whose connection dropped are discarded.
    [[nodiscard]] session_ptr find(const std::string& name)
    {
        auto it = sessions_.find(name);
        if (it == sessions_.end())
            return nullptr;
        if (!it->second->is_open())
        {
            sessions_.erase(it);
            return nullptr;
        }
        return it->second;
    }

    /// LOGOUT (best effort) and removal. Closing an unknown server does nothing.
    awaitable<void> close(std::string name)
    {
        auto it = sessions_.find(name);
        if (it == sessions_.end())
            co_return;
        session_ptr s = std::move(it->second);
        sessions_.erase(it);
        auto bye = co_await s->logout();
        if (!bye)
            MAILSYNC_DEBUG("IMAP " + name + ": logout failed, " + to_string(bye.error()));
        MAILSYNC_INFO("IMAP " + name + ": session closed");
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return sessions_.size();
    }

    /**
    Probing idle sessions with NOOP.

    A session whose last command is older than the idle threshold gets a NOOP, unless a command is in
    flight on it; one that fails the probe (or whose connection already dropped) is closed and removed.

    @return Number of sessions probed.
    **/
    awaitable<std::size_t> sweep_keepalive()
    {
        std::vector<std::string> names;
        for (const auto& [name, s] : sessions_)
            names.push_back(name);

        std::size_t probed = 0;
        const auto now = session::clock::now();
        for (const auto& name : names)
        {
            auto it = sessions_.find(name);
            if (it == sessions_.end())
                continue;
            session_ptr s = it->second;
            if (!s->is_open())
            {
                sessions_.erase(it);
                continue;
            }
            if (s->busy() || now - s->last_command_time() < keepalive_.idle_threshold)
                continue;

            ++probed;
            MAILSYNC_DEBUG("IMAP " + name + ": keepalive NOOP");
            auto alive = co_await s->noop();
            if (alive)
                continue;
            MAILSYNC_WARN("IMAP " + name + ": keepalive failed, dropping session, " + to_string(alive.error()));
            s->close();
            sessions_.erase(name);
        }
        co_return probed;
    }

    /// Sweeping every keepalive interval until stop().
    awaitable<void> run_keepalive()
    {
        stopped_ = false;
        while (!stopped_)
        {
            keepalive_timer_.expires_after(keepalive_.interval);
            mailsync::asio::error_code ec;
            co_await keepalive_timer_.async_wait(mailsync::asio::redirect_error(mailsync::asio::use_awaitable, ec));
            if (stopped_)
                break;
            co_await sweep_keepalive();
        }
    }

    void stop()
    {
        stopped_ = true;
        keepalive_timer_.cancel();
    }

private:
    awaitable<result<session_ptr>> establish(const server_config& config)
    {
        session_ptr s;
        MAILSYNC_CO_TRY_ASSIGN(s, co_await probe(config));
        if (config.transport == net::tls_mode::none && config.opportunistic_starttls && s->has_capability("STARTTLS"))
            s = co_await upgrade_or_continue(config, std::move(s));
        MAILSYNC_TRY_CO_AWAIT(authenticate(*s));
        co_await enable_resync(*s);

        sessions_[config.name] = s;
        MAILSYNC_INFO("IMAP " + config.name + ": session open on port " + s->port() + (s->is_tls() ? " (TLS)" : ""));
        co_return s;
    }

    /// Mutex held while a session for `name` is being established.
    std::shared_ptr<detail::async_mutex> opening_gate(const std::string& name)
    {
        auto& gate = opening_[name];
        if (!gate)
            gate = std::make_shared<detail::async_mutex>(executor_);
        return gate;
    }

    /// Connection, greeting and CAPABILITY; STARTTLS as well when the transport asks for it.
    awaitable<result<session_ptr>> probe(const server_config& config)
    {
        auto s = std::make_shared<session>(executor_, config);
        auto probed = co_await probe_steps(*s);
        if (!probed)
        {
            s->close();
            co_return fail<session_ptr>(std::move(probed).error());
        }
        co_return s;
    }

    awaitable<result_void> probe_steps(session& s)
    {
        MAILSYNC_TRY_CO_AWAIT(s.connect(&tls_context_));
        MAILSYNC_TRY_CO_AWAIT(s.read_greeting());
        MAILSYNC_TRY_CO_AWAIT(s.capability());
        if (s.config().transport == net::tls_mode::starttls)
            MAILSYNC_TRY_CO_AWAIT(s.start_tls(tls_context_));
        co_return ok();
    }

    /// A secured session replaces the plain one only if it could be fully established.
    awaitable<session_ptr> upgrade_or_continue(const server_config& config, session_ptr plain)
    {
        server_config secured = config;
        secured.transport = net::tls_mode::starttls;
        auto upgraded = co_await probe(secured);
        if (!upgraded)
        {
            MAILSYNC_WARN("IMAP " + config.name + ": STARTTLS upgrade failed, continuing unencrypted, "
                + to_string(upgraded.error()));
            co_return plain;
        }
        MAILSYNC_INFO("IMAP " + config.name + ": upgraded to TLS");
        auto bye = co_await plain->logout();
        if (!bye)
            MAILSYNC_DEBUG("IMAP " + config.name + ": logout of plain session failed, " + to_string(bye.error()));
        co_return std::move(*upgraded);
    }

    awaitable<result_void> authenticate(session& s)
    {
        if (s.preauthenticated())
            co_return ok();

        const server_config& config = s.config();
        const std::vector<std::string> ports = config.candidate_ports();
        auto cred = credentials_.lookup(config.host(), ports);
        if (!cred)
        {
            s.close();
            co_return fail<void>(errc::imap_no_credentials, "No credentials for server.",
                make_imap_detail(config.name, 0, "LOGIN", {}, 0));
        }

        auto logged_in = co_await s.login(*cred);
        if (logged_in)
            co_return ok();

        if (logged_in.error().code == errc::imap_auth_failed)
        {
            for (const auto& port : ports)
                credentials_.forget(config.host(), port);
            MAILSYNC_WARN("IMAP " + config.name + ": authentication failed, credentials forgotten");
        }
        s.close();
        co_return fail<void>(std::move(logged_in).error());
    }

    awaitable<void> enable_resync(session& s)
    {
        if (!s.has_capability("QRESYNC") && !s.has_capability("CONDSTORE"))
            co_return;
        auto enabled = co_await s.enable("QRESYNC");
        if (!enabled)
            MAILSYNC_WARN("IMAP " + s.name() + ": ENABLE QRESYNC refused, " + to_string(enabled.error()));
    }

    mailsync::asio::any_io_executor executor_;
    credential_provider& credentials_;
    ssl::context& tls_context_;
    keepalive_config keepalive_;
    mailsync::asio::steady_timer keepalive_timer_;
    bool stopped_ = false;
    std::map<std::string, session_ptr> sessions_;
    std::map<std::string, std::shared_ptr<detail::async_mutex>> opening_;
};

} // namespace mailsync::imap
