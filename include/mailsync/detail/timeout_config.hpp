/**
 * @file timeout_config.hpp
 * @brief Per-phase timeouts for mailbox sessions.
 *
 * Every read on a session is bounded; a stalled server never blocks a task forever.
 */

#ifndef MAILSYNC_DETAIL_TIMEOUT_CONFIG_HPP
#define MAILSYNC_DETAIL_TIMEOUT_CONFIG_HPP

#include <chrono>
#include <optional>

namespace mailsync {

/**
 * Per-operation timeout configuration.
 *
 * If a specific timeout is not set, default_timeout is used.
 *
 * Example:
 * @code
 * timeout_config timeouts;
 * timeouts.connect = std::chrono::seconds(10);
 * timeouts.command = std::chrono::minutes(2);   // large FETCH replies
 * @endcode
 */
struct timeout_config
{
    /// Default timeout used when specific timeout is not set
    std::chrono::steady_clock::duration default_timeout{std::chrono::seconds(60)};

    /// Resolve + TCP connect
    std::optional<std::chrono::steady_clock::duration> connect;

    /// Server greeting line
    std::optional<std::chrono::steady_clock::duration> greeting;

    /// TLS handshake, implicit or after STARTTLS
    std::optional<std::chrono::steady_clock::duration> starttls;

    /// LOGIN round trip
    std::optional<std::chrono::steady_clock::duration> auth;

    /// Waiting for one tagged completion (bounds await_tag)
    std::optional<std::chrono::steady_clock::duration> command;

    std::chrono::steady_clock::duration get_connect() const
    { return connect.value_or(default_timeout); }

    std::chrono::steady_clock::duration get_greeting() const
    { return greeting.value_or(default_timeout); }

    std::chrono::steady_clock::duration get_starttls() const
    { return starttls.value_or(default_timeout); }

    std::chrono::steady_clock::duration get_auth() const
    { return auth.value_or(command.value_or(default_timeout)); }

    std::chrono::steady_clock::duration get_command() const
    { return command.value_or(default_timeout); }

    static timeout_config defaults()
    {
        return {};
    }

    /**
     * Short timeouts for local or well-connected servers.
     */
    static timeout_config fast()
    {
        timeout_config cfg;
        cfg.default_timeout = std::chrono::seconds(15);
        cfg.connect = std::chrono::seconds(5);
        cfg.greeting = std::chrono::seconds(10);
        return cfg;
    }

    /**
     * Longer timeouts for high-latency servers and very large mailboxes.
     */
    static timeout_config patient()
    {
        timeout_config cfg;
        cfg.default_timeout = std::chrono::seconds(120);
        cfg.connect = std::chrono::seconds(30);
        cfg.greeting = std::chrono::seconds(60);
        cfg.command = std::chrono::minutes(10);
        return cfg;
    }
};

} // namespace mailsync

#endif // MAILSYNC_DETAIL_TIMEOUT_CONFIG_HPP
