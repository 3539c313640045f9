/*

imap/types.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/detail/result.hpp>
#include <mailsync/detail/sanitize.hpp>
#include <mailsync/detail/timeout_config.hpp>
#include <mailsync/imap/reply.hpp>
#include <mailsync/imap/utf7.hpp>
#include <mailsync/net/tls_options.hpp>

namespace mailsync::imap
{

struct credentials
{
    std::string username;
    std::string secret;
};

/// Quoted string form of an argument, with '"' and '\' escaped.
[[nodiscard]] inline result<std::string> to_astring(std::string_view text)
{
    auto checked = detail::ensure_no_crlf_or_nul(text, "astring");
    if (!checked)
        return fail<std::string>(std::move(checked).error());
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

/// Mailbox argument: modified UTF-7, then quoted.
[[nodiscard]] inline result<std::string> to_mailbox(std::string_view utf8_mailbox)
{
    std::string encoded;
    MAILSYNC_TRY_ASSIGN(encoded, encode_modified_utf7(utf8_mailbox));
    return to_astring(encoded);
}

/// How command lines are terminated on the wire.
enum class line_ending
{
    detect,
    crlf,
    lf
};

[[nodiscard]] constexpr std::string_view terminator(line_ending ending) noexcept
{
    return ending == line_ending::lf ? std::string_view("\n") : std::string_view("\r\n");
}

/**
Connection settings of one logical server.

The server name is the registry key; address and port locate it. With an empty port the candidates
are 993/imaps for implicit TLS and 143/imap otherwise.
**/
struct server_config
{
    std::string name;
    std::string address;
    std::string port;
    net::tls_mode transport = net::tls_mode::none;

    /// Upgrade a plain connection when the server advertises STARTTLS.
    bool opportunistic_starttls = true;

    net::tls_options tls;
    line_ending ending = line_ending::detect;

    /// Resume each tag search where the previous one stopped instead of rescanning the buffer.
    bool high_throughput = false;

    /// Allow a mailbox-wide EXPUNGE when the server lacks UIDPLUS.
    bool allow_unscoped_expunge = false;

    /// Number of newest UIDs re-read by a partial flag sync.
    std::uint32_t flag_window = 100;

    timeout_config timeouts;
    bool redact_secrets_in_trace = true;

    /// Source mailbox of the splitting pipeline.
    std::string inbox = "INBOX";

    [[nodiscard]] std::string host() const
    {
        return address.empty() ? name : address;
    }

    [[nodiscard]] std::vector<std::string> candidate_ports() const
    {
        if (!port.empty())
            return {port};
        if (transport == net::tls_mode::implicit)
            return {"993", "imaps"};
        return {"143", "imap"};
    }
};

/// Idle connections get a NOOP after idle_threshold; the sweep runs every interval.
struct keepalive_config
{
    std::chrono::steady_clock::duration interval{std::chrono::seconds(900)};
    std::chrono::steady_clock::duration idle_threshold{std::chrono::seconds(300)};
};

/// Everything received for one tagged command.
struct command_reply
{
    std::uint64_t tag = 0;
    status st = status::unknown;

    /// Text of the tagged line after the status word.
    std::string text;

    /// Raw bytes of the response unit, literals untouched.
    std::string raw;

    /// Parsed untagged lines in arrival order.
    std::vector<reply_tree> untagged;

    /// Parsed tagged line.
    reply_tree completion;

    /// Set when the unit could not be parsed; the tagged status is still valid.
    std::optional<error_info> parse_error;

    [[nodiscard]] bool ok() const noexcept
    {
        return st == status::ok;
    }
};

} // namespace mailsync::imap
