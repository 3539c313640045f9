/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Expected failures never throw: every fallible operation returns result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <mailsync/detail/error_detail.hpp>

namespace mailsync
{

/// Error codes for mailsync operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Transport (100-199)
    net_resolve_failed = 100,
    net_connect_failed = 101,
    net_connection_refused = 102,
    net_connection_reset = 103,
    net_eof = 104,
    net_timeout = 105,
    net_cancelled = 106,
    net_io_failed = 107,
    tls_handshake_failed = 120,
    tls_verify_failed = 121,
    tls_context_missing = 122,

    // Protocol (200-219)
    imap_tagged_no = 200,
    imap_tagged_bad = 201,
    imap_bye = 202,
    imap_not_found = 203,

    // Authentication (220-229)
    imap_auth_failed = 220,
    imap_no_credentials = 221,

    // Reply structure (240-259)
    imap_parse_error = 240,
    imap_bodystructure_invalid = 241,
    codec_invalid_utf7 = 242,

    // Batch operations (300-399)
    split_partial_failure = 300,

    // Caller mistakes (700-799)
    invalid_argument = 700,
    imap_invalid_state = 701,
};

/// Coarse failure families used by callers to decide on retry policy.
enum class error_class : std::uint8_t
{
    none,
    transport,
    auth,
    protocol,
    parse,
    partial_failure,
    usage
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_eof: return "net_eof";
        case errc::net_timeout: return "net_timeout";
        case errc::net_cancelled: return "net_cancelled";
        case errc::net_io_failed: return "net_io_failed";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::tls_context_missing: return "tls_context_missing";
        case errc::imap_tagged_no: return "imap_tagged_no";
        case errc::imap_tagged_bad: return "imap_tagged_bad";
        case errc::imap_bye: return "imap_bye";
        case errc::imap_not_found: return "imap_not_found";
        case errc::imap_auth_failed: return "imap_auth_failed";
        case errc::imap_no_credentials: return "imap_no_credentials";
        case errc::imap_parse_error: return "imap_parse_error";
        case errc::imap_bodystructure_invalid: return "imap_bodystructure_invalid";
        case errc::codec_invalid_utf7: return "codec_invalid_utf7";
        case errc::split_partial_failure: return "split_partial_failure";
        case errc::invalid_argument: return "invalid_argument";
        case errc::imap_invalid_state: return "imap_invalid_state";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

[[nodiscard]] constexpr error_class classify(errc code) noexcept
{
    switch (code)
    {
        case errc::ok:
            return error_class::none;
        case errc::imap_auth_failed:
        case errc::imap_no_credentials:
            return error_class::auth;
        case errc::imap_tagged_no:
        case errc::imap_tagged_bad:
        case errc::imap_bye:
        case errc::imap_not_found:
            return error_class::protocol;
        case errc::imap_parse_error:
        case errc::imap_bodystructure_invalid:
        case errc::codec_invalid_utf7:
            return error_class::parse;
        case errc::split_partial_failure:
            return error_class::partial_failure;
        case errc::invalid_argument:
        case errc::imap_invalid_state:
            return error_class::usage;
        default:
            break;
    }
    const auto value = static_cast<std::uint16_t>(code);
    if (value >= 100 && value < 200)
        return error_class::transport;
    return error_class::usage;
}

struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;
};

/// One-line rendering for logs: "<code>: <message>".
[[nodiscard]] inline std::string to_string(const error_info& err)
{
    std::string out(to_string(err.code));
    if (!err.message.empty())
    {
        out += ": ";
        out += err.message;
    }
    return out;
}

template<typename T>
using result = std::expected<T, error_info>;

using result_void = result<void>;

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T = void>
[[nodiscard]] result<T> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), std::move(detail), sys, where});
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, const detail::error_detail& detail,
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), detail.str(), sys, where});
}

// ==================== Coroutine Helpers ====================

/// Assign the value of a result-returning expression or propagate its error.
/// Usage: MAILSYNC_CO_TRY_ASSIGN(reply, co_await session.run_command("NOOP"));
#define MAILSYNC_CO_TRY_ASSIGN(lhs, expr) \
    do { \
        auto _mailsync_res = (expr); \
        if (!_mailsync_res) [[unlikely]] \
            co_return std::unexpected(std::move(_mailsync_res).error()); \
        lhs = std::move(*_mailsync_res); \
    } while (0)

/// Same but discards the value
#define MAILSYNC_CO_TRY_VOID(expr) \
    do { \
        auto _mailsync_res = (expr); \
        if (!_mailsync_res) [[unlikely]] \
            co_return std::unexpected(std::move(_mailsync_res).error()); \
    } while (0)

#define MAILSYNC_TRY_CO_AWAIT(expr) MAILSYNC_CO_TRY_VOID(co_await (expr))

/// Plain-function counterpart of MAILSYNC_CO_TRY_ASSIGN.
#define MAILSYNC_TRY_ASSIGN(lhs, expr) \
    do { \
        auto _mailsync_res = (expr); \
        if (!_mailsync_res) [[unlikely]] \
            return std::unexpected(std::move(_mailsync_res).error()); \
        lhs = std::move(*_mailsync_res); \
    } while (0)

} // namespace mailsync
