/*

error_mapping.hpp
-----------------

Centralized mapping between Asio error codes and mailsync::errc for network I/O.

*/

#pragma once

#include <string_view>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/result.hpp>

namespace mailsync::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "unknown";
}

[[nodiscard]] inline errc map_net_error(io_stage stage, const mailsync::asio::error_code& ec,
    bool timeout_triggered) noexcept
{
    namespace error = mailsync::asio::error;

    if (timeout_triggered || ec == error::timed_out)
        return errc::net_timeout;
    if (ec == error::operation_aborted)
        return errc::net_cancelled;
    if (ec == error::eof)
        return errc::net_eof;
    if (ec == error::connection_refused)
        return errc::net_connection_refused;
    if (ec == error::connection_reset || ec == error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == error::host_not_found || ec == error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
    }
    return errc::net_io_failed;
}

/// Transport failures always name the server and how it was reached.
[[nodiscard]] inline detail::error_detail make_net_detail(
    std::string_view server,
    std::string_view host,
    std::string_view service,
    std::string_view transport,
    io_stage stage)
{
    detail::error_detail detail;
    detail.add("proto", "imap");
    detail.add("server", server);
    detail.add("host", host);
    detail.add("service", service);
    detail.add("transport", transport);
    detail.add("stage", stage_name(stage));
    return detail;
}

[[nodiscard]] inline error_info make_net_error(io_stage stage, const mailsync::asio::error_code& ec,
    bool timeout_triggered, const detail::error_detail& detail,
    std::source_location where = std::source_location::current())
{
    const errc code = map_net_error(stage, ec, timeout_triggered);
    std::string message(stage_name(stage));
    message += code == errc::net_timeout ? " timed out" : " failed";
    if (ec)
    {
        message += ": ";
        message += ec.message();
    }
    return error_info{code, std::move(message), detail.str(), ec, where};
}

} // namespace mailsync::net
