/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>

#include <mailsync/detail/result.hpp>

namespace mailsync
{
namespace detail
{

[[nodiscard]] inline bool contains_crlf_or_nul(std::string_view value) noexcept
{
    return value.find_first_of(std::string_view("\r\n\0", 3)) != std::string_view::npos;
}

/// Command arguments are written verbatim on one protocol line; a stray CR/LF would inject a command.
[[nodiscard]] inline result_void ensure_no_crlf_or_nul(std::string_view value, std::string_view field_name)
{
    if (!contains_crlf_or_nul(value))
        return ok();

    std::string message = "Invalid ";
    message.append(field_name.empty() ? std::string_view("value") : field_name);
    message += ": CR/LF or NUL not allowed.";
    error_detail detail;
    detail.add("field", field_name);
    return fail<void>(errc::invalid_argument, std::move(message), detail);
}

} // namespace detail
} // namespace mailsync
