/*

imap/error_mapping.hpp
----------------------

Centralized mapping between IMAP completions and mailsync::errc.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <mailsync/detail/result.hpp>
#include <mailsync/imap/reply.hpp>

namespace mailsync::imap
{

[[nodiscard]] constexpr errc map_status(status st) noexcept
{
    switch (st)
    {
        case status::ok:
        case status::preauth:
            return errc::ok;
        case status::no: return errc::imap_tagged_no;
        case status::bad: return errc::imap_tagged_bad;
        case status::bye: return errc::imap_bye;
        case status::unknown: return errc::imap_parse_error;
    }
    return errc::imap_parse_error;
}

[[nodiscard]] inline detail::error_detail make_imap_detail(
    std::string_view server,
    std::uint64_t tag,
    std::string_view command,
    std::string_view tagged_text,
    std::size_t untagged_count)
{
    detail::error_detail detail;
    detail.add("proto", "imap");
    detail.add("server", server);
    detail.add_int("tag", tag);
    detail.add("command", command);
    detail.add("tagged.text", tagged_text);
    detail.add_int("untagged.count", untagged_count);
    return detail;
}

} // namespace mailsync::imap
