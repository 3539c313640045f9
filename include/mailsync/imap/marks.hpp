/*

imap/marks.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/detail/ascii.hpp>

namespace mailsync::imap
{

/**
Client-side mark and the server flag storing it.

Some servers were fed flags under an older spelling (a leading '%' instead of '\'); that spelling is
read as a fallback but never written.
**/
struct mark_mapping
{
    std::string_view mark;
    std::string_view flag;
    std::string_view alternate;
};

inline constexpr std::array<mark_mapping, 9> mark_table{{
    {"read", "\\Seen", "%Seen"},
    {"tick", "\\Flagged", "%Flagged"},
    {"reply", "\\Answered", "%Answered"},
    {"expire", "gnus-expire", {}},
    {"dormant", "gnus-dormant", {}},
    {"score", "gnus-score", {}},
    {"save", "gnus-save", {}},
    {"download", "gnus-download", {}},
    {"forward", "gnus-forward", "$Forwarded"},
}};

[[nodiscard]] inline const mark_mapping* find_mark(std::string_view mark) noexcept
{
    for (const auto& m : mark_table)
    {
        if (m.mark == mark)
            return &m;
    }
    return nullptr;
}

[[nodiscard]] inline std::optional<std::string_view> flag_for_mark(std::string_view mark) noexcept
{
    const mark_mapping* m = find_mark(mark);
    if (m == nullptr)
        return std::nullopt;
    return m->flag;
}

/// Flags compare case-insensitively; both spellings map back to the mark.
[[nodiscard]] inline std::optional<std::string_view> mark_for_flag(std::string_view flag) noexcept
{
    for (const auto& m : mark_table)
    {
        if (detail::iequals_ascii(m.flag, flag) || (!m.alternate.empty() && detail::iequals_ascii(m.alternate, flag)))
            return m.mark;
    }
    return std::nullopt;
}

/// Whether PERMANENTFLAGS lets `flag` be stored. "\\*" admits any keyword, not system flags.
[[nodiscard]] inline bool flag_storable(const std::vector<std::string>& permanent_flags, std::string_view flag) noexcept
{
    for (const auto& f : permanent_flags)
    {
        if (f == "\\*" && !flag.starts_with('\\'))
            return true;
        if (detail::iequals_ascii(f, flag))
            return true;
    }
    return false;
}

} // namespace mailsync::imap
