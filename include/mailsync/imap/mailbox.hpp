/*

imap/mailbox.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/detail/ascii.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/marks.hpp>
#include <mailsync/imap/reply.hpp>
#include <mailsync/imap/session.hpp>
#include <mailsync/imap/types.hpp>
#include <mailsync/imap/utf7.hpp>

namespace mailsync::imap
{

struct mailbox_stat
{
    std::uint32_t exists = 0;
    std::uint32_t recent = 0;
    std::optional<std::uint32_t> unseen;
    std::optional<std::uint32_t> uid_next;
    std::optional<std::uint32_t> uid_validity;
    std::optional<std::uint64_t> highest_modseq;

    /// FLAGS: flags defined in the mailbox.
    std::vector<std::string> flags;

    /// PERMANENTFLAGS, when the server sent it. "\*" means new keywords may be stored.
    std::optional<std::vector<std::string>> permanent_flags;

    bool read_only = false;

    /// Whether `flag` can be stored permanently; unknown PERMANENTFLAGS counts as yes.
    [[nodiscard]] bool can_store(std::string_view flag) const
    {
        return !permanent_flags || flag_storable(*permanent_flags, flag);
    }
};

struct mailbox_folder
{
    std::string name;
    std::string delimiter;
    std::vector<std::string> attributes;
};

/// Fill a mailbox_stat from the untagged data of SELECT or EXAMINE.
[[nodiscard]] inline mailbox_stat parse_mailbox_stat(const command_reply& reply)
{
    mailbox_stat stat;
    auto narrow = [](std::uint64_t value) -> std::optional<std::uint32_t>
    {
        if (value > UINT32_MAX)
            return std::nullopt;
        return static_cast<std::uint32_t>(value);
    };
    auto as_u32 = [&narrow](std::string_view text) -> std::optional<std::uint32_t>
    {
        std::uint64_t value = 0;
        if (!detail::parse_uint64(text, value))
            return std::nullopt;
        return narrow(value);
    };

    // Counts that do not fit 32 bits are ignored.
    for (const auto& line : reply.untagged)
    {
        if (auto n = untagged_number(line, "EXISTS"))
        {
            if (auto count = narrow(*n))
                stat.exists = *count;
            continue;
        }
        if (auto n = untagged_number(line, "RECENT"))
        {
            if (auto count = narrow(*n))
                stat.recent = *count;
            continue;
        }
        if (is_untagged(line, "FLAGS") && line.items.size() >= 3 && line.items[2].list() != nullptr)
        {
            stat.flags.clear();
            for (const auto& f : line.items[2].list()->items)
                stat.flags.emplace_back(f.text());
            continue;
        }

        const reply_attrs* code = is_untagged(line, "OK") ? response_code(line) : nullptr;
        if (code == nullptr || code->items.empty())
            continue;
        const std::string& key = code->items[0];
        const std::string_view value = code->items.size() > 1 ? std::string_view(code->items[1]) : std::string_view{};
        if (detail::iequals_ascii(key, "UIDNEXT"))
            stat.uid_next = as_u32(value);
        else if (detail::iequals_ascii(key, "UIDVALIDITY"))
            stat.uid_validity = as_u32(value);
        else if (detail::iequals_ascii(key, "UNSEEN"))
            stat.unseen = as_u32(value);
        else if (detail::iequals_ascii(key, "HIGHESTMODSEQ"))
        {
            std::uint64_t modseq = 0;
            if (detail::parse_uint64(value, modseq))
                stat.highest_modseq = modseq;
        }
        else if (detail::iequals_ascii(key, "PERMANENTFLAGS"))
            stat.permanent_flags = unparen_items(code->items, 1);
    }

    if (const reply_attrs* code = response_code(reply.completion); code != nullptr && !code->items.empty())
        stat.read_only = detail::iequals_ascii(code->items[0], "READ-ONLY");
    return stat;
}

/**
Selecting a mailbox (or examining it read-only) and reporting its state.
On failure the session is left with no mailbox selected.
**/
inline awaitable<result<mailbox_stat>> select_mailbox(session& s, std::string mailbox, bool examine = false)
{
    std::string quoted;
    MAILSYNC_CO_TRY_ASSIGN(quoted, to_mailbox(mailbox));
    auto reply = co_await s.run_command(examine ? "EXAMINE" : "SELECT", quoted);
    if (!reply)
    {
        s.set_selected_mailbox(std::nullopt);
        co_return fail<mailbox_stat>(std::move(reply).error());
    }
    if (reply->parse_error)
    {
        s.set_selected_mailbox(std::nullopt);
        co_return fail<mailbox_stat>(*reply->parse_error);
    }
    mailbox_stat stat = parse_mailbox_stat(*reply);
    if (examine)
        stat.read_only = true;
    s.set_selected_mailbox(mailbox);
    MAILSYNC_DEBUG("IMAP " + s.name() + ": selected " + mailbox + ", " + detail::uint_to_string(stat.exists) + " messages");
    co_return stat;
}

inline awaitable<result<mailbox_stat>> examine_mailbox(session& s, std::string mailbox)
{
    return select_mailbox(s, std::move(mailbox), true);
}

/**
Listing mailboxes matching a pattern. Names are decoded from modified UTF-7; a name that fails to
decode is kept as sent.
**/
inline awaitable<result<std::vector<mailbox_folder>>> list_mailboxes(session& s, std::string reference = {},
    std::string pattern = "*")
{
    std::string ref_q;
    std::string pattern_q;
    MAILSYNC_CO_TRY_ASSIGN(ref_q, to_astring(reference));
    MAILSYNC_CO_TRY_ASSIGN(pattern_q, to_astring(pattern));
    command_reply reply;
    MAILSYNC_CO_TRY_ASSIGN(reply, co_await s.run_command("LIST", ref_q, pattern_q));
    if (reply.parse_error)
        co_return fail<std::vector<mailbox_folder>>(*reply.parse_error);

    std::vector<mailbox_folder> folders;
    for (const auto& line : reply.untagged)
    {
        if (!is_untagged(line, "LIST") || line.items.size() < 5)
            continue;
        mailbox_folder folder;
        if (const reply_list* attrs = line.items[2].list())
        {
            for (const auto& a : attrs->items)
                folder.attributes.emplace_back(a.text());
        }
        if (!line.items[3].is_nil())
            folder.delimiter = std::string(line.items[3].text());
        const std::string_view raw_name = line.items[4].text();
        auto decoded = decode_modified_utf7(raw_name);
        folder.name = decoded ? std::move(*decoded) : std::string(raw_name);
        folders.push_back(std::move(folder));
    }
    co_return folders;
}

inline awaitable<result_void> create_mailbox(session& s, std::string mailbox)
{
    std::string quoted;
    MAILSYNC_CO_TRY_ASSIGN(quoted, to_mailbox(mailbox));
    MAILSYNC_TRY_CO_AWAIT(s.run_command("CREATE", quoted));
    MAILSYNC_INFO("IMAP " + s.name() + ": created mailbox " + mailbox);
    co_return ok();
}

} // namespace mailsync::imap
