/*

imap/reconcile.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/ascii.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/collaborators.hpp>
#include <mailsync/imap/mailbox.hpp>
#include <mailsync/imap/marks.hpp>
#include <mailsync/imap/range.hpp>
#include <mailsync/imap/reply.hpp>
#include <mailsync/imap/session.hpp>

namespace mailsync::imap
{

/// What one flag listing revealed about a mailbox.
struct mailbox_state
{
    uid_range existing;

    /// Flag, upper-cased, to the UIDs carrying it.
    std::map<std::string, uid_range> flags;

    std::optional<uid_t> uid_next;

    /// Lowest UID requested by this fetch; 1 for a complete listing.
    uid_t start_article = 1;

    std::optional<std::vector<std::string>> permanent_flags;

    [[nodiscard]] const uid_range* flag_range(std::string_view flag) const
    {
        auto it = flags.find(detail::to_upper_ascii(flag));
        return it == flags.end() ? nullptr : &it->second;
    }

    /// Fresh set for a mark: its flag, else the alternate spelling, else nothing.
    [[nodiscard]] uid_range mark_range(const mark_mapping& m) const
    {
        if (const uid_range* r = flag_range(m.flag))
            return *r;
        if (!m.alternate.empty())
        {
            if (const uid_range* r = flag_range(m.alternate))
                return *r;
        }
        return {};
    }

    /// uidnext - 1, raised to the highest UID seen should UIDNEXT be stale.
    [[nodiscard]] uid_t high() const noexcept
    {
        const uid_t observed = existing.max().value_or(0);
        if (uid_next && *uid_next > 0)
            return std::max<uid_t>(*uid_next - 1, observed);
        return observed;
    }

    [[nodiscard]] uid_t low() const noexcept
    {
        if (auto m = existing.min())
            return *m;
        return uid_next.value_or(1);
    }

    /// Whether the mark may be held on the server; see flag_storable().
    [[nodiscard]] bool mark_storable(const mark_mapping& m) const
    {
        if (!permanent_flags)
            return true;
        return flag_storable(*permanent_flags, m.flag)
            || (!m.alternate.empty() && flag_storable(*permanent_flags, m.alternate));
    }
};

/**
Build a mailbox_state from "* n FETCH (UID u FLAGS (...))" lines. Items may come in any order;
lines without a UID are skipped.
**/
[[nodiscard]] inline mailbox_state collect_flags(const std::vector<reply_tree>& untagged)
{
    std::vector<uid_t> existing;
    std::map<std::string, std::vector<uid_t>> flags;
    for (const auto& line : untagged)
    {
        const reply_list* data = fetch_data(line);
        if (data == nullptr)
            continue;
        const auto uid = number_of(find_item(*data, "UID"));
        if (!uid || *uid == 0 || *uid > UINT32_MAX)
            continue;
        existing.push_back(static_cast<uid_t>(*uid));

        const reply_node* flag_list = find_item(*data, "FLAGS");
        if (flag_list == nullptr || flag_list->list() == nullptr)
            continue;
        for (const auto& flag : flag_list->list()->items)
        {
            if (!flag.text().empty())
                flags[detail::to_upper_ascii(flag.text())].push_back(static_cast<uid_t>(*uid));
        }
    }

    mailbox_state state;
    state.existing = uid_range::from_list(std::move(existing));
    for (auto& [flag, uids] : flags)
        state.flags.emplace(flag, uid_range::from_list(std::move(uids)));
    return state;
}

struct reconcile_summary
{
    bool complete = false;
    uid_t low = 0;
    uid_t high = 0;
    std::uint64_t unread = 0;
};

/**
Merge a fresh flag listing into the stored record of a mailbox.

A complete listing (start article 1, or nothing stored yet) replaces the record. A partial listing is
authoritative only for [start article, high]: stored read and mark data below that window is kept,
and the active range keeps its lower bound.

Marks whose flag the mailbox cannot store (PERMANENTFLAGS known, flag absent, no "\*") are left as they
were. For the others the fresh set wins inside the window even when empty.

Applying the same state twice gives the same record.
**/
inline reconcile_summary reconcile(const mailbox_state& state, mailbox_info& info)
{
    reconcile_summary summary;
    const uid_t start = std::max<uid_t>(state.start_article, 1);
    const uid_t high = state.high();
    const uid_t low = state.low();
    summary.complete = start == 1 || !info.active;
    summary.high = high;

    if (summary.complete)
    {
        info.active = active_range{low, high};
    }
    else
    {
        info.active->high = std::max(info.active->high, high);
    }
    summary.low = info.active->low;

    const mark_mapping& read_mark = *find_mark("read");
    const mark_mapping& tick_mark = *find_mark("tick");
    const uid_range unread = state.existing.subtract(state.mark_range(read_mark)).subtract(state.mark_range(tick_mark));
    summary.unread = unread.size();

    uid_range read = unread.complement(start, high);
    if (start > 1)
        read = info.read.clamp(1, start - 1).unite(read);
    info.read = std::move(read);

    for (const auto& m : mark_table)
    {
        if (m.mark == read_mark.mark)
            continue;
        if (!state.mark_storable(m))
            continue;

        const std::string key(m.mark);
        uid_range merged = state.mark_range(m);
        if (start > 1)
        {
            auto it = info.marks.find(key);
            if (it != info.marks.end())
            {
                uid_range kept = it->second;
                kept.erase(start, high);
                merged = kept.unite(merged);
            }
        }
        if (merged.empty())
            info.marks.erase(key);
        else
            info.marks[key] = std::move(merged);
    }
    return summary;
}

struct sync_outcome
{
    /// UIDVALIDITY, UIDNEXT and HIGHESTMODSEQ were unchanged; no flags were fetched.
    bool skipped = false;

    uid_t start_article = 1;
    std::uint64_t fetched = 0;
    reconcile_summary summary;
    mailbox_stat stat;
};

/**
Bring the stored record of one mailbox up to date.

Selects the mailbox, refetches flags from max(1, UIDNEXT - flag_window) (from 1 on a first sync or after
a UIDVALIDITY change), reconciles and saves. Nothing is fetched when the server reports the mailbox
unchanged since the last sync.
**/
inline awaitable<result<sync_outcome>> sync_mailbox(session& s, std::string mailbox, info_store& store)
{
    sync_outcome outcome;
    MAILSYNC_CO_TRY_ASSIGN(outcome.stat, co_await select_mailbox(s, mailbox));
    const mailbox_stat& stat = outcome.stat;

    std::optional<mailbox_info> stored = store.load(mailbox);
    mailbox_info info = stored.value_or(mailbox_info{});
    const bool same_validity = stored && stored->uid_validity && stat.uid_validity
        && *stored->uid_validity == *stat.uid_validity;
    if (stored && stored->uid_validity && !same_validity)
    {
        MAILSYNC_INFO("IMAP " + s.name() + ": UIDVALIDITY of " + mailbox + " changed, resyncing from scratch");
        info = mailbox_info{};
    }

    if (same_validity && stat.uid_next && stored->uid_next == stat.uid_next
        && stat.highest_modseq && stored->highest_modseq == stat.highest_modseq)
    {
        MAILSYNC_DEBUG("IMAP " + s.name() + ": " + mailbox + " unchanged, skipping flag fetch");
        outcome.skipped = true;
        co_return outcome;
    }

    uid_t start = 1;
    const std::uint32_t window = s.config().flag_window;
    if (info.active && stat.uid_next && *stat.uid_next > window)
        start = *stat.uid_next - window;
    outcome.start_article = start;

    std::string set = detail::uint_to_string(start);
    set += ":*";
    command_reply reply;
    MAILSYNC_CO_TRY_ASSIGN(reply, co_await s.run_command("UID FETCH", set, "(UID FLAGS)"));
    if (reply.parse_error)
        co_return fail<sync_outcome>(*reply.parse_error);

    mailbox_state state = collect_flags(reply.untagged);
    // "n:*" always returns the last message, even below n.
    if (start > 1)
    {
        state.existing = state.existing.clamp(start, UINT32_MAX);
        for (auto& [flag, range] : state.flags)
            range = range.clamp(start, UINT32_MAX);
    }
    state.uid_next = stat.uid_next;
    state.start_article = start;
    state.permanent_flags = stat.permanent_flags;
    outcome.fetched = state.existing.size();

    outcome.summary = reconcile(state, info);
    info.uid_validity = stat.uid_validity;
    info.uid_next = stat.uid_next;
    info.highest_modseq = stat.highest_modseq;
    store.save(mailbox, info);

    MAILSYNC_DEBUG("IMAP " + s.name() + ": synced " + mailbox + " from " + detail::uint_to_string(start)
        + ", " + detail::uint_to_string(outcome.fetched) + " fetched, " + detail::uint_to_string(outcome.summary.unread)
        + " unread");
    co_return outcome;
}

} // namespace mailsync::imap
