/*

imap/split.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/error_detail.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/collaborators.hpp>
#include <mailsync/imap/expunge.hpp>
#include <mailsync/imap/mailbox.hpp>
#include <mailsync/imap/range.hpp>
#include <mailsync/imap/reconcile.hpp>
#include <mailsync/imap/reply.hpp>
#include <mailsync/imap/session.hpp>
#include <mailsync/imap/types.hpp>

namespace mailsync::imap
{

struct split_report
{
    /// Unseen, undeleted messages found in the inbox.
    uid_range incoming;

    /// Destination to the UIDs copied there.
    std::map<std::string, uid_range> copied;

    /// Destination to the UIDs whose copy (or mailbox creation) failed.
    std::map<std::string, uid_range> failed;

    uid_range discarded;

    /// Marked \Deleted in the inbox.
    uid_range deleted;

    expunge_outcome expunge = expunge_outcome::nothing_to_do;

    /// Set when some destinations failed; their messages stay in the inbox for the next pass.
    std::optional<error_info> partial_failure;
};

namespace split_detail
{

inline std::string fetched_text(const reply_list& data, std::string_view item)
{
    const reply_node* node = find_item(data, item);
    if (node == nullptr || node->atom() == nullptr || node->is_nil())
        return {};
    return std::string(node->text());
}

/// Header plus first body part of each fetched message, keyed by UID.
inline std::map<uid_t, std::string> collect_messages(const command_reply& reply)
{
    std::map<uid_t, std::string> messages;
    for (const auto& line : reply.untagged)
    {
        const reply_list* data = fetch_data(line);
        if (data == nullptr)
            continue;
        const auto uid = number_of(find_item(*data, "UID"));
        if (!uid || *uid == 0 || *uid > UINT32_MAX)
            continue;
        std::string raw = fetched_text(*data, "BODY[HEADER]");
        raw += fetched_text(*data, "BODY[1]");
        messages[static_cast<uid_t>(*uid)] = std::move(raw);
    }
    return messages;
}

} // namespace split_detail

/**
Moving new messages out of the inbox into the mailboxes the classifier picks.

New messages are those without \Deleted and without \Seen. Each one is classified from its header and
first body part; destinations missing on the server are created; one UID COPY per destination is
pipelined and each completion is checked against its own tag. Every UID present in a successful copy,
plus every discarded UID, is then deleted from the inbox (see delete_articles()).

The source mailbox and the EXPUNGE permission come from the session's server_config.

A failed destination does not fail the pass: its messages are only left in place and reported through
`partial_failure`. Transport errors and a failed SELECT abort the pass.
**/
inline awaitable<result<split_report>> split_incoming(session& s, const classifier& classify)
{
    const std::string& inbox = s.config().inbox;
    split_report report;
    mailbox_stat stat;
    MAILSYNC_CO_TRY_ASSIGN(stat, co_await select_mailbox(s, inbox));
    if (stat.exists == 0)
        co_return report;

    command_reply listing;
    MAILSYNC_CO_TRY_ASSIGN(listing, co_await s.run_command("UID FETCH", "1:*", "(UID FLAGS)"));
    if (listing.parse_error)
        co_return fail<split_report>(*listing.parse_error);
    const mailbox_state state = collect_flags(listing.untagged);
    uid_range incoming = state.existing;
    if (const uid_range* deleted = state.flag_range("\\Deleted"))
        incoming = incoming.subtract(*deleted);
    if (const uid_range* seen = state.flag_range("\\Seen"))
        incoming = incoming.subtract(*seen);
    report.incoming = incoming;
    if (incoming.empty())
    {
        MAILSYNC_DEBUG("IMAP " + s.name() + ": nothing new in " + inbox);
        co_return report;
    }

    command_reply bodies;
    MAILSYNC_CO_TRY_ASSIGN(bodies, co_await s.run_command("UID FETCH", incoming.to_imap_set(),
        "(UID BODY.PEEK[HEADER] BODY.PEEK[1])"));
    if (bodies.parse_error)
        co_return fail<split_report>(*bodies.parse_error);

    std::map<std::string, uid_range> destinations;
    for (const auto& [uid, raw] : split_detail::collect_messages(bodies))
    {
        const classification where = classify(raw);
        if (where.discard)
        {
            report.discarded.insert(uid);
            continue;
        }
        for (const auto& dest : where.destinations)
            destinations[dest].insert(uid);
    }

    if (!destinations.empty())
    {
        std::vector<mailbox_folder> folders;
        MAILSYNC_CO_TRY_ASSIGN(folders, co_await list_mailboxes(s));
        std::set<std::string> known;
        for (const auto& f : folders)
            known.insert(f.name);
        for (auto it = destinations.begin(); it != destinations.end();)
        {
            if (known.contains(it->first))
            {
                ++it;
                continue;
            }
            auto created = co_await create_mailbox(s, it->first);
            if (created)
            {
                ++it;
                continue;
            }
            MAILSYNC_WARN("IMAP " + s.name() + ": cannot create " + it->first + ", " + to_string(created.error()));
            report.failed.insert(*it);
            it = destinations.erase(it);
        }
    }

    std::vector<std::pair<std::string, std::uint64_t>> copies;
    auto abandon_copies = [&s, &copies]
    {
        for (const auto& [dest, tag] : copies)
            s.discard(tag);
    };
    for (const auto& [dest, uids] : destinations)
    {
        auto quoted = to_mailbox(dest);
        if (!quoted)
        {
            abandon_copies();
            co_return fail<split_report>(std::move(quoted).error());
        }
        auto tag = co_await s.send("UID COPY", uids.to_imap_set(), *quoted);
        if (!tag)
        {
            abandon_copies();
            co_return fail<split_report>(std::move(tag).error());
        }
        copies.emplace_back(dest, *tag);
    }
    for (const auto& [dest, tag] : copies)
    {
        if (!co_await s.await_tag(tag))
        {
            abandon_copies();
            co_return fail<split_report>(s.current_error());
        }
    }
    for (const auto& [dest, tag] : copies)
    {
        const uid_range& uids = destinations[dest];
        auto copied = s.take_reply(tag);
        if (copied)
        {
            report.copied.emplace(dest, uids);
            MAILSYNC_INFO("IMAP " + s.name() + ": copied " + uids.to_imap_set() + " to " + dest);
        }
        else
        {
            report.failed.emplace(dest, uids);
            MAILSYNC_WARN("IMAP " + s.name() + ": copy to " + dest + " failed, " + to_string(copied.error()));
        }
    }

    uid_range to_delete = report.discarded;
    for (const auto& [dest, uids] : report.copied)
        to_delete = to_delete.unite(uids);
    MAILSYNC_CO_TRY_ASSIGN(report.expunge, co_await delete_articles(s, to_delete, s.config().allow_unscoped_expunge));
    report.deleted = std::move(to_delete);

    if (!report.failed.empty())
    {
        detail::error_detail info;
        info.add("server", s.name()).add("mailbox", inbox);
        for (const auto& [dest, uids] : report.failed)
            info.add("failed", dest + " " + uids.to_imap_set());
        report.partial_failure = error_info{errc::split_partial_failure, "Some destinations were not delivered.",
            info.str(), {}, std::source_location::current()};
        MAILSYNC_WARN("IMAP " + s.name() + ": split of " + inbox + " partially failed, "
            + detail::uint_to_string(report.failed.size()) + " destination(s) left for the next pass");
    }
    co_return report;
}

} // namespace mailsync::imap
