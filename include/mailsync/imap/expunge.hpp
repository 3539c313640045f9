/*

imap/expunge.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <ostream>
#include <string_view>

#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/error_mapping.hpp>
#include <mailsync/imap/range.hpp>
#include <mailsync/imap/session.hpp>

namespace mailsync::imap
{

enum class expunge_outcome
{
    nothing_to_do,
    /// UID EXPUNGE removed exactly the marked messages.
    expunged_scoped,
    /// Plain EXPUNGE, which also removes anything else marked \Deleted.
    expunged_all,
    /// Marked \Deleted but left in the mailbox.
    not_expunged
};

inline std::string_view to_string(expunge_outcome outcome) noexcept
{
    switch (outcome)
    {
        case expunge_outcome::nothing_to_do:
            return "nothing to do";
        case expunge_outcome::expunged_scoped:
            return "expunged (scoped)";
        case expunge_outcome::expunged_all:
            return "expunged (all)";
        case expunge_outcome::not_expunged:
            return "not expunged";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, expunge_outcome outcome)
{
    return os << to_string(outcome);
}

/**
Marking messages of the selected mailbox deleted and expunging them.

Scoped removal (UID EXPUNGE) is used when the server has UIDPLUS. Without it, a plain EXPUNGE would also
drop messages other clients marked \Deleted, so it is sent only when `allow_unscoped` is set; otherwise
the messages stay marked and a warning is logged.
**/
inline awaitable<result<expunge_outcome>> delete_articles(session& s, const uid_range& uids, bool allow_unscoped)
{
    if (uids.empty())
        co_return expunge_outcome::nothing_to_do;
    if (!s.selected_mailbox())
        co_return fail<expunge_outcome>(errc::imap_invalid_state, "No mailbox selected.",
            make_imap_detail(s.name(), 0, "UID STORE", {}, 0));

    const std::string set = uids.to_imap_set();
    MAILSYNC_TRY_CO_AWAIT(s.run_command("UID STORE", set, "+FLAGS.SILENT (\\Deleted)"));

    if (s.has_capability("UIDPLUS"))
    {
        MAILSYNC_TRY_CO_AWAIT(s.run_command("UID EXPUNGE", set));
        MAILSYNC_DEBUG("IMAP " + s.name() + ": expunged " + set + " from " + *s.selected_mailbox());
        co_return expunge_outcome::expunged_scoped;
    }
    if (allow_unscoped)
    {
        MAILSYNC_TRY_CO_AWAIT(s.run_command("EXPUNGE"));
        MAILSYNC_DEBUG("IMAP " + s.name() + ": expunged all deleted messages of " + *s.selected_mailbox());
        co_return expunge_outcome::expunged_all;
    }
    MAILSYNC_WARN("IMAP " + s.name() + ": no UIDPLUS, " + set + " marked deleted but not expunged");
    co_return expunge_outcome::not_expunged;
}

} // namespace mailsync::imap
