/*

imap/collaborators.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Interfaces the client depends on but does not implement: where credentials come from,
where per-mailbox state is persisted, and how a message is routed when splitting.

*/


#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/imap/range.hpp>
#include <mailsync/imap/types.hpp>

namespace mailsync::imap
{

class credential_provider
{
public:
    virtual ~credential_provider() = default;

    /// Credentials for a host, given every port the server may be reached on.
    virtual std::optional<credentials> lookup(std::string_view host, const std::vector<std::string>& ports) = 0;

    /// Drop cached credentials after the server rejected them.
    virtual void forget(std::string_view host, std::string_view port) = 0;
};

/// Article range ever seen in a mailbox; empty when high < low.
struct active_range
{
    uid_t low = 1;
    uid_t high = 0;

    [[nodiscard]] bool empty() const noexcept
    {
        return high < low;
    }

    friend bool operator==(const active_range&, const active_range&) = default;
};

/// Everything remembered about one mailbox between syncs.
struct mailbox_info
{
    std::optional<active_range> active;
    uid_range read;

    /// Mark name (tick, reply, ...) to UIDs carrying it.
    std::map<std::string, uid_range> marks;

    std::optional<std::uint32_t> uid_validity;
    std::optional<std::uint32_t> uid_next;
    std::optional<std::uint64_t> highest_modseq;
};

class info_store
{
public:
    virtual ~info_store() = default;

    virtual std::optional<mailbox_info> load(std::string_view mailbox) = 0;

    virtual void save(std::string_view mailbox, const mailbox_info& info) = 0;
};

/// In-process store, for tests and short-lived tools.
class memory_info_store : public info_store
{
public:
    std::optional<mailbox_info> load(std::string_view mailbox) override
    {
        std::lock_guard lock(mutex_);
        auto it = infos_.find(std::string(mailbox));
        if (it == infos_.end())
            return std::nullopt;
        return it->second;
    }

    void save(std::string_view mailbox, const mailbox_info& info) override
    {
        std::lock_guard lock(mutex_);
        infos_[std::string(mailbox)] = info;
    }

private:
    std::mutex mutex_;
    std::map<std::string, mailbox_info> infos_;
};

/// Where one incoming message goes. No destination and no discard leaves it in place.
struct classification
{
    std::vector<std::string> destinations;
    bool discard = false;
};

/// Receives the raw header plus first body part of a message.
using classifier = std::function<classification(std::string_view raw)>;

} // namespace mailsync::imap
