/*

imap/range.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/ascii.hpp>
#include <mailsync/detail/result.hpp>

namespace mailsync::imap
{

using uid_t = std::uint32_t;

/**
Set of UIDs kept as sorted, disjoint, non-adjacent closed intervals.

The representation is canonical: two ranges holding the same UIDs compare equal,
and every mutating operation restores the canonical form before returning.
**/
class uid_range
{
public:
    struct interval
    {
        uid_t low = 0;
        uid_t high = 0;

        friend bool operator==(const interval&, const interval&) = default;
    };

    uid_range() = default;

    /// [low, high]; empty when high < low.
    uid_range(uid_t low, uid_t high)
    {
        if (low <= high)
            intervals_.push_back({low, high});
    }

    /// Compress an arbitrary list of UIDs (any order, duplicates allowed).
    [[nodiscard]] static uid_range from_list(std::vector<uid_t> uids)
    {
        std::sort(uids.begin(), uids.end());
        uid_range out;
        for (uid_t uid : uids)
        {
            if (!out.intervals_.empty() && static_cast<std::uint64_t>(out.intervals_.back().high) + 1 >= uid)
                out.intervals_.back().high = std::max(out.intervals_.back().high, uid);
            else
                out.intervals_.push_back({uid, uid});
        }
        return out;
    }

    /// Expand back into the ascending list of UIDs.
    [[nodiscard]] std::vector<uid_t> to_list() const
    {
        std::vector<uid_t> out;
        out.reserve(static_cast<std::size_t>(size()));
        for (const auto& iv : intervals_)
        {
            for (std::uint64_t uid = iv.low; uid <= iv.high; ++uid)
                out.push_back(static_cast<uid_t>(uid));
        }
        return out;
    }

    [[nodiscard]] const std::vector<interval>& intervals() const noexcept
    {
        return intervals_;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return intervals_.empty();
    }

    /// Number of UIDs in the set.
    [[nodiscard]] std::uint64_t size() const noexcept
    {
        std::uint64_t count = 0;
        for (const auto& iv : intervals_)
            count += static_cast<std::uint64_t>(iv.high) - iv.low + 1;
        return count;
    }

    [[nodiscard]] std::optional<uid_t> min() const noexcept
    {
        if (intervals_.empty())
            return std::nullopt;
        return intervals_.front().low;
    }

    [[nodiscard]] std::optional<uid_t> max() const noexcept
    {
        if (intervals_.empty())
            return std::nullopt;
        return intervals_.back().high;
    }

    [[nodiscard]] bool contains(uid_t uid) const noexcept
    {
        auto it = std::lower_bound(intervals_.begin(), intervals_.end(), uid,
            [](const interval& iv, uid_t value) { return iv.high < value; });
        return it != intervals_.end() && it->low <= uid;
    }

    void insert(uid_t uid)
    {
        insert(uid, uid);
    }

    void insert(uid_t low, uid_t high)
    {
        if (high < low)
            return;
        std::vector<interval> merged;
        merged.reserve(intervals_.size() + 1);
        bool placed = false;
        for (const auto& iv : intervals_)
        {
            if (static_cast<std::uint64_t>(iv.high) + 1 < low)
            {
                merged.push_back(iv);
            }
            else if (static_cast<std::uint64_t>(high) + 1 < iv.low)
            {
                if (!placed)
                {
                    merged.push_back({low, high});
                    placed = true;
                }
                merged.push_back(iv);
            }
            else
            {
                low = std::min(low, iv.low);
                high = std::max(high, iv.high);
            }
        }
        if (!placed)
            merged.push_back({low, high});
        intervals_ = std::move(merged);
    }

    /// Remove every UID in [low, high].
    void erase(uid_t low, uid_t high)
    {
        if (high < low)
            return;
        std::vector<interval> kept;
        kept.reserve(intervals_.size() + 1);
        for (const auto& iv : intervals_)
        {
            if (iv.high < low || iv.low > high)
            {
                kept.push_back(iv);
                continue;
            }
            if (iv.low < low)
                kept.push_back({iv.low, low - 1});
            if (iv.high > high)
                kept.push_back({high + 1, iv.high});
        }
        intervals_ = std::move(kept);
    }

    [[nodiscard]] uid_range unite(const uid_range& other) const
    {
        uid_range out = *this;
        for (const auto& iv : other.intervals_)
            out.insert(iv.low, iv.high);
        return out;
    }

    [[nodiscard]] uid_range subtract(const uid_range& other) const
    {
        uid_range out = *this;
        for (const auto& iv : other.intervals_)
            out.erase(iv.low, iv.high);
        return out;
    }

    [[nodiscard]] uid_range intersect(const uid_range& other) const
    {
        uid_range out;
        std::size_t i = 0;
        std::size_t j = 0;
        while (i < intervals_.size() && j < other.intervals_.size())
        {
            const auto& a = intervals_[i];
            const auto& b = other.intervals_[j];
            const uid_t low = std::max(a.low, b.low);
            const uid_t high = std::min(a.high, b.high);
            if (low <= high)
                out.intervals_.push_back({low, high});
            if (a.high < b.high)
                ++i;
            else
                ++j;
        }
        return out;
    }

    /// UIDs of this set that fall inside [low, high].
    [[nodiscard]] uid_range clamp(uid_t low, uid_t high) const
    {
        return intersect(uid_range(low, high));
    }

    /// UIDs of [low, high] that are not in this set.
    [[nodiscard]] uid_range complement(uid_t low, uid_t high) const
    {
        return uid_range(low, high).subtract(*this);
    }

    /// IMAP sequence-set syntax: "1:5,7,9:12". Empty for an empty range.
    [[nodiscard]] std::string to_imap_set() const
    {
        std::string out;
        for (const auto& iv : intervals_)
        {
            if (!out.empty())
                out.push_back(',');
            detail::append_uint(out, iv.low);
            if (iv.high != iv.low)
            {
                out.push_back(':');
                detail::append_uint(out, iv.high);
            }
        }
        return out;
    }

    /// Parse a sequence set of explicit numbers; "*" is rejected since it needs server context.
    [[nodiscard]] static result<uid_range> parse_imap_set(std::string_view text)
    {
        uid_range out;
        while (!text.empty())
        {
            const auto comma = text.find(',');
            std::string_view item = text.substr(0, comma);
            text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);

            const auto colon = item.find(':');
            std::uint64_t low = 0;
            std::uint64_t high = 0;
            const bool parsed = colon == std::string_view::npos
                ? detail::parse_uint64(item, low) && detail::parse_uint64(item, high)
                : detail::parse_uint64(item.substr(0, colon), low) && detail::parse_uint64(item.substr(colon + 1), high);
            if (!parsed || low == 0 || high == 0 || low > UINT32_MAX || high > UINT32_MAX)
                return fail<uid_range>(errc::imap_parse_error, "Invalid sequence set.", std::string(item));
            if (high < low)
                std::swap(low, high);
            out.insert(static_cast<uid_t>(low), static_cast<uid_t>(high));
        }
        return out;
    }

    friend bool operator==(const uid_range&, const uid_range&) = default;

    friend std::ostream& operator<<(std::ostream& os, const uid_range& range)
    {
        return os << '{' << range.to_imap_set() << '}';
    }

private:
    std::vector<interval> intervals_;
};

} // namespace mailsync::imap
