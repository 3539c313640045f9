/*

imap/article.hpp
----------------

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
#include <string_view>
#include <utility>
#include <vector>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/ascii.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/regex.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/range.hpp>
#include <mailsync/imap/reply.hpp>
#include <mailsync/imap/session.hpp>

namespace mailsync::imap
{

/// One node of a BODYSTRUCTURE: a multipart container or a leaf.
struct body_part
{
    std::string type;
    std::string subtype;
    std::vector<std::pair<std::string, std::string>> params;
    std::string id;
    std::string description;
    std::string encoding;
    std::uint64_t size = 0;

    /// Non-empty for multipart nodes.
    std::vector<body_part> children;

    /// Positional identifier ("1", "2.1"); empty for a multipart root.
    std::string part_id;

    [[nodiscard]] bool multipart() const noexcept
    {
        return !children.empty();
    }

    [[nodiscard]] std::optional<std::string> param(std::string_view name) const
    {
        for (const auto& [key, value] : params)
        {
            if (detail::iequals_ascii(key, name))
                return value;
        }
        return std::nullopt;
    }

    /// "type/subtype", lower case.
    [[nodiscard]] std::string content_type() const
    {
        std::string out;
        for (char ch : type)
            out.push_back(static_cast<char>(ch >= 'A' && ch <= 'Z' ? ch + ('a' - 'A') : ch));
        out.push_back('/');
        for (char ch : subtype)
            out.push_back(static_cast<char>(ch >= 'A' && ch <= 'Z' ? ch + ('a' - 'A') : ch));
        return out;
    }
};

namespace article_detail
{

inline result<body_part> invalid(std::string_view why)
{
    return fail<body_part>(errc::imap_bodystructure_invalid, "Invalid BODYSTRUCTURE.", std::string(why));
}

inline std::string nstring(const reply_node& node)
{
    return node.is_nil() ? std::string{} : std::string(node.text());
}

inline void parse_params(const reply_node& node, body_part& part)
{
    const reply_list* list = node.list();
    if (list == nullptr)
        return;
    for (std::size_t i = 0; i + 1 < list->items.size(); i += 2)
        part.params.emplace_back(list->items[i].text(), list->items[i + 1].text());
}

inline std::string lower(std::string_view text)
{
    std::string out;
    for (char ch : text)
        out.push_back(static_cast<char>(ch >= 'A' && ch <= 'Z' ? ch + ('a' - 'A') : ch));
    return out;
}

inline void number(body_part& part, const std::string& prefix)
{
    for (std::size_t i = 0; i < part.children.size(); ++i)
    {
        body_part& child = part.children[i];
        child.part_id = prefix.empty() ? detail::uint_to_string(i + 1) : prefix + "." + detail::uint_to_string(i + 1);
        if (child.multipart())
            number(child, child.part_id);
    }
}

/// Header lines other than Content-Type and Content-Transfer-Encoding (with their continuations), LF-terminated.
inline std::string envelope_header(std::string_view header)
{
    std::string out;
    bool skipping = false;
    while (!header.empty())
    {
        const auto lf = header.find('\n');
        std::string_view line = header.substr(0, lf);
        header = lf == std::string_view::npos ? std::string_view{} : header.substr(lf + 1);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (line.empty())
            break;
        const bool continuation = line.front() == ' ' || line.front() == '\t';
        if (!continuation)
            skipping = detail::starts_with_ci(line, "content-type:") || detail::starts_with_ci(line, "content-transfer-encoding:");
        if (skipping)
            continue;
        out.append(line);
        out.push_back('\n');
    }
    return out;
}

inline result_void emit(const body_part& part, const std::map<std::string, std::string>& parts, std::string& out)
{
    if (!part.multipart())
    {
        out += "Content-type: ";
        out += part.content_type();
        if (auto charset = part.param("charset"))
        {
            out += "; charset=\"";
            out += *charset;
            out += "\"";
        }
        out += "\nContent-transfer-encoding: ";
        out += part.encoding.empty() ? std::string("7bit") : part.encoding;
        out += "\n\n";
        if (auto it = parts.find(part.part_id); it != parts.end())
            out += it->second;
        return ok();
    }

    const auto boundary = part.param("boundary");
    if (!boundary || boundary->empty())
        return fail<void>(errc::imap_bodystructure_invalid, "Multipart without boundary.",
            "part=" + (part.part_id.empty() ? std::string("root") : part.part_id));

    out += "Content-type: multipart/";
    out += lower(part.subtype);
    out += "; boundary=\"";
    out += *boundary;
    out += "\"\n\n";
    for (const auto& child : part.children)
    {
        out += "\n--";
        out += *boundary;
        out += "\n";
        auto nested = emit(child, parts, out);
        if (!nested)
            return nested;
    }
    out += "\n--";
    out += *boundary;
    out += "--\n";
    return ok();
}

inline void collect_leaves(const body_part& part, std::vector<const body_part*>& out)
{
    if (!part.multipart())
    {
        out.push_back(&part);
        return;
    }
    for (const auto& child : part.children)
        collect_leaves(child, out);
}

} // namespace article_detail

/**
Build the part tree from the list following BODYSTRUCTURE.

Leading sublists make a multipart node (followed by its subtype and parameters); otherwise the list is
a leaf: type, subtype, parameters, id, description, encoding, size. Extension data is ignored.
**/
[[nodiscard]] inline result<body_part> parse_body_structure(const reply_list& list)
{
    if (list.items.empty())
        return article_detail::invalid("empty list");

    body_part part;
    if (list.items.front().list() != nullptr)
    {
        std::size_t i = 0;
        for (; i < list.items.size() && list.items[i].list() != nullptr; ++i)
        {
            body_part child;
            MAILSYNC_TRY_ASSIGN(child, parse_body_structure(*list.items[i].list()));
            part.children.push_back(std::move(child));
        }
        part.type = "MULTIPART";
        if (i >= list.items.size() || list.items[i].atom() == nullptr)
            return article_detail::invalid("multipart without subtype");
        part.subtype = std::string(list.items[i].text());
        if (i + 1 < list.items.size())
            article_detail::parse_params(list.items[i + 1], part);
        return part;
    }

    if (list.items.size() < 7 || list.items[0].atom() == nullptr || list.items[1].atom() == nullptr)
        return article_detail::invalid("leaf needs type, subtype, parameters, id, description, encoding and size");
    part.type = std::string(list.items[0].text());
    part.subtype = std::string(list.items[1].text());
    article_detail::parse_params(list.items[2], part);
    part.id = article_detail::nstring(list.items[3]);
    part.description = article_detail::nstring(list.items[4]);
    part.encoding = article_detail::nstring(list.items[5]);
    if (auto size = number_of(&list.items[6]))
        part.size = *size;
    return part;
}

/**
Give every node its positional identifier: 1-based per level, dotted for nesting. A message that is a
single leaf has the one part "1".
**/
inline void number_parts(body_part& root)
{
    if (!root.multipart())
    {
        root.part_id = "1";
        return;
    }
    root.part_id.clear();
    article_detail::number(root, {});
}

/// Which parts of a message to fetch.
struct part_policy
{
    enum class kind
    {
        first_part,
        content_type
    };

    kind k = kind::first_part;

    /// Regular expression matched, case-insensitively, against the whole "type/subtype".
    std::string pattern;

    static part_policy first_part_only()
    {
        return {};
    }

    static part_policy content_type_matching(std::string pattern)
    {
        return {kind::content_type, std::move(pattern)};
    }
};

[[nodiscard]] inline result<std::set<std::string>> select_wanted_parts(const body_part& structure, const part_policy& policy)
{
    std::vector<const body_part*> leaves;
    article_detail::collect_leaves(structure, leaves);

    std::set<std::string> wanted;
    if (policy.k == part_policy::kind::first_part)
    {
        for (const body_part* leaf : leaves)
        {
            if (leaf->part_id == "1")
                wanted.insert(leaf->part_id);
        }
        return wanted;
    }

    detail::regex rule;
    try
    {
        rule = detail::make_icase_regex(policy.pattern);
    }
    catch (const boost::regex_error& exc)
    {
        return fail<std::set<std::string>>(errc::invalid_argument, "Invalid content type rule.",
            policy.pattern + ": " + exc.what());
    }
    for (const body_part* leaf : leaves)
    {
        if (detail::regex_match(leaf->content_type(), rule))
            wanted.insert(leaf->part_id);
    }
    return wanted;
}

/**
Synthesize a message from its header and the fetched parts.

The tree is walked depth first: each multipart node emits its Content-type with the declared boundary
and its delimiters, each leaf its Content-type, charset and transfer encoding, followed by the fetched
bytes when the leaf is in `parts`, nothing otherwise.

@param header    Header block of the message; its own Content-Type and Content-Transfer-Encoding are replaced.
@param structure Numbered part tree.
@param parts     Part identifier to raw bytes.
**/
[[nodiscard]] inline result<std::string> reconstruct_partial(std::string_view header, const body_part& structure,
    const std::map<std::string, std::string>& parts)
{
    std::string out = article_detail::envelope_header(header);
    auto emitted = article_detail::emit(structure, parts, out);
    if (!emitted)
        return fail<std::string>(std::move(emitted).error());
    return out;
}

namespace article_detail
{

/// Value of a FETCH item (e.g. "BODY[1]") in any FETCH line of a reply.
inline std::optional<std::string> fetched_item(const command_reply& reply, std::string_view item)
{
    for (const auto& line : reply.untagged)
    {
        const reply_list* data = fetch_data(line);
        if (data == nullptr)
            continue;
        const reply_node* node = find_item(*data, item);
        if (node != nullptr && node->atom() != nullptr && !node->is_nil())
            return std::string(node->text());
    }
    return std::nullopt;
}

} // namespace article_detail

/**
Fetching a whole message.

@return The message bytes, or nothing if the server sent no data for that UID.
**/
inline awaitable<result<std::optional<std::string>>> fetch_whole(session& s, uid_t uid)
{
    command_reply reply;
    MAILSYNC_CO_TRY_ASSIGN(reply, co_await s.run_command("UID FETCH", uid, "(BODY.PEEK[])"));
    if (reply.parse_error)
        co_return fail<std::optional<std::string>>(*reply.parse_error);
    co_return article_detail::fetched_item(reply, "BODY[]");
}

/// Fetching and numbering the part tree of a message.
inline awaitable<result<body_part>> fetch_body_structure(session& s, uid_t uid)
{
    command_reply reply;
    MAILSYNC_CO_TRY_ASSIGN(reply, co_await s.run_command("UID FETCH", uid, "(BODYSTRUCTURE)"));
    if (reply.parse_error)
    {
        error_info err = *reply.parse_error;
        err.code = errc::imap_bodystructure_invalid;
        co_return fail<body_part>(std::move(err));
    }
    for (const auto& line : reply.untagged)
    {
        const reply_list* data = fetch_data(line);
        if (data == nullptr)
            continue;
        const reply_node* node = find_item(*data, "BODYSTRUCTURE");
        if (node == nullptr || node->list() == nullptr)
            continue;
        body_part root;
        MAILSYNC_CO_TRY_ASSIGN(root, parse_body_structure(*node->list()));
        number_parts(root);
        co_return root;
    }
    co_return fail<body_part>(errc::imap_bodystructure_invalid, "No BODYSTRUCTURE in reply.",
        "uid=" + detail::uint_to_string(uid));
}

/**
Fetching the header and the wanted parts of a message, then rebuilding it.

The header and part requests are pipelined; each reply is matched to its own request by tag.
**/
inline awaitable<result<std::string>> fetch_partial(session& s, uid_t uid, const body_part& structure,
    const std::set<std::string>& wanted)
{
    std::uint64_t header_tag = 0;
    MAILSYNC_CO_TRY_ASSIGN(header_tag, co_await s.send("UID FETCH", uid, "(BODY.PEEK[HEADER])"));
    std::vector<std::pair<std::string, std::uint64_t>> part_tags;
    auto abandon = [&s, &header_tag, &part_tags]
    {
        s.discard(header_tag);
        for (const auto& [id, tag] : part_tags)
            s.discard(tag);
    };
    for (const auto& id : wanted)
    {
        auto tag = co_await s.send("UID FETCH", uid, "(BODY.PEEK[" + id + "])");
        if (!tag)
        {
            abandon();
            co_return fail<std::string>(std::move(tag).error());
        }
        part_tags.emplace_back(id, *tag);
    }

    if (!co_await s.await_tag(header_tag))
    {
        abandon();
        co_return fail<std::string>(s.current_error());
    }
    for (const auto& [id, tag] : part_tags)
    {
        if (!co_await s.await_tag(tag))
        {
            abandon();
            co_return fail<std::string>(s.current_error());
        }
    }

    auto header_reply = s.take_reply(header_tag);
    std::map<std::string, std::string> parts;
    for (const auto& [id, tag] : part_tags)
    {
        auto part_reply = s.take_reply(tag);
        if (!part_reply)
        {
            MAILSYNC_WARN("IMAP " + s.name() + ": part " + id + " of " + detail::uint_to_string(uid) + " not fetched, "
                + to_string(part_reply.error()));
            continue;
        }
        if (auto bytes = article_detail::fetched_item(*part_reply, "BODY[" + id + "]"))
            parts.emplace(id, std::move(*bytes));
    }

    if (!header_reply)
        co_return fail<std::string>(std::move(header_reply).error());
    auto header = article_detail::fetched_item(*header_reply, "BODY[HEADER]");
    if (!header)
        co_return fail<std::string>(errc::imap_not_found, "Message not found.", "uid=" + detail::uint_to_string(uid));
    co_return reconstruct_partial(*header, structure, parts);
}

/**
Fetching a message, partially when a policy is given.

With a policy the part tree is fetched and only the wanted parts are transferred; an error (for
instance an unusable BODYSTRUCTURE) is returned as is, and falling back to fetch_whole() is up to the
caller.
**/
inline awaitable<result<std::optional<std::string>>> fetch_article(session& s, uid_t uid,
    std::optional<part_policy> policy = std::nullopt)
{
    if (!policy)
        co_return co_await fetch_whole(s, uid);

    body_part structure;
    MAILSYNC_CO_TRY_ASSIGN(structure, co_await fetch_body_structure(s, uid));
    std::set<std::string> wanted;
    MAILSYNC_CO_TRY_ASSIGN(wanted, select_wanted_parts(structure, *policy));
    std::string bytes;
    MAILSYNC_CO_TRY_ASSIGN(bytes, co_await fetch_partial(s, uid, structure, wanted));
    co_return std::optional<std::string>(std::move(bytes));
}

} // namespace mailsync::imap
