/*

imap/reply.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Structural model of server replies: literal unfolding, logical line framing
and the nested tree produced for every untagged or tagged line.

*/


#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/ascii.hpp>
#include <mailsync/detail/result.hpp>

namespace mailsync::imap
{

enum class status
{
    ok,
    no,
    bad,
    preauth,
    bye,
    unknown
};

[[nodiscard]] inline status parse_status_word(std::string_view word) noexcept
{
    if (detail::iequals_ascii(word, "OK"))
        return status::ok;
    if (detail::iequals_ascii(word, "NO"))
        return status::no;
    if (detail::iequals_ascii(word, "BAD"))
        return status::bad;
    if (detail::iequals_ascii(word, "PREAUTH"))
        return status::preauth;
    if (detail::iequals_ascii(word, "BYE"))
        return status::bye;
    return status::unknown;
}

[[nodiscard]] constexpr std::string_view to_string(status st) noexcept
{
    switch (st)
    {
        case status::ok: return "OK";
        case status::no: return "NO";
        case status::bad: return "BAD";
        case status::preauth: return "PREAUTH";
        case status::bye: return "BYE";
        case status::unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, status st)
{
    return os << to_string(st);
}

struct reply_node;

/// Bare or quoted string. Quoted strings are stored unescaped.
struct reply_atom
{
    std::string text;
    bool quoted = false;
};

/// Bracketed response code, e.g. [UIDNEXT 42], split on whitespace.
struct reply_attrs
{
    std::vector<std::string> items;
};

/// Parenthesized list.
struct reply_list
{
    std::vector<reply_node> items;
};

struct reply_node
{
    std::variant<reply_atom, reply_attrs, reply_list> value;

    [[nodiscard]] const reply_atom* atom() const noexcept
    {
        return std::get_if<reply_atom>(&value);
    }

    [[nodiscard]] const reply_attrs* attrs() const noexcept
    {
        return std::get_if<reply_attrs>(&value);
    }

    [[nodiscard]] const reply_list* list() const noexcept
    {
        return std::get_if<reply_list>(&value);
    }

    /// Text of an atom, empty for anything else.
    [[nodiscard]] std::string_view text() const noexcept
    {
        const reply_atom* a = atom();
        return a == nullptr ? std::string_view{} : std::string_view(a->text);
    }

    [[nodiscard]] bool is_nil() const noexcept
    {
        const reply_atom* a = atom();
        return a != nullptr && !a->quoted && detail::iequals_ascii(a->text, "NIL");
    }
};

/// One parsed logical line.
using reply_tree = reply_list;

namespace reply_detail
{

class parser
{
public:
    explicit parser(std::string_view input) noexcept
        : in_(input)
    {
    }

    result<reply_list> run()
    {
        return sequence('\0');
    }

private:
    static bool is_space(char ch) noexcept
    {
        return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
    }

    result<reply_list> sequence(char closer)
    {
        reply_list out;
        for (;;)
        {
            while (pos_ < in_.size() && is_space(in_[pos_]))
                ++pos_;
            if (pos_ >= in_.size())
            {
                if (closer != '\0')
                    return fail<reply_list>(errc::imap_parse_error, "Unterminated list in reply.", std::string(in_));
                return out;
            }

            const char ch = in_[pos_];
            if (ch == closer)
            {
                ++pos_;
                return out;
            }
            if (ch == ')')
                return fail<reply_list>(errc::imap_parse_error, "Unbalanced parenthesis in reply.", std::string(in_));

            if (ch == '(')
            {
                ++pos_;
                reply_list nested;
                MAILSYNC_TRY_ASSIGN(nested, sequence(')'));
                out.items.push_back(reply_node{std::move(nested)});
            }
            else if (ch == '[')
            {
                reply_attrs attrs;
                MAILSYNC_TRY_ASSIGN(attrs, bracket());
                out.items.push_back(reply_node{std::move(attrs)});
            }
            else if (ch == '"')
            {
                reply_atom quoted;
                MAILSYNC_TRY_ASSIGN(quoted, quoted_string());
                out.items.push_back(reply_node{std::move(quoted)});
            }
            else
            {
                out.items.push_back(reply_node{bare_atom()});
            }
        }
    }

    result<reply_attrs> bracket()
    {
        const std::size_t open = pos_;
        int depth = 0;
        bool in_quote = false;
        for (; pos_ < in_.size(); ++pos_)
        {
            const char ch = in_[pos_];
            if (in_quote)
            {
                if (ch == '\\')
                    ++pos_;
                else if (ch == '"')
                    in_quote = false;
                continue;
            }
            if (ch == '"')
                in_quote = true;
            else if (ch == '[')
                ++depth;
            else if (ch == ']' && --depth == 0)
                break;
        }
        if (pos_ >= in_.size())
            return fail<reply_attrs>(errc::imap_parse_error, "Unterminated response code in reply.", std::string(in_));

        std::string_view inner = in_.substr(open + 1, pos_ - open - 1);
        ++pos_;

        reply_attrs out;
        while (!inner.empty())
        {
            while (!inner.empty() && is_space(inner.front()))
                inner.remove_prefix(1);
            std::size_t end = 0;
            while (end < inner.size() && !is_space(inner[end]))
                ++end;
            if (end > 0)
                out.items.emplace_back(inner.substr(0, end));
            inner.remove_prefix(end);
        }
        return out;
    }

    result<reply_atom> quoted_string()
    {
        reply_atom out;
        out.quoted = true;
        ++pos_;
        while (pos_ < in_.size())
        {
            const char ch = in_[pos_++];
            if (ch == '"')
                return out;
            if (ch == '\\' && pos_ < in_.size())
            {
                out.text.push_back(in_[pos_++]);
                continue;
            }
            out.text.push_back(ch);
        }
        return fail<reply_atom>(errc::imap_parse_error, "Unterminated quoted string in reply.", std::string(in_));
    }

    // Runs to the next space or parenthesis; a bracketed section such as
    // BODY[HEADER.FIELDS (FROM)] stays part of the atom.
    reply_atom bare_atom()
    {
        reply_atom out;
        int depth = 0;
        while (pos_ < in_.size())
        {
            const char ch = in_[pos_];
            if (depth == 0 && (is_space(ch) || ch == '(' || ch == ')'))
                break;
            if (ch == '[')
                ++depth;
            else if (ch == ']' && depth > 0)
                --depth;
            out.text.push_back(ch);
            ++pos_;
        }
        return out;
    }

    std::string_view in_;
    std::size_t pos_ = 0;
};

inline void append_quoted(std::string& out, std::string_view bytes)
{
    out.push_back('"');
    for (char ch : bytes)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
}

} // namespace reply_detail

/**
Parse one logical line (literals already unfolded) into a tree.

`[` opens a response code split on whitespace, `(` a nested list, `"` a quoted string;
anything else is an atom running to the next space.
**/
[[nodiscard]] inline result<reply_tree> parse_reply(std::string_view line)
{
    return reply_detail::parser(line).run();
}

/**
Checks whether a line (without its terminator) announces a literal, i.e. ends with {N} or {N+}.

@param line Line to check.
@param size Announced byte count, set on success.
@return     True if the line ends with a literal announcement.
**/
[[nodiscard]] inline bool literal_size_at_end(std::string_view line, std::size_t& size) noexcept
{
    if (line.size() < 3 || line.back() != '}')
        return false;
    const auto brace = line.rfind('{');
    if (brace == std::string_view::npos)
        return false;
    std::string_view inner = line.substr(brace + 1, line.size() - brace - 2);
    if (!inner.empty() && inner.back() == '+')
        inner.remove_suffix(1);
    std::uint64_t value = 0;
    if (!detail::parse_uint64(inner, value))
        return false;
    size = static_cast<std::size_t>(value);
    return true;
}

/**
Replace every literal announcement and the bytes that follow it by an equivalent quoted string.

A literal is `{N}` (or `{N+}`) at the end of a line; the N bytes after that line break are its content
and may contain anything, line breaks and NULs included.

@return The rewritten buffer, or imap_parse_error if a literal is cut short.
**/
[[nodiscard]] inline result<std::string> unfold_literals(std::string_view buffer)
{
    std::string out;
    out.reserve(buffer.size() + 16);
    bool in_quote = false;
    std::size_t i = 0;
    while (i < buffer.size())
    {
        const char ch = buffer[i];
        if (ch == '\n')
        {
            in_quote = false;
            out.push_back(ch);
            ++i;
            continue;
        }
        if (in_quote)
        {
            out.push_back(ch);
            if (ch == '\\' && i + 1 < buffer.size() && buffer[i + 1] != '\n')
            {
                out.push_back(buffer[i + 1]);
                i += 2;
                continue;
            }
            if (ch == '"')
                in_quote = false;
            ++i;
            continue;
        }
        if (ch == '"')
        {
            in_quote = true;
            out.push_back(ch);
            ++i;
            continue;
        }
        if (ch == '{')
        {
            std::size_t j = i + 1;
            while (j < buffer.size() && buffer[j] >= '0' && buffer[j] <= '9')
                ++j;
            const std::string_view digits = buffer.substr(i + 1, j - i - 1);
            if (j < buffer.size() && buffer[j] == '+')
                ++j;
            std::size_t after = std::string_view::npos;
            if (!digits.empty() && j < buffer.size() && buffer[j] == '}')
            {
                if (buffer.substr(j + 1, 2) == "\r\n")
                    after = j + 3;
                else if (j + 1 < buffer.size() && buffer[j + 1] == '\n')
                    after = j + 2;
            }
            std::uint64_t size = 0;
            if (after != std::string_view::npos && detail::parse_uint64(digits, size))
            {
                if (buffer.size() - after < size)
                    return fail<std::string>(errc::imap_parse_error, "Truncated literal in reply.",
                        "literal.size=" + detail::uint_to_string(size));
                reply_detail::append_quoted(out, buffer.substr(after, static_cast<std::size_t>(size)));
                i = after + static_cast<std::size_t>(size);
                continue;
            }
        }
        out.push_back(ch);
        ++i;
    }
    return out;
}

/**
End of the logical line starting at `begin`: the offset just past its final line feed, skipping over
the content of any literal it announces. Returns npos while the line is not fully buffered.
**/
[[nodiscard]] inline std::size_t logical_line_end(std::string_view buffer, std::size_t begin) noexcept
{
    std::size_t pos = begin;
    for (;;)
    {
        const auto lf = buffer.find('\n', pos);
        if (lf == std::string_view::npos)
            return std::string_view::npos;
        std::string_view physical = buffer.substr(pos, lf - pos);
        if (!physical.empty() && physical.back() == '\r')
            physical.remove_suffix(1);
        std::size_t literal = 0;
        if (!literal_size_at_end(physical, literal))
            return lf + 1;
        if (buffer.size() - (lf + 1) < literal)
            return std::string_view::npos;
        pos = lf + 1 + literal;
    }
}

/// Start offsets of every complete logical line in the buffer.
[[nodiscard]] inline std::vector<std::size_t> logical_line_starts(std::string_view buffer)
{
    std::vector<std::size_t> starts;
    std::size_t pos = 0;
    while (pos < buffer.size())
    {
        const std::size_t end = logical_line_end(buffer, pos);
        if (end == std::string_view::npos)
            break;
        starts.push_back(pos);
        pos = end;
    }
    return starts;
}

/// Split an unfolded unit into lines; line breaks inside quoted strings do not count.
[[nodiscard]] inline std::vector<std::string_view> split_logical_lines(std::string_view unfolded)
{
    std::vector<std::string_view> lines;
    bool in_quote = false;
    std::size_t start = 0;
    for (std::size_t i = 0; i < unfolded.size(); ++i)
    {
        const char ch = unfolded[i];
        if (in_quote)
        {
            if (ch == '\\')
                ++i;
            else if (ch == '"')
                in_quote = false;
            continue;
        }
        if (ch == '"')
        {
            in_quote = true;
        }
        else if (ch == '\n')
        {
            std::string_view line = unfolded.substr(start, i - start);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            lines.push_back(line);
            start = i + 1;
        }
    }
    if (start < unfolded.size())
        lines.push_back(unfolded.substr(start));
    return lines;
}

/// Tagged completion line: "<tag> OK|NO|BAD text".
struct tagged_completion
{
    std::uint64_t tag = 0;
    status st = status::unknown;
    std::string_view text;
};

/// Recognize a tagged completion line. Tags are the numeric ones this client issues.
[[nodiscard]] inline std::optional<tagged_completion> parse_tagged_line(std::string_view line) noexcept
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);
    const auto sp = line.find(' ');
    if (sp == std::string_view::npos || sp == 0)
        return std::nullopt;

    tagged_completion out;
    if (!detail::parse_uint64(line.substr(0, sp), out.tag))
        return std::nullopt;

    std::string_view rest = line.substr(sp + 1);
    const auto sp2 = rest.find(' ');
    out.st = parse_status_word(rest.substr(0, sp2));
    if (out.st != status::ok && out.st != status::no && out.st != status::bad)
        return std::nullopt;
    out.text = sp2 == std::string_view::npos ? std::string_view{} : detail::trim_view(rest.substr(sp2 + 1));
    return out;
}

/**
Offset where the last response unit of a buffer begins.

The buffer must end right after a tagged completion line. The unit is that line plus every untagged (`*`)
logical line directly before it; the walk stops at the first line that is not untagged.
**/
[[nodiscard]] inline std::size_t isolate_last_response_unit(std::string_view buffer)
{
    const auto starts = logical_line_starts(buffer);
    if (starts.empty())
        return 0;
    std::size_t i = starts.size() - 1;
    while (i > 0 && buffer[starts[i - 1]] == '*')
        --i;
    return starts[i];
}

// ==================== Tree accessors ====================

/// Value following the atom `name` in a key/value list such as FETCH data.
[[nodiscard]] inline const reply_node* find_item(const reply_list& list, std::string_view name) noexcept
{
    for (std::size_t i = 0; i + 1 < list.items.size(); ++i)
    {
        const reply_atom* key = list.items[i].atom();
        if (key != nullptr && !key->quoted && detail::iequals_ascii(key->text, name))
            return &list.items[i + 1];
    }
    return nullptr;
}

[[nodiscard]] inline std::optional<std::uint64_t> number_of(const reply_node* node) noexcept
{
    if (node == nullptr)
        return std::nullopt;
    std::uint64_t value = 0;
    if (!detail::parse_uint64(node->text(), value))
        return std::nullopt;
    return value;
}

/// Data list of "* n FETCH (...)", or nullptr.
[[nodiscard]] inline const reply_list* fetch_data(const reply_tree& line) noexcept
{
    if (line.items.size() < 4 || line.items[0].text() != "*")
        return nullptr;
    if (!detail::iequals_ascii(line.items[2].text(), "FETCH"))
        return nullptr;
    return line.items[3].list();
}

/// Number in "* n KEYWORD", e.g. EXISTS or RECENT.
[[nodiscard]] inline std::optional<std::uint64_t> untagged_number(const reply_tree& line, std::string_view keyword) noexcept
{
    if (line.items.size() < 3 || line.items[0].text() != "*")
        return std::nullopt;
    if (!detail::iequals_ascii(line.items[2].text(), keyword))
        return std::nullopt;
    return number_of(&line.items[1]);
}

/// Whether a line is "* KEYWORD ...".
[[nodiscard]] inline bool is_untagged(const reply_tree& line, std::string_view keyword) noexcept
{
    return line.items.size() >= 2 && line.items[0].text() == "*"
        && detail::iequals_ascii(line.items[1].text(), keyword);
}

/// Response code following the status word, as in "* OK [UIDNEXT 5] text" or "3 OK [READ-WRITE] done".
[[nodiscard]] inline const reply_attrs* response_code(const reply_tree& line) noexcept
{
    if (line.items.size() < 3)
        return nullptr;
    return line.items[2].attrs();
}

/// Strip the list parentheses that whitespace splitting leaves on response code items.
[[nodiscard]] inline std::vector<std::string> unparen_items(const std::vector<std::string>& items, std::size_t first)
{
    std::vector<std::string> out;
    for (std::size_t i = first; i < items.size(); ++i)
    {
        std::string_view item = items[i];
        while (!item.empty() && item.front() == '(')
            item.remove_prefix(1);
        while (!item.empty() && item.back() == ')')
            item.remove_suffix(1);
        if (!item.empty())
            out.emplace_back(item);
    }
    return out;
}

} // namespace mailsync::imap
