#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <mailsync/detail/ascii.hpp>

namespace mailsync::detail
{

/// Length of the IMAP astring starting at text[0]: a quoted string with escapes, or a run up to a space.
[[nodiscard]] inline std::size_t astring_length(std::string_view text) noexcept
{
    if (text.empty())
        return 0;
    if (text.front() != '"')
    {
        const auto pos = text.find(' ');
        return pos == std::string_view::npos ? text.size() : pos;
    }
    std::size_t i = 1;
    while (i < text.size())
    {
        if (text[i] == '\\' && i + 1 < text.size())
        {
            i += 2;
            continue;
        }
        if (text[i] == '"')
            return i + 1;
        ++i;
    }
    return text.size();
}

[[nodiscard]] inline bool looks_like_sasl_blob(std::string_view token) noexcept
{
    if (token.size() < 12)
        return false;
    for (char ch : token)
    {
        const bool b64 = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z')
            || (ch >= '0' && ch <= '9') || ch == '+' || ch == '/' || ch == '=';
        if (!b64)
            return false;
    }
    return true;
}

/**
Hide secrets in an IMAP command line before it reaches a trace sink or an error detail.

    a1 LOGIN user pass          -> a1 LOGIN user <redacted>
    a2 AUTHENTICATE PLAIN AGZv  -> a2 AUTHENTICATE PLAIN <redacted>
    dXNlcjpwYXNzd29yZA==        -> <redacted>   (SASL continuation)

Line terminators are preserved.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    std::string_view body = line;
    while (!body.empty() && (body.back() == '\r' || body.back() == '\n'))
        body.remove_suffix(1);
    const std::string_view terminator = line.substr(body.size());

    auto rebuild = [&](std::size_t keep) {
        std::string out(body.substr(0, keep));
        out += "<redacted>";
        out.append(terminator.data(), terminator.size());
        return out;
    };

    if (body.find(' ') == std::string_view::npos && looks_like_sasl_blob(body))
        return rebuild(0);

    // Walk: tag, verb, then verb-specific arguments.
    std::size_t pos = 0;
    auto skip_spaces = [&] {
        while (pos < body.size() && body[pos] == ' ')
            ++pos;
    };
    auto next_word = [&]() -> std::string_view {
        skip_spaces();
        const std::size_t len = astring_length(body.substr(pos));
        std::string_view word = body.substr(pos, len);
        pos += len;
        return word;
    };

    next_word();
    const std::string_view verb = next_word();
    if (iequals_ascii(verb, "LOGIN"))
    {
        next_word();
        skip_spaces();
        if (pos < body.size())
            return rebuild(pos);
    }
    else if (iequals_ascii(verb, "AUTHENTICATE"))
    {
        next_word();
        skip_spaces();
        if (pos < body.size())
            return rebuild(pos);
    }
    return std::string(line);
}

} // namespace mailsync::detail
