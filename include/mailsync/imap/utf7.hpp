/*

imap/utf7.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/detail/result.hpp>

namespace mailsync::imap
{

namespace utf7_detail
{

inline constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+,";

inline int base64_value(char ch) noexcept
{
    if (ch >= 'A' && ch <= 'Z')
        return ch - 'A';
    if (ch >= 'a' && ch <= 'z')
        return ch - 'a' + 26;
    if (ch >= '0' && ch <= '9')
        return ch - '0' + 52;
    if (ch == '+')
        return 62;
    if (ch == ',')
        return 63;
    return -1;
}

/// Next code point of a UTF-8 string; false on malformed or overlong input.
inline bool next_code_point(std::string_view text, std::size_t& index, std::uint32_t& cp) noexcept
{
    const auto b0 = static_cast<unsigned char>(text[index]);
    std::size_t extra = 0;
    std::uint32_t min = 0;
    if (b0 < 0x80)
    {
        cp = b0;
        index += 1;
        return true;
    }
    if ((b0 >> 5) == 0x6)
    {
        extra = 1;
        cp = b0 & 0x1F;
        min = 0x80;
    }
    else if ((b0 >> 4) == 0xE)
    {
        extra = 2;
        cp = b0 & 0x0F;
        min = 0x800;
    }
    else if ((b0 >> 3) == 0x1E)
    {
        extra = 3;
        cp = b0 & 0x07;
        min = 0x10000;
    }
    else
    {
        return false;
    }

    if (index + extra >= text.size())
        return false;
    for (std::size_t k = 1; k <= extra; ++k)
    {
        const auto b = static_cast<unsigned char>(text[index + k]);
        if ((b & 0xC0) != 0x80)
            return false;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return false;
    index += extra + 1;
    return true;
}

inline void append_utf8(std::uint32_t cp, std::string& out)
{
    if (cp <= 0x7F)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// UTF-16 units packed big-endian into modified base64, 6 bits at a time.
inline void append_shifted(const std::vector<std::uint16_t>& units, std::string& out)
{
    std::uint32_t bits = 0;
    int count = 0;
    out.push_back('&');
    for (std::uint16_t unit : units)
    {
        bits = (bits << 16) | unit;
        count += 16;
        while (count >= 6)
        {
            count -= 6;
            out.push_back(alphabet[(bits >> count) & 0x3F]);
        }
        bits &= (1u << count) - 1;
    }
    if (count > 0)
        out.push_back(alphabet[(bits << (6 - count)) & 0x3F]);
    out.push_back('-');
}

} // namespace utf7_detail

/**
Encode a UTF-8 mailbox name in modified UTF-7 (RFC 3501 section 5.1.3).

@param utf8 Mailbox name.
@return     Encoded name, or codec_invalid_utf7 if the input is not valid UTF-8.
**/
[[nodiscard]] inline result<std::string> encode_modified_utf7(std::string_view utf8)
{
    std::string out;
    out.reserve(utf8.size());
    std::vector<std::uint16_t> pending;

    auto flush = [&]()
    {
        if (pending.empty())
            return;
        utf7_detail::append_shifted(pending, out);
        pending.clear();
    };

    std::size_t index = 0;
    while (index < utf8.size())
    {
        std::uint32_t cp = 0;
        if (!utf7_detail::next_code_point(utf8, index, cp))
            return fail<std::string>(errc::codec_invalid_utf7, "Mailbox name is not valid UTF-8.", std::string(utf8));

        if (cp >= 0x20 && cp <= 0x7E)
        {
            flush();
            if (cp == '&')
                out += "&-";
            else
                out.push_back(static_cast<char>(cp));
            continue;
        }

        if (cp <= 0xFFFF)
        {
            pending.push_back(static_cast<std::uint16_t>(cp));
        }
        else
        {
            const std::uint32_t v = cp - 0x10000;
            pending.push_back(static_cast<std::uint16_t>(0xD800 + (v >> 10)));
            pending.push_back(static_cast<std::uint16_t>(0xDC00 + (v & 0x3FF)));
        }
    }
    flush();
    return out;
}

/**
Decode a modified UTF-7 mailbox name into UTF-8.

@param mutf7 Name as sent by the server.
@return      UTF-8 name, or codec_invalid_utf7 on a malformed shift sequence.
**/
[[nodiscard]] inline result<std::string> decode_modified_utf7(std::string_view mutf7)
{
    auto invalid = [&]() { return fail<std::string>(errc::codec_invalid_utf7, "Invalid modified UTF-7.", std::string(mutf7)); };

    std::string out;
    out.reserve(mutf7.size());
    std::size_t i = 0;
    while (i < mutf7.size())
    {
        const char ch = mutf7[i];
        if (static_cast<unsigned char>(ch) & 0x80)
            return invalid();
        if (ch != '&')
        {
            out.push_back(ch);
            ++i;
            continue;
        }

        const auto end = mutf7.find('-', i + 1);
        if (end == std::string_view::npos)
            return invalid();
        if (end == i + 1)
        {
            out.push_back('&');
            i = end + 1;
            continue;
        }

        std::uint32_t bits = 0;
        int count = 0;
        std::uint32_t high_surrogate = 0;
        for (std::size_t k = i + 1; k < end; ++k)
        {
            const int value = utf7_detail::base64_value(mutf7[k]);
            if (value < 0)
                return invalid();
            bits = (bits << 6) | static_cast<std::uint32_t>(value);
            count += 6;
            if (count < 16)
                continue;
            count -= 16;
            const auto unit = static_cast<std::uint16_t>((bits >> count) & 0xFFFF);
            bits &= (1u << count) - 1;

            if (unit >= 0xD800 && unit <= 0xDBFF)
            {
                if (high_surrogate != 0)
                    return invalid();
                high_surrogate = unit;
            }
            else if (unit >= 0xDC00 && unit <= 0xDFFF)
            {
                if (high_surrogate == 0)
                    return invalid();
                utf7_detail::append_utf8(0x10000 + ((high_surrogate - 0xD800) << 10) + (unit - 0xDC00), out);
                high_surrogate = 0;
            }
            else
            {
                if (high_surrogate != 0)
                    return invalid();
                utf7_detail::append_utf8(unit, out);
            }
        }
        // Leftover bits must be zero padding shorter than one base64 digit.
        if (high_surrogate != 0 || count >= 6 || bits != 0)
            return invalid();
        i = end + 1;
    }
    return out;
}

} // namespace mailsync::imap
