#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace mailsync
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_toupper(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_toupper(a[i]) != ascii_toupper(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
    {
        if (text.size() < prefix.size())
            return false;
        return iequals_ascii(text.substr(0, prefix.size()), prefix);
    }

    [[nodiscard]] inline std::string to_upper_ascii(std::string_view input)
    {
        std::string out;
        out.reserve(input.size());
        for (char ch : input)
            out.push_back(ascii_toupper(ch));
        return out;
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        auto is_space = [](char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };

        while (!sv.empty() && is_space(sv.front()))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(sv.back()))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline bool parse_uint64(std::string_view token, std::uint64_t& out) noexcept
    {
        if (token.empty())
            return false;
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size())
            return false;
        out = value;
        return true;
    }
} // namespace detail
} // namespace mailsync
