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

inline void append_sv(std::string& out, std::string_view sv)
{
    out.append(sv.data(), sv.size());
}

inline void append_char(std::string& out, char ch)
{
    out.push_back(ch);
}

inline void append_space(std::string& out)
{
    append_char(out, ' ');
}

inline void append_uint(std::string& out, std::uint64_t value)
{
    char buffer[20];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc())
        return;
    out.append(buffer, static_cast<std::size_t>(result.ptr - buffer));
}

[[nodiscard]] inline std::string uint_to_string(std::uint64_t value)
{
    std::string out;
    append_uint(out, value);
    return out;
}

/// Zero-padded decimal, used for timestamps in log lines.
inline void append_padded(std::string& out, unsigned value, std::size_t width)
{
    std::string digits = uint_to_string(value);
    if (digits.size() < width)
        out.append(width - digits.size(), '0');
    out += digits;
}

} // namespace detail
} // namespace mailsync
