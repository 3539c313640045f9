/*

error_detail.hpp
----------------

Header-only helper to build structured error_info::detail strings.

Each entry is formatted as key=value\n to ease parsing and redaction.

*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/redact.hpp>

namespace mailsync::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        append_sv(out_, value);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t value)
    {
        append_key(key);
        append_uint(out_, value);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        append_key(key);
        append_uint(out_, static_cast<std::uint64_t>(ec.value() < 0 ? -ec.value() : ec.value()));
        const std::string msg = ec.message();
        if (!msg.empty())
        {
            out_.push_back(' ');
            out_.append(msg);
        }
        out_.push_back('\n');
        return *this;
    }

    /// Adds a protocol line, hiding LOGIN/AUTHENTICATE secrets when asked to.
    error_detail& add_line(std::string_view key, std::string_view line, bool redact)
    {
        if (redact)
            return add(key, redact_line(line));
        return add(key, line);
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return out_.empty();
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        append_sv(out_, key);
        out_.push_back('=');
    }
};

} // namespace mailsync::detail
