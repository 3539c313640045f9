/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process-wide logging for mailsync: severity levels, a replaceable sink, and per-server protocol
tracing of what goes over the wire.

*/

#pragma once

#include <atomic>
#include <cstddef>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <mailsync/detail/append.hpp>

namespace mailsync::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,     ///< Data sent to server
    receive   ///< Data received from server
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;
        /// Logical server the bytes belong to; empty for connections not tied to one.
        std::string server;
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Level from its name as written in configuration ("debug", "WARN", "warning", ...).
[[nodiscard]] inline std::optional<level> parse_level(std::string_view name) noexcept
{
    std::string lowered;
    for (char ch : name)
        lowered.push_back(ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch - 'A' + 'a') : ch);
    if (lowered == "trace") return level::trace;
    if (lowered == "debug") return level::debug;
    if (lowered == "info") return level::info;
    if (lowered == "warn" || lowered == "warning") return level::warn;
    if (lowered == "error") return level::error;
    if (lowered == "fatal") return level::fatal;
    if (lowered == "off" || lowered == "none") return level::off;
    return std::nullopt;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    /// Longest traced payload written by the default sink; FETCH literals can be megabytes.
    void set_trace_limit(std::size_t bytes) noexcept
    {
        trace_limit_.store(bytes, std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    void trace_protocol(std::string_view protocol, std::string_view server, direction dir, std::string_view data,
                        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .protocol = std::string(protocol),
                .server = std::string(server),
                .data = std::string(data)
            }
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    static std::string timestamp_prefix(std::chrono::system_clock::time_point tp)
    {
        const auto time = std::chrono::system_clock::to_time_t(tp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        std::string out = "[";
        detail::append_padded(out, static_cast<unsigned>(tm_buf.tm_hour), 2);
        out.push_back(':');
        detail::append_padded(out, static_cast<unsigned>(tm_buf.tm_min), 2);
        out.push_back(':');
        detail::append_padded(out, static_cast<unsigned>(tm_buf.tm_sec), 2);
        out.push_back('.');
        detail::append_padded(out, static_cast<unsigned>(ms.count()), 3);
        out += "] ";
        return out;
    }

    void default_output(const entry& e)
    {
        std::string line = timestamp_prefix(e.timestamp);
        if (e.trace_info)
        {
            line += e.trace_info->protocol;
            if (!e.trace_info->server.empty())
            {
                line.push_back(' ');
                line += e.trace_info->server;
            }
            line += (e.trace_info->dir == direction::send) ? " >>> " : " <<< ";
            line += sanitize_trace(e.trace_info->data, trace_limit_.load(std::memory_order_relaxed));
        }
        else
        {
            line.push_back('[');
            line += level_to_string(e.lvl);
            line += "] ";
            line += e.message;
        }
        line.push_back('\n');
        std::cerr << line;
    }

    /// Truncate long payloads and mask control characters other than CR/LF.
    [[nodiscard]] static std::string sanitize_trace(std::string_view data, std::size_t limit)
    {
        std::string result(data.substr(0, limit));
        if (data.size() > limit)
        {
            result += "... [";
            detail::append_uint(result, data.size() - limit);
            result += " bytes truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
                c = '.';
        }

        while (!result.empty() && (result.back() == '\r' || result.back() == '\n'))
            result.pop_back();

        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::atomic<std::size_t> trace_limit_{500};
    std::mutex mutex_;
    callback_t callback_;
};

#define MAILSYNC_LOG(lvl, msg) \
    ::mailsync::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MAILSYNC_TRACE(msg)  MAILSYNC_LOG(::mailsync::log::level::trace, msg)
#define MAILSYNC_DEBUG(msg)  MAILSYNC_LOG(::mailsync::log::level::debug, msg)
#define MAILSYNC_INFO(msg)   MAILSYNC_LOG(::mailsync::log::level::info, msg)
#define MAILSYNC_WARN(msg)   MAILSYNC_LOG(::mailsync::log::level::warn, msg)
#define MAILSYNC_ERROR(msg)  MAILSYNC_LOG(::mailsync::log::level::error, msg)

} // namespace mailsync::log
