/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for xmppxx.
Supports log levels, an optional callback sink and XML stream tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace xmppxx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Stream-level tracing (very verbose)
    debug = 1,   ///< Negotiation steps and dropped stanzas
    info = 2,
    warn = 3,    ///< Non-fatal issues such as cleartext authentication
    error = 4,
    off = 5      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,
    receive
};

/// Log entry passed to callbacks
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
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

/// Per session protocol trace receiver: protocol name, direction and the bytes as exchanged.
using trace_sink_t = std::function<void(std::string_view protocol, direction dir, std::string_view data)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
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

    /// Replaces the default stderr output.
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

    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
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

    static void default_output(const entry& e)
    {
        const auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::ostringstream line;
        line << '[' << std::setfill('0')
             << std::setw(2) << tm_buf.tm_hour << ':'
             << std::setw(2) << tm_buf.tm_min << ':'
             << std::setw(2) << tm_buf.tm_sec << '.'
             << std::setw(3) << ms.count() << "] ";

        if (e.trace_info)
        {
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            line << e.trace_info->protocol << ' ' << dir_str << ' ' << sanitize_trace(e.trace_info->data);
        }
        else
        {
            line << '[' << level_to_string(e.lvl) << "] " << e.message;
        }
        line << '\n';
        std::cerr << line.str();
    }

    /// Truncates long chunks and masks control characters.
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 1000;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (auto& c : result)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n' && c != '\t')
                c = '.';
        }

        while (!result.empty() && (result.back() == '\r' || result.back() == '\n'))
            result.pop_back();

        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

#define XMPPXX_LOG(lvl, msg) \
    ::xmppxx::log::logger::instance().log(lvl, msg, std::source_location::current())

#define XMPPXX_DEBUG(msg)  XMPPXX_LOG(::xmppxx::log::level::debug, msg)
#define XMPPXX_INFO(msg)   XMPPXX_LOG(::xmppxx::log::level::info, msg)
#define XMPPXX_WARN(msg)   XMPPXX_LOG(::xmppxx::log::level::warn, msg)
#define XMPPXX_ERROR(msg)  XMPPXX_LOG(::xmppxx::log::level::error, msg)

#define XMPPXX_TRACE_SEND(protocol, data) \
    ::xmppxx::log::logger::instance().trace_protocol(protocol, ::xmppxx::log::direction::send, data)

#define XMPPXX_TRACE_RECV(protocol, data) \
    ::xmppxx::log::logger::instance().trace_protocol(protocol, ::xmppxx::log::direction::receive, data)

} // namespace xmppxx::log
