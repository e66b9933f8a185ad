/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Builds structured error_info::detail strings. Each entry is formatted as
key=value\n to ease parsing and redaction.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace xmppxx::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        append_value(value);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t v)
    {
        append_key(key);
        append_int(v);
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_ec(std::string_view key, std::error_code ec)
    {
        append_key(key);
        append_int(static_cast<std::uint64_t>(ec.value() < 0 ? -ec.value() : ec.value()));
        const std::string msg = ec.message();
        if (!msg.empty())
        {
            out_.push_back(' ');
            append_value(msg);
        }
        out_.push_back('\n');
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return out_.empty();
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }

    // Values stay on one line so every entry remains a single key=value record.
    void append_value(std::string_view value)
    {
        for (char c : value)
            out_.push_back(c == '\n' || c == '\r' ? ' ' : c);
    }

    void append_int(std::uint64_t v)
    {
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
    }
};

} // namespace xmppxx::detail
