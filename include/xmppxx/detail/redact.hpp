/*

redact.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Redaction of credentials in XMPP protocol traces and error details.

*/

#pragma once

#include <array>
#include <string>
#include <string_view>

namespace xmppxx::detail
{

[[nodiscard]] inline bool is_name_char(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')
        || ch == '-' || ch == '_' || ch == '.' || ch == ':';
}

/// Local part of a possibly prefixed tag name ("sasl:auth" -> "auth").
[[nodiscard]] inline std::string_view local_name(std::string_view name) noexcept
{
    const auto colon = name.rfind(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

/**
Replaces the character data of SASL <auth> and <response> elements with "<redacted>".

Works on partial chunks too: an opening tag without its closing tag redacts the rest
of the chunk. Self-closing elements and empty payloads are left untouched.
**/
[[nodiscard]] inline std::string redact_xml(std::string_view data)
{
    static constexpr std::array<std::string_view, 2> secret_elements{"auth", "response"};

    std::string out;
    out.reserve(data.size());
    std::size_t pos = 0;
    while (pos < data.size())
    {
        const auto lt = data.find('<', pos);
        if (lt == std::string_view::npos)
        {
            out.append(data.substr(pos));
            break;
        }
        out.append(data.substr(pos, lt - pos));

        std::size_t name_end = lt + 1;
        while (name_end < data.size() && is_name_char(data[name_end]))
            ++name_end;
        const std::string_view name = data.substr(lt + 1, name_end - lt - 1);
        const auto gt = data.find('>', name_end);

        bool secret = false;
        for (auto candidate : secret_elements)
            secret = secret || local_name(name) == candidate;

        if (!secret || gt == std::string_view::npos || data[gt - 1] == '/')
        {
            const auto stop = gt == std::string_view::npos ? data.size() : gt + 1;
            out.append(data.substr(lt, stop - lt));
            pos = stop;
            continue;
        }

        out.append(data.substr(lt, gt + 1 - lt));
        const auto close = data.find("</", gt + 1);
        const auto payload_end = close == std::string_view::npos ? data.size() : close;
        if (payload_end > gt + 1)
            out.append("<redacted>");
        pos = payload_end;
        if (close != std::string_view::npos)
        {
            const auto close_gt = data.find('>', close);
            const auto stop = close_gt == std::string_view::npos ? data.size() : close_gt + 1;
            out.append(data.substr(close, stop - close));
            pos = stop;
        }
    }
    return out;
}

} // namespace xmppxx::detail
