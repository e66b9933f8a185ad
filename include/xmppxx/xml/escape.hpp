/*

escape.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace xmppxx::xml
{

/// Written in place of bytes that cannot appear in an XML 1.0 document.
inline constexpr std::string_view REPLACEMENT_CHAR{"\xEF\xBF\xBD"};

/**
Length of the UTF-8 sequence starting at `pos` when it encodes a character allowed by
XML 1.0, zero otherwise. Tab, line feed and carriage return count as allowed.
**/
[[nodiscard]] inline std::size_t valid_char_length(std::string_view text, std::size_t pos) noexcept
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80)
        return lead >= 0x20 || lead == '\t' || lead == '\n' || lead == '\r' ? 1 : 0;

    std::size_t len = 0;
    std::uint32_t cp = 0;
    if ((lead & 0xE0) == 0xC0)
    {
        len = 2;
        cp = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        len = 3;
        cp = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        len = 4;
        cp = lead & 0x07;
    }
    else
        return 0;

    if (pos + len > text.size())
        return 0;
    for (std::size_t i = 1; i < len; ++i)
    {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (cont & 0x3F);
    }

    static constexpr std::uint32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_length[len] || cp > 0x10FFFF)
        return 0;
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp == 0xFFFE || cp == 0xFFFF)
        return 0;
    return len;
}

inline void escape_impl(std::string& out, std::string_view text, bool attribute)
{
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const std::size_t len = valid_char_length(text, pos);
        if (len == 0)
        {
            out += REPLACEMENT_CHAR;
            ++pos;
            continue;
        }
        if (len > 1)
        {
            out.append(text.substr(pos, len));
            pos += len;
            continue;
        }

        const char ch = text[pos++];
        switch (ch)
        {
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            case '&': out += "&amp;"; break;
            // Parsers turn a literal CR into LF, and whitespace in attributes into spaces.
            case '\r': out += "&#xD;"; break;
            case '\n': out += attribute ? "&#xA;" : "\n"; break;
            case '\t': out += attribute ? "&#x9;" : "\t"; break;
            default: out += ch; break;
        }
    }
}

/**
Appends `text` escaped for character data.

The five special characters become entity references and carriage returns a character
reference. Bytes that are not valid UTF-8, or encode a character XML forbids, are
replaced with U+FFFD.
**/
inline void escape_to(std::string& out, std::string_view text)
{
    escape_impl(out, text, false);
}

/// Same as `escape_to`, also protecting tab and line feed from attribute value normalization.
inline void escape_attr_to(std::string& out, std::string_view text)
{
    escape_impl(out, text, true);
}

[[nodiscard]] inline std::string escape(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    escape_to(out, text);
    return out;
}

[[nodiscard]] inline std::string escape_attr(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    escape_attr_to(out, text);
    return out;
}

} // namespace xmppxx::xml
