/*

qname.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

namespace xmppxx::xml
{

/**
Qualified XML name: namespace URI plus local name.

Prefixes are resolved by the parser and never stored. Two names are equal iff both
fields are equal.
**/
struct qname
{
    std::string ns;
    std::string local;

    [[nodiscard]] bool matches(std::string_view other_ns, std::string_view other_local) const noexcept
    {
        return ns == other_ns && local == other_local;
    }

    friend bool operator==(const qname&, const qname&) = default;
};

/// Namespace declaration; an empty prefix stands for the default namespace.
struct namespace_decl
{
    std::string prefix;
    std::string uri;

    friend bool operator==(const namespace_decl&, const namespace_decl&) = default;
};

/// Diagnostic rendering in Clark notation, `{ns}local`.
[[nodiscard]] inline std::string to_string(const qname& name)
{
    std::string out;
    out.reserve(name.ns.size() + name.local.size() + 2);
    out += '{';
    out += name.ns;
    out += '}';
    out += name.local;
    return out;
}

} // namespace xmppxx::xml
