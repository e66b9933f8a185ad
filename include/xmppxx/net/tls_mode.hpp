/*

tls_mode.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <ostream>
#include <string_view>

namespace xmppxx::net
{

/**
How client::connect secures the transport.

`starttls` upgrades in band after the first stream features, `implicit` performs the
TLS handshake right after the TCP connection (XEP-0368 style direct TLS).
**/
enum class tls_mode
{
    none,
    starttls,
    implicit
};

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "none";
        case tls_mode::starttls: return "starttls";
        case tls_mode::implicit: return "implicit";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, tls_mode mode)
{
    return os << to_string(mode);
}

} // namespace xmppxx::net
