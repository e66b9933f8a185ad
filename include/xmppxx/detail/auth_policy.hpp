/*

auth_policy.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <xmppxx/detail/log.hpp>
#include <xmppxx/detail/result.hpp>

namespace xmppxx::detail
{

/**
Checks whether credentials may be sent on the current transport.

@param is_tls  Whether the transport is encrypted.
@param options Any type with `require_tls_for_auth` and `allow_cleartext_auth` flags.
@param code    Error code returned on refusal.
**/
template <typename Options>
[[nodiscard]] inline xmppxx::result<void> ensure_auth_allowed(bool is_tls, const Options& options, errc code)
{
    if (is_tls || !options.require_tls_for_auth)
        return xmppxx::ok();
    if (options.allow_cleartext_auth)
    {
        XMPPXX_WARN("SASL authentication without TLS allowed by configuration.");
        return xmppxx::ok();
    }
    return xmppxx::fail<void>(
        code,
        "TLS required for authentication; use STARTTLS, tls_mode::implicit or set allow_cleartext_auth");
}

} // namespace xmppxx::detail
