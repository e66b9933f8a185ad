/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <xmppxx/detail/error_detail.hpp>
#include <xmppxx/detail/log.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/net/tls_options.hpp>

namespace xmppxx
{

/// What to do when the server advertises `<starttls/>`.
enum class starttls_policy
{
    none,           ///< Never upgrade in band.
    opportunistic,  ///< Upgrade when offered and a TLS context was given.
    required        ///< Fail unless the stream ends up encrypted.
};

struct presence_options
{
    std::string show = "chat";
    std::string status = "Online";
};

/// Default upper bound for a single incoming stanza.
inline constexpr std::size_t DEFAULT_MAX_STANZA_SIZE = 1024 * 1024;

/**
Per client configuration, copied at construction.
**/
struct options
{
    /// Bare JID `local@domain`.
    std::string jid;
    std::string password;
    /// Requested resource; the server picks one when empty.
    std::string resource;
    /// Prefer SASL EXTERNAL, relying on an identity the transport already established.
    bool auth_external = false;
    bool require_tls_for_auth = true;
    bool allow_cleartext_auth = false;
    starttls_policy starttls = starttls_policy::opportunistic;
    net::tls_options tls;
    /// Establish an RFC 3921 session when the server advertises it.
    bool session = true;
    presence_options initial_presence;
    std::optional<std::chrono::steady_clock::duration> timeout = std::nullopt;
    std::size_t max_stanza_size = DEFAULT_MAX_STANZA_SIZE;
    bool redact_secrets_in_trace = true;
    /// Receives the protocol trace of this client only; traces go to the global logger when unset.
    log::trace_sink_t trace;
};

struct jid_parts
{
    std::string local;
    std::string domain;
};

/**
Splitting a bare JID on its first `@`.

@param jid Identifier of the form `local@domain`.
@return    Local part and domain, or `config_invalid_jid` when there is no `@`.
**/
[[nodiscard]] inline result<jid_parts> split_jid(std::string_view jid)
{
    const auto at = jid.find('@');
    if (at == std::string_view::npos)
    {
        detail::error_detail detail;
        detail.add("jid", jid);
        return fail<jid_parts>(errc::config_invalid_jid, "JID must be of the form local@domain.", detail);
    }
    return jid_parts{std::string(jid.substr(0, at)), std::string(jid.substr(at + 1))};
}

} // namespace xmppxx
