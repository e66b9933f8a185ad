/*

sasl.hpp
--------

SASL helpers for xmppxx: mechanism selection and PLAIN encoding.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <xmppxx/codec/base64.hpp>
#include <xmppxx/detail/result.hpp>

namespace xmppxx::sasl
{

enum class mechanism
{
    external,
    plain
};

[[nodiscard]] constexpr std::string_view to_string(mechanism m) noexcept
{
    return m == mechanism::external ? "EXTERNAL" : "PLAIN";
}

/**
 * Choose the mechanism to authenticate with among those offered by the server.
 *
 * EXTERNAL wins when requested and offered; otherwise PLAIN is used when offered.
 * Names are compared exactly as registered with IANA.
 *
 * @param offered         Mechanism names in server order
 * @param prefer_external Whether the caller asked for EXTERNAL
 * @return The mechanism, or sasl_no_mechanism listing what was offered
 */
[[nodiscard]] inline result<mechanism> select_mechanism(const std::vector<std::string>& offered, bool prefer_external)
{
    bool has_plain = false;
    bool has_external = false;
    for (const auto& m : offered)
    {
        if (m == "PLAIN")
            has_plain = true;
        else if (m == "EXTERNAL")
            has_external = true;
    }

    if (prefer_external && has_external)
        return mechanism::external;
    if (has_plain)
        return mechanism::plain;

    std::string list;
    for (const auto& m : offered)
    {
        if (!list.empty())
            list += ',';
        list += m;
    }
    return fail<mechanism>(errc::sasl_no_mechanism,
        prefer_external ? "Server offers neither EXTERNAL nor PLAIN" : "Server does not offer PLAIN",
        "offered=" + list);
}

/**
 * Encode credentials for SASL PLAIN mechanism.
 * Format: \0username\0password (then base64 encoded)
 *
 * @param username Local part of the JID
 * @param password The password
 * @return Base64 encoded PLAIN credentials
 */
[[nodiscard]] inline std::string encode_plain(std::string_view username, std::string_view password)
{
    std::string plain;
    plain.reserve(2 + username.size() + password.size());
    plain.push_back('\0');
    plain += username;
    plain.push_back('\0');
    plain += password;
    return base64::encode(plain);
}

} // namespace xmppxx::sasl
