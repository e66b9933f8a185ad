/*

namespaces.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string_view>

namespace xmppxx::ns
{

// RFC 3920 appendix C and RFC 3921 appendix B.
inline constexpr std::string_view stream = "http://etherx.jabber.org/streams";
inline constexpr std::string_view tls = "urn:ietf:params:xml:ns:xmpp-tls";
inline constexpr std::string_view sasl = "urn:ietf:params:xml:ns:xmpp-sasl";
inline constexpr std::string_view bind = "urn:ietf:params:xml:ns:xmpp-bind";
inline constexpr std::string_view session = "urn:ietf:params:xml:ns:xmpp-session";
inline constexpr std::string_view client = "jabber:client";
inline constexpr std::string_view streams_error = "urn:ietf:params:xml:ns:xmpp-streams";
inline constexpr std::string_view stanzas_error = "urn:ietf:params:xml:ns:xmpp-stanzas";
inline constexpr std::string_view xml = "http://www.w3.org/XML/1998/namespace";

} // namespace xmppxx::ns
