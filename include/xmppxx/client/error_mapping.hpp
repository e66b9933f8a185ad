/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Diagnostic details attached to negotiation and session errors.

*/

#pragma once

#include <string_view>
#include <xmppxx/detail/error_detail.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/stanza/types.hpp>
#include <xmppxx/xml/qname.hpp>

namespace xmppxx
{

[[nodiscard]] inline detail::error_detail make_xmpp_detail(std::string_view step, std::string_view state = {})
{
    detail::error_detail detail;
    detail.add("proto", "XMPP");
    detail.add("step", step);
    if (!state.empty())
        detail.add("state", state);
    return detail;
}

[[nodiscard]] inline detail::error_detail make_xmpp_detail(std::string_view step, const xml::qname& element)
{
    auto detail = make_xmpp_detail(step);
    detail.add("namespace", element.ns);
    detail.add("local", element.local);
    return detail;
}

/// ProtocolError for an element that is valid XMPP but not expected at `step`.
[[nodiscard]] inline error_info unexpected_at(std::string_view step, const xml::qname& element)
{
    return make_error(errc::xmpp_unexpected_element,
        "unexpected XMPP element <" + element.local + "/> in namespace '" + element.ns + "'",
        make_xmpp_detail(step, element).str());
}

/// Stream level error sent by the server; the condition is part of the message.
[[nodiscard]] inline error_info stream_error_at(std::string_view step, const stream_error& err)
{
    auto detail = make_xmpp_detail(step, err.condition);
    detail.add("text", err.text);
    std::string message = "stream error: " + (err.condition.local.empty() ? std::string("undefined-condition") : err.condition.local);
    return make_error(errc::xmpp_stream_error, std::move(message), detail.str());
}

} // namespace xmppxx
