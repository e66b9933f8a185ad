/*

decoder.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Qualified name dispatch table and element decoders.

*/

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <xmppxx/detail/error_detail.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/stanza/namespaces.hpp>
#include <xmppxx/stanza/types.hpp>
#include <xmppxx/xml/element.hpp>

namespace xmppxx
{

namespace detail
{

[[nodiscard]] inline std::string lang_of(const xml::element& el)
{
    const auto* lang = el.attr(ns::xml, "lang");
    return lang != nullptr ? *lang : std::string();
}

[[nodiscard]] inline raw_element capture(const xml::element& el)
{
    return raw_element{el.name, el.inner_xml, el.namespaces};
}

/// First child that is not a `text` element of `text_ns`, used for error conditions.
[[nodiscard]] inline xml::qname condition_of(const xml::element& el, std::string_view text_ns)
{
    for (const auto& c : el.children)
    {
        if (!c.name.matches(text_ns, "text"))
            return c.name;
    }
    return {};
}

[[nodiscard]] inline std::string text_of(const xml::element& el, std::string_view text_ns)
{
    const auto* text = el.child(text_ns, "text");
    return text != nullptr ? text->text : std::string();
}

// Sets `field` from the first matching child; later duplicates stay unmodeled.
[[nodiscard]] inline bool take_text(const xml::element& child, std::string_view local, std::string& field, bool& seen)
{
    if (!child.name.matches(ns::client, local) || seen)
        return false;
    field = child.text;
    seen = true;
    return true;
}

[[nodiscard]] inline client_error decode_client_error_value(const xml::element& el)
{
    client_error out;
    out.code = el.attr_or_empty("code");
    out.type = el.attr_or_empty("type");
    out.condition = condition_of(el, ns::stanzas_error);
    out.text = text_of(el, ns::stanzas_error);
    return out;
}

[[nodiscard]] inline bind_result decode_bind_value(const xml::element& el)
{
    bind_result out;
    if (const auto* resource = el.child(ns::bind, "resource"))
        out.resource = resource->text;
    if (const auto* jid = el.child(ns::bind, "jid"))
        out.jid = jid->text;
    return out;
}

inline result<stanza> decode_stream_header(const xml::element& el)
{
    stream_header out;
    out.from = el.attr_or_empty("from");
    out.to = el.attr_or_empty("to");
    out.id = el.attr_or_empty("id");
    out.version = el.attr_or_empty("version");
    out.lang = lang_of(el);
    return out;
}

inline result<stanza> decode_stream_features(const xml::element& el)
{
    stream_features out;
    for (const auto& c : el.children)
    {
        if (c.name.matches(ns::tls, "starttls"))
            out.starttls = tls_starttls{c.child(ns::tls, "required") != nullptr};
        else if (c.name.matches(ns::sasl, "mechanisms"))
        {
            for (const auto& m : c.children)
            {
                if (m.name.matches(ns::sasl, "mechanism"))
                    out.mechanisms.push_back(m.text);
            }
        }
        else if (c.name.matches(ns::bind, "bind"))
            out.bind = true;
        else if (c.name.matches(ns::session, "session"))
            out.session = true;
        else
            out.other.push_back(capture(c));
    }
    return out;
}

inline result<stanza> decode_stream_error(const xml::element& el)
{
    return stream_error{condition_of(el, ns::streams_error), text_of(el, ns::streams_error)};
}

inline result<stanza> decode_tls_starttls(const xml::element& el)
{
    return tls_starttls{el.child(ns::tls, "required") != nullptr};
}

inline result<stanza> decode_tls_proceed(const xml::element&)
{
    return tls_proceed{};
}

inline result<stanza> decode_tls_failure(const xml::element&)
{
    return tls_failure{};
}

inline result<stanza> decode_sasl_mechanisms(const xml::element& el)
{
    sasl_mechanisms out;
    for (const auto& m : el.children)
    {
        if (m.name.matches(ns::sasl, "mechanism"))
            out.mechanisms.push_back(m.text);
    }
    return out;
}

inline result<stanza> decode_sasl_challenge(const xml::element& el)
{
    return sasl_challenge{el.text};
}

inline result<stanza> decode_sasl_response(const xml::element& el)
{
    return sasl_response{el.text};
}

inline result<stanza> decode_sasl_abort(const xml::element&)
{
    return sasl_abort{};
}

inline result<stanza> decode_sasl_success(const xml::element& el)
{
    return sasl_success{el.text};
}

inline result<stanza> decode_sasl_failure(const xml::element& el)
{
    return sasl_failure{condition_of(el, ns::sasl), text_of(el, ns::sasl)};
}

inline result<stanza> decode_bind(const xml::element& el)
{
    return decode_bind_value(el);
}

inline result<stanza> decode_message(const xml::element& el)
{
    message out;
    out.from = el.attr_or_empty("from");
    out.to = el.attr_or_empty("to");
    out.id = el.attr_or_empty("id");
    out.type = el.attr_or_empty("type");
    out.lang = lang_of(el);

    bool has_subject = false;
    bool has_body = false;
    bool has_thread = false;
    for (const auto& c : el.children)
    {
        if (take_text(c, "subject", out.subject, has_subject)
            || take_text(c, "body", out.body, has_body)
            || take_text(c, "thread", out.thread, has_thread))
            continue;
        out.other.push_back(c.text);
        out.other_elements.push_back(capture(c));
    }
    return out;
}

inline result<stanza> decode_presence(const xml::element& el)
{
    presence out;
    out.from = el.attr_or_empty("from");
    out.to = el.attr_or_empty("to");
    out.id = el.attr_or_empty("id");
    out.type = el.attr_or_empty("type");
    out.lang = lang_of(el);

    bool has_show = false;
    bool has_status = false;
    bool has_priority = false;
    for (const auto& c : el.children)
    {
        if (take_text(c, "show", out.show, has_show)
            || take_text(c, "status", out.status, has_status)
            || take_text(c, "priority", out.priority, has_priority))
            continue;
        if (c.name.matches(ns::client, "error") && !out.error)
            out.error = decode_client_error_value(c);
        else
            out.other_elements.push_back(capture(c));
    }
    return out;
}

inline result<stanza> decode_iq(const xml::element& el)
{
    iq out;
    out.from = el.attr_or_empty("from");
    out.to = el.attr_or_empty("to");
    out.id = el.attr_or_empty("id");
    out.type = el.attr_or_empty("type");
    for (const auto& c : el.children)
    {
        if (c.name.matches(ns::client, "error") && !out.error)
            out.error = decode_client_error_value(c);
        else if (c.name.matches(ns::bind, "bind") && !out.bind)
            out.bind = decode_bind_value(c);
        else
            out.other_elements.push_back(capture(c));
    }
    return out;
}

inline result<stanza> decode_client_error(const xml::element& el)
{
    return decode_client_error_value(el);
}

} // namespace detail

/// One row of the dispatch table.
struct decoder_entry
{
    std::string_view ns;
    std::string_view local;
    /// The stream root never closes; it is decoded from its start tag alone.
    bool open_ended;
    result<stanza> (*decode)(const xml::element&);
};

inline constexpr std::array<decoder_entry, 17> decoder_table{{
    {ns::stream, "stream", true, &detail::decode_stream_header},
    {ns::stream, "features", false, &detail::decode_stream_features},
    {ns::stream, "error", false, &detail::decode_stream_error},
    {ns::tls, "starttls", false, &detail::decode_tls_starttls},
    {ns::tls, "proceed", false, &detail::decode_tls_proceed},
    {ns::tls, "failure", false, &detail::decode_tls_failure},
    {ns::sasl, "mechanisms", false, &detail::decode_sasl_mechanisms},
    {ns::sasl, "challenge", false, &detail::decode_sasl_challenge},
    {ns::sasl, "response", false, &detail::decode_sasl_response},
    {ns::sasl, "abort", false, &detail::decode_sasl_abort},
    {ns::sasl, "success", false, &detail::decode_sasl_success},
    {ns::sasl, "failure", false, &detail::decode_sasl_failure},
    {ns::bind, "bind", false, &detail::decode_bind},
    {ns::client, "message", false, &detail::decode_message},
    {ns::client, "presence", false, &detail::decode_presence},
    {ns::client, "iq", false, &detail::decode_iq},
    {ns::client, "error", false, &detail::decode_client_error},
}};

/// Table row for a qualified name, compared field by field; nullptr when unmapped.
[[nodiscard]] inline const decoder_entry* find_decoder(const xml::qname& name) noexcept
{
    for (const auto& entry : decoder_table)
    {
        if (name.matches(entry.ns, entry.local))
            return &entry;
    }
    return nullptr;
}

/// ProtocolError for a name absent from the table.
[[nodiscard]] inline error_info unexpected_element(const xml::qname& name, std::string_view step = {})
{
    detail::error_detail detail;
    detail.add("proto", "XMPP");
    if (!step.empty())
        detail.add("step", step);
    detail.add("namespace", name.ns);
    detail.add("local", name.local);
    return make_error(errc::xmpp_unexpected_element,
        "unexpected XMPP element <" + name.local + "/> in namespace '" + name.ns + "'", detail.str());
}

/**
Decoding a complete element through the dispatch table.

@param el Element built from the token stream.
@return   The qualified name and tagged value, or `xmpp_unexpected_element` naming the namespace and local name.
**/
[[nodiscard]] inline result<decoded_element> decode(const xml::element& el)
{
    const auto* entry = find_decoder(el.name);
    if (entry == nullptr)
        return detail::make_unexpected(unexpected_element(el.name));

    auto value = entry->decode(el);
    if (!value)
        return detail::make_unexpected(std::move(value).error());
    return decoded_element{el.name, std::move(*value)};
}

} // namespace xmppxx
