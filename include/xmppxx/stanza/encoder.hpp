/*

encoder.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Serialization of stanzas and negotiation requests. Elements of jabber:client rely
on the stream default namespace and carry no xmlns attribute.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <xmppxx/stanza/namespaces.hpp>
#include <xmppxx/stanza/types.hpp>
#include <xmppxx/xml/escape.hpp>

namespace xmppxx
{

namespace detail
{

inline void append_attr(std::string& out, std::string_view name, std::string_view value)
{
    if (value.empty())
        return;
    out += ' ';
    out += name;
    out += "='";
    xml::escape_attr_to(out, value);
    out += '\'';
}

inline void append_text_element(std::string& out, std::string_view local, std::string_view text)
{
    out += '<';
    out += local;
    out += '>';
    xml::escape_to(out, text);
    out += "</";
    out += local;
    out += '>';
}

[[nodiscard]] inline bool has_raw_named(const std::vector<raw_element>& raws, std::string_view ns_uri, std::string_view local)
{
    for (const auto& raw : raws)
    {
        if (raw.name.matches(ns_uri, local))
            return true;
    }
    return false;
}

/**
Writes a modeled text child when set.

An empty field is still written when an unmodeled child of the same name follows, so
that the decoder keeps assigning the first occurrence to the field.
**/
inline void append_optional_text_element(std::string& out, std::string_view local, std::string_view text,
    const std::vector<raw_element>& raws = {})
{
    if (!text.empty())
        append_text_element(out, local, text);
    else if (has_raw_named(raws, ns::client, local))
    {
        out += '<';
        out += local;
        out += "/>";
    }
}

/// Empty element `<local xmlns='ns'/>`, or with text content when given.
inline void append_ns_element(std::string& out, std::string_view local, std::string_view ns_uri, std::string_view text = {})
{
    out += '<';
    out += local;
    append_attr(out, "xmlns", ns_uri);
    if (text.empty())
    {
        out += "/>";
        return;
    }
    out += '>';
    xml::escape_to(out, text);
    out += "</";
    out += local;
    out += '>';
}

// First `nsN` prefix not bound by the inner markup.
[[nodiscard]] inline std::string unused_prefix(const std::vector<xml::namespace_decl>& namespaces)
{
    for (std::size_t n = 0;; ++n)
    {
        std::string candidate = "ns" + std::to_string(n);
        const bool taken = std::any_of(namespaces.begin(), namespaces.end(),
            [&candidate](const xml::namespace_decl& decl) { return decl.prefix == candidate; });
        if (!taken)
            return candidate;
    }
}

/**
Re-emits a captured child; its inner markup is written back untouched.

The bindings the markup relies on are declared on the element. When the markup needs
a default namespace other than the element's own, the element name gets a generated
prefix.
**/
inline void append_raw(std::string& out, const raw_element& raw, std::string_view default_ns)
{
    const auto inner_default = std::find_if(raw.namespaces.begin(), raw.namespaces.end(),
        [](const xml::namespace_decl& decl) { return decl.prefix.empty(); });
    std::string tag = raw.name.local;
    bool declare_default = false;
    if (inner_default != raw.namespaces.end() && inner_default->uri != raw.name.ns && !raw.name.ns.empty())
    {
        const std::string prefix = unused_prefix(raw.namespaces);
        tag = prefix + ":" + raw.name.local;
        declare_default = true;
        out += '<';
        out += tag;
        append_attr(out, "xmlns:" + prefix, raw.name.ns);
    }
    else
    {
        out += '<';
        out += tag;
        if (raw.name.ns.empty() && !default_ns.empty())
            out += " xmlns=''";
        else if (raw.name.ns != default_ns)
            append_attr(out, "xmlns", raw.name.ns);
    }

    for (const auto& decl : raw.namespaces)
    {
        if (!decl.prefix.empty())
            append_attr(out, "xmlns:" + decl.prefix, decl.uri);
        else if (declare_default)
        {
            out += " xmlns='";
            xml::escape_attr_to(out, decl.uri);
            out += '\'';
        }
    }

    if (raw.inner_xml.empty())
    {
        out += "/>";
        return;
    }
    out += '>';
    out += raw.inner_xml;
    out += "</";
    out += tag;
    out += '>';
}

inline void append_condition(std::string& out, const xml::qname& condition, std::string_view default_ns)
{
    if (condition.local.empty())
        return;
    append_raw(out, raw_element{condition, {}}, default_ns);
}

inline void append_client_error(std::string& out, const client_error& err)
{
    out += "<error";
    append_attr(out, "code", err.code);
    append_attr(out, "type", err.type);
    out += '>';
    append_condition(out, err.condition, ns::client);
    if (!err.text.empty())
        append_ns_element(out, "text", ns::stanzas_error, err.text);
    out += "</error>";
}

inline void append_bind(std::string& out, const bind_result& bind)
{
    if (bind.resource.empty() && bind.jid.empty())
    {
        append_ns_element(out, "bind", ns::bind);
        return;
    }
    out += "<bind";
    append_attr(out, "xmlns", ns::bind);
    out += '>';
    append_optional_text_element(out, "resource", bind.resource);
    append_optional_text_element(out, "jid", bind.jid);
    out += "</bind>";
}

inline void append_mechanisms(std::string& out, const std::vector<std::string>& mechanisms)
{
    out += "<mechanisms";
    append_attr(out, "xmlns", ns::sasl);
    out += '>';
    for (const auto& m : mechanisms)
        append_text_element(out, "mechanism", m);
    out += "</mechanisms>";
}

inline void append_starttls(std::string& out, const tls_starttls& starttls)
{
    if (!starttls.required)
    {
        append_ns_element(out, "starttls", ns::tls);
        return;
    }
    out += "<starttls";
    append_attr(out, "xmlns", ns::tls);
    out += "><required/></starttls>";
}

} // namespace detail

// ==================== Negotiation requests ====================

/**
Initial stream header, also sent unchanged on every stream restart.

@param domain Domain part of the JID; attribute-escaped.
**/
[[nodiscard]] inline std::string encode_stream_header(std::string_view domain)
{
    std::string out = "<?xml version='1.0'?>\n<stream:stream to='";
    xml::escape_attr_to(out, domain);
    out += "' xmlns='";
    out += ns::client;
    out += "'\n xmlns:stream='";
    out += ns::stream;
    out += "' version='1.0'>\n";
    return out;
}

[[nodiscard]] inline std::string encode_stream_close()
{
    return "</stream:stream>";
}

[[nodiscard]] inline std::string encode_starttls_request()
{
    std::string out;
    detail::append_ns_element(out, "starttls", ns::tls);
    return out;
}

/**
SASL `<auth>` request.

@param mechanism Mechanism name.
@param payload   Base64 initial response; an empty payload gives a self-closing element.
**/
[[nodiscard]] inline std::string encode_auth(std::string_view mechanism, std::string_view payload)
{
    std::string out = "<auth xmlns='";
    out += ns::sasl;
    out += "' mechanism='";
    xml::escape_attr_to(out, mechanism);
    out += '\'';
    if (payload.empty())
        return out + "/>";
    out += '>';
    out += payload;
    out += "</auth>";
    return out;
}

/// Resource binding request; without resource the server generates one.
[[nodiscard]] inline std::string encode_bind_request(std::string_view resource)
{
    std::string out = "<iq type='set' id='x'><bind xmlns='";
    out += ns::bind;
    if (resource.empty())
        return out + "'/></iq>";
    out += "'><resource>";
    xml::escape_to(out, resource);
    out += "</resource></bind></iq>";
    return out;
}

/// RFC 3921 session establishment request.
[[nodiscard]] inline std::string encode_session_request(std::string_view domain)
{
    std::string out = "<iq type='set' id='sess_1'";
    detail::append_attr(out, "to", domain);
    out += "><session xmlns='";
    out += ns::session;
    out += "'/></iq>";
    return out;
}

/// Initial presence; both children are always written.
[[nodiscard]] inline std::string encode_initial_presence(std::string_view show, std::string_view status)
{
    std::string out = "<presence xml:lang='en'>";
    detail::append_text_element(out, "show", show);
    detail::append_text_element(out, "status", status);
    out += "</presence>";
    return out;
}

// ==================== Stanza values ====================

[[nodiscard]] inline std::string encode(const message& msg)
{
    std::string out = "<message";
    detail::append_attr(out, "from", msg.from);
    detail::append_attr(out, "to", msg.to);
    detail::append_attr(out, "id", msg.id);
    detail::append_attr(out, "type", msg.type);
    detail::append_attr(out, "xml:lang", msg.lang);
    out += '>';
    detail::append_optional_text_element(out, "subject", msg.subject, msg.other_elements);
    detail::append_optional_text_element(out, "body", msg.body, msg.other_elements);
    detail::append_optional_text_element(out, "thread", msg.thread, msg.other_elements);
    for (const auto& raw : msg.other_elements)
        detail::append_raw(out, raw, ns::client);
    out += "</message>";
    return out;
}

[[nodiscard]] inline std::string encode(const presence& pres)
{
    std::string out = "<presence";
    detail::append_attr(out, "from", pres.from);
    detail::append_attr(out, "to", pres.to);
    detail::append_attr(out, "id", pres.id);
    detail::append_attr(out, "type", pres.type);
    detail::append_attr(out, "xml:lang", pres.lang);
    out += '>';
    detail::append_optional_text_element(out, "show", pres.show, pres.other_elements);
    detail::append_optional_text_element(out, "status", pres.status, pres.other_elements);
    detail::append_optional_text_element(out, "priority", pres.priority, pres.other_elements);
    if (pres.error)
        detail::append_client_error(out, *pres.error);
    for (const auto& raw : pres.other_elements)
    {
        // Decoding would turn it into `error`; decoded values never carry one.
        if (!pres.error && raw.name.matches(ns::client, "error"))
            continue;
        detail::append_raw(out, raw, ns::client);
    }
    out += "</presence>";
    return out;
}

[[nodiscard]] inline std::string encode(const iq& query)
{
    std::string out = "<iq";
    detail::append_attr(out, "from", query.from);
    detail::append_attr(out, "to", query.to);
    detail::append_attr(out, "id", query.id);
    detail::append_attr(out, "type", query.type);
    out += '>';
    if (query.bind)
        detail::append_bind(out, *query.bind);
    if (query.error)
        detail::append_client_error(out, *query.error);
    for (const auto& raw : query.other_elements)
    {
        if ((!query.error && raw.name.matches(ns::client, "error")) || (!query.bind && raw.name.matches(ns::bind, "bind")))
            continue;
        detail::append_raw(out, raw, ns::client);
    }
    out += "</iq>";
    return out;
}

[[nodiscard]] inline std::string encode(const client_error& err)
{
    std::string out;
    detail::append_client_error(out, err);
    return out;
}

/// Stream header value; only `to` is used, as in the client request.
[[nodiscard]] inline std::string encode(const stream_header& header)
{
    return encode_stream_header(header.to);
}

[[nodiscard]] inline std::string encode(const stream_features& features)
{
    std::string out = "<stream:features>";
    if (features.starttls)
        detail::append_starttls(out, *features.starttls);
    if (!features.mechanisms.empty())
        detail::append_mechanisms(out, features.mechanisms);
    if (features.bind)
        detail::append_ns_element(out, "bind", ns::bind);
    if (features.session)
        detail::append_ns_element(out, "session", ns::session);
    for (const auto& raw : features.other)
    {
        // Names the decoder maps to fields are never kept as unmodeled features.
        if (raw.name.matches(ns::tls, "starttls") || raw.name.matches(ns::sasl, "mechanisms")
            || raw.name.matches(ns::bind, "bind") || raw.name.matches(ns::session, "session"))
            continue;
        detail::append_raw(out, raw, ns::client);
    }
    out += "</stream:features>";
    return out;
}

[[nodiscard]] inline std::string encode(const stream_error& err)
{
    std::string out = "<stream:error>";
    detail::append_condition(out, err.condition, ns::client);
    if (!err.text.empty())
        detail::append_ns_element(out, "text", ns::streams_error, err.text);
    out += "</stream:error>";
    return out;
}

[[nodiscard]] inline std::string encode(const tls_starttls& starttls)
{
    std::string out;
    detail::append_starttls(out, starttls);
    return out;
}

[[nodiscard]] inline std::string encode(const tls_proceed&)
{
    std::string out;
    detail::append_ns_element(out, "proceed", ns::tls);
    return out;
}

[[nodiscard]] inline std::string encode(const tls_failure&)
{
    std::string out;
    detail::append_ns_element(out, "failure", ns::tls);
    return out;
}

[[nodiscard]] inline std::string encode(const sasl_mechanisms& mechanisms)
{
    std::string out;
    detail::append_mechanisms(out, mechanisms.mechanisms);
    return out;
}

[[nodiscard]] inline std::string encode(const sasl_challenge& challenge)
{
    std::string out;
    detail::append_ns_element(out, "challenge", ns::sasl, challenge.data);
    return out;
}

[[nodiscard]] inline std::string encode(const sasl_response& response)
{
    std::string out;
    detail::append_ns_element(out, "response", ns::sasl, response.data);
    return out;
}

[[nodiscard]] inline std::string encode(const sasl_abort&)
{
    std::string out;
    detail::append_ns_element(out, "abort", ns::sasl);
    return out;
}

[[nodiscard]] inline std::string encode(const sasl_success& success)
{
    std::string out;
    detail::append_ns_element(out, "success", ns::sasl, success.data);
    return out;
}

[[nodiscard]] inline std::string encode(const sasl_failure& failure)
{
    std::string out = "<failure";
    detail::append_attr(out, "xmlns", ns::sasl);
    out += '>';
    detail::append_condition(out, failure.condition, ns::sasl);
    detail::append_optional_text_element(out, "text", failure.text);
    out += "</failure>";
    return out;
}

[[nodiscard]] inline std::string encode(const bind_result& bind)
{
    std::string out;
    detail::append_bind(out, bind);
    return out;
}

/// Serializes any decodable value.
[[nodiscard]] inline std::string encode(const stanza& value)
{
    return std::visit([](const auto& v) { return encode(v); }, value);
}

} // namespace xmppxx
