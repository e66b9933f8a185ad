/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Values of the XMPP elements the client understands.

*/

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <xmppxx/xml/qname.hpp>

namespace xmppxx
{

/**
Unmodeled child element kept as received.

`namespaces` lists the bindings `inner_xml` relies on that were declared outside it,
so that the markup keeps its meaning when written back on its own.
**/
struct raw_element
{
    xml::qname name;
    std::string inner_xml;
    std::vector<xml::namespace_decl> namespaces;

    friend bool operator==(const raw_element&, const raw_element&) = default;
};

// ==================== Stream namespace ====================

/// Attributes of a `<stream:stream>` root.
struct stream_header
{
    std::string from;
    std::string to;
    std::string id;
    std::string version;
    std::string lang;

    friend bool operator==(const stream_header&, const stream_header&) = default;
};

struct tls_starttls
{
    bool required{false};

    friend bool operator==(const tls_starttls&, const tls_starttls&) = default;
};

/// Capabilities advertised by the server for the current stream instance.
struct stream_features
{
    std::optional<tls_starttls> starttls;
    std::vector<std::string> mechanisms;
    bool bind{false};
    bool session{false};
    std::vector<raw_element> other;

    friend bool operator==(const stream_features&, const stream_features&) = default;
};

struct stream_error
{
    xml::qname condition;
    std::string text;

    friend bool operator==(const stream_error&, const stream_error&) = default;
};

// ==================== TLS namespace ====================

struct tls_proceed
{
    friend bool operator==(const tls_proceed&, const tls_proceed&) = default;
};

struct tls_failure
{
    friend bool operator==(const tls_failure&, const tls_failure&) = default;
};

// ==================== SASL namespace ====================

struct sasl_mechanisms
{
    std::vector<std::string> mechanisms;

    friend bool operator==(const sasl_mechanisms&, const sasl_mechanisms&) = default;
};

/// Base64 payload as it appears on the wire.
struct sasl_challenge
{
    std::string data;

    friend bool operator==(const sasl_challenge&, const sasl_challenge&) = default;
};

struct sasl_response
{
    std::string data;

    friend bool operator==(const sasl_response&, const sasl_response&) = default;
};

struct sasl_abort
{
    friend bool operator==(const sasl_abort&, const sasl_abort&) = default;
};

struct sasl_success
{
    std::string data;

    friend bool operator==(const sasl_success&, const sasl_success&) = default;
};

struct sasl_failure
{
    /// First child, e.g. `not-authorized`.
    xml::qname condition;
    std::string text;

    friend bool operator==(const sasl_failure&, const sasl_failure&) = default;
};

// ==================== Binding namespace ====================

struct bind_result
{
    std::string resource;
    std::string jid;

    friend bool operator==(const bind_result&, const bind_result&) = default;
};

// ==================== jabber:client ====================

struct client_error
{
    std::string code;
    std::string type;
    /// First child element, normally a stanzas namespace condition.
    xml::qname condition;
    std::string text;

    friend bool operator==(const client_error&, const client_error&) = default;
};

/**
Chat message.

For every child element not mapped to a field, `other` receives its own character
data and `other_elements` its qualified name and raw inner markup, in document order.
**/
struct message
{
    std::string from;
    std::string to;
    std::string id;
    std::string type;   // chat, error, groupchat, headline or normal
    std::string lang;
    std::string subject;
    std::string body;
    std::string thread;
    std::vector<std::string> other;
    std::vector<raw_element> other_elements;

    friend bool operator==(const message&, const message&) = default;
};

struct presence
{
    std::string from;
    std::string to;
    std::string id;
    std::string type;   // error, probe, subscribe, subscribed, unavailable, unsubscribe, unsubscribed
    std::string lang;
    std::string show;   // away, chat, dnd, xa
    std::string status;
    std::string priority;
    std::optional<client_error> error;
    std::vector<raw_element> other_elements;

    friend bool operator==(const presence&, const presence&) = default;
};

struct iq
{
    std::string from;
    std::string to;
    std::string id;
    std::string type;   // error, get, result, set
    std::optional<client_error> error;
    std::optional<bind_result> bind;
    std::vector<raw_element> other_elements;

    friend bool operator==(const iq&, const iq&) = default;
};

/// Every decodable element, tagged by type.
using stanza = std::variant<
    stream_header,
    stream_features,
    stream_error,
    tls_starttls,
    tls_proceed,
    tls_failure,
    sasl_mechanisms,
    sasl_challenge,
    sasl_response,
    sasl_abort,
    sasl_success,
    sasl_failure,
    bind_result,
    message,
    presence,
    iq,
    client_error>;

/// Result of a dispatcher read: the qualified name seen on the wire and its value.
struct decoded_element
{
    xml::qname name;
    stanza value;
};

/// What client::recv() delivers.
using event = std::variant<message, presence>;

} // namespace xmppxx
