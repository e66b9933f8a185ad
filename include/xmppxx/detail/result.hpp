/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions are thrown by xmppxx - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <xmppxx/detail/error_detail.hpp>

namespace xmppxx
{

/// Error codes for xmppxx operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Configuration (100-199)
    config_invalid_jid = 100,
    config_invalid_argument = 101,

    // Network (200-299)
    net_resolve_failed = 200,
    net_connect_failed = 201,
    net_connection_refused = 202,
    net_connection_reset = 203,
    net_io_failed = 204,
    net_timeout = 205,
    net_cancelled = 206,
    net_eof = 207,

    // TLS (300-399)
    tls_handshake_failed = 300,
    tls_verify_failed = 301,
    tls_negotiation_failed = 302,

    // XML (400-499)
    xml_parse_error = 400,
    xml_stanza_too_large = 401,

    // XMPP stream protocol (500-599)
    xmpp_unexpected_element = 500,
    xmpp_missing_element = 501,
    xmpp_stream_error = 502,
    xmpp_invalid_state = 503,
    xmpp_bind_failed = 504,
    xmpp_session_failed = 505,

    // SASL (600-699)
    sasl_no_mechanism = 600,
    sasl_auth_failed = 601,
    sasl_encoding_failed = 602,

    // Security policy (700-799)
    security_cleartext_auth = 700,

    internal_error = 900
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::config_invalid_jid: return "config_invalid_jid";
        case errc::config_invalid_argument: return "config_invalid_argument";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_io_failed: return "net_io_failed";
        case errc::net_timeout: return "net_timeout";
        case errc::net_cancelled: return "net_cancelled";
        case errc::net_eof: return "net_eof";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::tls_negotiation_failed: return "tls_negotiation_failed";
        case errc::xml_parse_error: return "xml_parse_error";
        case errc::xml_stanza_too_large: return "xml_stanza_too_large";
        case errc::xmpp_unexpected_element: return "xmpp_unexpected_element";
        case errc::xmpp_missing_element: return "xmpp_missing_element";
        case errc::xmpp_stream_error: return "xmpp_stream_error";
        case errc::xmpp_invalid_state: return "xmpp_invalid_state";
        case errc::xmpp_bind_failed: return "xmpp_bind_failed";
        case errc::xmpp_session_failed: return "xmpp_session_failed";
        case errc::sasl_no_mechanism: return "sasl_no_mechanism";
        case errc::sasl_auth_failed: return "sasl_auth_failed";
        case errc::sasl_encoding_failed: return "sasl_encoding_failed";
        case errc::security_cleartext_auth: return "security_cleartext_auth";
        case errc::internal_error: return "internal_error";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

[[nodiscard]] constexpr bool is_config_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 100 && c < 200;
}

[[nodiscard]] constexpr bool is_network_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 200 && c < 300;
}

/// Malformed or unexpected input from the server: XML, stream or TLS negotiation.
[[nodiscard]] constexpr bool is_protocol_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return code == errc::tls_negotiation_failed || (c >= 400 && c < 600);
}

[[nodiscard]] constexpr bool is_auth_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 600 && c < 700;
}

[[nodiscard]] constexpr bool is_security_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 700 && c < 800;
}

/// Clean closure of the transport or of the XML stream by the peer.
[[nodiscard]] constexpr bool is_end_of_stream(errc code) noexcept
{
    return code == errc::net_eof;
}

/// Rich error value carried by every failed result.
struct error_info
{
    errc code{errc::ok};
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = result<void>;

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string details = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    if (message.empty())
        message = std::string(to_string(code));
    return error_info{code, std::move(message), std::move(details), sys, where};
}

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info info)
{
    return std::unexpected<error_info>(std::move(info));
}

} // namespace detail

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T>
[[nodiscard]] result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
[[nodiscard]] result<T> fail(error_info info)
{
    return detail::make_unexpected(std::move(info));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string details = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return detail::make_unexpected(make_error(code, std::move(message), std::move(details), sys, where));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, const detail::error_detail& details,
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return detail::make_unexpected(make_error(code, std::move(message), details.str(), sys, where));
}

[[nodiscard]] inline result_void fail_void(errc code, std::string message, const detail::error_detail& details,
    std::source_location where = std::source_location::current())
{
    return fail<void>(code, std::move(message), details, {}, where);
}

/// Human readable one-line rendering: "code: message".
[[nodiscard]] inline std::string to_string(const error_info& err)
{
    std::string out(to_string(err.code));
    if (!err.message.empty())
    {
        out += ": ";
        out += err.message;
    }
    return out;
}

// ==================== Propagation Helpers ====================

#define XMPPXX_DETAIL_CONCAT_INNER(a, b) a##b
#define XMPPXX_DETAIL_CONCAT(a, b) XMPPXX_DETAIL_CONCAT_INNER(a, b)

/// Return the error of a failed result from a regular function.
#define XMPPXX_TRY(expr) \
    do { \
        auto&& _xmppxx_res = (expr); \
        if (!_xmppxx_res) [[unlikely]] \
            return ::xmppxx::detail::make_unexpected(std::move(_xmppxx_res).error()); \
    } while (0)

/// Assign the value of a result or return its error from a regular function.
#define XMPPXX_TRY_ASSIGN(lhs, expr) \
    auto XMPPXX_DETAIL_CONCAT(_xmppxx_res_, __LINE__) = (expr); \
    if (!XMPPXX_DETAIL_CONCAT(_xmppxx_res_, __LINE__)) [[unlikely]] \
        return ::xmppxx::detail::make_unexpected(std::move(XMPPXX_DETAIL_CONCAT(_xmppxx_res_, __LINE__)).error()); \
    lhs = std::move(*XMPPXX_DETAIL_CONCAT(_xmppxx_res_, __LINE__))

/// Same as XMPPXX_TRY, for coroutines.
/// Usage: XMPPXX_CO_TRY_VOID(co_await write(data));
#define XMPPXX_CO_TRY_VOID(expr) \
    do { \
        auto&& _xmppxx_res = (expr); \
        if (!_xmppxx_res) [[unlikely]] \
            co_return ::xmppxx::detail::make_unexpected(std::move(_xmppxx_res).error()); \
    } while (0)

/// Same as XMPPXX_TRY_ASSIGN, for coroutines.
/// Usage: XMPPXX_CO_TRY_ASSIGN(auto token, co_await reader.next_start());
#define XMPPXX_CO_TRY_ASSIGN(lhs, expr) \
    auto XMPPXX_DETAIL_CONCAT(_xmppxx_res_, __LINE__) = (expr); \
    if (!XMPPXX_DETAIL_CONCAT(_xmppxx_res_, __LINE__)) [[unlikely]] \
        co_return ::xmppxx::detail::make_unexpected(std::move(XMPPXX_DETAIL_CONCAT(_xmppxx_res_, __LINE__)).error()); \
    lhs = std::move(*XMPPXX_DETAIL_CONCAT(_xmppxx_res_, __LINE__))

} // namespace xmppxx
