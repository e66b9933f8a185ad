/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized mapping between Asio error codes and xmppxx::errc for network I/O.

*/

#pragma once

#include <string_view>

#include <xmppxx/detail/asio_decl.hpp>
#include <xmppxx/detail/error_detail.hpp>
#include <xmppxx/detail/result.hpp>

namespace xmppxx::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "unknown";
}

/// A clean close by the peer maps to net_eof, which callers treat as end-of-stream.
[[nodiscard]] inline errc map_net_error(io_stage stage, const xmppxx::asio::error_code& ec, bool timeout_triggered) noexcept
{
    namespace error = xmppxx::asio::error;
    if (timeout_triggered || ec == error::timed_out)
        return errc::net_timeout;
    if (ec == error::operation_aborted)
        return errc::net_cancelled;
    if (ec == error::eof)
        return errc::net_eof;
    if (ec == error::connection_refused)
        return errc::net_connection_refused;
    if (ec == error::connection_reset || ec == error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == error::host_not_found || ec == error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline detail::error_detail make_net_detail(
    std::string_view host,
    std::string_view service,
    io_stage stage,
    std::string_view op)
{
    detail::error_detail detail;
    detail.add("proto", "XMPP");
    if (!host.empty())
        detail.add("host", host);
    if (!service.empty())
        detail.add("service", service);
    detail.add("stage", stage_name(stage));
    detail.add("op", op);
    return detail;
}

/// Converts a failed asio operation into an error_info.
[[nodiscard]] inline error_info make_net_error(io_stage stage, const xmppxx::asio::error_code& ec,
    std::string_view op, bool timeout_triggered = false)
{
    const errc code = map_net_error(stage, ec, timeout_triggered);
    auto detail = make_net_detail({}, {}, stage, op);
    detail.add_ec("sys", ec);
    std::string message = code == errc::net_eof
        ? std::string("Connection closed by peer.")
        : std::string(op) + " failed: " + ec.message();
    return make_error(code, std::move(message), detail.str(), ec);
}

} // namespace xmppxx::net
