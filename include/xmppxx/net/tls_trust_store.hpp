/*

tls_trust_store.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <xmppxx/detail/asio_decl.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/net/tls_options.hpp>

namespace xmppxx::net
{

/**
Configure the TLS trust store for a context.
**/
[[nodiscard]] inline result<void> configure_trust_store(xmppxx::asio::ssl::context& ctx, const tls_options& options)
{
    if (options.verify == verify_mode::none)
        return ok();

    xmppxx::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", "ca_file=" + file, ec);
    }

    for (const auto& path : options.ca_paths)
    {
        if (path.empty())
            continue;
        ctx.add_verify_path(path, ec);
        if (ec)
            return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", "ca_path=" + path, ec);
    }
    return ok();
}

} // namespace xmppxx::net
