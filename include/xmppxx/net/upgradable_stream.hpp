/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <xmppxx/detail/asio_decl.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/net/tls_options.hpp>
#include <xmppxx/net/tls_trust_store.hpp>

namespace xmppxx
{
namespace net
{

using xmppxx::asio::any_io_executor;
using xmppxx::asio::awaitable;
using xmppxx::asio::tcp;
namespace ssl = xmppxx::asio::ssl;

/**
Stable stream type that can be upgraded to TLS without changing the type.

The XML token reader sits above this object, so a STARTTLS upgrade swaps the
transport without touching buffered stream state.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = any_io_executor;
    using lowest_layer_type = std::remove_reference_t<decltype(std::declval<ssl_stream&>().lowest_layer())>;

    explicit upgradable_stream(tcp::socket socket)
        : stream_(std::move(socket))
    {
    }

    explicit upgradable_stream(executor_type executor)
        : stream_(tcp::socket(executor))
    {
    }

    executor_type get_executor()
    {
        return std::visit([](auto& stream) -> executor_type
        {
            return executor_type(stream.get_executor());
        }, stream_);
    }

    lowest_layer_type& lowest_layer()
    {
        return std::visit([](auto& stream) -> lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    const lowest_layer_type& lowest_layer() const
    {
        return std::visit([](const auto& stream) -> const lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(stream_);
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    /**
    Performs the client TLS handshake over the current TCP socket.

    @param context Caller owned context, configured with `opt` before use.
    @param sni     Server name sent in the handshake and checked against the certificate.
    @param opt     Verification policy.
    **/
    awaitable<xmppxx::result<void>> start_tls(ssl::context& context, std::string sni, const tls_options& opt)
    {
        if (is_tls())
            co_return xmppxx::ok();

        auto trust_res = configure_trust_store(context, opt);
        if (!trust_res)
            co_return xmppxx::fail<void>(std::move(trust_res).error());
        auto harden_res = apply_tls_hardening(context, opt);
        if (!harden_res)
            co_return xmppxx::fail<void>(std::move(harden_res).error());

        if (opt.verify == verify_mode::peer && opt.verify_host && sni.empty())
            co_return xmppxx::fail<void>(errc::tls_verify_failed,
                "TLS hostname verification requires a host name.");

        auto socket = std::move(std::get<tcp::socket>(stream_));
        stream_.template emplace<ssl_stream>(std::move(socket), context);

        auto& tls_stream = std::get<ssl_stream>(stream_);
        if (!sni.empty())
            SSL_set_tlsext_host_name(tls_stream.native_handle(), sni.c_str());

        if (opt.verify == verify_mode::peer)
        {
            tls_stream.set_verify_mode(ssl::verify_peer);
            if (opt.verify_host)
            {
                auto verifier = ssl::host_name_verification(sni);
                tls_stream.set_verify_callback([verifier,
                    allow_self_signed = opt.allow_self_signed,
                    allow_expired = opt.allow_expired](bool preverified, ssl::verify_context& ctx) mutable
                {
                    if (!relax_verify(preverified, ctx, allow_self_signed, allow_expired))
                        return false;
                    return verifier(true, ctx);
                });
            }
            else if (opt.allow_self_signed || opt.allow_expired)
            {
                tls_stream.set_verify_callback(
                    [allow_self_signed = opt.allow_self_signed,
                     allow_expired = opt.allow_expired](bool preverified, ssl::verify_context& ctx)
                {
                    return relax_verify(preverified, ctx, allow_self_signed, allow_expired);
                });
            }
        }
        else
        {
            tls_stream.set_verify_mode(ssl::verify_none);
        }

        xmppxx::asio::error_code ec;
        co_await tls_stream.async_handshake(ssl::stream_base::client,
            xmppxx::asio::redirect_error(xmppxx::asio::use_awaitable, ec));
        if (ec)
        {
            const long verify_result = SSL_get_verify_result(tls_stream.native_handle());
            const errc code = verify_result != X509_V_OK ? errc::tls_verify_failed : errc::tls_handshake_failed;
            std::string detail = "verify=";
            detail += X509_verify_cert_error_string(verify_result);
            co_return xmppxx::fail<void>(code, "TLS handshake failed: " + ec.message(), std::move(detail), ec);
        }
        co_return xmppxx::ok();
    }

    /// Sends close_notify when encrypted, then shuts the socket down. Errors are ignored.
    awaitable<void> close()
    {
        xmppxx::asio::error_code ec;
        if (auto* tls_stream = std::get_if<ssl_stream>(&stream_))
            co_await tls_stream->async_shutdown(xmppxx::asio::redirect_error(xmppxx::asio::use_awaitable, ec));
        auto& socket = lowest_layer();
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    /// Cancels pending operations on the socket.
    void cancel() noexcept
    {
        xmppxx::asio::error_code ec;
        lowest_layer().cancel(ec);
    }

private:
    static std::string openssl_error_message()
    {
        const unsigned long err = ERR_get_error();
        if (err == 0)
            return {};
        char buffer[256];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    static result<void> apply_tls_hardening(ssl::context& context, const tls_options& opt)
    {
        // Applies policy to the SSL_CTX; does not override existing min version.
        if (opt.min_tls_version.has_value())
        {
            const int current = SSL_CTX_get_min_proto_version(context.native_handle());
            if (current == 0 && SSL_CTX_set_min_proto_version(context.native_handle(), opt.min_tls_version.value()) != 1)
            {
                return fail<void>(errc::tls_handshake_failed,
                    "TLS min version configuration failed.", openssl_error_message());
            }
        }

        if (!opt.cipher_list.empty()
            && SSL_CTX_set_cipher_list(context.native_handle(), opt.cipher_list.c_str()) != 1)
        {
            return fail<void>(errc::tls_handshake_failed,
                "TLS cipher list configuration failed.", openssl_error_message());
        }
        return ok();
    }

    static bool relax_verify(bool preverified, ssl::verify_context& ctx,
        bool allow_self_signed, bool allow_expired) noexcept
    {
        if (preverified)
            return true;
        if (!allow_self_signed && !allow_expired)
            return false;

        X509_STORE_CTX* store_ctx = ctx.native_handle();
        if (store_ctx == nullptr)
            return false;

        const int err = X509_STORE_CTX_get_error(store_ctx);
        if (allow_self_signed
            && (err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN || err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT))
            return true;
        if (allow_expired
            && (err == X509_V_ERR_CERT_HAS_EXPIRED || err == X509_V_ERR_CERT_NOT_YET_VALID))
            return true;
        return false;
    }

    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace net
} // namespace xmppxx
