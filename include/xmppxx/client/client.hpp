/*

client.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <xmppxx/client/error_mapping.hpp>
#include <xmppxx/client/stream_reader.hpp>
#include <xmppxx/client/types.hpp>
#include <xmppxx/detail/asio_decl.hpp>
#include <xmppxx/detail/async_mutex.hpp>
#include <xmppxx/detail/auth_policy.hpp>
#include <xmppxx/detail/log.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/detail/sasl.hpp>
#include <xmppxx/net/dialog.hpp>
#include <xmppxx/net/error_mapping.hpp>
#include <xmppxx/net/tls_mode.hpp>
#include <xmppxx/net/upgradable_stream.hpp>
#include <xmppxx/stanza/decoder.hpp>
#include <xmppxx/stanza/encoder.hpp>
#include <xmppxx/stanza/types.hpp>

namespace xmppxx
{

/**
XMPP client session over a single transport.

`connect()` or `open()` run the whole stream negotiation (features, optional STARTTLS,
SASL, stream restart, resource binding, optional session, initial presence). They
either leave the client `READY` or fail with the transport closed; a partially
negotiated session is never usable.

Once ready, one coroutine may drive the read path (`recv`, `next_element`) while
another drives the write path (`send*`, `close`).
**/
class client
{
public:
    using dialog_type = net::dialog<net::upgradable_stream>;
    using reader_type = stream_reader<dialog_type>;

    inline static const std::string DEFAULT_SERVICE{"5222"};

    enum class state_t
    {
        DISCONNECTED,       ///< No transport attached.
        STREAM_OPENED,      ///< Stream header sent.
        AWAITING_FEATURES,  ///< Server stream root received.
        TLS_NEGOTIATING,    ///< STARTTLS requested.
        AUTH_SENT,          ///< SASL auth element sent.
        AUTHENTICATED,      ///< SASL success received.
        STREAM_RESTARTED,   ///< Stream header sent again over the same transport.
        BIND_SENT,          ///< Resource binding requested.
        SESSION_SENT,       ///< Session establishment requested.
        PRESENCE_SENT,      ///< Initial presence sent.
        READY,              ///< Stanzas may be exchanged.
        FAILED,             ///< Negotiation failed; transport closed.
        CLOSED              ///< Closed by the caller.
    };

    [[nodiscard]] static constexpr std::string_view state_name(state_t state) noexcept
    {
        switch (state)
        {
            case state_t::DISCONNECTED: return "DISCONNECTED";
            case state_t::STREAM_OPENED: return "STREAM_OPENED";
            case state_t::AWAITING_FEATURES: return "AWAITING_FEATURES";
            case state_t::TLS_NEGOTIATING: return "TLS_NEGOTIATING";
            case state_t::AUTH_SENT: return "AUTH_SENT";
            case state_t::AUTHENTICATED: return "AUTHENTICATED";
            case state_t::STREAM_RESTARTED: return "STREAM_RESTARTED";
            case state_t::BIND_SENT: return "BIND_SENT";
            case state_t::SESSION_SENT: return "SESSION_SENT";
            case state_t::PRESENCE_SENT: return "PRESENCE_SENT";
            case state_t::READY: return "READY";
            case state_t::FAILED: return "FAILED";
            case state_t::CLOSED: return "CLOSED";
        }
        return "UNKNOWN";
    }

    explicit client(asio::any_io_executor executor, options opts = {})
        : options_(std::move(opts)),
          executor_(std::move(executor)),
          read_mutex_(executor_),
          write_mutex_(executor_)
    {
    }

    explicit client(asio::io_context& io_context, options opts = {})
        : client(io_context.get_executor(), std::move(opts))
    {
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    ~client() = default;

    [[nodiscard]] state_t state() const noexcept { return state_.load(); }

    /// Full JID assigned by the server during resource binding.
    [[nodiscard]] const std::string& jid() const noexcept { return jid_; }

    /// Stream id announced by the server in its latest stream header.
    [[nodiscard]] const std::string& stream_id() const noexcept { return stream_id_; }

    /// Features of the latest stream, after restart.
    [[nodiscard]] const stream_features& features() const noexcept { return features_; }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return dlg_.has_value() && dlg_->stream().is_tls();
    }

    [[nodiscard]] const options& config() const noexcept { return options_; }

#if defined(XMPPXX_TESTING)
    /// Attaches a transport in the ready state, skipping negotiation.
    void debug_attach_ready(net::upgradable_stream stream)
    {
        attach(std::move(stream));
        set_state(state_t::READY);
    }
#endif

    /**
    Connecting to the server and negotiating the stream.

    @param host    Server host; the JID domain when empty.
    @param service Port or service name; 5222 when empty.
    @param mode    `implicit` performs the TLS handshake right after connecting; `starttls`
                   only ensures a context is given for the in band upgrade.
    @param tls_ctx Context used for implicit TLS and STARTTLS, owned by the caller.
    @param sni     Server name for TLS; the host when empty.
    **/
    asio::awaitable<result_void> connect(std::string host = {}, std::string service = {},
        net::tls_mode mode = net::tls_mode::none, asio::ssl::context* tls_ctx = nullptr, std::string sni = {})
    {
        [[maybe_unused]] auto read_guard = co_await read_mutex_.lock();
        [[maybe_unused]] auto write_guard = co_await write_mutex_.lock();
        co_return co_await connect_impl(std::move(host), std::move(service), mode, tls_ctx, std::move(sni));
    }

    /**
    Negotiating the stream over an already connected transport.

    @param stream  Connected transport, possibly already encrypted.
    @param tls_ctx Context for STARTTLS, owned by the caller; STARTTLS is skipped without it.
    @param sni     Server name for STARTTLS; the JID domain when empty.
    **/
    asio::awaitable<result_void> open(net::upgradable_stream stream, asio::ssl::context* tls_ctx = nullptr,
        std::string sni = {})
    {
        [[maybe_unused]] auto read_guard = co_await read_mutex_.lock();
        [[maybe_unused]] auto write_guard = co_await write_mutex_.lock();
        co_return co_await open_impl(std::move(stream), tls_ctx, std::move(sni));
    }

    /**
    Receiving the next message or presence.

    Other decoded elements (iq, stream errors, SASL leftovers) are discarded. A closed
    stream or transport yields `net_eof`.
    **/
    asio::awaitable<result<event>> recv()
    {
        [[maybe_unused]] auto guard = co_await read_mutex_.lock();
        co_return co_await recv_impl();
    }

    /// Next decoded element of any kind, for callers that need iq or error stanzas.
    asio::awaitable<result<decoded_element>> next_element()
    {
        [[maybe_unused]] auto guard = co_await read_mutex_.lock();
        co_return co_await next_element_impl("NEXT_ELEMENT");
    }

    /// Serializes and writes any decodable value in one write.
    asio::awaitable<result_void> send(const stanza& value)
    {
        [[maybe_unused]] auto guard = co_await write_mutex_.lock();
        co_return co_await send_impl(encode(value), "SEND");
    }

    asio::awaitable<result_void> send_message(const std::string& to, const std::string& body,
        const std::string& type = "chat")
    {
        message msg;
        msg.to = to;
        msg.type = type;
        msg.body = body;
        [[maybe_unused]] auto guard = co_await write_mutex_.lock();
        co_return co_await send_impl(encode(msg), "SEND_MESSAGE");
    }

    asio::awaitable<result_void> send_presence(const presence& pres)
    {
        [[maybe_unused]] auto guard = co_await write_mutex_.lock();
        co_return co_await send_impl(encode(pres), "SEND_PRESENCE");
    }

    /// Writes caller supplied markup verbatim.
    asio::awaitable<result_void> send_raw(std::string xml)
    {
        [[maybe_unused]] auto guard = co_await write_mutex_.lock();
        co_return co_await send_impl(std::move(xml), "SEND_RAW");
    }

    /// Ends the stream and shuts the transport down. Closing twice is a no-op.
    asio::awaitable<result_void> close()
    {
        [[maybe_unused]] auto guard = co_await write_mutex_.lock();
        co_return co_await close_impl();
    }

    dialog_type& dialog() { return *dlg_; }
    const dialog_type& dialog() const { return *dlg_; }

private:
    void configure_trace()
    {
        dlg_->set_trace_protocol("XMPP");
        dlg_->set_trace_redaction(options_.redact_secrets_in_trace);
        dlg_->set_trace_sink(options_.trace);
    }

    void attach(net::upgradable_stream stream)
    {
        reader_.reset();
        dlg_.emplace(std::move(stream), options_.timeout);
        configure_trace();
        reader_.emplace(*dlg_, options_.max_stanza_size);
        read_failed_ = false;
        write_failed_ = false;
        jid_.clear();
        stream_id_.clear();
        features_ = stream_features{};
    }

    void set_state(state_t next)
    {
        const state_t previous = state_.exchange(next);
        if (previous != next)
            XMPPXX_DEBUG("XMPP state " + std::string(state_name(previous)) + " -> " + std::string(state_name(next)));
    }

    [[nodiscard]] result_void ensure_can_open(std::string_view operation) const
    {
        const state_t current = state_.load();
        if (current != state_t::DISCONNECTED && current != state_t::FAILED && current != state_t::CLOSED)
            return fail_void(errc::xmpp_invalid_state, std::string(operation) + ": invalid state",
                make_xmpp_detail(operation, state_name(current)));
        return ok();
    }

    [[nodiscard]] result_void ensure_ready(std::string_view operation, bool path_failed) const
    {
        const state_t current = state_.load();
        if (current != state_t::READY)
            return fail_void(errc::xmpp_invalid_state, std::string(operation) + ": invalid state",
                make_xmpp_detail(operation, state_name(current)));
        if (path_failed)
            return fail_void(errc::xmpp_invalid_state, std::string(operation) + ": session unusable after an earlier failure",
                make_xmpp_detail(operation, state_name(current)));
        return ok();
    }

    asio::awaitable<result_void> connect_impl(std::string host, std::string service, net::tls_mode mode,
        asio::ssl::context* tls_ctx, std::string sni)
    {
        XMPPXX_CO_TRY_VOID(ensure_can_open("CONNECT"));
        auto res = co_await dial(std::move(host), std::move(service), mode, tls_ctx, std::move(sni));
        if (!res)
            set_state(state_t::FAILED);
        co_return res;
    }

    asio::awaitable<result_void> dial(std::string host, std::string service, net::tls_mode mode,
        asio::ssl::context* tls_ctx, std::string sni)
    {
        XMPPXX_CO_TRY_ASSIGN(const jid_parts parts, split_jid(options_.jid));
        if (host.empty())
            host = parts.domain;
        if (service.empty())
            service = DEFAULT_SERVICE;
        if (sni.empty())
            sni = host;

        if (mode != net::tls_mode::none && tls_ctx == nullptr)
        {
            auto details = make_xmpp_detail("CONNECT");
            details.add("tls_mode", net::to_string(mode));
            co_return fail_void(errc::config_invalid_argument, "TLS context is required.", details);
        }

        asio::tcp::resolver resolver(executor_);
        asio::error_code ec;
        auto endpoints = co_await resolver.async_resolve(host, service, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return fail<void>(with_endpoint(net::make_net_error(net::io_stage::resolve, ec, "resolve"), host, service));

        net::upgradable_stream stream(executor_);
        co_await asio::async_connect(stream.lowest_layer(), endpoints, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return fail<void>(with_endpoint(net::make_net_error(net::io_stage::connect, ec, "connect"), host, service));

        if (mode == net::tls_mode::implicit)
            XMPPXX_CO_TRY_VOID(co_await stream.start_tls(*tls_ctx, sni, options_.tls));

        attach(std::move(stream));
        co_return co_await negotiate(tls_ctx, std::move(sni));
    }

    static error_info with_endpoint(error_info err, std::string_view host, std::string_view service)
    {
        detail::error_detail extra;
        extra.add("host", host);
        extra.add("service", service);
        err.detail += extra.str();
        return err;
    }

    asio::awaitable<result_void> open_impl(net::upgradable_stream stream, asio::ssl::context* tls_ctx, std::string sni)
    {
        XMPPXX_CO_TRY_VOID(ensure_can_open("OPEN"));
        attach(std::move(stream));
        co_return co_await negotiate(tls_ctx, std::move(sni));
    }

    // Any failure is terminal: the transport is closed and the client left FAILED.
    asio::awaitable<result_void> negotiate(asio::ssl::context* tls_ctx, std::string sni)
    {
        auto res = co_await negotiate_steps(tls_ctx, std::move(sni));
        if (!res)
        {
            XMPPXX_DEBUG("XMPP negotiation failed in state " + std::string(state_name(state_.load())) + ": "
                + to_string(res.error()));
            co_await dlg_->stream().close();
            set_state(state_t::FAILED);
        }
        co_return res;
    }

    asio::awaitable<result_void> negotiate_steps(asio::ssl::context* tls_ctx, std::string sni)
    {
        XMPPXX_CO_TRY_ASSIGN(jid_parts parts, split_jid(options_.jid));
        local_ = std::move(parts.local);
        domain_ = std::move(parts.domain);
        if (sni.empty())
            sni = domain_;

        set_state(state_t::STREAM_OPENED);
        XMPPXX_CO_TRY_ASSIGN(stream_features features, co_await open_stream("OPEN_STREAM", true));
        XMPPXX_CO_TRY_ASSIGN(features, co_await negotiate_tls(std::move(features), tls_ctx, std::move(sni)));
        XMPPXX_CO_TRY_VOID(co_await authenticate(features));

        set_state(state_t::STREAM_RESTARTED);
        XMPPXX_CO_TRY_ASSIGN(features_, co_await open_stream("RESTART_STREAM", false));

        XMPPXX_CO_TRY_VOID(co_await bind_resource());
        if (features_.session && options_.session)
            XMPPXX_CO_TRY_VOID(co_await establish_session());

        set_state(state_t::PRESENCE_SENT);
        XMPPXX_CO_TRY_VOID(co_await write(encode_initial_presence(options_.initial_presence.show,
            options_.initial_presence.status)));
        set_state(state_t::READY);
        co_return ok();
    }

    asio::awaitable<result_void> write(const std::string& data)
    {
        co_return co_await dlg_->write(data);
    }

    /**
    Sending the stream header and reading the server root and features.

    @param step   Name of the negotiation step, for diagnostics.
    @param strict When false, features that fail to decode are treated as empty; transport
                  errors and stream errors still fail.
    **/
    asio::awaitable<result<stream_features>> open_stream(std::string_view step, bool strict)
    {
        XMPPXX_CO_TRY_VOID(co_await write(encode_stream_header(domain_)));

        XMPPXX_CO_TRY_ASSIGN(decoded_element root, co_await reader_->next_element());
        if (!std::holds_alternative<stream_header>(root.value))
            co_return detail::make_unexpected(unexpected_at(step, root.name));
        stream_id_ = std::get<stream_header>(root.value).id;
        set_state(state_t::AWAITING_FEATURES);

        auto next = co_await reader_->next_element();
        if (!next)
        {
            if (strict || !is_protocol_error(next.error().code))
                co_return detail::make_unexpected(std::move(next).error());
            XMPPXX_DEBUG("Ignoring undecodable stream features: " + to_string(next.error()));
            co_return stream_features{};
        }
        if (const auto* err = std::get_if<stream_error>(&next->value))
            co_return detail::make_unexpected(stream_error_at(step, *err));
        if (auto* features = std::get_if<stream_features>(&next->value))
            co_return std::move(*features);
        if (strict)
            co_return detail::make_unexpected(unexpected_at(step, next->name));
        XMPPXX_DEBUG("Ignoring <" + next->name.local + "/> in place of stream features.");
        co_return stream_features{};
    }

    asio::awaitable<result<stream_features>> negotiate_tls(stream_features features, asio::ssl::context* tls_ctx,
        std::string sni)
    {
        if (dlg_->stream().is_tls())
            co_return features;

        const bool offered = features.starttls.has_value();
        const bool can_upgrade = offered && options_.starttls != starttls_policy::none && tls_ctx != nullptr;
        if (!can_upgrade)
        {
            if (offered && features.starttls->required)
                co_return fail<stream_features>(errc::tls_negotiation_failed,
                    "Server requires STARTTLS but no upgrade is possible.",
                    make_xmpp_detail("STARTTLS", tls_ctx == nullptr ? "no TLS context" : "disabled by policy"));
            if (options_.starttls == starttls_policy::required)
                co_return fail<stream_features>(errc::tls_negotiation_failed,
                    "STARTTLS required by configuration but not available.",
                    make_xmpp_detail("STARTTLS", offered ? "no TLS context" : "not offered"));
            co_return features;
        }

        set_state(state_t::TLS_NEGOTIATING);
        XMPPXX_CO_TRY_VOID(co_await write(encode_starttls_request()));
        auto reply = co_await reader_->next_element();
        if (!reply)
        {
            if (!is_protocol_error(reply.error().code))
                co_return detail::make_unexpected(std::move(reply).error());
            co_return fail<stream_features>(errc::tls_negotiation_failed,
                "STARTTLS answer not understood: " + reply.error().message, reply.error().detail);
        }
        if (!std::holds_alternative<tls_proceed>(reply->value))
            co_return fail<stream_features>(errc::tls_negotiation_failed,
                std::holds_alternative<tls_failure>(reply->value) ? "Server refused STARTTLS." : "Unexpected STARTTLS answer.",
                make_xmpp_detail("STARTTLS", reply->name));

        XMPPXX_CO_TRY_VOID(co_await dlg_->stream().start_tls(*tls_ctx, std::move(sni), options_.tls));

        set_state(state_t::STREAM_RESTARTED);
        co_return co_await open_stream("STARTTLS_RESTART", true);
    }

    asio::awaitable<result_void> authenticate(const stream_features& features)
    {
        XMPPXX_CO_TRY_ASSIGN(const sasl::mechanism mech, sasl::select_mechanism(features.mechanisms, options_.auth_external));
        XMPPXX_CO_TRY_VOID(detail::ensure_auth_allowed(dlg_->stream().is_tls(), options_, errc::security_cleartext_auth));

        const std::string payload = mech == sasl::mechanism::plain
            ? sasl::encode_plain(local_, options_.password)
            : std::string();
        set_state(state_t::AUTH_SENT);
        XMPPXX_CO_TRY_VOID(co_await write(encode_auth(sasl::to_string(mech), payload)));

        XMPPXX_CO_TRY_ASSIGN(decoded_element reply, co_await reader_->next_element());
        if (const auto* failure = std::get_if<sasl_failure>(&reply.value))
        {
            auto details = make_xmpp_detail("AUTH", failure->condition);
            details.add("mechanism", sasl::to_string(mech));
            details.add("text", failure->text);
            const std::string reason = failure->condition.local.empty() ? std::string("unknown") : failure->condition.local;
            co_return fail_void(errc::sasl_auth_failed, "auth failure: " + reason, details);
        }
        if (!std::holds_alternative<sasl_success>(reply.value))
            co_return detail::make_unexpected(unexpected_at("AUTH", reply.name));

        set_state(state_t::AUTHENTICATED);
        co_return ok();
    }

    asio::awaitable<result_void> bind_resource()
    {
        set_state(state_t::BIND_SENT);
        XMPPXX_CO_TRY_VOID(co_await write(encode_bind_request(options_.resource)));

        XMPPXX_CO_TRY_ASSIGN(decoded_element reply, co_await reader_->next_element());
        const auto* query = std::get_if<iq>(&reply.value);
        if (query == nullptr)
            co_return detail::make_unexpected(unexpected_at("BIND", reply.name));
        if (query->type == "error" || query->error.has_value())
        {
            const xml::qname condition = query->error ? query->error->condition : xml::qname{};
            co_return fail_void(errc::xmpp_bind_failed, "resource binding refused: "
                + (condition.local.empty() ? std::string("unknown") : condition.local),
                make_xmpp_detail("BIND", condition));
        }
        if (!query->bind.has_value() || query->bind->jid.empty())
            co_return fail_void(errc::xmpp_missing_element, "bind result carries no JID.",
                make_xmpp_detail("BIND", xml::qname{std::string(ns::bind), "jid"}));

        jid_ = query->bind->jid;
        co_return ok();
    }

    asio::awaitable<result_void> establish_session()
    {
        set_state(state_t::SESSION_SENT);
        XMPPXX_CO_TRY_VOID(co_await write(encode_session_request(domain_)));

        XMPPXX_CO_TRY_ASSIGN(decoded_element reply, co_await reader_->next_element());
        const auto* query = std::get_if<iq>(&reply.value);
        if (query == nullptr)
            co_return detail::make_unexpected(unexpected_at("SESSION", reply.name));
        if (query->type != "result")
        {
            const xml::qname condition = query->error ? query->error->condition : xml::qname{};
            co_return fail_void(errc::xmpp_session_failed, "session establishment refused: "
                + (condition.local.empty() ? std::string("unknown") : condition.local),
                make_xmpp_detail("SESSION", condition));
        }
        co_return ok();
    }

    asio::awaitable<result<decoded_element>> next_element_impl(std::string_view operation)
    {
        XMPPXX_CO_TRY_VOID(ensure_ready(operation, read_failed_.load()));
        auto next = co_await reader_->next_element();
        // An unmapped element has been consumed whole; the stream is still in step.
        if (!next && next.error().code != errc::xmpp_unexpected_element)
            read_failed_ = true;
        co_return next;
    }

    asio::awaitable<result<event>> recv_impl()
    {
        for (;;)
        {
            XMPPXX_CO_TRY_ASSIGN(decoded_element next, co_await next_element_impl("RECV"));
            if (auto* msg = std::get_if<message>(&next.value))
                co_return event{std::move(*msg)};
            if (auto* pres = std::get_if<presence>(&next.value))
                co_return event{std::move(*pres)};
            if (const auto* err = std::get_if<stream_error>(&next.value))
                XMPPXX_WARN("XMPP stream error from server: " + err->condition.local + " " + err->text);
            else
                XMPPXX_DEBUG("Discarding <" + next.name.local + "/> in namespace '" + next.name.ns + "'");
        }
    }

    // A failed write leaves the peer in an unknown state: nothing more is written.
    asio::awaitable<result_void> send_impl(std::string data, std::string_view operation)
    {
        XMPPXX_CO_TRY_VOID(ensure_ready(operation, write_failed_.load()));
        auto res = co_await write(data);
        if (!res)
            write_failed_ = true;
        co_return res;
    }

    asio::awaitable<result_void> close_impl()
    {
        const state_t current = state_.load();
        if (!dlg_.has_value() || current == state_t::CLOSED || current == state_t::DISCONNECTED)
            co_return ok();

        if (current == state_t::READY && !write_failed_.load())
        {
            auto res = co_await write(encode_stream_close());
            if (!res)
                XMPPXX_DEBUG("Stream end not delivered: " + to_string(res.error()));
        }
        co_await dlg_->stream().close();
        set_state(state_t::CLOSED);
        co_return ok();
    }

    options options_;
    asio::any_io_executor executor_;
    detail::async_mutex read_mutex_;
    detail::async_mutex write_mutex_;
    std::optional<dialog_type> dlg_;
    std::optional<reader_type> reader_;
    std::atomic<state_t> state_{state_t::DISCONNECTED};
    std::atomic<bool> read_failed_{false};
    std::atomic<bool> write_failed_{false};
    std::string local_;
    std::string domain_;
    std::string jid_;
    std::string stream_id_;
    stream_features features_;
};

} // namespace xmppxx
