/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <xmppxx/detail/asio_decl.hpp>
#include <xmppxx/detail/log.hpp>
#include <xmppxx/detail/redact.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/net/error_mapping.hpp>

namespace xmppxx
{
namespace net
{

using namespace xmppxx::asio;

/// Size of a single transport read.
inline constexpr std::size_t DEFAULT_READ_CHUNK = 4096;

/**
Byte oriented conversation with the XMPP server.

Wraps a Boost.Asio stream (socket, upgradable stream, ...) and adds an optional
deadline to every read and write. XMPP is not line based, so reads return whatever
chunk the transport delivers and framing is left to the XML token reader.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    explicit dialog(Stream stream, std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          timeout_(timeout)
    {
    }

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_secrets_in_trace_ = enabled;
    }

    /// Routes this dialog's trace to `sink` instead of the global logger; an empty sink restores the logger.
    void set_trace_sink(log::trace_sink_t sink)
    {
        trace_sink_ = std::move(sink);
    }

    /**
    Reading the next chunk of bytes.

    @param buffer Destination.
    @return       Number of bytes read, `net_eof` on a clean close, `net_timeout` when the deadline expires.
    **/
    awaitable<result<std::size_t>> read_some(mutable_buffer buffer)
    {
        error_code ec;
        std::size_t n = 0;
        if (read_timed_out_)
            ec = error::timed_out;
        else
            n = co_await async_with_timeout<void(error_code, std::size_t)>(io_stage::read,
                [this, buffer](auto handler) mutable
                {
                    stream_.async_read_some(buffer, std::move(handler));
                }, redirect_error(use_awaitable, ec));
        if (ec)
            co_return detail::make_unexpected(make_net_error(io_stage::read, ec, "read"));
        trace(log::direction::receive, std::string_view(static_cast<const char*>(buffer.data()), n));
        co_return n;
    }

    /**
    Writing a complete serialized unit with one composed write.

    A failure leaves the peer in an unknown state: the data may be partially delivered
    and is never retried.
    **/
    awaitable<result<void>> write(std::string_view data)
    {
        trace(log::direction::send, data);
        std::string payload(data);
        error_code ec;
        if (write_timed_out_)
            ec = error::timed_out;
        else
            co_await async_with_timeout<void(error_code, std::size_t)>(io_stage::write,
                [this, &payload](auto handler) mutable
                {
                    async_write(stream_, buffer(payload), std::move(handler));
                }, redirect_error(use_awaitable, ec));
        if (ec)
            co_return detail::make_unexpected(make_net_error(io_stage::write, ec, "write"));
        co_return ok();
    }

    template<typename Signature, typename Initiation, typename CompletionToken>
    auto async_with_timeout(io_stage stage, Initiation initiation, CompletionToken&& token)
    {
        if (timeout_.has_value())
            return async_with_timeout<Signature>(stage, *timeout_, std::move(initiation), std::forward<CompletionToken>(token));

        return boost::asio::async_compose<CompletionToken, Signature>(
            [initiation = std::move(initiation), started = false](auto& self, error_code ec = {}, auto... results) mutable
            {
                if (!started)
                {
                    started = true;
                    initiation(std::move(self));
                    return;
                }
                if constexpr (requires { self.complete(ec, std::move(results)...); })
                    self.complete(ec, std::move(results)...);
            }, token, stream_);
    }

    /**
    Running a read or a write under a deadline.

    On expiry only the direction of `stage` is shut down on the socket, which wakes the
    pending operation while an operation in the other direction carries on. The
    direction stays closed and later operations in it fail with `net_timeout`.
    **/
    template<typename Signature, typename Initiation, typename CompletionToken>
    auto async_with_timeout(io_stage stage, duration timeout, Initiation initiation, CompletionToken&& token)
    {
        struct timeout_state
        {
            std::atomic_bool timed_out{false};
        };

        return boost::asio::async_compose<CompletionToken, Signature>(
            [this, stage, initiation = std::move(initiation), timeout,
                state = std::make_shared<timeout_state>(),
                timer = std::shared_ptr<steady_timer>(),
                started = false](auto& self, error_code ec = {}, auto... results) mutable
            {
                if (!started)
                {
                    started = true;
                    timer = std::make_shared<steady_timer>(stream_.get_executor());
                    timer->expires_after(timeout);
                    timer->async_wait([this, stage, state](error_code timer_ec)
                    {
                        if (timer_ec)
                            return;
                        state->timed_out.store(true);
                        shut_down(stage);
                    });
                    initiation(std::move(self));
                    return;
                }
                if (timer)
                    timer->cancel();
                if (state->timed_out.load())
                    ec = error::timed_out;
                if constexpr (requires { self.complete(ec, std::move(results)...); })
                    self.complete(ec, std::move(results)...);
            }, token, stream_);
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

    void timeout(std::optional<duration> value) noexcept { timeout_ = value; }
    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

protected:
    Stream stream_;
    std::optional<duration> timeout_;

    bool read_timed_out_{false};
    bool write_timed_out_{false};

    std::string trace_protocol_{"XMPP"};
    bool redact_secrets_in_trace_{true};
    log::trace_sink_t trace_sink_;

    void shut_down(io_stage stage)
    {
        error_code ignore_ec;
        if (stage == io_stage::write)
        {
            write_timed_out_ = true;
            stream_.lowest_layer().shutdown(tcp::socket::shutdown_send, ignore_ec);
            return;
        }
        read_timed_out_ = true;
        stream_.lowest_layer().shutdown(tcp::socket::shutdown_receive, ignore_ec);
    }

    void trace(log::direction dir, std::string_view data) const
    {
        auto& logger = log::logger::instance();
        if (!trace_sink_ && !logger.is_trace_enabled())
            return;

        std::string redacted;
        if (dir == log::direction::send && redact_secrets_in_trace_)
        {
            redacted = detail::redact_xml(data);
            data = redacted;
        }
        if (trace_sink_)
            trace_sink_(trace_protocol_, dir, data);
        else
            logger.trace_protocol(trace_protocol_, dir, data);
    }
};

} // namespace net
} // namespace xmppxx
