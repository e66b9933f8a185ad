/*

stream_reader.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <xmppxx/detail/asio_decl.hpp>
#include <xmppxx/detail/error_detail.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/net/dialog.hpp>
#include <xmppxx/stanza/decoder.hpp>
#include <xmppxx/stanza/namespaces.hpp>
#include <xmppxx/xml/element.hpp>
#include <xmppxx/xml/token_reader.hpp>

namespace xmppxx
{

/**
Pulls decoded elements out of the byte stream of a dialog.

The token reader lives as long as the session, so a stream restart, or a TLS
upgrade performed on the dialog's stream, does not lose any parsing state.
Bytes of consumed elements are released; at most `max_stanza_size` bytes are
retained while an element is being assembled.
**/
template<typename Dialog>
class stream_reader
{
public:
    stream_reader(Dialog& dialog, std::size_t max_stanza_size)
        : dialog_(&dialog),
          max_stanza_size_(max_stanza_size)
    {
    }

    stream_reader(const stream_reader&) = delete;
    stream_reader& operator=(const stream_reader&) = delete;

    /// Next raw token, reading from the transport as needed.
    asio::awaitable<result<xml::token>> next_token()
    {
        while (!tokens_.has_token())
        {
            XMPPXX_CO_TRY_ASSIGN(const std::size_t n, co_await dialog_->read_some(asio::buffer(chunk_)));
            XMPPXX_CO_TRY_VOID(tokens_.feed(std::string_view(chunk_.data(), n)));
            if (tokens_.retained() > max_stanza_size_)
            {
                detail::error_detail detail;
                detail.add("proto", "XMPP");
                detail.add_int("retained", tokens_.retained());
                detail.add_int("limit", max_stanza_size_);
                co_return fail<xml::token>(errc::xml_stanza_too_large, "Incoming stanza exceeds the size limit.", detail);
            }
        }
        co_return std::move(*tokens_.next());
    }

    /**
    Skipping to the next start element.

    Character data between top level elements is dropped. The end tag of the stream
    root ends the conversation and is reported as `net_eof`.
    **/
    asio::awaitable<result<xml::token>> next_start()
    {
        for (;;)
        {
            XMPPXX_CO_TRY_ASSIGN(xml::token tok, co_await next_token());
            if (tok.kind == xml::token_kind::start_element)
                co_return tok;

            tokens_.release(tok.end);
            if (tok.kind == xml::token_kind::end_element && tok.name.matches(ns::stream, "stream"))
            {
                detail::error_detail detail;
                detail.add("proto", "XMPP");
                detail.add("reason", "stream root closed");
                co_return fail<xml::token>(errc::net_eof, "Stream closed by server.", detail);
            }
        }
    }

    /**
    Reading and decoding the next element.

    @return The qualified name with the decoded value, or `xmpp_unexpected_element` naming
            the namespace and local name when the element has no decoder.
    **/
    asio::awaitable<result<decoded_element>> next_element()
    {
        XMPPXX_CO_TRY_ASSIGN(xml::token start, co_await next_start());

        const decoder_entry* entry = find_decoder(start.name);
        if (entry == nullptr)
        {
            XMPPXX_CO_TRY_VOID(co_await skip_element(start));
            co_return detail::make_unexpected(unexpected_element(start.name));
        }

        if (entry->open_ended)
        {
            xml::element root;
            root.name = start.name;
            root.attributes = std::move(start.attributes);
            root_scope_.insert(root_scope_.end(), start.namespaces.begin(), start.namespaces.end());
            tokens_.release(start.end);
            co_return decode(root);
        }

        xml::element_builder builder(start, root_scope_);
        while (!builder.complete())
        {
            XMPPXX_CO_TRY_ASSIGN(xml::token tok, co_await next_token());
            builder.add(tok, tokens_);
        }
        tokens_.release(builder.end());
        co_return decode(builder.take());
    }

    /// Consumes the rest of the element opened by `start`, releasing its bytes as they arrive.
    asio::awaitable<result<void>> skip_element(const xml::token& start)
    {
        tokens_.release(start.end);
        std::size_t depth = 1;
        while (depth > 0)
        {
            XMPPXX_CO_TRY_ASSIGN(xml::token tok, co_await next_token());
            if (tok.kind == xml::token_kind::start_element)
                ++depth;
            else if (tok.kind == xml::token_kind::end_element)
                --depth;
            tokens_.release(tok.end);
        }
        co_return ok();
    }

    [[nodiscard]] const xml::token_reader& tokens() const noexcept
    {
        return tokens_;
    }

private:
    Dialog* dialog_;
    std::size_t max_stanza_size_;
    xml::token_reader tokens_;
    /// Declarations of the stream roots opened so far, restarts included.
    std::vector<xml::namespace_decl> root_scope_;
    std::array<char, net::DEFAULT_READ_CHUNK> chunk_{};
};

} // namespace xmppxx
