/*

token_reader.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <expat.h>
#include <xmppxx/detail/error_detail.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/xml/qname.hpp>

namespace xmppxx::xml
{

enum class token_kind
{
    start_element,
    end_element,
    char_data
};

struct attribute
{
    qname name;
    std::string value;
    /// Prefix as written, empty for unprefixed attributes.
    std::string prefix;
};

/**
One parse event.

`begin` and `end` are absolute byte offsets into the input stream (after removal of
XML declarations) delimiting the markup the token was parsed from. For an empty
element the end token has `begin == end`, placed just after `/>`.
**/
struct token
{
    token_kind kind{token_kind::char_data};
    qname name;
    /// Prefix of the element name as written.
    std::string prefix;
    std::vector<attribute> attributes;
    /// Declarations made on this start tag.
    std::vector<namespace_decl> namespaces;
    std::string text;
    std::uint64_t begin{0};
    std::uint64_t end{0};

    /// Value of an attribute without namespace, or nullptr.
    [[nodiscard]] const std::string* attr(std::string_view local) const noexcept
    {
        for (const auto& a : attributes)
        {
            if (a.name.ns.empty() && a.name.local == local)
                return &a.value;
        }
        return nullptr;
    }
};

/**
Incremental XML token reader over an endless document.

Bytes are pushed with `feed()` and tokens pulled with `next()`. The reader never
requires the document to end: a stream restart simply shows up as a new start element
nested in the previous root, and parsing continues with the same state. The raw bytes
of unreleased tokens stay available through `raw()` so that callers can capture the
exact markup of a subtree.

XML declarations outside comments and CDATA sections are removed before parsing,
since a restarted stream repeats one in the middle of the document.
**/
class token_reader
{
public:
    static constexpr char NS_SEPARATOR = '\x01';

    token_reader()
        : parser_(XML_ParserCreateNS(nullptr, NS_SEPARATOR), &XML_ParserFree)
    {
        if (parser_ == nullptr)
            return;
        XML_SetUserData(parser_.get(), this);
        XML_SetElementHandler(parser_.get(), &token_reader::on_start, &token_reader::on_end);
        XML_SetCharacterDataHandler(parser_.get(), &token_reader::on_char_data);
        XML_SetNamespaceDeclHandler(parser_.get(), &token_reader::on_namespace_decl, nullptr);
        XML_SetReturnNSTriplet(parser_.get(), XML_TRUE);
#if XML_MAJOR_VERSION > 2 || (XML_MAJOR_VERSION == 2 && XML_MINOR_VERSION >= 6)
        // Tokens must surface as soon as their bytes arrive.
        XML_SetReparseDeferralEnabled(parser_.get(), XML_FALSE);
#endif
    }

    token_reader(const token_reader&) = delete;
    token_reader& operator=(const token_reader&) = delete;

    /**
    Parsing more input.

    @param bytes Next chunk as received from the transport; may split tokens anywhere.
    @return      `xml_parse_error` on malformed input. The reader stays failed afterwards.
    **/
    [[nodiscard]] result<void> feed(std::string_view bytes)
    {
        if (parser_ == nullptr)
            return fail<void>(errc::internal_error, "XML parser allocation failed.");
        if (failed_)
            return fail<void>(errc::xml_parse_error, "XML stream already failed: " + failure_);

        const std::string filtered = strip_declarations(bytes);
        if (filtered.empty())
            return ok();

        buffer_.append(filtered);
        if (XML_Parse(parser_.get(), filtered.data(), static_cast<int>(filtered.size()), XML_FALSE) == XML_STATUS_ERROR)
        {
            failed_ = true;
            const XML_Error code = XML_GetErrorCode(parser_.get());
            failure_ = XML_ErrorString(code);
            detail::error_detail detail;
            detail.add("proto", "XMPP");
            detail.add("expat", failure_);
            detail.add_int("line", XML_GetCurrentLineNumber(parser_.get()));
            detail.add_int("column", XML_GetCurrentColumnNumber(parser_.get()));
            return fail<void>(errc::xml_parse_error, "Malformed XML: " + failure_, detail);
        }
        return ok();
    }

    [[nodiscard]] bool has_token() const noexcept
    {
        return !tokens_.empty();
    }

    /// Pops the oldest parsed token; empty when more input is needed.
    [[nodiscard]] std::optional<token> next()
    {
        if (tokens_.empty())
            return std::nullopt;
        token tok = std::move(tokens_.front());
        tokens_.pop_front();
        return tok;
    }

    /// Raw input bytes in [begin, end), which must not have been released.
    [[nodiscard]] std::string_view raw(std::uint64_t begin, std::uint64_t end) const noexcept
    {
        if (begin < base_ || end < begin || end > base_ + buffer_.size())
            return {};
        return std::string_view(buffer_).substr(static_cast<std::size_t>(begin - base_), static_cast<std::size_t>(end - begin));
    }

    /// Drops retained input before offset `upto`.
    void release(std::uint64_t upto)
    {
        if (upto <= base_)
            return;
        const auto count = std::min<std::uint64_t>(upto - base_, buffer_.size());
        buffer_.erase(0, static_cast<std::size_t>(count));
        base_ += count;
    }

    /// Number of input bytes currently retained.
    [[nodiscard]] std::size_t retained() const noexcept
    {
        return buffer_.size();
    }

    /// Offset of the first retained byte.
    [[nodiscard]] std::uint64_t base() const noexcept
    {
        return base_;
    }

    /// Number of currently open elements, the stream roots included.
    [[nodiscard]] std::size_t depth() const noexcept
    {
        return depth_;
    }

private:
    struct split_result
    {
        qname name;
        std::string prefix;
    };

    // Expat reports `uri SEP local [SEP prefix]`, or the bare local name outside any namespace.
    static split_result split_name(const XML_Char* name)
    {
        const std::string_view full(name);
        const auto sep = full.find(NS_SEPARATOR);
        if (sep == std::string_view::npos)
            return split_result{qname{{}, std::string(full)}, {}};

        const std::string_view rest = full.substr(sep + 1);
        const auto prefix_sep = rest.find(NS_SEPARATOR);
        split_result out;
        out.name.ns = std::string(full.substr(0, sep));
        out.name.local = std::string(rest.substr(0, prefix_sep));
        if (prefix_sep != std::string_view::npos)
            out.prefix = std::string(rest.substr(prefix_sep + 1));
        return out;
    }

    std::uint64_t current_index() const noexcept
    {
        return static_cast<std::uint64_t>(XML_GetCurrentByteIndex(parser_.get()));
    }

    std::uint64_t current_count() const noexcept
    {
        return static_cast<std::uint64_t>(XML_GetCurrentByteCount(parser_.get()));
    }

    static void XMLCALL on_start(void* user_data, const XML_Char* name, const XML_Char** atts)
    {
        auto* self = static_cast<token_reader*>(user_data);
        token tok;
        tok.kind = token_kind::start_element;
        auto split = split_name(name);
        tok.name = std::move(split.name);
        tok.prefix = std::move(split.prefix);
        for (std::size_t i = 0; atts[i] != nullptr && atts[i + 1] != nullptr; i += 2)
        {
            auto att = split_name(atts[i]);
            tok.attributes.push_back(attribute{std::move(att.name), std::string(atts[i + 1]), std::move(att.prefix)});
        }
        tok.namespaces = std::exchange(self->pending_namespaces_, {});
        tok.begin = self->current_index();
        tok.end = tok.begin + self->current_count();
        ++self->depth_;
        self->tokens_.push_back(std::move(tok));
    }

    static void XMLCALL on_end(void* user_data, const XML_Char* name)
    {
        auto* self = static_cast<token_reader*>(user_data);
        token tok;
        tok.kind = token_kind::end_element;
        auto split = split_name(name);
        tok.name = std::move(split.name);
        tok.prefix = std::move(split.prefix);
        tok.begin = self->current_index();
        tok.end = tok.begin + self->current_count();
        if (self->depth_ > 0)
            --self->depth_;
        self->tokens_.push_back(std::move(tok));
    }

    // Called before the start handler of the element carrying the declaration.
    static void XMLCALL on_namespace_decl(void* user_data, const XML_Char* prefix, const XML_Char* uri)
    {
        auto* self = static_cast<token_reader*>(user_data);
        self->pending_namespaces_.push_back(namespace_decl{
            prefix != nullptr ? std::string(prefix) : std::string(),
            uri != nullptr ? std::string(uri) : std::string()});
    }

    static void XMLCALL on_char_data(void* user_data, const XML_Char* text, int len)
    {
        auto* self = static_cast<token_reader*>(user_data);
        const auto begin = self->current_index();
        const auto end = begin + self->current_count();
        if (!self->tokens_.empty() && self->tokens_.back().kind == token_kind::char_data)
        {
            auto& last = self->tokens_.back();
            last.text.append(text, static_cast<std::size_t>(len));
            last.end = std::max(last.end, end);
            return;
        }

        token tok;
        tok.kind = token_kind::char_data;
        tok.text.assign(text, static_cast<std::size_t>(len));
        tok.begin = begin;
        tok.end = end;
        self->tokens_.push_back(std::move(tok));
    }

    enum class scan_state : std::uint8_t
    {
        markup,
        declaration,
        comment,
        cdata
    };

    // Removes `<?xml ...?>` declarations; comments and CDATA sections pass unchanged.
    // Tails that cannot be decided yet are kept for the next chunk.
    std::string strip_declarations(std::string_view bytes)
    {
        static constexpr std::string_view declaration_open{"<?xml"};
        static constexpr std::string_view comment_open{"<!--"};
        static constexpr std::string_view cdata_open{"<![CDATA["};

        std::string data = std::exchange(pending_, std::string());
        data.append(bytes);

        std::string out;
        out.reserve(data.size());
        std::size_t i = 0;
        while (i < data.size())
        {
            if (scan_ != scan_state::markup)
            {
                const std::string_view terminator = scan_ == scan_state::declaration ? "?>"
                    : scan_ == scan_state::comment ? "-->" : "]]>";
                const bool keep = scan_ != scan_state::declaration;
                const auto close = data.find(terminator, i);
                if (close == std::string::npos)
                {
                    const std::size_t tail = partial_suffix(std::string_view(data).substr(i), terminator);
                    if (keep)
                        out.append(data, i, data.size() - i - tail);
                    pending_ = data.substr(data.size() - tail);
                    break;
                }
                const std::size_t stop = close + terminator.size();
                if (keep)
                    out.append(data, i, stop - i);
                i = stop;
                scan_ = scan_state::markup;
                continue;
            }

            const auto lt = data.find('<', i);
            if (lt == std::string::npos)
            {
                out.append(data, i, std::string::npos);
                break;
            }
            out.append(data, i, lt - i);

            const std::string_view rest = std::string_view(data).substr(lt);
            if ((rest.size() <= declaration_open.size() && declaration_open.starts_with(rest))
                || (rest.size() < comment_open.size() && comment_open.starts_with(rest))
                || (rest.size() < cdata_open.size() && cdata_open.starts_with(rest)))
            {
                pending_ = std::string(rest);
                break;
            }
            if (rest.starts_with(declaration_open) && is_space(rest[declaration_open.size()]))
            {
                scan_ = scan_state::declaration;
                i = lt + declaration_open.size() + 1;
                continue;
            }
            if (rest.starts_with(comment_open) || rest.starts_with(cdata_open))
            {
                const std::string_view open = rest.starts_with(comment_open) ? comment_open : cdata_open;
                out.append(open);
                scan_ = open == comment_open ? scan_state::comment : scan_state::cdata;
                i = lt + open.size();
                continue;
            }
            out.push_back('<');
            i = lt + 1;
        }
        return out;
    }

    // Length of the longest suffix of `text` that starts `terminator` without completing it.
    static std::size_t partial_suffix(std::string_view text, std::string_view terminator) noexcept
    {
        for (std::size_t len = std::min(text.size(), terminator.size() - 1); len > 0; --len)
        {
            if (text.ends_with(terminator.substr(0, len)))
                return len;
        }
        return 0;
    }

    static bool is_space(char ch) noexcept
    {
        return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
    }

    std::unique_ptr<XML_ParserStruct, decltype(&XML_ParserFree)> parser_;
    std::deque<token> tokens_;
    std::string buffer_;
    std::uint64_t base_{0};
    std::size_t depth_{0};
    std::string pending_;
    std::vector<namespace_decl> pending_namespaces_;
    scan_state scan_{scan_state::markup};
    bool failed_{false};
    std::string failure_;
};

} // namespace xmppxx::xml
