/*

element.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <xmppxx/xml/qname.hpp>
#include <xmppxx/xml/token_reader.hpp>

namespace xmppxx::xml
{

/**
Fully parsed XML subtree.

`text` holds the element's own character data (entity references decoded, children
excluded). `inner_xml` holds the markup between the start and end tags exactly as
it was received, and `namespaces` the bindings that markup uses without declaring
them: prefixes declared on this element or an ancestor, and the default namespace
when it differs from the element's own namespace.
**/
struct element
{
    qname name;
    std::vector<attribute> attributes;
    std::vector<element> children;
    std::string text;
    std::string inner_xml;
    std::vector<namespace_decl> namespaces;

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

    /// Value of a namespaced attribute, or nullptr.
    [[nodiscard]] const std::string* attr(std::string_view ns, std::string_view local) const noexcept
    {
        for (const auto& a : attributes)
        {
            if (a.name.matches(ns, local))
                return &a.value;
        }
        return nullptr;
    }

    [[nodiscard]] std::string attr_or_empty(std::string_view local) const
    {
        const auto* value = attr(local);
        return value != nullptr ? *value : std::string();
    }

    /// First child with the given qualified name, or nullptr.
    [[nodiscard]] const element* child(std::string_view ns, std::string_view local) const noexcept
    {
        for (const auto& c : children)
        {
            if (c.name.matches(ns, local))
                return &c;
        }
        return nullptr;
    }
};

/**
Assembles an element from the tokens following its start token.

Feed every token with `add()` until it returns true; the element is then complete and
can be taken. Raw inner markup is sliced from the reader, so the bytes of the subtree
must not be released before completion.
**/
class element_builder
{
public:
    /**
    @param start     Start token of the element.
    @param inherited Declarations in scope at the start tag, from outer elements; later
                     entries override earlier ones.
    **/
    explicit element_builder(const token& start, std::vector<namespace_decl> inherited = {})
    {
        open(start, std::move(inherited));
    }

    /**
    Consuming the next token of the subtree.

    @param tok    Token popped from `reader`.
    @param reader Reader still retaining the subtree bytes.
    @return       True once the end tag of the root element has been consumed.
    **/
    bool add(const token& tok, const token_reader& reader)
    {
        switch (tok.kind)
        {
            case token_kind::start_element:
                open(tok, stack_.back().scope);
                return false;

            case token_kind::char_data:
                stack_.back().node.text += tok.text;
                return false;

            case token_kind::end_element:
            {
                frame done = std::move(stack_.back());
                stack_.pop_back();
                done.node.inner_xml = std::string(reader.raw(done.content_begin, tok.begin));
                done.node.namespaces = bindings_for(done);
                end_ = tok.end;

                if (stack_.empty())
                {
                    result_ = std::move(done.node);
                    return true;
                }
                for (const auto& prefix : done.free)
                    mark_used(stack_.back(), prefix, true);
                stack_.back().node.children.push_back(std::move(done.node));
                return false;
            }
        }
        return false;
    }

    [[nodiscard]] bool complete() const noexcept
    {
        return stack_.empty();
    }

    /// Offset just past the end tag of the root element.
    [[nodiscard]] std::uint64_t end() const noexcept
    {
        return end_;
    }

    [[nodiscard]] element take()
    {
        return std::move(result_);
    }

private:
    struct frame
    {
        element node;
        std::uint64_t content_begin{0};
        /// Bindings in effect inside the element.
        std::vector<namespace_decl> scope;
        /// Prefixes declared on the start tag.
        std::vector<std::string> declared;
        /// Prefixes used by the content and not declared within it.
        std::vector<std::string> inner_free;
        /// Prefixes used by the element or its content and not declared within them.
        std::vector<std::string> free;
    };

    static void add_unique(std::vector<std::string>& set, const std::string& prefix)
    {
        if (std::find(set.begin(), set.end(), prefix) == set.end())
            set.push_back(prefix);
    }

    // An unprefixed element name relies on the default namespace, written as the empty prefix.
    static void mark_used(frame& f, const std::string& prefix, bool from_child = false)
    {
        if (prefix == "xml")
            return;
        if (from_child)
            add_unique(f.inner_free, prefix);
        if (std::find(f.declared.begin(), f.declared.end(), prefix) == f.declared.end())
            add_unique(f.free, prefix);
    }

    void open(const token& start, std::vector<namespace_decl> scope)
    {
        frame f;
        f.node.name = start.name;
        f.node.attributes = start.attributes;
        f.content_begin = start.end;
        f.scope = std::move(scope);
        for (const auto& decl : start.namespaces)
        {
            f.scope.push_back(decl);
            add_unique(f.declared, decl.prefix);
        }
        mark_used(f, start.prefix);
        for (const auto& att : start.attributes)
        {
            if (!att.prefix.empty())
                mark_used(f, att.prefix);
        }
        stack_.push_back(std::move(f));
    }

    static const namespace_decl* find_binding(const std::vector<namespace_decl>& scope, const std::string& prefix)
    {
        for (auto it = scope.rbegin(); it != scope.rend(); ++it)
        {
            if (it->prefix == prefix)
                return &*it;
        }
        return nullptr;
    }

    static std::vector<namespace_decl> bindings_for(const frame& f)
    {
        std::vector<namespace_decl> out;
        for (const auto& prefix : f.inner_free)
        {
            const namespace_decl* decl = find_binding(f.scope, prefix);
            if (prefix.empty())
            {
                const std::string uri = decl != nullptr ? decl->uri : std::string();
                if (uri != f.node.name.ns)
                    out.push_back(namespace_decl{prefix, uri});
            }
            else if (decl != nullptr)
                out.push_back(*decl);
        }
        std::sort(out.begin(), out.end(), [](const namespace_decl& a, const namespace_decl& b)
        {
            return a.prefix < b.prefix;
        });
        return out;
    }

    std::vector<frame> stack_;
    element result_;
    std::uint64_t end_{0};
};

} // namespace xmppxx::xml
