/*

throwing.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Bridges xmppxx::result into exceptions for callers that prefer them.

*/

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <xmppxx/config.hpp>
#include <xmppxx/detail/result.hpp>

namespace xmppxx
{

#if !XMPPXX_THROWING_ENABLED
#error "XMPPXX_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error_info info)
        : std::runtime_error(to_string(info)),
          info_(std::move(info))
    {
    }

    [[nodiscard]] const error_info& info() const noexcept { return info_; }

    [[nodiscard]] errc code() const noexcept { return info_.code; }

private:
    error_info info_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result<void>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

} // namespace xmppxx
