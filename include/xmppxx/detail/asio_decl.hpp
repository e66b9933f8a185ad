/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio declarations for xmppxx.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_future.hpp>

namespace xmppxx::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    namespace this_coro = boost::asio::this_coro;
    using boost::asio::use_future;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;
    using boost::asio::mutable_buffer;
    using boost::asio::const_buffer;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    // Async operations
    using boost::asio::async_write;
    using boost::asio::async_connect;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace xmppxx::asio

#else
#error "xmppxx requires coroutine support (C++20) and Boost.Asio 1.18+"
#endif

namespace xmppxx
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
