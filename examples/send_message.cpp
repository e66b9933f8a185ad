/*

send_message.cpp
----------------

Connects to an XMPP server with STARTTLS, sends one chat message and closes the stream.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <xmppxx/client/client.hpp>
#include <xmppxx/net/tls_mode.hpp>
#include "example_util.hpp"


using xmppxx::client;
using std::cout;
using std::endl;


int main()
{
    boost::asio::io_context io_ctx;
    boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
    int status = EXIT_SUCCESS;

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            xmppxx::options options;
            // modify to use an existing account
            options.jid = "xmppxx@example.org";
            options.password = "xmppxxpass";
            options.resource = "example";
            options.starttls = xmppxx::starttls_policy::required;
            options.tls.verify = xmppxx::net::verify_mode::peer;
            options.tls.verify_host = true;
            options.timeout = std::chrono::seconds(30);

            client conn(io_ctx.get_executor(), options);
            auto connected = co_await conn.connect("", "5222", xmppxx::net::tls_mode::starttls, &ssl_ctx);
            if (!connected)
            {
                print_error(connected.error());
                status = EXIT_FAILURE;
                co_return;
            }
            cout << "Bound as " << conn.jid() << endl;

            auto sent = co_await conn.send_message("friend@example.org", "Hello from xmppxx!");
            if (!sent)
            {
                print_error(sent.error());
                status = EXIT_FAILURE;
            }
            auto closed = co_await conn.close();
            if (!closed)
                print_error(closed.error());
        },
        boost::asio::detached);

    io_ctx.run();
    return status;
}
