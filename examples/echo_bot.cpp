/*

echo_bot.cpp
------------

Logs in over direct TLS and echoes every chat message back to its sender until the
server closes the stream. Errors are turned into exceptions with `xmppxx::unwrap`.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <utility>
#include <variant>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <xmppxx/client/client.hpp>
#include <xmppxx/detail/log.hpp>
#include <xmppxx/throwing.hpp>


using xmppxx::client;
using xmppxx::unwrap;
using std::cout;
using std::endl;


int main()
{
    xmppxx::log::logger::instance().set_level(xmppxx::log::level::debug);

    boost::asio::io_context io_ctx;
    boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            xmppxx::options options;
            // modify to use an existing account
            options.jid = "echo@example.org";
            options.password = "echopass";
            options.resource = "bot";
            options.initial_presence.status = "Echoing";

            client conn(io_ctx.get_executor(), options);
            try
            {
                unwrap(co_await conn.connect("xmpp.example.org", "5223",
                    xmppxx::net::tls_mode::implicit, &ssl_ctx));
                cout << "Connected as " << conn.jid() << endl;

                for (;;)
                {
                    auto received = co_await conn.recv();
                    if (!received && xmppxx::is_end_of_stream(received.error().code))
                        break;
                    xmppxx::event ev = unwrap(std::move(received));

                    auto* msg = std::get_if<xmppxx::message>(&ev);
                    if (msg == nullptr || msg->body.empty() || msg->type == "error")
                        continue;
                    cout << msg->from << ": " << msg->body << endl;
                    unwrap(co_await conn.send_message(msg->from, msg->body, msg->type.empty() ? "chat" : msg->type));
                }
            }
            catch (const xmppxx::exception& exc)
            {
                cout << exc.what() << endl;
            }
            unwrap(co_await conn.close());
        },
        boost::asio::detached);

    io_ctx.run();
    return EXIT_SUCCESS;
}
