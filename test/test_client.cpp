/*

test_client.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Runs xmppxx::client against a scripted loopback server and checks the negotiation
bytes and the failure paths.

*/

#define XMPPXX_TESTING
#define BOOST_TEST_MODULE client_test

#include <array>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <xmppxx/client/client.hpp>

using xmppxx::client;
using xmppxx::errc;

namespace asio = xmppxx::asio;
using tcp = asio::tcp;

namespace
{

const std::string SERVER_ROOT =
    "<?xml version='1.0'?><stream:stream xmlns='jabber:client' xmlns:stream='http://etherx.jabber.org/streams'"
    " id='s1' from='example.org' version='1.0'>";
const std::string SERVER_RESTART_ROOT =
    "<?xml version='1.0'?><stream:stream xmlns='jabber:client' xmlns:stream='http://etherx.jabber.org/streams'"
    " id='s2' from='example.org' version='1.0'>";
const std::string PLAIN_FEATURES =
    "<stream:features><mechanisms xmlns='urn:ietf:params:xml:ns:xmpp-sasl'><mechanism>PLAIN</mechanism>"
    "</mechanisms></stream:features>";
const std::string BIND_FEATURES =
    "<stream:features><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'/>"
    "<session xmlns='urn:ietf:params:xml:ns:xmpp-session'/></stream:features>";
const std::string SASL_SUCCESS = "<success xmlns='urn:ietf:params:xml:ns:xmpp-sasl'/>";
const std::string BIND_RESULT =
    "<iq type='result' id='x'><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'><jid>alice@example.org/phone</jid>"
    "</bind></iq>";

const std::string CLIENT_HEADER =
    "<?xml version='1.0'?>\n"
    "<stream:stream to='example.org' xmlns='jabber:client'\n"
    " xmlns:stream='http://etherx.jabber.org/streams' version='1.0'>\n";
const std::string CLIENT_AUTH =
    "<auth xmlns='urn:ietf:params:xml:ns:xmpp-sasl' mechanism='PLAIN'>AGFsaWNlAHNlY3JldA==</auth>";

struct step
{
    /// Substring awaited in the bytes written by the client since the previous step.
    std::string expect;
    std::string reply;
    /// Runs the server side TLS handshake once the reply is written.
    bool upgrade{false};
};

/**
Single connection server playing a fixed script, then reading until the client hangs up.

Everything the client wrote is available through `received()` after `join()`; the
part written after a TLS upgrade step also through `received_over_tls()`.
**/
class scripted_server
{
public:
    explicit scripted_server(std::vector<step> steps, bool hang_up = false, asio::ssl::context* tls_ctx = nullptr)
        : acceptor_(ctx_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)),
          steps_(std::move(steps)),
          hang_up_(hang_up),
          tls_ctx_(tls_ctx)
    {
        thread_ = std::thread([this] { run(); });
    }

    ~scripted_server()
    {
        join();
    }

    std::string port() const
    {
        return std::to_string(acceptor_.local_endpoint().port());
    }

    tcp::endpoint endpoint() const
    {
        return acceptor_.local_endpoint();
    }

    void join()
    {
        if (thread_.joinable())
            thread_.join();
    }

    const std::string& received() const
    {
        return received_;
    }

    std::size_t replies() const
    {
        return replies_;
    }

    std::string received_over_tls() const
    {
        return tls_offset_ ? received_.substr(*tls_offset_) : std::string();
    }

private:
    void run()
    {
        tcp::socket sock(ctx_);
        asio::error_code ec;
        acceptor_.accept(sock, ec);
        if (ec)
            return;
        play(sock);
        tls_.reset();
    }

    void play(tcp::socket& sock)
    {
        asio::error_code ec;
        std::size_t cursor = 0;
        for (const auto& s : steps_)
        {
            std::size_t pos = received_.find(s.expect, cursor);
            while (pos == std::string::npos)
            {
                if (!read_more(sock))
                    return;
                pos = received_.find(s.expect, cursor);
            }
            cursor = pos + s.expect.size();
            if (!s.reply.empty() && !send(sock, s.reply))
                return;
            ++replies_;

            if (s.upgrade && tls_ctx_ != nullptr)
            {
                tls_.emplace(sock, *tls_ctx_);
                tls_->handshake(asio::ssl::stream_base::server, ec);
                if (ec)
                    return;
                tls_offset_ = received_.size();
                cursor = received_.size();
            }
        }

        if (hang_up_)
        {
            sock.shutdown(tcp::socket::shutdown_both, ec);
            sock.close(ec);
            return;
        }
        while (read_more(sock))
            ;
    }

    bool read_more(tcp::socket& sock)
    {
        std::array<char, 1024> buf{};
        asio::error_code ec;
        const std::size_t n = tls_ ? tls_->read_some(asio::buffer(buf), ec) : sock.read_some(asio::buffer(buf), ec);
        if (ec)
            return false;
        received_.append(buf.data(), n);
        return true;
    }

    bool send(tcp::socket& sock, const std::string& data)
    {
        asio::error_code ec;
        if (tls_)
            boost::asio::write(*tls_, asio::buffer(data), ec);
        else
            boost::asio::write(sock, asio::buffer(data), ec);
        return !ec;
    }

    asio::io_context ctx_;
    tcp::acceptor acceptor_;
    std::vector<step> steps_;
    bool hang_up_;
    asio::ssl::context* tls_ctx_;
    std::optional<asio::ssl::stream<tcp::socket&>> tls_;
    std::optional<std::size_t> tls_offset_;
    std::string received_;
    std::size_t replies_{0};
    std::thread thread_;
};

struct test_certificate
{
    std::string cert_pem;
    std::string key_pem;
};

void add_extension(X509* cert, int nid, const char* value)
{
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
    BOOST_REQUIRE(ext != nullptr);
    BOOST_REQUIRE(X509_add_ext(cert, ext, -1) == 1);
    X509_EXTENSION_free(ext);
}

std::string bio_contents(BIO* bio)
{
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<std::size_t>(len));
}

/// Self signed P-256 certificate for example.org, valid for one day from now.
test_certificate make_test_certificate()
{
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_EC_gen("P-256"), &EVP_PKEY_free);
    BOOST_REQUIRE(key != nullptr);
    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), &X509_free);
    BOOST_REQUIRE(cert != nullptr);

    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24 * 60 * 60);
    X509_set_pubkey(cert.get(), key.get());
    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("example.org"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    add_extension(cert.get(), NID_basic_constraints, "critical,CA:TRUE");
    add_extension(cert.get(), NID_subject_alt_name, "DNS:example.org");
    BOOST_REQUIRE(X509_sign(cert.get(), key.get(), EVP_sha256()) > 0);

    std::unique_ptr<BIO, decltype(&BIO_free)> cert_bio(BIO_new(BIO_s_mem()), &BIO_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(BIO_new(BIO_s_mem()), &BIO_free);
    BOOST_REQUIRE(PEM_write_bio_X509(cert_bio.get(), cert.get()) == 1);
    BOOST_REQUIRE(PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) == 1);
    return test_certificate{bio_contents(cert_bio.get()), bio_contents(key_bio.get())};
}

xmppxx::options plain_options()
{
    xmppxx::options opts;
    opts.jid = "alice@example.org";
    opts.password = "secret";
    opts.allow_cleartext_auth = true;
    return opts;
}

template<typename Coroutine>
void run_client(Coroutine&& coroutine)
{
    asio::io_context client_ctx;
    auto fut = asio::co_spawn(client_ctx, std::forward<Coroutine>(coroutine), asio::use_future);
    client_ctx.run();
    fut.get();
}

} // namespace


BOOST_AUTO_TEST_CASE(full_negotiation_with_restart)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES},
        {"</auth>", SASL_SUCCESS},
        {CLIENT_HEADER, SERVER_RESTART_ROOT + BIND_FEATURES},
        {"</iq>", BIND_RESULT},
        {"</iq>", "<iq type='result' id='sess_1'/>"},
        {"</presence>", ""}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(res.has_value());
        BOOST_TEST((cli.state() == client::state_t::READY));
        BOOST_TEST(cli.jid() == "alice@example.org/phone");
        BOOST_TEST(cli.stream_id() == "s2");
        BOOST_TEST(cli.features().bind);
        BOOST_TEST(!cli.is_tls());

        auto sent = co_await cli.send_message("bob@example.org", "hi & bye");
        BOOST_REQUIRE(sent.has_value());
        auto closed = co_await cli.close();
        BOOST_REQUIRE(closed.has_value());
        BOOST_TEST((cli.state() == client::state_t::CLOSED));
        auto again = co_await cli.close();
        BOOST_TEST(again.has_value());
    });
    server.join();

    BOOST_TEST(server.replies() == 6u);
    BOOST_TEST(server.received() ==
        CLIENT_HEADER
        + CLIENT_AUTH
        + CLIENT_HEADER
        + "<iq type='set' id='x'><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'/></iq>"
        + "<iq type='set' id='sess_1' to='example.org'><session xmlns='urn:ietf:params:xml:ns:xmpp-session'/></iq>"
        + "<presence xml:lang='en'><show>chat</show><status>Online</status></presence>"
        + "<message to='bob@example.org' type='chat'><body>hi &amp; bye</body></message>"
        + "</stream:stream>");
}

BOOST_AUTO_TEST_CASE(session_skipped_when_not_advertised)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES},
        {"</auth>", SASL_SUCCESS},
        {CLIENT_HEADER, SERVER_RESTART_ROOT + "<stream:features><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'/></stream:features>"},
        {"</bind>", BIND_RESULT}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        auto opts = plain_options();
        opts.resource = "phone";
        client cli(co_await asio::this_coro::executor, opts);
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(res.has_value());
        BOOST_TEST((cli.state() == client::state_t::READY));
    });
    server.join();

    BOOST_TEST(server.received().find("<resource>phone</resource>") != std::string::npos);
    BOOST_TEST(server.received().find("<session") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(external_negotiation)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + "<stream:features><mechanisms xmlns='urn:ietf:params:xml:ns:xmpp-sasl'>"
            "<mechanism>PLAIN</mechanism><mechanism>EXTERNAL</mechanism></mechanisms></stream:features>"},
        {"mechanism='EXTERNAL'/>", SASL_SUCCESS},
        {CLIENT_HEADER, SERVER_RESTART_ROOT + "<stream:features><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'/></stream:features>"},
        {"</iq>", BIND_RESULT},
        {"</presence>", ""}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        auto opts = plain_options();
        opts.password.clear();
        opts.auth_external = true;
        client cli(co_await asio::this_coro::executor, opts);
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(res.has_value());
        BOOST_TEST((cli.state() == client::state_t::READY));
        BOOST_TEST(cli.jid() == "alice@example.org/phone");
        auto closed = co_await cli.close();
        BOOST_TEST(closed.has_value());
    });
    server.join();

    BOOST_TEST(server.received() ==
        CLIENT_HEADER
        + "<auth xmlns='urn:ietf:params:xml:ns:xmpp-sasl' mechanism='EXTERNAL'/>"
        + CLIENT_HEADER
        + "<iq type='set' id='x'><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'/></iq>"
        + "<presence xml:lang='en'><show>chat</show><status>Online</status></presence>"
        + "</stream:stream>");
}

BOOST_AUTO_TEST_CASE(starttls_upgrade_and_restart)
{
    const test_certificate certificate = make_test_certificate();
    asio::ssl::context server_tls(asio::ssl::context::tls_server);
    server_tls.use_certificate(asio::buffer(certificate.cert_pem), asio::ssl::context::pem);
    server_tls.use_private_key(asio::buffer(certificate.key_pem), asio::ssl::context::pem);
    asio::ssl::context client_tls(asio::ssl::context::tls_client);
    client_tls.add_certificate_authority(asio::buffer(certificate.cert_pem));

    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + "<stream:features><starttls xmlns='urn:ietf:params:xml:ns:xmpp-tls'><required/>"
            "</starttls></stream:features>"},
        {"<starttls xmlns='urn:ietf:params:xml:ns:xmpp-tls'/>", "<proceed xmlns='urn:ietf:params:xml:ns:xmpp-tls'/>", true},
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES},
        {"</auth>", SASL_SUCCESS},
        {CLIENT_HEADER, SERVER_RESTART_ROOT + "<stream:features><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'/></stream:features>"},
        {"</iq>", BIND_RESULT},
        {"</presence>", ""}
    }, false, &server_tls);

    run_client([endpoint = server.endpoint(), &client_tls]() -> asio::awaitable<void>
    {
        const auto executor = co_await asio::this_coro::executor;
        tcp::socket sock(executor);
        co_await sock.async_connect(endpoint, asio::use_awaitable);

        auto opts = plain_options();
        opts.allow_cleartext_auth = false;
        opts.starttls = xmppxx::starttls_policy::required;
        client cli(executor, opts);
        auto res = co_await cli.open(xmppxx::net::upgradable_stream(std::move(sock)), &client_tls);
        BOOST_REQUIRE(res.has_value());
        BOOST_TEST((cli.state() == client::state_t::READY));
        BOOST_TEST(cli.is_tls());
        BOOST_TEST(cli.stream_id() == "s2");

        auto sent = co_await cli.send_message("bob@example.org", "over tls");
        BOOST_TEST(sent.has_value());
        auto closed = co_await cli.close();
        BOOST_TEST(closed.has_value());
    });
    server.join();

    BOOST_TEST(server.replies() == 7u);
    const std::string encrypted = server.received_over_tls();
    BOOST_TEST(server.received().substr(0, server.received().size() - encrypted.size()) ==
        CLIENT_HEADER + "<starttls xmlns='urn:ietf:params:xml:ns:xmpp-tls'/>");
    BOOST_TEST(encrypted.rfind(CLIENT_HEADER + CLIENT_AUTH + CLIENT_HEADER, 0) == 0u);
    BOOST_TEST(encrypted.find("<body>over tls</body>") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(trace_goes_to_session_sink)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES},
        {"</auth>", SASL_SUCCESS},
        {CLIENT_HEADER, SERVER_RESTART_ROOT + "<stream:features><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'/></stream:features>"},
        {"</iq>", BIND_RESULT},
        {"</presence>", ""}
    });

    auto& logger = xmppxx::log::logger::instance();
    std::size_t global_entries = 0;
    logger.set_trace_enabled(true);
    logger.set_callback([&global_entries](const xmppxx::log::entry& e)
    {
        if (e.trace_info)
            ++global_entries;
    });

    std::string sent;
    std::string received;
    std::vector<std::string> protocols;
    run_client([&, port = server.port()]() -> asio::awaitable<void>
    {
        auto opts = plain_options();
        opts.trace = [&](std::string_view protocol, xmppxx::log::direction dir, std::string_view data)
        {
            protocols.emplace_back(protocol);
            (dir == xmppxx::log::direction::send ? sent : received).append(data);
        };
        client cli(co_await asio::this_coro::executor, opts);
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(res.has_value());
        auto closed = co_await cli.close();
        BOOST_TEST(closed.has_value());
    });
    server.join();
    logger.clear_callback();
    logger.set_trace_enabled(false);

    BOOST_TEST(global_entries == 0u);
    BOOST_REQUIRE(!protocols.empty());
    BOOST_TEST(protocols.front() == "XMPP");
    BOOST_TEST(sent.find("mechanism='PLAIN'><redacted></auth>") != std::string::npos);
    BOOST_TEST(sent.find("AGFsaWNlAHNlY3JldA==") == std::string::npos);
    BOOST_TEST(sent.find("</stream:stream>") != std::string::npos);
    BOOST_TEST(received.find(SASL_SUCCESS) != std::string::npos);
    BOOST_TEST(received.find("<jid>alice@example.org/phone</jid>") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(tolerated_second_features)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES},
        {"</auth>", SASL_SUCCESS},
        {CLIENT_HEADER, SERVER_RESTART_ROOT + "<odd xmlns='urn:example:odd'><child a='1'>text<leaf/></child><child/></odd>"},
        {"</iq>", BIND_RESULT},
        {"</presence>", ""}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(res.has_value());
        BOOST_TEST((cli.state() == client::state_t::READY));
        BOOST_TEST(cli.features().mechanisms.empty());
        BOOST_TEST(!cli.features().session);
    });
    server.join();
    BOOST_TEST(server.received().find("<session") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(auth_failure)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES},
        {"</auth>", "<failure xmlns='urn:ietf:params:xml:ns:xmpp-sasl'><not-authorized/></failure>"}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::sasl_auth_failed);
        BOOST_TEST(res.error().message == "auth failure: not-authorized");
        BOOST_TEST((cli.state() == client::state_t::FAILED));

        auto next = co_await cli.recv();
        BOOST_REQUIRE(!next.has_value());
        BOOST_TEST(next.error().code == errc::xmpp_invalid_state);
    });
    server.join();
    BOOST_TEST(server.received() == CLIENT_HEADER + CLIENT_AUTH);
}

BOOST_AUTO_TEST_CASE(no_usable_mechanism)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + "<stream:features><mechanisms xmlns='urn:ietf:params:xml:ns:xmpp-sasl'>"
            "<mechanism>SCRAM-SHA-1</mechanism></mechanisms></stream:features>"}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::sasl_no_mechanism);
        BOOST_TEST((cli.state() == client::state_t::FAILED));
    });
    server.join();
    BOOST_TEST(server.received() == CLIENT_HEADER);
}

BOOST_AUTO_TEST_CASE(cleartext_auth_rejected_by_default)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        auto opts = plain_options();
        opts.allow_cleartext_auth = false;
        client cli(co_await asio::this_coro::executor, opts);
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::security_cleartext_auth);
    });
    server.join();
    BOOST_TEST(server.received() == CLIENT_HEADER);
}

BOOST_AUTO_TEST_CASE(bind_result_without_jid)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES},
        {"</auth>", SASL_SUCCESS},
        {CLIENT_HEADER, SERVER_RESTART_ROOT + BIND_FEATURES},
        {"</iq>", "<iq type='result' id='x'><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'/></iq>"}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::xmpp_missing_element);
        BOOST_TEST((cli.state() == client::state_t::FAILED));
    });
}

BOOST_AUTO_TEST_CASE(bind_refused)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES},
        {"</auth>", SASL_SUCCESS},
        {CLIENT_HEADER, SERVER_RESTART_ROOT + BIND_FEATURES},
        {"</iq>", "<iq type='error' id='x'><error type='cancel'>"
            "<conflict xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/></error></iq>"}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::xmpp_bind_failed);
        BOOST_TEST(res.error().message == "resource binding refused: conflict");
    });
}

BOOST_AUTO_TEST_CASE(unexpected_root_element)
{
    scripted_server server({
        {CLIENT_HEADER, "<iq xmlns='jabber:client' type='result' id='z'/>"}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::xmpp_unexpected_element);
        BOOST_TEST(res.error().message == "unexpected XMPP element <iq/> in namespace 'jabber:client'");
        BOOST_TEST(res.error().detail.find("step=OPEN_STREAM") != std::string::npos);
    });
}

BOOST_AUTO_TEST_CASE(starttls_required_by_policy_but_not_offered)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        auto opts = plain_options();
        opts.starttls = xmppxx::starttls_policy::required;
        client cli(co_await asio::this_coro::executor, opts);
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::tls_negotiation_failed);
    });
    server.join();
    BOOST_TEST(server.received() == CLIENT_HEADER);
}

BOOST_AUTO_TEST_CASE(starttls_required_by_server_without_context)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + "<stream:features><starttls xmlns='urn:ietf:params:xml:ns:xmpp-tls'>"
            "<required/></starttls></stream:features>"}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::tls_negotiation_failed);
        BOOST_TEST(res.error().detail.find("state=no TLS context") != std::string::npos);
    });
    server.join();
    BOOST_TEST(server.received() == CLIENT_HEADER);
}

BOOST_AUTO_TEST_CASE(stream_error_during_negotiation)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + "<stream:error><host-unknown xmlns='urn:ietf:params:xml:ns:xmpp-streams'/>"
            "</stream:error></stream:stream>"}
    });

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::xmpp_stream_error);
        BOOST_TEST(res.error().message == "stream error: host-unknown");
    });
}

BOOST_AUTO_TEST_CASE(implicit_tls_without_context)
{
    run_client([]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.connect("127.0.0.1", "5223", xmppxx::net::tls_mode::implicit);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::config_invalid_argument);
        BOOST_TEST((cli.state() == client::state_t::FAILED));
    });
}

BOOST_AUTO_TEST_CASE(invalid_jid)
{
    run_client([]() -> asio::awaitable<void>
    {
        auto opts = plain_options();
        opts.jid = "example.org";
        client cli(co_await asio::this_coro::executor, opts);
        auto res = co_await cli.connect("127.0.0.1", "5222");
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::config_invalid_jid);
    });
}

BOOST_AUTO_TEST_CASE(send_before_ready)
{
    run_client([]() -> asio::awaitable<void>
    {
        client cli(co_await asio::this_coro::executor, plain_options());
        auto res = co_await cli.send_message("bob@example.org", "hello");
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::xmpp_invalid_state);
        BOOST_TEST(res.error().detail.find("state=DISCONNECTED") != std::string::npos);

        auto next = co_await cli.recv();
        BOOST_REQUIRE(!next.has_value());
        BOOST_TEST(next.error().code == errc::xmpp_invalid_state);

        auto closed = co_await cli.close();
        BOOST_TEST(closed.has_value());
        BOOST_TEST((cli.state() == client::state_t::DISCONNECTED));
    });
}

BOOST_AUTO_TEST_CASE(recv_delivers_messages_and_presence)
{
    scripted_server server({
        {"", SERVER_ROOT
            + "<iq type='get' id='ping'><ping xmlns='urn:xmpp:ping'/></iq>"
            + "<message id='3' type='error' to='123456789@gcm.googleapis.com/ABC'>"
              "<gcm xmlns='google:mobile:data'>{\"random\": \"&lt;text&gt;\"}</gcm>"
              "<error code='400' type='modify'><bad-request xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/></error>"
              "</message>"
            + "<presence from='bob@example.org/laptop'><show>away</show></presence>"
            + "</stream:stream>"}
    }, true);

    run_client([endpoint = server.endpoint()]() -> asio::awaitable<void>
    {
        const auto executor = co_await asio::this_coro::executor;
        tcp::socket sock(executor);
        co_await sock.async_connect(endpoint, asio::use_awaitable);

        client cli(executor, plain_options());
        cli.debug_attach_ready(xmppxx::net::upgradable_stream(std::move(sock)));

        auto first = co_await cli.recv();
        BOOST_REQUIRE(first.has_value());
        BOOST_REQUIRE(std::holds_alternative<xmppxx::message>(*first));
        const auto& msg = std::get<xmppxx::message>(*first);
        BOOST_TEST(msg.type == "error");
        BOOST_TEST(msg.id == "3");
        BOOST_REQUIRE(msg.other_elements.size() == 2u);
        BOOST_TEST(msg.other_elements[0].name.ns == "google:mobile:data");
        BOOST_TEST(msg.other_elements[0].inner_xml == "{\"random\": \"&lt;text&gt;\"}");
        BOOST_TEST(msg.other_elements[1].name.local == "error");

        auto second = co_await cli.recv();
        BOOST_REQUIRE(second.has_value());
        BOOST_REQUIRE(std::holds_alternative<xmppxx::presence>(*second));
        BOOST_TEST(std::get<xmppxx::presence>(*second).show == "away");

        auto end = co_await cli.recv();
        BOOST_REQUIRE(!end.has_value());
        BOOST_TEST(end.error().code == errc::net_eof);

        auto after = co_await cli.recv();
        BOOST_REQUIRE(!after.has_value());
        BOOST_TEST(after.error().code == errc::xmpp_invalid_state);
    });
}

BOOST_AUTO_TEST_CASE(unmapped_element_with_children_skipped)
{
    scripted_server server({
        {"", SERVER_ROOT
            + "<query xmlns='urn:example:roster'><item jid='bob@example.org'><group>Friends</group></item>"
              "<message><body>not a stanza</body></message></query>"
            + "<message from='bob@example.org' type='chat'><body>after</body></message>"
            + "</stream:stream>"}
    }, true);

    run_client([endpoint = server.endpoint()]() -> asio::awaitable<void>
    {
        const auto executor = co_await asio::this_coro::executor;
        tcp::socket sock(executor);
        co_await sock.async_connect(endpoint, asio::use_awaitable);

        client cli(executor, plain_options());
        cli.debug_attach_ready(xmppxx::net::upgradable_stream(std::move(sock)));

        auto unmapped = co_await cli.next_element();
        BOOST_REQUIRE(!unmapped.has_value());
        BOOST_TEST(unmapped.error().code == errc::xmpp_unexpected_element);
        BOOST_TEST(unmapped.error().message == "unexpected XMPP element <query/> in namespace 'urn:example:roster'");

        auto next = co_await cli.recv();
        BOOST_REQUIRE(next.has_value());
        BOOST_REQUIRE(std::holds_alternative<xmppxx::message>(*next));
        BOOST_TEST(std::get<xmppxx::message>(*next).body == "after");

        auto end = co_await cli.recv();
        BOOST_REQUIRE(!end.has_value());
        BOOST_TEST(end.error().code == errc::net_eof);
    });
}

BOOST_AUTO_TEST_CASE(recv_on_closed_transport)
{
    scripted_server server({}, true);

    run_client([endpoint = server.endpoint()]() -> asio::awaitable<void>
    {
        const auto executor = co_await asio::this_coro::executor;
        tcp::socket sock(executor);
        co_await sock.async_connect(endpoint, asio::use_awaitable);

        client cli(executor, plain_options());
        cli.debug_attach_ready(xmppxx::net::upgradable_stream(std::move(sock)));
        auto res = co_await cli.recv();
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::net_eof);
    });
}

BOOST_AUTO_TEST_CASE(read_timeout)
{
    scripted_server server({});

    run_client([port = server.port()]() -> asio::awaitable<void>
    {
        auto opts = plain_options();
        opts.timeout = std::chrono::milliseconds(200);
        client cli(co_await asio::this_coro::executor, opts);
        auto res = co_await cli.connect("127.0.0.1", port);
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::net_timeout);
        BOOST_TEST((cli.state() == client::state_t::FAILED));
    });
}

BOOST_AUTO_TEST_CASE(read_timeout_spares_concurrent_send)
{
    // The server stays silent and stops reading long enough for the client's receive deadline to expire
    // while a large send is still blocked on a full socket buffer.
    const std::size_t payload_size = 32 * 1024 * 1024;
    asio::io_context server_ctx;
    tcp::acceptor acceptor(server_ctx, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    std::size_t drained = 0;
    std::thread server([&]
    {
        tcp::socket sock(server_ctx);
        asio::error_code ec;
        acceptor.accept(sock, ec);
        if (ec)
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(2200));
        std::vector<char> buf(64 * 1024);
        for (;;)
        {
            const std::size_t n = sock.read_some(asio::buffer(buf), ec);
            if (ec)
                break;
            drained += n;
        }
    });

    run_client([endpoint = acceptor.local_endpoint(), payload_size]() -> asio::awaitable<void>
    {
        const auto executor = co_await asio::this_coro::executor;
        tcp::socket sock(executor);
        co_await sock.async_connect(endpoint, asio::use_awaitable);

        auto opts = plain_options();
        opts.timeout = std::chrono::seconds(2);
        client cli(executor, opts);
        cli.debug_attach_ready(xmppxx::net::upgradable_stream(std::move(sock)));

        std::optional<xmppxx::result<xmppxx::event>> received;
        asio::co_spawn(executor, [&cli, &received]() -> asio::awaitable<void>
        {
            received = co_await cli.recv();
        }, asio::detached);

        asio::steady_timer pause(executor, std::chrono::milliseconds(500));
        co_await pause.async_wait(asio::use_awaitable);
        auto sent = co_await cli.send_raw(std::string(payload_size, 'a'));
        BOOST_TEST(sent.has_value());

        while (!received.has_value())
        {
            pause.expires_after(std::chrono::milliseconds(50));
            co_await pause.async_wait(asio::use_awaitable);
        }
        BOOST_REQUIRE(!received->has_value());
        BOOST_TEST(received->error().code == errc::net_timeout);

        auto later = co_await cli.send_message("bob@example.org", "still writable");
        BOOST_TEST(later.has_value());
        auto closed = co_await cli.close();
        BOOST_TEST(closed.has_value());
    });
    server.join();
    BOOST_TEST(drained > payload_size);
}

BOOST_AUTO_TEST_CASE(oversized_stanza)
{
    scripted_server server({
        {"", SERVER_ROOT + "<message><body>" + std::string(4096, 'a') + "</body></message>"}
    });

    run_client([endpoint = server.endpoint()]() -> asio::awaitable<void>
    {
        const auto executor = co_await asio::this_coro::executor;
        tcp::socket sock(executor);
        co_await sock.async_connect(endpoint, asio::use_awaitable);

        auto opts = plain_options();
        opts.max_stanza_size = 256;
        client cli(executor, opts);
        cli.debug_attach_ready(xmppxx::net::upgradable_stream(std::move(sock)));
        auto res = co_await cli.recv();
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::xml_stanza_too_large);

        auto closed = co_await cli.close();
        BOOST_TEST(closed.has_value());
    });
}

BOOST_AUTO_TEST_CASE(open_over_connected_transport)
{
    scripted_server server({
        {CLIENT_HEADER, SERVER_ROOT + PLAIN_FEATURES},
        {"</auth>", SASL_SUCCESS},
        {CLIENT_HEADER, SERVER_RESTART_ROOT + "<stream:features><bind xmlns='urn:ietf:params:xml:ns:xmpp-bind'/></stream:features>"},
        {"</iq>", BIND_RESULT},
        {"</presence>", "<message from='bob@example.org' type='chat'><body>welcome</body></message>"}
    });

    run_client([endpoint = server.endpoint()]() -> asio::awaitable<void>
    {
        const auto executor = co_await asio::this_coro::executor;
        tcp::socket sock(executor);
        co_await sock.async_connect(endpoint, asio::use_awaitable);

        auto opts = plain_options();
        opts.initial_presence.show = "away";
        opts.initial_presence.status = "Busy";
        client cli(executor, opts);
        auto res = co_await cli.open(xmppxx::net::upgradable_stream(std::move(sock)));
        BOOST_REQUIRE(res.has_value());
        BOOST_TEST((cli.state() == client::state_t::READY));

        auto again = co_await cli.open(xmppxx::net::upgradable_stream(executor));
        BOOST_REQUIRE(!again.has_value());
        BOOST_TEST(again.error().code == errc::xmpp_invalid_state);

        auto next = co_await cli.recv();
        BOOST_REQUIRE(next.has_value());
        BOOST_TEST(std::get<xmppxx::message>(*next).body == "welcome");
        auto closed = co_await cli.close();
        BOOST_TEST(closed.has_value());
    });
    server.join();
    BOOST_TEST(server.received().find("<presence xml:lang='en'><show>away</show><status>Busy</status></presence>")
        != std::string::npos);
}
