#include "tephra/net/Client.hpp"
#include "tephra/net/Server.hpp"
#include "tephra/net/Session.hpp"

#include "NetTestSupport.hpp"

#include <memory>

using namespace tephra;
using namespace tephra::net;
using namespace tephra::net::test;
using namespace std::chrono_literals;

namespace codes = tephra::telnet::codes;

namespace {

bool supports_sga(telnet::Option option) { return option == codes::SGA; }

boost::asio::awaitable<void> echo_until_quit(TelnetSession &session, std::string data) {
    if (data.find("quit") != std::string::npos)
        session.close();
    else
        session.send(data);
    co_return;
}

// Greets, offers SGA, sends one GMCP message and says it is ready; then echoes until told to quit.
boost::asio::awaitable<void> serve(TcpStream socket, int64_t connection_id) {
    auto session = std::make_shared<TelnetSession>(std::move(socket), connection_id,
                                                   telnet::SupportPolicy::both(supports_sga));
    session->send("Welcome\r\n");
    session->submit(telnet::RequestOption{telnet::Direction::local, codes::SGA, true});
    session->submit(telnet::SendSubnegotiation{codes::GMCP, "Core.Hello {}"});
    session->send("ready\r\n");
    co_await session->run(echo_until_quit);
}

boost::asio::ip::tcp::acceptor loopback_acceptor(boost::asio::io_context &ioc) {
    return boost::asio::ip::tcp::acceptor(ioc,
                                          boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
}

}

TEST_CASE("client against a loopback server") {
    boost::asio::io_context ioc;
    Server server(loopback_acceptor(ioc), serve);
    server.run();
    const auto port = server.local_endpoint().port();

    TelnetClient client(ioc.get_executor(), telnet::SupportPolicy::both(supports_sga));
    int negotiations = 0;
    client.set_event_handler([&](TelnetClient &, const telnet::TelnetEvent &event) {
        if (std::holds_alternative<telnet::TelnetMessageNegotiation>(event))
            ++negotiations;
    });

    run_until_done(ioc, [&]() -> boost::asio::awaitable<void> {
        co_await client.connect("127.0.0.1", port);

        auto greeting = co_await client.read_until("\r\n", 2s);
        CHECK(greeting == "Welcome\r\n");

        // everything the server sent before "ready" has been through the engine by now
        auto ready = co_await client.read_until("ready\r\n", 2s);
        CHECK(ready == "ready\r\n");
        CHECK(negotiations == 1);
        CHECK(client.telnet().remote_enabled(codes::SGA));

        auto subnegotiations = client.read_sb_data();
        REQUIRE(subnegotiations.size() == 1);
        CHECK(subnegotiations[0].option == codes::GMCP);
        CHECK(subnegotiations[0].data == "Core.Hello {}");
        CHECK(client.read_sb_data().empty());

        co_await client.write("ping\n");
        auto echoed = co_await client.read_until("ping\n", 2s);
        CHECK(echoed == "ping\n");

        co_await client.write("abc");
        std::string some;
        while (some.size() < 3)
            some += co_await client.read_some();
        CHECK(some == "abc");

        auto nothing_waiting = co_await client.read_eager();
        CHECK(nothing_waiting.empty());

        const auto started = std::chrono::steady_clock::now();
        auto partial = co_await client.read_until("never sent", 200ms);
        CHECK(partial.empty());
        CHECK(std::chrono::steady_clock::now() - started >= 200ms);

        co_await client.write("quit\n");
        bool saw_eof = false;
        try {
            co_await client.read_until("anything", 2s);
        } catch (const boost::system::system_error &e) {
            saw_eof = e.code() == boost::asio::error::eof;
        }
        CHECK(saw_eof);
        CHECK(client.eof());

        client.close();
        server.stop();
    });
}

TEST_CASE("client output goes through the engine") {
    boost::asio::io_context ioc;
    auto acceptor = loopback_acceptor(ioc);
    TelnetClient client(ioc.get_executor(), telnet::SupportPolicy::both(supports_sga));

    run_until_done(ioc, [&]() -> boost::asio::awaitable<void> {
        // the listen backlog completes the connect before anything is accepted
        co_await client.connect("127.0.0.1", acceptor.local_endpoint().port());
        TcpStream peer(ioc);
        co_await acceptor.async_accept(peer, boost::asio::use_awaitable);

        co_await client.write(std::string("a\xff" "b", 3));
        co_await client.submit(telnet::RequestOption{telnet::Direction::remote, codes::NAWS, true});
        auto received = co_await read_exactly(peer, 7);
        CHECK(received == std::string("a\xff\xff" "b\xff\xfd\x1f", 7));
        CHECK(client.telnet().remote_state(codes::NAWS) == telnet::OptionState::WANT_YES);

        // a refusal settles the option without an answer
        co_await write_all(peer, std::string("\xff\xfc\x1f", 3));
        auto after_refusal = co_await client.read_until("x", 200ms);
        CHECK(after_refusal.empty());
        CHECK(client.telnet().remote_state(codes::NAWS) == telnet::OptionState::NO);

        client.close();
    });
}
