#include "tephra/net/Session.hpp"

#include "NetTestSupport.hpp"

#include <boost/asio/detached.hpp>

#include <memory>
#include <stdexcept>

using namespace tephra;
using namespace tephra::net;
using namespace tephra::net::test;
using namespace std::string_literals;

namespace {

const std::string iac_nop = "\xff\xf1"s;

boost::asio::awaitable<void> ignore_data(TelnetSession &, std::string) { co_return; }

boost::asio::awaitable<void> failing_handler(TelnetSession &, std::string) {
    throw std::runtime_error("handler failed");
    co_return;
}

}

TEST_CASE("session writer") {
    boost::asio::io_context ioc;
    auto pair = loopback_pair(ioc);
    auto session = std::make_shared<TelnetSession>(std::move(pair.served), 1, telnet::SupportPolicy{});

    SECTION("queued output goes out in submission order") {
        session->send("one");
        session->submit(telnet::SendCommand{telnet::codes::NOP});
        session->send("t\xff"s + "o");

        run_until_done(ioc, [&]() -> boost::asio::awaitable<void> {
            boost::asio::co_spawn(ioc, session->run(ignore_data), boost::asio::detached);
            auto received = co_await read_exactly(pair.peer, 9);
            CHECK(received == "one" + iac_nop + "t\xff\xff"s + "o");
            pair.peer.close();
        });
        CHECK(session->closed());
    }

    SECTION("close sends what is already queued, then ends the stream") {
        auto reply_then_close = [](TelnetSession &s, std::string data) -> boost::asio::awaitable<void> {
            s.send("bye:" + data);
            s.close();
            s.send("dropped");
            co_return;
        };

        run_until_done(ioc, [&]() -> boost::asio::awaitable<void> {
            boost::asio::co_spawn(ioc, session->run(reply_then_close), boost::asio::detached);
            co_await write_all(pair.peer, "hi");
            auto received = co_await read_to_eof(pair.peer);
            CHECK(received == "bye:hi");
        });
        CHECK(session->closed());
    }
}

TEST_CASE("session ends when the peer disconnects") {
    boost::asio::io_context ioc;
    auto pair = loopback_pair(ioc);
    auto session = std::make_shared<TelnetSession>(std::move(pair.served), 2, telnet::SupportPolicy{});
    std::string delivered;
    std::vector<telnet::TelnetEvent> events;
    bool run_returned = false;

    auto collect = [&](TelnetSession &, std::string data) -> boost::asio::awaitable<void> {
        delivered += data;
        co_return;
    };
    auto record = [&](TelnetSession &, const telnet::TelnetEvent &event) { events.push_back(event); };

    run_until_done(ioc, [&]() -> boost::asio::awaitable<void> {
        boost::asio::co_spawn(ioc, session->run(collect, record), [&](std::exception_ptr) { run_returned = true; });
        co_await write_all(pair.peer, "last words"s + "\xff\xf6"s);
        pair.peer.shutdown(TcpStream::shutdown_send);
        auto received = co_await read_to_eof(pair.peer);
        CHECK(received.empty());
    });

    CHECK(run_returned);
    CHECK(session->closed());
    CHECK(delivered == "last words");
    REQUIRE(events.size() == 1);
    CHECK(std::holds_alternative<telnet::TelnetMessageCommand>(events[0]));
}

TEST_CASE("session keepalive") {
    boost::asio::io_context ioc;
    auto pair = loopback_pair(ioc);
    SessionOptions options;
    options.keepalive = std::chrono::seconds(1);
    auto session = std::make_shared<TelnetSession>(std::move(pair.served), 3, telnet::SupportPolicy{}, options);

    run_until_done(ioc, [&]() -> boost::asio::awaitable<void> {
        boost::asio::co_spawn(ioc, session->run(ignore_data), boost::asio::detached);
        auto received = co_await read_exactly(pair.peer, 2);
        CHECK(received == iac_nop);
        pair.peer.close();
    });
    CHECK(session->closed());
}

TEST_CASE("a handler that throws still closes the session") {
    boost::asio::io_context ioc;
    auto pair = loopback_pair(ioc);
    std::weak_ptr<TelnetSession> watch;
    std::exception_ptr run_failure;

    {
        auto session = std::make_shared<TelnetSession>(std::move(pair.served), 4, telnet::SupportPolicy{});
        watch = session;
        boost::asio::co_spawn(
            ioc, [session]() { return session->run(failing_handler); },
            [&](std::exception_ptr e) { run_failure = e; });
    }

    run_until_done(ioc, [&]() -> boost::asio::awaitable<void> {
        co_await write_all(pair.peer, "x");
        auto received = co_await read_to_eof(pair.peer);
        CHECK(received.empty());
    });

    REQUIRE(run_failure != nullptr);
    CHECK_THROWS_AS(std::rethrow_exception(run_failure), std::runtime_error);
    CHECK(watch.expired());
}
