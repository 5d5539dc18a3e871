#pragma once

#include "tephra/net/net.hpp"

#include <catch2/catch.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <chrono>
#include <exception>
#include <string>

namespace tephra::net::test {

// Two connected sockets on the loopback interface: one to hand to the code under test, one to play the peer.
struct LoopbackPair {
    TcpStream served;
    TcpStream peer;
};

inline LoopbackPair loopback_pair(boost::asio::io_context &ioc) {
    boost::asio::ip::tcp::acceptor acceptor(ioc,
                                            boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    TcpStream peer(ioc);
    peer.connect(acceptor.local_endpoint());
    TcpStream served(ioc);
    acceptor.accept(served);
    return LoopbackPair{std::move(served), std::move(peer)};
}

// Runs body on ioc until there is no work left, giving up after a few seconds so a hang fails the test.
template <typename Body>
void run_until_done(boost::asio::io_context &ioc, Body body) {
    bool finished = false;
    std::exception_ptr failure;
    boost::asio::co_spawn(ioc, std::move(body), [&](std::exception_ptr e) {
        finished = true;
        failure = e;
    });
    ioc.run_for(std::chrono::seconds(5));
    REQUIRE(finished);
    if (failure)
        std::rethrow_exception(failure);
}

inline boost::asio::awaitable<void> write_all(TcpStream &socket, std::string bytes) {
    co_await boost::asio::async_write(socket, boost::asio::buffer(bytes), boost::asio::use_awaitable);
}

inline boost::asio::awaitable<std::string> read_exactly(TcpStream &socket, std::size_t count) {
    std::string out(count, '\0');
    co_await boost::asio::async_read(socket, boost::asio::buffer(out), boost::asio::use_awaitable);
    co_return out;
}

inline boost::asio::awaitable<std::string> read_to_eof(TcpStream &socket) {
    std::string out;
    char chunk[256];
    for (;;) {
        boost::system::error_code ec;
        auto count = co_await socket.async_read_some(boost::asio::buffer(chunk),
                                                     boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        out.append(chunk, count);
        if (ec)
            co_return out;
    }
}

}
