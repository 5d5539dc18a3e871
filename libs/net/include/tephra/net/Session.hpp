#pragma once

#include <chrono>
#include <cstdint>
#include <utility>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include "net.hpp"
#include "tephra/telnet/Connection.hpp"

namespace tephra::net {

    struct SessionOptions {
        telnet::TelnetSettings telnet;
        // 0 disables the NOP keepalive
        std::chrono::seconds keepalive{0};
        std::size_t read_chunk{4096};
    };

    // Binds one socket to one Telnet engine.
    // All members must be used from the socket's executor, which the Server makes a strand.
    class TelnetSession : public std::enable_shared_from_this<TelnetSession> {
        public:
        using DataHandler = std::function<boost::asio::awaitable<void>(TelnetSession&, std::string)>;
        using EventHandler = std::function<void(TelnetSession&, const telnet::TelnetEvent&)>;

        TelnetSession(TcpStream socket, int64_t id, telnet::SupportPolicy policy, SessionOptions options = {});

        // Returns once the peer disconnects, a read or write fails, or close() is called.
        // Data events go to on_data in arrival order; every other event goes to on_event.
        // An exception from either handler closes the session and propagates out of run().
        boost::asio::awaitable<void> run(DataHandler on_data, EventHandler on_event = {});

        void submit(const telnet::OutboundIntent& intent);
        void submit(const std::vector<telnet::OutboundIntent>& intents);
        void send(std::string_view text);
        void close();

        int64_t id() const {
            return id_;
        }

        const boost::asio::ip::tcp::endpoint& endpoint() const {
            return endpoint_;
        }

        const telnet::TelnetConnection& telnet() const {
            return telnet_;
        }

        bool closed() const {
            return closing_;
        }

        private:
        boost::asio::awaitable<void> runReader();
        boost::asio::awaitable<void> runWriter();
        boost::asio::awaitable<void> runKeepAlive();

        void enqueue(std::string bytes);

        TcpStream socket_;
        int64_t id_;
        boost::asio::ip::tcp::endpoint endpoint_;
        SessionOptions options_;
        telnet::TelnetConnection telnet_;
        DataHandler on_data_;
        EventHandler on_event_;
        std::deque<std::string> outgoing_;
        // never expires; cancelled to wake the writer
        boost::asio::steady_timer writer_signal_;
        boost::asio::steady_timer keepalive_timer_;
        bool closing_{false};
    };

}

template <>
struct fmt::formatter<tephra::net::TelnetSession> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tephra::net::TelnetSession &session, FormatContext &ctx) const {
        return formatter<std::string_view>::format(
            fmt::format("TelnetSession#{}({})", session.id(), session.endpoint()), ctx);
    }
};
