#pragma once

#include <chrono>
#include <cstdint>
#include <utility>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include "net.hpp"
#include "tephra/telnet/Connection.hpp"

namespace tephra::net {

    // The connecting side: one socket, one engine, and a queue of received text the caller reads from.
    // Negotiation replies go out as soon as the bytes that asked for them are read.
    // Not thread safe; use it from one coroutine at a time.
    class TelnetClient {
        public:
        using EventHandler = std::function<void(TelnetClient&, const telnet::TelnetEvent&)>;

        TelnetClient(boost::asio::any_io_executor executor, telnet::SupportPolicy policy,
                     telnet::TelnetSettings settings = {});

        // Resolves host and connects to the first endpoint that answers.
        // Throws boost::system::system_error on failure.
        boost::asio::awaitable<void> connect(std::string_view host, uint16_t port);

        boost::asio::awaitable<void> write(std::string_view text);
        boost::asio::awaitable<void> submit(const telnet::OutboundIntent& intent);

        // Returns the text up to and including match. On timeout, or at end of stream, returns whatever
        // text has arrived instead. Throws system_error(eof) once the stream is over and nothing is left.
        boost::asio::awaitable<std::string> read_until(std::string_view match, std::chrono::milliseconds timeout);

        // Waits for at least one byte of text; returns "" at end of stream.
        boost::asio::awaitable<std::string> read_some();

        // Reads only what the socket already holds, then returns the queued text.
        // Throws system_error(eof) once the stream is over and nothing is left.
        boost::asio::awaitable<std::string> read_eager();

        // Subnegotiations received since the last call, oldest first.
        std::vector<telnet::TelnetMessageSubnegotiation> read_sb_data();

        // Sees every event except text: negotiation, commands, subnegotiations and violations.
        void set_event_handler(EventHandler handler) {
            on_event_ = std::move(handler);
        }

        void close();

        bool eof() const {
            return eof_;
        }

        bool is_open() const {
            return socket_.is_open();
        }

        const boost::asio::ip::tcp::endpoint& endpoint() const {
            return endpoint_;
        }

        const telnet::TelnetConnection& telnet() const {
            return telnet_;
        }

        private:
        // One socket read, fed through the engine. Returns false when the read was cut off by the deadline.
        boost::asio::awaitable<bool> receive(std::chrono::steady_clock::time_point deadline);
        boost::asio::awaitable<void> writeRaw(std::string bytes);
        std::string takeText(std::size_t count);

        TcpStream socket_;
        boost::asio::steady_timer deadline_;
        boost::asio::ip::tcp::endpoint endpoint_;
        telnet::TelnetConnection telnet_;
        boost::beast::flat_buffer buffer_;
        std::string text_;
        std::vector<telnet::TelnetMessageSubnegotiation> subnegotiations_;
        EventHandler on_event_;
        bool eof_{false};
    };

}

template <>
struct fmt::formatter<tephra::net::TelnetClient> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tephra::net::TelnetClient &client, FormatContext &ctx) const {
        return formatter<std::string_view>::format(fmt::format("TelnetClient({})", client.endpoint()), ctx);
    }
};
