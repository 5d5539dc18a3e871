#pragma once

#include <cstdint>
#include <utility>
#include <functional>

#include <boost/asio/awaitable.hpp>

#include "net.hpp"

namespace tephra::net {

    // Called once per accepted socket, on that socket's own strand.
    using ClientHandler = std::function<boost::asio::awaitable<void>(TcpStream, int64_t)>;

    class Server {
        public:

        // Client strands are made on the acceptor's executor.
        Server(boost::asio::ip::tcp::acceptor acc, ClientHandler handler);

        Server(boost::asio::ip::address address, uint16_t port, ClientHandler handler);

        void run();

        // Closes the acceptor; sessions already running are left alone.
        void stop();

        boost::asio::ip::tcp::endpoint local_endpoint() const {
            return acceptor.local_endpoint();
        }

        private:
        boost::asio::ip::tcp::acceptor acceptor;
        boost::asio::any_io_executor client_executor;
        ClientHandler handle_client;
        boost::asio::awaitable<void> accept_loop();
        boost::asio::awaitable<void> accept_client(TcpStream socket, int64_t connection_id);
    };
}
