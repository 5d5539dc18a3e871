#include "tephra/net/Server.hpp"
#include "tephra/log/Log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <atomic>

namespace tephra::net
{
    static std::atomic<int64_t> connection_id_seed{1};

    Server::Server(boost::asio::ip::tcp::acceptor acc, ClientHandler handler)
        : acceptor(std::move(acc)), client_executor(acceptor.get_executor()), handle_client(std::move(handler)) {}

    Server::Server(boost::asio::ip::address address, uint16_t port, ClientHandler handler)
        : acceptor(boost::asio::make_strand(context()), boost::asio::ip::tcp::endpoint(address, port)),
          client_executor(context().get_executor()),
          handle_client(std::move(handler)) {}

    boost::asio::awaitable<void> Server::accept_client(TcpStream socket, int64_t connection_id)
    {
        boost::system::error_code ec;
        auto endpoint = socket.remote_endpoint(ec);
        if (ec)
        {
            LINFO("Connection #{} went away before it could be served: {}", connection_id, ec.message());
            co_return;
        }
        LINFO("Incoming connection #{} from {}", connection_id, endpoint);

        try
        {
            co_await handle_client(std::move(socket), connection_id);
        }
        catch (const boost::system::system_error &e)
        {
            LERROR("Connection #{} ended with an error: {}", connection_id, e.what());
        }
        catch (const std::exception &e)
        {
            LERROR("Connection #{} handler failed: {}", connection_id, e.what());
        }
        LINFO("Connection #{} from {} closed.", connection_id, endpoint);
    }

    boost::asio::awaitable<void> Server::accept_loop()
    {
        for (;;)
        {
            boost::system::error_code ec;
            // every client socket gets its own strand; the engine inside a session is never touched concurrently
            auto socket = co_await acceptor.async_accept(boost::asio::make_strand(client_executor),
                                                         boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec)
            {
                if (ec == boost::asio::error::operation_aborted)
                {
                    co_return;
                }
                LERROR("Accept error: {}", ec.message());
                continue;
            }
            const int64_t connection_id = connection_id_seed.fetch_add(1, std::memory_order_relaxed);
            auto executor = socket.get_executor();
            boost::asio::co_spawn(executor,
                                  accept_client(std::move(socket), connection_id),
                                  boost::asio::detached);
        }
        co_return;
    }

    void Server::stop()
    {
        boost::system::error_code ec;
        acceptor.close(ec);
        if (ec)
        {
            LWARN("Closing the acceptor failed: {}", ec.message());
        }
    }

    void Server::run()
    {
        if (!handle_client)
        {
            LERROR("Server has no client handler defined; cannot run.");
            return;
        }
        auto exec = acceptor.get_executor();
        LINFO("TCP Server listening on {}", acceptor.local_endpoint());
        boost::asio::co_spawn(exec,
                              accept_loop(),
                              boost::asio::detached);
    }

} // namespace tephra::net
