#include "tephra/net/Session.hpp"
#include "tephra/log/Log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>

namespace tephra::net {

    static boost::asio::ip::tcp::endpoint remote_of(const TcpStream& socket) {
        boost::system::error_code ec;
        auto endpoint = socket.remote_endpoint(ec);
        return ec ? boost::asio::ip::tcp::endpoint{} : endpoint;
    }

    TelnetSession::TelnetSession(TcpStream socket, int64_t id, telnet::SupportPolicy policy, SessionOptions options)
        : socket_(std::move(socket)),
        id_(id),
        endpoint_(remote_of(socket_)),
        options_(options),
        telnet_(std::move(policy), options.telnet),
        writer_signal_(socket_.get_executor()),
        keepalive_timer_(socket_.get_executor()) {
        writer_signal_.expires_at(boost::asio::steady_timer::time_point::max());
    }

    boost::asio::awaitable<void> TelnetSession::run(DataHandler on_data, EventHandler on_event) {
        on_data_ = std::move(on_data);
        on_event_ = std::move(on_event);

        auto self = shared_from_this();
        auto executor = socket_.get_executor();
        boost::asio::co_spawn(executor, [self] { return self->runWriter(); }, boost::asio::detached);
        if(options_.keepalive.count() > 0) {
            boost::asio::co_spawn(executor, [self] { return self->runKeepAlive(); }, boost::asio::detached);
        }

        // a throwing handler must still release the writer, which holds a reference to this session
        try {
            co_await runReader();
        } catch(...) {
            close();
            throw;
        }
        close();
    }

    void TelnetSession::submit(const telnet::OutboundIntent& intent) {
        enqueue(telnet_.submit(intent));
    }

    void TelnetSession::submit(const std::vector<telnet::OutboundIntent>& intents) {
        enqueue(telnet_.submit(intents));
    }

    void TelnetSession::send(std::string_view text) {
        submit(telnet::SendData{std::string(text)});
    }

    void TelnetSession::close() {
        if(closing_) {
            return;
        }
        closing_ = true;
        LDEBUG("{} closing.", *this);

        // the reader sees end of stream; the writer drains what is queued, then closes the socket
        boost::system::error_code ec;
        socket_.shutdown(TcpStream::shutdown_receive, ec);
        writer_signal_.cancel();
        keepalive_timer_.cancel();
    }

    void TelnetSession::enqueue(std::string bytes) {
        if(bytes.empty() || closing_) {
            return;
        }
        outgoing_.push_back(std::move(bytes));
        writer_signal_.cancel_one();
    }

    boost::asio::awaitable<void> TelnetSession::runReader() {
        boost::beast::flat_buffer buffer;

        while(!closing_) {
            boost::system::error_code read_ec;
            auto prepared = buffer.prepare(options_.read_chunk);
            std::size_t read_bytes = co_await socket_.async_read_some(
                prepared,
                boost::asio::redirect_error(boost::asio::use_awaitable, read_ec));
            if(read_ec) {
                if(read_ec == boost::asio::error::eof || read_ec == boost::asio::error::operation_aborted) {
                    LDEBUG("{} reader finished: {}", *this, read_ec.message());
                } else {
                    LINFO("{} read error: {}", *this, read_ec.message());
                }
                co_return;
            }
            buffer.commit(read_bytes);

            auto result = telnet_.feed(std::string_view{
                static_cast<const char*>(buffer.data().data()),
                buffer.size()
            });
            buffer.consume(buffer.size());

            enqueue(std::move(result.output));

            for(auto& event : result.events) {
                if(auto* data = std::get_if<telnet::TelnetMessageData>(&event)) {
                    if(on_data_) {
                        co_await on_data_(*this, std::move(data->data));
                    }
                } else {
                    LTRACE("{} received {}", *this, event);
                    if(on_event_) {
                        on_event_(*this, event);
                    }
                }
                if(closing_) {
                    co_return;
                }
            }
        }
    }

    boost::asio::awaitable<void> TelnetSession::runWriter() {
        for(;;) {
            while(!outgoing_.empty()) {
                auto chunk = std::move(outgoing_.front());
                outgoing_.pop_front();

                boost::system::error_code write_ec;
                co_await boost::asio::async_write(
                    socket_,
                    boost::asio::buffer(chunk),
                    boost::asio::redirect_error(boost::asio::use_awaitable, write_ec));
                if(write_ec) {
                    if(write_ec != boost::asio::error::operation_aborted) {
                        LINFO("{} write error: {}", *this, write_ec.message());
                    }
                    outgoing_.clear();
                    close();
                    break;
                }
            }

            if(closing_) {
                boost::system::error_code ec;
                socket_.shutdown(TcpStream::shutdown_both, ec);
                socket_.close(ec);
                co_return;
            }

            // woken by enqueue() or close(); the operation_aborted it reports is the signal
            boost::system::error_code ec;
            co_await writer_signal_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    }

    boost::asio::awaitable<void> TelnetSession::runKeepAlive() {
        while(!closing_) {
            keepalive_timer_.expires_after(options_.keepalive);
            boost::system::error_code ec;
            co_await keepalive_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if(ec || closing_) {
                co_return;
            }
            submit(telnet::SendCommand{telnet::codes::NOP});
        }
    }

}
