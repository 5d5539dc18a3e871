#include "tephra/net/Client.hpp"
#include "tephra/log/Log.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <utility>

namespace tephra::net {

    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t read_chunk = 4096;

    TelnetClient::TelnetClient(boost::asio::any_io_executor executor, telnet::SupportPolicy policy,
                               telnet::TelnetSettings settings)
        : socket_(executor),
        deadline_(executor),
        telnet_(std::move(policy), settings) {}

    boost::asio::awaitable<void> TelnetClient::connect(std::string_view host, uint16_t port) {
        if(socket_.is_open()) {
            throw boost::system::system_error(boost::asio::error::already_connected);
        }
        boost::asio::ip::tcp::resolver resolver(socket_.get_executor());
        auto endpoints = co_await resolver.async_resolve(std::string(host), std::to_string(port),
                                                         boost::asio::use_awaitable);
        endpoint_ = co_await boost::asio::async_connect(socket_, endpoints, boost::asio::use_awaitable);
        eof_ = false;
        LDEBUG("{} connected.", *this);
    }

    boost::asio::awaitable<void> TelnetClient::write(std::string_view text) {
        co_await writeRaw(telnet_.submit(telnet::SendData{std::string(text)}));
    }

    boost::asio::awaitable<void> TelnetClient::submit(const telnet::OutboundIntent& intent) {
        co_await writeRaw(telnet_.submit(intent));
    }

    boost::asio::awaitable<std::string> TelnetClient::read_until(std::string_view match,
                                                                 std::chrono::milliseconds timeout) {
        const auto deadline = Clock::now() + timeout;
        std::size_t search_from = 0;

        for(;;) {
            if(auto found = text_.find(match, search_from); found != std::string::npos) {
                co_return takeText(found + match.size());
            }
            // a match not found yet must end in bytes that have not arrived
            search_from = text_.size() >= match.size() ? text_.size() - match.size() + 1 : 0;

            if(eof_ || !co_await receive(deadline)) {
                break;
            }
        }

        if(text_.empty() && eof_) {
            throw boost::system::system_error(boost::asio::error::eof);
        }
        co_return takeText(text_.size());
    }

    boost::asio::awaitable<std::string> TelnetClient::read_some() {
        while(text_.empty() && !eof_) {
            if(!co_await receive(Clock::time_point::max())) {
                break;
            }
        }
        co_return takeText(text_.size());
    }

    boost::asio::awaitable<std::string> TelnetClient::read_eager() {
        while(text_.empty() && !eof_) {
            boost::system::error_code ec;
            if(socket_.available(ec) == 0 || ec) {
                break;
            }
            if(!co_await receive(Clock::time_point::max())) {
                break;
            }
        }

        if(text_.empty() && eof_) {
            throw boost::system::system_error(boost::asio::error::eof);
        }
        co_return takeText(text_.size());
    }

    std::vector<telnet::TelnetMessageSubnegotiation> TelnetClient::read_sb_data() {
        return std::exchange(subnegotiations_, {});
    }

    void TelnetClient::close() {
        boost::system::error_code ec;
        socket_.shutdown(TcpStream::shutdown_both, ec);
        socket_.close(ec);
        deadline_.cancel();
        eof_ = true;
    }

    boost::asio::awaitable<bool> TelnetClient::receive(Clock::time_point deadline) {
        // re-arming also disarms a wait left over from an earlier read
        deadline_.expires_at(deadline);
        if(deadline != Clock::time_point::max()) {
            if(deadline <= Clock::now()) {
                co_return false;
            }
            deadline_.async_wait([this](const boost::system::error_code& ec) {
                // a wait that completed just before being re-armed must not cut off the next read
                if(!ec && deadline_.expiry() <= Clock::now()) {
                    boost::system::error_code ignored;
                    socket_.cancel(ignored);
                }
            });
        }

        boost::system::error_code read_ec;
        std::size_t read_bytes = co_await socket_.async_read_some(
            buffer_.prepare(read_chunk),
            boost::asio::redirect_error(boost::asio::use_awaitable, read_ec));
        deadline_.cancel();

        if(read_ec == boost::asio::error::operation_aborted) {
            if(!socket_.is_open()) {
                eof_ = true;
            }
            co_return false;
        }
        if(read_ec) {
            if(read_ec != boost::asio::error::eof) {
                LINFO("{} read error: {}", *this, read_ec.message());
            }
            eof_ = true;
            co_return true;
        }
        buffer_.commit(read_bytes);

        auto result = telnet_.feed(std::string_view{
            static_cast<const char*>(buffer_.data().data()),
            buffer_.size()
        });
        buffer_.consume(buffer_.size());

        for(auto& event : result.events) {
            if(auto* data = std::get_if<telnet::TelnetMessageData>(&event)) {
                text_ += data->data;
                continue;
            }
            LTRACE("{} received {}", *this, event);
            if(auto* sub = std::get_if<telnet::TelnetMessageSubnegotiation>(&event)) {
                subnegotiations_.push_back(*sub);
            }
            if(on_event_) {
                on_event_(*this, event);
            }
        }

        co_await writeRaw(std::move(result.output));
        co_return true;
    }

    boost::asio::awaitable<void> TelnetClient::writeRaw(std::string bytes) {
        if(bytes.empty()) {
            co_return;
        }
        co_await boost::asio::async_write(socket_, boost::asio::buffer(bytes), boost::asio::use_awaitable);
    }

    std::string TelnetClient::takeText(std::size_t count) {
        auto out = text_.substr(0, count);
        text_.erase(0, count);
        return out;
    }

}
