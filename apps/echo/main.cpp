// Listens on TELNET_HOST:TELNET_PORT and echoes every line back to the client.
// Offers SGA, asks for NAWS, and logs whatever else the client negotiates.

#include "tephra/config/config.hpp"
#include "tephra/log/Log.hpp"
#include "tephra/net/Server.hpp"
#include "tephra/net/Session.hpp"

#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>

#include <csignal>
#include <memory>
#include <stdexcept>

using namespace tephra;
namespace codes = tephra::telnet::codes;

namespace {

config::Config cfg;

bool echo_supports(telnet::Option option) { return option == codes::SGA || option == codes::NAWS; }

boost::asio::awaitable<void> echo_data(net::TelnetSession &session, std::string data) {
    session.send(data);
    co_return;
}

void echo_event(net::TelnetSession &session, const telnet::TelnetEvent &event) {
    if (const auto *sub = std::get_if<telnet::TelnetMessageSubnegotiation>(&event)) {
        if (sub->option == codes::NAWS && sub->data.size() == 4) {
            auto byte = [&](std::size_t i) { return static_cast<unsigned char>(sub->data[i]); };
            LINFO("{} window is {}x{}", session, (byte(0) << 8) | byte(1), (byte(2) << 8) | byte(3));
        }
    } else if (const auto *command = std::get_if<telnet::TelnetMessageCommand>(&event)) {
        if (command->command == codes::AYT)
            session.send("[Yes]\r\n");
    } else if (const auto *violation = std::get_if<telnet::TelnetProtocolViolation>(&event)) {
        LINFO("{} sent a malformed sequence ({}).", session, violation->kind);
    } else {
        LDEBUG("{} {}", session, event);
    }
}

boost::asio::awaitable<void> handle_client(net::TcpStream socket, int64_t connection_id) {
    net::SessionOptions options{cfg.engine_settings(), cfg.engine.keepalive};
    auto session = std::make_shared<net::TelnetSession>(std::move(socket), connection_id,
                                                        telnet::SupportPolicy::both(echo_supports), options);

    session->send("Welcome to the tephra echo server.\r\n");
    session->submit(std::vector<telnet::OutboundIntent>{
        telnet::RequestOption{telnet::Direction::local, codes::SGA, true},
        telnet::RequestOption{telnet::Direction::remote, codes::NAWS, true}});

    co_await session->run(echo_data, echo_event);
}

int Main() {
    cfg = config::init("echo");

    // a client vanishing mid-write must not take the process down
    signal(SIGPIPE, SIG_IGN);

    net::Server server(cfg.telnet.address, cfg.telnet.port, handle_client);
    server.run();

    boost::asio::signal_set signals(net::context(), SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code &ec, int signal_number) {
        if (!ec) {
            LINFO("Received signal {}, shutting down.", signal_number);
            net::context().stop();
        }
    });

    net::run();
    return 0;
}

}

int main() {
    try {
        auto result = Main();
        spdlog::shutdown();
        return result;
    } catch (const std::runtime_error &re) {
        // config errors can arrive before logging is up
        fmt::print(stderr, "{}\n", re.what());
        LCRIT("{}", re.what());
        spdlog::shutdown();
        return 1;
    }
}
