#pragma once
#include <chrono>
#include <cstdint>
#include <string_view>

#include <tephra/log/Log.hpp>
#include <tephra/net/net.hpp>
#include <tephra/telnet/Base.hpp>

namespace tephra::config {

    struct EndPointConfig {
        boost::asio::ip::address address = boost::asio::ip::address_v6::any();
        uint16_t port{2323};
    };

    struct TelnetConfig {
        std::size_t max_subnegotiation{64 * 1024};
        bool translate_newlines{false};
        std::chrono::seconds keepalive{0};
    };

    struct Config {
        EndPointConfig telnet;
        TelnetConfig engine;
        int log_level{SPDLOG_LEVEL_INFO};

        telnet::TelnetSettings engine_settings() const {
            return telnet::TelnetSettings{engine.max_subnegotiation, engine.translate_newlines};
        }
    };

    // Sets up logging, loads .env and .env.local, then reads the environment.
    // Throws std::runtime_error naming the variable when a value cannot be used.
    Config init(std::string_view log_file);

    // The environment-reading half of init(), for callers that manage logging themselves.
    Config from_environment();

    bool parse_flag(std::string_view key, std::string_view value);
}
