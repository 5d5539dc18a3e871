#pragma once

#include <cstdint>
#include <utility>
#include <expected>
#include <string_view>
#include <thread>

#include <boost/asio.hpp>
#include <fmt/format.h>

#include "Base.hpp"

namespace tephra::net {

    using TcpStream = boost::asio::ip::tcp::socket;

    // Accepts a literal IPv4/IPv6 address, or "any" / "*" for the IPv6 wildcard.
    std::expected<boost::asio::ip::address, boost::system::error_code> parse_address(std::string_view addr_str);

    // Runs context() on numThreads threads (the calling thread included) until it stops.
    void run(int numThreads = std::thread::hardware_concurrency());

}

template <>
struct fmt::formatter<boost::asio::ip::address> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const boost::asio::ip::address &address, FormatContext &ctx) const {
        return formatter<std::string_view>::format(address.to_string(), ctx);
    }
};

template <>
struct fmt::formatter<boost::asio::ip::tcp::endpoint> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const boost::asio::ip::tcp::endpoint &endpoint, FormatContext &ctx) const {
        return formatter<std::string_view>::format(
            fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port()), ctx);
    }
};
