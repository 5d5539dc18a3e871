#pragma once

#include <utility>

#include <boost/asio.hpp>

namespace tephra::net {
    extern boost::asio::io_context& context();
}
