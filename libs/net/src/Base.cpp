#include "tephra/net/Base.hpp"

namespace tephra::net {
    boost::asio::io_context& context() {
        static boost::asio::io_context ioc;
        return ioc;
    }
}
