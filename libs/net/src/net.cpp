#include "tephra/net/net.hpp"
#include "tephra/log/Log.hpp"

#include <boost/algorithm/string.hpp>

#include <vector>

namespace tephra::net {

    std::expected<boost::asio::ip::address, boost::system::error_code> parse_address(std::string_view addr_str) {
        if(boost::iequals(addr_str, "any") || boost::iequals(addr_str, "*")) {
            return boost::asio::ip::address_v6::any();
        }
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(std::string(addr_str), ec);
        if(ec) {
            return std::unexpected(ec);
        }
        return address;
    }

    void run(int numThreads) {
        if(numThreads < 1) {
            numThreads = 1;
        }

        // the accept loop and sessions are already queued; keep the pool alive until stop()
        auto guard = boost::asio::make_work_guard(context());

        std::vector<std::thread> threads;
        threads.reserve(numThreads - 1);
        for(int i = 1; i < numThreads; ++i) {
            threads.emplace_back([] {
                context().run();
            });
        }

        LINFO("Running network context on {} thread(s).", numThreads);
        context().run();

        for(auto& thread : threads) {
            thread.join();
        }
        LINFO("Network context stopped.");
    }
}
