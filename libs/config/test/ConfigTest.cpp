#include "tephra/config/config.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <stdexcept>

using namespace tephra::config;

namespace {

const char *const variables[] = {"TELNET_HOST", "TELNET_PORT", "TELNET_MAX_SUBNEGOTIATION", "TELNET_TRANSLATE_NEWLINES",
                                 "TELNET_KEEPALIVE_SECONDS", "LOG_LEVEL"};

void clear_environment() {
    for (auto name : variables)
        ::unsetenv(name);
}

}

TEST_CASE("configuration from the environment") {
    clear_environment();

    SECTION("defaults") {
        auto cfg = from_environment();
        CHECK(cfg.telnet.address == boost::asio::ip::address_v6::any());
        CHECK(cfg.telnet.port == 2323);
        CHECK(cfg.engine.max_subnegotiation == 64 * 1024);
        CHECK_FALSE(cfg.engine.translate_newlines);
        CHECK(cfg.engine.keepalive.count() == 0);
        CHECK(cfg.log_level == SPDLOG_LEVEL_INFO);
    }
    SECTION("every variable is read") {
        ::setenv("TELNET_HOST", "127.0.0.1", 1);
        ::setenv("TELNET_PORT", "4000", 1);
        ::setenv("TELNET_MAX_SUBNEGOTIATION", "512", 1);
        ::setenv("TELNET_TRANSLATE_NEWLINES", "yes", 1);
        ::setenv("TELNET_KEEPALIVE_SECONDS", "30", 1);
        ::setenv("LOG_LEVEL", "debug", 1);

        auto cfg = from_environment();
        CHECK(cfg.telnet.address == boost::asio::ip::make_address("127.0.0.1"));
        CHECK(cfg.telnet.port == 4000);
        CHECK(cfg.engine.keepalive.count() == 30);
        CHECK(cfg.log_level == SPDLOG_LEVEL_DEBUG);

        auto settings = cfg.engine_settings();
        CHECK(settings.max_subnegotiation == 512);
        CHECK(settings.translate_newlines);
    }
    SECTION("wildcard host") {
        ::setenv("TELNET_HOST", "*", 1);
        CHECK(from_environment().telnet.address == boost::asio::ip::address_v6::any());
    }
    SECTION("bad values throw") {
        SECTION("host") { ::setenv("TELNET_HOST", "not-an-address", 1); }
        SECTION("port out of range") { ::setenv("TELNET_PORT", "70000", 1); }
        SECTION("port not a number") { ::setenv("TELNET_PORT", "23x", 1); }
        SECTION("zero limit") { ::setenv("TELNET_MAX_SUBNEGOTIATION", "0", 1); }
        SECTION("negative keepalive") { ::setenv("TELNET_KEEPALIVE_SECONDS", "-1", 1); }
        SECTION("flag") { ::setenv("TELNET_TRANSLATE_NEWLINES", "maybe", 1); }
        SECTION("log level") { ::setenv("LOG_LEVEL", "loud", 1); }
        CHECK_THROWS_AS(from_environment(), std::runtime_error);
    }

    clear_environment();
}

TEST_CASE("boolean flags") {
    for (auto yes : {"1", "true", "TRUE", "yes", "on", " On "})
        CHECK(parse_flag("FLAG", yes));
    for (auto no : {"0", "false", "no", "OFF"})
        CHECK_FALSE(parse_flag("FLAG", no));
    CHECK_THROWS_WITH(parse_flag("FLAG", "2"), "Invalid FLAG: 2");
}
