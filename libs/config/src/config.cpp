#include "tephra/config/config.hpp"
#include "tephra/dotenv/dotenv.hpp"
#include "tephra/log/Log.hpp"
#include "tephra/net/net.hpp"

#include <boost/algorithm/string.hpp>

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace tephra::config {

    namespace {
        const char* get_env(const char* key) {
            const char* value = std::getenv(key);
            return (value && *value) ? value : nullptr;
        }

        std::optional<long> parse_long(const char* value) {
            char* end = nullptr;
            const long parsed = std::strtol(value, &end, 10);
            if (end == value || *end != '\0') {
                return std::nullopt;
            }
            return parsed;
        }

        std::optional<uint16_t> parse_port(const char* value, std::string_view label) {
            if (!value) {
                return std::nullopt;
            }
            auto parsed = parse_long(value);
            if (parsed && *parsed > 0 && *parsed <= 65535) {
                return static_cast<uint16_t>(*parsed);
            }
            throw std::runtime_error(std::string("Invalid ") + std::string(label) + ": " + value);
        }

        void parse_address_env(const char* key, boost::asio::ip::address& out) {
            if (const char* host = get_env(key)) {
                auto parsed = tephra::net::parse_address(host);
                if (!parsed) {
                    throw std::runtime_error(std::string("Invalid ") + key + ": " + host);
                }
                out = *parsed;
            }
        }
    }

    bool parse_flag(std::string_view key, std::string_view value) {
        auto lowered = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(value)));
        if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
            return false;
        }
        throw std::runtime_error(std::string("Invalid ") + std::string(key) + ": " + std::string(value));
    }

    Config from_environment() {
        Config cfg{};

        parse_address_env("TELNET_HOST", cfg.telnet.address);
        if (auto port = parse_port(get_env("TELNET_PORT"), "TELNET_PORT")) {
            cfg.telnet.port = *port;
        }

        if (const char* limit = get_env("TELNET_MAX_SUBNEGOTIATION")) {
            auto value = parse_long(limit);
            if (!value || *value <= 0) {
                throw std::runtime_error(std::string("Invalid TELNET_MAX_SUBNEGOTIATION: ") + limit);
            }
            cfg.engine.max_subnegotiation = static_cast<std::size_t>(*value);
        }

        if (const char* translate = get_env("TELNET_TRANSLATE_NEWLINES")) {
            cfg.engine.translate_newlines = parse_flag("TELNET_TRANSLATE_NEWLINES", translate);
        }

        if (const char* keepalive = get_env("TELNET_KEEPALIVE_SECONDS")) {
            auto value = parse_long(keepalive);
            if (!value || *value < 0) {
                throw std::runtime_error(std::string("Invalid TELNET_KEEPALIVE_SECONDS: ") + keepalive);
            }
            cfg.engine.keepalive = std::chrono::seconds(*value);
        }

        if (const char* level = get_env("LOG_LEVEL")) {
            auto parsed = tephra::log::level_from_name(level);
            if (!parsed) {
                throw std::runtime_error("Invalid LOG_LEVEL: " + parsed.error());
            }
            cfg.log_level = *parsed;
        }

        return cfg;
    }

    Config init(std::string_view log_file) {
        auto log_options = tephra::log::Options();
        log_options.file_path = "logs/" + std::string(log_file) + ".log";
        tephra::log::init(log_options);

        auto loaded = tephra::dotenv::load_env_file(".env", false);
        loaded.merge(tephra::dotenv::load_env_file(".env.local", true));
        for (const auto& message : loaded.error_messages) {
            LWARN("{}", message);
        }
        LDEBUG("Environment files: {} loaded, {} skipped, {} errors.", loaded.loaded, loaded.skipped, loaded.errors);

        auto cfg = from_environment();
        tephra::log::set_level(cfg.log_level);
        return cfg;
    }
}
