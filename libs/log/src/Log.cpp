#include "tephra/log/Log.hpp"

#include <filesystem>
#include <memory>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if !defined(_WIN32)
#include <spdlog/sinks/syslog_sink.h>
#include <syslog.h>
#endif

namespace tephra::log {

static std::shared_ptr<spdlog::logger> make_logger(const Options& o) {
    std::vector<spdlog::sink_ptr> sinks;

    if (o.to_console) {
        sinks.emplace_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (o.to_file) {
        auto parent = std::filesystem::path(o.file_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        sinks.emplace_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            o.file_path, o.max_file_bytes, o.max_files));
    }
#if !defined(_WIN32)
    if (o.to_syslog) {
        sinks.emplace_back(std::make_shared<spdlog::sinks::syslog_sink_mt>("tephra", 0, LOG_USER, true));
    }
#endif

    if (o.async) {
        static bool pool_inited = false;
        if (!pool_inited) {
            // Queue size, worker threads
            spdlog::init_thread_pool(1 << 16, 1);
            pool_inited = true;
        }
        return std::make_shared<spdlog::async_logger>(
            "tephra", sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    }
    return std::make_shared<spdlog::logger>("tephra", sinks.begin(), sinks.end());
}

void init(const Options& opts) {
    auto logger = make_logger(opts);

    logger->set_level(static_cast<spdlog::level::level_enum>(opts.level));
    logger->set_pattern(opts.pattern);
    logger->flush_on(static_cast<spdlog::level::level_enum>(opts.flush_on));

    if (opts.enable_backtrace) {
        logger->enable_backtrace(opts.backtrace_lines);
    }

    // re-initialising replaces the previous registration
    spdlog::drop("tephra");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void set_level(int lvl) {
    if (auto* lg = spdlog::default_logger_raw()) {
        lg->set_level(static_cast<spdlog::level::level_enum>(lvl));
    }
}

std::expected<int, std::string> level_from_name(std::string_view name) {
    auto lowered = boost::algorithm::to_lower_copy(std::string(name));
    if (lowered == "trace") return SPDLOG_LEVEL_TRACE;
    if (lowered == "debug") return SPDLOG_LEVEL_DEBUG;
    if (lowered == "info") return SPDLOG_LEVEL_INFO;
    if (lowered == "warn" || lowered == "warning") return SPDLOG_LEVEL_WARN;
    if (lowered == "error" || lowered == "err") return SPDLOG_LEVEL_ERROR;
    if (lowered == "critical") return SPDLOG_LEVEL_CRITICAL;
    if (lowered == "off") return SPDLOG_LEVEL_OFF;
    return std::unexpected(fmt::format("Unknown log level '{}'", name));
}

} // namespace tephra::log
