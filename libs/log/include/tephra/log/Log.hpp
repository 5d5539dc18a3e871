#pragma once
#include <string>
#include <string_view>
#include <expected>
#include <source_location>
#include <utility>
#include <fmt/format.h>

// spdlog is linked against the system fmt (SPDLOG_FMT_EXTERNAL comes from its CMake target).
#include <spdlog/spdlog.h>
#include <spdlog/common.h>

namespace tephra::log
{
    struct Options
    {
        // Where to write logs:
        bool to_console = true;
        bool to_file = true;
        std::string file_path = "logs/tephra.log";
        std::size_t max_file_bytes = 5 * 1024 * 1024; // 5MB
        std::size_t max_files = 3;
        bool to_syslog = false; // *nix only

        // Behavior:
        bool async = true;
        int level = SPDLOG_LEVEL_INFO;
        int flush_on = SPDLOG_LEVEL_WARN;
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%t] [%^%l%$] [%s:%#] %v";
        bool enable_backtrace = true;
        int backtrace_lines = 64;
    };

    // Must be called once at startup (safe to call again; it re-initializes).
    void init(const Options &opts = {});

    // Change level at runtime.
    void set_level(int lvl);

    // "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"; case-insensitive.
    std::expected<int, std::string> level_from_name(std::string_view name);

    // ---- Primary API (fmt-style, compile-time checked) ----
    template <typename... Args>
    inline void log(std::source_location loc, int lvl,
                    fmt::format_string<Args...> fmtstr,
                    Args &&...args)
    {
        auto *logger = spdlog::default_logger_raw();
        if (!logger) [[unlikely]]
            return;

        // Skip formatting if level is disabled:
        if (!logger->should_log(static_cast<spdlog::level::level_enum>(lvl)))
            return;

        logger->log(
            spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
            static_cast<spdlog::level::level_enum>(lvl),
            fmtstr, std::forward<Args>(args)...);
    }
}

// ---- Handy macros (capture source location automatically) ----
#define LTRACE(...) ::tephra::log::log(std::source_location::current(), SPDLOG_LEVEL_TRACE, __VA_ARGS__)
#define LDEBUG(...) ::tephra::log::log(std::source_location::current(), SPDLOG_LEVEL_DEBUG, __VA_ARGS__)
#define LINFO(...) ::tephra::log::log(std::source_location::current(), SPDLOG_LEVEL_INFO, __VA_ARGS__)
#define LWARN(...) ::tephra::log::log(std::source_location::current(), SPDLOG_LEVEL_WARN, __VA_ARGS__)
#define LERROR(...) ::tephra::log::log(std::source_location::current(), SPDLOG_LEVEL_ERROR, __VA_ARGS__)
#define LCRIT(...) ::tephra::log::log(std::source_location::current(), SPDLOG_LEVEL_CRITICAL, __VA_ARGS__)
