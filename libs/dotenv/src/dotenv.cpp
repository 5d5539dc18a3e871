#include "tephra/dotenv/dotenv.hpp"

#include <cstdlib>
#include <fstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace tephra::dotenv {

    static std::string strip_quotes(std::string_view value) {
        if (value.size() >= 2) {
            const char first = value.front();
            const char last = value.back();
            if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
                return std::string(value.substr(1, value.size() - 2));
            }
        }
        return std::string(value);
    }

    void LoadResult::merge(const LoadResult& other) {
        loaded += other.loaded;
        skipped += other.skipped;
        errors += other.errors;
        error_messages.insert(error_messages.end(), other.error_messages.begin(), other.error_messages.end());
    }

    std::expected<std::optional<Entry>, std::string> parse_line(std::string_view line) {
        auto trimmed = boost::algorithm::trim_copy(std::string(line));
        if (trimmed.empty() || trimmed[0] == '#') {
            return std::nullopt;
        }

        if (boost::algorithm::starts_with(trimmed, "export ")) {
            trimmed = boost::algorithm::trim_copy(trimmed.substr(7));
        }

        const auto eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos) {
            return std::unexpected("missing '='");
        }

        auto key = boost::algorithm::trim_copy(trimmed.substr(0, eq_pos));
        auto value = boost::algorithm::trim_copy(trimmed.substr(eq_pos + 1));

        if (key.empty()) {
            return std::unexpected("empty key");
        }
        if (key.front() == '"' || key.front() == '\'') {
            return std::unexpected("quoted key");
        }

        return Entry{std::move(key), strip_quotes(value)};
    }

    static bool set_env_var(const std::string& key, const std::string& value, bool override_existing) {
        const char* existing = std::getenv(key.c_str());
        if (existing && !override_existing) {
            return false;
        }

    #if defined(_WIN32)
        return _putenv_s(key.c_str(), value.c_str()) == 0;
    #else
        return ::setenv(key.c_str(), value.c_str(), override_existing ? 1 : 0) == 0;
    #endif
    }

    LoadResult load_env_file(const std::filesystem::path& path, bool override_existing) {
        LoadResult result;

        if (!std::filesystem::exists(path)) {
            result.skipped++;
            return result;
        }

        std::ifstream file(path);
        if (!file) {
            result.errors++;
            result.error_messages.push_back("Failed to open " + path.string());
            return result;
        }

        std::string line;
        std::size_t line_no = 0;
        while (std::getline(file, line)) {
            ++line_no;
            auto parsed = parse_line(line);
            if (!parsed) {
                result.errors++;
                result.error_messages.push_back("Invalid line " + std::to_string(line_no) + " in " + path.string() + ": " + parsed.error());
                continue;
            }
            if (!parsed->has_value()) {
                continue;
            }

            const auto& [key, value] = **parsed;
            if (set_env_var(key, value, override_existing)) {
                result.loaded++;
            } else {
                result.skipped++;
            }
        }

        return result;
    }

    LoadResult load_env_files(const std::vector<std::filesystem::path>& paths,
                              bool override_existing_for_all) {
        LoadResult combined;
        for (const auto& path : paths) {
            combined.merge(load_env_file(path, override_existing_for_all));
        }
        return combined;
    }

    std::string get_env(std::string_view key, std::string_view fallback) {
        std::string key_str(key);
        const char* value = std::getenv(key_str.c_str());
        if (value && *value) {
            return std::string(value);
        }
        return std::string(fallback);
    }

} // namespace tephra::dotenv
