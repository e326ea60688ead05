//
// Created by gregorian-rayne on 10/4/26.
//

#include "gk/core/config.hpp"
#include "gk/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace gk::config
{
    namespace {

        std::string key_path(const std::string_view section, const std::string_view key) {
            std::string path(section);
            path += ".";
            path += key;
            return path;
        }

        Result<std::optional<long long>, Error> read_integer(
            const toml::table& tbl,
            const std::string_view section,
            const std::string_view key
        ) {
            const auto node = tbl[section][key];
            if (!node) {
                return Result<std::optional<long long>, Error>::success(std::nullopt);
            }
            if (!node.is_integer()) {
                return Result<std::optional<long long>, Error>::failure(
                    Error::config_error("Expected an integer", key_path(section, key))
                );
            }
            return Result<std::optional<long long>, Error>::success(
                static_cast<long long>(*node.value<std::int64_t>())
            );
        }

        Result<std::optional<std::string>, Error> read_string(
            const toml::table& tbl,
            const std::string_view section,
            const std::string_view key
        ) {
            const auto node = tbl[section][key];
            if (!node) {
                return Result<std::optional<std::string>, Error>::success(std::nullopt);
            }
            if (!node.is_string()) {
                return Result<std::optional<std::string>, Error>::failure(
                    Error::config_error("Expected a string", key_path(section, key))
                );
            }
            return Result<std::optional<std::string>, Error>::success(*node.value<std::string>());
        }

        Result<void, Error> override_from_env(const char* name, std::optional<long long>& target) {
            const char* raw = std::getenv(name);
            if (raw == nullptr) {
                return Result<void, Error>::success();
            }

            auto parsed = parse_integer(raw, name);
            if (parsed.is_err()) {
                return Result<void, Error>::failure(parsed.error());
            }
            target = parsed.value();
            return Result<void, Error>::success();
        }

    }  // namespace

    Result<ReviewLimits, Error> ReviewConfig::validate() const {
        if (!max_line_length) {
            return Result<ReviewLimits, Error>::failure(
                Error::config_error("Missing required setting", "review.max_line_length")
            );
        }
        if (!max_inline_comments) {
            return Result<ReviewLimits, Error>::failure(
                Error::config_error("Missing required setting", "review.max_inline_comments")
            );
        }
        if (*max_line_length <= 0) {
            return Result<ReviewLimits, Error>::failure(
                Error::config_error("max_line_length must be positive",
                                    "review.max_line_length = " + std::to_string(*max_line_length))
            );
        }
        if (*max_inline_comments < 0) {
            return Result<ReviewLimits, Error>::failure(
                Error::config_error("max_inline_comments must not be negative",
                                    "review.max_inline_comments = " + std::to_string(*max_inline_comments))
            );
        }

        ReviewLimits limits;
        limits.max_line_length = static_cast<std::size_t>(*max_line_length);
        limits.max_inline_comments = static_cast<std::size_t>(*max_inline_comments);
        return Result<ReviewLimits, Error>::success(limits);
    }

    Result<Settings, Error> Settings::load_from_file(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            return Result<Settings, Error>::failure(
                Error::not_found("Configuration file not found", path)
            );
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto result = load_from_string(buffer.str());
        if (result.is_err()) {
            return Result<Settings, Error>::failure(result.error().with_context(path));
        }
        return result;
    }

    Result<Settings, Error> Settings::load_from_string(const std::string_view content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            std::ostringstream where;
            where << "line " << err.source().begin.line;
            return Result<Settings, Error>::failure(
                Error::parse_error("Failed to parse TOML configuration: " + std::string(err.description()),
                                   where.str())
            );
        }

        Settings settings;

        auto max_line_length = read_integer(tbl, "review", "max_line_length");
        if (max_line_length.is_err()) {
            return Result<Settings, Error>::failure(max_line_length.error());
        }
        settings.review.max_line_length = max_line_length.value();

        auto max_inline_comments = read_integer(tbl, "review", "max_inline_comments");
        if (max_inline_comments.is_err()) {
            return Result<Settings, Error>::failure(max_inline_comments.error());
        }
        settings.review.max_inline_comments = max_inline_comments.value();

        auto threads = read_integer(tbl, "runtime", "threads");
        if (threads.is_err()) {
            return Result<Settings, Error>::failure(threads.error());
        }
        if (const auto& value = threads.value()) {
            if (*value < 0) {
                return Result<Settings, Error>::failure(
                    Error::config_error("threads must not be negative", "runtime.threads")
                );
            }
            settings.runtime.threads = static_cast<std::size_t>(*value);
        }

        auto format = read_string(tbl, "output", "format");
        if (format.is_err()) {
            return Result<Settings, Error>::failure(format.error());
        }
        if (const auto& value = format.value()) {
            const auto parsed = output_format_from_string(*value);
            if (!parsed) {
                return Result<Settings, Error>::failure(
                    Error::config_error("Unknown output format '" + *value + "'", "output.format")
                );
            }
            settings.output.format = *parsed;
        }

        auto level = read_string(tbl, "logging", "level");
        if (level.is_err()) {
            return Result<Settings, Error>::failure(level.error());
        }
        if (const auto& value = level.value()) {
            const auto parsed = log_level_from_string(*value);
            if (!parsed) {
                return Result<Settings, Error>::failure(
                    Error::config_error("Unknown log level '" + *value + "'", "logging.level")
                );
            }
            settings.logging.level = *parsed;
        }

        return Result<Settings, Error>::success(std::move(settings));
    }

    Settings Settings::starter() {
        Settings settings;
        settings.review.max_line_length = 120;
        settings.review.max_inline_comments = 50;
        return settings;
    }

    Result<void, Error> Settings::apply_environment() {
        if (auto result = override_from_env("MAX_LINE_LENGTH", review.max_line_length); result.is_err()) {
            return result;
        }
        return override_from_env("MAX_INLINE_COMMENTS", review.max_inline_comments);
    }

    std::string Settings::to_string() const {
        std::ostringstream ss;

        ss << "[review]\n";
        if (review.max_line_length) {
            ss << "max_line_length = " << *review.max_line_length << "\n";
        }
        if (review.max_inline_comments) {
            ss << "max_inline_comments = " << *review.max_inline_comments << "\n";
        }
        ss << "\n";

        ss << "[runtime]\n";
        ss << "threads = " << runtime.threads << "\n\n";

        ss << "[output]\n";
        ss << "format = \"" << config::to_string(output.format) << "\"\n\n";

        ss << "[logging]\n";
        ss << "level = \"" << config::to_string(logging.level) << "\"\n";

        return ss.str();
    }

    const char* to_string(const OutputFormat format) noexcept {
        switch (format) {
            case OutputFormat::Markdown: return "markdown";
            case OutputFormat::Json:     return "json";
        }
        return "markdown";
    }

    const char* to_string(const LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Quiet:   return "QUIET";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Verbose: return "VERBOSE";
            case LogLevel::Debug:   return "DEBUG";
        }
        return "INFO";
    }

    std::optional<OutputFormat> output_format_from_string(const std::string_view text) {
        const auto lower = string_utils::to_lower(string_utils::trim(text));
        if (lower == "markdown" || lower == "md") return OutputFormat::Markdown;
        if (lower == "json") return OutputFormat::Json;
        return std::nullopt;
    }

    std::optional<LogLevel> log_level_from_string(const std::string_view text) {
        const auto upper = string_utils::to_upper(string_utils::trim(text));
        if (upper == "QUIET" || upper == "ERROR") return LogLevel::Quiet;
        if (upper == "INFO") return LogLevel::Info;
        if (upper == "VERBOSE") return LogLevel::Verbose;
        if (upper == "DEBUG") return LogLevel::Debug;
        return std::nullopt;
    }

    Result<long long, Error> parse_integer(const std::string_view text, const std::string_view name) {
        const auto trimmed = string_utils::trim(text);
        long long value = 0;
        const auto* first = trimmed.data();
        const auto* last = trimmed.data() + trimmed.size();
        if (auto [ptr, ec] = std::from_chars(first, last, value);
            trimmed.empty() || ec != std::errc{} || ptr != last) {
            return Result<long long, Error>::failure(
                Error::config_error("Expected an integer for " + std::string(name),
                                    "'" + std::string(text) + "'")
            );
        }
        return Result<long long, Error>::success(value);
    }

}  // namespace gk::config
