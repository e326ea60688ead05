//
// Created by gregorian-rayne on 10/4/26.
//

#ifndef GK_CONFIG_HPP
#define GK_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Review limits and tool settings.
 *
 * ReviewConfig holds the two limits every run needs. Neither has a
 * default: a run with either one unset or out of range fails with a
 * ConfigError before any patch is parsed.
 *
 * Settings wraps ReviewConfig with the tool-level sections read from
 * gatekeeper.toml:
 *
 * @code
 *     [review]
 *     max_line_length = 120
 *     max_inline_comments = 50
 *
 *     [runtime]
 *     threads = 0
 *
 *     [output]
 *     format = "markdown"
 *
 *     [logging]
 *     level = "INFO"
 * @endcode
 */

#include "gk/result.hpp"
#include "gk/error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace gk::config {

    /**
     * Validated review limits handed to analyzers and the review builder.
     */
    struct ReviewLimits {
        std::size_t max_line_length = 0;
        std::size_t max_inline_comments = 0;
    };

    /**
     * Review limits as supplied by the caller, possibly incomplete.
     */
    struct ReviewConfig {
        std::optional<long long> max_line_length;
        std::optional<long long> max_inline_comments;

        /**
         * Checks that both limits are present and in range.
         *
         * max_line_length must be positive; max_inline_comments must not
         * be negative (0 disables inline comments).
         */
        [[nodiscard]] Result<ReviewLimits, Error> validate() const;
    };

    enum class OutputFormat {
        Markdown,
        Json
    };

    enum class LogLevel {
        Quiet,
        Info,
        Verbose,
        Debug
    };

    struct RuntimeConfig {
        /// Worker threads for analyzer fan-out. 0 = hardware concurrency, 1 = sequential.
        std::size_t threads = 0;
    };

    struct OutputConfig {
        OutputFormat format = OutputFormat::Markdown;
    };

    struct LoggingConfig {
        LogLevel level = LogLevel::Info;
    };

    class Settings {
    public:
        ReviewConfig review;
        RuntimeConfig runtime;
        OutputConfig output;
        LoggingConfig logging;

        /**
         * Loads settings from a TOML file.
         */
        [[nodiscard]] static Result<Settings, Error> load_from_file(const std::string& path);

        /**
         * Parses settings from TOML text.
         *
         * Syntax errors are ParseError; wrong value types and unknown enum
         * names are ConfigError. Missing review keys are left unset.
         */
        [[nodiscard]] static Result<Settings, Error> load_from_string(std::string_view content);

        /**
         * Starter settings written by "gatekeeper init".
         */
        [[nodiscard]] static Settings starter();

        /**
         * Applies MAX_LINE_LENGTH and MAX_INLINE_COMMENTS from the
         * environment on top of the loaded values.
         */
        [[nodiscard]] Result<void, Error> apply_environment();

        /**
         * Renders the settings back as TOML.
         */
        [[nodiscard]] std::string to_string() const;
    };

    [[nodiscard]] const char* to_string(OutputFormat format) noexcept;
    [[nodiscard]] const char* to_string(LogLevel level) noexcept;

    [[nodiscard]] std::optional<OutputFormat> output_format_from_string(std::string_view text);
    [[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view text);

    /**
     * Parses a whole-string integer, as used for environment and CLI overrides.
     */
    [[nodiscard]] Result<long long, Error> parse_integer(std::string_view text, std::string_view name);

}  // namespace gk::config

#endif //GK_CONFIG_HPP
