//
// Created by gregorian-rayne on 10/2/26.
//

#ifndef GATEKEEPER_ERROR_HPP
#define GATEKEEPER_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types used across the review pipeline.
 *
 * Error carries a category code, a message, and optional context such as
 * a file path or a diff line number. It travels inside Result<T, Error>
 * so every failure path is visible in function signatures.
 *
 * Only ConfigError is fatal to a run. ParseError and AnalysisError are
 * scoped to one file and surface as Diagnostics.
 *
 * Usage:
 * @code
 *     auto lines = diff::changed_lines(patch_text);
 *     if (lines.is_err()) {
 *         std::cerr << lines.error() << std::endl;
 *         // Output: [ParseError] Malformed hunk header (context: line 3)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace gk {

    enum class ErrorCode {
        None,
        InvalidArgument,
        NotFound,
        ParseError,       ///< Diff, payload or TOML text did not parse
        IoError,
        ConfigError,      ///< Review limits missing or out of range
        AnalysisError,    ///< One analyzer failed on one file
        InternalError
    };

    inline const char* error_code_to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Category, message and an optional location such as "line 3" or a
     * file path. Immutable once built; with_context() returns a copy.
     */
    class Error {
    public:
        using Context = std::optional<std::string>;

        Error(const ErrorCode code, std::string message, Context context = std::nullopt)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, Context context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error analysis_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const Context& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Appends a location to the context: "line 3" becomes
         * "line 3; src/app.py".
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /// "[ParseError] Malformed hunk header (context: line 3)"
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error&) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        Context context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace gk

#endif //GATEKEEPER_ERROR_HPP
