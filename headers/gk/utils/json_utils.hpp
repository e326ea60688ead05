//
// Created by gregorian-rayne on 10/10/26.
//

#ifndef GATEKEEPER_JSON_UTILS_HPP
#define GATEKEEPER_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann/json helpers returning Result.
 */

#include "gk/result.hpp"
#include "gk/error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace gk::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses a JSON document.
     */
    inline Result<json, Error> parse(std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Reads a whole text file.
     */
    inline Result<std::string, Error> read_text(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        return Result<std::string, Error>::success(buffer.str());
    }

    /**
     * Reads and parses a JSON file.
     */
    inline Result<json, Error> read_file(const fs::path& path) {
        auto text = read_text(path);
        if (text.is_err()) {
            return Result<json, Error>::failure(text.error());
        }

        auto parsed = parse(text.value());
        if (parsed.is_err()) {
            return Result<json, Error>::failure(parsed.error().with_context(path.string()));
        }
        return parsed;
    }

    /**
     * Writes text to a file, creating parent directories as needed.
     */
    inline Result<void, Error> write_text(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file << content;
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Serializes a JSON value (-1 for compact output).
     */
    inline std::string to_string(const json& data, const int indent = -1) {
        return data.dump(indent);
    }

    /**
     * Gets a typed value from a JSON object.
     */
    template<typename T>
    Result<T, Error> get(const json& obj, const std::string& key) {
        if (!obj.contains(key)) {
            return Result<T, Error>::failure(
                Error::not_found("JSON key not found", key)
            );
        }

        try {
            return Result<T, Error>::success(obj.at(key).get<T>());
        } catch (const json::type_error& e) {
            return Result<T, Error>::failure(
                Error::parse_error("JSON type mismatch", key + ": " + e.what())
            );
        }
    }

}  // namespace gk::json_utils

#endif //GATEKEEPER_JSON_UTILS_HPP
