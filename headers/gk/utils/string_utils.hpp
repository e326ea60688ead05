//
// Created by gregorian-rayne on 10/2/26.
//

#ifndef GATEKEEPER_STRING_UTILS_HPP
#define GATEKEEPER_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the diff parser, analyzers and formatter.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace gk::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits text into physical lines.
     *
     * A trailing newline does not produce an empty final line, and a "\r"
     * before "\n" is dropped so CRLF patches number the same as LF ones.
     */
    inline std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;

        while (start < text.size()) {
            std::size_t end = text.find('\n', start);
            if (end == std::string_view::npos) {
                end = text.size();
            }

            std::string_view line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            lines.push_back(line);
            start = end + 1;
        }

        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    inline std::string to_upper(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }

        std::string result;
        result.reserve(s.size());

        std::size_t pos = 0;
        std::size_t found;

        while ((found = s.find(from, pos)) != std::string_view::npos) {
            result.append(s, pos, found - pos);
            result.append(to);
            pos = found + from.size();
        }

        result.append(s, pos, s.size() - pos);
        return result;
    }

    /**
     * Counts UTF-8 code points. Continuation bytes (10xxxxxx) are skipped,
     * so "héllo" has length 5.
     */
    inline std::size_t utf8_length(const std::string_view s) noexcept {
        return static_cast<std::size_t>(std::ranges::count_if(s, [](const unsigned char c) {
            return (c & 0xC0U) != 0x80U;
        }));
    }

    /**
     * Width of the leading whitespace, with tabs counted as tab_width columns.
     */
    inline std::size_t indentation_width(const std::string_view s, const std::size_t tab_width = 4) noexcept {
        std::size_t width = 0;
        for (const char c : s) {
            if (c == ' ') {
                ++width;
            } else if (c == '\t') {
                width += tab_width;
            } else {
                break;
            }
        }
        return width;
    }

    /**
     * Truncates to at most max_chars code points without splitting a
     * multi-byte sequence.
     */
    inline std::string truncate_utf8(const std::string_view s, const std::size_t max_chars) {
        std::size_t chars = 0;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if ((static_cast<unsigned char>(s[i]) & 0xC0U) != 0x80U) {
                if (chars == max_chars) {
                    return std::string(s.substr(0, i));
                }
                ++chars;
            }
        }
        return std::string(s);
    }

    /**
     * Escapes a value for use inside a Markdown table cell.
     */
    inline std::string escape_table_cell(const std::string_view s) {
        return replace_all(replace_all(s, "|", "\\|"), "\n", " ");
    }

}  // namespace gk::string_utils

#endif //GATEKEEPER_STRING_UTILS_HPP
