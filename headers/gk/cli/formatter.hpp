//
// Created by gregorian-rayne on 10/11/26.
//

#ifndef GK_FORMATTER_HPP
#define GK_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Terminal output helpers for the CLI: colors and aligned tables.
 */

#include "gk/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace gk::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        void set_enabled(bool enable);

    }  // namespace colors

    /**
     * True when stdout is a terminal.
     */
    [[nodiscard]] bool is_tty();

    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        /**
         * Draws a separator under the last added row.
         */
        void add_separator();

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;



    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        std::vector<bool> separators_;
    };

    /**
     * Formats a count with comma separators.
     */
    [[nodiscard]] std::string format_count(std::size_t count);

    /**
     * Shortens a path from the left to fit max_width.
     */
    [[nodiscard]] std::string format_path(std::string_view path, std::size_t max_width = 60);

    /**
     * Upper-case severity label, colored when colors are enabled.
     */
    [[nodiscard]] std::string colorize_severity(Severity severity);

    /**
     * Section heading followed by a rule line.
     */
    void print_heading(std::ostream& out, std::string_view title);

}  // namespace gk::cli

#endif //GK_FORMATTER_HPP
