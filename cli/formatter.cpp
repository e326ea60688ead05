//
// Created by gregorian-rayne on 10/11/26.
//

#include "gk/cli/formatter.hpp"
#include "gk/utils/string_utils.hpp"

#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#include <cstdio>
#else
#include <unistd.h>
#include <cstdio>
#endif

namespace gk::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
#ifdef _WIN32
        return _isatty(_fileno(stdout)) != 0;
#else
        return isatty(fileno(stdout)) != 0;
#endif
    }

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_count(const std::size_t count) {
        std::string result = std::to_string(count);

        int insert_pos = static_cast<int>(result.length()) - 3;
        while (insert_pos > 0) {
            result.insert(static_cast<std::size_t>(insert_pos), ",");
            insert_pos -= 3;
        }

        return result;
    }

    std::string format_path(const std::string_view path, const std::size_t max_width) {
        if (path.length() <= max_width) {
            return std::string(path);
        }

        const std::string ellipsis = "...";
        return ellipsis + std::string(path.substr(path.length() - max_width + ellipsis.length()));
    }

    std::string colorize_severity(const Severity severity) {
        const std::string label = string_utils::to_upper(to_string(severity));
        if (!colors::enabled()) {
            return label;
        }

        switch (severity) {
            case Severity::Error:
                return std::string(colors::RED) + colors::BOLD + label + colors::RESET;
            case Severity::Warning:
                return std::string(colors::YELLOW) + label + colors::RESET;
            case Severity::Info:
                return std::string(colors::CYAN) + label + colors::RESET;
        }
        return label;
    }

    void print_heading(std::ostream& out, const std::string_view title) {
        if (colors::enabled()) {
            out << colors::BOLD << title << colors::RESET << "\n";
        } else {
            out << title << "\n";
        }
        out << std::string(60, '-') << "\n";
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back();
        }
        rows_.push_back(std::move(row));
        separators_.push_back(false);
    }

    void Table::add_separator() {
        if (!separators_.empty()) {
            separators_.back() = true;
        }
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width == 0) {
                std::size_t max_width = columns_[i].header.length();
                for (const auto& row : rows_) {
                    if (i < row.size() && row[i].length() > max_width) {
                        max_width = row[i].length();
                    }
                }
                columns_[i].width = max_width;
            }
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header = false) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                if (cell.length() > col.width && col.width > 3) {
                    cell = cell.substr(0, col.width - 3) + "...";
                }

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }

                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }

                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (i < temp.columns_.size() - 1) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        auto render_separator = [&]() {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i < temp.columns_.size() - 1) {
                    out << "--";
                }
            }
            out << "\n";
        };

        Row header;
        for (const auto& col : temp.columns_) {
            header.push_back(col.header);
        }
        render_row(header, true);
        render_separator();

        for (std::size_t i = 0; i < temp.rows_.size(); ++i) {
            render_row(temp.rows_[i]);
            if (i < temp.separators_.size() && temp.separators_[i]) {
                render_separator();
            }
        }
    }

}  // namespace gk::cli
