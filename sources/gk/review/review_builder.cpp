//
// Created by gregorian-rayne on 10/8/26.
//

#include "gk/review/review_builder.hpp"
#include "gk/utils/string_utils.hpp"

#include <algorithm>
#include <map>
#include <sstream>

namespace gk::review
{
    namespace {

        using string_utils::escape_table_cell;
        using string_utils::to_upper;

        /**
         * Wraps text in a Markdown code span whose fence is longer than any
         * backtick run inside it.
         */
        std::string code_span(const std::string_view text) {
            std::size_t longest = 0;
            std::size_t run = 0;
            for (const char c : text) {
                run = c == '`' ? run + 1 : 0;
                longest = std::max(longest, run);
            }

            const std::string fence(longest + 1, '`');
            const bool pad = !text.empty() && (text.front() == '`' || text.back() == '`');
            std::string out = fence;
            if (pad) out += ' ';
            out += text;
            if (pad) out += ' ';
            out += fence;
            return out;
        }

        void render_scope(std::ostringstream& out, const ReviewScope& scope, const std::size_t total) {
            out << "### Scope\n";
            if (!scope.pull_request_id.empty()) {
                out << "- Pull request: " << code_span(scope.pull_request_id) << "\n";
            }
            out << "- Files analyzed: " << scope.files_analyzed << "\n";
            out << "- Changed lines analyzed: " << scope.changed_lines_analyzed << "\n";
            out << "- Findings: " << total << "\n\n";
        }

        void render_severity_table(std::ostringstream& out, const SeverityCounts& counts) {
            out << "### Severity Breakdown\n";
            out << "| Severity | Count |\n";
            out << "| --- | ---: |\n";
            out << "| ERROR | " << counts.error << " |\n";
            out << "| WARNING | " << counts.warning << " |\n";
            out << "| INFO | " << counts.info << " |\n\n";
        }

        void render_file_table(std::ostringstream& out, const std::vector<FileSeverityRow>& rows) {
            out << "### Files\n";
            out << "| File | Error | Warning | Info |\n";
            out << "| --- | ---: | ---: | ---: |\n";
            for (const auto& row : rows) {
                out << "| " << code_span(escape_table_cell(row.path)) << " | "
                    << row.counts.error << " | "
                    << row.counts.warning << " | "
                    << row.counts.info << " |\n";
            }
            out << "\n";
        }

        void render_findings_table(std::ostringstream& out, const std::vector<Finding>& sorted) {
            out << "### Findings (Changed Lines Only)\n";
            out << "| File | Line | Severity | Rule | Message |\n";
            out << "| --- | ---: | --- | --- | --- |\n";

            const std::size_t rows = std::min(sorted.size(), kMaxTableRows);
            for (std::size_t i = 0; i < rows; ++i) {
                const auto& finding = sorted[i];
                out << "| " << code_span(escape_table_cell(finding.path)) << " | "
                    << finding.line << " | "
                    << to_upper(to_string(finding.severity)) << " | "
                    << code_span(escape_table_cell(finding.rule_id)) << " | "
                    << escape_table_cell(finding.message) << " |\n";
            }

            if (sorted.size() > kMaxTableRows) {
                out << "\n_Table truncated to first " << kMaxTableRows << " findings; "
                    << sorted.size() - kMaxTableRows
                    << " additional finding(s) included in summary counts only._\n";
            }
        }

        std::string render_summary(
            const ReviewScope& scope,
            const std::vector<Finding>& sorted,
            const SeverityCounts& counts,
            const std::vector<FileSeverityRow>& rows,
            const std::size_t inline_count,
            const std::size_t max_inline_comments
        ) {
            std::ostringstream out;
            out << "## Gatekeeper Review\n\n";
            render_scope(out, scope, sorted.size());
            render_severity_table(out, counts);

            if (sorted.empty()) {
                out << "### Result\n";
                out << "No issues found on changed lines.\n";
            } else {
                render_file_table(out, rows);
                render_findings_table(out, sorted);

                if (inline_count < sorted.size()) {
                    out << "\n_Inline comments limited to " << inline_count << " of " << sorted.size()
                        << " findings (max_inline_comments = " << max_inline_comments << ")._\n";
                }
            }

            if (!scope.skipped_files.empty()) {
                out << "\n### Skipped Files\n";
                out << "The following files could not be parsed and were not analyzed:\n";
                for (const auto& path : scope.skipped_files) {
                    out << "- " << code_span(path) << "\n";
                }
            }

            return out.str();
        }

    }  // namespace

    std::vector<Finding> sort_for_review(std::vector<Finding> findings) {
        std::ranges::stable_sort(findings, [](const Finding& a, const Finding& b) {
            if (a.severity != b.severity) {
                return severity_rank(a.severity) > severity_rank(b.severity);
            }
            if (a.path != b.path) {
                return a.path < b.path;
            }
            return a.line < b.line;
        });
        return findings;
    }

    SeverityCounts count_by_severity(const std::vector<Finding>& findings) {
        SeverityCounts counts;
        for (const auto& finding : findings) {
            counts.add(finding.severity);
        }
        return counts;
    }

    std::vector<FileSeverityRow> summarize_files(const std::vector<Finding>& findings) {
        std::map<std::string, SeverityCounts> by_path;
        for (const auto& finding : findings) {
            by_path[finding.path].add(finding.severity);
        }

        std::vector<FileSeverityRow> rows;
        rows.reserve(by_path.size());
        for (auto& [path, counts] : by_path) {
            rows.push_back(FileSeverityRow{path, counts});
        }
        return rows;
    }

    std::string format_comment_body(const Finding& finding) {
        std::string body = "[" + to_upper(to_string(finding.severity)) + "] " + finding.message;
        body += "\n\n";
        body += code_span(finding.snippet.empty() ? std::string_view("<empty line>") : std::string_view(finding.snippet));
        return string_utils::truncate_utf8(body, kMaxCommentChars);
    }

    Review build_review(
        const std::vector<Finding>& findings,
        const std::size_t max_inline_comments,
        const ReviewScope& scope
    ) {
        const auto sorted = sort_for_review(findings);

        Review review;
        review.pull_request_id = scope.pull_request_id;
        review.total_findings = sorted.size();
        review.severity_counts = count_by_severity(sorted);
        review.file_rows = summarize_files(sorted);

        const std::size_t inline_count = std::min(sorted.size(), max_inline_comments);
        review.inline_comments.reserve(inline_count);
        for (std::size_t i = 0; i < inline_count; ++i) {
            const auto& finding = sorted[i];
            review.inline_comments.push_back(InlineComment{
                finding.path,
                finding.line,
                finding.severity,
                finding.rule_id,
                format_comment_body(finding)
            });
        }

        review.summary_markdown = render_summary(
            scope, sorted, review.severity_counts, review.file_rows, inline_count, max_inline_comments
        );
        return review;
    }

}  // namespace gk::review
