//
// Created by gregorian-rayne on 10/8/26.
//

#ifndef GK_REVIEW_BUILDER_HPP
#define GK_REVIEW_BUILDER_HPP

/**
 * @file review_builder.hpp
 * @brief Aggregates findings into the single Review of a run.
 *
 * The builder is deterministic: the same findings always produce the same
 * summary text and the same inline comments in the same order. Findings
 * beyond the inline-comment cap still count in every total.
 */

#include "gk/types.hpp"

#include <string>
#include <vector>

namespace gk::review {

    /// Rows of the findings table before it is truncated.
    inline constexpr std::size_t kMaxTableRows = 40;

    /// Upper bound on one inline comment body.
    inline constexpr std::size_t kMaxCommentChars = 64000;

    /**
     * Run-level facts shown in the Scope section of the summary.
     */
    struct ReviewScope {
        std::string pull_request_id;
        std::size_t files_analyzed = 0;
        std::size_t changed_lines_analyzed = 0;
        std::vector<std::string> skipped_files;
    };

    /**
     * Orders findings for review: severity rank descending, then path,
     * then line. The sort is stable, so ties keep their input order.
     */
    [[nodiscard]] std::vector<Finding> sort_for_review(std::vector<Finding> findings);

    /**
     * Counts findings per severity.
     */
    [[nodiscard]] SeverityCounts count_by_severity(const std::vector<Finding>& findings);

    /**
     * One row per file with a finding, ordered by path.
     */
    [[nodiscard]] std::vector<FileSeverityRow> summarize_files(const std::vector<Finding>& findings);

    /**
     * Inline comment body: "[ERROR] message" followed by the snippet.
     */
    [[nodiscard]] std::string format_comment_body(const Finding& finding);

    /**
     * Builds the Review.
     *
     * @param findings Every finding of the run, files in input order and
     *        analyzers in registration order within a file.
     * @param max_inline_comments Cap on inline comments; 0 disables them.
     * @param scope Facts for the summary header.
     */
    [[nodiscard]] Review build_review(
        const std::vector<Finding>& findings,
        std::size_t max_inline_comments,
        const ReviewScope& scope = {}
    );

}  // namespace gk::review

#endif //GK_REVIEW_BUILDER_HPP
