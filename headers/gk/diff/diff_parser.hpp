//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef GK_DIFF_PARSER_HPP
#define GK_DIFF_PARSER_HPP

/**
 * @file diff_parser.hpp
 * @brief Unified diff parsing and changed-line extraction.
 *
 * Parses the patch text the host reports for one file (either a bare
 * sequence of hunks or a full "diff --git" section with file headers)
 * into hunks, and reduces those hunks to the added lines analyzers run on.
 *
 * Line classification inside a hunk:
 * - "+" (not "+++"): added, gets a new-file line number
 * - "-" (not "---"): removed, no new-file line number
 * - "\ No newline at end of file": ignored
 * - "+++" / "---": file headers once the hunk's declared line counts
 *   are used up; before that they are "+"/"-" lines whose text starts
 *   with "++" or "--"
 * - anything else: context, gets a new-file line number
 *
 * All functions are pure and safe to call from several threads.
 */

#include "gk/result.hpp"
#include "gk/error.hpp"
#include "gk/types.hpp"

#include <string_view>
#include <vector>

namespace gk::diff {

    /**
     * Parses unified diff text into hunks.
     *
     * Text before the first hunk header is preamble and skipped. Empty or
     * binary patch text yields no hunks.
     *
     * @param patch_text Raw unified diff text for one file.
     * @return The hunks in source order, or a ParseError for a malformed
     *         hunk header or inconsistent line numbering. The error context
     *         names the 1-based line of the patch text.
     */
    [[nodiscard]] Result<std::vector<Hunk>, Error> parse(std::string_view patch_text);

    /**
     * Extracts the added lines of a patch.
     *
     * @return Added lines, ascending and unique by new-file line number.
     */
    [[nodiscard]] Result<ChangedLineSet, Error> changed_lines(std::string_view patch_text);

    /**
     * Extracts the added lines of a file, honoring its change kind.
     *
     * Removed files, binary files, empty patches and renames without
     * content changes all yield an empty set rather than an error.
     */
    [[nodiscard]] Result<ChangedLineSet, Error> changed_lines(const FilePatch& file);

    /**
     * Reduces parsed hunks to their added lines.
     */
    [[nodiscard]] ChangedLineSet collect_added_lines(const std::vector<Hunk>& hunks);

    /**
     * True for empty patch text or text that only reports a binary change.
     */
    [[nodiscard]] bool is_binary_patch(std::string_view patch_text) noexcept;

    /**
     * Detects the source language from the file extension (case-insensitive).
     */
    [[nodiscard]] Language detect_language(std::string_view path);

    /**
     * True when the path has a recognized source extension.
     */
    [[nodiscard]] inline bool is_source_file(const std::string_view path) {
        return detect_language(path) != Language::Text;
    }

}  // namespace gk::diff

#endif //GK_DIFF_PARSER_HPP
