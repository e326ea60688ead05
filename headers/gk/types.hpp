//
// Created by gregorian-rayne on 10/2/26.
//

#ifndef GATEKEEPER_TYPES_HPP
#define GATEKEEPER_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for pull request review.
 *
 * Types are organized into categories:
 *
 * - Input Types: FilePatch, PullRequest, ChangeKind, Language
 * - Diff Types: DiffLine, Hunk, ChangedLine, ChangedLineSet
 * - Finding Types: Severity, Finding
 * - Review Types: SeverityCounts, FileSeverityRow, InlineComment, Review
 *
 * Each pipeline stage produces new values of these types and never
 * mutates the values it received, so they can be read from several
 * worker threads at once.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gk {

    // ============================================================================
    // Input Types
    // ============================================================================

    /**
     * How a file changed in the pull request.
     */
    enum class ChangeKind {
        Added,
        Modified,
        Removed,
        Renamed
    };

    /**
     * Source language detected from a file extension.
     *
     * Text means the file is not a recognized source language.
     */
    enum class Language {
        Text,
        C,
        Cpp,
        CSharp,
        Go,
        Java,
        JavaScript,
        Kotlin,
        Php,
        Python,
        Ruby,
        Rust,
        Scala,
        Shell,
        Sql,
        Swift,
        TypeScript
    };

    /**
     * One changed file as delivered by the host: path, raw patch text
     * (empty for binary files) and change kind.
     */
    struct FilePatch {
        std::string path;
        std::string patch;
        ChangeKind status = ChangeKind::Modified;
    };

    /**
     * Everything the pipeline needs about one triggering event.
     *
     * The id is opaque and only passed through to the Review.
     */
    struct PullRequest {
        std::string id;
        std::vector<FilePatch> files;
    };

    // ============================================================================
    // Diff Types
    // ============================================================================

    enum class DiffLineKind {
        Context,
        Added,
        Removed
    };

    /**
     * One physical line of a hunk. new_line is set for Context and Added
     * lines only.
     */
    struct DiffLine {
        DiffLineKind kind = DiffLineKind::Context;
        std::string content;
        std::optional<std::size_t> new_line;

        bool operator==(const DiffLine&) const = default;
    };

    /**
     * A contiguous diff region.
     */
    struct Hunk {
        std::size_t old_start = 0;
        std::size_t old_count = 0;
        std::size_t new_start = 0;
        std::size_t new_count = 0;
        std::string section;
        std::vector<DiffLine> lines;

        bool operator==(const Hunk&) const = default;
    };

    /**
     * An added line and its number in the new file version.
     */
    struct ChangedLine {
        std::size_t number = 0;
        std::string content;

        bool operator==(const ChangedLine&) const = default;
    };

    /**
     * Added lines of one file, ascending and unique by line number.
     */
    using ChangedLineSet = std::vector<ChangedLine>;

    // ============================================================================
    // Finding Types
    // ============================================================================

    enum class Severity {
        Info,
        Warning,
        Error
    };

    /**
     * Sort rank: a higher rank is more severe (Error > Warning > Info).
     */
    [[nodiscard]] constexpr int severity_rank(Severity severity) noexcept {
        switch (severity) {
            case Severity::Error:   return 2;
            case Severity::Warning: return 1;
            case Severity::Info:    return 0;
        }
        return 0;
    }

    /**
     * One issue reported by an analyzer on a changed line.
     */
    struct Finding {
        std::string path;
        std::size_t line = 0;
        Severity severity = Severity::Info;
        std::string rule_id;
        std::string message;
        std::string analyzer;
        std::string snippet;

        bool operator==(const Finding&) const = default;
    };

    // ============================================================================
    // Review Types
    // ============================================================================

    struct SeverityCounts {
        std::size_t error = 0;
        std::size_t warning = 0;
        std::size_t info = 0;

        void add(Severity severity) noexcept {
            switch (severity) {
                case Severity::Error:   ++error;   break;
                case Severity::Warning: ++warning; break;
                case Severity::Info:    ++info;    break;
            }
        }

        [[nodiscard]] std::size_t total() const noexcept {
            return error + warning + info;
        }

        bool operator==(const SeverityCounts&) const = default;
    };

    /**
     * Summary table row for a file with at least one finding.
     */
    struct FileSeverityRow {
        std::string path;
        SeverityCounts counts;
    };

    struct InlineComment {
        std::string path;
        std::size_t line = 0;
        Severity severity = Severity::Info;
        std::string rule_id;
        std::string message;
    };

    /**
     * The single artifact posted once per triggering event.
     *
     * inline_comments never exceeds the configured cap; total_findings and
     * severity_counts always cover every finding.
     */
    struct Review {
        std::string pull_request_id;
        std::string summary_markdown;
        SeverityCounts severity_counts;
        std::vector<FileSeverityRow> file_rows;
        std::vector<InlineComment> inline_comments;
        std::size_t total_findings = 0;
    };

    // ============================================================================
    // String Conversion
    // ============================================================================

    inline const char* to_string(Severity severity) noexcept {
        switch (severity) {
            case Severity::Info:    return "info";
            case Severity::Warning: return "warning";
            case Severity::Error:   return "error";
        }
        return "info";
    }

    inline const char* to_string(ChangeKind kind) noexcept {
        switch (kind) {
            case ChangeKind::Added:    return "added";
            case ChangeKind::Modified: return "modified";
            case ChangeKind::Removed:  return "removed";
            case ChangeKind::Renamed:  return "renamed";
        }
        return "modified";
    }

    inline const char* to_string(DiffLineKind kind) noexcept {
        switch (kind) {
            case DiffLineKind::Context: return "context";
            case DiffLineKind::Added:   return "added";
            case DiffLineKind::Removed: return "removed";
        }
        return "context";
    }

    const char* to_string(Language language) noexcept;

    /**
     * Parses "info", "warning" or "error" (case-insensitive).
     */
    [[nodiscard]] std::optional<Severity> severity_from_string(std::string_view text);

    /**
     * Parses a host file status. "copied", "changed" and "unchanged" are
     * reported as Modified.
     */
    [[nodiscard]] std::optional<ChangeKind> change_kind_from_string(std::string_view text);

}  // namespace gk

#endif //GATEKEEPER_TYPES_HPP
