//
// Created by gregorian-rayne on 10/5/26.
//

#ifndef GK_ANALYZER_HPP
#define GK_ANALYZER_HPP

/**
 * @file analyzer.hpp
 * @brief Analyzer interface and rule tables.
 *
 * Analyzers inspect the added lines of one file and report Findings.
 * They hold no state besides their compiled rule tables, so one instance
 * can serve every file of a run concurrently.
 *
 * Analyzer types:
 * - LintAnalyzer: Line length, whitespace and leftover debug constructs
 * - SecurityPatternAnalyzer: Dangerous calls in recognized source files
 * - ComplexityAnalyzer: Nesting and expression density heuristics
 */

#include "gk/result.hpp"
#include "gk/error.hpp"
#include "gk/types.hpp"
#include "gk/core/config.hpp"

#include <initializer_list>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace gk::analyzers {

    /// Leading bytes of a line that regex rules look at. Minified bundles
    /// can put a whole program on one line; only its start is scanned.
    inline constexpr std::size_t kMaxScannedChars = 1000;

    /**
     * The first kMaxScannedChars bytes of a line, cut back to a UTF-8
     * character boundary.
     */
    [[nodiscard]] std::string_view scan_window(std::string_view line) noexcept;

    /**
     * One data-driven pattern rule: regex -> severity -> message.
     *
     * An empty language list applies the rule to every file the analyzer
     * accepts. When unless is set, a line that also matches it is skipped.
     */
    struct PatternRule {
        std::string id;
        std::string pattern;
        Severity severity = Severity::Warning;
        std::string message;
        std::vector<Language> languages;
        bool ignore_case = false;
        std::optional<std::string> unless;
    };

    /**
     * A PatternRule with its regular expressions compiled.
     */
    class CompiledRule {
    public:
        explicit CompiledRule(PatternRule rule);

        [[nodiscard]] const PatternRule& rule() const noexcept { return rule_; }

        [[nodiscard]] bool applies_to(Language language) const;

        [[nodiscard]] bool matches(std::string_view line) const;

    private:
        PatternRule rule_;
        std::regex pattern_;
        std::optional<std::regex> unless_;
    };

    /**
     * Compiles a rule table.
     *
     * @throws std::regex_error for an invalid pattern; rule tables are
     *         fixed at build time so this indicates a programming error.
     */
    [[nodiscard]] std::vector<CompiledRule> compile_rules(std::vector<PatternRule> rules);

    /**
     * Builds a Finding with the snippet taken from the changed line.
     */
    [[nodiscard]] Finding make_finding(
        std::string_view path,
        const ChangedLine& line,
        Severity severity,
        std::string_view rule_id,
        std::string message,
        std::string_view analyzer
    );

    /**
     * Trimmed line text capped at 160 characters, or "<empty line>".
     */
    [[nodiscard]] std::string make_snippet(std::string_view content);

    /**
     * Runs every applicable rule of a table over the changed lines.
     *
     * Findings come out ordered by line, then by rule table order.
     */
    [[nodiscard]] std::vector<Finding> apply_rules(
        const std::vector<CompiledRule>& rules,
        std::string_view path,
        Language language,
        const ChangedLineSet& lines,
        std::string_view analyzer
    );

    /**
     * Base interface for all analyzers.
     */
    class IAnalyzer {
    public:
        virtual ~IAnalyzer() = default;

        /**
         * Returns the analyzer name recorded on each Finding.
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Returns a description of what this analyzer checks.
         */
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Whether this analyzer has anything to say about the file.
         * Files it does not apply to are skipped silently.
         */
        [[nodiscard]] virtual bool applies_to(std::string_view path) const {
            (void)path;
            return true;
        }

        /**
         * Rule table, for listing and documentation.
         */
        [[nodiscard]] virtual std::vector<PatternRule> rules() const = 0;

        /**
         * Analyzes the added lines of one file.
         *
         * @param path File path, copied onto each Finding.
         * @param lines Added lines of the file, ascending.
         * @param limits Validated review limits.
         * @return Findings on lines of the set, or an AnalysisError.
         */
        [[nodiscard]] virtual Result<std::vector<Finding>, Error> analyze(
            std::string_view path,
            const ChangedLineSet& lines,
            const config::ReviewLimits& limits
        ) const = 0;
    };

}  // namespace gk::analyzers

#endif //GK_ANALYZER_HPP
