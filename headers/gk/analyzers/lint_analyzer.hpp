//
// Created by gregorian-rayne on 10/5/26.
//

#ifndef GK_LINT_ANALYZER_HPP
#define GK_LINT_ANALYZER_HPP

/**
 * @file lint_analyzer.hpp
 * @brief Per-line style and hygiene checks.
 */

#include "gk/analyzers/analyzer.hpp"

namespace gk::analyzers {

    /**
     * Flags, on each added line:
     * - Lines longer than max_line_length code points (warning)
     * - Trailing spaces or tabs (info)
     * - TODO/FIXME/XXX markers (info)
     * - Debug output left in code (warning)
     * - Bare or overly broad exception handlers (warning)
     * - Tab indentation in Python (warning)
     */
    class LintAnalyzer : public IAnalyzer {
    public:
        LintAnalyzer();

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Lint";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Line length, trailing whitespace and leftover debug constructs";
        }

        [[nodiscard]] std::vector<PatternRule> rules() const override;

        [[nodiscard]] Result<std::vector<Finding>, Error> analyze(
            std::string_view path,
            const ChangedLineSet& lines,
            const config::ReviewLimits& limits
        ) const override;

    private:
        std::vector<CompiledRule> rules_;
    };

}  // namespace gk::analyzers

#endif //GK_LINT_ANALYZER_HPP
