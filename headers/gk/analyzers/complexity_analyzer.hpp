//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef GK_COMPLEXITY_ANALYZER_HPP
#define GK_COMPLEXITY_ANALYZER_HPP

/**
 * @file complexity_analyzer.hpp
 * @brief Lightweight complexity heuristics over added lines.
 *
 * This is a line-based proxy, not control-flow analysis. It works on
 * windows of consecutive added lines and estimates nesting from the
 * indentation of lines that open a branch, loop or exception block.
 */

#include "gk/analyzers/analyzer.hpp"

namespace gk::analyzers {

    /**
     * Nesting depth (control keywords stacked by indentation) at which a
     * line is reported as DEEP_NESTING.
     */
    inline constexpr std::size_t kMaxNestingDepth = 4;

    /**
     * Number of and/or/&&/|| operators on one line reported as
     * COMPLEX_BOOLEAN_EXPRESSION.
     */
    inline constexpr std::size_t kMaxBooleanOperators = 3;

    class ComplexityAnalyzer : public IAnalyzer {
    public:
        ComplexityAnalyzer();

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Complexity";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Deep nesting, dense boolean expressions and nested ternaries";
        }

        [[nodiscard]] std::vector<PatternRule> rules() const override;

        [[nodiscard]] Result<std::vector<Finding>, Error> analyze(
            std::string_view path,
            const ChangedLineSet& lines,
            const config::ReviewLimits& limits
        ) const override;

    private:
        std::regex control_keyword_;
        std::regex boolean_operator_;
        std::vector<CompiledRule> rules_;
    };

}  // namespace gk::analyzers

#endif //GK_COMPLEXITY_ANALYZER_HPP
