//
// Created by gregorian-rayne on 10/7/26.
//

#ifndef GK_RUNNER_HPP
#define GK_RUNNER_HPP

/**
 * @file runner.hpp
 * @brief Runs every registered analyzer over one file.
 *
 * Analyzers are registered explicitly and keep their registration order,
 * which fixes the order of findings within a file. Each invocation is
 * isolated: an analyzer that fails or throws is recorded as a degraded
 * diagnostic and the others still report.
 */

#include "gk/analyzers/analyzer.hpp"
#include "gk/diagnostic.hpp"

#include <memory>
#include <vector>

namespace gk::analyzers {

    /**
     * Findings and diagnostics of one analyzer, or of all analyzers, for one file.
     */
    struct FileAnalysis {
        std::vector<Finding> findings;
        Diagnostics diagnostics;
    };

    class AnalyzerRunner {
    public:
        AnalyzerRunner() = default;

        AnalyzerRunner(const AnalyzerRunner&) = delete;
        AnalyzerRunner& operator=(const AnalyzerRunner&) = delete;
        AnalyzerRunner(AnalyzerRunner&&) noexcept = default;
        AnalyzerRunner& operator=(AnalyzerRunner&&) noexcept = default;

        /**
         * Appends an analyzer; registration order is reporting order.
         */
        void register_analyzer(std::unique_ptr<IAnalyzer> analyzer);

        [[nodiscard]] std::vector<const IAnalyzer*> list_analyzers() const;

        [[nodiscard]] std::size_t size() const noexcept {
            return analyzers_.size();
        }

        /**
         * Invokes the analyzer at index over one file.
         *
         * Safe to call concurrently for different (file, analyzer) pairs.
         * Findings are sorted by line; any finding on a line outside
         * lines is dropped with a FindingDiscarded diagnostic.
         */
        [[nodiscard]] FileAnalysis run_one(
            std::size_t index,
            std::string_view path,
            const ChangedLineSet& lines,
            const config::ReviewLimits& limits
        ) const;

        /**
         * Runs every analyzer over one file, in registration order.
         */
        [[nodiscard]] FileAnalysis run(
            std::string_view path,
            const ChangedLineSet& lines,
            const config::ReviewLimits& limits
        ) const;

        /**
         * Concatenates per-analyzer results given in registration order.
         */
        [[nodiscard]] static FileAnalysis merge(std::vector<FileAnalysis> parts);

    private:
        std::vector<std::unique_ptr<IAnalyzer>> analyzers_;
    };

    /**
     * Runner with Lint, SecurityPattern and Complexity, in that order.
     */
    [[nodiscard]] AnalyzerRunner make_default_runner();

}  // namespace gk::analyzers

#endif //GK_RUNNER_HPP
