//
// Created by gregorian-rayne on 10/9/26.
//

#ifndef GATEKEEPER_PIPELINE_HPP
#define GATEKEEPER_PIPELINE_HPP

/**
 * @file pipeline.hpp
 * @brief End-to-end review of one pull request.
 *
 * A run validates the review limits, parses every patch, fans the
 * (file, analyzer) units out over a thread pool and aggregates the
 * merged findings into one Review. Runs share no state.
 */

#include "gk/analyzers/runner.hpp"
#include "gk/core/config.hpp"
#include "gk/diagnostic.hpp"
#include "gk/result.hpp"
#include "gk/types.hpp"

namespace gk {

    struct PipelineOptions {
        /// Worker threads. 0 = hardware concurrency, 1 = run inline.
        std::size_t threads = 0;
    };

    struct PipelineOutcome {
        Review review;
        Diagnostics diagnostics;
        std::size_t files_analyzed = 0;
        std::size_t changed_lines_analyzed = 0;
    };

    /**
     * Pool size for a run: the requested count (0 = hardware concurrency)
     * capped by the number of work units, never below 1.
     */
    [[nodiscard]] std::size_t worker_count(std::size_t requested, std::size_t units) noexcept;

    class ReviewPipeline {
    public:
        explicit ReviewPipeline(analyzers::AnalyzerRunner runner, PipelineOptions options = {});

        /**
         * Reviews one pull request.
         *
         * Only an invalid configuration fails the run. Files whose patch
         * does not parse are skipped with a FileSkipped diagnostic.
         */
        [[nodiscard]] Result<PipelineOutcome, Error> run(
            const PullRequest& pull_request,
            const config::ReviewConfig& review_config
        ) const;

        [[nodiscard]] const analyzers::AnalyzerRunner& runner() const noexcept {
            return runner_;
        }

    private:
        analyzers::AnalyzerRunner runner_;
        PipelineOptions options_;
    };

}  // namespace gk

#endif //GATEKEEPER_PIPELINE_HPP
