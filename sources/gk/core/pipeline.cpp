//
// Created by gregorian-rayne on 10/9/26.
//

#include "gk/pipeline.hpp"
#include "gk/diff/diff_parser.hpp"
#include "gk/review/review_builder.hpp"
#include "gk/utils/parallel.hpp"

#include <algorithm>
#include <iterator>

namespace gk
{
    namespace {

        struct ParsedFile {
            const FilePatch* file = nullptr;
            ChangedLineSet lines;
        };

        struct AnalysisUnit {
            std::size_t file_index = 0;
            std::size_t analyzer_index = 0;
        };

    }  // namespace

    std::size_t worker_count(const std::size_t requested, const std::size_t units) noexcept {
        const std::size_t wanted = requested == 0 ? parallel::hardware_concurrency() : requested;
        return std::max<std::size_t>(1, std::min(wanted, units));
    }

    ReviewPipeline::ReviewPipeline(analyzers::AnalyzerRunner runner, const PipelineOptions options)
        : runner_(std::move(runner))
        , options_(options) {
    }

    Result<PipelineOutcome, Error> ReviewPipeline::run(
        const PullRequest& pull_request,
        const config::ReviewConfig& review_config
    ) const {
        auto limits_result = review_config.validate();
        if (limits_result.is_err()) {
            return Result<PipelineOutcome, Error>::failure(limits_result.error());
        }
        const config::ReviewLimits limits = limits_result.value();

        PipelineOutcome outcome;
        review::ReviewScope scope;
        scope.pull_request_id = pull_request.id;

        std::vector<ParsedFile> parsed;
        parsed.reserve(pull_request.files.size());

        for (const auto& file : pull_request.files) {
            auto lines = diff::changed_lines(file);
            if (lines.is_err()) {
                outcome.diagnostics.push_back(Diagnostic{
                    DiagnosticKind::FileSkipped, file.path, "", lines.error()
                });
                scope.skipped_files.push_back(file.path);
                continue;
            }
            outcome.changed_lines_analyzed += lines.value().size();
            parsed.push_back(ParsedFile{&file, std::move(lines).value()});
        }
        outcome.files_analyzed = parsed.size();

        std::vector<AnalysisUnit> units;
        for (std::size_t f = 0; f < parsed.size(); ++f) {
            if (parsed[f].lines.empty()) {
                continue;
            }
            for (std::size_t a = 0; a < runner_.size(); ++a) {
                units.push_back(AnalysisUnit{f, a});
            }
        }

        auto analyze_unit = [this, &parsed, &limits](const AnalysisUnit& unit) {
            const ParsedFile& target = parsed[unit.file_index];
            return runner_.run_one(unit.analyzer_index, target.file->path, target.lines, limits);
        };

        std::vector<analyzers::FileAnalysis> parts;
        if (options_.threads == 1 || units.size() <= 1) {
            parts.reserve(units.size());
            for (const auto& unit : units) {
                parts.push_back(analyze_unit(unit));
            }
        } else {
            parallel::ThreadPool pool(static_cast<unsigned int>(worker_count(options_.threads, units.size())));
            parts = parallel::map(units, analyze_unit, pool);
        }

        // Units are ordered by file, then analyzer, so one merge keeps both orders.
        auto merged = analyzers::AnalyzerRunner::merge(std::move(parts));
        outcome.diagnostics.insert(outcome.diagnostics.end(),
                                   std::make_move_iterator(merged.diagnostics.begin()),
                                   std::make_move_iterator(merged.diagnostics.end()));

        scope.files_analyzed = outcome.files_analyzed;
        scope.changed_lines_analyzed = outcome.changed_lines_analyzed;
        outcome.review = review::build_review(merged.findings, limits.max_inline_comments, scope);

        return Result<PipelineOutcome, Error>::success(std::move(outcome));
    }

}  // namespace gk
