//
// Created by gregorian-rayne on 10/7/26.
//

#include "gk/analyzers/runner.hpp"
#include "gk/analyzers/complexity_analyzer.hpp"
#include "gk/analyzers/lint_analyzer.hpp"
#include "gk/analyzers/security_analyzer.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

namespace gk::analyzers
{
    namespace {

        bool has_line(const ChangedLineSet& lines, const std::size_t number) {
            const auto it = std::ranges::lower_bound(lines, number, {}, &ChangedLine::number);
            return it != lines.end() && it->number == number;
        }

        Diagnostic degraded(const std::string_view path, const IAnalyzer& analyzer, Error error) {
            return Diagnostic{
                DiagnosticKind::AnalyzerDegraded,
                std::string(path),
                std::string(analyzer.name()),
                std::move(error)
            };
        }

    }  // namespace

    void AnalyzerRunner::register_analyzer(std::unique_ptr<IAnalyzer> analyzer) {
        analyzers_.push_back(std::move(analyzer));
    }

    std::vector<const IAnalyzer*> AnalyzerRunner::list_analyzers() const {
        std::vector<const IAnalyzer*> result;
        result.reserve(analyzers_.size());

        for (const auto& analyzer : analyzers_) {
            result.push_back(analyzer.get());
        }

        return result;
    }

    FileAnalysis AnalyzerRunner::run_one(
        const std::size_t index,
        const std::string_view path,
        const ChangedLineSet& lines,
        const config::ReviewLimits& limits
    ) const {
        FileAnalysis analysis;
        if (index >= analyzers_.size()) {
            return analysis;
        }

        const IAnalyzer& analyzer = *analyzers_[index];
        if (lines.empty() || !analyzer.applies_to(path)) {
            return analysis;
        }

        std::vector<Finding> findings;
        try {
            auto result = analyzer.analyze(path, lines, limits);
            if (result.is_err()) {
                analysis.diagnostics.push_back(degraded(path, analyzer, result.error()));
                return analysis;
            }
            findings = std::move(result).value();
        } catch (const std::exception& e) {
            analysis.diagnostics.push_back(degraded(path, analyzer,
                Error::analysis_error("Analyzer threw an exception", e.what())));
            return analysis;
        } catch (...) {
            analysis.diagnostics.push_back(degraded(path, analyzer,
                Error::analysis_error("Analyzer threw a non-standard exception")));
            return analysis;
        }

        for (auto& finding : findings) {
            if (!has_line(lines, finding.line)) {
                analysis.diagnostics.push_back(Diagnostic{
                    DiagnosticKind::FindingDiscarded,
                    std::string(path),
                    std::string(analyzer.name()),
                    Error::analysis_error("Finding " + finding.rule_id + " references a line outside the changed lines",
                                          "line " + std::to_string(finding.line))
                });
                continue;
            }
            analysis.findings.push_back(std::move(finding));
        }

        std::ranges::stable_sort(analysis.findings, {}, &Finding::line);
        return analysis;
    }

    FileAnalysis AnalyzerRunner::run(
        const std::string_view path,
        const ChangedLineSet& lines,
        const config::ReviewLimits& limits
    ) const {
        std::vector<FileAnalysis> parts;
        parts.reserve(analyzers_.size());

        for (std::size_t i = 0; i < analyzers_.size(); ++i) {
            parts.push_back(run_one(i, path, lines, limits));
        }

        return merge(std::move(parts));
    }

    FileAnalysis AnalyzerRunner::merge(std::vector<FileAnalysis> parts) {
        FileAnalysis merged;

        for (auto& part : parts) {
            merged.findings.insert(merged.findings.end(),
                                   std::make_move_iterator(part.findings.begin()),
                                   std::make_move_iterator(part.findings.end()));
            merged.diagnostics.insert(merged.diagnostics.end(),
                                      std::make_move_iterator(part.diagnostics.begin()),
                                      std::make_move_iterator(part.diagnostics.end()));
        }

        return merged;
    }

    AnalyzerRunner make_default_runner() {
        AnalyzerRunner runner;
        runner.register_analyzer(std::make_unique<LintAnalyzer>());
        runner.register_analyzer(std::make_unique<SecurityPatternAnalyzer>());
        runner.register_analyzer(std::make_unique<ComplexityAnalyzer>());
        return runner;
    }

}  // namespace gk::analyzers
