//
// Created by gregorian-rayne on 10/5/26.
//

#include "gk/analyzers/analyzer.hpp"
#include "gk/utils/string_utils.hpp"

#include <algorithm>

namespace gk::analyzers
{
    namespace {

        constexpr std::size_t kMaxSnippetChars = 160;

        std::regex compile(const std::string& pattern, const bool ignore_case) {
            auto flags = std::regex::ECMAScript | std::regex::optimize;
            if (ignore_case) {
                flags |= std::regex::icase;
            }
            return std::regex(pattern, flags);
        }

    }  // namespace

    CompiledRule::CompiledRule(PatternRule rule)
        : rule_(std::move(rule))
        , pattern_(compile(rule_.pattern, rule_.ignore_case))
    {
        if (rule_.unless) {
            unless_ = compile(*rule_.unless, rule_.ignore_case);
        }
    }

    bool CompiledRule::applies_to(const Language language) const {
        return rule_.languages.empty() || std::ranges::find(rule_.languages, language) != rule_.languages.end();
    }

    std::string_view scan_window(const std::string_view line) noexcept {
        if (line.size() <= kMaxScannedChars) {
            return line;
        }
        std::size_t end = kMaxScannedChars;
        while (end > 0 && (static_cast<unsigned char>(line[end]) & 0xC0) == 0x80) {
            --end;
        }
        return line.substr(0, end);
    }

    bool CompiledRule::matches(const std::string_view line) const {
        const std::string_view text = scan_window(line);
        if (!std::regex_search(text.begin(), text.end(), pattern_)) {
            return false;
        }
        return !unless_ || !std::regex_search(text.begin(), text.end(), *unless_);
    }

    std::vector<CompiledRule> compile_rules(std::vector<PatternRule> rules) {
        std::vector<CompiledRule> compiled;
        compiled.reserve(rules.size());
        for (auto& rule : rules) {
            compiled.emplace_back(std::move(rule));
        }
        return compiled;
    }

    std::string make_snippet(const std::string_view content) {
        const auto trimmed = string_utils::trim(content);
        if (trimmed.empty()) {
            return "<empty line>";
        }
        return string_utils::truncate_utf8(trimmed, kMaxSnippetChars);
    }

    Finding make_finding(
        const std::string_view path,
        const ChangedLine& line,
        const Severity severity,
        const std::string_view rule_id,
        std::string message,
        const std::string_view analyzer
    ) {
        Finding finding;
        finding.path = std::string(path);
        finding.line = line.number;
        finding.severity = severity;
        finding.rule_id = std::string(rule_id);
        finding.message = std::move(message);
        finding.analyzer = std::string(analyzer);
        finding.snippet = make_snippet(line.content);
        return finding;
    }

    std::vector<Finding> apply_rules(
        const std::vector<CompiledRule>& rules,
        const std::string_view path,
        const Language language,
        const ChangedLineSet& lines,
        const std::string_view analyzer
    ) {
        std::vector<const CompiledRule*> active;
        for (const auto& rule : rules) {
            if (rule.applies_to(language)) {
                active.push_back(&rule);
            }
        }

        std::vector<Finding> findings;
        if (active.empty()) {
            return findings;
        }

        for (const auto& line : lines) {
            for (const auto* rule : active) {
                if (rule->matches(line.content)) {
                    findings.push_back(make_finding(
                        path, line, rule->rule().severity, rule->rule().id, rule->rule().message, analyzer
                    ));
                }
            }
        }

        return findings;
    }

}  // namespace gk::analyzers
