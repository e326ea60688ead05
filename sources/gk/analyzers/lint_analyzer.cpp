//
// Created by gregorian-rayne on 10/5/26.
//

#include "gk/analyzers/lint_analyzer.hpp"
#include "gk/diff/diff_parser.hpp"
#include "gk/utils/string_utils.hpp"

#include <algorithm>
#include <iterator>

namespace gk::analyzers
{
    namespace {

        constexpr std::string_view kLineTooLong = "LINE_TOO_LONG";
        constexpr std::string_view kTrailingWhitespace = "TRAILING_WHITESPACE";

        bool has_trailing_whitespace(const std::string_view text) noexcept {
            return !text.empty() && (text.back() == ' ' || text.back() == '\t');
        }

        std::vector<PatternRule> lint_rule_table() {
            return {
                {"TODO_COMMENT", R"(\b(TODO|FIXME|XXX)\b)", Severity::Info,
                 "TODO/FIXME marker found in changed line.", {}, true, std::nullopt},
                {"PY_DEBUG_PRINT", R"(^\s*print\()", Severity::Warning,
                 "Debug print statement found in changed line.", {Language::Python}, false, std::nullopt},
                {"JS_DEBUG_LOG", R"(\bconsole\.(log|debug)\s*\()", Severity::Warning,
                 "Debug console.log statement found in changed line.",
                 {Language::JavaScript, Language::TypeScript}, false, std::nullopt},
                {"JAVA_DEBUG_PRINT", R"(\bSystem\.(out|err)\.print(ln|f)?\s*\()", Severity::Warning,
                 "Debug System.out/System.err output found in changed line.",
                 {Language::Java, Language::Kotlin, Language::Scala}, false, std::nullopt},
                {"PY_BARE_EXCEPT", R"(^\s*except\s*(\(\s*)?((Base)?Exception\s*\)?\s*)?(as\s+\w+\s*)?:)", Severity::Warning,
                 "Bare or broad `except` swallows unrelated errors; catch specific exceptions.",
                 {Language::Python}, false, std::nullopt},
                {"BROAD_CATCH", R"(\bcatch\s*\(\s*(\.\.\.|(java\.lang\.|System\.)?(Exception|Throwable)(\s+\w+)?)\s*\))", Severity::Warning,
                 "Catch-all handler swallows unrelated errors; catch specific exceptions.",
                 {Language::C, Language::Cpp, Language::Java, Language::CSharp, Language::Kotlin, Language::Scala},
                 false, std::nullopt},
                {"PY_TAB_INDENT", R"(^ *\t)", Severity::Warning,
                 "Tab character used for indentation in Python code.", {Language::Python}, false, std::nullopt},
            };
        }

    }  // namespace

    LintAnalyzer::LintAnalyzer()
        : rules_(compile_rules(lint_rule_table()))
    {}

    std::vector<PatternRule> LintAnalyzer::rules() const {
        std::vector<PatternRule> result;
        result.push_back({std::string(kLineTooLong), "<length > max_line_length>", Severity::Warning,
                          "Line exceeds the configured length limit.", {}, false, std::nullopt});
        result.push_back({std::string(kTrailingWhitespace), R"([ \t]$)", Severity::Info,
                          "Line has trailing whitespace.", {}, false, std::nullopt});
        for (const auto& rule : rules_) {
            result.push_back(rule.rule());
        }
        return result;
    }

    Result<std::vector<Finding>, Error> LintAnalyzer::analyze(
        const std::string_view path,
        const ChangedLineSet& lines,
        const config::ReviewLimits& limits
    ) const {
        const Language language = diff::detect_language(path);
        std::vector<Finding> findings;

        // Whole-line checks lead the findings of their line. Pattern rules
        // only see the scan window of very long lines.
        for (const auto& line : lines) {
            if (const auto length = string_utils::utf8_length(line.content); length > limits.max_line_length) {
                findings.push_back(make_finding(
                    path, line, Severity::Warning, kLineTooLong,
                    "Line length is " + std::to_string(length) + " characters (limit: " +
                        std::to_string(limits.max_line_length) + ").",
                    name()
                ));
            }
            if (has_trailing_whitespace(line.content)) {
                findings.push_back(make_finding(
                    path, line, Severity::Info, kTrailingWhitespace, "Line has trailing whitespace.", name()
                ));
            }
        }

        auto pattern_findings = apply_rules(rules_, path, language, lines, name());
        findings.insert(findings.end(),
                        std::make_move_iterator(pattern_findings.begin()),
                        std::make_move_iterator(pattern_findings.end()));

        std::ranges::stable_sort(findings, {}, &Finding::line);
        return Result<std::vector<Finding>, Error>::success(std::move(findings));
    }

}  // namespace gk::analyzers
