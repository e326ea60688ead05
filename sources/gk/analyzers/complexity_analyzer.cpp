//
// Created by gregorian-rayne on 10/6/26.
//

#include "gk/analyzers/complexity_analyzer.hpp"
#include "gk/diff/diff_parser.hpp"
#include "gk/utils/string_utils.hpp"

#include <algorithm>
#include <iterator>

namespace gk::analyzers
{
    namespace {

        constexpr std::string_view kDeepNesting = "DEEP_NESTING";
        constexpr std::string_view kComplexBoolean = "COMPLEX_BOOLEAN_EXPRESSION";

        constexpr const char* kControlKeywordPattern =
            R"(^\s*(\}\s*)?(if|elif|else\s+if|for|foreach|while|do|switch|case|try|catch|except|with)\b)";

        constexpr const char* kBooleanOperatorPattern = R"(&&|\|\||\band\b|\bor\b)";

        std::vector<PatternRule> complexity_rule_table() {
            return {
                {"NESTED_TERNARY", R"(\?[^:]*:[^?]*\?[^:]*:)", Severity::Warning,
                 "Nested ternary detected on changed line; consider clearer control flow.",
                 {Language::JavaScript, Language::TypeScript}, false, std::nullopt},
            };
        }

        /**
         * Indentation stack of the control lines enclosing the current line
         * within one window of consecutive added lines.
         */
        class NestingTracker {
        public:
            void reset() {
                stack_.clear();
                armed_ = true;
            }

            /**
             * Closes every block opened at the same or a deeper indentation.
             */
            void close_blocks(const std::size_t indent) {
                while (!stack_.empty() && stack_.back() >= indent) {
                    stack_.pop_back();
                }
                if (stack_.size() < kMaxNestingDepth) {
                    armed_ = true;
                }
            }

            /**
             * Opens a block and reports whether the threshold was just crossed.
             */
            [[nodiscard]] bool open_block(const std::size_t indent) {
                stack_.push_back(indent);
                if (stack_.size() >= kMaxNestingDepth && armed_) {
                    armed_ = false;
                    return true;
                }
                return false;
            }

            [[nodiscard]] std::size_t depth() const noexcept {
                return stack_.size();
            }

        private:
            std::vector<std::size_t> stack_;
            bool armed_ = true;
        };

    }  // namespace

    ComplexityAnalyzer::ComplexityAnalyzer()
        : control_keyword_(kControlKeywordPattern, std::regex::ECMAScript | std::regex::optimize)
        , boolean_operator_(kBooleanOperatorPattern, std::regex::ECMAScript | std::regex::optimize)
        , rules_(compile_rules(complexity_rule_table()))
    {}

    std::vector<PatternRule> ComplexityAnalyzer::rules() const {
        std::vector<PatternRule> result;
        result.push_back({std::string(kDeepNesting), kControlKeywordPattern, Severity::Warning,
                          "Changed control flow nests " + std::to_string(kMaxNestingDepth) +
                              " or more levels deep.", {}, false, std::nullopt});
        result.push_back({std::string(kComplexBoolean), kBooleanOperatorPattern, Severity::Warning,
                          "Changed line has a dense boolean expression.", {}, false, std::nullopt});
        for (const auto& rule : rules_) {
            result.push_back(rule.rule());
        }
        return result;
    }

    Result<std::vector<Finding>, Error> ComplexityAnalyzer::analyze(
        const std::string_view path,
        const ChangedLineSet& lines,
        const config::ReviewLimits& limits
    ) const {
        (void)limits;

        std::vector<Finding> findings;
        NestingTracker nesting;
        std::optional<std::size_t> previous_line;

        for (const auto& line : lines) {
            if (previous_line && line.number != *previous_line + 1) {
                nesting.reset();
            }
            previous_line = line.number;

            const std::string_view text = scan_window(line.content);
            if (string_utils::trim(text).empty()) {
                continue;
            }

            const std::size_t indent = string_utils::indentation_width(text);
            nesting.close_blocks(indent);

            if (std::regex_search(text.begin(), text.end(), control_keyword_) && nesting.open_block(indent)) {
                findings.push_back(make_finding(
                    path, line, Severity::Warning, kDeepNesting,
                    "Changed control flow reaches nesting depth " + std::to_string(nesting.depth()) +
                        "; consider extracting a function or returning early.",
                    name()
                ));
            }

            const auto operators = static_cast<std::size_t>(std::distance(
                std::cregex_iterator(text.data(), text.data() + text.size(), boolean_operator_),
                std::cregex_iterator()
            ));
            if (operators >= kMaxBooleanOperators) {
                findings.push_back(make_finding(
                    path, line, Severity::Warning, kComplexBoolean,
                    "Changed line has a dense boolean expression (" + std::to_string(operators) +
                        " operators); consider extracting named sub-expressions.",
                    name()
                ));
            }
        }

        auto pattern_findings = apply_rules(rules_, path, diff::detect_language(path), lines, name());
        findings.insert(findings.end(),
                        std::make_move_iterator(pattern_findings.begin()),
                        std::make_move_iterator(pattern_findings.end()));

        std::ranges::stable_sort(findings, {}, &Finding::line);
        return Result<std::vector<Finding>, Error>::success(std::move(findings));
    }

}  // namespace gk::analyzers
