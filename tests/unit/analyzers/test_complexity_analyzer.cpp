//
// Created by gregorian-rayne on 10/13/26.
//

#include "gk/analyzers/complexity_analyzer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace gk::analyzers
{
    class ComplexityAnalyzerTest : public ::testing::Test {
    protected:
        std::vector<Finding> run(const std::string& path, const ChangedLineSet& lines) const {
            auto result = analyzer_.analyze(path, lines, limits_);
            EXPECT_TRUE(result.is_ok());
            return result.is_ok() ? result.value() : std::vector<Finding>{};
        }

        std::vector<Finding> run(const std::string& path, const std::vector<std::string>& contents) const {
            ChangedLineSet lines;
            std::size_t number = 1;
            for (const auto& content : contents) {
                lines.push_back(ChangedLine{number++, content});
            }
            return run(path, lines);
        }

        static std::size_t count_rule(const std::vector<Finding>& findings, const std::string& rule_id) {
            return static_cast<std::size_t>(std::ranges::count_if(findings, [&](const Finding& f) {
                return f.rule_id == rule_id;
            }));
        }

        ComplexityAnalyzer analyzer_;
        config::ReviewLimits limits_{120, 50};
    };

    TEST_F(ComplexityAnalyzerTest, Name) {
        EXPECT_EQ(analyzer_.name(), "Complexity");
    }

    TEST_F(ComplexityAnalyzerTest, DeepNestingReportedOnce) {
        const auto findings = run("app.py", {
            "if a:",
            "    for x in items:",
            "        while running:",
            "            if ready:",
            "                with lock:",
            "                    go()",
        });

        ASSERT_EQ(count_rule(findings, "DEEP_NESTING"), 1u);
        EXPECT_EQ(findings[0].line, 4u);
        EXPECT_EQ(findings[0].severity, Severity::Warning);
    }

    TEST_F(ComplexityAnalyzerTest, ShallowNestingIsAccepted) {
        const auto findings = run("app.js", {
            "if (a) {",
            "  for (const x of xs) {",
            "    while (y) {",
            "      step();",
            "    }",
            "  }",
            "}",
        });

        EXPECT_EQ(count_rule(findings, "DEEP_NESTING"), 0u);
    }

    TEST_F(ComplexityAnalyzerTest, SiblingBlocksDoNotAccumulate) {
        const auto findings = run("app.py", {
            "if a:",
            "    pass",
            "if b:",
            "    pass",
            "if c:",
            "    pass",
            "if d:",
            "    pass",
        });

        EXPECT_EQ(count_rule(findings, "DEEP_NESTING"), 0u);
    }

    TEST_F(ComplexityAnalyzerTest, GapInChangedLinesResetsNesting) {
        const ChangedLineSet lines = {
            {1, "if a:"},
            {2, "    for x in items:"},
            {3, "        while running:"},
            {40, "            if ready:"},
        };

        EXPECT_EQ(count_rule(run("app.py", lines), "DEEP_NESTING"), 0u);
    }

    TEST_F(ComplexityAnalyzerTest, DenseBooleanExpression) {
        const auto findings = run("app.py", std::vector<std::string>{
            "if a and b or c and d:",
            "if a and b:",
        });

        ASSERT_EQ(count_rule(findings, "COMPLEX_BOOLEAN_EXPRESSION"), 1u);
        const auto it = std::ranges::find(findings, std::string("COMPLEX_BOOLEAN_EXPRESSION"), &Finding::rule_id);
        EXPECT_EQ(it->line, 1u);
        EXPECT_NE(it->message.find("3 operators"), std::string::npos);
    }

    TEST_F(ComplexityAnalyzerTest, DenseBooleanWithSymbols) {
        EXPECT_EQ(count_rule(run("app.cpp", {"return a && b && c || d;"}), "COMPLEX_BOOLEAN_EXPRESSION"), 1u);
        EXPECT_EQ(count_rule(run("app.cpp", {"return a && b || c;"}), "COMPLEX_BOOLEAN_EXPRESSION"), 0u);
    }

    TEST_F(ComplexityAnalyzerTest, NestedTernaryInJavaScript) {
        EXPECT_EQ(count_rule(run("app.ts", {"const v = a ? b : c ? d : e;"}), "NESTED_TERNARY"), 1u);
        EXPECT_EQ(count_rule(run("app.ts", {"const v = a ? b : c;"}), "NESTED_TERNARY"), 0u);
        EXPECT_EQ(count_rule(run("app.py", {"v = a ? b : c ? d : e"}), "NESTED_TERNARY"), 0u);
    }

    TEST_F(ComplexityAnalyzerTest, BlankLinesAreSkipped) {
        EXPECT_TRUE(run("app.py", {"", "   ", "x = 1"}).empty());
    }
}  // namespace gk::analyzers
