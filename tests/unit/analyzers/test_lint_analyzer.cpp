//
// Created by gregorian-rayne on 10/13/26.
//

#include "gk/analyzers/lint_analyzer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace gk::analyzers
{
    class LintAnalyzerTest : public ::testing::Test {
    protected:
        static ChangedLineSet numbered(const std::vector<std::string>& contents, std::size_t first = 1) {
            ChangedLineSet lines;
            for (const auto& content : contents) {
                lines.push_back(ChangedLine{first++, content});
            }
            return lines;
        }

        std::vector<Finding> run(const std::string& path, const std::vector<std::string>& contents) const {
            auto result = analyzer_.analyze(path, numbered(contents), limits_);
            EXPECT_TRUE(result.is_ok());
            return result.is_ok() ? result.value() : std::vector<Finding>{};
        }

        static bool has_rule(const std::vector<Finding>& findings, const std::string& rule_id) {
            return std::ranges::any_of(findings, [&](const Finding& f) { return f.rule_id == rule_id; });
        }

        LintAnalyzer analyzer_;
        config::ReviewLimits limits_{20, 50};
    };

    TEST_F(LintAnalyzerTest, Name) {
        EXPECT_EQ(analyzer_.name(), "Lint");
        EXPECT_FALSE(analyzer_.description().empty());
    }

    TEST_F(LintAnalyzerTest, LineTooLong) {
        const auto findings = run("app.py", {"x = 'aaaaaaaaaaaaaaaaaaaa'"});

        ASSERT_TRUE(has_rule(findings, "LINE_TOO_LONG"));
        const auto& finding = findings.front();
        EXPECT_EQ(finding.rule_id, "LINE_TOO_LONG");
        EXPECT_EQ(finding.severity, Severity::Warning);
        EXPECT_EQ(finding.line, 1u);
        EXPECT_EQ(finding.message, "Line length is 26 characters (limit: 20).");
        EXPECT_EQ(finding.analyzer, "Lint");
    }

    TEST_F(LintAnalyzerTest, LineAtLimitIsAccepted) {
        const auto findings = run("app.py", {std::string(20, 'a')});

        EXPECT_FALSE(has_rule(findings, "LINE_TOO_LONG"));
    }

    TEST_F(LintAnalyzerTest, LineLengthCountsCharactersNotBytes) {
        // 20 two-byte characters
        std::string text;
        for (int i = 0; i < 20; ++i) {
            text += "\xC3\xA9";
        }
        const auto findings = run("notes.txt", {text});

        EXPECT_FALSE(has_rule(findings, "LINE_TOO_LONG"));
    }

    TEST_F(LintAnalyzerTest, TrailingWhitespace) {
        const auto findings = run("README.md", {"hello ", "tab\t", "clean"});

        ASSERT_EQ(findings.size(), 2u);
        EXPECT_EQ(findings[0].rule_id, "TRAILING_WHITESPACE");
        EXPECT_EQ(findings[0].severity, Severity::Info);
        EXPECT_EQ(findings[1].line, 2u);
    }

    TEST_F(LintAnalyzerTest, TrailingWhitespaceChecksWholeLine) {
        std::string padded(kMaxScannedChars + 500, 'a');
        padded[kMaxScannedChars - 1] = ' ';
        const auto clean = run("bundle.js", {padded});
        EXPECT_FALSE(has_rule(clean, "TRAILING_WHITESPACE"));

        const auto trailing = run("bundle.js", {std::string(100000, 'a') + " "});
        EXPECT_TRUE(has_rule(trailing, "TRAILING_WHITESPACE"));
        EXPECT_TRUE(has_rule(trailing, "LINE_TOO_LONG"));
    }

    TEST_F(LintAnalyzerTest, ScanWindowStopsOnCharacterBoundary) {
        // A leading ASCII byte shifts every two-byte character onto odd offsets.
        std::string text = "x";
        while (text.size() < kMaxScannedChars + 10) {
            text += "\xC3\xA9";
        }
        const auto window = scan_window(text);

        EXPECT_LE(window.size(), kMaxScannedChars);
        EXPECT_EQ(window.size() % 2, 1u);
        EXPECT_EQ(scan_window("short"), "short");
    }

    TEST_F(LintAnalyzerTest, TodoMarkersIgnoreCase) {
        const auto findings = run("main.go", {"// todo: remove", "// FIXME later", "// prefix-xxx"});

        ASSERT_EQ(findings.size(), 3u);
        for (const auto& finding : findings) {
            EXPECT_EQ(finding.rule_id, "TODO_COMMENT");
        }
    }

    TEST_F(LintAnalyzerTest, DebugOutputDependsOnLanguage) {
        EXPECT_TRUE(has_rule(run("app.py", {"print('hi')"}), "PY_DEBUG_PRINT"));
        EXPECT_FALSE(has_rule(run("app.js", {"print('hi')"}), "PY_DEBUG_PRINT"));

        EXPECT_TRUE(has_rule(run("app.ts", {"console.log(x);"}), "JS_DEBUG_LOG"));
        EXPECT_FALSE(has_rule(run("app.py", {"console.log(x)"}), "JS_DEBUG_LOG"));

        EXPECT_TRUE(has_rule(run("Main.java", {"System.out.println(x);"}), "JAVA_DEBUG_PRINT"));
    }

    TEST_F(LintAnalyzerTest, BroadExceptionHandlers) {
        EXPECT_TRUE(has_rule(run("app.py", {"except:"}), "PY_BARE_EXCEPT"));
        EXPECT_TRUE(has_rule(run("app.py", {"    except Exception as e:"}), "PY_BARE_EXCEPT"));
        EXPECT_FALSE(has_rule(run("app.py", {"except ValueError:"}), "PY_BARE_EXCEPT"));

        EXPECT_TRUE(has_rule(run("io.cpp", {"} catch (...) {"}), "BROAD_CATCH"));
        EXPECT_TRUE(has_rule(run("Io.java", {"} catch (Exception e) {"}), "BROAD_CATCH"));
        EXPECT_FALSE(has_rule(run("io.cpp", {"} catch (const std::bad_alloc&) {"}), "BROAD_CATCH"));
    }

    TEST_F(LintAnalyzerTest, PythonTabIndent) {
        EXPECT_TRUE(has_rule(run("app.py", {"\tx = 1"}), "PY_TAB_INDENT"));
        EXPECT_FALSE(has_rule(run("app.go", {"\tx := 1"}), "PY_TAB_INDENT"));
    }

    TEST_F(LintAnalyzerTest, FindingsOrderedByLine) {
        const auto findings = run("app.py", {"ok", "print('a') ", "fine", "# TODO"});

        ASSERT_FALSE(findings.empty());
        for (std::size_t i = 1; i < findings.size(); ++i) {
            EXPECT_LE(findings[i - 1].line, findings[i].line);
        }
        EXPECT_EQ(findings.back().rule_id, "TODO_COMMENT");
        EXPECT_EQ(findings.back().line, 4u);
    }

    TEST_F(LintAnalyzerTest, SnippetIsTrimmedLine) {
        const auto findings = run("app.py", {"    print('x')"});

        ASSERT_TRUE(has_rule(findings, "PY_DEBUG_PRINT"));
        EXPECT_EQ(findings.front().snippet, "print('x')");
    }

    TEST_F(LintAnalyzerTest, EmptyInput) {
        EXPECT_TRUE(run("app.py", {}).empty());
    }

    TEST_F(LintAnalyzerTest, RulesListIncludesLengthCheck) {
        const auto rules = analyzer_.rules();

        ASSERT_FALSE(rules.empty());
        EXPECT_EQ(rules.front().id, "LINE_TOO_LONG");
    }
}  // namespace gk::analyzers
