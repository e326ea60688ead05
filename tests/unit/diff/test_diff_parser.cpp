//
// Created by gregorian-rayne on 10/13/26.
//

#include "gk/diff/diff_parser.hpp"

#include <gtest/gtest.h>

namespace gk::diff
{
    TEST(DiffParserTest, AddedLinesAfterContext) {
        auto result = changed_lines("@@ -1,2 +1,3 @@\n context\n+import os\n+eval(x)\n");

        ASSERT_TRUE(result.is_ok());
        const ChangedLineSet expected = {{2, "import os"}, {3, "eval(x)"}};
        EXPECT_EQ(result.value(), expected);
    }

    TEST(DiffParserTest, RemovedLinesDoNotAdvanceNewFile) {
        auto result = changed_lines("@@ -10,3 +10,3 @@\n a\n-b\n+c\n d\n");

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].number, 11u);
        EXPECT_EQ(result.value()[0].content, "c");
    }

    TEST(DiffParserTest, MultipleHunks) {
        const std::string patch =
            "@@ -1,2 +1,3 @@\n"
            " first\n"
            "+added one\n"
            " second\n"
            "@@ -20,2 +21,3 @@ def handler():\n"
            " x = 1\n"
            "+y = 2\n"
            " return x\n";

        auto hunks = parse(patch);
        ASSERT_TRUE(hunks.is_ok());
        ASSERT_EQ(hunks.value().size(), 2u);
        EXPECT_EQ(hunks.value()[1].new_start, 21u);
        EXPECT_EQ(hunks.value()[1].section, "def handler():");

        const auto lines = collect_added_lines(hunks.value());
        ASSERT_EQ(lines.size(), 2u);
        EXPECT_EQ(lines[0].number, 2u);
        EXPECT_EQ(lines[1].number, 22u);
    }

    TEST(DiffParserTest, NewFileHunk) {
        auto result = changed_lines("@@ -0,0 +1,2 @@\n+line one\n+line two\n");

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 2u);
        EXPECT_EQ(result.value()[0].number, 1u);
        EXPECT_EQ(result.value()[1].number, 2u);
    }

    TEST(DiffParserTest, OmittedCountsDefaultToOne) {
        auto hunks = parse("@@ -3 +3 @@\n-old\n+new\n");

        ASSERT_TRUE(hunks.is_ok());
        ASSERT_EQ(hunks.value().size(), 1u);
        EXPECT_EQ(hunks.value()[0].old_count, 1u);
        EXPECT_EQ(hunks.value()[0].new_count, 1u);
    }

    TEST(DiffParserTest, RemovedOnlyHunkHasNoChangedLines) {
        auto result = changed_lines("@@ -5,2 +4,0 @@\n-gone\n-also gone\n");

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
    }

    TEST(DiffParserTest, EmptyPatchHasNoChangedLines) {
        auto result = changed_lines("");

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
    }

    TEST(DiffParserTest, BinaryPatchHasNoChangedLines) {
        EXPECT_TRUE(is_binary_patch("Binary files a/logo.png and b/logo.png differ\n"));
        EXPECT_TRUE(is_binary_patch("GIT binary patch\nliteral 12\n"));

        auto result = changed_lines("Binary files a/logo.png and b/logo.png differ\n");
        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
    }

    TEST(DiffParserTest, NoNewlineMarkerIsIgnored) {
        auto result = changed_lines("@@ -1 +1 @@\n-a\n\\ No newline at end of file\n+b\n\\ No newline at end of file\n");

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].number, 1u);
        EXPECT_EQ(result.value()[0].content, "b");
    }

    TEST(DiffParserTest, FileHeadersAreSkipped) {
        const std::string patch =
            "diff --git a/app.py b/app.py\n"
            "index 83db48f..bf269f4 100644\n"
            "--- a/app.py\n"
            "+++ b/app.py\n"
            "@@ -1,1 +1,2 @@\n"
            " a\n"
            "+b\n";

        auto result = changed_lines(patch);
        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].number, 2u);
    }

    TEST(DiffParserTest, AddedLineStartingWithPlusPlusIsNumbered) {
        auto result = changed_lines("@@ -1,1 +1,3 @@\n a\n+++i;\n+eval(x)\n");

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 2u);
        EXPECT_EQ(result.value()[0].number, 2u);
        EXPECT_EQ(result.value()[0].content, "++i;");
        EXPECT_EQ(result.value().back().number, 3u);
        EXPECT_EQ(result.value().back().content, "eval(x)");
    }

    TEST(DiffParserTest, RemovedLineStartingWithDashDashKeepsNumbering) {
        auto result = changed_lines(
            "@@ -1,3 +1,4 @@\n"
            " SELECT 1;\n"
            "--- old comment\n"
            "+-- new comment\n"
            " SELECT 2;\n"
            "+SELECT 3;\n"
        );

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 2u);
        EXPECT_EQ(result.value()[0].number, 2u);
        EXPECT_EQ(result.value()[0].content, "-- new comment");
        EXPECT_EQ(result.value()[1].number, 4u);
    }

    TEST(DiffParserTest, HeadersAfterCompletedHunkAreSkipped) {
        const std::string patch =
            "@@ -1,1 +1,2 @@\n"
            " a\n"
            "+b\n"
            "--- a/other.py\n"
            "+++ b/other.py\n"
            "@@ -10,1 +11,2 @@\n"
            " c\n"
            "+d\n";

        auto hunks = parse(patch);
        ASSERT_TRUE(hunks.is_ok());
        ASSERT_EQ(hunks.value().size(), 2u);
        EXPECT_EQ(hunks.value()[0].lines.size(), 2u);

        const auto lines = collect_added_lines(hunks.value());
        ASSERT_EQ(lines.size(), 2u);
        EXPECT_EQ(lines[0].number, 2u);
        EXPECT_EQ(lines[1].number, 12u);
    }

    TEST(DiffParserTest, CarriageReturnsAreStripped) {
        auto result = changed_lines("@@ -1,1 +1,2 @@\r\n a\r\n+b\r\n");

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].content, "b");
    }

    TEST(DiffParserTest, MalformedHeaderIsParseError) {
        auto result = parse(" context\n@@ -a,2 +1,3 @@\n+x\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        ASSERT_TRUE(result.error().has_context());
        EXPECT_EQ(result.error().context().value(), "line 2");
    }

    TEST(DiffParserTest, NewStartZeroWithLinesIsParseError) {
        auto result = parse("@@ -1,1 +0,1 @@\n+x\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(DiffParserTest, OverlappingHunksAreParseError) {
        auto result = parse("@@ -1,2 +1,3 @@\n a\n+b\n c\n@@ -2,1 +2,2 @@\n c\n+d\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(DiffParserTest, ChangedLinesAreAscendingAndUnique) {
        auto result = changed_lines("@@ -1,0 +1,3 @@\n+a\n+b\n+c\n@@ -10,0 +13,1 @@\n+d\n");

        ASSERT_TRUE(result.is_ok());
        const auto& lines = result.value();
        for (std::size_t i = 1; i < lines.size(); ++i) {
            EXPECT_LT(lines[i - 1].number, lines[i].number);
        }
    }

    TEST(DiffParserTest, RemovedFileHasNoChangedLines) {
        FilePatch file{"old.py", "@@ -1,1 +0,0 @@\n-print(1)\n", ChangeKind::Removed};

        auto result = changed_lines(file);
        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
    }

    TEST(DiffParserTest, FileErrorsCarryThePath) {
        FilePatch file{"broken.py", "@@ nonsense @@\n+x\n", ChangeKind::Modified};

        auto result = changed_lines(file);
        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().context().value().find("broken.py"), std::string::npos);
    }

    TEST(DiffParserTest, DetectLanguage) {
        EXPECT_EQ(detect_language("src/app.py"), Language::Python);
        EXPECT_EQ(detect_language("web/index.TS"), Language::TypeScript);
        EXPECT_EQ(detect_language("include/gk/types.hpp"), Language::Cpp);
        EXPECT_EQ(detect_language("scripts/deploy.sh"), Language::Shell);
        EXPECT_EQ(detect_language("README.md"), Language::Text);
        EXPECT_EQ(detect_language("Makefile"), Language::Text);

        EXPECT_TRUE(is_source_file("main.go"));
        EXPECT_FALSE(is_source_file("notes.txt"));
    }
}  // namespace gk::diff
