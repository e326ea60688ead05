//
// Created by gregorian-rayne on 10/14/26.
//

#include "gk/core/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace gk::config
{
    namespace fs = std::filesystem;

    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "gk_config_test";
            fs::create_directories(temp_dir_);
            unsetenv("MAX_LINE_LENGTH");
            unsetenv("MAX_INLINE_COMMENTS");
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
            unsetenv("MAX_LINE_LENGTH");
            unsetenv("MAX_INLINE_COMMENTS");
        }

        std::string write_file(const std::string& name, const std::string& content) const {
            const fs::path path = temp_dir_ / name;
            std::ofstream file(path);
            file << content;
            return path.string();
        }

        fs::path temp_dir_;
    };

    TEST_F(ConfigTest, ValidateAcceptsLimits) {
        const ReviewConfig config{120, 50};

        auto limits = config.validate();
        ASSERT_TRUE(limits.is_ok());
        EXPECT_EQ(limits.value().max_line_length, 120u);
        EXPECT_EQ(limits.value().max_inline_comments, 50u);
    }

    TEST_F(ConfigTest, ValidateAcceptsZeroInlineComments) {
        const ReviewConfig config{80, 0};

        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST_F(ConfigTest, MissingLimitsAreConfigErrors) {
        const ReviewConfig missing_length{std::nullopt, 50};
        const ReviewConfig missing_cap{120, std::nullopt};

        auto first = missing_length.validate();
        ASSERT_TRUE(first.is_err());
        EXPECT_EQ(first.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(first.error().context().value(), "review.max_line_length");

        auto second = missing_cap.validate();
        ASSERT_TRUE(second.is_err());
        EXPECT_EQ(second.error().context().value(), "review.max_inline_comments");
    }

    TEST_F(ConfigTest, OutOfRangeLimitsAreConfigErrors) {
        EXPECT_EQ((ReviewConfig{0, 10}).validate().error().code(), ErrorCode::ConfigError);
        EXPECT_EQ((ReviewConfig{-5, 10}).validate().error().code(), ErrorCode::ConfigError);
        EXPECT_EQ((ReviewConfig{100, -1}).validate().error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, LoadFromString) {
        auto result = Settings::load_from_string(R"(
[review]
max_line_length = 100
max_inline_comments = 25

[runtime]
threads = 4

[output]
format = "json"

[logging]
level = "verbose"
)");

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& settings = result.value();
        EXPECT_EQ(settings.review.max_line_length.value(), 100);
        EXPECT_EQ(settings.review.max_inline_comments.value(), 25);
        EXPECT_EQ(settings.runtime.threads, 4u);
        EXPECT_EQ(settings.output.format, OutputFormat::Json);
        EXPECT_EQ(settings.logging.level, LogLevel::Verbose);
    }

    TEST_F(ConfigTest, MissingKeysStayUnset) {
        auto result = Settings::load_from_string("[runtime]\nthreads = 1\n");

        ASSERT_TRUE(result.is_ok());
        EXPECT_FALSE(result.value().review.max_line_length.has_value());
        EXPECT_FALSE(result.value().review.max_inline_comments.has_value());
        EXPECT_EQ(result.value().output.format, OutputFormat::Markdown);
        EXPECT_TRUE(result.value().review.validate().is_err());
    }

    TEST_F(ConfigTest, SyntaxErrorIsParseError) {
        auto result = Settings::load_from_string("[review\nmax_line_length = 1\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(result.error().context().value().rfind("line ", 0), 0u);
    }

    TEST_F(ConfigTest, WrongTypeIsConfigError) {
        auto result = Settings::load_from_string("[review]\nmax_line_length = \"long\"\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(result.error().context().value(), "review.max_line_length");
    }

    TEST_F(ConfigTest, UnknownEnumValuesAreConfigErrors) {
        EXPECT_EQ(Settings::load_from_string("[output]\nformat = \"xml\"\n").error().code(),
                  ErrorCode::ConfigError);
        EXPECT_EQ(Settings::load_from_string("[logging]\nlevel = \"loud\"\n").error().code(),
                  ErrorCode::ConfigError);
        EXPECT_EQ(Settings::load_from_string("[runtime]\nthreads = -2\n").error().code(),
                  ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, LoadFromFile) {
        const auto path = write_file("gatekeeper.toml", "[review]\nmax_line_length = 90\nmax_inline_comments = 5\n");

        auto result = Settings::load_from_file(path);
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().review.max_line_length.value(), 90);
    }

    TEST_F(ConfigTest, MissingFileIsNotFound) {
        auto result = Settings::load_from_file((temp_dir_ / "absent.toml").string());

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST_F(ConfigTest, EnvironmentOverridesFile) {
        setenv("MAX_LINE_LENGTH", "72", 1);
        setenv("MAX_INLINE_COMMENTS", "0", 1);

        Settings settings = Settings::starter();
        ASSERT_TRUE(settings.apply_environment().is_ok());
        EXPECT_EQ(settings.review.max_line_length.value(), 72);
        EXPECT_EQ(settings.review.max_inline_comments.value(), 0);
    }

    TEST_F(ConfigTest, InvalidEnvironmentValueIsConfigError) {
        setenv("MAX_LINE_LENGTH", "wide", 1);

        Settings settings = Settings::starter();
        auto result = settings.apply_environment();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, StarterRoundTripsThroughToml) {
        const auto text = Settings::starter().to_string();

        auto reloaded = Settings::load_from_string(text);
        ASSERT_TRUE(reloaded.is_ok());
        EXPECT_EQ(reloaded.value().review.max_line_length.value(), 120);
        EXPECT_EQ(reloaded.value().review.max_inline_comments.value(), 50);
        EXPECT_TRUE(reloaded.value().review.validate().is_ok());
    }

    TEST_F(ConfigTest, ParseInteger) {
        EXPECT_EQ(parse_integer(" 42 ", "n").value(), 42);
        EXPECT_EQ(parse_integer("-3", "n").value(), -3);
        EXPECT_TRUE(parse_integer("", "n").is_err());
        EXPECT_TRUE(parse_integer("4x", "n").is_err());
    }
}  // namespace gk::config
