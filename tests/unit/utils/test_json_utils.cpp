//
// Created by gregorian-rayne on 10/14/26.
//

#include <gtest/gtest.h>
#include "gk/utils/json_utils.hpp"
#include <fstream>
#include <filesystem>

using namespace gk;
using namespace gk::json_utils;
namespace fs = std::filesystem;

class JsonUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "gk_json_utils_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    [[nodiscard]] fs::path create_file(const std::string& filename, const std::string& content) const
    {
        const fs::path file_path = temp_dir / filename;
        std::ofstream file(file_path);
        file << content;
        file.close();
        return file_path;
    }

    fs::path temp_dir;
};

TEST_F(JsonUtilsTest, ParseSimpleObject) {
    const auto result = parse(R"({"name": "gatekeeper", "files": []})");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().is_object());
    EXPECT_EQ(result.value()["name"].get<std::string>(), "gatekeeper");
}

TEST_F(JsonUtilsTest, ParseInvalidJson) {
    const auto result = parse(R"({invalid json})");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(JsonUtilsTest, ReadFile) {
    const auto path = create_file("payload.json", R"([{"filename": "a.py"}])");
    const auto result = read_file(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 1u);
}

TEST_F(JsonUtilsTest, ReadMissingFile) {
    const auto result = read_file(temp_dir / "missing.json");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST_F(JsonUtilsTest, ReadFileWithBadJsonCarriesPath) {
    const auto path = create_file("bad.json", "{");
    const auto result = read_file(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    ASSERT_TRUE(result.error().has_context());
    EXPECT_NE(result.error().context()->find("bad.json"), std::string::npos);
}

TEST_F(JsonUtilsTest, WriteTextCreatesParentDirectories) {
    const auto path = temp_dir / "nested" / "out" / "review.json";
    const auto written = write_text(path, R"({"ok":true})");
    ASSERT_TRUE(written.is_ok());

    const auto text = read_text(path);
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value(), R"({"ok":true})");
}

TEST_F(JsonUtilsTest, GetTypedValue) {
    const json doc = {{"limit", 120}, {"name", "x"}};

    const auto limit = get<int>(doc, "limit");
    ASSERT_TRUE(limit.is_ok());
    EXPECT_EQ(limit.value(), 120);

    EXPECT_EQ(get<int>(doc, "missing").error().code(), ErrorCode::NotFound);
    EXPECT_EQ(get<int>(doc, "name").error().code(), ErrorCode::ParseError);
}

TEST_F(JsonUtilsTest, ToStringCompactAndIndented) {
    const json doc = {{"a", 1}};
    EXPECT_EQ(to_string(doc), R"({"a":1})");
    EXPECT_NE(to_string(doc, 2).find('\n'), std::string::npos);
}
