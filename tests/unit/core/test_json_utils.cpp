/**
 * @file test_json_utils.cpp
 * @brief Unit tests for the JSON helpers used by logging and state files
 */

#include <gtest/gtest.h>

#include <kcenon/fetcher/core/json_utils.h>

namespace kcenon::fetcher::test {

class JsonUtilsTest : public ::testing::Test {};

TEST_F(JsonUtilsTest, EscapeSpecialCharacters) {
    EXPECT_EQ(json_utils::escape("a\"b"), "a\\\"b");
    EXPECT_EQ(json_utils::escape("C:\\data"), "C:\\\\data");
    EXPECT_EQ(json_utils::escape("line1\nline2\t"), "line1\\nline2\\t");
    EXPECT_EQ(json_utils::escape(std::string(1, '\x01')), "\\u0001");
}

TEST_F(JsonUtilsTest, UnescapeReversesEscape) {
    const std::string original = "path \"quoted\"\\dir\nnext";
    EXPECT_EQ(json_utils::unescape(json_utils::escape(original)).value(), original);
    EXPECT_EQ(json_utils::unescape("\\u0041\\u000a").value(), "A\n");
}

TEST_F(JsonUtilsTest, MalformedUnicodeEscapeIsRejected) {
    EXPECT_FALSE(json_utils::unescape("\\uZZZZ.csv").has_value());
    EXPECT_FALSE(json_utils::unescape("tail\\u00").has_value());
    EXPECT_FALSE(json_utils::extract_value("{\"k\": \"a\\uZZZZ\"}", "k").has_value());
    EXPECT_FALSE(
        json_utils::extract_string_array("{\"files\": [\"/in/\\uZZZZ.csv\"]}", "files")
            .has_value());
}

TEST_F(JsonUtilsTest, ExtractStringAndNumberValues) {
    const std::string json = R"({
  "instance_id": "job-1",
  "channel_id": "ch_3",
  "updated_at": 1700000000
})";

    EXPECT_EQ(json_utils::extract_value(json, "instance_id").value(), "job-1");
    EXPECT_EQ(json_utils::extract_value(json, "channel_id").value(), "ch_3");
    EXPECT_EQ(json_utils::extract_value(json, "updated_at").value(), "1700000000");
}

TEST_F(JsonUtilsTest, ExtractMissingKeyReturnsNullopt) {
    EXPECT_FALSE(json_utils::extract_value(R"({"a": "b"})", "missing").has_value());
}

TEST_F(JsonUtilsTest, ExtractStringArray) {
    const std::string json = R"({"processed_files": ["/in/a.csv", "/in/b\"q.csv"]})";

    auto items = json_utils::extract_string_array(json, "processed_files");

    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items->size(), 2u);
    EXPECT_EQ((*items)[0], "/in/a.csv");
    EXPECT_EQ((*items)[1], "/in/b\"q.csv");
}

TEST_F(JsonUtilsTest, ExtractEmptyArray) {
    auto items = json_utils::extract_string_array(R"({"files": []})", "files");

    ASSERT_TRUE(items.has_value());
    EXPECT_TRUE(items->empty());
}

TEST_F(JsonUtilsTest, MalformedArrayIsRejected) {
    EXPECT_FALSE(json_utils::extract_string_array(R"({"files": [1, 2]})", "files").has_value());
    EXPECT_FALSE(json_utils::extract_string_array(R"({"files": ["a")", "files").has_value());
    EXPECT_FALSE(json_utils::extract_string_array(R"({"files": "a"})", "files").has_value());
}

TEST_F(JsonUtilsTest, FormatStringArrayRoundTripsThroughExtract) {
    std::vector<std::string> items = {"/a.csv", "/b.csv"};
    auto json = "{\n  \"files\": " + json_utils::format_string_array(items, "  ") + "\n}";

    auto parsed = json_utils::extract_string_array(json, "files");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, items);
    EXPECT_EQ(json_utils::format_string_array({}, ""), "[]");
}

}  // namespace kcenon::fetcher::test
