/**
 * @file test_output_compare.cpp
 * @brief Unit tests for output normalization and JSON comparison.
 */

#include "harness/output_compare.hpp"

#include <gtest/gtest.h>

using namespace sandbox_gate;

TEST(NormalizeOutputTest, StripsTrailingWhitespacePerLine) {
    EXPECT_EQ(normalize_output("a  \nb\t\r\nc"), "a\nb\nc");
}

TEST(NormalizeOutputTest, DropsTrailingBlankLines) {
    EXPECT_EQ(normalize_output("5\n"), "5");
    EXPECT_EQ(normalize_output("5\n\n  \n"), "5");
}

TEST(NormalizeOutputTest, KeepsLeadingAndInnerBlankLines) {
    EXPECT_EQ(normalize_output("\n  x\n\ny\n"), "\n  x\n\ny");
}

TEST(NormalizeOutputTest, Empty) {
    EXPECT_EQ(normalize_output(""), "");
    EXPECT_EQ(normalize_output("\n\n"), "");
}

TEST(OutputsMatchTest, ExactAfterNormalization) {
    EXPECT_TRUE(outputs_match("hello world\n", "hello world"));
    EXPECT_TRUE(outputs_match("1\r\n2\r\n", "1\n2"));
    EXPECT_FALSE(outputs_match("Hello", "hello"));
    EXPECT_FALSE(outputs_match(" x", "x"));
}

TEST(OutputsMatchTest, JsonObjectsIgnoreKeyOrderAndSpacing) {
    EXPECT_TRUE(outputs_match("{\"b\": 2, \"a\": [1, 2]}", "{\"a\":[1,2],\"b\":2}"));
    EXPECT_FALSE(outputs_match("{\"a\": [2, 1]}", "{\"a\": [1, 2]}"));
}

TEST(OutputsMatchTest, JsonNumbersCompareByValue) {
    EXPECT_TRUE(outputs_match("1.0", "1"));
    EXPECT_TRUE(outputs_match("[0.30000000000000004]", "[0.3]"));
    EXPECT_FALSE(outputs_match("1.001", "1"));
    EXPECT_FALSE(outputs_match("9007199254740993", "9007199254740992"));
}

TEST(OutputsMatchTest, NumberIsNotString) {
    EXPECT_FALSE(outputs_match("\"5\"", "5"));
}

TEST(OutputsMatchTest, TrailingGarbageIsNotJson) {
    EXPECT_FALSE(outputs_match("{\"a\":1} extra", "{\"a\": 1}"));
}

TEST(ParseJsonDocumentTest, RejectsEmptyAndInvalid) {
    EXPECT_FALSE(parse_json_document("").has_value());
    EXPECT_FALSE(parse_json_document("{").has_value());
    ASSERT_TRUE(parse_json_document("[true, null]").has_value());
}

TEST(JsonEqualTest, NestedStructures) {
    auto a = parse_json_document(R"({"x": {"y": [1, {"z": null}]}})");
    auto b = parse_json_document(R"({"x": {"y": [1.0, {"z": null}]}})");
    auto c = parse_json_document(R"({"x": {"y": [1, {"z": false}]}})");
    ASSERT_TRUE(a && b && c);
    EXPECT_TRUE(json_equal(*a, *b));
    EXPECT_FALSE(json_equal(*a, *c));
}
