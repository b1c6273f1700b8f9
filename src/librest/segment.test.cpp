#include <rest/segment.hpp>

#include <gtest/gtest.h>

using namespace std::literals;

using segment_list = std::vector<std::string_view>;

TEST(Segments, Empty) {
    EXPECT_TRUE(rest::segments("").empty());
    EXPECT_TRUE(rest::segments("/").empty());
}

TEST(Segments, SingleSegment) {
    EXPECT_EQ(segment_list {"path"}, rest::segments("path"));
    EXPECT_EQ(segment_list {"path"}, rest::segments("/path"));
    EXPECT_EQ(segment_list {"path"}, rest::segments("path/"));
    EXPECT_EQ(segment_list {"a"}, rest::segments("a"));
}

TEST(Segments, SurroundingSlashes) {
    const auto expected = segment_list {"path", "to", "test3"};

    EXPECT_EQ(expected, rest::segments("path/to/test3"));
    EXPECT_EQ(expected, rest::segments("/path/to/test3"));
    EXPECT_EQ(expected, rest::segments("path/to/test3/"));
    EXPECT_EQ(expected, rest::segments("/path/to/test3/"));
}

TEST(Segments, RepeatedSlashes) {
    EXPECT_EQ(
        (segment_list {"", "path", "to", "test3"}),
        rest::segments("//path/to/test3")
    );
    EXPECT_EQ((segment_list {"a", "", "b"}), rest::segments("a//b"));
    EXPECT_EQ((segment_list {"a", ""}), rest::segments("/a//"));
    EXPECT_EQ(segment_list {""}, rest::segments("//"));
}

TEST(Segments, NoDecoding) {
    EXPECT_EQ(
        (segment_list {"a%20b", "C"}),
        rest::segments("/a%20b/C")
    );
}

TEST(Segments, Classify) {
    EXPECT_EQ(rest::segment_kind::wildcard, rest::classify("*"));
    EXPECT_EQ(rest::segment_kind::variable, rest::classify(":id"));
    EXPECT_EQ(rest::segment_kind::variable, rest::classify(":"));
    EXPECT_EQ(rest::segment_kind::literal, rest::classify("users"));
    EXPECT_EQ(rest::segment_kind::literal, rest::classify("**"));
    EXPECT_EQ(rest::segment_kind::literal, rest::classify("a:b"));
    EXPECT_EQ(rest::segment_kind::literal, rest::classify(""));
}

TEST(Segments, VariableName) {
    EXPECT_EQ("id"sv, rest::variable_name(":id"));
    EXPECT_EQ(""sv, rest::variable_name(":"));
}

TEST(Segments, Join) {
    EXPECT_EQ("product/json", rest::join("product", "json"));
    EXPECT_EQ("product/json", rest::join("product/", "/json"));
    EXPECT_EQ("/product/:id/", rest::join("/product", ":id/"));
    EXPECT_EQ("product", rest::join("product", ""));
    EXPECT_EQ("json", rest::join("/", "json"));
    EXPECT_EQ("", rest::join("", ""));
}

TEST(Segments, Trim) {
    EXPECT_EQ("a/b"sv, rest::trim("  a/b\t\n"));
    EXPECT_EQ(""sv, rest::trim("   "));
}
