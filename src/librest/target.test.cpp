#include <rest/error.h>
#include <rest/target.h>

#include <gtest/gtest.h>

TEST(Target, PathParts) {
    const auto target = rest::parse_target(
        "/path/to/something?with=this&and=that#lol"
    );

    EXPECT_EQ("/path/to/something", target.path);
    EXPECT_EQ("this", target.query.at("with"));
    EXPECT_EQ("that", target.query.at("and"));
    EXPECT_EQ("lol", target.fragment);
}

TEST(Target, StrangePath) {
    const auto target = rest::parse_target(
        "/path/to/something?with=this&and=what?#"
    );

    EXPECT_EQ("/path/to/something", target.path);
    EXPECT_EQ("this", target.query.at("with"));
    EXPECT_EQ("what?", target.query.at("and"));
    EXPECT_EQ("", target.fragment);
}

TEST(Target, MissingParts) {
    auto target = rest::parse_target("/path/to/something?with=this&and=that");

    EXPECT_EQ("/path/to/something", target.path);
    EXPECT_EQ("this", target.query.at("with"));
    EXPECT_EQ("that", target.query.at("and"));
    EXPECT_FALSE(target.fragment.has_value());

    target = rest::parse_target("/path/to/something#lol");

    EXPECT_EQ("/path/to/something", target.path);
    EXPECT_TRUE(target.query.empty());
    EXPECT_EQ("lol", target.fragment);

    target = rest::parse_target("?with=this&and=that#lol");

    EXPECT_EQ("", target.path);
    EXPECT_EQ("this", target.query.at("with"));
    EXPECT_EQ("that", target.query.at("and"));
    EXPECT_EQ("lol", target.fragment);
}

TEST(Target, DecodePath) {
    const auto target = rest::parse_target("/hello%20world/caf%C3%A9");

    EXPECT_EQ("/hello world/café", target.path);
}

TEST(Target, PathKeepsPlus) {
    EXPECT_EQ("/a+b", rest::parse_target("/a+b").path);
}

TEST(Target, DecodeQuery) {
    const auto query = rest::parse_query("q=hello+world&x=%26%3D&flag&&y=");

    EXPECT_EQ(4, query.size());
    EXPECT_EQ("hello world", query.at("q"));
    EXPECT_EQ("&=", query.at("x"));
    EXPECT_EQ("", query.at("flag"));
    EXPECT_EQ("", query.at("y"));
}

TEST(Target, PercentDecode) {
    EXPECT_EQ("plain", rest::percent_decode("plain"));
    EXPECT_EQ("a/b", rest::percent_decode("a%2Fb"));
    EXPECT_EQ("a/b", rest::percent_decode("a%2fb"));
    EXPECT_EQ("", rest::percent_decode(""));
}

TEST(Target, AbsoluteForm) {
    const auto target = rest::parse_target(
        "http://example.com:8080/users/42?verbose=yes#top"
    );

    EXPECT_EQ("/users/42", target.path);
    EXPECT_EQ("yes", target.query.at("verbose"));
    EXPECT_EQ("top", target.fragment);
}

TEST(Target, AbsoluteFormWithoutPath) {
    const auto target = rest::parse_target("http://example.com");

    EXPECT_EQ("/", target.path);
    EXPECT_TRUE(target.query.empty());
    EXPECT_FALSE(target.fragment.has_value());
}

TEST(Target, InvalidForm) {
    EXPECT_THROW(rest::parse_target("*"), rest::error_code);
    EXPECT_THROW(rest::parse_target("path/without/slash"), rest::error_code);

    try {
        rest::parse_target("*");
    }
    catch (const rest::error_code& error) {
        EXPECT_EQ(400, error.code());
    }
}
