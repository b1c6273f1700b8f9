#include <rest/route.hpp>

#include <gtest/gtest.h>

using namespace std::literals;

namespace {
    using routes = rest::route_list<std::string>;

    auto check(
        const rest::route_tree<std::string>& tree,
        std::string_view method,
        std::string_view path
    ) -> std::optional<std::string> {
        const auto match = tree.find(method, path);

        if (!match) return std::nullopt;
        return *match->value;
    }
}

TEST(RouteList, PreservesOrder) {
    auto list = routes()
        .get("/", "home")
        .post("user/:name", "save user")
        .get("user/:name", "show user");

    ASSERT_EQ(3, list.size());

    auto it = list.begin();
    EXPECT_EQ("GET", it->method);
    EXPECT_EQ("/", it->pattern);
    EXPECT_EQ("home", it->value);

    ++it;
    EXPECT_EQ("POST", it->method);
    EXPECT_EQ("user/:name", it->pattern);

    ++it;
    EXPECT_EQ("GET", it->method);
    EXPECT_EQ("show user", it->value);
}

TEST(RouteList, SeveralMethods) {
    const auto tree = routes()
        .add({rest::method::post, rest::method::del}, "product/:id", "edit")
        .tree();

    EXPECT_EQ("edit", check(tree, "POST", "product/3"));
    EXPECT_EQ("edit", check(tree, "DELETE", "product/3"));
    EXPECT_EQ(std::nullopt, check(tree, "GET", "product/3"));
}

TEST(RouteList, Nested) {
    const auto tree = routes()
        .get("/", "show home")
        .get("home", "show home")
        .add({"GET", "POST"}, "user/:username", "user")
        .nest("product", routes()
            .get("", "show all products")
            .get("json", "send all product data")
            .nest(":id", routes()
                .get("", "show product")
                .add({"POST", "DELETE"}, "/", "edit product")
                .get("json", "send product data")
            )
        )
        .tree();

    EXPECT_EQ(10, tree.size());

    EXPECT_EQ("show home", check(tree, "GET", "/"));
    EXPECT_EQ("show home", check(tree, "GET", "/home"));
    EXPECT_EQ("user", check(tree, "POST", "/user/alice"));
    EXPECT_EQ("show all products", check(tree, "GET", "/product"));
    EXPECT_EQ("send all product data", check(tree, "GET", "/product/json"));
    EXPECT_EQ("show product", check(tree, "GET", "/product/5"));
    EXPECT_EQ("edit product", check(tree, "DELETE", "/product/5"));
    EXPECT_EQ("send product data", check(tree, "GET", "/product/5/json"));

    const auto match = tree.find("GET", "/product/5/json");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ("5"sv, match->find("id"));
}

TEST(RouteList, LaterRouteWins) {
    const auto tree = routes()
        .get("a", "first")
        .get("/a/", "second")
        .tree();

    EXPECT_EQ("second", check(tree, "GET", "a"));
}

TEST(RouteList, RejectDuplicates) {
    EXPECT_THROW(
        routes()
            .get("a", "first")
            .get("/a/", "second")
            .tree(rest::duplicates::reject),
        rest::error
    );
}
