#pragma once

#include "tree.hpp"

#include <initializer_list>

#define REST_METHOD(name, str) \
    auto name(std::string_view pattern, T value) -> route_list& { \
        return add(str, pattern, std::move(value)); \
    }

namespace rest {
    namespace method {
        constexpr auto del = std::string_view("DELETE");
        constexpr auto get = std::string_view("GET");
        constexpr auto head = std::string_view("HEAD");
        constexpr auto options = std::string_view("OPTIONS");
        constexpr auto patch = std::string_view("PATCH");
        constexpr auto post = std::string_view("POST");
        constexpr auto put = std::string_view("PUT");
    }

    /**
     * An ordered list of routes, built up piece by piece and turned into
     * a route tree once complete.
     *
     * ```
     * auto routes = route_list<handler>()
     *     .get("/", home)
     *     .nest("product", route_list<handler>()
     *         .get("", all_products)
     *         .add({method::post, method::del}, ":id", edit_product));
     * ```
     */
    template <typename T>
    class route_list {
        std::vector<route<T>> routes;
    public:
        using value_type = route<T>;
        using const_iterator = typename std::vector<route<T>>::const_iterator;

        auto add(
            std::string_view method,
            std::string_view pattern,
            T value
        ) -> route_list& {
            routes.push_back(route<T> {
                .method = std::string(method),
                .pattern = std::string(pattern),
                .value = std::move(value)
            });

            return *this;
        }

        auto add(
            std::initializer_list<std::string_view> methods,
            std::string_view pattern,
            const T& value
        ) -> route_list& {
            for (const auto method : methods) add(method, pattern, value);
            return *this;
        }

        auto begin() const noexcept -> const_iterator { return routes.begin(); }

        auto end() const noexcept -> const_iterator { return routes.end(); }

        auto empty() const noexcept -> bool { return routes.empty(); }

        auto nest(std::string_view prefix, route_list other) -> route_list& {
            routes.reserve(routes.size() + other.routes.size());

            for (auto& entry : other.routes) {
                entry.pattern = join(prefix, entry.pattern);
                routes.push_back(std::move(entry));
            }

            return *this;
        }

        auto size() const noexcept -> std::size_t { return routes.size(); }

        auto tree(
            duplicates policy = duplicates::replace
        ) const& -> route_tree<T> {
            return route_tree<T>::from_routes(routes, policy);
        }

        auto tree(
            duplicates policy = duplicates::replace
        ) && -> route_tree<T> {
            return route_tree<T>::from_routes(std::move(routes), policy);
        }

        REST_METHOD(del,  method::del)
        REST_METHOD(get,  method::get)
        REST_METHOD(head, method::head)
        REST_METHOD(post, method::post)
        REST_METHOD(put,  method::put)
    };
}

#undef REST_METHOD
