#pragma once

#include "parser.hpp"
#include "target.h"

#include <unordered_map>

namespace rest {
    namespace detail {
        template <typename T>
        struct is_optional : std::false_type {};

        template <typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

        template <typename T>
        inline constexpr bool is_optional_v = is_optional<T>::value;

        auto lowercase(std::string_view string) -> std::string;

        template <typename T, typename Map>
        auto parse(
            const Map& map,
            std::string_view name,
            std::string_view description
        ) -> T {
            const auto result = map.find(std::string(name));

            if (result == map.end()) {
                if constexpr (is_optional_v<T>) return T();
                else throw error_code(
                    400,
                    "Missing required {} '{}'",
                    description,
                    name
                );
            }

            const auto value = std::string_view(result->second);

            if constexpr (is_optional_v<T>) {
                if (value.empty()) return T();
            }

            try {
                return parser<T>::parse(value);
            }
            catch (const std::exception& ex) {
                throw error_code(
                    400,
                    "Failed to parse {} '{}': {}",
                    description,
                    name,
                    ex.what()
                );
            }
        }
    }

    struct request {
        std::string method;
        std::string path;
        std::unordered_map<std::string, std::string> params;
        query_map query;
        std::optional<std::string> fragment;

        /**
         * Header fields keyed by lowercase name. Use `add_header` to
         * store a field under any spelling of its name.
         */
        std::unordered_map<std::string, std::string> headers;

        std::string body;

        request() = default;

        request(std::string_view method, std::string_view target);

        auto add_header(std::string_view name, std::string_view value) -> void;

        /**
         * Header names are case-insensitive.
         */
        template <typename T>
        auto header(std::string_view name) const -> T {
            return detail::parse<T>(headers, detail::lowercase(name), "header");
        }

        template <typename T>
        auto path_param(std::string_view name) const -> T {
            return detail::parse<T>(params, name, "path parameter");
        }

        template <typename T>
        auto query_param(std::string_view name) const -> T {
            return detail::parse<T>(query, name, "query parameter");
        }
    };
}
