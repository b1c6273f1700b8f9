#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

namespace rest {
    namespace media {
        constexpr auto json = std::string_view("application/json");
        constexpr auto utf8_text = std::string_view("text/plain; charset=utf-8");
    }

    struct response;

    template <typename T>
    struct response_type {};

    template <typename T>
    concept response_data = requires(response& res, T&& t) {
        { response_type<std::decay_t<T>>::send(
            res,
            std::forward<T>(t)
        ) } -> std::same_as<void>;
    };

    struct response {
        int status = 200;
        std::unordered_map<std::string, std::string> headers;
        std::string body;

        auto content_length(std::size_t length) -> void {
            headers.insert_or_assign("content-length", std::to_string(length));
        }

        auto content_type(std::string_view type) -> void {
            headers.insert_or_assign("content-type", std::string(type));
        }

        auto header(
            const std::string& name
        ) const -> std::optional<std::string_view> {
            const auto result = headers.find(name);

            if (result == headers.end()) return std::nullopt;
            return result->second;
        }

        template <response_data T>
        auto send(T&& t) -> void {
            response_type<std::decay_t<T>>::send(*this, std::forward<T>(t));
        }
    };
}
