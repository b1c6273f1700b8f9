#pragma once

#include "request.hpp"
#include "response.hpp"

#include <functional>
#include <memory>

namespace rest {
    struct handler {
        virtual ~handler() = default;

        virtual auto handle(request& req, response& res) -> void = 0;
    };

    namespace detail {
        template <typename T>
        concept handler_argument =
            std::same_as<T, request&> ||
            std::same_as<T, const request&> ||
            std::same_as<T, response&> ||
            std::constructible_from<std::remove_cvref_t<T>, request&>;

        template <handler_argument T>
        auto extract(request& req, response& res) -> decltype(auto) {
            if constexpr (std::same_as<T, response&>) return (res);
            else if constexpr (
                std::same_as<T, request&> ||
                std::same_as<T, const request&>
            ) return (req);
            else return std::remove_cvref_t<T>(req);
        }

        template <typename R, typename... Args>
        class function_handler : public rest::handler {
            using function = std::function<R(Args...)>;

            function fn;
        public:
            function_handler(function&& fn) : fn(std::forward<function>(fn)) {}

            auto handle(request& req, response& res) -> void override {
                if constexpr (std::is_void_v<R>) {
                    fn(extract<Args>(req, res)...);
                }
                else {
                    res.send(fn(extract<Args>(req, res)...));
                }
            }
        };
    }

    template <typename R, typename... Args>
    auto make_handler(std::function<R(Args...)>&& fn) -> std::shared_ptr<handler> {
        return std::make_shared<detail::function_handler<R, Args...>>(
            std::move(fn)
        );
    }

    template <typename F>
    auto make_handler(F&& f) -> std::shared_ptr<handler> {
        return make_handler(std::function(std::forward<F>(f)));
    }
}
