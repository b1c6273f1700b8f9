#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rest {
    namespace detail {
        inline auto vformat(
            fmt::string_view format,
            fmt::format_args args
        ) -> std::string {
            return fmt::vformat(format, args);
        }
    }

    /**
     * Library misuse or unusable input. Messages take fmt format strings.
     */
    class error : public std::runtime_error {
    public:
        error(std::string_view what) : runtime_error(std::string(what)) {}

        template <typename... T>
        error(fmt::format_string<T...> format, T&&... args) :
            runtime_error(detail::vformat(
                format,
                fmt::make_format_args(args...)
            ))
        {}
    };

    /**
     * A request that cannot be served. The router answers with `code()`
     * as the status and the message as the body.
     */
    class error_code : public error {
        int status;
    public:
        error_code(int code, std::string_view what) :
            error(what),
            status(code)
        {}

        template <typename... T>
        error_code(int code, fmt::format_string<T...> format, T&&... args) :
            error(format, std::forward<T>(args)...),
            status(code)
        {}

        auto code() const noexcept -> int { return status; }
    };

    /**
     * A route rejected by a route tree.
     */
    class route_error : public error {
        std::string route_method;
        std::string route_pattern;
    public:
        route_error(std::string_view method, std::string_view pattern) :
            error("duplicate route: {} {}", method, pattern),
            route_method(method),
            route_pattern(pattern)
        {}

        auto method() const noexcept -> std::string_view {
            return route_method;
        }

        auto pattern() const noexcept -> std::string_view {
            return route_pattern;
        }
    };

    struct parser_error : std::runtime_error {
        parser_error(const std::string& what) : runtime_error(what) {}
    };
}
