#pragma once

#include "fixed_string.hpp"

#include <rest/request.hpp>

namespace rest::extractor {
    enum class source {
        header,
        path,
        query
    };

    namespace detail {
        template <source Source, typename T>
        auto lookup(const request& req, std::string_view name) -> T {
            if constexpr (Source == source::header) {
                return req.header<T>(name);
            }
            else if constexpr (Source == source::path) {
                return req.path_param<T>(name);
            }
            else return req.query_param<T>(name);
        }
    }

    /**
     * A named request value parsed as T when the handler is invoked.
     */
    template <source Source, fixed_string Name, typename T>
    class parameter {
        T val;
    public:
        parameter(request& req) :
            val(detail::lookup<Source, T>(req, Name.str()))
        {}

        static constexpr auto name() noexcept -> std::string_view {
            return Name.str();
        }

        auto value() const noexcept -> const T& { return val; }

        operator const T&() const noexcept { return val; }

        auto operator*() const noexcept -> const T& { return val; }

        auto operator->() const noexcept -> const T* { return &val; }
    };
}
