#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace rest {
    struct options {
        /** Value of the 'server' header sent with every response. */
        std::string server_name = "librest";

        /** Content type used when a handler does not set one. */
        std::string content_type = "text/plain; charset=utf-8";

        /**
         * Answer 405 with an 'allow' header when the path matches a route
         * registered for other methods. Otherwise such requests get 404.
         */
        bool method_not_allowed = true;

        /** Registering the same method and pattern twice is an error. */
        bool reject_duplicate_routes = false;

        /** Log the route table when a router is created. */
        bool log_routes = false;
    };

    auto from_json(const nlohmann::json& json, options& opts) -> void;

    auto to_json(nlohmann::json& json, const options& opts) -> void;

    auto load_options(const std::filesystem::path& path) -> options;
}
