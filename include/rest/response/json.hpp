#pragma once

#include "../response.hpp"

#include <nlohmann/json.hpp>

namespace rest {
    using json = nlohmann::json;

    template <>
    struct response_type<json> {
        static auto send(response& res, const json& json) -> void {
            auto string = json.dump();

            res.content_type(media::json);
            res.content_length(string.size());
            res.body = std::move(string);
        }
    };
}
