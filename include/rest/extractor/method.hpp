#pragma once

#include <rest/request.hpp>

namespace rest::extractor {
    struct method {
        std::string_view value;

        method(request& request) : value(request.method) {}
    };
}
