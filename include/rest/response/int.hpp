#pragma once

#include "../error.h"
#include "../response.hpp"

namespace rest {
    /**
     * Sets the response status. Only codes in the 1xx to 5xx classes
     * are accepted.
     */
    template <>
    struct response_type<int> {
        static auto send(response& res, int status) -> void {
            if (status < 100 || status > 599) {
                throw error("Invalid HTTP status code: {}", status);
            }

            res.status = status;
        }
    };
}
