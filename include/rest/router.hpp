#pragma once

#include "handler.hpp"
#include "options.h"
#include "route.hpp"

namespace rest {
    using handler_ptr = std::shared_ptr<handler>;
    using route_table = route_tree<handler_ptr>;
    using routes = route_list<handler_ptr>;

    /**
     * Dispatches requests to the handlers of a route table.
     *
     * The table is frozen when the router is created. Copies of a router
     * share it, so one router may serve any number of threads.
     */
    class router {
        std::shared_ptr<const route_table> table;
        rest::options opts;

        auto dispatch(request& req, response& res) const -> void;
    public:
        router(route_table&& table);

        router(route_table&& table, rest::options opts);

        router(const routes& list, rest::options opts = {});

        auto options() const noexcept -> const rest::options&;

        auto paths() const noexcept -> const route_table&;

        auto route(request& req) const -> response;

        auto route(std::string_view method, std::string_view target) const
            -> response;
    };
}
