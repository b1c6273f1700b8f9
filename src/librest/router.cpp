#include <rest/response/string.hpp>
#include <rest/router.hpp>

#include <timber/timber>

namespace rest {
    router::router(route_table&& table) :
        router(std::forward<route_table>(table), rest::options())
    {}

    router::router(route_table&& table, rest::options opts) :
        table(std::make_shared<const route_table>(
            std::forward<route_table>(table)
        )),
        opts(std::move(opts))
    {
        if (this->opts.log_routes) {
            TIMBER_DEBUG("Routes ({}):\n{}", this->table->size(), *this->table);
        }
    }

    router::router(const routes& list, rest::options opts) :
        router(
            list.tree(
                opts.reject_duplicate_routes ?
                    duplicates::reject : duplicates::replace
            ),
            opts
        )
    {}

    auto router::dispatch(request& req, response& res) const -> void {
        const auto match = table->find(req.method, req.path);

        if (!match) {
            const auto allowed = opts.method_not_allowed ?
                table->allowed(req.path) :
                std::vector<std::string_view>();

            if (allowed.empty()) {
                TIMBER_DEBUG("{} {}: no route", req.method, req.path);
                res.status = 404;
                return;
            }

            TIMBER_DEBUG(
                "{} {}: method not allowed ({})",
                req.method,
                req.path,
                fmt::join(allowed, ", ")
            );

            res.status = 405;
            res.headers.insert_or_assign(
                "allow",
                fmt::format("{}", fmt::join(allowed, ", "))
            );
            return;
        }

        req.params.clear();
        for (const auto& param : match->params) {
            req.params.insert_or_assign(
                std::string(param.name),
                std::string(param.value)
            );
        }

        try {
            (*match->value)->handle(req, res);
        }
        catch (const error_code& error) {
            TIMBER_DEBUG(
                "{} {}: status {} ({})",
                req.method,
                req.path,
                error.code(),
                error.what()
            );

            res.status = error.code();
            res.send(error.what());
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR(
                "{} {}: status 500 ({})",
                req.method,
                req.path,
                ex.what()
            );

            res.status = 500;
            res.body.clear();
            res.headers.erase("content-length");
            res.content_type(opts.content_type);
        }
    }

    auto router::options() const noexcept -> const rest::options& {
        return opts;
    }

    auto router::paths() const noexcept -> const route_table& {
        return *table;
    }

    auto router::route(request& req) const -> response {
        auto res = response();

        res.headers.emplace("server", opts.server_name);
        res.content_type(opts.content_type);

        dispatch(req, res);

        TIMBER_TRACE("{} {} -> {}", req.method, req.path, res.status);
        return res;
    }

    auto router::route(
        std::string_view method,
        std::string_view target
    ) const -> response {
        auto req = request();
        req.method = method;

        try {
            auto parts = parse_target(target);

            req.path = std::move(parts.path);
            req.query = std::move(parts.query);
            req.fragment = std::move(parts.fragment);
        }
        catch (const error_code& error) {
            TIMBER_DEBUG("{} {}: {}", method, target, error.what());

            auto res = response();
            res.headers.emplace("server", opts.server_name);
            res.status = error.code();
            res.send(error.what());
            return res;
        }

        return route(req);
    }
}
