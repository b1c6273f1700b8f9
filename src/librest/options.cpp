#include <rest/error.h>
#include <rest/options.h>

#include <fstream>

namespace {
    template <typename T>
    auto read(const nlohmann::json& json, const char* key, T& value) -> void {
        if (const auto it = json.find(key); it != json.end()) {
            it->get_to(value);
        }
    }
}

namespace rest {
    auto from_json(const nlohmann::json& json, options& opts) -> void {
        read(json, "server_name", opts.server_name);
        read(json, "content_type", opts.content_type);
        read(json, "method_not_allowed", opts.method_not_allowed);
        read(json, "reject_duplicate_routes", opts.reject_duplicate_routes);
        read(json, "log_routes", opts.log_routes);
    }

    auto to_json(nlohmann::json& json, const options& opts) -> void {
        json = {
            {"server_name", opts.server_name},
            {"content_type", opts.content_type},
            {"method_not_allowed", opts.method_not_allowed},
            {"reject_duplicate_routes", opts.reject_duplicate_routes},
            {"log_routes", opts.log_routes}
        };
    }

    auto load_options(const std::filesystem::path& path) -> options {
        auto file = std::ifstream(path);

        if (!file) {
            throw error("Failed to open options file '{}'", path.string());
        }

        try {
            return nlohmann::json::parse(file).get<options>();
        }
        catch (const nlohmann::json::exception& ex) {
            throw error(
                "Invalid options file '{}': {}",
                path.string(),
                ex.what()
            );
        }
    }
}
