#include <rest/request.hpp>

#include <cctype>

namespace rest {
    auto detail::lowercase(std::string_view string) -> std::string {
        auto result = std::string(string);

        for (auto& c : result) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        return result;
    }

    request::request(std::string_view method, std::string_view target) :
        method(method)
    {
        auto parts = parse_target(target);

        path = std::move(parts.path);
        query = std::move(parts.query);
        fragment = std::move(parts.fragment);
    }

    auto request::add_header(
        std::string_view name,
        std::string_view value
    ) -> void {
        headers.insert_or_assign(detail::lowercase(name), std::string(value));
    }
}
