#include <rest/curl_string.h>
#include <rest/error.h>
#include <rest/target.h>

#include <curl/curl.h>
#include <limits>
#include <memory>

namespace {
    using url_handle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    auto try_get(
        CURLU* url,
        CURLUPart what,
        CURLUcode none
    ) -> std::optional<rest::curl_string> {
        char* part = nullptr;
        const auto code = curl_url_get(url, what, &part, 0);

        if (code == CURLUE_OK) return rest::curl_string(part);
        if (code == none) return std::nullopt;

        throw rest::error_code(
            400,
            "Invalid request target: {}",
            curl_url_strerror(code)
        );
    }

    auto split_origin(std::string_view target) -> rest::target {
        auto result = rest::target();
        auto path = target;

        if (const auto q = path.find('?'); q != std::string_view::npos) {
            auto query = path.substr(q + 1);
            path = path.substr(0, q);

            if (const auto f = query.find('#'); f != std::string_view::npos) {
                result.fragment = std::string(query.substr(f + 1));
                query = query.substr(0, f);
            }

            result.query = rest::parse_query(query);
        }
        else if (const auto f = path.find('#'); f != std::string_view::npos) {
            result.fragment = std::string(path.substr(f + 1));
            path = path.substr(0, f);
        }

        result.path = rest::percent_decode(path);
        return result;
    }

    auto split_absolute(std::string_view target) -> rest::target {
        auto url = url_handle(curl_url(), &curl_url_cleanup);
        if (!url) throw rest::error("Failed to allocate URL handle");

        const auto string = std::string(target);
        const auto code = curl_url_set(
            url.get(),
            CURLUPART_URL,
            string.c_str(),
            CURLU_PATH_AS_IS | CURLU_NON_SUPPORT_SCHEME
        );

        if (code != CURLUE_OK) {
            throw rest::error_code(
                400,
                "Invalid request target '{}': {}",
                target,
                curl_url_strerror(code)
            );
        }

        auto result = rest::target();

        if (const auto path = try_get(url.get(), CURLUPART_PATH, CURLUE_OK)) {
            result.path = rest::percent_decode(*path);
        }

        if (const auto query = try_get(
            url.get(),
            CURLUPART_QUERY,
            CURLUE_NO_QUERY
        )) result.query = rest::parse_query(*query);

        if (const auto fragment = try_get(
            url.get(),
            CURLUPART_FRAGMENT,
            CURLUE_NO_FRAGMENT
        )) result.fragment = std::string(*fragment);

        return result;
    }
}

namespace rest {
    auto percent_decode(std::string_view string) -> std::string {
        if (string.find('%') == std::string_view::npos) {
            return std::string(string);
        }

        if (string.size() > std::numeric_limits<int>::max()) {
            throw error_code(414, "URI too long");
        }

        auto size = 0;
        auto* const decoded = curl_easy_unescape(
            nullptr,
            string.data(),
            static_cast<int>(string.size()),
            &size
        );

        if (!decoded) throw error("Failed to percent-decode '{}'", string);

        const auto result = curl_string(decoded, static_cast<std::size_t>(size));
        return std::string(std::string_view(result));
    }

    auto parse_query(std::string_view query) -> query_map {
        auto result = query_map();

        const auto decode = [](std::string_view part) -> std::string {
            auto plus = std::string(part);
            for (auto& c : plus) if (c == '+') c = ' ';
            return percent_decode(plus);
        };

        while (!query.empty()) {
            const auto amp = query.find('&');
            const auto pair = query.substr(0, amp);

            query = amp == std::string_view::npos ?
                std::string_view() : query.substr(amp + 1);

            if (pair.empty()) continue;

            const auto eq = pair.find('=');

            if (eq == std::string_view::npos) {
                result.insert_or_assign(decode(pair), std::string());
            }
            else {
                result.insert_or_assign(
                    decode(pair.substr(0, eq)),
                    decode(pair.substr(eq + 1))
                );
            }
        }

        return result;
    }

    auto parse_target(std::string_view target) -> rest::target {
        if (
            target.empty() ||
            target.starts_with('/') ||
            target.starts_with('?') ||
            target.starts_with('#')
        ) return split_origin(target);

        const auto scheme = target.find("://");
        const auto slash = target.find('/');

        if (scheme != std::string_view::npos && scheme > 0 && scheme < slash) {
            return split_absolute(target);
        }

        throw error_code(400, "Invalid request target '{}'", target);
    }
}
