#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rest {
    using query_map = std::unordered_map<std::string, std::string>;

    /**
     * The parts of a request target that routing cares about.
     */
    struct target {
        std::string path;
        query_map query;
        std::optional<std::string> fragment;
    };

    /**
     * Decodes "%XX" escapes. Malformed escapes are copied as they are.
     */
    auto percent_decode(std::string_view string) -> std::string;

    /**
     * Parses "a=b&c=d" pairs. Keys and values are percent-decoded and '+'
     * stands for a space. A key without '=' maps to an empty value.
     */
    auto parse_query(std::string_view query) -> query_map;

    /**
     * Splits an origin-form ("/path?query#fragment") or absolute-form
     * ("http://host/path?query") request target and decodes its path.
     *
     * Throws error_code (400) for any other form.
     */
    auto parse_target(std::string_view target) -> rest::target;
}
