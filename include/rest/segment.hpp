#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rest {
    enum class segment_kind {
        literal,
        variable,
        wildcard
    };

    /**
     * Classifies a pattern segment: "*" is a wildcard, a leading ':'
     * marks a variable and anything else is literal text.
     */
    auto classify(std::string_view segment) noexcept -> segment_kind;

    /**
     * Name bound by a variable segment (the text after ':').
     */
    auto variable_name(std::string_view segment) noexcept -> std::string_view;

    /**
     * Splits a path on '/'.
     *
     * An empty path or "/" has no segments. Otherwise one leading and one
     * trailing slash are dropped; repeated slashes are kept as empty
     * segments. The returned views point into `path`.
     */
    auto segments(std::string_view path) -> std::vector<std::string_view>;

    /**
     * Joins a prefix and a pattern with a single '/'.
     */
    auto join(std::string_view prefix, std::string_view pattern) -> std::string;

    auto trim(std::string_view string) noexcept -> std::string_view;
}
