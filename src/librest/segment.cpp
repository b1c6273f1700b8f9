#include <rest/segment.hpp>

namespace {
    auto is_space(char c) noexcept -> bool {
        return
            c == ' ' ||
            c == '\t' ||
            c == '\n' ||
            c == '\r' ||
            c == '\f' ||
            c == '\v';
    }
}

namespace rest {
    auto classify(std::string_view segment) noexcept -> segment_kind {
        if (segment == "*") return segment_kind::wildcard;
        if (segment.starts_with(':')) return segment_kind::variable;
        return segment_kind::literal;
    }

    auto variable_name(std::string_view segment) noexcept -> std::string_view {
        return segment.substr(1);
    }

    auto segments(std::string_view path) -> std::vector<std::string_view> {
        auto result = std::vector<std::string_view>();

        if (path.empty() || path == "/") return result;

        if (path.starts_with('/')) path.remove_prefix(1);
        if (path.ends_with('/')) path.remove_suffix(1);

        auto begin = path.begin();
        auto it = begin;
        const auto end = path.end();

        while (true) {
            while (it != end && *it != '/') ++it;
            result.emplace_back(begin, it);

            if (it == end) break;
            begin = ++it; // Consume the '/'.
        }

        return result;
    }

    auto join(
        std::string_view prefix,
        std::string_view pattern
    ) -> std::string {
        prefix = trim(prefix);
        pattern = trim(pattern);

        if (prefix.ends_with('/')) prefix.remove_suffix(1);
        if (pattern.starts_with('/')) pattern.remove_prefix(1);

        if (prefix.empty()) return std::string(pattern);
        if (pattern.empty()) return std::string(prefix);

        auto result = std::string();
        result.reserve(prefix.size() + pattern.size() + 1);

        result.append(prefix);
        result.push_back('/');
        result.append(pattern);

        return result;
    }

    auto trim(std::string_view string) noexcept -> std::string_view {
        while (!string.empty() && is_space(string.front())) {
            string.remove_prefix(1);
        }

        while (!string.empty() && is_space(string.back())) {
            string.remove_suffix(1);
        }

        return string;
    }
}
