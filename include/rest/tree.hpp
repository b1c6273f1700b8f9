#pragma once

#include "error.h"
#include "segment.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rest {
    struct param {
        std::string_view name;
        std::string_view value;

        constexpr auto operator==(const param& other) const noexcept
            -> bool = default;
    };

    template <typename T>
    struct match {
        T* value;
        std::vector<param> params;

        auto find(
            std::string_view name
        ) const noexcept -> std::optional<std::string_view> {
            for (const auto& p : params) {
                if (p.name == name) return p.value;
            }

            return std::nullopt;
        }

        auto set(std::string_view name, std::string_view value) -> void {
            for (auto& p : params) {
                if (p.name == name) {
                    p.value = value;
                    return;
                }
            }

            params.push_back({name, value});
        }
    };

    template <typename T>
    struct route {
        std::string method;
        std::string pattern;
        T value;
    };

    enum class duplicates {
        replace,
        reject
    };

    /**
     * Stores values by HTTP method and path pattern.
     *
     * Patterns are '/' separated. A segment starting with ':' is a variable
     * and matches any single non-empty segment, binding it to the name that
     * follows the colon. A "*" segment is a wildcard and consumes one or more
     * segments. Everything else is matched literally.
     *
     * Lookups prefer literal children, then the variable child, then the
     * wildcard child, backtracking whenever a branch fails deeper down.
     * A finished tree is never modified by lookups and may be shared
     * between threads.
     */
    template <typename T>
    class route_tree {
    public:
        struct item {
            T value;
            std::vector<std::string> names;
        };
    private:
        using child = std::unique_ptr<route_tree>;
        using names_type = std::vector<std::string>;
        using captures = std::vector<std::string_view>;

        std::map<std::string, item, std::less<>> items;
        std::map<std::string, child, std::less<>> static_children;
        child variable_child;
        child wildcard_child;

        static auto make(child& node) -> route_tree& {
            if (!node) node = std::make_unique<route_tree>();
            return *node;
        }

        auto static_child(std::string_view key) -> route_tree& {
            auto it = static_children.find(key);

            if (it == static_children.end()) {
                it = static_children.emplace(
                    std::string(key),
                    std::make_unique<route_tree>()
                ).first;
            }

            return *it->second;
        }

        auto next(std::string_view segment) -> route_tree& {
            switch (classify(segment)) {
                case segment_kind::wildcard: return make(wildcard_child);
                case segment_kind::variable: return make(variable_child);
                case segment_kind::literal: break;
            }

            return static_child(segment);
        }

        auto descend(
            std::span<const std::string_view> path,
            names_type& names
        ) -> route_tree& {
            if (path.empty()) return *this;

            const auto segment = path.front();

            if (classify(segment) == segment_kind::variable) {
                names.emplace_back(variable_name(segment));
            }

            return next(segment).descend(path.subspan(1), names);
        }

        auto merge(const route_tree& other, const names_type& prefix) -> void {
            for (const auto& [method, entry] : other.items) {
                auto names = prefix;
                names.insert(names.end(), entry.names.begin(), entry.names.end());

                items.insert_or_assign(
                    method,
                    item { .value = entry.value, .names = std::move(names) }
                );
            }

            for (const auto& [key, subtree] : other.static_children) {
                static_child(key).merge(*subtree, prefix);
            }

            if (other.variable_child) {
                make(variable_child).merge(*other.variable_child, prefix);
            }

            if (other.wildcard_child) {
                make(wildcard_child).merge(*other.wildcard_child, prefix);
            }
        }

        template <typename Accept>
        auto search(
            std::span<const std::string_view> path,
            captures& values,
            const Accept& accept
        ) const -> const route_tree* {
            if (path.empty()) return accept(*this) ? this : nullptr;

            const auto segment = path.front();
            const auto tail = path.subspan(1);

            if (
                const auto it = static_children.find(segment);
                it != static_children.end()
            ) {
                if (const auto* result = it->second->search(tail, values, accept)) {
                    return result;
                }
            }

            if (variable_child && !segment.empty()) {
                values.push_back(segment);

                if (const auto* result = variable_child->search(
                    tail,
                    values,
                    accept
                )) return result;

                values.pop_back();
            }

            if (wildcard_child) {
                // Consume as few segments as possible, but at least one.
                for (auto consumed = 1ul; consumed <= path.size(); ++consumed) {
                    if (const auto* result = wildcard_child->search(
                        path.subspan(consumed),
                        values,
                        accept
                    )) return result;
                }
            }

            return nullptr;
        }

        auto format_to(
            std::back_insert_iterator<fmt::memory_buffer>& out,
            std::string_view label,
            int level
        ) const -> void {
            const auto indent = level * 2;
            for (auto i = 0; i < indent; ++i) fmt::format_to(out, " ");

            fmt::format_to(out, "{}", label);

            for (const auto& [method, entry] : items) {
                fmt::format_to(out, " {}", method);

                if (!entry.names.empty()) {
                    fmt::format_to(out, "({})", fmt::join(entry.names, ", "));
                }
            }

            fmt::format_to(out, "\n");

            for (const auto& [key, subtree] : static_children) {
                subtree->format_to(out, key, level + 1);
            }

            if (variable_child) variable_child->format_to(out, ":", level + 1);
            if (wildcard_child) wildcard_child->format_to(out, "*", level + 1);
        }
    public:
        route_tree() = default;

        route_tree(route_tree&&) = default;

        auto operator=(route_tree&&) -> route_tree& = default;

        static auto from_routes(
            std::vector<route<T>> routes,
            duplicates policy = duplicates::replace
        ) -> route_tree {
            auto tree = route_tree();

            for (auto& entry : routes) {
                if (policy == duplicates::reject) {
                    tree.insert_unique(
                        entry.method,
                        entry.pattern,
                        std::move(entry.value)
                    );
                }
                else {
                    tree.insert(entry.method, entry.pattern, std::move(entry.value));
                }
            }

            return tree;
        }

        /**
         * Methods for which `find` would succeed on `path`, sorted.
         * Every branch is searched, since different methods may be served
         * by different branches (a literal and a variable, for example).
         */
        auto allowed(std::string_view path) const -> std::vector<std::string_view> {
            const auto segments = rest::segments(path);
            auto values = captures();
            auto result = std::vector<std::string_view>();

            search(
                segments,
                values,
                [&result](const route_tree& candidate) {
                    for (const auto& entry : candidate.items) {
                        result.push_back(entry.first);
                    }

                    return false;
                }
            );

            std::sort(result.begin(), result.end());
            result.erase(std::unique(result.begin(), result.end()), result.end());

            return result;
        }

        auto empty() const noexcept -> bool { return size() == 0; }

        auto find(
            std::string_view method,
            std::string_view path
        ) const -> std::optional<match<const T>> {
            const auto segments = rest::segments(path);
            auto values = captures();

            const auto* node = search(
                segments,
                values,
                [method](const route_tree& candidate) {
                    return candidate.items.contains(method);
                }
            );

            if (!node) return std::nullopt;

            const auto& entry = node->items.find(method)->second;
            const auto count = std::min(entry.names.size(), values.size());

            auto result = match<const T> { .value = &entry.value, .params = {} };
            result.params.reserve(count);

            for (auto i = 0ul; i < count; ++i) {
                result.set(entry.names[i], values[i]);
            }

            return result;
        }

        auto insert(
            std::string_view method,
            std::string_view pattern,
            T value
        ) -> item& {
            auto names = names_type();
            auto& node = descend(segments(trim(pattern)), names);

            return node.items.insert_or_assign(
                std::string(method),
                item { .value = std::move(value), .names = std::move(names) }
            ).first->second;
        }

        /**
         * Copies the contents of another tree below `prefix`. Variables
         * declared in the prefix are bound before the other tree's own.
         */
        auto insert(std::string_view prefix, const route_tree& other) -> void {
            if (&other == this) {
                throw error("cannot insert a route tree into itself");
            }

            auto names = names_type();
            descend(segments(trim(prefix)), names).merge(other, names);
        }

        auto insert_unique(
            std::string_view method,
            std::string_view pattern,
            T value
        ) -> item& {
            auto names = names_type();
            auto& node = descend(segments(trim(pattern)), names);

            if (node.items.contains(method)) {
                throw route_error(method, pattern);
            }

            return node.items.emplace(
                std::string(method),
                item { .value = std::move(value), .names = std::move(names) }
            ).first->second;
        }

        auto size() const noexcept -> std::size_t {
            auto result = items.size();

            for (const auto& entry : static_children) {
                result += entry.second->size();
            }

            if (variable_child) result += variable_child->size();
            if (wildcard_child) result += wildcard_child->size();

            return result;
        }

        auto to_string() const -> std::string {
            auto buffer = fmt::memory_buffer();
            auto out = std::back_inserter(buffer);

            format_to(out, "/", 0);

            return fmt::to_string(buffer);
        }
    };
}

template <typename T>
struct fmt::formatter<rest::route_tree<T>> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const rest::route_tree<T>& tree, FormatContext& ctx) const {
        return formatter<std::string_view>::format(tree.to_string(), ctx);
    }
};
