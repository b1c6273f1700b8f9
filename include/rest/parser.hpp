#pragma once

#include "error.h"

#include <fmt/format.h>
#include <charconv>
#include <chrono>
#include <concepts>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace rest {
    template <typename T>
    struct parser {};

    template <>
    struct parser<std::string_view> {
        static auto parse(std::string_view string) -> std::string_view {
            return string;
        }
    };

    template <>
    struct parser<std::string> {
        static auto parse(std::string_view string) -> std::string {
            return std::string(string);
        }
    };

    template <typename T>
    struct parser<std::optional<T>> {
        static auto parse(std::string_view string) -> std::optional<T> {
            return parser<T>::parse(string);
        }
    };

    template <>
    struct parser<bool> {
        static auto parse(std::string_view string) -> bool {
            if (string == "t" || string == "y") return true;
            if (string == "f" || string == "n") return false;

            if (string == "true" || string == "yes") return true;
            if (string == "false" || string == "no") return false;

            throw parser_error("Expect (t)rue/(f)alse or (y)es/(n)o");
        }
    };

    template <std::integral T>
    struct parser<T> {
        static auto parse(std::string_view string) -> T {
            auto value = T();

            const auto* const first = string.data();
            const auto* const last = first + string.size();

            const auto [ptr, ec] = std::from_chars(first, last, value);

            if (ec == std::errc::result_out_of_range) {
                throw parser_error(fmt::format(
                    "Argument '{}' is outside the range of {} and {}",
                    string,
                    std::numeric_limits<T>::min(),
                    std::numeric_limits<T>::max()
                ));
            }

            if (ec != std::errc() || ptr != last) {
                throw parser_error("Expect an integer");
            }

            return value;
        }
    };

    template <typename Rep, typename Period>
    struct parser<std::chrono::duration<Rep, Period>> {
        static auto parse(
            std::string_view string
        ) -> std::chrono::duration<Rep, Period> {
            return std::chrono::duration<Rep, Period>(parser<Rep>::parse(string));
        }
    };

    template <>
    struct parser<std::filesystem::path> {
        static auto parse(std::string_view string) -> std::filesystem::path {
            return string;
        }
    };
}
