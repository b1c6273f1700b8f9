#pragma once

#include <cstddef>
#include <string_view>

namespace rest::extractor {
    template <std::size_t Size>
    struct fixed_string {
        char chars[Size] = {};

        constexpr fixed_string(const char (&chars)[Size]) {
            for (std::size_t i = 0; i < Size; ++i) {
                this->chars[i] = chars[i];
            }
        }

        constexpr auto str() const noexcept -> std::string_view {
            return {chars, Size - 1};
        }
    };
}
