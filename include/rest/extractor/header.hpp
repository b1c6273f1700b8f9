#pragma once

#include "parameter.hpp"

namespace rest::extractor {
    /**
     * A request header, looked up by case-insensitive name.
     */
    template <fixed_string Name, typename T = std::optional<std::string>>
    struct header : parameter<source::header, Name, T> {
        using parameter<source::header, Name, T>::parameter;
    };
}
