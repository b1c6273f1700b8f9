#pragma once

#include "parameter.hpp"

namespace rest::extractor {
    template <fixed_string Name, typename T = std::optional<std::string>>
    struct query : parameter<source::query, Name, T> {
        using parameter<source::query, Name, T>::parameter;
    };
}
