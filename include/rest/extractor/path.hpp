#pragma once

#include "parameter.hpp"

namespace rest::extractor {
    /**
     * A path variable bound by the matched route, parsed as T.
     */
    template <fixed_string Name, typename T = std::string>
    struct path : parameter<source::path, Name, T> {
        using parameter<source::path, Name, T>::parameter;
    };
}
