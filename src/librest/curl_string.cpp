#include <rest/curl_string.h>

#include <curl/curl.h>
#include <cstring>
#include <memory>
#include <utility>

namespace rest {
    curl_string::curl_string() : str(nullptr), len(0) {}

    curl_string::curl_string(char* data) :
        str(data),
        len(data ? std::strlen(data) : 0)
    {}

    curl_string::curl_string(char* data, std::size_t size) :
        str(data),
        len(size)
    {}

    curl_string::curl_string(curl_string&& other) :
        str(std::exchange(other.str, nullptr)),
        len(std::exchange(other.len, 0))
    {}

    curl_string::~curl_string() { curl_free(str); }

    curl_string::operator std::string_view() const noexcept {
        if (!str) return {};
        return std::string_view(str, len);
    }

    auto curl_string::operator=(curl_string&& other) -> curl_string& {
        if (std::addressof(other) != this) {
            curl_free(str);
            str = std::exchange(other.str, nullptr);
            len = std::exchange(other.len, 0);
        }

        return *this;
    }

    auto curl_string::data() const noexcept -> const char* { return str; }

    auto curl_string::size() const noexcept -> std::size_t { return len; }
}
