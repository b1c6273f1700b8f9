#pragma once

#include <string_view>

namespace rest {
    /**
     * Owns a string allocated by libcurl.
     */
    class curl_string {
        char* str;
        std::size_t len;
    public:
        curl_string();

        curl_string(char* data);

        curl_string(char* data, std::size_t size);

        curl_string(const curl_string&) = delete;

        curl_string(curl_string&& other);

        ~curl_string();

        operator std::string_view() const noexcept;

        auto operator=(const curl_string&) -> curl_string& = delete;

        auto operator=(curl_string&& other) -> curl_string&;

        auto data() const noexcept -> const char*;

        auto size() const noexcept -> std::size_t;
    };
}
