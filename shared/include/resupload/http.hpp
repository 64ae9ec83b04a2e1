/**
 * resupload - HTTP message types exchanged between the upload engine and its transport.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace resupload::http
{

    constexpr unsigned kStatusPayloadTooLarge = 413;

    struct Url
    {
        std::string scheme{"http"};
        std::string host;
        std::uint16_t port{80};
        std::string target{"/"};

        bool secure() const
        {
            return scheme == "https";
        }
    };

    // Accepts http:// and https:// URLs; throws UploadError(InvalidConfig) otherwise.
    Url parse_url(std::string_view url);

    using Header = std::pair<std::string, std::string>;
    using Headers = std::vector<Header>;

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

    // Replaces every header called `name` (case-insensitive) with one entry.
    void set_header(Headers &headers, std::string_view name, std::string value);

    std::optional<std::string> find_header(const Headers &headers, std::string_view name);

    struct Request
    {
        std::string method{"PUT"};
        Url url;
        Headers headers;
        std::vector<std::byte> body;
    };

    struct Response
    {
        unsigned status{};
        std::string reason;
        Headers headers;
        std::string body;
    };

    constexpr bool is_success(unsigned status) noexcept
    {
        return status >= 200 && status < 300;
    }

    std::string format_content_range(std::uint64_t start, std::uint64_t end_inclusive, std::uint64_t total);

} // namespace resupload::http
