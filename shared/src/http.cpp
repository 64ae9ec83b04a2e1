#include "resupload/http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

#include "resupload/error_codes.hpp"

namespace resupload::http
{

    namespace
    {

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            for (auto &ch : result)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return result;
        }

        std::optional<std::uint16_t> parse_port(std::string_view text)
        {
            std::uint16_t value{};
            const auto *last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), last, value);
            if (text.empty() || ec != std::errc{} || ptr != last || value == 0)
            {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    Url parse_url(std::string_view url)
    {
        const auto scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos)
        {
            throw UploadError(ErrorCode::InvalidConfig, "URL is missing a scheme: " + std::string(url));
        }
        Url result;
        result.scheme = to_lower(url.substr(0, scheme_end));
        if (result.scheme == "https")
        {
            result.port = 443;
        }
        else if (result.scheme != "http")
        {
            throw UploadError(ErrorCode::InvalidConfig,
                              "Unsupported URL scheme '" + result.scheme + "' (expected http or https)");
        }

        auto rest = url.substr(scheme_end + 3);
        const auto path_begin = rest.find_first_of("/?#");
        auto authority = rest.substr(0, path_begin);
        if (path_begin != std::string_view::npos)
        {
            auto target = rest.substr(path_begin);
            if (const auto fragment = target.find('#'); fragment != std::string_view::npos)
            {
                target = target.substr(0, fragment);
            }
            result.target = std::string(target);
            if (result.target.empty() || result.target.front() != '/')
            {
                result.target.insert(result.target.begin(), '/');
            }
        }

        if (const auto at = authority.rfind('@'); at != std::string_view::npos)
        {
            authority = authority.substr(at + 1);
        }

        std::string_view port_text;
        if (!authority.empty() && authority.front() == '[')
        {
            const auto close = authority.find(']');
            if (close == std::string_view::npos)
            {
                throw UploadError(ErrorCode::InvalidConfig, "Malformed IPv6 host in URL: " + std::string(url));
            }
            result.host = std::string(authority.substr(1, close - 1));
            const auto remainder = authority.substr(close + 1);
            if (!remainder.empty())
            {
                if (remainder.front() != ':')
                {
                    throw UploadError(ErrorCode::InvalidConfig, "Malformed authority in URL: " + std::string(url));
                }
                port_text = remainder.substr(1);
            }
        }
        else
        {
            const auto colon = authority.rfind(':');
            result.host = std::string(authority.substr(0, colon));
            if (colon != std::string_view::npos)
            {
                port_text = authority.substr(colon + 1);
            }
        }

        if (result.host.empty())
        {
            throw UploadError(ErrorCode::InvalidConfig, "URL has no host: " + std::string(url));
        }
        if (!port_text.empty())
        {
            const auto port = parse_port(port_text);
            if (!port)
            {
                throw UploadError(ErrorCode::InvalidConfig, "Invalid port in URL: " + std::string(url));
            }
            result.port = *port;
        }
        return result;
    }

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept
    {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

    void set_header(Headers &headers, std::string_view name, std::string value)
    {
        headers.erase(std::remove_if(headers.begin(), headers.end(), [&](const Header &header)
                                     { return iequals(header.first, name); }),
                      headers.end());
        headers.emplace_back(std::string(name), std::move(value));
    }

    std::optional<std::string> find_header(const Headers &headers, std::string_view name)
    {
        for (const auto &header : headers)
        {
            if (iequals(header.first, name))
            {
                return header.second;
            }
        }
        return std::nullopt;
    }

    std::string format_content_range(std::uint64_t start, std::uint64_t end_inclusive, std::uint64_t total)
    {
        return "bytes " + std::to_string(start) + "-" + std::to_string(end_inclusive) + "/" + std::to_string(total);
    }

} // namespace resupload::http
