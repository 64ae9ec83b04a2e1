#include "resupload/client/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

#include "resupload/error_codes.hpp"

namespace resupload::client
{

    namespace
    {

        std::string read_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw UploadError(ErrorCode::InvalidConfig, flag + " requires a value");
            }
            return argv[index++];
        }

        std::uint64_t parse_unsigned(const std::string &value, const std::string &flag)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || value.front() == '-')
                {
                    throw std::invalid_argument(value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw UploadError(ErrorCode::InvalidConfig, flag + " expects a non-negative integer, got '" + value + "'");
            }
        }

        double parse_double(const std::string &value, const std::string &flag)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stod(value, &consumed);
                if (consumed != value.size() || !std::isfinite(parsed))
                {
                    throw std::invalid_argument(value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw UploadError(ErrorCode::InvalidConfig, flag + " expects a number, got '" + value + "'");
            }
        }

        http::Header parse_header(const std::string &value)
        {
            const auto colon = value.find(':');
            if (colon == std::string::npos || colon == 0)
            {
                throw UploadError(ErrorCode::InvalidConfig, "--header expects 'Name: value', got '" + value + "'");
            }
            auto name = value.substr(0, colon);
            auto content = value.substr(colon + 1);
            const auto first = content.find_first_not_of(' ');
            content = first == std::string::npos ? std::string{} : content.substr(first);
            return {std::move(name), std::move(content)};
        }

        void validate_method(const std::string &method)
        {
            if (method.empty() || !std::all_of(method.begin(), method.end(), [](char ch)
                                               { return std::isupper(static_cast<unsigned char>(ch)) != 0; }))
            {
                throw UploadError(ErrorCode::InvalidConfig, "Invalid HTTP method '" + method + "'");
            }
        }

    } // namespace

    UploaderConfig normalize(UploaderConfig config)
    {
        if (config.endpoint.empty())
        {
            throw UploadError(ErrorCode::InvalidConfig, "An upload endpoint is required");
        }
        (void)http::parse_url(config.endpoint);
        if (config.init_endpoint)
        {
            (void)http::parse_url(*config.init_endpoint);
        }
        validate_method(config.method);
        validate_method(config.init_method);

        config.initial_chunk_size = std::max(kFloorInitialChunkSize, config.initial_chunk_size);
        config.min_chunk_size = std::max(kFloorMinChunkSize, config.min_chunk_size);
        config.min_chunk_size = std::min(config.min_chunk_size, config.initial_chunk_size);
        config.max_concurrency = std::clamp<std::size_t>(config.max_concurrency, 1, kMaxConcurrency);

        if (config.backoff_base.count() < 0 || config.backoff_max.count() < 0)
        {
            throw UploadError(ErrorCode::InvalidConfig, "Backoff bounds must not be negative");
        }
        if (config.request_timeout.count() < 0)
        {
            throw UploadError(ErrorCode::InvalidConfig, "Request timeout must not be negative");
        }
        if (config.compression.enabled && !(config.compression.max_megapixels > 0.0))
        {
            throw UploadError(ErrorCode::InvalidConfig, "Megapixel ceiling must be positive");
        }
        if (config.session_id && config.session_id->empty())
        {
            config.session_id.reset();
        }
        return config;
    }

    std::string usage()
    {
        return "Usage: resupload <file> --endpoint <url> [--init-endpoint <url>] [--method <M>] [--init-method <M>]\n"
               "                 [--header 'Name: value']... [--type <mime>] [--chunk-size <bytes>]\n"
               "                 [--min-chunk-size <bytes>] [--concurrency <n>] [--backoff-base-ms <ms>]\n"
               "                 [--backoff-max-ms <ms>] [--timeout <seconds>] [--session-id <id>]\n"
               "                 [--state-file <path>] [--compress-images] [--max-megapixels <mp>]\n"
               "                 [--output-type <mime>] [--quality <0.1-1.0>] [--log <file>] [--verbose]";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw UploadError(ErrorCode::InvalidConfig, "Missing file argument");
        }

        ClientConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--endpoint")
            {
                config.uploader.endpoint = read_value(index, argc, argv, arg);
            }
            else if (arg == "--init-endpoint")
            {
                config.uploader.init_endpoint = read_value(index, argc, argv, arg);
            }
            else if (arg == "--method")
            {
                config.uploader.method = read_value(index, argc, argv, arg);
            }
            else if (arg == "--init-method")
            {
                config.uploader.init_method = read_value(index, argc, argv, arg);
            }
            else if (arg == "--header")
            {
                auto header = parse_header(read_value(index, argc, argv, arg));
                http::set_header(config.uploader.headers, header.first, std::move(header.second));
            }
            else if (arg == "--type")
            {
                config.content_type = read_value(index, argc, argv, arg);
            }
            else if (arg == "--chunk-size")
            {
                config.uploader.initial_chunk_size = parse_unsigned(read_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--min-chunk-size")
            {
                config.uploader.min_chunk_size = parse_unsigned(read_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--concurrency")
            {
                config.uploader.max_concurrency =
                    static_cast<std::size_t>(parse_unsigned(read_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--backoff-base-ms")
            {
                config.uploader.backoff_base =
                    std::chrono::milliseconds(parse_unsigned(read_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--backoff-max-ms")
            {
                config.uploader.backoff_max =
                    std::chrono::milliseconds(parse_unsigned(read_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--timeout")
            {
                config.uploader.request_timeout =
                    std::chrono::seconds(parse_unsigned(read_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--session-id")
            {
                config.uploader.session_id = read_value(index, argc, argv, arg);
            }
            else if (arg == "--state-file")
            {
                config.state_file = std::filesystem::path(read_value(index, argc, argv, arg));
            }
            else if (arg == "--compress-images")
            {
                config.uploader.compression.enabled = true;
            }
            else if (arg == "--max-megapixels")
            {
                config.uploader.compression.max_megapixels = parse_double(read_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--output-type")
            {
                config.uploader.compression.output_type = read_value(index, argc, argv, arg);
            }
            else if (arg == "--quality")
            {
                config.uploader.compression.quality = parse_double(read_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(read_value(index, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw UploadError(ErrorCode::InvalidConfig, "Unknown argument: " + arg);
            }
            else if (config.file.empty())
            {
                config.file = std::filesystem::path(arg);
            }
            else
            {
                throw UploadError(ErrorCode::InvalidConfig, "Unexpected extra argument: " + arg);
            }
        }

        if (config.file.empty())
        {
            throw UploadError(ErrorCode::InvalidConfig, "Missing file argument");
        }
        config.uploader = normalize(std::move(config.uploader));
        return config;
    }

} // namespace resupload::client
