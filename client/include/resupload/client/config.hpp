#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "resupload/http.hpp"

namespace resupload::client
{

    constexpr std::uint64_t kDefaultChunkSize = 1024 * 1024;
    constexpr std::uint64_t kFloorInitialChunkSize = 64 * 1024;
    constexpr std::uint64_t kDefaultMinChunkSize = 64 * 1024;
    constexpr std::uint64_t kFloorMinChunkSize = 16 * 1024;
    constexpr std::size_t kDefaultConcurrency = 3;
    constexpr std::size_t kMaxConcurrency = 8;

    struct HeaderNames
    {
        std::string content_range{"Content-Range"};
        std::string upload_id{"Upload-Id"};
        std::string content_type{"Content-Type"};
    };

    struct CompressionConfig
    {
        bool enabled{};
        double max_megapixels{12.0};
        std::optional<std::string> output_type;
        std::optional<double> quality;
    };

    struct UploaderConfig
    {
        std::string endpoint;
        std::string method{"PUT"};
        std::optional<std::string> init_endpoint;
        std::string init_method{"POST"};
        http::Headers headers;
        HeaderNames header_names;
        std::uint64_t initial_chunk_size{kDefaultChunkSize};
        std::uint64_t min_chunk_size{kDefaultMinChunkSize};
        std::size_t max_concurrency{kDefaultConcurrency};
        std::chrono::milliseconds backoff_base{500};
        std::chrono::milliseconds backoff_max{15000};
        // Zero disables the per-request timeout.
        std::chrono::milliseconds request_timeout{std::chrono::seconds{60}};
        std::string storage_key_prefix{"resumable_upload:"};
        std::optional<std::string> session_id;
        CompressionConfig compression;
    };

    // Applies the size and concurrency floors and validates URLs and methods.
    UploaderConfig normalize(UploaderConfig config);

    struct ClientConfig
    {
        std::filesystem::path file;
        std::optional<std::string> content_type;
        std::optional<std::filesystem::path> state_file;
        std::optional<std::filesystem::path> log_path;
        bool verbose{};
        UploaderConfig uploader;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace resupload::client
