#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "resupload/error_codes.hpp"
#include "resupload/protocol.hpp"

namespace resupload::client
{

    struct ChunkError
    {
        std::uint64_t start{};
        std::uint64_t end_inclusive{};
        ErrorCode code{ErrorCode::Ok};
        // HTTP status, 0 when the request never produced a response.
        unsigned status{};
        std::string message;
    };

    // Every callback is optional and runs on the uploader's io_context.
    struct UploadEvents
    {
        std::function<void(std::uint64_t confirmed, std::uint64_t total)> on_progress;
        std::function<void(std::uint64_t start, std::uint64_t end_inclusive)> on_chunk_success;
        std::function<void(const ChunkError &)> on_chunk_error;
        std::function<void(const protocol::Checkpoint &)> on_checkpoint;
    };

} // namespace resupload::client
