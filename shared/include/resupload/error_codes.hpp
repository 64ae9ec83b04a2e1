/**
 * resupload - Error codes shared by the upload client and its tooling.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace resupload
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidConfig = 1,
        InitFailed = 2,
        PayloadTooLarge = 3,
        HttpError = 4,
        TransportError = 5,
        FileIo = 6,
        Cancelled = 7,
        InternalError = 8
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept
        {
            return code_;
        }

    private:
        ErrorCode code_;
    };

} // namespace resupload
