#include "resupload/error_codes.hpp"

#include <array>

namespace resupload
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 9> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidConfig, "invalid_config"},
            {ErrorCode::InitFailed, "init_failed"},
            {ErrorCode::PayloadTooLarge, "payload_too_large"},
            {ErrorCode::HttpError, "http_error"},
            {ErrorCode::TransportError, "transport_error"},
            {ErrorCode::FileIo, "file_io"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    UploadError::UploadError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

} // namespace resupload
