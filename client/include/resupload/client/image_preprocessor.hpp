#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "resupload/client/config.hpp"
#include "resupload/client/logger.hpp"
#include "resupload/client/payload.hpp"

namespace resupload::client
{

    constexpr double kMinQuality = 0.1;
    constexpr double kMaxQuality = 1.0;
    constexpr double kDefaultJpegQuality = 0.85;
    constexpr double kDefaultQuality = 0.92;

    // PNG stays PNG unless configured otherwise, everything else becomes JPEG.
    std::string output_type_for(const CompressionConfig &config, std::string_view input_type);

    double quality_for(const CompressionConfig &config, std::string_view output_type);

    // Downscales image payloads above the megapixel ceiling. Any failure returns the input unchanged.
    class ImagePreprocessor
    {
    public:
        ImagePreprocessor(CompressionConfig config, Logger logger);

        std::unique_ptr<Payload> apply(std::unique_ptr<Payload> payload);

    private:
        CompressionConfig config_;
        Logger logger_;
    };

} // namespace resupload::client
