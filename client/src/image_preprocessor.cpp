#include "resupload/client/image_preprocessor.hpp"

#include <QBuffer>
#include <QByteArray>
#include <QImage>
#include <QSize>

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>
#include <vector>

#include "resupload/error_codes.hpp"

namespace resupload::client
{

    namespace
    {

        struct FormatEntry
        {
            std::string_view mime;
            const char *format;
        };

        constexpr std::array<FormatEntry, 3> kFormats{{
            {"image/png", "PNG"},
            {"image/jpeg", "JPEG"},
            {"image/webp", "WEBP"},
        }};

        const char *qt_format(std::string_view mime)
        {
            for (const auto &entry : kFormats)
            {
                if (entry.mime == mime)
                {
                    return entry.format;
                }
            }
            return nullptr;
        }

    } // namespace

    std::string output_type_for(const CompressionConfig &config, std::string_view input_type)
    {
        if (config.output_type && qt_format(*config.output_type) != nullptr)
        {
            return *config.output_type;
        }
        return input_type == "image/png" ? "image/png" : "image/jpeg";
    }

    double quality_for(const CompressionConfig &config, std::string_view output_type)
    {
        if (config.quality)
        {
            return std::clamp(*config.quality, kMinQuality, kMaxQuality);
        }
        return output_type == "image/jpeg" ? kDefaultJpegQuality : kDefaultQuality;
    }

    ImagePreprocessor::ImagePreprocessor(CompressionConfig config, Logger logger)
        : config_(std::move(config)), logger_(std::move(logger))
    {
    }

    std::unique_ptr<Payload> ImagePreprocessor::apply(std::unique_ptr<Payload> payload)
    {
        if (!config_.enabled || !payload || !is_image_type(payload->content_type()))
        {
            return payload;
        }

        std::vector<std::byte> original;
        try
        {
            original = payload->read_all();
        }
        catch (const UploadError &ex)
        {
            logger_.warn("preprocess", "Skipping ", payload->name(), ": ", ex.what());
            return payload;
        }

        QImage image;
        if (!image.loadFromData(reinterpret_cast<const uchar *>(original.data()),
                                static_cast<qsizetype>(original.size())))
        {
            logger_.warn("preprocess", "Could not decode ", payload->name(), ", uploading it unchanged");
            return payload;
        }

        const double megapixels = static_cast<double>(image.width()) * image.height() / 1e6;
        if (megapixels <= config_.max_megapixels)
        {
            return payload;
        }

        const double scale = std::sqrt(config_.max_megapixels / megapixels);
        const int width = std::max(1, static_cast<int>(std::floor(image.width() * scale)));
        const int height = std::max(1, static_cast<int>(std::floor(image.height() * scale)));
        const QImage resized = image.scaled(QSize(width, height), Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
        if (resized.isNull())
        {
            logger_.warn("preprocess", "Resizing ", payload->name(), " failed, uploading it unchanged");
            return payload;
        }

        const auto output_type = output_type_for(config_, payload->content_type());
        const int quality = static_cast<int>(std::lround(quality_for(config_, output_type) * 100.0));
        QByteArray encoded;
        QBuffer buffer(&encoded);
        if (!buffer.open(QIODevice::WriteOnly) ||
            !resized.save(&buffer, qt_format(output_type), output_type == "image/png" ? -1 : quality))
        {
            logger_.warn("preprocess", "Encoding ", payload->name(), " as ", output_type, " failed, uploading it unchanged");
            return payload;
        }

        std::vector<std::byte> bytes(static_cast<std::size_t>(encoded.size()));
        std::copy_n(reinterpret_cast<const std::byte *>(encoded.constData()), bytes.size(), bytes.begin());
        logger_.log("preprocess", payload->name(), ": ", image.width(), "x", image.height(), " -> ", width, "x", height,
                    ", ", original.size(), " -> ", bytes.size(), " bytes");
        return std::make_unique<MemoryPayload>(payload->name(), output_type, std::move(bytes));
    }

} // namespace resupload::client
