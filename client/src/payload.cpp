#include "resupload/client/payload.hpp"

#include <array>
#include <cctype>

#include "resupload/error_codes.hpp"

namespace resupload::client
{

    namespace
    {

        struct ExtensionMapping
        {
            std::string_view extension;
            std::string_view content_type;
        };

        constexpr std::array<ExtensionMapping, 24> kExtensionMappings{{
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".png", "image/png"},
            {".gif", "image/gif"},
            {".bmp", "image/bmp"},
            {".webp", "image/webp"},
            {".tif", "image/tiff"},
            {".tiff", "image/tiff"},
            {".mp4", "video/mp4"},
            {".mov", "video/quicktime"},
            {".mkv", "video/x-matroska"},
            {".webm", "video/webm"},
            {".avi", "video/x-msvideo"},
            {".mp3", "audio/mpeg"},
            {".wav", "audio/wav"},
            {".flac", "audio/flac"},
            {".ogg", "audio/ogg"},
            {".pdf", "application/pdf"},
            {".zip", "application/zip"},
            {".gz", "application/gzip"},
            {".tar", "application/x-tar"},
            {".json", "application/json"},
            {".txt", "text/plain"},
            {".csv", "text/csv"},
        }};

        constexpr std::string_view kDefaultContentType = "application/octet-stream";

    } // namespace

    std::vector<std::byte> Payload::read_all()
    {
        return read(0, size());
    }

    FilePayload::FilePayload(std::filesystem::path path, std::string content_type)
        : path_(std::move(path)), name_(path_.filename().string()), content_type_(std::move(content_type))
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path_, ec))
        {
            throw UploadError(ErrorCode::FileIo, "Not a regular file: " + path_.string());
        }
        size_ = std::filesystem::file_size(path_, ec);
        if (ec)
        {
            throw UploadError(ErrorCode::FileIo, "Cannot stat " + path_.string() + ": " + ec.message());
        }
        if (content_type_.empty())
        {
            content_type_ = guess_content_type(path_);
        }
        stream_.open(path_, std::ios::binary);
        if (!stream_.is_open())
        {
            throw UploadError(ErrorCode::FileIo, "Could not open " + path_.string() + " for reading");
        }
    }

    const std::string &FilePayload::name() const
    {
        return name_;
    }

    const std::string &FilePayload::content_type() const
    {
        return content_type_;
    }

    std::uint64_t FilePayload::size() const
    {
        return size_;
    }

    std::vector<std::byte> FilePayload::read(std::uint64_t offset, std::uint64_t length)
    {
        if (offset > size_ || length > size_ - offset)
        {
            throw UploadError(ErrorCode::FileIo, "Read past the end of " + path_.string());
        }
        std::vector<std::byte> buffer(static_cast<std::size_t>(length));
        stream_.clear();
        stream_.seekg(static_cast<std::streamoff>(offset));
        stream_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(stream_.gcount()) != length)
        {
            throw UploadError(ErrorCode::FileIo, "Short read from " + path_.string() + " at offset " +
                                                     std::to_string(offset));
        }
        return buffer;
    }

    MemoryPayload::MemoryPayload(std::string name, std::string content_type, std::vector<std::byte> data)
        : name_(std::move(name)), content_type_(std::move(content_type)), data_(std::move(data)) {}

    const std::string &MemoryPayload::name() const
    {
        return name_;
    }

    const std::string &MemoryPayload::content_type() const
    {
        return content_type_;
    }

    std::uint64_t MemoryPayload::size() const
    {
        return data_.size();
    }

    std::vector<std::byte> MemoryPayload::read(std::uint64_t offset, std::uint64_t length)
    {
        if (offset > data_.size() || length > data_.size() - offset)
        {
            throw UploadError(ErrorCode::FileIo, "Read past the end of in-memory payload " + name_);
        }
        const auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
        return std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(length));
    }

    std::string guess_content_type(const std::filesystem::path &path)
    {
        auto extension = path.extension().string();
        for (auto &ch : extension)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        for (const auto &mapping : kExtensionMappings)
        {
            if (mapping.extension == extension)
            {
                return std::string(mapping.content_type);
            }
        }
        return std::string(kDefaultContentType);
    }

    bool is_image_type(std::string_view content_type) noexcept
    {
        return content_type.substr(0, 6) == "image/";
    }

} // namespace resupload::client
