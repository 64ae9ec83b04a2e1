#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace resupload::client
{

    // Byte source for one upload. Reads throw UploadError(FileIo) on failure.
    class Payload
    {
    public:
        virtual ~Payload() = default;

        virtual const std::string &name() const = 0;
        virtual const std::string &content_type() const = 0;
        virtual std::uint64_t size() const = 0;
        virtual std::vector<std::byte> read(std::uint64_t offset, std::uint64_t length) = 0;

        std::vector<std::byte> read_all();
    };

    class FilePayload : public Payload
    {
    public:
        // Content type defaults to a guess from the file extension.
        explicit FilePayload(std::filesystem::path path, std::string content_type = {});

        const std::string &name() const override;
        const std::string &content_type() const override;
        std::uint64_t size() const override;
        std::vector<std::byte> read(std::uint64_t offset, std::uint64_t length) override;

        const std::filesystem::path &path() const
        {
            return path_;
        }

    private:
        std::filesystem::path path_;
        std::string name_;
        std::string content_type_;
        std::uint64_t size_{};
        std::ifstream stream_;
    };

    class MemoryPayload : public Payload
    {
    public:
        MemoryPayload(std::string name, std::string content_type, std::vector<std::byte> data);

        const std::string &name() const override;
        const std::string &content_type() const override;
        std::uint64_t size() const override;
        std::vector<std::byte> read(std::uint64_t offset, std::uint64_t length) override;

    private:
        std::string name_;
        std::string content_type_;
        std::vector<std::byte> data_;
    };

    std::string guess_content_type(const std::filesystem::path &path);

    bool is_image_type(std::string_view content_type) noexcept;

} // namespace resupload::client
