/**
 * resupload - JSON schema for checkpoints and the upload initialization exchange.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace resupload::protocol
{

    struct Checkpoint
    {
        std::string session_id;
        std::uint64_t next_offset{};
        std::uint64_t confirmed_offset{};
        std::uint64_t chunk_size{};
        std::string file_name;
        std::uint64_t file_size{};
        std::string file_type;

        bool operator==(const Checkpoint &) const = default;
    };

    void to_json(nlohmann::json &json, const Checkpoint &checkpoint);
    void from_json(const nlohmann::json &json, Checkpoint &checkpoint);

    // Body of the optional initialization request.
    struct InitRequest
    {
        std::string file_name;
        std::uint64_t file_size{};
        std::string file_type;
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const InitRequest &request);

    struct InitResponse
    {
        std::optional<std::string> upload_id{};
    };

    // Only truthy identifiers are adopted: a non-empty string or a non-zero number.
    void from_json(const nlohmann::json &json, InitResponse &response);

    // Returns std::nullopt when the body is not JSON or carries no identifier.
    std::optional<std::string> parse_init_response(std::string_view body);

} // namespace resupload::protocol
