#include "resupload/protocol.hpp"

#include <cmath>
#include <utility>

namespace resupload::protocol
{

    void to_json(nlohmann::json &json, const Checkpoint &checkpoint)
    {
        json = {
            {"session_id", checkpoint.session_id},
            {"next_offset", checkpoint.next_offset},
            {"confirmed_offset", checkpoint.confirmed_offset},
            {"chunk_size", checkpoint.chunk_size},
            {"file_name", checkpoint.file_name},
            {"file_size", checkpoint.file_size},
            {"file_type", checkpoint.file_type},
        };
    }

    void from_json(const nlohmann::json &json, Checkpoint &checkpoint)
    {
        checkpoint.session_id = json.at("session_id").get<std::string>();
        checkpoint.next_offset = json.value("next_offset", 0ULL);
        // Checkpoints without a confirmed frontier restart from the beginning.
        checkpoint.confirmed_offset = json.value("confirmed_offset", 0ULL);
        checkpoint.chunk_size = json.at("chunk_size").get<std::uint64_t>();
        checkpoint.file_name = json.at("file_name").get<std::string>();
        checkpoint.file_size = json.at("file_size").get<std::uint64_t>();
        checkpoint.file_type = json.value("file_type", std::string{});
    }

    void to_json(nlohmann::json &json, const InitRequest &request)
    {
        json = {
            {"fileName", request.file_name},
            {"fileSize", request.file_size},
            {"fileType", request.file_type},
            {"sessionId", request.session_id},
        };
    }

    void from_json(const nlohmann::json &json, InitResponse &response)
    {
        response.upload_id.reset();
        if (!json.is_object())
        {
            return;
        }
        const auto it = json.find("upload_id");
        if (it == json.end() || it->is_null())
        {
            return;
        }
        if (it->is_string())
        {
            auto value = it->get<std::string>();
            if (!value.empty())
            {
                response.upload_id = std::move(value);
            }
        }
        else if (it->is_number())
        {
            const auto value = it->get<double>();
            if (value != 0.0 && !std::isnan(value))
            {
                response.upload_id = it->dump();
            }
        }
    }

    std::optional<std::string> parse_init_response(std::string_view body)
    {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded())
        {
            return std::nullopt;
        }
        const auto response = json.get<InitResponse>();
        if (!response.upload_id || response.upload_id->empty())
        {
            return std::nullopt;
        }
        return response.upload_id;
    }

} // namespace resupload::protocol
