#include "resupload/client/checkpoint_store.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "resupload/error_codes.hpp"

namespace resupload::client
{

    std::optional<std::string> MemoryStore::get(const std::string &key) const
    {
        const auto it = entries_.find(key);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void MemoryStore::set(const std::string &key, std::string value)
    {
        entries_[key] = std::move(value);
    }

    void MemoryStore::erase(const std::string &key)
    {
        entries_.erase(key);
    }

    JsonFileStore::JsonFileStore(std::filesystem::path path)
        : state_path_(std::move(path))
    {
        load();
    }

    std::optional<std::string> JsonFileStore::get(const std::string &key) const
    {
        const auto it = entries_.find(key);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void JsonFileStore::set(const std::string &key, std::string value)
    {
        entries_[key] = std::move(value);
        save();
    }

    void JsonFileStore::erase(const std::string &key)
    {
        if (entries_.erase(key) > 0)
        {
            save();
        }
    }

    std::filesystem::path JsonFileStore::default_state_path()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "resupload" / "checkpoints.json";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".resupload" / "checkpoints.json";
        }
        return std::filesystem::path(".resupload") / "checkpoints.json";
    }

    void JsonFileStore::load()
    {
        entries_.clear();
        std::error_code ec;
        if (!std::filesystem::exists(state_path_, ec))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            spdlog::warn("Ignoring corrupt checkpoint file {}", state_path_.string());
            return;
        }
        for (const auto &[key, value] : json.items())
        {
            if (value.is_string())
            {
                entries_.emplace(key, value.get<std::string>());
            }
        }
    }

    void JsonFileStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[key, value] : entries_)
        {
            json[key] = value;
        }

        auto temp_path = state_path_;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw UploadError(ErrorCode::FileIo, "Could not write checkpoint file " + temp_path.string());
            }
            out << json.dump(2);
            if (!out)
            {
                throw UploadError(ErrorCode::FileIo, "Could not write checkpoint file " + temp_path.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, state_path_, ec);
        if (ec)
        {
            throw UploadError(ErrorCode::FileIo, "Could not replace checkpoint file " + state_path_.string() + ": " +
                                                     ec.message());
        }
    }

    CheckpointStore::CheckpointStore(KeyValueStore &store, std::string prefix)
        : store_(store), prefix_(std::move(prefix)) {}

    std::string CheckpointStore::key_for(const std::string &endpoint, const std::string &file_name,
                                         std::uint64_t file_size, const std::string &file_type) const
    {
        return prefix_ + endpoint + "|" + file_name + "|" + std::to_string(file_size) + "|" + file_type;
    }

    std::optional<protocol::Checkpoint> CheckpointStore::load(const std::string &key) const
    {
        const auto raw = store_.get(key);
        if (!raw)
        {
            return std::nullopt;
        }
        const auto json = nlohmann::json::parse(*raw, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            return std::nullopt;
        }
        try
        {
            return json.get<protocol::Checkpoint>();
        }
        catch (const nlohmann::json::exception &)
        {
            return std::nullopt;
        }
    }

    void CheckpointStore::save(const std::string &key, const protocol::Checkpoint &checkpoint)
    {
        store_.set(key, nlohmann::json(checkpoint).dump());
    }

    void CheckpointStore::erase(const std::string &key)
    {
        store_.erase(key);
    }

} // namespace resupload::client
