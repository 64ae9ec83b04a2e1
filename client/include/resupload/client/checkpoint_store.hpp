#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "resupload/protocol.hpp"

namespace resupload::client
{

    // Durable, synchronous key/value storage. Last write wins.
    class KeyValueStore
    {
    public:
        virtual ~KeyValueStore() = default;

        virtual std::optional<std::string> get(const std::string &key) const = 0;
        virtual void set(const std::string &key, std::string value) = 0;
        virtual void erase(const std::string &key) = 0;
    };

    class MemoryStore : public KeyValueStore
    {
    public:
        std::optional<std::string> get(const std::string &key) const override;
        void set(const std::string &key, std::string value) override;
        void erase(const std::string &key) override;

        std::size_t size() const
        {
            return entries_.size();
        }

    private:
        std::map<std::string, std::string> entries_;
    };

    // Keeps every entry in one JSON object file, rewritten through a temporary file on each change.
    class JsonFileStore : public KeyValueStore
    {
    public:
        explicit JsonFileStore(std::filesystem::path path = default_state_path());

        std::optional<std::string> get(const std::string &key) const override;
        void set(const std::string &key, std::string value) override;
        void erase(const std::string &key) override;

        const std::filesystem::path &path() const
        {
            return state_path_;
        }

        static std::filesystem::path default_state_path();

    private:
        void load();
        void save() const;

        std::filesystem::path state_path_;
        std::map<std::string, std::string> entries_;
    };

    class CheckpointStore
    {
    public:
        CheckpointStore(KeyValueStore &store, std::string prefix);

        // prefix + endpoint|name|size|type
        std::string key_for(const std::string &endpoint, const std::string &file_name, std::uint64_t file_size,
                            const std::string &file_type) const;

        // Unparseable entries are treated as absent.
        std::optional<protocol::Checkpoint> load(const std::string &key) const;

        void save(const std::string &key, const protocol::Checkpoint &checkpoint);

        void erase(const std::string &key);

    private:
        KeyValueStore &store_;
        std::string prefix_;
    };

} // namespace resupload::client
