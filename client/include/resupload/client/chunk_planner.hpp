#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "resupload/protocol.hpp"

namespace resupload::client
{

    struct UploadState
    {
        std::string session_id;
        std::string file_name;
        std::uint64_t file_size{};
        std::string file_type;
        std::uint64_t chunk_size{};
        std::uint64_t next_offset{};
        std::uint64_t confirmed_offset{};
    };

    struct ChunkClaim
    {
        std::uint64_t start{};
        std::uint64_t end_inclusive{};

        std::uint64_t length() const
        {
            return end_inclusive - start + 1;
        }
    };

    /**
     * Owns the offsets and chunk size of one upload session.
     *
     * Invariants after every call: confirmed_offset <= next_offset <= file_size and
     * chunk_size >= min_chunk_size. confirmed_offset is the contiguous confirmed
     * frontier: every byte below it was acknowledged. Confirmations above the
     * frontier are remembered and merged once the gap below them closes.
     *
     * Listeners run after the internal lock is released.
     */
    class ChunkPlanner
    {
    public:
        using StateListener = std::function<void(const protocol::Checkpoint &)>;
        using ProgressListener = std::function<void(std::uint64_t confirmed, std::uint64_t total)>;

        ChunkPlanner(UploadState state, std::uint64_t min_chunk_size, StateListener on_state = {},
                     ProgressListener on_progress = {});

        // Next unclaimed range, or std::nullopt after a restart request or once every byte is claimed.
        std::optional<ChunkClaim> claim();

        // Returns true when the confirmed frontier advanced.
        bool confirm(std::uint64_t start, std::uint64_t end_inclusive);

        // Halves the chunk size and rewinds to the frontier. Only the first call per generation acts.
        bool request_restart();

        // Gives a failed range back so it is claimed again.
        void release(std::uint64_t start);

        void begin_generation();

        void set_session_id(std::string session_id);

        bool complete() const;
        bool restart_requested() const;
        std::uint64_t chunk_size() const;
        std::uint64_t min_chunk_size() const
        {
            return min_chunk_size_;
        }
        UploadState state() const;
        protocol::Checkpoint checkpoint() const;

    private:
        protocol::Checkpoint checkpoint_locked() const;
        void notify(const protocol::Checkpoint &checkpoint, bool progressed);

        mutable std::mutex mutex_;
        UploadState state_;
        std::uint64_t min_chunk_size_;
        bool restart_requested_{false};
        // start -> exclusive end of ranges confirmed above the frontier
        std::map<std::uint64_t, std::uint64_t> confirmed_ranges_;
        StateListener on_state_;
        ProgressListener on_progress_;
    };

} // namespace resupload::client
