#include "resupload/client/chunk_planner.hpp"

#include <algorithm>
#include <iterator>

namespace resupload::client
{

    ChunkPlanner::ChunkPlanner(UploadState state, std::uint64_t min_chunk_size, StateListener on_state,
                               ProgressListener on_progress)
        : state_(std::move(state)),
          min_chunk_size_(std::max<std::uint64_t>(1, min_chunk_size)),
          on_state_(std::move(on_state)),
          on_progress_(std::move(on_progress))
    {
        state_.chunk_size = std::max(state_.chunk_size, min_chunk_size_);
        state_.confirmed_offset = std::min(state_.confirmed_offset, state_.file_size);
        state_.next_offset = std::clamp(state_.next_offset, state_.confirmed_offset, state_.file_size);
    }

    std::optional<ChunkClaim> ChunkPlanner::claim()
    {
        protocol::Checkpoint snapshot;
        ChunkClaim claimed;
        {
            std::lock_guard lock(mutex_);
            if (restart_requested_ || state_.next_offset >= state_.file_size)
            {
                return std::nullopt;
            }

            // Skip bytes an out-of-order confirmation already covers.
            auto it = confirmed_ranges_.upper_bound(state_.next_offset);
            while (it != confirmed_ranges_.begin())
            {
                const auto previous = std::prev(it);
                if (previous->second <= state_.next_offset)
                {
                    break;
                }
                state_.next_offset = std::min(previous->second, state_.file_size);
                it = confirmed_ranges_.upper_bound(state_.next_offset);
            }
            if (state_.next_offset >= state_.file_size)
            {
                return std::nullopt;
            }

            claimed.start = state_.next_offset;
            claimed.end_inclusive = std::min(state_.file_size, claimed.start + state_.chunk_size) - 1;
            state_.next_offset = claimed.end_inclusive + 1;
            snapshot = checkpoint_locked();
        }
        notify(snapshot, false);
        return claimed;
    }

    bool ChunkPlanner::confirm(std::uint64_t start, std::uint64_t end_inclusive)
    {
        protocol::Checkpoint snapshot;
        {
            std::lock_guard lock(mutex_);
            const auto end_exclusive = std::min(end_inclusive + 1, state_.file_size);
            if (end_exclusive <= state_.confirmed_offset || start >= end_exclusive)
            {
                return false;
            }
            auto &stored_end = confirmed_ranges_[start];
            stored_end = std::max(stored_end, end_exclusive);

            const auto before = state_.confirmed_offset;
            while (!confirmed_ranges_.empty() && confirmed_ranges_.begin()->first <= state_.confirmed_offset)
            {
                state_.confirmed_offset = std::max(state_.confirmed_offset, confirmed_ranges_.begin()->second);
                confirmed_ranges_.erase(confirmed_ranges_.begin());
            }
            if (state_.confirmed_offset == before)
            {
                return false;
            }
            state_.next_offset = std::max(state_.next_offset, state_.confirmed_offset);
            snapshot = checkpoint_locked();
        }
        notify(snapshot, true);
        return true;
    }

    bool ChunkPlanner::request_restart()
    {
        protocol::Checkpoint snapshot;
        {
            std::lock_guard lock(mutex_);
            if (restart_requested_)
            {
                return false;
            }
            restart_requested_ = true;
            state_.chunk_size = std::max(min_chunk_size_, state_.chunk_size / 2);
            state_.next_offset = state_.confirmed_offset;
            snapshot = checkpoint_locked();
        }
        notify(snapshot, false);
        return true;
    }

    void ChunkPlanner::release(std::uint64_t start)
    {
        protocol::Checkpoint snapshot;
        {
            std::lock_guard lock(mutex_);
            const auto target = std::max(start, state_.confirmed_offset);
            if (target >= state_.next_offset)
            {
                return;
            }
            state_.next_offset = target;
            snapshot = checkpoint_locked();
        }
        notify(snapshot, false);
    }

    void ChunkPlanner::begin_generation()
    {
        std::lock_guard lock(mutex_);
        restart_requested_ = false;
    }

    void ChunkPlanner::set_session_id(std::string session_id)
    {
        protocol::Checkpoint snapshot;
        {
            std::lock_guard lock(mutex_);
            state_.session_id = std::move(session_id);
            snapshot = checkpoint_locked();
        }
        notify(snapshot, false);
    }

    bool ChunkPlanner::complete() const
    {
        std::lock_guard lock(mutex_);
        return state_.confirmed_offset >= state_.file_size;
    }

    bool ChunkPlanner::restart_requested() const
    {
        std::lock_guard lock(mutex_);
        return restart_requested_;
    }

    std::uint64_t ChunkPlanner::chunk_size() const
    {
        std::lock_guard lock(mutex_);
        return state_.chunk_size;
    }

    UploadState ChunkPlanner::state() const
    {
        std::lock_guard lock(mutex_);
        return state_;
    }

    protocol::Checkpoint ChunkPlanner::checkpoint() const
    {
        std::lock_guard lock(mutex_);
        return checkpoint_locked();
    }

    protocol::Checkpoint ChunkPlanner::checkpoint_locked() const
    {
        return protocol::Checkpoint{
            .session_id = state_.session_id,
            .next_offset = state_.next_offset,
            .confirmed_offset = state_.confirmed_offset,
            .chunk_size = state_.chunk_size,
            .file_name = state_.file_name,
            .file_size = state_.file_size,
            .file_type = state_.file_type,
        };
    }

    void ChunkPlanner::notify(const protocol::Checkpoint &checkpoint, bool progressed)
    {
        if (progressed && on_progress_)
        {
            on_progress_(checkpoint.confirmed_offset, checkpoint.file_size);
        }
        if (on_state_)
        {
            on_state_(checkpoint);
        }
    }

} // namespace resupload::client
