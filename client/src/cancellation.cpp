#include "resupload/client/cancellation.hpp"

#include <utility>

namespace resupload::client
{

    CancellationSource::CancellationSource()
        : state_(std::make_shared<State>()) {}

    CancellationToken CancellationSource::token() const
    {
        return CancellationToken(state_);
    }

    void CancellationSource::cancel()
    {
        std::map<std::size_t, std::function<void()>> callbacks;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->cancelled)
            {
                return;
            }
            state_->cancelled = true;
            callbacks.swap(state_->callbacks);
        }
        for (auto &[id, callback] : callbacks)
        {
            callback();
        }
    }

    bool CancellationSource::cancelled() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    CancellationToken::CancellationToken(std::shared_ptr<CancellationSource::State> state)
        : state_(std::move(state)) {}

    bool CancellationToken::cancelled() const
    {
        if (!state_)
        {
            return false;
        }
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    std::size_t CancellationToken::subscribe(std::function<void()> callback) const
    {
        if (!state_)
        {
            return 0;
        }
        {
            std::lock_guard lock(state_->mutex);
            if (!state_->cancelled)
            {
                const auto id = state_->next_id++;
                state_->callbacks.emplace(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void CancellationToken::unsubscribe(std::size_t id) const
    {
        if (!state_ || id == 0)
        {
            return;
        }
        std::lock_guard lock(state_->mutex);
        state_->callbacks.erase(id);
    }

} // namespace resupload::client
