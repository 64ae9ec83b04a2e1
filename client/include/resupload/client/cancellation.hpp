#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace resupload::client
{

    class CancellationToken;

    // Broadcast cancellation signal shared by every operation of one generation.
    class CancellationSource
    {
    public:
        CancellationSource();

        CancellationToken token() const;

        // Runs every registered callback once; later registrations run immediately.
        void cancel();

        bool cancelled() const;

    private:
        friend class CancellationToken;

        struct State
        {
            mutable std::mutex mutex;
            bool cancelled{false};
            std::size_t next_id{1};
            std::map<std::size_t, std::function<void()>> callbacks;
        };

        std::shared_ptr<State> state_;
    };

    class CancellationToken
    {
    public:
        // A default token is never cancelled.
        CancellationToken() = default;

        bool cancelled() const;

        // Returns 0 when the token was already cancelled and the callback ran inline.
        std::size_t subscribe(std::function<void()> callback) const;

        void unsubscribe(std::size_t id) const;

    private:
        friend class CancellationSource;

        explicit CancellationToken(std::shared_ptr<CancellationSource::State> state);

        std::shared_ptr<CancellationSource::State> state_;
    };

} // namespace resupload::client
