#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace resupload::client
{

    struct BackoffConfig
    {
        std::chrono::milliseconds base{500};
        std::chrono::milliseconds cap{15000};
    };

    // Jittered exponential delay: min(cap, round(base * 2^attempt * jitter)), jitter in [0.75, 1.0].
    class Backoff
    {
    public:
        // Returns a sample in [0, 1]; mapped onto the jitter interval.
        using UnitSource = std::function<double()>;

        static constexpr double kMinJitter = 0.75;
        static constexpr double kMaxJitter = 1.0;

        explicit Backoff(BackoffConfig config, UnitSource source = {});

        std::chrono::milliseconds delay(std::uint32_t attempt) const;

        const BackoffConfig &config() const
        {
            return config_;
        }

    private:
        BackoffConfig config_;
        UnitSource source_;
    };

} // namespace resupload::client
