#include "resupload/client/backoff.hpp"

#include <algorithm>
#include <cmath>

#include "resupload/crypto.hpp"

namespace resupload::client
{

    Backoff::Backoff(BackoffConfig config, UnitSource source)
        : config_(config), source_(std::move(source))
    {
        if (!source_)
        {
            source_ = []
            { return crypto::random_unit(); };
        }
    }

    std::chrono::milliseconds Backoff::delay(std::uint32_t attempt) const
    {
        const double unit = std::clamp(source_(), 0.0, 1.0);
        const double jitter = kMinJitter + unit * (kMaxJitter - kMinJitter);
        const double cap = static_cast<double>(config_.cap.count());
        // 2^64 already exceeds any representable cap.
        const int exponent = static_cast<int>(std::min<std::uint32_t>(attempt, 64));
        const double raw = static_cast<double>(config_.base.count()) * std::ldexp(1.0, exponent) * jitter;
        const double bounded = std::min(cap, std::round(raw));
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(bounded));
    }

} // namespace resupload::client
