#pragma once
#include <chrono>
#include <cstdint>

// Doubling retry delay: attempt k (1-indexed) waits min(base * 2^(k-1), max).
inline std::chrono::milliseconds backoff_delay(unsigned attempt,
                                               std::chrono::milliseconds base,
                                               std::chrono::milliseconds max)
{
    if (attempt == 0) attempt = 1;
    std::int64_t delay = base.count();
    for (unsigned i = 1; i < attempt && delay < max.count(); ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(delay < max.count() ? delay : max.count());
}

struct ReconnectPolicy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    unsigned max_attempts{10};

    std::chrono::milliseconds delay_for(unsigned attempt) const {
        return backoff_delay(attempt, base_delay, max_delay);
    }
};
