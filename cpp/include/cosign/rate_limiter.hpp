#pragma once

#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cosign
{
    /**
     * Token bucket per client key (authenticated user, else remote address).
     * Buckets idle for longer than max_idle are dropped on the next prune().
     */
    class RateLimiter
    {
    public:
        using TimePoint = std::chrono::steady_clock::time_point;

        struct Config
        {
            double tokens_per_second{1.0};
            double burst_capacity{60.0};
            std::chrono::seconds max_idle{std::chrono::minutes(10)};
        };

        struct Decision
        {
            bool allowed{false};
            std::size_t remaining{0};
        };

        RateLimiter();
        explicit RateLimiter(const Config &cfg);

        bool allow(const std::string &key);

        /** Take one token for key at the given instant */
        Decision check(const std::string &key, TimePoint now);

        /** Forget buckets untouched since before now - max_idle; returns how many were dropped */
        std::size_t prune(TimePoint now);

        std::size_t tracked() const;

    private:
        struct Bucket
        {
            double tokens{0.0};
            TimePoint last_refill{};
        };

        void refill(Bucket &bucket, TimePoint now) const;

        Config cfg_;
        std::unordered_map<std::string, Bucket> buckets_;
        mutable std::mutex mutex_;
    };
}
