#include "cosign/rate_limiter.hpp"
#include <algorithm>
#include <cmath>

namespace cosign
{
    RateLimiter::RateLimiter() : cfg_{} {}

    RateLimiter::RateLimiter(const Config &cfg) : cfg_(cfg) {}

    void RateLimiter::refill(Bucket &bucket, TimePoint now) const
    {
        if (bucket.last_refill == TimePoint{})
        {
            bucket.last_refill = now;
            bucket.tokens = cfg_.burst_capacity;
            return;
        }
        auto elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
        if (elapsed <= 0)
            return;
        bucket.tokens = std::min(cfg_.burst_capacity, bucket.tokens + elapsed * cfg_.tokens_per_second);
        bucket.last_refill = now;
    }

    bool RateLimiter::allow(const std::string &key)
    {
        return check(key, std::chrono::steady_clock::now()).allowed;
    }

    RateLimiter::Decision RateLimiter::check(const std::string &key, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        auto &bucket = buckets_[key];
        refill(bucket, now);
        if (bucket.tokens < 1.0)
        {
            return {false, 0};
        }
        bucket.tokens -= 1.0;
        return {true, static_cast<std::size_t>(std::floor(bucket.tokens))};
    }

    std::size_t RateLimiter::prune(TimePoint now)
    {
        std::lock_guard lock(mutex_);
        return std::erase_if(buckets_, [&](const auto &entry)
                             { return now - entry.second.last_refill > cfg_.max_idle; });
    }

    std::size_t RateLimiter::tracked() const
    {
        std::lock_guard lock(mutex_);
        return buckets_.size();
    }

} // namespace cosign
