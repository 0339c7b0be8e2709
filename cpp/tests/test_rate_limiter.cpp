#include <catch2/catch_test_macros.hpp>
#include "cosign/rate_limiter.hpp"

using namespace cosign;
using namespace std::chrono_literals;

TEST_CASE("Token bucket allows a burst then refills", "[rate_limit]")
{
    RateLimiter::Config cfg;
    cfg.tokens_per_second = 2.0;
    cfg.burst_capacity = 3.0;
    RateLimiter limiter(cfg);

    auto t0 = std::chrono::steady_clock::now();
    REQUIRE(limiter.check("alice", t0).remaining == 2);
    REQUIRE(limiter.check("alice", t0).allowed);
    REQUIRE(limiter.check("alice", t0).allowed);
    REQUIRE_FALSE(limiter.check("alice", t0).allowed);

    // other clients have their own bucket
    REQUIRE(limiter.check("bob", t0).allowed);

    auto t1 = t0 + 500ms;
    REQUIRE(limiter.check("alice", t1).allowed);
    REQUIRE_FALSE(limiter.check("alice", t1).allowed);

    auto t2 = t1 + 10s;
    REQUIRE(limiter.check("alice", t2).remaining == 2);
}

TEST_CASE("Idle buckets are pruned", "[rate_limit]")
{
    RateLimiter::Config cfg;
    cfg.max_idle = 60s;
    RateLimiter limiter(cfg);

    auto t0 = std::chrono::steady_clock::now();
    limiter.check("alice", t0);
    limiter.check("bob", t0 + 50s);
    REQUIRE(limiter.tracked() == 2);

    REQUIRE(limiter.prune(t0 + 61s) == 1);
    REQUIRE(limiter.tracked() == 1);
    REQUIRE(limiter.prune(t0 + 200s) == 1);
    REQUIRE(limiter.tracked() == 0);
}
