#pragma once

#include "cosign/api_router.hpp"
#include "cosign/engine.hpp"
#include "cosign/rate_limiter.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace cosign
{
    struct WebServerConfig
    {
        std::uint16_t port{8080};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
        RateLimiter::Config rate_limit{};
        std::int64_t sweep_interval_secs{60};

        static WebServerConfig from(const CosignConfig &cfg);
    };

    /**
     * HTTP and WebSocket front end on Boost.Beast. HTTP requests go through
     * ApiRouter with per-client rate limiting; GET /ws upgrades to a
     * real-time channel registered with the notification hub. The
     * expiration sweeper runs on the same io_context.
     */
    class WebServer
    {
    public:
        WebServer(std::shared_ptr<Engine> engine, const WebServerConfig &cfg = WebServerConfig{});
        ~WebServer();

        /** Start the server and block until stopped. */
        void run();

        /** Request a stop; active connections complete gracefully. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
