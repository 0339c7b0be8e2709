#include "cosign/expiration_sweeper.hpp"
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace cosign
{

    ExpirationSweeper::ExpirationSweeper(std::shared_ptr<ProposalStore> proposals,
                                         boost::asio::any_io_executor executor,
                                         SweeperConfig cfg)
        : proposals_(std::move(proposals)),
          timer_(executor),
          cfg_(cfg)
    {
    }

    std::size_t ExpirationSweeper::sweep_once(Timestamp now)
    {
        proposals_->flush_unsaved();

        std::size_t expired = 0;
        for (const auto &id : proposals_->overdue_ids(now))
        {
            auto res = proposals_->expire(id);
            if (res)
            {
                ++expired;
                continue;
            }
            // resolved concurrently by a signature or cancellation
            if (res.error().code == ErrorCode::NotPending)
                continue;
            spdlog::error("sweeper could not expire {}: {}", id, res.error().what());
        }
        if (expired > 0)
            spdlog::info("sweeper expired {} proposal(s)", expired);
        return expired;
    }

    void ExpirationSweeper::start()
    {
        if (running_.exchange(true))
            return;
        spdlog::info("expiration sweeper running every {}s", cfg_.interval_secs);
        boost::asio::post(timer_.get_executor(), [self = shared_from_this()] { self->schedule(); });
    }

    void ExpirationSweeper::stop()
    {
        if (!running_.exchange(false))
            return;
        boost::asio::post(timer_.get_executor(), [self = shared_from_this()] { self->timer_.cancel(); });
    }

    void ExpirationSweeper::schedule()
    {
        if (!running_)
            return;
        timer_.expires_after(std::chrono::seconds(cfg_.interval_secs));
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec)
                          {
            if (ec || !self->running_)
                return;
            try
            {
                self->sweep_once(self->proposals_->clock()->now_ms());
            }
            catch (const std::exception &e)
            {
                spdlog::error("sweep aborted: {}", e.what());
            }
            self->schedule(); });
    }

} // namespace cosign
