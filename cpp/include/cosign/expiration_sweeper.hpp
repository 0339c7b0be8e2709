#pragma once

#include "config.hpp"
#include "proposal_store.hpp"
#include "types.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <cstddef>
#include <memory>

namespace cosign
{

    /**
     * Periodic background task that moves overdue pending proposals to
     * expired. Each transition goes through ProposalStore::expire, the same
     * per-proposal critical section signing uses, so a sweep racing a
     * signature resolves to exactly one outcome.
     */
    class ExpirationSweeper : public std::enable_shared_from_this<ExpirationSweeper>
    {
    public:
        ExpirationSweeper(std::shared_ptr<ProposalStore> proposals,
                          boost::asio::any_io_executor executor,
                          SweeperConfig cfg);

        /** Retry unsaved proposal writes, then expire everything overdue at now; returns how many were expired */
        std::size_t sweep_once(Timestamp now);

        /** Arm the timer; the first sweep runs after one interval */
        void start();

        void stop();

        bool running() const { return running_; }

    private:
        void schedule();

        std::shared_ptr<ProposalStore> proposals_;
        boost::asio::steady_timer timer_;
        SweeperConfig cfg_;
        std::atomic<bool> running_{false};
    };

} // namespace cosign
