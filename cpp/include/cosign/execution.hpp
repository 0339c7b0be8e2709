#pragma once

#include "config.hpp"
#include "proposal.hpp"
#include "proposal_store.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cosign
{

    /** All collected signatures of a proposal combined into one execution payload */
    struct AggregatedSignature
    {
        struct Entry
        {
            std::string validator_id;
            std::string signer;
            ValidatorKind signer_type{ValidatorKind::Social};
            std::uint32_t weight{1};
            std::string signature;
        };

        std::vector<Entry> entries;

        std::uint64_t total_weight() const;

        nlohmann::json to_json() const;

        /** Uniform weighting: every signer counts once */
        static AggregatedSignature from(const Proposal &proposal);
    };

    /**
     * Hands an approved call to the chain. Implementations may be slow and
     * may fail; the coordinator never retries.
     */
    class ExecutionBroadcaster
    {
    public:
        virtual ~ExecutionBroadcaster() = default;

        /** Returns the transaction hash */
        virtual Result<std::string> execute(const std::string &to,
                                            const std::string &value,
                                            const std::string &data,
                                            const AggregatedSignature &aggregate) = 0;
    };

    /**
     * Logs the call and returns "0x" + SHA-256 of the call and aggregate,
     * for running without a chain client.
     */
    class DryRunBroadcaster : public ExecutionBroadcaster
    {
    public:
        Result<std::string> execute(const std::string &to,
                                    const std::string &value,
                                    const std::string &data,
                                    const AggregatedSignature &aggregate) override;
    };

    struct ExecutionOutcome
    {
        bool executed{false};
        std::optional<std::string> transaction_hash;
        std::optional<std::string> error;
    };

    struct GasEstimate
    {
        std::uint64_t gas_limit{0};
        std::uint64_t gas_price{0};
        std::uint64_t total_cost{0};

        nlohmann::json to_json() const;
    };

    struct Preflight
    {
        bool can_execute{false};
        std::optional<std::string> reason;

        nlohmann::json to_json() const;
    };

    class ExecutionCoordinator
    {
    public:
        ExecutionCoordinator(std::shared_ptr<ProposalStore> proposals,
                             std::shared_ptr<ExecutionBroadcaster> broadcaster,
                             GasConfig gas);

        /**
         * Execute the proposal if it is pending and has reached quorum.
         *
         * The quorum check, the broadcast and the status transition all run
         * inside one ProposalStore::transact, so concurrent callers crossing
         * the threshold together broadcast exactly once; the loser sees a
         * non-pending proposal and gets executed = false.
         *
         * A broadcaster failure marks the proposal failed and is reported in
         * ExecutionOutcome::error rather than as an error result.
         */
        Result<ExecutionOutcome> try_execute(std::string_view proposal_id);

        Result<GasEstimate> estimate_gas(const Proposal &proposal,
                                         const std::vector<ProposalSignature> &signatures) const;

        /** Read-only quorum check over a candidate signature set */
        Preflight can_execute(std::size_t required, const std::vector<ProposalSignature> &signatures) const;

        /** can_execute for a stored proposal, including its status and expiry */
        Result<Preflight> preflight(std::string_view proposal_id) const;

    private:
        std::shared_ptr<ProposalStore> proposals_;
        std::shared_ptr<ExecutionBroadcaster> broadcaster_;
        GasConfig gas_;
    };

} // namespace cosign
