#include "cosign/execution.hpp"
#include "cosign/crypto.hpp"
#include <spdlog/spdlog.h>
#include <format>
#include <limits>
#include <unordered_set>

namespace cosign
{

    std::uint64_t AggregatedSignature::total_weight() const
    {
        std::uint64_t total = 0;
        for (const auto &e : entries)
            total += e.weight;
        return total;
    }

    nlohmann::json AggregatedSignature::to_json() const
    {
        nlohmann::json sigs = nlohmann::json::array();
        for (const auto &e : entries)
        {
            sigs.push_back({{"validatorId", e.validator_id},
                            {"signer", e.signer},
                            {"signerType", to_string(e.signer_type)},
                            {"weight", e.weight},
                            {"signature", e.signature}});
        }
        return {{"signatures", sigs}, {"totalWeight", total_weight()}};
    }

    AggregatedSignature AggregatedSignature::from(const Proposal &proposal)
    {
        AggregatedSignature agg;
        agg.entries.reserve(proposal.signatures.size());
        for (const auto &s : proposal.signatures)
        {
            agg.entries.push_back({s.validator_id, s.signed_by.empty() ? s.validator_id : s.signed_by,
                                   s.signer_type, 1, s.signature});
        }
        return agg;
    }

    Result<std::string> DryRunBroadcaster::execute(const std::string &to,
                                                   const std::string &value,
                                                   const std::string &data,
                                                   const AggregatedSignature &aggregate)
    {
        nlohmann::json call = {
            {"to", to},
            {"value", value},
            {"data", data.empty() ? "0x" : data},
            {"aggregate", aggregate.to_json()}};
        auto hash = "0x" + crypto::SHA256::to_hex(crypto::SHA256::hash(call.dump()));
        spdlog::info("dry-run broadcast of {} to {} with {} signature(s): {}",
                     value, to, aggregate.entries.size(), hash);
        return hash;
    }

    nlohmann::json GasEstimate::to_json() const
    {
        // wei amounts exceed the JSON safe-integer range, so they travel as strings
        return {{"gasLimit", std::to_string(gas_limit)},
                {"gasPrice", std::to_string(gas_price)},
                {"totalCost", std::to_string(total_cost)}};
    }

    nlohmann::json Preflight::to_json() const
    {
        nlohmann::json j = {{"canExecute", can_execute}};
        if (reason)
            j["reason"] = *reason;
        return j;
    }

    ExecutionCoordinator::ExecutionCoordinator(std::shared_ptr<ProposalStore> proposals,
                                               std::shared_ptr<ExecutionBroadcaster> broadcaster,
                                               GasConfig gas)
        : proposals_(std::move(proposals)),
          broadcaster_(std::move(broadcaster)),
          gas_(gas)
    {
    }

    Result<ExecutionOutcome> ExecutionCoordinator::try_execute(std::string_view proposal_id)
    {
        auto clock = proposals_->clock();
        ExecutionOutcome outcome;

        auto committed = proposals_->transact(proposal_id, [&](Proposal &p) -> Result<void>
                                              {
            if (p.status != ProposalStatus::Pending)
                return {};
            auto now = clock->now_ms();
            if (now > p.expires_at)
            {
                p.status = ProposalStatus::Expired;
                return std::unexpected(CosignError::expired("Proposal has expired"));
            }
            if (p.collected_signatures() < p.required_signatures)
                return {};

            auto aggregate = AggregatedSignature::from(p);
            if (aggregate.total_weight() < p.required_signatures)
            {
                spdlog::error("proposal {} reached {} signatures but only weight {}",
                              p.id, p.collected_signatures(), aggregate.total_weight());
                return std::unexpected(CosignError::insufficient_weight(
                    std::format("Aggregate weight {} is below the threshold {}",
                                aggregate.total_weight(), p.required_signatures)));
            }

            Result<std::string> tx = std::unexpected(CosignError::execution_failed("broadcaster unavailable"));
            try
            {
                tx = broadcaster_->execute(p.to, p.value, p.data, aggregate);
            }
            catch (const std::exception &e)
            {
                tx = std::unexpected(CosignError::execution_failed(e.what()));
            }

            if (tx)
            {
                p.status = ProposalStatus::Executed;
                p.executed_at = clock->now_ms();
                p.transaction_hash = *tx;
                outcome.executed = true;
                outcome.transaction_hash = *tx;
            }
            else
            {
                p.status = ProposalStatus::Failed;
                p.metadata.failure_reason = tx.error().what();
                p.metadata.failed_at = clock->now_ms();
                outcome.error = tx.error().what();
            }
            return {}; },
                                              ProposalStore::Commit::Irreversible);

        if (!committed)
            return std::unexpected(committed.error());
        return outcome;
    }

    Result<GasEstimate> ExecutionCoordinator::estimate_gas(const Proposal &proposal,
                                                           const std::vector<ProposalSignature> &signatures) const
    {
        constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
        auto n = static_cast<std::uint64_t>(signatures.size());

        if (gas_.verification_gas_per_signature != 0 && n > kMax / gas_.verification_gas_per_signature)
            return std::unexpected(CosignError::invalid_input("gas estimate overflow"));
        auto verification = gas_.verification_gas_per_signature * n;
        if (verification > kMax - gas_.call_gas || verification + gas_.call_gas > kMax - gas_.pre_verification_gas)
            return std::unexpected(CosignError::invalid_input("gas estimate overflow"));

        GasEstimate est;
        est.gas_limit = gas_.call_gas + verification + gas_.pre_verification_gas;
        est.gas_price = gas_.gas_price_wei;
        if (est.gas_price != 0 && est.gas_limit > kMax / est.gas_price)
            return std::unexpected(CosignError::invalid_input("gas cost overflow"));
        est.total_cost = est.gas_limit * est.gas_price;

        spdlog::debug("gas estimate for {}: limit {} price {}", proposal.id, est.gas_limit, est.gas_price);
        return est;
    }

    Preflight ExecutionCoordinator::can_execute(std::size_t required,
                                                const std::vector<ProposalSignature> &signatures) const
    {
        auto registry = proposals_->registry();
        auto now = proposals_->clock()->now_ms();
        auto window_ms = proposals_->signing().freshness_window_secs * 1000;

        std::unordered_set<std::string> seen;
        std::size_t valid = 0;
        for (const auto &sig : signatures)
        {
            auto v = registry->get(sig.validator_id);
            if (!v)
                return {false, std::format("Unknown validator {}", sig.validator_id)};
            if (!v->is_active)
                return {false, std::format("Validator {} is not active", sig.validator_id)};
            if (!seen.insert(sig.validator_id).second)
                return {false, std::format("Duplicate signature from {}", sig.validator_id)};
            auto age = now - sig.signed_at;
            if (age > window_ms || age < -window_ms)
                return {false, std::format("Signature from {} is stale", sig.validator_id)};
            ++valid;
        }

        if (valid < required)
            return {false, std::format("Need {} more signature(s)", required - valid)};
        return {true, std::nullopt};
    }

    Result<Preflight> ExecutionCoordinator::preflight(std::string_view proposal_id) const
    {
        auto p = proposals_->get(proposal_id);
        if (!p)
            return std::unexpected(p.error());
        if (p->status != ProposalStatus::Pending)
            return Preflight{false, std::format("Proposal is {}", to_string(p->status))};
        if (proposals_->clock()->now_ms() > p->expires_at)
            return Preflight{false, std::string("Proposal has expired")};
        return can_execute(p->required_signatures, p->signatures);
    }

} // namespace cosign
