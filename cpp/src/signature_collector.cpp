#include "cosign/signature_collector.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace cosign
{

    nlohmann::json SignOutcome::to_json() const
    {
        nlohmann::json j = {{"proposal", proposal.to_json()}, {"executed", executed}};
        if (transaction_hash)
            j["transactionHash"] = *transaction_hash;
        if (error)
            j["error"] = *error;
        return j;
    }

    SignatureCollector::SignatureCollector(std::shared_ptr<ProposalStore> proposals,
                                           std::shared_ptr<SignatureVerifier> verifier,
                                           std::shared_ptr<ExecutionCoordinator> coordinator)
        : proposals_(std::move(proposals)),
          verifier_(std::move(verifier)),
          coordinator_(std::move(coordinator))
    {
    }

    Result<SignOutcome> SignatureCollector::sign(const SignRequest &request)
    {
        auto registry = proposals_->registry();
        auto clock = proposals_->clock();
        auto window_ms = proposals_->signing().freshness_window_secs * 1000;

        auto signed_proposal = proposals_->transact(request.proposal_id, [&](Proposal &p) -> Result<void>
                                                    {
            if (!p.is_eligible(request.validator_id))
            {
                return std::unexpected(CosignError::unauthorized(
                    std::format("Validator {} is not authorized to sign this proposal", request.validator_id)));
            }
            auto validator = registry->get(request.validator_id);
            if (!validator)
                return std::unexpected(validator.error());
            if (!validator->is_active)
            {
                return std::unexpected(CosignError::unauthorized(
                    std::format("Validator {} has been deactivated", request.validator_id)));
            }
            if (request.signer_type && *request.signer_type != validator->kind())
            {
                return std::unexpected(CosignError::invalid_input(
                    std::format("Validator {} is a {} validator", validator->id, to_string(validator->kind()))));
            }

            if (p.status != ProposalStatus::Pending)
            {
                return std::unexpected(CosignError::not_pending(
                    std::format("Proposal is not pending (status: {})", to_string(p.status))));
            }
            auto now = clock->now_ms();
            if (now > p.expires_at)
            {
                p.status = ProposalStatus::Expired;
                return std::unexpected(CosignError::expired("Proposal has expired"));
            }
            if (p.has_signed(request.validator_id))
                return std::unexpected(CosignError::already_signed("Validator has already signed this proposal"));

            if (!verifier_->verify(p.canonical_payload(), request.signature, *validator))
                return std::unexpected(CosignError::invalid_signature("Invalid signature"));

            auto signed_at = request.signed_at.value_or(now);
            if (signed_at < now - window_ms || signed_at > now + window_ms)
            {
                return std::unexpected(CosignError::stale_signature(
                    "Signature timestamp is outside the accepted window"));
            }

            p.signatures.push_back(ProposalSignature{validator->id,
                                                     request.signature,
                                                     validator->kind(),
                                                     signed_at,
                                                     validator->signer_identity(),
                                                     request.device});
            return {}; });

        if (!signed_proposal)
        {
            spdlog::info("signature from {} on {} rejected: {} ({})",
                         request.validator_id, request.proposal_id,
                         error_code_name(signed_proposal.error().code), signed_proposal.error().what());
            return std::unexpected(signed_proposal.error());
        }

        if (auto touched = registry->touch(request.validator_id); !touched)
        {
            spdlog::warn("could not update last use of {}: {}", request.validator_id, touched.error().what());
        }

        SignOutcome outcome;
        outcome.proposal = std::move(*signed_proposal);

        auto execution = coordinator_->try_execute(request.proposal_id);
        if (!execution)
        {
            spdlog::error("execution check for {} failed: {}", request.proposal_id, execution.error().what());
            outcome.error = execution.error().what();
        }
        else
        {
            outcome.executed = execution->executed;
            outcome.transaction_hash = execution->transaction_hash;
            outcome.error = execution->error;
        }

        if (auto latest = proposals_->get(request.proposal_id))
            outcome.proposal = std::move(*latest);
        return outcome;
    }

} // namespace cosign
