#pragma once

#include "execution.hpp"
#include "proposal.hpp"
#include "proposal_store.hpp"
#include "signature_verifier.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace cosign
{

    struct SignRequest
    {
        std::string proposal_id;
        std::string validator_id;
        std::string signature; // base64
        std::optional<ValidatorKind> signer_type;
        std::optional<Timestamp> signed_at; // server time when absent
        std::optional<DeviceMetadata> device;
    };

    struct SignOutcome
    {
        Proposal proposal;
        bool executed{false};
        std::optional<std::string> transaction_hash;
        std::optional<std::string> error; // execution failure, signature still recorded

        nlohmann::json to_json() const;
    };

    /**
     * Validates and records one validator signature, then asks the
     * coordinator to execute so the caller learns in one round trip
     * whether quorum was reached.
     *
     * Rejections, in order: NotFound (proposal), Unauthorized (validator
     * not eligible for this proposal or deactivated), NotPending, Expired
     * (the proposal is moved to expired first), AlreadySigned,
     * InvalidSignature, StaleSignature. A rejection never changes the
     * proposal apart from the expiry transition.
     */
    class SignatureCollector
    {
    public:
        SignatureCollector(std::shared_ptr<ProposalStore> proposals,
                           std::shared_ptr<SignatureVerifier> verifier,
                           std::shared_ptr<ExecutionCoordinator> coordinator);

        Result<SignOutcome> sign(const SignRequest &request);

    private:
        std::shared_ptr<ProposalStore> proposals_;
        std::shared_ptr<SignatureVerifier> verifier_;
        std::shared_ptr<ExecutionCoordinator> coordinator_;
    };

} // namespace cosign
