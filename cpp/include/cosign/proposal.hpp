#pragma once

#include "types.hpp"
#include "validator.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cosign
{

    /**
     * Proposal lifecycle. Pending is the only non-terminal state; every
     * transition leaves it and none returns to it.
     */
    enum class ProposalStatus
    {
        Pending,
        Executed,
        Expired,
        Cancelled,
        Failed
    };

    std::string_view to_string(ProposalStatus status);
    Result<ProposalStatus> proposal_status_from_string(std::string_view s);

    enum class ProposalType
    {
        Transfer,
        ContractInteraction,
        NftTransfer,
        TokenApproval
    };

    std::string_view to_string(ProposalType type);
    Result<ProposalType> proposal_type_from_string(std::string_view s);

    /** Client device that produced a signature; display only */
    struct DeviceMetadata
    {
        std::string device_id;
        std::string device_name;
        std::string platform;
    };

    struct ProposalSignature
    {
        std::string validator_id;
        std::string signature; // base64
        ValidatorKind signer_type{ValidatorKind::Social};
        Timestamp signed_at{0};
        std::string signed_by; // signer identity
        std::optional<DeviceMetadata> device;

        nlohmann::json to_json() const;
        static Result<ProposalSignature> from_json(const nlohmann::json &j);
    };

    struct ProposalMetadata
    {
        std::string title;
        std::string description;
        ProposalType type{ProposalType::Transfer};
        std::optional<std::string> failure_reason;
        std::optional<Timestamp> failed_at;
    };

    struct Proposal
    {
        std::string id;
        std::string created_by;
        std::string to;
        std::string value; // decimal, display units
        std::string data;  // hex call data, empty when none
        std::size_t required_signatures{1};
        std::vector<ProposalSignature> signatures; // arrival order
        std::vector<std::string> validator_ids;
        ProposalStatus status{ProposalStatus::Pending};
        Timestamp created_at{0};
        Timestamp expires_at{0};
        std::optional<Timestamp> executed_at;
        std::optional<std::string> transaction_hash;
        ProposalMetadata metadata;

        std::size_t collected_signatures() const { return signatures.size(); }

        std::size_t remaining_signatures() const
        {
            return collected_signatures() >= required_signatures ? 0 : required_signatures - collected_signatures();
        }

        bool is_eligible(std::string_view validator_id) const;
        bool has_signed(std::string_view validator_id) const;

        /**
         * The bytes every validator signs: compact JSON with sorted keys
         * {"data","proposalId","to","value"}, data defaulting to "0x".
         */
        std::string canonical_payload() const;

        nlohmann::json to_json() const;
        static Result<Proposal> from_json(const nlohmann::json &j);
    };

} // namespace cosign
