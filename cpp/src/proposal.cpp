#include "cosign/proposal.hpp"
#include <algorithm>
#include <format>

namespace cosign
{

    std::string_view to_string(ProposalStatus status)
    {
        switch (status)
        {
        case ProposalStatus::Pending:
            return "pending";
        case ProposalStatus::Executed:
            return "executed";
        case ProposalStatus::Expired:
            return "expired";
        case ProposalStatus::Cancelled:
            return "cancelled";
        case ProposalStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    Result<ProposalStatus> proposal_status_from_string(std::string_view s)
    {
        if (s == "pending")
            return ProposalStatus::Pending;
        if (s == "executed")
            return ProposalStatus::Executed;
        if (s == "expired")
            return ProposalStatus::Expired;
        if (s == "cancelled")
            return ProposalStatus::Cancelled;
        if (s == "failed")
            return ProposalStatus::Failed;
        return std::unexpected(CosignError::invalid_input(std::format("Invalid proposal status: {}", s)));
    }

    std::string_view to_string(ProposalType type)
    {
        switch (type)
        {
        case ProposalType::Transfer:
            return "transfer";
        case ProposalType::ContractInteraction:
            return "contract_interaction";
        case ProposalType::NftTransfer:
            return "nft_transfer";
        case ProposalType::TokenApproval:
            return "token_approval";
        }
        return "unknown";
    }

    Result<ProposalType> proposal_type_from_string(std::string_view s)
    {
        if (s == "transfer")
            return ProposalType::Transfer;
        if (s == "contract_interaction")
            return ProposalType::ContractInteraction;
        if (s == "nft_transfer")
            return ProposalType::NftTransfer;
        if (s == "token_approval")
            return ProposalType::TokenApproval;
        return std::unexpected(CosignError::invalid_input(std::format("Invalid proposal type: {}", s)));
    }

    namespace
    {
        template <typename T>
        nlohmann::json optional_json(const std::optional<T> &v)
        {
            return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
        }

        template <typename T>
        std::optional<T> optional_field(const nlohmann::json &j, const char *key)
        {
            if (!j.contains(key) || j[key].is_null())
                return std::nullopt;
            return j[key].get<T>();
        }
    } // namespace

    nlohmann::json ProposalSignature::to_json() const
    {
        nlohmann::json j = {
            {"validatorId", validator_id},
            {"signature", signature},
            {"signerType", to_string(signer_type)},
            {"signedAt", signed_at},
            {"signedBy", signed_by}};
        if (device)
        {
            j["metadata"] = {{"deviceId", device->device_id},
                             {"deviceName", device->device_name},
                             {"platform", device->platform}};
        }
        return j;
    }

    Result<ProposalSignature> ProposalSignature::from_json(const nlohmann::json &j)
    {
        try
        {
            ProposalSignature s;
            s.validator_id = j.at("validatorId").get<std::string>();
            s.signature = j.at("signature").get<std::string>();
            auto kind = validator_kind_from_string(j.at("signerType").get<std::string>());
            if (!kind)
                return std::unexpected(kind.error());
            s.signer_type = *kind;
            s.signed_at = j.at("signedAt").get<Timestamp>();
            s.signed_by = j.value("signedBy", "");
            if (j.contains("metadata") && j["metadata"].is_object())
            {
                const auto &m = j["metadata"];
                s.device = DeviceMetadata{m.value("deviceId", ""), m.value("deviceName", ""), m.value("platform", "")};
            }
            return s;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(CosignError::invalid_input(std::format("Malformed signature: {}", e.what())));
        }
    }

    bool Proposal::is_eligible(std::string_view validator_id) const
    {
        return std::find(validator_ids.begin(), validator_ids.end(), validator_id) != validator_ids.end();
    }

    bool Proposal::has_signed(std::string_view validator_id) const
    {
        return std::any_of(signatures.begin(), signatures.end(),
                           [&](const ProposalSignature &s) { return s.validator_id == validator_id; });
    }

    std::string Proposal::canonical_payload() const
    {
        nlohmann::json payload = {
            {"data", data.empty() ? "0x" : data},
            {"proposalId", id},
            {"to", to},
            {"value", value}};
        return payload.dump();
    }

    nlohmann::json Proposal::to_json() const
    {
        nlohmann::json sigs = nlohmann::json::array();
        for (const auto &s : signatures)
            sigs.push_back(s.to_json());

        nlohmann::json meta = {
            {"title", metadata.title},
            {"description", metadata.description},
            {"type", to_string(metadata.type)}};
        if (metadata.failure_reason)
            meta["failureReason"] = *metadata.failure_reason;
        if (metadata.failed_at)
            meta["failedAt"] = *metadata.failed_at;

        return {
            {"id", id},
            {"createdBy", created_by},
            {"to", to},
            {"value", value},
            {"data", data.empty() ? nlohmann::json(nullptr) : nlohmann::json(data)},
            {"requiredSignatures", required_signatures},
            {"collectedSignatures", collected_signatures()},
            {"signatures", sigs},
            {"validatorIds", validator_ids},
            {"status", to_string(status)},
            {"createdAt", created_at},
            {"expiresAt", expires_at},
            {"executedAt", optional_json(executed_at)},
            {"transactionHash", optional_json(transaction_hash)},
            {"metadata", meta}};
    }

    Result<Proposal> Proposal::from_json(const nlohmann::json &j)
    {
        try
        {
            Proposal p;
            p.id = j.at("id").get<std::string>();
            p.created_by = j.at("createdBy").get<std::string>();
            p.to = j.at("to").get<std::string>();
            p.value = j.at("value").get<std::string>();
            p.data = optional_field<std::string>(j, "data").value_or("");
            p.required_signatures = j.at("requiredSignatures").get<std::size_t>();
            p.validator_ids = j.at("validatorIds").get<std::vector<std::string>>();

            auto status = proposal_status_from_string(j.at("status").get<std::string>());
            if (!status)
                return std::unexpected(status.error());
            p.status = *status;

            for (const auto &sj : j.value("signatures", nlohmann::json::array()))
            {
                auto sig = ProposalSignature::from_json(sj);
                if (!sig)
                    return std::unexpected(sig.error());
                p.signatures.push_back(std::move(*sig));
            }

            p.created_at = j.at("createdAt").get<Timestamp>();
            p.expires_at = j.at("expiresAt").get<Timestamp>();
            p.executed_at = optional_field<Timestamp>(j, "executedAt");
            p.transaction_hash = optional_field<std::string>(j, "transactionHash");

            auto meta = j.value("metadata", nlohmann::json::object());
            p.metadata.title = meta.value("title", "");
            p.metadata.description = meta.value("description", "");
            auto type = proposal_type_from_string(meta.value("type", "transfer"));
            if (!type)
                return std::unexpected(type.error());
            p.metadata.type = *type;
            p.metadata.failure_reason = optional_field<std::string>(meta, "failureReason");
            p.metadata.failed_at = optional_field<Timestamp>(meta, "failedAt");
            return p;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(CosignError::invalid_input(std::format("Malformed proposal: {}", e.what())));
        }
    }

} // namespace cosign
