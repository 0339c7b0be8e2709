#include "cosign/validator.hpp"
#include <format>

namespace cosign
{

    std::string_view to_string(ValidatorKind kind)
    {
        switch (kind)
        {
        case ValidatorKind::Social:
            return "social";
        case ValidatorKind::Passkey:
            return "passkey";
        case ValidatorKind::Hardware:
            return "hardware";
        }
        return "unknown";
    }

    Result<ValidatorKind> validator_kind_from_string(std::string_view s)
    {
        if (s == "social")
            return ValidatorKind::Social;
        if (s == "passkey")
            return ValidatorKind::Passkey;
        if (s == "hardware")
            return ValidatorKind::Hardware;
        return std::unexpected(CosignError::invalid_input(std::format("Invalid validator kind: {}", s)));
    }

    namespace
    {
        struct DetailsToJson
        {
            nlohmann::json operator()(const SocialIdentity &s) const
            {
                return {{"email", s.email},
                        {"provider", s.provider},
                        {"publicAddress", s.public_address},
                        {"issuer", s.issuer}};
            }

            nlohmann::json operator()(const PasskeyCredential &p) const
            {
                return {{"credentialId", p.credential_id},
                        {"authenticatorId", p.authenticator_id},
                        {"passkeyName", p.passkey_name}};
            }

            nlohmann::json operator()(const HardwareKey &h) const
            {
                return {{"deviceModel", h.device_model}, {"serial", h.serial}};
            }
        };

        ValidatorDetails details_from_json(ValidatorKind kind, const nlohmann::json &m)
        {
            switch (kind)
            {
            case ValidatorKind::Social:
                return SocialIdentity{m.value("email", ""),
                                      m.value("provider", ""),
                                      m.value("publicAddress", ""),
                                      m.value("issuer", "")};
            case ValidatorKind::Passkey:
                return PasskeyCredential{m.value("credentialId", ""),
                                         m.value("authenticatorId", ""),
                                         m.value("passkeyName", "")};
            case ValidatorKind::Hardware:
                return HardwareKey{m.value("deviceModel", ""), m.value("serial", "")};
            }
            return SocialIdentity{};
        }
    } // namespace

    ValidatorKind Validator::kind() const
    {
        return static_cast<ValidatorKind>(details.index());
    }

    std::string Validator::signer_identity() const
    {
        if (auto social = std::get_if<SocialIdentity>(&details); social && !social->public_address.empty())
            return social->public_address;
        return id;
    }

    nlohmann::json Validator::to_json() const
    {
        nlohmann::json j = {
            {"id", id},
            {"owner", owner},
            {"type", to_string(kind())},
            {"name", name},
            {"publicKey", public_key},
            {"metadata", std::visit(DetailsToJson{}, details)},
            {"isActive", is_active},
            {"createdAt", created_at}};
        j["lastUsed"] = last_used ? nlohmann::json(*last_used) : nlohmann::json(nullptr);
        return j;
    }

    Result<Validator> Validator::from_json(const nlohmann::json &j)
    {
        try
        {
            auto kind = validator_kind_from_string(j.at("type").get<std::string>());
            if (!kind)
                return std::unexpected(kind.error());

            Validator v;
            v.id = j.at("id").get<std::string>();
            v.owner = j.value("owner", "");
            v.name = j.value("name", "");
            v.public_key = j.value("publicKey", "");
            v.details = details_from_json(*kind, j.value("metadata", nlohmann::json::object()));
            v.is_active = j.value("isActive", true);
            v.created_at = j.value("createdAt", Timestamp{0});
            if (j.contains("lastUsed") && !j["lastUsed"].is_null())
                v.last_used = j["lastUsed"].get<Timestamp>();

            if (v.id.empty())
                return std::unexpected(CosignError::invalid_input("validator id must not be empty"));
            return v;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(CosignError::invalid_input(std::format("Malformed validator: {}", e.what())));
        }
    }

    nlohmann::json SigningPolicy::to_json() const
    {
        nlohmann::json j = {
            {"requireMultiSig", require_multi_sig},
            {"threshold", threshold},
            {"allowedOperations", allowed_operations}};
        j["highValueThreshold"] = high_value_threshold ? nlohmann::json(*high_value_threshold) : nlohmann::json(nullptr);
        j["timeDelay"] = time_delay_secs ? nlohmann::json(*time_delay_secs) : nlohmann::json(nullptr);
        return j;
    }

    Result<SigningPolicy> SigningPolicy::from_json(const nlohmann::json &j)
    {
        try
        {
            SigningPolicy p;
            p.require_multi_sig = j.value("requireMultiSig", false);

            auto threshold = j.at("threshold").get<std::int64_t>();
            if (threshold < 0)
                return std::unexpected(CosignError::invalid_threshold("Threshold must be at least 1"));
            p.threshold = static_cast<std::size_t>(threshold);

            if (j.contains("highValueThreshold") && !j["highValueThreshold"].is_null())
            {
                auto hv = j["highValueThreshold"].get<std::string>();
                if (auto parsed = parse_amount(hv); !parsed)
                    return std::unexpected(parsed.error());
                p.high_value_threshold = hv;
            }
            if (j.contains("timeDelay") && !j["timeDelay"].is_null())
                p.time_delay_secs = j["timeDelay"].get<std::int64_t>();
            if (j.contains("allowedOperations"))
                p.allowed_operations = j["allowedOperations"].get<std::vector<std::string>>();
            return p;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(CosignError::invalid_input(std::format("Malformed signing policy: {}", e.what())));
        }
    }

} // namespace cosign
