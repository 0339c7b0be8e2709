#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cosign
{

    enum class ValidatorKind
    {
        Social,
        Passkey,
        Hardware
    };

    std::string_view to_string(ValidatorKind kind);
    Result<ValidatorKind> validator_kind_from_string(std::string_view s);

    /** Social login key (identity-provider backed) */
    struct SocialIdentity
    {
        std::string email;
        std::string provider; // google | github | twitter | discord | email
        std::string public_address;
        std::string issuer;
    };

    /** Device passkey (WebAuthn credential) */
    struct PasskeyCredential
    {
        std::string credential_id;
        std::string authenticator_id;
        std::string passkey_name;
    };

    struct HardwareKey
    {
        std::string device_model;
        std::string serial;
    };

    /** Kind-specific validator data; the active alternative determines the kind */
    using ValidatorDetails = std::variant<SocialIdentity, PasskeyCredential, HardwareKey>;

    /**
     * One authentication factor authorized to sign for the account.
     * After creation only last_used and is_active ever change.
     */
    struct Validator
    {
        std::string id;
        std::string owner; // user id controlling this factor
        std::string name;
        std::string public_key; // base64 Ed25519 public key
        ValidatorDetails details;
        bool is_active{true};
        Timestamp created_at{0};
        std::optional<Timestamp> last_used;

        ValidatorKind kind() const;

        /** Signer identity recorded in aggregates: public address for social keys, else the id */
        std::string signer_identity() const;

        nlohmann::json to_json() const;
        static Result<Validator> from_json(const nlohmann::json &j);
    };

    struct SigningPolicy
    {
        bool require_multi_sig{false};
        std::size_t threshold{1};
        std::optional<std::string> high_value_threshold; // decimal amount
        std::optional<std::int64_t> time_delay_secs;
        std::vector<std::string> allowed_operations; // empty means all

        nlohmann::json to_json() const;
        static Result<SigningPolicy> from_json(const nlohmann::json &j);
    };

} // namespace cosign
