#pragma once

#include "crypto.hpp"
#include "proposal.hpp"
#include "validator.hpp"
#include <string>

namespace cosign
{

    /** Checks one validator's signature over a proposal's canonical payload */
    class SignatureVerifier
    {
    public:
        virtual ~SignatureVerifier() = default;

        virtual bool verify(const std::string &payload,
                            const std::string &signature,
                            const Validator &validator) const = 0;
    };

    /**
     * Ed25519 via libsodium. Social and hardware validators sign the
     * payload bytes; passkeys sign the SHA-256 digest of the payload,
     * which is the challenge form a WebAuthn ceremony produces.
     */
    class SodiumSignatureVerifier : public SignatureVerifier
    {
    public:
        bool verify(const std::string &payload,
                    const std::string &signature,
                    const Validator &validator) const override;

        /** The exact bytes a validator of this kind must sign */
        static crypto::Bytes signing_input(const std::string &payload, ValidatorKind kind);
    };

} // namespace cosign
