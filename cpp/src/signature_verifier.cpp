#include "cosign/signature_verifier.hpp"
#include "cosign/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace cosign
{

    crypto::Bytes SodiumSignatureVerifier::signing_input(const std::string &payload, ValidatorKind kind)
    {
        if (kind == ValidatorKind::Passkey)
        {
            auto digest = crypto::SHA256::hash(payload);
            return crypto::Bytes(digest.begin(), digest.end());
        }
        return crypto::Bytes(payload.begin(), payload.end());
    }

    bool SodiumSignatureVerifier::verify(const std::string &payload,
                                         const std::string &signature,
                                         const Validator &validator) const
    {
        auto pk_bytes = crypto::Base64::decode(validator.public_key);
        if (!pk_bytes || pk_bytes->size() != 32)
        {
            spdlog::warn("validator {} has an unusable public key", validator.id);
            return false;
        }
        auto sig_bytes = crypto::Base64::decode(signature);
        if (!sig_bytes || sig_bytes->size() != 64)
            return false;

        crypto::Ed25519PublicKey pk;
        crypto::Ed25519Signature sig;
        std::copy(pk_bytes->begin(), pk_bytes->end(), pk.begin());
        std::copy(sig_bytes->begin(), sig_bytes->end(), sig.begin());

        return crypto::Ed25519KeyPair::verify(signing_input(payload, validator.kind()), sig, pk);
    }

} // namespace cosign
