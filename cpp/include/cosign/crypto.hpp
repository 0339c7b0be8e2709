#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace cosign::crypto
{

    using Bytes = std::vector<uint8_t>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using AESKey = std::array<uint8_t, 32>;

    /**
     * Ed25519 key pair. Validators hold the secret half on their device;
     * the engine only ever sees public keys, but the key pair is used by
     * the CLI to simulate devices and by the tests.
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        static Result<Ed25519KeyPair> generate();

        /** Deterministic key pair from a 32-byte seed */
        static Result<Ed25519KeyPair> from_seed(const std::array<uint8_t, 32> &seed);

        Ed25519Signature sign(const Bytes &message) const;

        static bool verify(
            const Bytes &message,
            const Ed25519Signature &signature,
            const Ed25519PublicKey &public_key);

        /** Base64 public key, the form stored on a Validator */
        std::string public_key_b64() const;

        /** {"public_key": b64, "secret_key": b64}, the CLI key file format */
        std::string to_json() const;

        /** Rejects files whose public key does not belong to the secret key */
        static Result<Ed25519KeyPair> from_json(const std::string &json);
    };

    /**
     * AES-256-GCM sealing for state store rows and the config secrets
     * block. A sealed value is [12-byte nonce][ciphertext][16-byte tag];
     * associated data must match between encrypt and decrypt.
     */
    class AES256GCM
    {
    public:
        static Result<Bytes> encrypt(const AESKey &key, const Bytes &plaintext, const Bytes &associated_data = {});

        static Result<Bytes> decrypt(const AESKey &key, const Bytes &sealed, const Bytes &associated_data = {});

        static AESKey generate_key();
    };

    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(const std::string &data);

        static std::string to_hex(const SHA256Hash &hash);
    };

    /** HMAC-SHA-256, used for bearer token signatures */
    class HmacSha256
    {
    public:
        static SHA256Hash mac(const std::string &key, const std::string &message);

        /** Constant-time comparison of two MACs */
        static bool equal(const SHA256Hash &a, const SHA256Hash &b);
    };

    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &encoded);

        /** URL-safe alphabet, no padding */
        static std::string encode_url_safe(const Bytes &data);

        static Result<Bytes> decode_url_safe(const std::string &encoded);
    };

    /** Random identifiers for proposals, validators, notifications and connections */
    class SecureRandom
    {
    public:
        /** n random bytes rendered as 2n lowercase hex characters */
        static std::string hex(size_t n);
    };

} // namespace cosign::crypto
