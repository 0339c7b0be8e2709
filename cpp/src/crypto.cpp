#include "cosign/crypto.hpp"
#include <sodium.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstring>
#include <format>

using json = nlohmann::json;

namespace cosign::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    namespace
    {
        constexpr std::size_t kNonceLen = crypto_aead_aes256gcm_NPUBBYTES;
        constexpr std::size_t kTagLen = crypto_aead_aes256gcm_ABYTES;

        const unsigned char *bytes_of(const std::string &s)
        {
            return reinterpret_cast<const unsigned char *>(s.data());
        }

        template <std::size_t N>
        Result<std::array<uint8_t, N>> fixed_from_b64(const json &j, const char *field)
        {
            auto raw = Base64::decode(j.at(field).get<std::string>());
            if (!raw)
                return std::unexpected(raw.error());
            if (raw->size() != N)
                return std::unexpected(CosignError::crypto(std::format("{} must be {} bytes", field, N)));
            std::array<uint8_t, N> out;
            std::copy(raw->begin(), raw->end(), out.begin());
            return out;
        }
    } // namespace

    // ============================================================================
    // Ed25519KeyPair
    // ============================================================================

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519KeyPair kp;
        if (crypto_sign_keypair(kp.public_key.data(), kp.secret_key.data()) != 0)
            return std::unexpected(CosignError::crypto("Failed to generate Ed25519 keypair"));
        return kp;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const std::array<uint8_t, 32> &seed)
    {
        Ed25519KeyPair kp;
        if (crypto_sign_seed_keypair(kp.public_key.data(), kp.secret_key.data(), seed.data()) != 0)
            return std::unexpected(CosignError::crypto("Failed to derive Ed25519 keypair from seed"));
        return kp;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature sig;
        crypto_sign_detached(sig.data(), nullptr, message.data(), message.size(), secret_key.data());
        return sig;
    }

    bool Ed25519KeyPair::verify(const Bytes &message, const Ed25519Signature &signature,
                                const Ed25519PublicKey &public_key)
    {
        return crypto_sign_verify_detached(signature.data(), message.data(), message.size(), public_key.data()) == 0;
    }

    std::string Ed25519KeyPair::public_key_b64() const
    {
        return Base64::encode(Bytes(public_key.begin(), public_key.end()));
    }

    std::string Ed25519KeyPair::to_json() const
    {
        json j = {
            {"public_key", public_key_b64()},
            {"secret_key", Base64::encode(Bytes(secret_key.begin(), secret_key.end()))}};
        return j.dump(2);
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_json(const std::string &text)
    {
        json j;
        try
        {
            j = json::parse(text);
        }
        catch (const json::exception &e)
        {
            return std::unexpected(CosignError::crypto(std::format("Failed to parse keypair JSON: {}", e.what())));
        }
        if (!j.is_object() || !j.contains("public_key") || !j.contains("secret_key") ||
            !j["public_key"].is_string() || !j["secret_key"].is_string())
        {
            return std::unexpected(CosignError::crypto("Keypair JSON needs public_key and secret_key strings"));
        }

        auto pk = fixed_from_b64<32>(j, "public_key");
        if (!pk)
            return std::unexpected(pk.error());
        auto sk = fixed_from_b64<64>(j, "secret_key");
        if (!sk)
            return std::unexpected(sk.error());

        Ed25519PublicKey derived;
        crypto_sign_ed25519_sk_to_pk(derived.data(), sk->data());
        if (sodium_memcmp(derived.data(), pk->data(), derived.size()) != 0)
            return std::unexpected(CosignError::crypto("Public key does not match secret key"));

        Ed25519KeyPair kp;
        kp.public_key = *pk;
        kp.secret_key = *sk;
        return kp;
    }

    // ============================================================================
    // AES256GCM
    // ============================================================================

    Result<Bytes> AES256GCM::encrypt(const AESKey &key, const Bytes &plaintext, const Bytes &associated_data)
    {
        if (crypto_aead_aes256gcm_is_available() == 0)
            return std::unexpected(CosignError::crypto("AES-256-GCM not supported on this CPU"));

        Bytes sealed(kNonceLen + plaintext.size() + kTagLen);
        randombytes_buf(sealed.data(), kNonceLen);

        unsigned long long body_len = 0;
        auto rc = crypto_aead_aes256gcm_encrypt(sealed.data() + kNonceLen, &body_len,
                                                plaintext.data(), plaintext.size(),
                                                associated_data.data(), associated_data.size(),
                                                nullptr, sealed.data(), key.data());
        if (rc != 0)
            return std::unexpected(CosignError::crypto("AES-256-GCM encryption failed"));

        sealed.resize(kNonceLen + body_len);
        return sealed;
    }

    Result<Bytes> AES256GCM::decrypt(const AESKey &key, const Bytes &sealed, const Bytes &associated_data)
    {
        if (crypto_aead_aes256gcm_is_available() == 0)
            return std::unexpected(CosignError::crypto("AES-256-GCM not supported on this CPU"));
        if (sealed.size() < kNonceLen + kTagLen)
            return std::unexpected(CosignError::crypto("Ciphertext too short"));

        Bytes plain(sealed.size() - kNonceLen - kTagLen);
        unsigned long long plain_len = 0;
        auto rc = crypto_aead_aes256gcm_decrypt(plain.data(), &plain_len, nullptr,
                                                sealed.data() + kNonceLen, sealed.size() - kNonceLen,
                                                associated_data.data(), associated_data.size(),
                                                sealed.data(), key.data());
        if (rc != 0)
            return std::unexpected(CosignError::crypto("AES-256-GCM decryption failed (authentication failed)"));

        plain.resize(plain_len);
        return plain;
    }

    AESKey AES256GCM::generate_key()
    {
        AESKey key;
        crypto_aead_aes256gcm_keygen(key.data());
        return key;
    }

    // ============================================================================
    // SHA256 / HMAC
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash digest;
        crypto_hash_sha256(digest.data(), data.data(), data.size());
        return digest;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash digest;
        crypto_hash_sha256(digest.data(), bytes_of(data), data.size());
        return digest;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        char out[2 * std::tuple_size_v<SHA256Hash> + 1];
        sodium_bin2hex(out, sizeof(out), hash.data(), hash.size());
        return std::string(out, sizeof(out) - 1);
    }

    SHA256Hash HmacSha256::mac(const std::string &key, const std::string &message)
    {
        SHA256Hash tag;
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state, bytes_of(key), key.size());
        crypto_auth_hmacsha256_update(&state, bytes_of(message), message.size());
        crypto_auth_hmacsha256_final(&state, tag.data());
        sodium_memzero(&state, sizeof(state));
        return tag;
    }

    bool HmacSha256::equal(const SHA256Hash &a, const SHA256Hash &b)
    {
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    // ============================================================================
    // Base64
    // ============================================================================

    namespace
    {
        std::string encode_variant(const Bytes &data, int variant)
        {
            std::string out(sodium_base64_encoded_len(data.size(), variant), '\0');
            sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
            // drop the terminator
            out.resize(std::strlen(out.c_str()));
            return out;
        }

        Result<Bytes> decode_variant(const std::string &encoded, int variant)
        {
            Bytes out(encoded.size() * 3 / 4 + 3);
            size_t len = 0;
            const char *end = nullptr;
            if (sodium_base642bin(out.data(), out.size(), encoded.c_str(), encoded.size(),
                                  nullptr, &len, &end, variant) != 0 ||
                end != encoded.c_str() + encoded.size())
            {
                return std::unexpected(CosignError::crypto("Invalid base64 encoding"));
            }
            out.resize(len);
            return out;
        }
    } // namespace

    std::string Base64::encode(const Bytes &data)
    {
        return encode_variant(data, sodium_base64_VARIANT_ORIGINAL);
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        return decode_variant(encoded, sodium_base64_VARIANT_ORIGINAL);
    }

    std::string Base64::encode_url_safe(const Bytes &data)
    {
        return encode_variant(data, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    }

    Result<Bytes> Base64::decode_url_safe(const std::string &encoded)
    {
        return decode_variant(encoded, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    }

    // ============================================================================
    // SecureRandom
    // ============================================================================

    std::string SecureRandom::hex(size_t n)
    {
        Bytes raw(n);
        randombytes_buf(raw.data(), raw.size());
        std::string out(2 * n + 1, '\0');
        sodium_bin2hex(out.data(), out.size(), raw.data(), raw.size());
        out.pop_back();
        return out;
    }

} // namespace cosign::crypto
