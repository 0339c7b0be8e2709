#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

namespace cosign
{

    struct ServerConfig
    {
        std::uint16_t port{8080};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
        double rate_limit_tokens_per_second{1.0};
        double rate_limit_burst{60.0};
    };

    struct StorageConfig
    {
        std::string backend{"rocksdb"}; // "rocksdb" | "memory"
        std::string rocksdb_path{"./data/cosign"};
        bool encrypt_at_rest{false};
    };

    struct SigningConfig
    {
        std::int64_t freshness_window_secs{24 * 60 * 60};
        std::int64_t default_ttl_secs{24 * 60 * 60};
    };

    struct SweeperConfig
    {
        std::int64_t interval_secs{60};
    };

    struct NotificationConfig
    {
        std::size_t history_limit{50};
        std::size_t resync_limit{20};
        bool notify_creator{true};
    };

    struct GasConfig
    {
        std::uint64_t call_gas{100000};
        std::uint64_t verification_gas_per_signature{25000};
        std::uint64_t pre_verification_gas{25000};
        std::uint64_t gas_price_wei{20000000000ULL}; // 20 gwei
    };

    struct AuthConfig
    {
        std::string token_secret{"dev-secret-key"};
        std::int64_t token_ttl_secs{24 * 60 * 60};
    };

    struct CosignConfig
    {
        std::string log_level{"info"};
        ServerConfig server{};
        StorageConfig storage{};
        SigningConfig signing{};
        SweeperConfig sweeper{};
        NotificationConfig notifications{};
        GasConfig gas{};
        AuthConfig auth{};
        std::optional<crypto::AESKey> encryption_key; // COSIGN_ENCRYPTION_KEY
    };

    /**
     * ConfigLoader reads a TOML document, applies COSIGN_* environment
     * overrides, and unlocks the optional AES-256-GCM `[secrets]` block
     * when an encryption key is present.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<CosignConfig> load(const std::string &path);

        static Result<CosignConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, for running without a file */
        static CosignConfig defaults();

        /** Effective config as JSON, secrets omitted */
        static nlohmann::json to_json(const CosignConfig &cfg);

        /** Encrypt an inner TOML document for the `[secrets] ciphertext` field */
        static Result<std::string> seal_secrets(const std::string &toml_content,
                                                const crypto::AESKey &key);

        static Result<std::string> open_secrets(const std::string &cipher_b64,
                                                const crypto::AESKey &key);

    private:
        static Result<void> apply_env_overrides(CosignConfig &cfg);
    };

} // namespace cosign
