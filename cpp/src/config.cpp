#include "cosign/config.hpp"
#include <toml++/toml.h>
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cosign
{
    namespace
    {
        std::optional<crypto::AESKey> env_encryption_key()
        {
            const char *env = std::getenv("COSIGN_ENCRYPTION_KEY");
            if (!env)
                return std::nullopt;
            auto decoded = crypto::Base64::decode(env);
            if (!decoded || decoded->size() != 32)
                return std::nullopt;
            crypto::AESKey key{};
            std::copy_n(decoded->begin(), 32, key.begin());
            return key;
        }

        template <typename T>
        Result<T> env_number(const char *name, const char *value)
        {
            T out{};
            std::string_view sv(value);
            auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
            if (ec != std::errc{} || ptr != sv.data() + sv.size())
            {
                return std::unexpected(CosignError::config(std::string("Invalid numeric value for ") + name + ": " + value));
            }
            return out;
        }

        template <typename T>
        void read_unsigned(const toml::table &tbl, std::string_view key, T &out)
        {
            if (auto v = tbl[key].value<int64_t>(); v && *v >= 0)
                out = static_cast<T>(*v);
        }

        CosignConfig parse_toml(const toml::table &tbl, CosignConfig cfg)
        {
            if (auto log = tbl["log"].as_table())
            {
                if (auto level = (*log)["level"].value<std::string>())
                    cfg.log_level = *level;
            }

            if (auto server = tbl["server"].as_table())
            {
                read_unsigned(*server, "port", cfg.server.port);
                read_unsigned(*server, "threads", cfg.server.threads);
                if (auto rl = (*server)["rate_limit"].as_table())
                {
                    if (auto rps = (*rl)["tokens_per_second"].value<double>())
                        cfg.server.rate_limit_tokens_per_second = *rps;
                    if (auto burst = (*rl)["burst"].value<double>())
                        cfg.server.rate_limit_burst = *burst;
                }
            }

            if (auto storage = tbl["storage"].as_table())
            {
                if (auto backend = (*storage)["backend"].value<std::string>())
                    cfg.storage.backend = *backend;
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
                if (auto enc = (*storage)["encrypt_at_rest"].value<bool>())
                    cfg.storage.encrypt_at_rest = *enc;
            }

            if (auto signing = tbl["signing"].as_table())
            {
                read_unsigned(*signing, "freshness_window_secs", cfg.signing.freshness_window_secs);
                read_unsigned(*signing, "default_ttl_secs", cfg.signing.default_ttl_secs);
            }

            if (auto sweeper = tbl["sweeper"].as_table())
            {
                read_unsigned(*sweeper, "interval_secs", cfg.sweeper.interval_secs);
            }

            if (auto notif = tbl["notifications"].as_table())
            {
                read_unsigned(*notif, "history_limit", cfg.notifications.history_limit);
                read_unsigned(*notif, "resync_limit", cfg.notifications.resync_limit);
                if (auto nc = (*notif)["notify_creator"].value<bool>())
                    cfg.notifications.notify_creator = *nc;
            }

            if (auto gas = tbl["gas"].as_table())
            {
                read_unsigned(*gas, "call_gas", cfg.gas.call_gas);
                read_unsigned(*gas, "verification_gas_per_signature", cfg.gas.verification_gas_per_signature);
                read_unsigned(*gas, "pre_verification_gas", cfg.gas.pre_verification_gas);
                read_unsigned(*gas, "gas_price_wei", cfg.gas.gas_price_wei);
            }

            if (auto auth = tbl["auth"].as_table())
            {
                if (auto secret = (*auth)["token_secret"].value<std::string>())
                    cfg.auth.token_secret = *secret;
                read_unsigned(*auth, "token_ttl_secs", cfg.auth.token_ttl_secs);
            }

            // Encrypted secrets block: secrets.ciphertext is base64 of an AES-GCM sealed TOML document
            if (auto secrets = tbl["secrets"].as_table())
            {
                if (auto cipher_b64 = (*secrets)["ciphertext"].value<std::string>(); cipher_b64 && cfg.encryption_key)
                {
                    auto inner = ConfigLoader::open_secrets(*cipher_b64, *cfg.encryption_key);
                    if (inner)
                    {
                        auto inner_tbl = toml::parse(*inner);
                        cfg = parse_toml(inner_tbl, cfg);
                    }
                }
            }

            return cfg;
        }

        Result<void> validate(const CosignConfig &cfg)
        {
            if (cfg.storage.backend != "rocksdb" && cfg.storage.backend != "memory")
                return std::unexpected(CosignError::config("storage.backend must be 'rocksdb' or 'memory'"));
            if (cfg.storage.encrypt_at_rest && !cfg.encryption_key)
                return std::unexpected(CosignError::config("storage.encrypt_at_rest requires COSIGN_ENCRYPTION_KEY"));
            if (cfg.signing.freshness_window_secs <= 0)
                return std::unexpected(CosignError::config("signing.freshness_window_secs must be positive"));
            if (cfg.signing.default_ttl_secs <= 0)
                return std::unexpected(CosignError::config("signing.default_ttl_secs must be positive"));
            if (cfg.sweeper.interval_secs <= 0)
                return std::unexpected(CosignError::config("sweeper.interval_secs must be positive"));
            if (cfg.server.threads == 0)
                return std::unexpected(CosignError::config("server.threads must be at least 1"));
            if (cfg.auth.token_secret.empty())
                return std::unexpected(CosignError::config("auth.token_secret must not be empty"));
            return {};
        }

    } // namespace

    CosignConfig ConfigLoader::defaults()
    {
        CosignConfig cfg{};
        cfg.encryption_key = env_encryption_key();
        // Numeric env overrides that fail to parse leave the default in place here
        (void)apply_env_overrides(cfg);
        return cfg;
    }

    Result<CosignConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(CosignError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<CosignConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        CosignConfig cfg{};
        cfg.encryption_key = env_encryption_key();

        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl, cfg);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(CosignError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(CosignConfig &cfg)
    {
        if (const char *level = std::getenv("COSIGN_LOG_LEVEL"))
            cfg.log_level = level;
        if (const char *port = std::getenv("COSIGN_PORT"))
        {
            auto v = env_number<std::uint16_t>("COSIGN_PORT", port);
            if (!v)
                return std::unexpected(v.error());
            cfg.server.port = *v;
        }
        if (const char *backend = std::getenv("COSIGN_STORAGE_BACKEND"))
            cfg.storage.backend = backend;
        if (const char *path = std::getenv("COSIGN_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;
        if (const char *enc = std::getenv("COSIGN_ENCRYPT_AT_REST"))
            cfg.storage.encrypt_at_rest = std::string(enc) != "0";
        if (const char *window = std::getenv("COSIGN_FRESHNESS_WINDOW_SECS"))
        {
            auto v = env_number<std::int64_t>("COSIGN_FRESHNESS_WINDOW_SECS", window);
            if (!v)
                return std::unexpected(v.error());
            cfg.signing.freshness_window_secs = *v;
        }
        if (const char *interval = std::getenv("COSIGN_SWEEP_INTERVAL_SECS"))
        {
            auto v = env_number<std::int64_t>("COSIGN_SWEEP_INTERVAL_SECS", interval);
            if (!v)
                return std::unexpected(v.error());
            cfg.sweeper.interval_secs = *v;
        }
        if (const char *secret = std::getenv("COSIGN_TOKEN_SECRET"))
            cfg.auth.token_secret = secret;

        if (!cfg.encryption_key)
        {
            cfg.encryption_key = env_encryption_key();
        }
        return {};
    }

    Result<std::string> ConfigLoader::seal_secrets(const std::string &toml_content,
                                                   const crypto::AESKey &key)
    {
        auto cipher = crypto::AES256GCM::encrypt(key, crypto::Bytes(toml_content.begin(), toml_content.end()));
        if (!cipher)
            return std::unexpected(cipher.error());
        return crypto::Base64::encode(*cipher);
    }

    Result<std::string> ConfigLoader::open_secrets(const std::string &cipher_b64,
                                                   const crypto::AESKey &key)
    {
        auto cipher = crypto::Base64::decode(cipher_b64);
        if (!cipher)
            return std::unexpected(cipher.error());
        auto plain = crypto::AES256GCM::decrypt(key, *cipher);
        if (!plain)
            return std::unexpected(plain.error());
        return std::string(plain->begin(), plain->end());
    }

    nlohmann::json ConfigLoader::to_json(const CosignConfig &cfg)
    {
        nlohmann::json j;
        j["log"] = {{"level", cfg.log_level}};
        j["server"] = {
            {"port", cfg.server.port},
            {"threads", cfg.server.threads},
            {"rate_limit", {{"tokens_per_second", cfg.server.rate_limit_tokens_per_second},
                            {"burst", cfg.server.rate_limit_burst}}}};
        j["storage"] = {
            {"backend", cfg.storage.backend},
            {"rocksdb_path", cfg.storage.rocksdb_path},
            {"encrypt_at_rest", cfg.storage.encrypt_at_rest}};
        j["signing"] = {
            {"freshness_window_secs", cfg.signing.freshness_window_secs},
            {"default_ttl_secs", cfg.signing.default_ttl_secs}};
        j["sweeper"] = {{"interval_secs", cfg.sweeper.interval_secs}};
        j["notifications"] = {
            {"history_limit", cfg.notifications.history_limit},
            {"resync_limit", cfg.notifications.resync_limit},
            {"notify_creator", cfg.notifications.notify_creator}};
        j["gas"] = {
            {"call_gas", cfg.gas.call_gas},
            {"verification_gas_per_signature", cfg.gas.verification_gas_per_signature},
            {"pre_verification_gas", cfg.gas.pre_verification_gas},
            {"gas_price_wei", cfg.gas.gas_price_wei}};
        j["auth"] = {{"token_ttl_secs", cfg.auth.token_ttl_secs}};
        j["has_encryption_key"] = cfg.encryption_key.has_value();
        return j;
    }

} // namespace cosign
