#pragma once

#include "types.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cosign
{

    /**
     * Abstract key-value persistence for engine state. Records are JSON
     * documents addressed by (kind, key); kinds partition the keyspace
     * ("proposal", "proposal_signature", "validator", "signing_policy").
     */
    class StateStore
    {
    public:
        virtual ~StateStore() = default;

        /** Create or overwrite a record */
        virtual Result<void> put(std::string_view kind,
                                 std::string_view key,
                                 const nlohmann::json &value) = 0;

        /**
         * Create a record that must not exist yet.
         * Fails with AlreadyExists when the key is taken.
         */
        virtual Result<void> insert(std::string_view kind,
                                    std::string_view key,
                                    const nlohmann::json &value) = 0;

        virtual Result<std::optional<nlohmann::json>> get(std::string_view kind,
                                                          std::string_view key) = 0;

        /** Delete a record; deleting a missing key succeeds */
        virtual Result<void> erase(std::string_view kind, std::string_view key) = 0;

        /** All records of a kind, in key order */
        virtual Result<std::vector<nlohmann::json>> list(std::string_view kind) = 0;
    };

    class MemoryStateStore : public StateStore
    {
    public:
        Result<void> put(std::string_view kind, std::string_view key, const nlohmann::json &value) override;
        Result<void> insert(std::string_view kind, std::string_view key, const nlohmann::json &value) override;
        Result<std::optional<nlohmann::json>> get(std::string_view kind, std::string_view key) override;
        Result<void> erase(std::string_view kind, std::string_view key) override;
        Result<std::vector<nlohmann::json>> list(std::string_view kind) override;

    private:
        std::mutex mutex_;
        std::map<std::string, nlohmann::json> records_;
    };

    /**
     * RocksDB-backed StateStore with optional AES-256-GCM encryption at rest.
     * Keys are stored as "<kind>/<key>".
     */
    class RocksDbStateStore : public StateStore
    {
    public:
        RocksDbStateStore(const StorageConfig &cfg, std::optional<crypto::AESKey> encryption_key);
        ~RocksDbStateStore() override;

        Result<void> put(std::string_view kind, std::string_view key, const nlohmann::json &value) override;
        Result<void> insert(std::string_view kind, std::string_view key, const nlohmann::json &value) override;
        Result<std::optional<nlohmann::json>> get(std::string_view kind, std::string_view key) override;
        Result<void> erase(std::string_view kind, std::string_view key) override;
        Result<std::vector<nlohmann::json>> list(std::string_view kind) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

    /** Build the backend named by cfg.storage.backend */
    Result<std::shared_ptr<StateStore>> open_state_store(const CosignConfig &cfg);

} // namespace cosign
