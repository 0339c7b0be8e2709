#include "cosign/state_store.hpp"
#include "cosign/crypto.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <spdlog/spdlog.h>
#include <format>
#include <stdexcept>

namespace cosign
{
    namespace
    {
        std::string compose_key(std::string_view kind, std::string_view key)
        {
            return std::format("{}/{}", kind, key);
        }

        std::string kind_prefix(std::string_view kind)
        {
            return std::format("{}/", kind);
        }
    } // namespace

    // ============================================================================
    // MemoryStateStore
    // ============================================================================

    Result<void> MemoryStateStore::put(std::string_view kind, std::string_view key, const nlohmann::json &value)
    {
        std::lock_guard lock(mutex_);
        records_[compose_key(kind, key)] = value;
        return {};
    }

    Result<void> MemoryStateStore::insert(std::string_view kind, std::string_view key, const nlohmann::json &value)
    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = records_.try_emplace(compose_key(kind, key), value);
        if (!inserted)
        {
            return std::unexpected(CosignError::already_exists(std::format("{} already exists", it->first)));
        }
        return {};
    }

    Result<std::optional<nlohmann::json>> MemoryStateStore::get(std::string_view kind, std::string_view key)
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(compose_key(kind, key));
        if (it == records_.end())
            return std::optional<nlohmann::json>{};
        return std::optional<nlohmann::json>(it->second);
    }

    Result<void> MemoryStateStore::erase(std::string_view kind, std::string_view key)
    {
        std::lock_guard lock(mutex_);
        records_.erase(compose_key(kind, key));
        return {};
    }

    Result<std::vector<nlohmann::json>> MemoryStateStore::list(std::string_view kind)
    {
        std::vector<nlohmann::json> out;
        auto prefix = kind_prefix(kind);
        std::lock_guard lock(mutex_);
        for (auto it = records_.lower_bound(prefix); it != records_.end() && it->first.starts_with(prefix); ++it)
        {
            out.push_back(it->second);
        }
        return out;
    }

    // ============================================================================
    // RocksDbStateStore
    // ============================================================================

    class RocksDbStateStore::Impl
    {
    public:
        Impl(const StorageConfig &cfg, std::optional<crypto::AESKey> key)
            : encrypt_at_rest(cfg.encrypt_at_rest),
              encryption_key(std::move(key))
        {
            if (encrypt_at_rest && !encryption_key)
            {
                throw std::runtime_error("encrypt_at_rest enabled but no encryption key configured");
            }

            rocksdb::Options options;
            options.create_if_missing = true;
            rocksdb::DB *raw = nullptr;
            auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &raw);
            if (!status.ok())
            {
                throw std::runtime_error("RocksDB open failed: " + status.ToString());
            }
            db.reset(raw);
            spdlog::info("state store opened at {} (encrypt_at_rest={})", cfg.rocksdb_path, encrypt_at_rest);
        }

        // The row key is the associated data, so a sealed value only opens under its own key
        Result<std::string> encode(const std::string &key, const nlohmann::json &value) const
        {
            auto json = value.dump();
            if (!encrypt_at_rest)
                return json;
            auto cipher = crypto::AES256GCM::encrypt(*encryption_key, crypto::Bytes(json.begin(), json.end()),
                                                     crypto::Bytes(key.begin(), key.end()));
            if (!cipher)
                return std::unexpected(cipher.error());
            return crypto::Base64::encode(*cipher);
        }

        Result<nlohmann::json> decode(const std::string &key, const std::string &stored) const
        {
            std::string raw = stored;
            if (encrypt_at_rest)
            {
                auto cipher = crypto::Base64::decode(raw);
                if (!cipher)
                    return std::unexpected(cipher.error());
                auto plain = crypto::AES256GCM::decrypt(*encryption_key, *cipher, crypto::Bytes(key.begin(), key.end()));
                if (!plain)
                    return std::unexpected(plain.error());
                raw.assign(plain->begin(), plain->end());
            }

            auto parsed = nlohmann::json::parse(raw, nullptr, false);
            if (parsed.is_discarded())
                return std::unexpected(CosignError::storage("stored record is not valid JSON"));
            return parsed;
        }

        Result<void> write(const std::string &key, const nlohmann::json &value)
        {
            auto encoded = encode(key, value);
            if (!encoded)
                return std::unexpected(encoded.error());
            auto status = db->Put(rocksdb::WriteOptions(), key, *encoded);
            if (!status.ok())
            {
                return std::unexpected(CosignError::storage("RocksDB Put failed: " + status.ToString()));
            }
            return {};
        }

        Result<std::optional<std::string>> read(const std::string &key)
        {
            std::string value;
            auto status = db->Get(rocksdb::ReadOptions(), key, &value);
            if (status.IsNotFound())
                return std::optional<std::string>{};
            if (!status.ok())
                return std::unexpected(CosignError::storage("RocksDB Get failed: " + status.ToString()));
            return std::optional<std::string>(std::move(value));
        }

        std::unique_ptr<rocksdb::DB> db;
        // Serializes insert's read-then-write
        std::mutex insert_mutex;
        bool encrypt_at_rest{false};
        std::optional<crypto::AESKey> encryption_key;
    };

    RocksDbStateStore::RocksDbStateStore(const StorageConfig &cfg, std::optional<crypto::AESKey> encryption_key)
        : impl_(std::make_unique<Impl>(cfg, std::move(encryption_key)))
    {
    }

    RocksDbStateStore::~RocksDbStateStore() = default;

    Result<void> RocksDbStateStore::put(std::string_view kind, std::string_view key, const nlohmann::json &value)
    {
        return impl_->write(compose_key(kind, key), value);
    }

    Result<void> RocksDbStateStore::insert(std::string_view kind, std::string_view key, const nlohmann::json &value)
    {
        auto full = compose_key(kind, key);
        std::lock_guard lock(impl_->insert_mutex);
        auto existing = impl_->read(full);
        if (!existing)
            return std::unexpected(existing.error());
        if (existing->has_value())
            return std::unexpected(CosignError::already_exists(std::format("{} already exists", full)));
        return impl_->write(full, value);
    }

    Result<std::optional<nlohmann::json>> RocksDbStateStore::get(std::string_view kind, std::string_view key)
    {
        auto full = compose_key(kind, key);
        auto raw = impl_->read(full);
        if (!raw)
            return std::unexpected(raw.error());
        if (!raw->has_value())
            return std::optional<nlohmann::json>{};
        auto decoded = impl_->decode(full, **raw);
        if (!decoded)
            return std::unexpected(decoded.error());
        return std::optional<nlohmann::json>(std::move(*decoded));
    }

    Result<void> RocksDbStateStore::erase(std::string_view kind, std::string_view key)
    {
        auto full = compose_key(kind, key);
        auto status = impl_->db->Delete(rocksdb::WriteOptions(), full);
        if (!status.ok())
            return std::unexpected(CosignError::storage("RocksDB Delete failed: " + status.ToString()));
        return {};
    }

    Result<std::vector<nlohmann::json>> RocksDbStateStore::list(std::string_view kind)
    {
        std::vector<nlohmann::json> out;
        auto prefix = kind_prefix(kind);

        std::unique_ptr<rocksdb::Iterator> it(impl_->db->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next())
        {
            auto decoded = impl_->decode(it->key().ToString(), it->value().ToString());
            if (!decoded)
            {
                spdlog::warn("skipping unreadable record {}: {}", it->key().ToString(), decoded.error().what());
                continue;
            }
            out.push_back(std::move(*decoded));
        }
        if (!it->status().ok())
        {
            return std::unexpected(CosignError::storage("RocksDB iteration failed: " + it->status().ToString()));
        }
        return out;
    }

    Result<std::shared_ptr<StateStore>> open_state_store(const CosignConfig &cfg)
    {
        if (cfg.storage.backend == "memory")
        {
            return std::shared_ptr<StateStore>(std::make_shared<MemoryStateStore>());
        }
        if (cfg.storage.backend != "rocksdb")
        {
            return std::unexpected(CosignError::config("unknown storage backend: " + cfg.storage.backend));
        }

        try
        {
            return std::shared_ptr<StateStore>(std::make_shared<RocksDbStateStore>(cfg.storage, cfg.encryption_key));
        }
        catch (const std::exception &e)
        {
            return std::unexpected(CosignError::storage(e.what()));
        }
    }

} // namespace cosign
