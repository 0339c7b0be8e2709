#include "cosign/validator_registry.hpp"
#include "cosign/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <mutex>

namespace cosign
{

    namespace
    {
        constexpr std::string_view kValidatorKind = "validator";
        constexpr std::string_view kPolicyKind = "signing_policy";
        constexpr std::string_view kPolicyKey = "current";

        Result<void> check_public_key(const std::string &public_key)
        {
            auto decoded = crypto::Base64::decode(public_key);
            if (!decoded)
                return std::unexpected(CosignError::invalid_input("public key is not valid base64"));
            if (decoded->size() != 32)
                return std::unexpected(CosignError::invalid_input("Invalid public key length (expected 32 bytes)"));
            return {};
        }
    } // namespace

    ValidatorRegistry::ValidatorRegistry(std::shared_ptr<StateStore> store,
                                         std::shared_ptr<const Clock> clock,
                                         std::shared_ptr<AuditTrail> audit)
        : store_(std::move(store)),
          clock_(std::move(clock)),
          audit_(std::move(audit))
    {
        if (auto loaded = reload(); !loaded)
        {
            spdlog::error("validator registry reload failed: {}", loaded.error().what());
        }
    }

    Result<Validator> ValidatorRegistry::bootstrap(Validator primary)
    {
        if (primary.kind() != ValidatorKind::Social)
            return std::unexpected(CosignError::invalid_input("the primary validator must be a social login"));
        if (auto key = check_public_key(primary.public_key); !key)
            return std::unexpected(key.error());

        std::unique_lock lock(mutex_);
        if (active_count_locked() != 0)
            return std::unexpected(CosignError::already_exists("account already has validators"));
        if (validators_.contains(primary.id))
            return std::unexpected(CosignError::already_exists(std::format("validator {} already exists", primary.id)));

        primary.is_active = true;
        if (primary.created_at == 0)
            primary.created_at = clock_->now_ms();
        primary.last_used = primary.created_at;

        SigningPolicy policy{};
        policy.allowed_operations = {"all"};

        if (auto res = persist_validator(primary); !res)
            return std::unexpected(res.error());
        if (auto res = persist_policy(policy); !res)
            return std::unexpected(res.error());

        validators_.emplace(primary.id, primary);
        order_.push_back(primary.id);
        policy_ = policy;
        lock.unlock();

        record("validator.bootstrapped", primary.id, {{"owner", primary.owner}});
        return primary;
    }

    Result<Validator> ValidatorRegistry::add(Validator validator)
    {
        if (validator.id.empty())
        {
            validator.id = std::format("{}_{}", to_string(validator.kind()), crypto::SecureRandom::hex(8));
        }
        if (auto key = check_public_key(validator.public_key); !key)
            return std::unexpected(key.error());

        std::unique_lock lock(mutex_);
        if (validators_.contains(validator.id))
        {
            return std::unexpected(CosignError::already_exists(std::format("validator {} already exists", validator.id)));
        }

        validator.is_active = true;
        if (validator.created_at == 0)
            validator.created_at = clock_->now_ms();

        auto active = active_count_locked() + 1;
        SigningPolicy next = policy_;
        if (active > 1 && !next.require_multi_sig)
        {
            next.require_multi_sig = true;
            next.threshold = std::min<std::size_t>(2, active);
        }

        if (auto res = persist_validator(validator); !res)
            return std::unexpected(res.error());
        if (next.threshold != policy_.threshold || next.require_multi_sig != policy_.require_multi_sig)
        {
            if (auto res = persist_policy(next); !res)
                return std::unexpected(res.error());
        }

        validators_.emplace(validator.id, validator);
        order_.push_back(validator.id);
        policy_ = next;
        lock.unlock();

        record("validator.added", validator.id,
               {{"type", to_string(validator.kind())}, {"owner", validator.owner}, {"threshold", next.threshold}});
        return validator;
    }

    Result<void> ValidatorRegistry::remove(std::string_view id)
    {
        std::unique_lock lock(mutex_);
        auto it = validators_.find(std::string(id));
        if (it == validators_.end() || !it->second.is_active)
        {
            return std::unexpected(CosignError::not_found(std::format("validator {} not found", id)));
        }

        auto active = active_count_locked();
        if (active <= 1)
        {
            return std::unexpected(CosignError::last_validator("Cannot remove the last signer"));
        }

        Validator updated = it->second;
        updated.is_active = false;

        auto remaining = active - 1;
        SigningPolicy next = policy_;
        if (remaining == 1)
        {
            next.require_multi_sig = false;
            next.threshold = 1;
        }
        else
        {
            next.threshold = std::min(next.threshold, remaining);
        }

        if (auto res = persist_validator(updated); !res)
            return res;
        if (auto res = persist_policy(next); !res)
            return res;

        it->second = std::move(updated);
        policy_ = next;
        lock.unlock();

        record("validator.removed", std::string(id), {{"threshold", next.threshold}});
        return {};
    }

    Result<Validator> ValidatorRegistry::get(std::string_view id) const
    {
        std::shared_lock lock(mutex_);
        auto it = validators_.find(std::string(id));
        if (it == validators_.end())
            return std::unexpected(CosignError::not_found(std::format("validator {} not found", id)));
        return it->second;
    }

    std::vector<Validator> ValidatorRegistry::list_active() const
    {
        std::vector<Validator> out;
        std::shared_lock lock(mutex_);
        for (const auto &id : order_)
        {
            const auto &v = validators_.at(id);
            if (v.is_active)
                out.push_back(v);
        }
        return out;
    }

    std::vector<Validator> ValidatorRegistry::list_all() const
    {
        std::vector<Validator> out;
        std::shared_lock lock(mutex_);
        out.reserve(order_.size());
        for (const auto &id : order_)
            out.push_back(validators_.at(id));
        return out;
    }

    std::size_t ValidatorRegistry::active_count() const
    {
        std::shared_lock lock(mutex_);
        return active_count_locked();
    }

    std::size_t ValidatorRegistry::active_count_locked() const
    {
        return static_cast<std::size_t>(std::count_if(validators_.begin(), validators_.end(),
                                                      [](const auto &entry) { return entry.second.is_active; }));
    }

    SigningPolicy ValidatorRegistry::policy() const
    {
        std::shared_lock lock(mutex_);
        return policy_;
    }

    Result<void> ValidatorRegistry::set_policy(SigningPolicy policy)
    {
        if (policy.high_value_threshold)
        {
            if (auto parsed = parse_amount(*policy.high_value_threshold); !parsed)
                return std::unexpected(parsed.error());
        }

        std::unique_lock lock(mutex_);
        auto active = active_count_locked();
        if (policy.threshold < 1)
        {
            return std::unexpected(CosignError::invalid_threshold("Threshold must be at least 1"));
        }
        if (policy.threshold > active)
        {
            return std::unexpected(CosignError::invalid_threshold(
                std::format("Threshold {} exceeds the {} active validator(s)", policy.threshold, active)));
        }

        if (auto res = persist_policy(policy); !res)
            return res;
        policy_ = policy;
        lock.unlock();

        record("policy.updated", std::string(kPolicyKey), policy.to_json());
        return {};
    }

    bool ValidatorRegistry::requires_multi_sig(double value) const
    {
        auto policy = this->policy();
        if (policy.require_multi_sig)
            return true;
        if (!policy.high_value_threshold)
            return false;
        // set_policy and from_json validate the amount
        auto threshold = parse_amount(*policy.high_value_threshold);
        return threshold && value >= *threshold;
    }

    Result<bool> ValidatorRegistry::requires_multi_sig(std::string_view value) const
    {
        auto parsed = parse_amount(value);
        if (!parsed)
            return std::unexpected(parsed.error());
        return requires_multi_sig(*parsed);
    }

    bool ValidatorRegistry::is_multi_sig() const
    {
        std::shared_lock lock(mutex_);
        return active_count_locked() > 1 && policy_.require_multi_sig;
    }

    Result<void> ValidatorRegistry::touch(std::string_view id)
    {
        std::unique_lock lock(mutex_);
        auto it = validators_.find(std::string(id));
        if (it == validators_.end())
            return std::unexpected(CosignError::not_found(std::format("validator {} not found", id)));

        Validator updated = it->second;
        updated.last_used = clock_->now_ms();
        if (auto res = persist_validator(updated); !res)
            return res;
        it->second = std::move(updated);
        return {};
    }

    std::vector<std::string> ValidatorRegistry::owners_of(const std::vector<std::string> &validator_ids) const
    {
        std::vector<std::string> owners;
        std::shared_lock lock(mutex_);
        for (const auto &id : validator_ids)
        {
            auto it = validators_.find(id);
            if (it == validators_.end() || it->second.owner.empty())
                continue;
            if (std::find(owners.begin(), owners.end(), it->second.owner) == owners.end())
                owners.push_back(it->second.owner);
        }
        return owners;
    }

    std::vector<std::string> ValidatorRegistry::ids_owned_by(std::string_view user) const
    {
        std::vector<std::string> out;
        std::shared_lock lock(mutex_);
        for (const auto &id : order_)
        {
            if (validators_.at(id).owner == user)
                out.push_back(id);
        }
        return out;
    }

    Result<void> ValidatorRegistry::reload()
    {
        if (!store_)
            return {};

        auto records = store_->list(kValidatorKind);
        if (!records)
            return std::unexpected(records.error());

        std::unordered_map<std::string, Validator> next;
        std::vector<Validator> loaded;
        for (const auto &rec : *records)
        {
            auto v = Validator::from_json(rec);
            if (!v)
            {
                spdlog::warn("skipping malformed validator record: {}", v.error().what());
                continue;
            }
            loaded.push_back(std::move(*v));
        }
        std::stable_sort(loaded.begin(), loaded.end(),
                         [](const Validator &a, const Validator &b) { return a.created_at < b.created_at; });

        std::vector<std::string> order;
        for (auto &v : loaded)
        {
            order.push_back(v.id);
            next.emplace(v.id, std::move(v));
        }

        SigningPolicy policy{};
        auto stored_policy = store_->get(kPolicyKind, kPolicyKey);
        if (!stored_policy)
            return std::unexpected(stored_policy.error());
        if (stored_policy->has_value())
        {
            auto parsed = SigningPolicy::from_json(**stored_policy);
            if (!parsed)
                return std::unexpected(parsed.error());
            policy = *parsed;
        }

        std::unique_lock lock(mutex_);
        validators_ = std::move(next);
        order_ = std::move(order);
        policy_ = policy;
        return {};
    }

    Result<void> ValidatorRegistry::persist_validator(const Validator &validator)
    {
        if (!store_)
            return {};
        return store_->put(kValidatorKind, validator.id, validator.to_json());
    }

    Result<void> ValidatorRegistry::persist_policy(const SigningPolicy &policy)
    {
        if (!store_)
            return {};
        return store_->put(kPolicyKind, kPolicyKey, policy.to_json());
    }

    void ValidatorRegistry::record(const std::string &action, const std::string &resource, nlohmann::json details)
    {
        if (!audit_)
            return;
        audit_->append(AuditEvent{clock_->now_ms(), "registry", action, resource, "ok", std::move(details)});
    }

} // namespace cosign
