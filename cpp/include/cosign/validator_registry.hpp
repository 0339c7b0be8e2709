#pragma once

#include "audit.hpp"
#include "state_store.hpp"
#include "types.hpp"
#include "validator.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cosign
{

    /**
     * The account's authentication factors and its signing policy.
     *
     * Every mutation validates, writes through to the StateStore and then
     * updates the in-memory view while holding the registry lock, so the
     * policy invariant 1 <= threshold <= |active| holds for every reader.
     */
    class ValidatorRegistry
    {
    public:
        ValidatorRegistry(std::shared_ptr<StateStore> store,
                          std::shared_ptr<const Clock> clock,
                          std::shared_ptr<AuditTrail> audit = nullptr);

        /**
         * Install the primary social-login validator of a fresh account and
         * reset the policy to single-signature.
         */
        Result<Validator> bootstrap(Validator primary);

        /**
         * Add a signer. Rejects duplicate ids with AlreadyExists. Adding a
         * second active signer to a single-signature account switches the
         * policy to multi-sig with threshold min(2, |active|).
         */
        Result<Validator> add(Validator validator);

        /**
         * Deactivate a signer. Refuses with LastValidatorRemoval when it is
         * the only active signer, and shrinks the threshold to fit.
         */
        Result<void> remove(std::string_view id);

        Result<Validator> get(std::string_view id) const;

        std::vector<Validator> list_active() const;

        std::vector<Validator> list_all() const;

        std::size_t active_count() const;

        SigningPolicy policy() const;

        /** Replace the policy; InvalidThreshold unless 1 <= threshold <= |active| */
        Result<void> set_policy(SigningPolicy policy);

        bool requires_multi_sig(double value) const;

        /** String form of requires_multi_sig, for amounts as they arrive on the wire */
        Result<bool> requires_multi_sig(std::string_view value) const;

        bool is_multi_sig() const;

        /** Record that a validator just produced an accepted signature */
        Result<void> touch(std::string_view id);

        /** Distinct owners of the given validators, in first-seen order; unknown ids are skipped */
        std::vector<std::string> owners_of(const std::vector<std::string> &validator_ids) const;

        /** Ids of every validator owned by user (active or not) */
        std::vector<std::string> ids_owned_by(std::string_view user) const;

        Result<void> reload();

    private:
        std::size_t active_count_locked() const;
        Result<void> persist_validator(const Validator &validator);
        Result<void> persist_policy(const SigningPolicy &policy);
        void record(const std::string &action, const std::string &resource, nlohmann::json details);

        std::shared_ptr<StateStore> store_;
        std::shared_ptr<const Clock> clock_;
        std::shared_ptr<AuditTrail> audit_;
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, Validator> validators_;
        std::vector<std::string> order_; // insertion order for listing
        SigningPolicy policy_{};
    };

} // namespace cosign
