#pragma once

#include "audit.hpp"
#include "config.hpp"
#include "notification.hpp"
#include "proposal.hpp"
#include "state_store.hpp"
#include "types.hpp"
#include "validator_registry.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cosign
{

    /** Caller-supplied fields of a new proposal */
    struct ProposalDraft
    {
        std::string created_by;
        std::string to;
        std::string value{"0"};
        std::string data;
        std::size_t required_signatures{0};
        std::vector<std::string> validator_ids;
        std::optional<std::int64_t> ttl_secs; // signing.default_ttl_secs when absent
        ProposalMetadata metadata;
    };

    struct ProposalFilter
    {
        std::optional<ProposalStatus> status;
        std::size_t limit{50};
        std::size_t offset{0};
    };

    /**
     * Source of truth for proposal records.
     *
     * Proposals live in an arena keyed by id; each slot carries its own
     * mutex. transact() is the single mutation path: it runs a closure
     * against a working copy under the slot lock, persists the copy, and
     * only then makes it visible. Lifecycle notifications and audit
     * entries are emitted after the slot lock is released.
     */
    class ProposalStore
    {
    public:
        using Mutation = std::function<Result<void>(Proposal &)>;

        /** What transact() does with the working copy when the write fails */
        enum class Commit
        {
            // discard it and report the storage error
            AfterPersist,
            // keep it in memory and retry the write from flush_unsaved();
            // for mutations with an external effect that cannot be undone
            Irreversible,
        };

        ProposalStore(std::shared_ptr<StateStore> store,
                      std::shared_ptr<ValidatorRegistry> registry,
                      std::shared_ptr<NotificationHub> hub,
                      std::shared_ptr<const Clock> clock,
                      SigningConfig signing,
                      std::shared_ptr<AuditTrail> audit = nullptr);

        Result<Proposal> create(ProposalDraft draft);

        Result<Proposal> get(std::string_view id) const;

        /** Proposals the user created or may sign, newest first */
        std::vector<Proposal> list_for_user(const std::string &user, const ProposalFilter &filter = {}) const;

        /** Creator-only cancellation of a pending proposal */
        Result<Proposal> cancel(std::string_view id, const std::string &requester);

        /** Move an overdue pending proposal to expired */
        Result<Proposal> expire(std::string_view id);

        /**
         * Run mutation atomically for one proposal. The working copy is
         * committed when the closure succeeds, and also when it fails after
         * changing the status (a lazily detected expiry is still recorded).
         * Returns the committed proposal or the closure's error.
         */
        Result<Proposal> transact(std::string_view id, const Mutation &mutation,
                                  Commit commit = Commit::AfterPersist);

        /** Retry writes of proposals committed in memory only; returns how many were saved */
        std::size_t flush_unsaved();

        bool user_has_access(const std::string &user, std::string_view id) const;

        /** Ids of pending proposals whose expires_at is before now */
        std::vector<std::string> overdue_ids(Timestamp now) const;

        std::size_t size() const;

        Result<void> reload();

        std::shared_ptr<ValidatorRegistry> registry() const { return registry_; }
        std::shared_ptr<const Clock> clock() const { return clock_; }
        const SigningConfig &signing() const { return signing_; }

    private:
        struct Entry
        {
            std::mutex mutex;
            Proposal proposal;
            bool unsaved{false};
        };

        std::shared_ptr<Entry> find(std::string_view id) const;
        std::vector<std::shared_ptr<Entry>> snapshot() const;
        Result<void> persist(const Proposal &before, const Proposal &after, const nlohmann::json &serialized);
        std::vector<std::string> recipients_for(const Proposal &p) const;
        void announce(const Proposal &before, const Proposal &after);
        void record(const std::string &action, const Proposal &p, nlohmann::json details = nlohmann::json::object());

        std::shared_ptr<StateStore> store_;
        std::shared_ptr<ValidatorRegistry> registry_;
        std::shared_ptr<NotificationHub> hub_;
        std::shared_ptr<const Clock> clock_;
        SigningConfig signing_;
        std::shared_ptr<AuditTrail> audit_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    };

} // namespace cosign
