#include "cosign/proposal_store.hpp"
#include "cosign/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <limits>
#include <unordered_set>

namespace cosign
{

    namespace
    {
        constexpr std::string_view kProposalKind = "proposal";
        constexpr std::string_view kSignatureKind = "proposal_signature";

        std::string signature_key(const std::string &proposal_id, const std::string &validator_id)
        {
            return std::format("{}:{}", proposal_id, validator_id);
        }
    } // namespace

    ProposalStore::ProposalStore(std::shared_ptr<StateStore> store,
                                 std::shared_ptr<ValidatorRegistry> registry,
                                 std::shared_ptr<NotificationHub> hub,
                                 std::shared_ptr<const Clock> clock,
                                 SigningConfig signing,
                                 std::shared_ptr<AuditTrail> audit)
        : store_(std::move(store)),
          registry_(std::move(registry)),
          hub_(std::move(hub)),
          clock_(std::move(clock)),
          signing_(signing),
          audit_(std::move(audit))
    {
        if (auto loaded = reload(); !loaded)
        {
            spdlog::error("proposal store reload failed: {}", loaded.error().what());
        }
    }

    Result<Proposal> ProposalStore::create(ProposalDraft draft)
    {
        if (draft.created_by.empty())
            return std::unexpected(CosignError::invalid_input("creator must not be empty"));
        if (draft.to.empty())
            return std::unexpected(CosignError::invalid_input("destination address must not be empty"));
        if (auto amount = parse_amount(draft.value); !amount)
            return std::unexpected(amount.error());
        if (draft.validator_ids.empty())
            return std::unexpected(CosignError::invalid_input("at least one validator is required"));
        if (draft.required_signatures == 0)
            return std::unexpected(CosignError::invalid_threshold("requiredSignatures must be at least 1"));
        if (draft.required_signatures > draft.validator_ids.size())
        {
            return std::unexpected(CosignError::invalid_threshold(
                std::format("requiredSignatures ({}) exceeds the number of validators ({})",
                            draft.required_signatures, draft.validator_ids.size())));
        }

        std::unordered_set<std::string> seen;
        for (const auto &vid : draft.validator_ids)
        {
            if (!seen.insert(vid).second)
                return std::unexpected(CosignError::invalid_input(std::format("duplicate validator {}", vid)));
            auto v = registry_->get(vid);
            if (!v)
                return std::unexpected(v.error());
            if (!v->is_active)
                return std::unexpected(CosignError::invalid_input(std::format("validator {} is not active", vid)));
        }

        auto ttl = draft.ttl_secs.value_or(signing_.default_ttl_secs);
        if (ttl <= 0)
            return std::unexpected(CosignError::invalid_input("ttl must be positive"));

        auto now = clock_->now_ms();
        if (ttl > (std::numeric_limits<Timestamp>::max() - now) / 1000)
            return std::unexpected(CosignError::invalid_input(std::format("ttl of {}s is out of range", ttl)));

        Proposal p;
        p.id = std::format("proposal_{}_{}", now, crypto::SecureRandom::hex(5));
        p.created_by = std::move(draft.created_by);
        p.to = std::move(draft.to);
        p.value = std::move(draft.value);
        p.data = std::move(draft.data);
        p.required_signatures = draft.required_signatures;
        p.validator_ids = std::move(draft.validator_ids);
        p.status = ProposalStatus::Pending;
        p.created_at = now;
        p.expires_at = now + ttl * 1000;
        p.metadata = std::move(draft.metadata);
        p.metadata.failure_reason.reset();
        p.metadata.failed_at.reset();

        if (auto res = store_->insert(kProposalKind, p.id, p.to_json()); !res)
            return std::unexpected(res.error());

        {
            auto entry = std::make_shared<Entry>();
            entry->proposal = p;
            std::unique_lock lock(mutex_);
            entries_.emplace(p.id, std::move(entry));
        }

        spdlog::info("proposal {} created by {} ({} of {} signatures)",
                     p.id, p.created_by, p.required_signatures, p.validator_ids.size());
        record("proposal.created", p, {{"to", p.to}, {"value", p.value}});
        if (hub_)
            hub_->publish(notices::new_proposal(p, recipients_for(p), now));
        return p;
    }

    Result<Proposal> ProposalStore::get(std::string_view id) const
    {
        auto entry = find(id);
        if (!entry)
            return std::unexpected(CosignError::not_found(std::format("Proposal {} not found", id)));
        std::lock_guard lock(entry->mutex);
        return entry->proposal;
    }

    std::vector<Proposal> ProposalStore::list_for_user(const std::string &user, const ProposalFilter &filter) const
    {
        auto owned = registry_->ids_owned_by(user);
        std::vector<Proposal> matches;
        for (const auto &entry : snapshot())
        {
            std::lock_guard lock(entry->mutex);
            const auto &p = entry->proposal;
            if (filter.status && p.status != *filter.status)
                continue;
            bool visible = p.created_by == user ||
                           std::any_of(owned.begin(), owned.end(), [&](const auto &vid) { return p.is_eligible(vid); });
            if (visible)
                matches.push_back(p);
        }

        std::sort(matches.begin(), matches.end(), [](const Proposal &a, const Proposal &b)
                  {
            if (a.created_at != b.created_at)
                return a.created_at > b.created_at;
            return a.id > b.id; });

        if (filter.offset >= matches.size())
            return {};
        auto first = matches.begin() + static_cast<std::ptrdiff_t>(filter.offset);
        auto count = std::min(filter.limit, matches.size() - filter.offset);
        return {std::make_move_iterator(first), std::make_move_iterator(first + static_cast<std::ptrdiff_t>(count))};
    }

    Result<Proposal> ProposalStore::cancel(std::string_view id, const std::string &requester)
    {
        auto now = clock_->now_ms();
        return transact(id, [&](Proposal &p) -> Result<void>
                        {
            if (p.created_by != requester)
                return std::unexpected(CosignError::unauthorized("Only the proposal creator can cancel it"));
            if (p.status != ProposalStatus::Pending)
            {
                return std::unexpected(CosignError::already_resolved(
                    std::format("Proposal is already {}", to_string(p.status))));
            }
            if (now > p.expires_at)
            {
                p.status = ProposalStatus::Expired;
                return std::unexpected(CosignError::expired("Proposal has expired"));
            }
            p.status = ProposalStatus::Cancelled;
            return {}; });
    }

    Result<Proposal> ProposalStore::expire(std::string_view id)
    {
        auto now = clock_->now_ms();
        return transact(id, [&](Proposal &p) -> Result<void>
                        {
            if (p.status != ProposalStatus::Pending)
            {
                return std::unexpected(CosignError::not_pending(
                    std::format("Proposal is {}", to_string(p.status))));
            }
            if (now <= p.expires_at)
                return std::unexpected(CosignError::invalid_input("Proposal has not reached its expiry"));
            p.status = ProposalStatus::Expired;
            return {}; });
    }

    Result<Proposal> ProposalStore::transact(std::string_view id, const Mutation &mutation, Commit commit)
    {
        auto entry = find(id);
        if (!entry)
            return std::unexpected(CosignError::not_found(std::format("Proposal {} not found", id)));

        Proposal before;
        Proposal after;
        std::optional<CosignError> failure;
        {
            std::unique_lock lock(entry->mutex);
            before = entry->proposal;
            after = before;

            auto res = mutation(after);
            if (!res)
            {
                if (after.status == before.status)
                    return std::unexpected(res.error());
                failure = res.error();
                // only the status transition survives a failed mutation
                auto status = after.status;
                after = before;
                after.status = status;
            }

            auto serialized = after.to_json();
            if (serialized == before.to_json())
                return after;

            auto saved = persist(before, after, serialized);
            if (!saved && commit == Commit::AfterPersist)
                return std::unexpected(saved.error());
            if (!saved)
                spdlog::error("proposal {} kept in memory, write will be retried: {}", after.id, saved.error().what());
            entry->unsaved = !saved;
            entry->proposal = after;
        }

        announce(before, after);
        if (failure)
            return std::unexpected(*failure);
        return after;
    }

    bool ProposalStore::user_has_access(const std::string &user, std::string_view id) const
    {
        auto p = get(id);
        if (!p)
            return false;
        if (p->created_by == user)
            return true;
        auto owned = registry_->ids_owned_by(user);
        return std::any_of(owned.begin(), owned.end(), [&](const auto &vid) { return p->is_eligible(vid); });
    }

    std::vector<std::string> ProposalStore::overdue_ids(Timestamp now) const
    {
        std::vector<std::string> out;
        for (const auto &entry : snapshot())
        {
            std::lock_guard lock(entry->mutex);
            if (entry->proposal.status == ProposalStatus::Pending && now > entry->proposal.expires_at)
                out.push_back(entry->proposal.id);
        }
        return out;
    }

    std::size_t ProposalStore::size() const
    {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    Result<void> ProposalStore::reload()
    {
        auto records = store_->list(kProposalKind);
        if (!records)
            return std::unexpected(records.error());
        auto sig_records = store_->list(kSignatureKind);
        if (!sig_records)
            return std::unexpected(sig_records.error());

        std::unordered_map<std::string, std::shared_ptr<Entry>> next;
        for (const auto &rec : *records)
        {
            auto p = Proposal::from_json(rec);
            if (!p)
            {
                spdlog::warn("skipping malformed proposal record: {}", p.error().what());
                continue;
            }
            auto entry = std::make_shared<Entry>();
            entry->proposal = std::move(*p);
            next.emplace(entry->proposal.id, std::move(entry));
        }

        // a signature row written just before a failed proposal write is still valid evidence
        for (const auto &rec : *sig_records)
        {
            auto it = next.find(rec.value("proposalId", ""));
            if (it == next.end())
                continue;
            auto &p = it->second->proposal;
            auto sig = ProposalSignature::from_json(rec);
            if (!sig || p.status != ProposalStatus::Pending || p.has_signed(sig->validator_id))
                continue;
            spdlog::warn("restoring signature {} on proposal {}", sig->validator_id, p.id);
            p.signatures.push_back(std::move(*sig));
        }

        std::unique_lock lock(mutex_);
        entries_ = std::move(next);
        return {};
    }

    std::shared_ptr<ProposalStore::Entry> ProposalStore::find(std::string_view id) const
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(std::string(id));
        return it == entries_.end() ? nullptr : it->second;
    }

    std::vector<std::shared_ptr<ProposalStore::Entry>> ProposalStore::snapshot() const
    {
        std::vector<std::shared_ptr<Entry>> out;
        std::shared_lock lock(mutex_);
        out.reserve(entries_.size());
        for (const auto &[id, entry] : entries_)
            out.push_back(entry);
        return out;
    }

    Result<void> ProposalStore::persist(const Proposal &before, const Proposal &after, const nlohmann::json &serialized)
    {
        std::vector<std::string> written;
        auto rollback = [&]
        {
            for (const auto &key : written)
            {
                if (auto erased = store_->erase(kSignatureKind, key); !erased)
                    spdlog::error("could not roll back signature row {}: {}", key, erased.error().what());
            }
        };

        // a row for a signature the slot has not accepted is left over from a failed write
        for (auto i = before.signatures.size(); i < after.signatures.size(); ++i)
        {
            const auto &sig = after.signatures[i];
            auto key = signature_key(after.id, sig.validator_id);
            auto row = sig.to_json();
            row["proposalId"] = after.id;
            auto inserted = store_->insert(kSignatureKind, key, row);
            if (!inserted && inserted.error().code == ErrorCode::AlreadyExists)
            {
                spdlog::warn("replacing orphaned signature row {}", key);
                inserted = store_->put(kSignatureKind, key, row);
            }
            if (!inserted)
            {
                rollback();
                return inserted;
            }
            written.push_back(std::move(key));
        }

        auto saved = store_->put(kProposalKind, after.id, serialized);
        if (!saved)
            rollback();
        return saved;
    }

    std::size_t ProposalStore::flush_unsaved()
    {
        std::size_t flushed = 0;
        for (const auto &entry : snapshot())
        {
            std::lock_guard lock(entry->mutex);
            if (!entry->unsaved)
                continue;
            const auto &p = entry->proposal;
            if (auto saved = store_->put(kProposalKind, p.id, p.to_json()); !saved)
            {
                spdlog::warn("proposal {} is still unsaved: {}", p.id, saved.error().what());
                continue;
            }
            entry->unsaved = false;
            ++flushed;
        }
        if (flushed > 0)
            spdlog::info("saved {} proposal(s) held in memory", flushed);
        return flushed;
    }

    std::vector<std::string> ProposalStore::recipients_for(const Proposal &p) const
    {
        auto recipients = registry_->owners_of(p.validator_ids);
        bool listed = std::find(recipients.begin(), recipients.end(), p.created_by) != recipients.end();
        if (hub_ && hub_->config().notify_creator)
        {
            if (!listed)
                recipients.push_back(p.created_by);
        }
        else if (listed)
        {
            std::erase(recipients, p.created_by);
        }
        return recipients;
    }

    void ProposalStore::announce(const Proposal &before, const Proposal &after)
    {
        auto now = clock_->now_ms();
        std::vector<NotificationMessage> out;

        for (auto i = before.signatures.size(); i < after.signatures.size(); ++i)
        {
            const auto &sig = after.signatures[i];
            record("proposal.signed", after, {{"validatorId", sig.validator_id}, {"collected", after.collected_signatures()}});
            out.push_back(notices::signature_added(after, sig.validator_id, recipients_for(after), now));
        }

        if (before.status != after.status)
        {
            switch (after.status)
            {
            case ProposalStatus::Executed:
                spdlog::info("proposal {} executed: {}", after.id, after.transaction_hash.value_or(""));
                record("proposal.executed", after, {{"transactionHash", after.transaction_hash.value_or("")}});
                out.push_back(notices::proposal_executed(after, recipients_for(after), now));
                break;
            case ProposalStatus::Cancelled:
                spdlog::info("proposal {} cancelled", after.id);
                record("proposal.cancelled", after);
                out.push_back(notices::proposal_cancelled(after, after.created_by, recipients_for(after), now));
                break;
            case ProposalStatus::Expired:
                spdlog::info("proposal {} expired with {}/{} signatures",
                             after.id, after.collected_signatures(), after.required_signatures);
                record("proposal.expired", after);
                out.push_back(notices::proposal_expired(after, recipients_for(after), now));
                break;
            case ProposalStatus::Failed:
                spdlog::warn("proposal {} failed: {}", after.id, after.metadata.failure_reason.value_or(""));
                record("proposal.failed", after, {{"reason", after.metadata.failure_reason.value_or("")}});
                break;
            case ProposalStatus::Pending:
                break;
            }
        }

        if (!hub_)
            return;
        for (const auto &message : out)
            hub_->publish(message);
    }

    void ProposalStore::record(const std::string &action, const Proposal &p, nlohmann::json details)
    {
        if (!audit_)
            return;
        audit_->append(AuditEvent{clock_->now_ms(), p.created_by, action, p.id, "ok", std::move(details)});
    }

} // namespace cosign
