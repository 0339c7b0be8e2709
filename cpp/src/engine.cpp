#include "cosign/engine.hpp"
#include <spdlog/spdlog.h>
#include <limits>

namespace cosign
{

    Engine::Engine(const CosignConfig &cfg, EngineCollaborators collaborators)
        : cfg_(cfg),
          clock_(collaborators.clock ? std::move(collaborators.clock) : system_clock()),
          audit_(std::make_shared<AuditTrail>()),
          store_(collaborators.store ? std::move(collaborators.store) : std::make_shared<MemoryStateStore>())
    {
        registry_ = std::make_shared<ValidatorRegistry>(store_, clock_, audit_);
        hub_ = std::make_shared<NotificationHub>(cfg_.notifications, clock_, std::move(collaborators.side_channels));
        proposals_ = std::make_shared<ProposalStore>(store_, registry_, hub_, clock_, cfg_.signing, audit_);

        auto broadcaster = collaborators.broadcaster ? std::move(collaborators.broadcaster)
                                                     : std::make_shared<DryRunBroadcaster>();
        auto verifier = collaborators.verifier ? std::move(collaborators.verifier)
                                               : std::make_shared<SodiumSignatureVerifier>();
        coordinator_ = std::make_shared<ExecutionCoordinator>(proposals_, std::move(broadcaster), cfg_.gas);
        collector_ = std::make_shared<SignatureCollector>(proposals_, std::move(verifier), coordinator_);
        auth_ = std::make_shared<TokenAuthenticator>(cfg_.auth, clock_);

        // resync hands back the whole pending set, never a page of it
        std::weak_ptr<ProposalStore> weak = proposals_;
        hub_->set_pending_source([weak](const std::string &user)
                                 {
            auto proposals = weak.lock();
            if (!proposals)
                return std::vector<Proposal>{};
            return proposals->list_for_user(
                user, ProposalFilter{ProposalStatus::Pending, std::numeric_limits<std::size_t>::max(), 0}); });

        spdlog::info("engine ready: {} validator(s), {} proposal(s)",
                     registry_->active_count(), proposals_->size());
    }

    Result<std::unique_ptr<Engine>> Engine::open(const CosignConfig &cfg, EngineCollaborators collaborators)
    {
        if (!collaborators.store)
        {
            auto store = open_state_store(cfg);
            if (!store)
                return std::unexpected(store.error());
            collaborators.store = std::move(*store);
        }
        return std::make_unique<Engine>(cfg, std::move(collaborators));
    }

} // namespace cosign
