#pragma once

#include "audit.hpp"
#include "auth.hpp"
#include "config.hpp"
#include "execution.hpp"
#include "notification.hpp"
#include "proposal_store.hpp"
#include "signature_collector.hpp"
#include "signature_verifier.hpp"
#include "state_store.hpp"
#include "types.hpp"
#include "validator_registry.hpp"
#include <memory>

namespace cosign
{

    /** Replaceable external collaborators; null members get the defaults */
    struct EngineCollaborators
    {
        std::shared_ptr<StateStore> store;
        std::shared_ptr<SignatureVerifier> verifier;
        std::shared_ptr<ExecutionBroadcaster> broadcaster;
        std::shared_ptr<SideChannelSender> side_channels;
        std::shared_ptr<const Clock> clock;
    };

    /**
     * The coordination engine wired from one config: registry, proposal
     * store, notification hub, coordinator and collector sharing one
     * store, clock and audit trail.
     */
    class Engine
    {
    public:
        Engine(const CosignConfig &cfg, EngineCollaborators collaborators);

        /** Build with the store named by cfg.storage when none is supplied */
        static Result<std::unique_ptr<Engine>> open(const CosignConfig &cfg, EngineCollaborators collaborators = {});

        const CosignConfig &config() const { return cfg_; }
        std::shared_ptr<const Clock> clock() const { return clock_; }
        std::shared_ptr<AuditTrail> audit() const { return audit_; }
        std::shared_ptr<ValidatorRegistry> registry() const { return registry_; }
        std::shared_ptr<NotificationHub> hub() const { return hub_; }
        std::shared_ptr<ProposalStore> proposals() const { return proposals_; }
        std::shared_ptr<ExecutionCoordinator> coordinator() const { return coordinator_; }
        std::shared_ptr<SignatureCollector> collector() const { return collector_; }
        std::shared_ptr<TokenAuthenticator> authenticator() const { return auth_; }

    private:
        CosignConfig cfg_;
        std::shared_ptr<const Clock> clock_;
        std::shared_ptr<AuditTrail> audit_;
        std::shared_ptr<StateStore> store_;
        std::shared_ptr<ValidatorRegistry> registry_;
        std::shared_ptr<NotificationHub> hub_;
        std::shared_ptr<ProposalStore> proposals_;
        std::shared_ptr<ExecutionCoordinator> coordinator_;
        std::shared_ptr<SignatureCollector> collector_;
        std::shared_ptr<TokenAuthenticator> auth_;
    };

} // namespace cosign
