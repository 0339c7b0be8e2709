#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "cosign/signature_collector.hpp"
#include <thread>

using namespace cosign;
using namespace cosign::testing;

namespace {

struct TwoOfTwo {
    Harness h;
    Proposal proposal;

    TwoOfTwo() {
        h.add_device("v1", ValidatorKind::Social, "alice");
        h.add_device("v2", ValidatorKind::Passkey, "alice");
        proposal = h.propose({"v1", "v2"}, 2);
    }
};

} // namespace

TEST_CASE("Quorum of two executes on the second signature", "[signing]")
{
    TwoOfTwo t;
    auto &h = t.h;

    auto first = h.sign("v1", t.proposal);
    REQUIRE(first.has_value());
    REQUIRE_FALSE(first->executed);
    REQUIRE(first->proposal.collected_signatures() == 1);
    REQUIRE(first->proposal.status == ProposalStatus::Pending);
    REQUIRE(h.broadcaster->calls == 0);

    auto second = h.sign("v2", t.proposal);
    REQUIRE(second.has_value());
    REQUIRE(second->executed);
    REQUIRE(second->transaction_hash.has_value());
    REQUIRE(second->proposal.status == ProposalStatus::Executed);
    REQUIRE(second->proposal.transaction_hash == second->transaction_hash);
    REQUIRE(second->proposal.executed_at.has_value());
    REQUIRE(h.broadcaster->calls == 1);
    REQUIRE(h.broadcaster->last_weight == 2);

    SECTION("Signatures keep arrival order and signer identity")
    {
        const auto &sigs = second->proposal.signatures;
        REQUIRE(sigs.size() == 2);
        REQUIRE(sigs[0].validator_id == "v1");
        REQUIRE(sigs[0].signed_by == "0xv1");
        REQUIRE(sigs[1].validator_id == "v2");
        REQUIRE(sigs[1].signer_type == ValidatorKind::Passkey);
    }

    SECTION("A late signature is rejected as not pending")
    {
        auto stored = h.proposals->get(t.proposal.id).value();
        auto late = h.sign("v1", stored);
        REQUIRE_FALSE(late.has_value());
        REQUIRE(late.error().code == ErrorCode::NotPending);
        REQUIRE(h.broadcaster->calls == 1);
    }

    SECTION("Validators record their last use")
    {
        REQUIRE(h.registry->get("v2")->last_used == kEpoch);
    }
}

TEST_CASE("A validator cannot sign twice", "[signing]")
{
    TwoOfTwo t;
    REQUIRE(t.h.sign("v1", t.proposal).has_value());

    auto again = t.h.sign("v1", t.proposal);
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == ErrorCode::AlreadySigned);
    REQUIRE(t.h.proposals->get(t.proposal.id)->collected_signatures() == 1);
}

TEST_CASE("Ineligible validators are unauthorized whatever the status", "[signing]")
{
    TwoOfTwo t;
    auto &h = t.h;
    h.add_device("v3", ValidatorKind::Hardware, "bob");

    auto pending = h.sign("v3", t.proposal);
    REQUIRE_FALSE(pending.has_value());
    REQUIRE(pending.error().code == ErrorCode::Unauthorized);

    REQUIRE(h.proposals->cancel(t.proposal.id, "alice").has_value());
    auto cancelled = h.sign("v3", t.proposal);
    REQUIRE_FALSE(cancelled.has_value());
    REQUIRE(cancelled.error().code == ErrorCode::Unauthorized);

    SECTION("An eligible validator sees the status instead")
    {
        auto res = h.sign("v1", t.proposal);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::NotPending);
        REQUIRE(std::string(res.error().what()) == "Proposal is not pending (status: cancelled)");
    }
}

TEST_CASE("Deactivated validators cannot sign", "[signing]")
{
    Harness h;
    h.add_device("v1", ValidatorKind::Social, "alice");
    h.add_device("v2", ValidatorKind::Passkey, "alice");
    h.add_device("v3", ValidatorKind::Hardware, "alice");
    auto p = h.propose({"v1", "v2", "v3"}, 2);

    REQUIRE(h.registry->remove("v3").has_value());
    auto res = h.sign("v3", p);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::Unauthorized);
}

TEST_CASE("Signing after the deadline expires the proposal", "[signing]")
{
    TwoOfTwo t;
    auto &h = t.h;
    REQUIRE(h.sign("v1", t.proposal).has_value());

    auto conn = std::make_shared<RecordingConnection>("c1");
    h.hub->subscribe("alice", conn);

    h.clock->set(t.proposal.expires_at + 1);
    auto res = h.sign("v2", t.proposal);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::Expired);

    auto stored = h.proposals->get(t.proposal.id).value();
    REQUIRE(stored.status == ProposalStatus::Expired);
    REQUIRE(stored.collected_signatures() == 1);
    REQUIRE(h.broadcaster->calls == 0);
    REQUIRE(conn->notification_types() == std::vector<std::string>{"proposal_expired"});

    auto after = h.sign("v2", t.proposal);
    REQUIRE_FALSE(after.has_value());
    REQUIRE(after.error().code == ErrorCode::NotPending);
}

TEST_CASE("Forged and stale signatures are rejected", "[signing]")
{
    TwoOfTwo t;
    auto &h = t.h;

    SECTION("Signature over a different payload")
    {
        auto tampered = t.proposal;
        tampered.value = "100.0";
        auto req = h.request_for("v1", tampered);
        auto res = h.collector->sign(req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InvalidSignature);
    }

    SECTION("Signature from another validator's key")
    {
        auto req = h.request_for("v2", t.proposal);
        req.validator_id = "v1";
        req.signer_type.reset();
        auto res = h.collector->sign(req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InvalidSignature);
    }

    SECTION("Garbage signature")
    {
        auto req = h.request_for("v1", t.proposal);
        req.signature = "not base64!";
        auto res = h.collector->sign(req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InvalidSignature);
    }

    SECTION("Timestamp outside the freshness window")
    {
        auto req = h.request_for("v1", t.proposal);
        req.signed_at = h.clock->now_ms() - (h.config.signing.freshness_window_secs + 1) * 1000;
        auto res = h.collector->sign(req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::StaleSignature);
    }

    SECTION("Timestamp inside the window is kept")
    {
        auto req = h.request_for("v1", t.proposal);
        req.signed_at = h.clock->now_ms() - 5000;
        auto res = h.collector->sign(req);
        REQUIRE(res.has_value());
        REQUIRE(res->proposal.signatures[0].signed_at == kEpoch - 5000);
    }

    SECTION("Declared signer type must match the validator")
    {
        auto req = h.request_for("v1", t.proposal);
        req.signer_type = ValidatorKind::Hardware;
        auto res = h.collector->sign(req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InvalidInput);
    }

    SECTION("Unknown proposal")
    {
        auto req = h.request_for("v1", t.proposal);
        req.proposal_id = "proposal_missing";
        auto res = h.collector->sign(req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::NotFound);
    }

    REQUIRE(h.proposals->get(t.proposal.id)->status == ProposalStatus::Pending);
}

TEST_CASE("Device metadata travels with the signature", "[signing]")
{
    TwoOfTwo t;
    auto req = t.h.request_for("v1", t.proposal);
    req.device = DeviceMetadata{"dev-1", "Pixel", "android"};

    auto res = t.h.collector->sign(req);
    REQUIRE(res.has_value());
    REQUIRE(res->proposal.signatures[0].device.has_value());
    REQUIRE(res->proposal.signatures[0].device->device_name == "Pixel");
}

TEST_CASE("Concurrent final signatures execute exactly once", "[signing][concurrency]")
{
    Harness h;
    h.add_device("v1", ValidatorKind::Social, "alice");
    h.add_device("v2", ValidatorKind::Passkey, "alice");
    h.add_device("v3", ValidatorKind::Hardware, "alice");
    auto p = h.propose({"v1", "v2", "v3"}, 2);
    REQUIRE(h.sign("v1", p).has_value());

    h.broadcaster->delay = std::chrono::milliseconds(20);
    auto req2 = h.request_for("v2", p);
    auto req3 = h.request_for("v3", p);

    Result<SignOutcome> r2 = std::unexpected(CosignError::internal("unset"));
    Result<SignOutcome> r3 = std::unexpected(CosignError::internal("unset"));
    std::thread a([&] { r2 = h.collector->sign(req2); });
    std::thread b([&] { r3 = h.collector->sign(req3); });
    a.join();
    b.join();

    REQUIRE(h.broadcaster->calls == 1);
    auto stored = h.proposals->get(p.id).value();
    REQUIRE(stored.status == ProposalStatus::Executed);

    // the loser either landed its signature before execution or found the proposal resolved
    int executed = 0;
    for (auto *r : {&r2, &r3})
    {
        if (r->has_value())
        {
            if ((*r)->executed)
                ++executed;
        }
        else
        {
            REQUIRE((*r).error().code == ErrorCode::NotPending);
        }
    }
    REQUIRE(executed == 1);
    REQUIRE(stored.collected_signatures() >= 2);
    REQUIRE(stored.collected_signatures() <= 3);
}

TEST_CASE("Many validators signing together broadcast once", "[signing][concurrency]")
{
    Harness h;
    h.add_device("v0", ValidatorKind::Social, "alice");
    std::vector<std::string> ids{"v0"};
    for (int i = 1; i < 8; ++i)
    {
        auto id = "v" + std::to_string(i);
        h.add_device(id, ValidatorKind::Hardware, "alice");
        ids.push_back(id);
    }
    auto p = h.propose(ids, 5);

    std::vector<SignRequest> requests;
    for (const auto &id : ids)
        requests.push_back(h.request_for(id, p));

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (const auto &req : requests)
    {
        threads.emplace_back([&h, &accepted, req]
                             {
            if (h.collector->sign(req))
                ++accepted; });
    }
    for (auto &t : threads)
        t.join();

    auto stored = h.proposals->get(p.id).value();
    REQUIRE(h.broadcaster->calls == 1);
    REQUIRE(stored.status == ProposalStatus::Executed);
    REQUIRE(accepted == static_cast<int>(stored.collected_signatures()));
    REQUIRE(stored.collected_signatures() >= 5);
}
