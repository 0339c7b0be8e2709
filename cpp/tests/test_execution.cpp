#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "cosign/execution.hpp"
#include "cosign/expiration_sweeper.hpp"
#include <boost/asio/io_context.hpp>
#include <limits>
#include <stdexcept>

using namespace cosign;
using namespace cosign::testing;

namespace {

class ThrowingBroadcaster : public ExecutionBroadcaster
{
public:
    Result<std::string> execute(const std::string &, const std::string &, const std::string &,
                                const AggregatedSignature &) override
    {
        throw std::runtime_error("rpc connection reset");
    }
};

ProposalSignature signature_from(const std::string &validator_id, Timestamp at)
{
    ProposalSignature s;
    s.validator_id = validator_id;
    s.signature = "sig";
    s.signed_at = at;
    return s;
}

} // namespace

TEST_CASE("Broadcast failure marks the proposal failed", "[execution]")
{
    Harness h;
    h.add_device("v1", ValidatorKind::Social, "alice");
    h.add_device("v2", ValidatorKind::Passkey, "alice");
    auto p = h.propose({"v1", "v2"}, 2);
    h.broadcaster->failure = "insufficient funds for gas";

    REQUIRE(h.sign("v1", p).has_value());
    auto res = h.sign("v2", p);
    REQUIRE(res.has_value());
    REQUIRE_FALSE(res->executed);
    REQUIRE(res->error.has_value());
    REQUIRE(*res->error == "insufficient funds for gas");

    auto stored = h.proposals->get(p.id).value();
    REQUIRE(stored.status == ProposalStatus::Failed);
    REQUIRE(stored.metadata.failure_reason == "insufficient funds for gas");
    REQUIRE(stored.metadata.failed_at.has_value());
    REQUIRE_FALSE(stored.transaction_hash.has_value());
    REQUIRE(stored.collected_signatures() == 2);

    SECTION("Failed proposals are not retried")
    {
        h.broadcaster->failure.clear();
        auto again = h.coordinator->try_execute(p.id);
        REQUIRE(again.has_value());
        REQUIRE_FALSE(again->executed);
        REQUIRE(h.broadcaster->calls == 1);
    }

    SECTION("Failure is audited")
    {
        REQUIRE(h.audit->verify());
    }
}

TEST_CASE("A throwing broadcaster is treated as a failure", "[execution]")
{
    Harness h;
    h.coordinator = std::make_shared<ExecutionCoordinator>(h.proposals, std::make_shared<ThrowingBroadcaster>(),
                                                           h.config.gas);
    h.collector = std::make_shared<SignatureCollector>(h.proposals, std::make_shared<SodiumSignatureVerifier>(),
                                                       h.coordinator);
    h.add_device("v1", ValidatorKind::Social, "alice");
    auto p = h.propose({"v1"}, 1);

    auto res = h.sign("v1", p);
    REQUIRE(res.has_value());
    REQUIRE_FALSE(res->executed);
    REQUIRE(*res->error == "rpc connection reset");
    REQUIRE(h.proposals->get(p.id)->status == ProposalStatus::Failed);
}

TEST_CASE("try_execute leaves proposals below quorum alone", "[execution]")
{
    Harness h;
    h.add_device("v1", ValidatorKind::Social, "alice");
    h.add_device("v2", ValidatorKind::Passkey, "alice");
    auto p = h.propose({"v1", "v2"}, 2);

    auto res = h.coordinator->try_execute(p.id);
    REQUIRE(res.has_value());
    REQUIRE_FALSE(res->executed);
    REQUIRE(h.proposals->get(p.id)->status == ProposalStatus::Pending);
    REQUIRE(h.broadcaster->calls == 0);

    auto missing = h.coordinator->try_execute("proposal_missing");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("Gas estimate for a two-signature proposal", "[execution][gas]")
{
    Harness h;
    h.add_device("v1", ValidatorKind::Social, "alice");
    h.add_device("v2", ValidatorKind::Passkey, "alice");
    auto p = h.propose({"v1", "v2"}, 2);

    std::vector<ProposalSignature> sigs{signature_from("v1", kEpoch), signature_from("v2", kEpoch)};
    auto est = h.coordinator->estimate_gas(p, sigs);
    REQUIRE(est.has_value());
    REQUIRE(est->gas_limit == 175000);
    REQUIRE(est->gas_price == 20000000000ULL);
    REQUIRE(est->total_cost == 3500000000000000ULL);

    auto j = est->to_json();
    REQUIRE(j["gasLimit"] == "175000");
    REQUIRE(j["totalCost"] == "3500000000000000");

    SECTION("Overflowing configurations are rejected")
    {
        GasConfig huge;
        huge.gas_price_wei = std::numeric_limits<std::uint64_t>::max();
        ExecutionCoordinator coordinator(h.proposals, h.broadcaster, huge);
        auto res = coordinator.estimate_gas(p, sigs);
        REQUIRE_FALSE(res.has_value());
    }
}

TEST_CASE("can_execute checks every candidate signature", "[execution]")
{
    Harness h;
    h.add_device("v1", ValidatorKind::Social, "alice");
    h.add_device("v2", ValidatorKind::Passkey, "alice");
    h.add_device("v3", ValidatorKind::Hardware, "alice");
    auto now = h.clock->now_ms();

    SECTION("Enough fresh signatures")
    {
        auto pf = h.coordinator->can_execute(2, {signature_from("v1", now), signature_from("v2", now)});
        REQUIRE(pf.can_execute);
        REQUIRE_FALSE(pf.reason.has_value());
    }

    SECTION("Short of the threshold")
    {
        auto pf = h.coordinator->can_execute(3, {signature_from("v1", now)});
        REQUIRE_FALSE(pf.can_execute);
        REQUIRE(pf.reason == "Need 2 more signature(s)");
    }

    SECTION("Unknown validator")
    {
        auto pf = h.coordinator->can_execute(1, {signature_from("ghost", now)});
        REQUIRE_FALSE(pf.can_execute);
    }

    SECTION("Inactive validator")
    {
        REQUIRE(h.registry->remove("v3").has_value());
        auto pf = h.coordinator->can_execute(1, {signature_from("v3", now)});
        REQUIRE_FALSE(pf.can_execute);
    }

    SECTION("Duplicate signer")
    {
        auto pf = h.coordinator->can_execute(2, {signature_from("v1", now), signature_from("v1", now)});
        REQUIRE_FALSE(pf.can_execute);
    }

    SECTION("Stale signature")
    {
        auto old = now - (h.config.signing.freshness_window_secs + 1) * 1000;
        auto pf = h.coordinator->can_execute(1, {signature_from("v1", old)});
        REQUIRE_FALSE(pf.can_execute);
    }
}

TEST_CASE("Preflight reflects the stored proposal", "[execution]")
{
    Harness h;
    h.add_device("v1", ValidatorKind::Social, "alice");
    h.add_device("v2", ValidatorKind::Passkey, "alice");
    auto p = h.propose({"v1", "v2"}, 2);

    auto before = h.coordinator->preflight(p.id);
    REQUIRE(before.has_value());
    REQUIRE_FALSE(before->can_execute);
    REQUIRE(before->reason == "Need 2 more signature(s)");

    h.clock->set(p.expires_at + 1);
    auto late = h.coordinator->preflight(p.id);
    REQUIRE_FALSE(late->can_execute);
    REQUIRE(late->reason == "Proposal has expired");
}

TEST_CASE("Aggregated signatures weigh every signer once", "[execution]")
{
    Proposal p;
    p.signatures = {signature_from("a", 1), signature_from("b", 2), signature_from("c", 3)};
    p.signatures[0].signed_by = "0xabc";

    auto agg = AggregatedSignature::from(p);
    REQUIRE(agg.entries.size() == 3);
    REQUIRE(agg.total_weight() == 3);
    REQUIRE(agg.entries[0].signer == "0xabc");
    REQUIRE(agg.entries[1].signer == "b");
    REQUIRE(agg.to_json()["totalWeight"] == 3);
}

TEST_CASE("Dry-run broadcaster hashes the call", "[execution]")
{
    DryRunBroadcaster dry;
    AggregatedSignature agg;
    auto a = dry.execute("0xABC", "1.0", "", agg);
    auto b = dry.execute("0xABC", "1.0", "", agg);
    auto c = dry.execute("0xABC", "2.0", "", agg);
    REQUIRE(a.has_value());
    REQUIRE(a->starts_with("0x"));
    REQUIRE(a->size() == 66);
    REQUIRE(*a == *b);
    REQUIRE(*a != *c);
}

TEST_CASE("A broadcast whose write fails is kept and never repeated", "[execution][storage]")
{
    auto flaky = std::make_shared<FlakyStateStore>();
    Harness h(flaky);
    h.add_device("v1", ValidatorKind::Social, "alice");
    h.add_device("v2", ValidatorKind::Passkey, "alice");
    h.add_device("v3", ValidatorKind::Hardware, "alice");
    auto p = h.propose({"v1", "v2", "v3"}, 2);

    REQUIRE(h.sign("v1", p).has_value());

    // the store goes down while the transaction is in flight
    h.broadcaster->on_execute = [&] { flaky->fail_writes = true; };
    auto second = h.sign("v2", p);
    REQUIRE(second.has_value());
    REQUIRE(second->executed);
    REQUIRE(second->transaction_hash.has_value());
    REQUIRE(h.broadcaster->calls == 1);
    REQUIRE(h.proposals->get(p.id)->status == ProposalStatus::Executed);
    REQUIRE((**flaky->inner.get("proposal", p.id))["status"] == "pending");

    flaky->fail_writes = false;
    h.broadcaster->on_execute = nullptr;

    auto third = h.sign("v3", p);
    REQUIRE_FALSE(third.has_value());
    REQUIRE(third.error().code == ErrorCode::NotPending);
    REQUIRE(h.broadcaster->calls == 1);

    auto again = h.coordinator->try_execute(p.id);
    REQUIRE(again.has_value());
    REQUIRE_FALSE(again->executed);
    REQUIRE(h.broadcaster->calls == 1);

    // the next sweep saves the record and leaves it executed
    h.clock->advance_secs(h.config.signing.default_ttl_secs + 1);
    boost::asio::io_context ioc;
    auto sweeper = std::make_shared<ExpirationSweeper>(h.proposals, ioc.get_executor(), SweeperConfig{60});
    REQUIRE(sweeper->sweep_once(h.clock->now_ms()) == 0);
    REQUIRE((**flaky->inner.get("proposal", p.id))["status"] == "executed");
    REQUIRE(h.proposals->get(p.id)->status == ProposalStatus::Executed);
    REQUIRE(h.proposals->flush_unsaved() == 0);
}

TEST_CASE("Unsaved proposals stay unsaved while the store is down", "[execution][storage]")
{
    auto flaky = std::make_shared<FlakyStateStore>();
    Harness h(flaky);
    h.add_device("v1", ValidatorKind::Social, "alice");
    auto p = h.propose({"v1"}, 1);

    h.broadcaster->on_execute = [&] { flaky->fail_writes = true; };
    auto signed_once = h.sign("v1", p);
    REQUIRE(signed_once.has_value());
    REQUIRE(signed_once->executed);

    REQUIRE(h.proposals->flush_unsaved() == 0);
    flaky->fail_writes = false;
    REQUIRE(h.proposals->flush_unsaved() == 1);
    REQUIRE((**flaky->inner.get("proposal", p.id))["transactionHash"] == *signed_once->transaction_hash);
}

