#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "cosign/expiration_sweeper.hpp"
#include <boost/asio/io_context.hpp>
#include <thread>

using namespace cosign;
using namespace cosign::testing;

TEST_CASE("Sweeper expires only overdue pending proposals", "[sweeper]")
{
    Harness h;
    h.add_device("v1", ValidatorKind::Social, "alice");
    h.add_device("v2", ValidatorKind::Passkey, "alice");

    ProposalDraft short_lived;
    short_lived.created_by = "alice";
    short_lived.to = "0xABC";
    short_lived.value = "0.5";
    short_lived.validator_ids = {"v1", "v2"};
    short_lived.required_signatures = 2;
    short_lived.ttl_secs = 60;

    auto overdue = h.proposals->create(short_lived).value();
    auto cancelled = h.proposals->create(short_lived).value();
    auto long_lived = h.propose({"v1", "v2"}, 2);
    REQUIRE(h.proposals->cancel(cancelled.id, "alice").has_value());

    auto conn = std::make_shared<RecordingConnection>("c1");
    h.hub->subscribe("alice", conn);

    boost::asio::io_context ioc;
    auto sweeper = std::make_shared<ExpirationSweeper>(h.proposals, ioc.get_executor(), SweeperConfig{1});

    REQUIRE(sweeper->sweep_once(h.clock->now_ms()) == 0);

    h.clock->advance_secs(61);
    REQUIRE(sweeper->sweep_once(h.clock->now_ms()) == 1);

    REQUIRE(h.proposals->get(overdue.id)->status == ProposalStatus::Expired);
    REQUIRE(h.proposals->get(cancelled.id)->status == ProposalStatus::Cancelled);
    REQUIRE(h.proposals->get(long_lived.id)->status == ProposalStatus::Pending);
    REQUIRE(conn->notification_types() == std::vector<std::string>{"proposal_expired"});

    SECTION("A second sweep finds nothing")
    {
        REQUIRE(sweeper->sweep_once(h.clock->now_ms()) == 0);
    }
}

TEST_CASE("Sweeper start and stop", "[sweeper]")
{
    Harness h;
    boost::asio::io_context ioc;
    auto sweeper = std::make_shared<ExpirationSweeper>(h.proposals, ioc.get_executor(), SweeperConfig{1});

    REQUIRE_FALSE(sweeper->running());
    sweeper->start();
    REQUIRE(sweeper->running());
    sweeper->stop();
    REQUIRE_FALSE(sweeper->running());

    // the cancelled timer lets the loop run dry
    ioc.run();
}

TEST_CASE("Sweeper and signer racing resolve to one outcome", "[sweeper][concurrency]")
{
    for (int round = 0; round < 20; ++round)
    {
        Harness h;
        h.add_device("v1", ValidatorKind::Social, "alice");
        auto p = h.propose({"v1"}, 1);
        auto req = h.request_for("v1", p);

        h.clock->set(p.expires_at + 1);
        boost::asio::io_context ioc;
        auto sweeper = std::make_shared<ExpirationSweeper>(h.proposals, ioc.get_executor(), SweeperConfig{1});

        std::thread sweeping([&] { sweeper->sweep_once(h.clock->now_ms()); });
        auto res = h.collector->sign(req);
        sweeping.join();

        // the deadline has passed, so neither path may execute
        REQUIRE_FALSE(res.has_value());
        auto code = res.error().code;
        REQUIRE((code == ErrorCode::Expired || code == ErrorCode::NotPending));
        REQUIRE(h.proposals->get(p.id)->status == ProposalStatus::Expired);
        REQUIRE(h.broadcaster->calls == 0);
    }
}
