#include <catch2/catch_test_macros.hpp>
#include "cosign/audit.hpp"

using namespace cosign;

namespace {

AuditEvent event(const std::string &action, const std::string &resource) {
    return AuditEvent{1'700'000'000'000, "alice", action, resource, "ok", {{"n", 1}}};
}

} // namespace

TEST_CASE("Audit trail chains hashes", "[audit]") {
    AuditTrail trail;
    REQUIRE_FALSE(trail.head().has_value());
    REQUIRE(trail.verify());

    auto h1 = trail.append(event("proposal.created", "p1"));
    auto h2 = trail.append(event("proposal.signed", "p1"));
    REQUIRE(h1.size() == 64);
    REQUIRE(h1 != h2);
    REQUIRE(trail.head() == h2);
    REQUIRE(trail.size() == 2);
    REQUIRE(trail.verify());
}

TEST_CASE("Audit chain depends on order", "[audit]") {
    AuditTrail a;
    a.append(event("proposal.created", "p1"));
    a.append(event("proposal.cancelled", "p1"));

    AuditTrail b;
    b.append(event("proposal.cancelled", "p1"));
    b.append(event("proposal.created", "p1"));

    AuditTrail c;
    c.append(event("proposal.created", "p1"));
    c.append(event("proposal.cancelled", "p1"));

    REQUIRE(a.head() != b.head());
    REQUIRE(a.head() == c.head());
}

TEST_CASE("Audit events serialize with ISO timestamps", "[audit]") {
    auto j = event("validator.added", "v1").to_json();
    REQUIRE(j["ts"] == "2023-11-14T22:13:20.000Z");
    REQUIRE(j["action"] == "validator.added");
    REQUIRE(j["details"]["n"] == 1);
}
