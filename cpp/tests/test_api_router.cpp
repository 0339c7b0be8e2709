#include <catch2/catch_test_macros.hpp>
#include "cosign/api_router.hpp"
#include "test_support.hpp"
#include <cstdint>
#include <limits>

using namespace cosign;
using namespace cosign::testing;
namespace http = boost::beast::http;

namespace {

struct ApiFixture
{
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<ScriptedBroadcaster> broadcaster = std::make_shared<ScriptedBroadcaster>();
    std::shared_ptr<Engine> engine;
    std::unique_ptr<ApiRouter> router;
    std::map<std::string, DeviceKey> devices;

    ApiFixture()
    {
        CosignConfig cfg;
        cfg.storage.backend = "memory";
        EngineCollaborators collaborators;
        collaborators.store = std::make_shared<MemoryStateStore>();
        collaborators.broadcaster = broadcaster;
        collaborators.clock = clock;
        engine = std::make_shared<Engine>(cfg, collaborators);
        router = std::make_unique<ApiRouter>(engine);
    }

    std::string token(const std::string &user) const
    {
        return engine->authenticator()->issue(user);
    }

    ApiRouter::Response call(http::verb verb, const std::string &target, const std::string &user = "",
                             const nlohmann::json &body = nullptr) const
    {
        ApiRouter::Request req{verb, target, 11};
        if (!user.empty())
            req.set(http::field::authorization, "Bearer " + token(user));
        if (!body.is_null())
        {
            req.set(http::field::content_type, "application/json");
            req.body() = body.dump();
        }
        req.prepare_payload();
        return router->handle(req);
    }

    static nlohmann::json body_of(const ApiRouter::Response &res)
    {
        return nlohmann::json::parse(res.body());
    }

    ApiRouter::Response add_validator(const std::string &user, const std::string &id, const std::string &type)
    {
        auto keys = crypto::Ed25519KeyPair::generate().value();
        nlohmann::json body = {{"id", id}, {"type", type}, {"name", id}, {"publicKey", keys.public_key_b64()}};
        if (type == "social")
            body["metadata"] = {{"email", user + "@example.com"}, {"provider", "google"}, {"publicAddress", "0x" + id}};
        auto res = call(http::verb::post, "/api/validators", user, body);
        if (res.result() == http::status::created)
        {
            auto v = engine->registry()->get(id).value();
            devices.insert_or_assign(id, DeviceKey{keys, v});
        }
        return res;
    }

    nlohmann::json sign_body(const std::string &validator_id, const Proposal &p) const
    {
        return {{"validatorId", validator_id}, {"signature", sign_payload(devices.at(validator_id), p)}};
    }
};

} // namespace

TEST_CASE("Health needs no token, the API does", "[api]")
{
    ApiFixture f;
    auto health = f.call(http::verb::get, "/health");
    REQUIRE(health.result() == http::status::ok);
    REQUIRE(ApiFixture::body_of(health)["status"] == "ok");

    auto anonymous = f.call(http::verb::get, "/api/validators");
    REQUIRE(anonymous.result() == http::status::unauthorized);
    REQUIRE(ApiFixture::body_of(anonymous)["code"] == "AuthError");

    ApiRouter::Request req{http::verb::get, "/api/validators", 11};
    req.set(http::field::authorization, "Bearer not.a.token");
    REQUIRE(f.router->handle(req).result() == http::status::unauthorized);

    ApiRouter::Request query_token{http::verb::get, "/api/validators?token=" + f.token("alice"), 11};
    REQUIRE(f.router->handle(query_token).result() == http::status::ok);

    REQUIRE(f.call(http::verb::get, "/api/nowhere", "alice").result() == http::status::not_found);
    REQUIRE(f.call(http::verb::put, "/api/validators", "alice").result() == http::status::method_not_allowed);
}

TEST_CASE("Validator management over HTTP", "[api]")
{
    ApiFixture f;

    auto first = f.add_validator("alice", "social_1", "social");
    REQUIRE(first.result() == http::status::created);
    REQUIRE(ApiFixture::body_of(first)["data"]["validator"]["owner"] == "alice");

    SECTION("Outsiders cannot add validators to an existing account")
    {
        auto res = f.add_validator("bob", "social_bob", "social");
        REQUIRE(res.result() == http::status::forbidden);
    }

    SECTION("A second device upgrades the policy")
    {
        REQUIRE(f.add_validator("alice", "passkey_1", "passkey").result() == http::status::created);
        auto list = ApiFixture::body_of(f.call(http::verb::get, "/api/validators", "alice"))["data"];
        REQUIRE(list["validators"].size() == 2);
        REQUIRE(list["policy"]["threshold"] == 2);
        REQUIRE(list["isMultiSig"] == true);

        auto removed = f.call(http::verb::delete_, "/api/validators/passkey_1", "alice");
        REQUIRE(removed.result() == http::status::ok);
        REQUIRE(ApiFixture::body_of(removed)["data"]["policy"]["threshold"] == 1);

        auto last = f.call(http::verb::delete_, "/api/validators/social_1", "alice");
        REQUIRE(last.result() == http::status::conflict);
        REQUIRE(ApiFixture::body_of(last)["code"] == "LastValidatorRemoval");
    }

    SECTION("Policy updates are validated")
    {
        REQUIRE(f.add_validator("alice", "passkey_1", "passkey").result() == http::status::created);
        auto bad = f.call(http::verb::post, "/api/policy", "alice", {{"threshold", 3}});
        REQUIRE(bad.result() == http::status::bad_request);
        REQUIRE(ApiFixture::body_of(bad)["code"] == "InvalidThreshold");

        auto ok = f.call(http::verb::post, "/api/policy", "alice",
                         {{"requireMultiSig", false}, {"threshold", 1}, {"highValueThreshold", "10"}});
        REQUIRE(ok.result() == http::status::ok);

        auto low = ApiFixture::body_of(f.call(http::verb::get, "/api/policy/requires-multisig?value=5", "alice"));
        REQUIRE(low["data"]["requiresMultiSig"] == false);
        auto high = ApiFixture::body_of(f.call(http::verb::get, "/api/policy/requires-multisig?value=10.5", "alice"));
        REQUIRE(high["data"]["requiresMultiSig"] == true);

        REQUIRE(f.call(http::verb::post, "/api/policy", "bob", {{"threshold", 1}}).result() == http::status::forbidden);
    }
}

TEST_CASE("Proposal lifecycle over HTTP", "[api]")
{
    ApiFixture f;
    REQUIRE(f.add_validator("alice", "social_1", "social").result() == http::status::created);
    REQUIRE(f.add_validator("alice", "passkey_1", "passkey").result() == http::status::created);

    auto created = f.call(http::verb::post, "/api/multisig/proposals", "alice",
                          {{"to", "0xABC"}, {"value", "1.0"}, {"metadata", {{"title", "Rent"}}}});
    REQUIRE(created.result() == http::status::created);
    auto pj = ApiFixture::body_of(created)["data"];
    REQUIRE(pj["requiredSignatures"] == 2);
    REQUIRE(pj["validatorIds"].size() == 2);
    REQUIRE(pj["status"] == "pending");
    auto proposal = Proposal::from_json(pj).value();
    auto path = "/api/multisig/proposals/" + proposal.id;

    SECTION("Numeric values are refused")
    {
        auto res = f.call(http::verb::post, "/api/multisig/proposals", "alice", {{"to", "0xABC"}, {"value", 1.0}});
        REQUIRE(res.result() == http::status::bad_request);
    }

    SECTION("Strangers cannot read or sign")
    {
        REQUIRE(f.call(http::verb::get, path, "mallory").result() == http::status::forbidden);
        auto res = f.call(http::verb::post, path + "/sign", "mallory", f.sign_body("social_1", proposal));
        REQUIRE(res.result() == http::status::forbidden);
    }

    SECTION("Two signatures execute")
    {
        auto first = f.call(http::verb::post, path + "/sign", "alice", f.sign_body("social_1", proposal));
        REQUIRE(first.result() == http::status::ok);
        REQUIRE(ApiFixture::body_of(first)["data"]["executed"] == false);

        auto preflight = ApiFixture::body_of(f.call(http::verb::get, path + "/preflight", "alice"));
        REQUIRE(preflight["data"]["canExecute"] == false);
        auto estimate = ApiFixture::body_of(f.call(http::verb::get, path + "/estimate", "alice"));
        REQUIRE(estimate["data"]["gasLimit"] == "150000");

        auto dup = f.call(http::verb::post, path + "/sign", "alice", f.sign_body("social_1", proposal));
        REQUIRE(dup.result() == http::status::conflict);
        REQUIRE(ApiFixture::body_of(dup)["code"] == "AlreadySigned");

        auto second = f.call(http::verb::post, path + "/sign", "alice", f.sign_body("passkey_1", proposal));
        REQUIRE(second.result() == http::status::ok);
        auto outcome = ApiFixture::body_of(second)["data"];
        REQUIRE(outcome["executed"] == true);
        REQUIRE(outcome["proposal"]["status"] == "executed");
        REQUIRE(outcome["transactionHash"].is_string());

        auto cancel = f.call(http::verb::delete_, path, "alice");
        REQUIRE(cancel.result() == http::status::conflict);
        REQUIRE(ApiFixture::body_of(cancel)["code"] == "AlreadyResolved");

        auto executed = ApiFixture::body_of(
            f.call(http::verb::get, "/api/multisig/proposals?status=executed", "alice"))["data"];
        REQUIRE(executed.size() == 1);
    }

    SECTION("Expired proposals answer 410")
    {
        f.clock->set(proposal.expires_at + 1);
        auto res = f.call(http::verb::post, path + "/sign", "alice", f.sign_body("social_1", proposal));
        REQUIRE(res.result() == http::status::gone);
        REQUIRE(ApiFixture::body_of(res)["code"] == "Expired");
    }

    SECTION("Bad signatures answer 400")
    {
        auto body = f.sign_body("social_1", proposal);
        body["signature"] = f.sign_body("passkey_1", proposal)["signature"];
        auto res = f.call(http::verb::post, path + "/sign", "alice", body);
        REQUIRE(res.result() == http::status::bad_request);
        REQUIRE(ApiFixture::body_of(res)["code"] == "InvalidSignature");

        auto missing = f.call(http::verb::post, path + "/sign", "alice", {{"validatorId", "social_1"}});
        REQUIRE(missing.result() == http::status::bad_request);
    }

    SECTION("The creator cancels")
    {
        auto res = f.call(http::verb::delete_, path, "alice");
        REQUIRE(res.result() == http::status::ok);
        REQUIRE(ApiFixture::body_of(res)["data"]["status"] == "cancelled");
    }

    SECTION("Sync and notifications")
    {
        auto sync = ApiFixture::body_of(f.call(http::verb::get, "/api/sync", "alice"))["data"];
        REQUIRE(sync["pendingProposals"].size() == 1);
        REQUIRE(sync["recentNotifications"].size() == 1);

        auto note_id = sync["recentNotifications"][0]["id"].get<std::string>();
        auto read = f.call(http::verb::post, "/api/notifications/" + note_id + "/read", "alice");
        REQUIRE(read.result() == http::status::ok);
        REQUIRE(f.call(http::verb::post, "/api/notifications/nope/read", "alice").result() == http::status::not_found);

        auto device = f.call(http::verb::post, "/api/devices", "alice",
                             {{"type", "push"}, {"endpoint", "token-1"}, {"deviceId", "dev-1"}});
        REQUIRE(device.result() == http::status::ok);
        REQUIRE(f.engine->hub()->channels("alice").size() == 1);
        REQUIRE(f.call(http::verb::post, "/api/devices", "alice", {{"type", "pigeon"}, {"endpoint", "x"}}).result() ==
                http::status::bad_request);
    }
}

TEST_CASE("Sync returns every pending proposal", "[api]")
{
    ApiFixture f;
    REQUIRE(f.add_validator("alice", "social_1", "social").result() == http::status::created);
    for (int i = 0; i < 60; ++i)
    {
        auto res = f.call(http::verb::post, "/api/multisig/proposals", "alice",
                          {{"to", "0xABC"}, {"value", "0.1"}, {"metadata", {{"title", "Payout " + std::to_string(i)}}}});
        REQUIRE(res.result() == http::status::created);
    }

    auto sync = ApiFixture::body_of(f.call(http::verb::get, "/api/sync", "alice"))["data"];
    REQUIRE(sync["pendingProposals"].size() == 60);
    REQUIRE(sync["recentNotifications"].size() == 20);
}

TEST_CASE("Proposal lifetimes must be representable", "[api]")
{
    ApiFixture f;
    REQUIRE(f.add_validator("alice", "social_1", "social").result() == http::status::created);
    auto create = [&](const nlohmann::json &expires_in)
    {
        return f.call(http::verb::post, "/api/multisig/proposals", "alice",
                      {{"to", "0xABC"}, {"value", "1.0"}, {"expiresIn", expires_in}});
    };

    auto huge = create(10'000'000'000'000'000LL);
    REQUIRE(huge.result() == http::status::bad_request);
    REQUIRE(ApiFixture::body_of(huge)["code"] == "InvalidInput");
    REQUIRE(create(1e16).result() == http::status::bad_request);
    REQUIRE(create(90.5).result() == http::status::bad_request);
    REQUIRE(create(std::numeric_limits<std::uint64_t>::max()).result() == http::status::bad_request);
    REQUIRE(f.engine->proposals()->list_for_user("alice", ProposalFilter{}).empty());

    auto hour = create(3600);
    REQUIRE(hour.result() == http::status::created);
    REQUIRE(ApiFixture::body_of(hour)["data"]["expiresAt"] == kEpoch + 3600 * 1000);
}

TEST_CASE("Real-time control messages", "[api][ws]")
{
    ApiFixture f;

    auto pong = nlohmann::json::parse(f.router->handle_socket_message("alice", "c1", R"({"type":"ping"})"));
    REQUIRE(pong["type"] == "pong");

    auto sub = nlohmann::json::parse(f.router->handle_socket_message("alice", "c1", R"({"type":"subscribe_proposals"})"));
    REQUIRE(sub["type"] == "subscribed");

    auto sync = nlohmann::json::parse(f.router->handle_socket_message("alice", "c1", R"({"type":"request_sync"})"));
    REQUIRE(sync["type"] == "sync_data");
    REQUIRE(sync["data"]["pendingProposals"].empty());

    auto device = nlohmann::json::parse(f.router->handle_socket_message(
        "alice", "c1", R"({"type":"device_info","data":{"deviceId":"d1","name":"Pixel","platform":"android"}})"));
    REQUIRE(device["type"] == "device_registered");
    REQUIRE(f.engine->hub()->devices("alice").size() == 1);

    auto unknown = nlohmann::json::parse(f.router->handle_socket_message("alice", "c1", R"({"type":"dance"})"));
    REQUIRE(unknown["type"] == "error");
    auto garbage = nlohmann::json::parse(f.router->handle_socket_message("alice", "c1", "{{{"));
    REQUIRE(garbage["type"] == "error");
}

TEST_CASE("Request targets are decoded", "[api]")
{
    auto t = RequestTarget::parse("/api/policy/requires-multisig?value=1.5&note=a%20b+c&flag");
    REQUIRE(t.path == "/api/policy/requires-multisig");
    REQUIRE(t.query["value"] == "1.5");
    REQUIRE(t.query["note"] == "a b c");
    REQUIRE(t.query.contains("flag"));
}

TEST_CASE("Error codes map to HTTP statuses", "[api]")
{
    REQUIRE(ApiRouter::status_for(ErrorCode::NotFound) == http::status::not_found);
    REQUIRE(ApiRouter::status_for(ErrorCode::Unauthorized) == http::status::forbidden);
    REQUIRE(ApiRouter::status_for(ErrorCode::AlreadySigned) == http::status::conflict);
    REQUIRE(ApiRouter::status_for(ErrorCode::Expired) == http::status::gone);
    REQUIRE(ApiRouter::status_for(ErrorCode::StaleSignature) == http::status::bad_request);
    REQUIRE(ApiRouter::status_for(ErrorCode::ExecutionFailed) == http::status::internal_server_error);

    REQUIRE(error_code_name(ErrorCode::NotPending) == "NotPending");
    REQUIRE(error_code_name(ErrorCode::LastValidatorRemoval) == "LastValidatorRemoval");
    REQUIRE(error_code_name(ErrorCode::InvalidInput) == "InvalidInput");
}
