#include <catch2/catch_test_macros.hpp>
#include "cosign/crypto.hpp"
#include "cosign/state_store.hpp"
#include <filesystem>

using namespace cosign;

namespace {

std::filesystem::path scratch_dir() {
    auto dir = std::filesystem::temp_directory_path() / ("cosign-test-" + crypto::SecureRandom::hex(6));
    std::filesystem::create_directories(dir);
    return dir;
}

void exercise(StateStore &store) {
    REQUIRE(store.put("proposal", "p2", {{"id", "p2"}}).has_value());
    REQUIRE(store.put("proposal", "p1", {{"id", "p1"}}).has_value());
    REQUIRE(store.put("validator", "v1", {{"id", "v1"}}).has_value());

    auto p1 = store.get("proposal", "p1");
    REQUIRE(p1.has_value());
    REQUIRE(p1->has_value());
    REQUIRE((**p1)["id"] == "p1");
    REQUIRE_FALSE(store.get("proposal", "p9")->has_value());

    auto proposals = store.list("proposal");
    REQUIRE(proposals.has_value());
    REQUIRE(proposals->size() == 2);
    REQUIRE((*proposals)[0]["id"] == "p1");
    REQUIRE((*proposals)[1]["id"] == "p2");

    REQUIRE(store.insert("proposal_signature", "p1:v1", {{"validatorId", "v1"}}).has_value());
    auto dup = store.insert("proposal_signature", "p1:v1", {{"validatorId", "v1"}});
    REQUIRE_FALSE(dup.has_value());
    REQUIRE(dup.error().code == ErrorCode::AlreadyExists);

    // "proposal" must not pick up "proposal_signature" rows
    REQUIRE(store.list("proposal")->size() == 2);
    REQUIRE(store.list("proposal_signature")->size() == 1);

    REQUIRE(store.put("proposal", "p1", {{"id", "p1"}, {"status", "executed"}}).has_value());
    REQUIRE((**store.get("proposal", "p1"))["status"] == "executed");
}

} // namespace

TEST_CASE("Memory state store", "[storage]") {
    MemoryStateStore store;
    exercise(store);
}

TEST_CASE("RocksDB state store", "[storage][rocksdb]") {
    auto dir = scratch_dir();
    StorageConfig cfg;
    cfg.rocksdb_path = (dir / "db").string();

    SECTION("Plain records persist across reopen") {
        {
            RocksDbStateStore store(cfg, std::nullopt);
            exercise(store);
        }
        RocksDbStateStore reopened(cfg, std::nullopt);
        REQUIRE(reopened.list("proposal")->size() == 2);
        REQUIRE(reopened.get("validator", "v1")->has_value());
    }

    SECTION("Encrypted records need the key") {
        cfg.encrypt_at_rest = true;
        auto key = crypto::AES256GCM::generate_key();
        {
            RocksDbStateStore store(cfg, key);
            exercise(store);
        }
        {
            RocksDbStateStore reopened(cfg, key);
            REQUIRE((**reopened.get("proposal", "p2"))["id"] == "p2");
        }

        RocksDbStateStore wrong_key(cfg, crypto::AES256GCM::generate_key());
        REQUIRE_FALSE(wrong_key.get("proposal", "p2").has_value());
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("open_state_store honours the backend setting", "[storage]") {
    CosignConfig cfg;
    cfg.storage.backend = "memory";
    auto store = open_state_store(cfg);
    REQUIRE(store.has_value());
    REQUIRE(dynamic_cast<MemoryStateStore *>(store->get()) != nullptr);

    cfg.storage.backend = "postgres";
    REQUIRE_FALSE(open_state_store(cfg).has_value());
}
