#include <catch2/catch_test_macros.hpp>

#include "groupsig/registry.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace test_helpers;
using grpsig::MemoryStore;
using grpsig::Registry;
using grpsig::RegistryEntry;

static RegistryEntry random_entry() {
    RegistryEntry e;
    e.A  = ecgroup::G1Point::get_random();
    e.pi = ecgroup::G1Point::get_random();
    return e;
}

TEST_CASE("MemoryStore", "[registry]") {
    MemoryStore store;

    REQUIRE(store.size() == 0);
    REQUIRE_FALSE(store.get("a").has_value());

    REQUIRE(store.put_if_absent("a", msg("one")));
    REQUIRE_FALSE(store.put_if_absent("a", msg("two")));
    REQUIRE(store.get("a").value() == msg("one"));
    REQUIRE(store.size() == 1);

    store.put_if_absent("b", msg("x"));
    store.put_if_absent("c", msg("y"));

    std::vector<std::string> seen;
    store.for_each([&](const std::string& k, const Bytes&) {
        seen.push_back(k);
        return k != "b";
    });
    REQUIRE(seen == std::vector<std::string>{"a", "b"});
}

TEST_CASE("MemoryStore concurrent inserts of one key", "[registry]") {
    MemoryStore store;
    std::atomic<int> winners{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&store, &winners, i] {
            if (store.put_if_absent("member", Bytes(1, static_cast<uint8_t>(i)))) ++winners;
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(winners.load() == 1);
    REQUIRE(store.size() == 1);
}

TEST_CASE("Registry of (A, pi) entries", "[registry]") {
    init_crypto();
    Registry gml(std::make_shared<MemoryStore>());

    RegistryEntry e1 = random_entry();
    RegistryEntry e2 = random_entry();

    SECTION("Ids are hex SHA-256 of A || pi") {
        std::string id = gml.add(e1);
        REQUIRE(id.size() == 64);
        REQUIRE(id == grpsig::utils::bytes_to_hex(
                          grpsig::utils::hash_all({e1.A.to_bytes(), e1.pi.to_bytes()})));
        REQUIRE(id == e1.id());
    }

    SECTION("Add, find and idempotence") {
        std::string id1 = gml.add(e1);
        REQUIRE(gml.add(e1) == id1);
        gml.add(e2);
        REQUIRE(gml.size() == 2);

        auto found = gml.find(id1);
        REQUIRE(found.has_value());
        REQUIRE(found->A == e1.A);
        REQUIRE(found->pi == e1.pi);
        REQUIRE_FALSE(gml.find("00").has_value());
        REQUIRE(gml.contains(e2.id()));
    }

    SECTION("Copies share the backing store") {
        Registry view = gml;
        gml.add(e1);
        REQUIRE(view.contains(e1.id()));
    }

    SECTION("Export / import") {
        gml.add(e1);
        gml.add(e2);
        Bytes snapshot = gml.export_bytes();

        Registry copy(std::make_shared<MemoryStore>());
        REQUIRE(copy.import_bytes(snapshot) == 2);
        REQUIRE(copy.import_bytes(snapshot) == 0);
        REQUIRE(copy.find(e1.id())->A == e1.A);

        Bytes truncated(snapshot.begin(), snapshot.end() - 1);
        Registry empty(std::make_shared<MemoryStore>());
        REQUIRE_THROWS_AS(empty.import_bytes(truncated), ecgroup::DecodeError);
        REQUIRE(empty.size() == 0);
    }

    SECTION("Import rejects a count the snapshot cannot hold") {
        REQUIRE_THROWS_AS(gml.import_bytes(Bytes{0xFF, 0xFF, 0xFF, 0xFF}), ecgroup::DecodeError);

        gml.add(e1);
        Bytes snapshot = gml.export_bytes();
        snapshot[3] = 2;
        Registry copy(std::make_shared<MemoryStore>());
        REQUIRE_THROWS_AS(copy.import_bytes(snapshot), ecgroup::DecodeError);
        REQUIRE(copy.size() == 0);
    }

    SECTION("Import rejects an id that does not match its entry") {
        Bytes forged;
        grpsig::utils::append_u32_be(forged, 1);
        grpsig::utils::append_lp(forged, grpsig::utils::to_bytes(e2.id()));
        grpsig::utils::append_lp(forged, e1.to_bytes());
        REQUIRE_THROWS_AS(gml.import_bytes(forged), ecgroup::DecodeError);
    }

    SECTION("Null store") {
        REQUIRE_THROWS_AS(Registry(nullptr), std::invalid_argument);
    }
}
