#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <ledgit/evolving/evolving_registry.hpp>
#include <ledgit/storage/event_journal.hpp>
#include <ledgit/storage/snapshot_store.hpp>

using namespace ledgit;
using namespace ledgit::storage;

// Test helper: cleanup storage directory
struct TestStore {
    std::string path;
    SnapshotStore store;

    explicit TestStore(const std::string &name) : path(name + "_snapshots") { cleanup(); }

    ~TestStore() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }
};

namespace {
    evolving::EvolvingState sampleState() {
        evolving::EvolvingRegistry registry(Address::derive("admin"));
        auto fee = registry.config().creation_fee;
        auto alice = Address::derive("alice");
        auto first = registry.create(CallContext::at(alice, 1000, fee));
        auto second = registry.create(CallContext::at(alice, 1001, fee));
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        return registry.snapshot();
    }
} // namespace

// ===========================================
// Snapshot store
// ===========================================

TEST_CASE("Snapshot store lifecycle") {
    TestStore test_store("test_snapshot_lifecycle");

    SUBCASE("Open creates the directory") {
        CHECK(test_store.store.open(String(test_store.path.c_str())).is_ok());
        CHECK(test_store.store.isOpen());
        CHECK(std::filesystem::exists(test_store.path));

        test_store.store.close();
        CHECK_FALSE(test_store.store.isOpen());
    }

    SUBCASE("Operations on a closed store fail") {
        auto state = sampleState();
        auto saved = test_store.store.save("evolving", state);
        REQUIRE(saved.is_err());
        CHECK(saved.error().code == ERR_STORE_NOT_OPEN);

        auto loaded = test_store.store.load<evolving::EvolvingState>("evolving");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == ERR_STORE_NOT_OPEN);
        CHECK_FALSE(test_store.store.exists("evolving"));
    }
}

TEST_CASE("Snapshot save and load") {
    TestStore test_store("test_snapshot_roundtrip");
    REQUIRE(test_store.store.open(String(test_store.path.c_str())).is_ok());

    auto state = sampleState();
    REQUIRE(test_store.store.save("evolving", state).is_ok());
    CHECK(test_store.store.exists("evolving"));
    CHECK_FALSE(std::filesystem::exists(test_store.store.path() / "evolving.snap.tmp"));

    auto loaded = test_store.store.load<evolving::EvolvingState>("evolving");
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value().next_id == 3);
    REQUIRE(loaded.value().blocks.size() == 2);
    CHECK(loaded.value().blocks[0].id == 1);
    CHECK(loaded.value().blocks[1].birth_time == 1001);
    CHECK(loaded.value().blocks[1].getOwner() == Address::derive("alice"));

    SUBCASE("Saving again replaces the snapshot") {
        evolving::EvolvingState empty;
        empty.next_id = 1;
        REQUIRE(test_store.store.save("evolving", empty).is_ok());
        auto reloaded = test_store.store.load<evolving::EvolvingState>("evolving");
        REQUIRE(reloaded.is_ok());
        CHECK(reloaded.value().blocks.size() == 0);
    }

    SUBCASE("Remove deletes the snapshot") {
        REQUIRE(test_store.store.remove("evolving").is_ok());
        CHECK_FALSE(test_store.store.exists("evolving"));
    }
}

TEST_CASE("Missing and damaged snapshots") {
    TestStore test_store("test_snapshot_damaged");
    REQUIRE(test_store.store.open(String(test_store.path.c_str())).is_ok());

    SUBCASE("Missing snapshot is not found") {
        auto loaded = test_store.store.load<evolving::EvolvingState>("nothing");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == Error::not_found("").code);
    }

    SUBCASE("Truncated snapshot fails to load") {
        {
            std::ofstream out(test_store.store.path() / "broken.snap", std::ios::binary);
            u32 len = 64;
            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write("abc", 3);
        }
        auto loaded = test_store.store.load<evolving::EvolvingState>("broken");
        REQUIRE(loaded.is_err());
        CHECK(loaded.error().code == ERR_DESERIALIZATION_FAILED);
    }
}

// ===========================================
// Event journal
// ===========================================

TEST_CASE("Event journal") {
    TestStore test_store("test_event_journal");
    std::string file = test_store.path + "/events.log";

    SUBCASE("Append before open fails") {
        EventJournal journal;
        auto result = journal.append(Event(EventType::Transfer, "TokenLedger", 1));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_STORE_NOT_OPEN);
    }

    SUBCASE("Events read back in append order") {
        {
            EventJournal journal;
            REQUIRE(journal.open(String(file.c_str())).is_ok());
            journal.publish(Event(EventType::BlockCreated, "EvolvingRegistry", 10).withNumber("block_id", 1));
            journal.publish(Event(EventType::BlockEvolved, "EvolvingRegistry", 20).withNumber("power", 200));
            CHECK(journal.appendedCount() == 2);
        }

        EventJournal reopened;
        REQUIRE(reopened.open(String(file.c_str())).is_ok());
        REQUIRE(reopened.append(Event(EventType::Transfer, "TokenLedger", 30)).is_ok());

        auto events = reopened.readAll();
        REQUIRE(events.is_ok());
        REQUIRE(events.value().size() == 3);
        CHECK(events.value()[0].getType() == EventType::BlockCreated);
        CHECK(events.value()[0].get("block_id") == "1");
        CHECK(events.value()[1].get("power") == "200");
        CHECK(events.value()[2].getContract() == "TokenLedger");
        CHECK(reopened.appendedCount() == 1);
    }
}
