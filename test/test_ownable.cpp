#include "ledgit/ownership/ownable.hpp"
#include <doctest/doctest.h>

using namespace ledgit;

TEST_SUITE("Ownable Tests") {

    TEST_CASE("Owner can transfer ownership") {
        auto alice = Address::derive("alice");
        auto bob = Address::derive("bob");
        auto sink = std::make_shared<MemoryEventSink>();

        Ownable ownable("TestContract", alice);
        ownable.setEventSink(sink);

        CHECK(ownable.isOwner(alice));
        auto result = ownable.transferOwnership(CallContext::at(alice, 10), bob);
        REQUIRE(result.is_ok());

        CHECK(ownable.owner() == bob);
        CHECK_FALSE(ownable.isOwner(alice));

        REQUIRE(sink->size() == 1);
        auto event = sink->last();
        CHECK(event.getType() == EventType::OwnershipTransferred);
        CHECK(event.getContract() == "TestContract");
        CHECK(event.get("previous_owner") == alice.str());
        CHECK(event.get("new_owner") == bob.str());
    }

    TEST_CASE("Non-owner cannot transfer ownership") {
        auto alice = Address::derive("alice");
        auto mallory = Address::derive("mallory");
        auto sink = std::make_shared<MemoryEventSink>();

        Ownable ownable("TestContract", alice);
        ownable.setEventSink(sink);

        auto result = ownable.transferOwnership(CallContext::at(mallory, 10), mallory);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_NOT_OWNER);
        CHECK(ownable.owner() == alice);
        CHECK(sink->size() == 0);
    }

    TEST_CASE("Transfer to the zero address is rejected") {
        auto alice = Address::derive("alice");
        Ownable ownable("TestContract", alice);

        auto result = ownable.transferOwnership(CallContext::at(alice, 10), Address::zero());
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_ZERO_ADDRESS);
        CHECK(ownable.owner() == alice);
    }

    TEST_CASE("requireOwner reports NotOwner") {
        auto alice = Address::derive("alice");
        Ownable ownable("TestContract", alice);

        CHECK(ownable.requireOwner(alice).is_ok());
        auto denied = ownable.requireOwner(Address::derive("bob"));
        REQUIRE(denied.is_err());
        CHECK(denied.error().code == ERR_NOT_OWNER);
    }

    TEST_CASE("Zero owner is never the owner") {
        Ownable ownable("TestContract", Address());
        CHECK_FALSE(ownable.isOwner(Address()));
        CHECK_FALSE(ownable.isOwner(Address::zero()));
    }
}
