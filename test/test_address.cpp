#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "ledgit/common/types.hpp"
#include <doctest/doctest.h>
#include <unordered_set>

using namespace ledgit;

TEST_SUITE("Address Tests") {

    TEST_CASE("Zero address detection") {
        CHECK(Address().isZero());
        CHECK(Address::zero().isZero());
        CHECK(Address("0x0000").isZero());
        CHECK_FALSE(Address("0x00a0").isZero());
    }

    TEST_CASE("Addresses are normalized to lowercase with 0x prefix") {
        Address a("0xABCDEF");
        Address b("abcdef");
        CHECK(a == b);
        CHECK(a.str() == "0xabcdef");
    }

    TEST_CASE("Derived addresses are deterministic and distinct") {
        auto alice1 = Address::derive("alice");
        auto alice2 = Address::derive("alice");
        auto bob = Address::derive("bob");

        CHECK(alice1 == alice2);
        CHECK(alice1 != bob);
        CHECK(alice1.str().size() == 42);
        CHECK_FALSE(alice1.isZero());
    }

    TEST_CASE("Addresses work as hash keys") {
        std::unordered_set<Address> set;
        set.insert(Address::derive("alice"));
        set.insert(Address::derive("alice"));
        set.insert(Address::derive("bob"));
        CHECK(set.size() == 2);
    }

    TEST_CASE("Call context carries caller, value and timestamp") {
        auto alice = Address::derive("alice");
        auto ctx = CallContext::at(alice, 1000, 5);
        CHECK(ctx.caller == alice);
        CHECK(ctx.value == 5);
        CHECK(ctx.timestamp == 1000);

        auto live = CallContext::now(alice);
        CHECK(live.timestamp > 0);
        CHECK(live.value == 0);
    }
}
