#include <doctest/doctest.h>

#include <algorithm>
#include <atomic>
#include <ledgit/ledgit.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace ledgit;

namespace {
    // Reads the supply when the ownership change is published
    class SupplyAtHandoff : public EventSink {
      public:
        const token::TokenLedger *ledger = nullptr;
        std::atomic<dp::u64> supply{0};
        std::atomic<bool> seen{false};

        void publish(const Event &event) override {
            if (event.getType() == EventType::OwnershipTransferred && ledger != nullptr) {
                supply = ledger->totalSupply();
                seen = true;
            }
        }
    };
} // namespace

TEST_SUITE("Concurrency Tests") {

    TEST_CASE("Concurrent transfers preserve total supply") {
        auto bank = Address::derive("bank");
        token::TokenConfig config;
        config.initial_supply = 8000;
        auto sink = std::make_shared<MemoryEventSink>();
        token::TokenLedger ledger(CallContext::at(bank, 1), config, sink);

        const int workers = 8;
        std::vector<Address> accounts;
        for (int i = 0; i < workers; ++i) {
            accounts.push_back(Address::derive("account-" + std::to_string(i)));
            REQUIRE(ledger.transfer(CallContext::at(bank, 2), accounts.back(), 1000).is_ok());
        }

        std::atomic<int> succeeded{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < workers; ++i) {
            threads.emplace_back([&, i]() {
                const auto &from = accounts[i];
                const auto &to = accounts[(i + 1) % workers];
                for (int n = 0; n < 200; ++n) {
                    if (ledger.transfer(CallContext::at(from, 3 + n), to, 7).is_ok()) {
                        ++succeeded;
                    }
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }

        dp::u64 sum = 0;
        for (const auto &account : accounts) {
            sum += ledger.balanceOf(account);
        }
        CHECK(sum == 8000);
        CHECK(ledger.totalSupply() == 8000);
        CHECK(ledger.balanceOf(bank) == 0);
        CHECK(sink->eventsOfType(EventType::Transfer).size() == static_cast<size_t>(1 + workers + succeeded.load()));
    }

    TEST_CASE("Concurrent creation assigns unique ids") {
        evolving::EvolvingRegistry registry(Address::derive("admin"));
        auto fee = registry.config().creation_fee;

        const int workers = 4;
        const int per_worker = 50;
        std::atomic<int> failed{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < workers; ++i) {
            threads.emplace_back([&, i]() {
                auto owner = Address::derive("creator-" + std::to_string(i));
                for (int n = 0; n < per_worker; ++n) {
                    if (!registry.create(CallContext::at(owner, 1000 + n, fee)).is_ok()) {
                        ++failed;
                    }
                }
            });
        }
        for (auto &t : threads) {
            t.join();
        }

        CHECK(failed.load() == 0);
        CHECK(registry.totalBlocks() == static_cast<size_t>(workers * per_worker));
        CHECK(registry.collectedFees() == fee * workers * per_worker);

        std::vector<dp::u64> all;
        for (int i = 0; i < workers; ++i) {
            auto ids = registry.getBlocksOf(Address::derive("creator-" + std::to_string(i)));
            CHECK(ids.size() == static_cast<size_t>(per_worker));
            all.insert(all.end(), ids.begin(), ids.end());
        }
        std::sort(all.begin(), all.end());
        CHECK(std::adjacent_find(all.begin(), all.end()) == all.end());
        CHECK(all.front() == 1);
        CHECK(all.back() == static_cast<dp::u64>(workers * per_worker));
    }

    TEST_CASE("Ownership handoff stops the previous owner minting") {
        auto owner = Address::derive("owner");
        auto successor = Address::derive("successor");
        auto handoff = std::make_shared<SupplyAtHandoff>();
        token::TokenLedger ledger(CallContext::at(owner, 1));
        handoff->ledger = &ledger;
        ledger.setEventSink(handoff);

        std::atomic<bool> stop{false};
        std::atomic<int> minted{0};
        std::thread minter([&]() {
            while (!stop) {
                if (ledger.mint(CallContext::at(owner, 2), owner, 1).is_ok()) {
                    ++minted;
                }
            }
        });

        while (minted.load() < 100) {
            std::this_thread::yield();
        }
        REQUIRE(ledger.transferOwnership(CallContext::at(owner, 3), successor).is_ok());
        for (int i = 0; i < 1000; ++i) {
            std::this_thread::yield();
        }
        stop = true;
        minter.join();

        REQUIRE(handoff->seen.load());
        CHECK(ledger.owner() == successor);
        CHECK(ledger.totalSupply() == static_cast<dp::u64>(minted.load()));
        CHECK(ledger.totalSupply() == handoff->supply.load());
    }
}

