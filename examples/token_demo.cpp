/**
 * Token Demo - persistent ledger through the Ledgit facade
 *
 * Run it twice: the second run restores the balances from ledgit_demo_data/
 * instead of minting the genesis supply again.
 */

#include <iostream>
#include <ledgit/ledgit.hpp>

using namespace ledgit;

int main() {
    std::cout << "=== Ledgit Token Demo ===\n\n";

    LedgitConfig config;
    config.owner = Address::derive("treasury");
    config.token_config.initial_supply = 1000000;

    auto fanout = std::make_shared<FanoutEventSink>();
    fanout->addSink(std::make_shared<ConsoleEventSink>());
    auto journal = std::make_shared<storage::EventJournal>();
    if (journal->open("ledgit_demo_data/events.log").is_ok()) {
        fanout->addSink(journal);
    }

    Ledgit ledgit(config, fanout);
    auto init = ledgit.initialize("ledgit_demo_data");
    if (!init.is_ok()) {
        std::cerr << "Failed to initialize: " << init.error().message.c_str() << "\n";
        return 1;
    }
    std::cout << "✓ Ledger ready\n";

    auto &token = ledgit.tokenLedger();
    auto treasury = config.owner;
    auto alice = Address::derive("alice");
    auto bob = Address::derive("bob");

    if (!token.transfer(CallContext::now(treasury), alice, 500).is_ok()) {
        std::cerr << "Transfer failed\n";
        return 1;
    }
    if (!token.approve(CallContext::now(alice), bob, 200).is_ok()) {
        std::cerr << "Approve failed\n";
        return 1;
    }
    auto spent = token.transferFrom(CallContext::now(bob), alice, bob, 150);
    if (!spent.is_ok()) {
        std::cerr << "Delegated transfer failed: " << spent.error().message.c_str() << "\n";
        return 1;
    }

    std::cout << "\n" << token.name() << " (" << token.symbol() << "), supply " << token.totalSupply() << "\n";
    for (const auto &holder : token.holders()) {
        std::cout << "  " << holder.str() << ": " << token.balanceOf(holder) << "\n";
    }
    std::cout << "  allowance alice -> bob: " << token.allowance(alice, bob) << "\n\n";

    auto committed = ledgit.commit();
    if (!committed.is_ok()) {
        std::cerr << "Commit failed: " << committed.error().message.c_str() << "\n";
        return 1;
    }
    std::cout << "✓ State committed (" << journal->appendedCount() << " events journaled)\n";

    return 0;
}
