/**
 * Evolving Demo - creating, evolving and merging blocks
 *
 * Timestamps are supplied by the caller, so a week can pass between two lines.
 */

#include <iostream>
#include <ledgit/ledgit.hpp>

using namespace ledgit;

namespace {
    void printBlock(const evolving::EvolvingBlock &block) {
        std::cout << "  #" << block.id << " power=" << block.power << " gen=" << block.generation
                  << " color=" << block.getColor() << (block.active ? "" : " (retired)") << "\n";
    }
} // namespace

int main() {
    std::cout << "=== Ledgit Evolving Registry Demo ===\n\n";

    auto admin = Address::derive("admin");
    auto alice = Address::derive("alice");

    evolving::EvolvingRegistry registry(admin);
    registry.setEventSink(std::make_shared<ConsoleEventSink>());

    const auto fee = registry.config().creation_fee;
    const auto week = registry.config().evolution_time;
    const dp::i64 t0 = 1700000000;

    // 1. Create two blocks
    auto first = registry.create(CallContext::at(alice, t0, fee));
    auto second = registry.create(CallContext::at(alice, t0 + 60, fee));
    if (!first.is_ok() || !second.is_ok()) {
        std::cerr << "Failed to create blocks\n";
        return 1;
    }
    std::cout << "✓ Created blocks " << first.value() << " and " << second.value() << "\n";

    // 2. Too early to evolve
    auto early = registry.evolve(CallContext::at(alice, t0 + 10), first.value());
    if (early.is_err()) {
        std::cout << "✓ Early evolution rejected: " << early.error().message.c_str() << "\n";
    }

    // 3. A week later
    auto evolved = registry.evolve(CallContext::at(alice, t0 + week), first.value());
    if (!evolved.is_ok()) {
        std::cerr << "Evolution failed: " << evolved.error().message.c_str() << "\n";
        return 1;
    }
    std::cout << "✓ Evolved:\n";
    printBlock(evolved.value());

    // 4. Merge both into a new block
    auto merged = registry.merge(CallContext::at(alice, t0 + week + 1), first.value(), second.value());
    if (!merged.is_ok()) {
        std::cerr << "Merge failed: " << merged.error().message.c_str() << "\n";
        return 1;
    }
    std::cout << "✓ Merged into block " << merged.value() << "\n\n";

    std::cout << "Blocks of alice:\n";
    for (auto id : registry.getBlocksOf(alice)) {
        auto block = registry.getBlock(id);
        if (block.is_ok()) {
            printBlock(block.value());
        }
    }

    // 5. Contract owner collects the creation fees
    auto withdrawn = registry.withdrawFees(CallContext::at(admin, t0 + week + 2));
    if (withdrawn.is_ok()) {
        std::cout << "\n✓ Withdrew " << withdrawn.value() << " in fees\n";
    }

    return 0;
}
