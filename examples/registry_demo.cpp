/**
 * Registry Demo - versioned content under stable keys
 */

#include <iostream>
#include <ledgit/ledgit.hpp>

using namespace ledgit;

int main() {
    std::cout << "=== Ledgit Content Registry Demo ===\n\n";

    auto admin = Address::derive("admin");
    auto author = Address::derive("author");
    auto reviewer = Address::derive("reviewer");

    registry::ContentRegistry content(admin);
    content.setEventSink(std::make_shared<ConsoleEventSink>());

    auto v1 = content.createBlock(CallContext::now(author), "manual/intro", "Introduction", "ipfs://intro-v1", "draft");
    if (!v1.is_ok()) {
        std::cerr << "Failed to create content: " << v1.error().message.c_str() << "\n";
        return 1;
    }
    std::cout << "✓ Created manual/intro version " << v1.value().version << "\n";

    auto v2 = content.createNewVersion(CallContext::now(author), "manual/intro", "Introduction", "ipfs://intro-v2",
                                       "final");
    if (!v2.is_ok()) {
        std::cerr << "Failed to add version: " << v2.error().message.c_str() << "\n";
        return 1;
    }
    std::cout << "✓ Added version " << v2.value().version << " (id " << v2.value().version_id << ")\n";

    // Someone else cannot extend the history
    auto denied = content.createNewVersion(CallContext::now(reviewer), "manual/intro", "Hijack", "ipfs://x", "x");
    if (denied.is_err()) {
        std::cout << "✓ Reviewer rejected: " << denied.error().message.c_str() << "\n";
    }

    // Retire the draft
    if (content.setVersionActive(CallContext::now(author), v1.value().version_id, false).is_ok()) {
        std::cout << "✓ Draft deactivated\n";
    }

    std::cout << "\nHistory of manual/intro:\n";
    for (auto id : content.getVersionsOf("manual/intro")) {
        auto version = content.getVersion(id);
        if (version.is_ok()) {
            std::cout << "  v" << version.value().version << " " << version.value().getUri() << " ["
                      << version.value().getTag() << "]" << (version.value().active ? "" : " inactive") << "\n";
        }
    }

    return 0;
}
