#pragma once

#include <array>
#include <datapod/datapod.hpp>
#include <ledgit/common/error.hpp>
#include <ledgit/common/types.hpp>
#include <ledgit/events/event_sink.hpp>
#include <ledgit/ownership/ownable.hpp>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledgit::evolving {

    struct EvolvingConfig {
        dp::u64 creation_fee = 10000000000000000ULL; // 0.01 of an 18-decimal coin
        dp::u64 base_power = 100;
        dp::i64 evolution_time = 7 * 24 * 60 * 60; // seconds

        auto members() { return std::tie(creation_fee, base_power, evolution_time); }
        auto members() const { return std::tie(creation_fee, base_power, evolution_time); }
    };

    /// A block that gains power as it evolves
    struct EvolvingBlock {
        dp::u64 id{0};
        dp::String owner;
        dp::u64 power{0};
        dp::u64 generation{0};
        dp::i64 birth_time{0};
        dp::String color;
        bool active{false};

        inline Address getOwner() const { return Address(std::string(owner.c_str())); }
        inline std::string getColor() const { return std::string(color.c_str()); }

        auto members() { return std::tie(id, owner, power, generation, birth_time, color, active); }
        auto members() const { return std::tie(id, owner, power, generation, birth_time, color, active); }
    };

    /// Serializable registry state
    struct EvolvingState {
        dp::String owner;
        dp::u64 next_id{1};
        dp::u64 collected_fees{0};
        EvolvingConfig config;
        dp::Vector<EvolvingBlock> blocks;

        auto members() { return std::tie(owner, next_id, collected_fees, config, blocks); }
        auto members() const { return std::tie(owner, next_id, collected_fees, config, blocks); }
    };

    class EvolvingRegistry {
      public:
        static constexpr const char *CONTRACT_NAME = "EvolvingRegistry";
        static constexpr std::array<const char *, 6> PALETTE = {"Red", "Blue", "Green", "Yellow", "Purple", "Orange"};

        explicit EvolvingRegistry(const Address &owner, const EvolvingConfig &config = EvolvingConfig{});

        EvolvingRegistry(const EvolvingRegistry &) = delete;
        EvolvingRegistry &operator=(const EvolvingRegistry &) = delete;

        /// Mint a generation-1 block for the caller, paid with ctx.value
        dp::Result<dp::u64, dp::Error> create(const CallContext &ctx);

        /// Advance a block one generation once evolution_time has elapsed since its birth
        dp::Result<EvolvingBlock, dp::Error> evolve(const CallContext &ctx, dp::u64 id);

        /// Retire two blocks owned by the caller and mint their combination
        dp::Result<dp::u64, dp::Error> merge(const CallContext &ctx, dp::u64 first_id, dp::u64 second_id);

        dp::Result<EvolvingBlock, dp::Error> getBlock(dp::u64 id) const;

        /// Every id ever assigned to the owner, in creation order, inactive ones included
        std::vector<dp::u64> getBlocksOf(const Address &owner) const;

        std::vector<dp::u64> getActiveBlocksOf(const Address &owner) const;

        size_t totalBlocks() const;

        /// Seconds until the block may evolve, 0 when ready
        dp::Result<dp::i64, dp::Error> timeUntilEvolution(dp::u64 id, dp::i64 now) const;

        dp::u64 collectedFees() const;

        /// Contract owner drains the fee pool
        dp::Result<dp::u64, dp::Error> withdrawFees(const CallContext &ctx);

        dp::Result<void, dp::Error> transferOwnership(const CallContext &ctx, const Address &new_owner);

        Address owner() const { return ownable_.owner(); }

        EvolvingConfig config() const;

        void setEventSink(std::shared_ptr<EventSink> sink);

        EvolvingState snapshot() const;

        dp::Result<void, dp::Error> restore(const EvolvingState &state);

        /// Checks restore() performs before touching any state
        static dp::Result<void, dp::Error> validate(const EvolvingState &state);

        /// Display colour derived from SHA-256(timestamp, id, caller); predictable, not a source of randomness
        static std::string colorFor(dp::i64 timestamp, dp::u64 id, const Address &caller);

      private:
        void publish(const Event &event) const;

        EvolvingConfig config_;
        Ownable ownable_;

        std::map<dp::u64, EvolvingBlock> blocks_;
        std::unordered_map<Address, std::vector<dp::u64>> by_owner_;
        dp::u64 next_id_ = 1;
        dp::u64 collected_fees_ = 0;

        std::shared_ptr<EventSink> sink_;
        mutable std::shared_mutex mutex_;
    };

} // namespace ledgit::evolving
