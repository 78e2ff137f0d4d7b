#include <algorithm>
#include <iostream>
#include <ledgit/evolving/evolving_registry.hpp>
#include <limits>
#include <optional>
#include <set>

namespace ledgit::evolving {

    namespace {
        // a + b, or nullopt when the sum leaves the i64 range
        std::optional<dp::i64> checkedAdd(dp::i64 a, dp::i64 b) {
            if ((b > 0 && a > std::numeric_limits<dp::i64>::max() - b) ||
                (b < 0 && a < std::numeric_limits<dp::i64>::min() - b)) {
                return std::nullopt;
            }
            return a + b;
        }
    } // namespace

    EvolvingRegistry::EvolvingRegistry(const Address &owner, const EvolvingConfig &config)
        : config_(config), ownable_(CONTRACT_NAME, owner) {}

    std::string EvolvingRegistry::colorFor(dp::i64 timestamp, dp::u64 id, const Address &caller) {
        std::vector<uint8_t> seed;
        appendLE(seed, timestamp);
        appendLE(seed, id);
        seed.insert(seed.end(), caller.str().begin(), caller.str().end());
        auto digest = computeSHA256(seed);
        return PALETTE[digestPrefix(digest) % PALETTE.size()];
    }

    dp::Result<dp::u64, dp::Error> EvolvingRegistry::create(const CallContext &ctx) {
        Event event;
        dp::u64 id = 0;
        {
            std::unique_lock lock(mutex_);
            if (ctx.value < config_.creation_fee) {
                return dp::Result<dp::u64, dp::Error>::err(insufficient_payment());
            }
            if (collected_fees_ > std::numeric_limits<dp::u64>::max() - ctx.value) {
                return dp::Result<dp::u64, dp::Error>::err(overflow("Fee pool overflow"));
            }

            id = next_id_++;
            EvolvingBlock block;
            block.id = id;
            block.owner = toDpString(ctx.caller.str());
            block.power = config_.base_power;
            block.generation = 1;
            block.birth_time = ctx.timestamp;
            block.color = toDpString(colorFor(ctx.timestamp, id, ctx.caller));
            block.active = true;

            blocks_[id] = block;
            by_owner_[ctx.caller].push_back(id);
            collected_fees_ += ctx.value;

            event = Event(EventType::BlockCreated, CONTRACT_NAME, ctx.timestamp);
            event.withNumber("id", id)
                .with("owner", ctx.caller.str())
                .withNumber("power", block.power)
                .with("color", block.getColor());
        }
        publish(event);
        return dp::Result<dp::u64, dp::Error>::ok(id);
    }

    dp::Result<EvolvingBlock, dp::Error> EvolvingRegistry::evolve(const CallContext &ctx, dp::u64 id) {
        Event event;
        EvolvingBlock updated;
        {
            std::unique_lock lock(mutex_);
            auto it = blocks_.find(id);
            if (it == blocks_.end()) {
                return dp::Result<EvolvingBlock, dp::Error>::err(not_found("Block not found"));
            }
            auto &block = it->second;
            if (block.getOwner() != ctx.caller) {
                return dp::Result<EvolvingBlock, dp::Error>::err(not_owner("Caller does not own the block"));
            }
            if (!block.active) {
                return dp::Result<EvolvingBlock, dp::Error>::err(inactive("Block is inactive"));
            }
            auto ready_at = checkedAdd(block.birth_time, config_.evolution_time);
            if (!ready_at) {
                return dp::Result<EvolvingBlock, dp::Error>::err(overflow("Evolution time out of range"));
            }
            if (ctx.timestamp < *ready_at) {
                return dp::Result<EvolvingBlock, dp::Error>::err(evolution_not_ready());
            }

            dp::u64 generation = block.generation + 1;
            if (generation != 0 && config_.base_power > std::numeric_limits<dp::u64>::max() / generation) {
                return dp::Result<EvolvingBlock, dp::Error>::err(overflow("Power overflow"));
            }
            dp::u64 gain = config_.base_power * generation / 2;
            if (block.power > std::numeric_limits<dp::u64>::max() - gain) {
                return dp::Result<EvolvingBlock, dp::Error>::err(overflow("Power overflow"));
            }

            block.generation = generation;
            block.power += gain;
            block.birth_time = ctx.timestamp;
            updated = block;

            event = Event(EventType::BlockEvolved, CONTRACT_NAME, ctx.timestamp);
            event.withNumber("id", id).withNumber("generation", block.generation).withNumber("power", block.power);
        }
        publish(event);
        return dp::Result<EvolvingBlock, dp::Error>::ok(updated);
    }

    dp::Result<dp::u64, dp::Error> EvolvingRegistry::merge(const CallContext &ctx, dp::u64 first_id,
                                                           dp::u64 second_id) {
        Event event;
        dp::u64 id = 0;
        {
            std::unique_lock lock(mutex_);
            auto first_it = blocks_.find(first_id);
            auto second_it = blocks_.find(second_id);
            if (first_it == blocks_.end() || second_it == blocks_.end()) {
                return dp::Result<dp::u64, dp::Error>::err(not_found("Block not found"));
            }
            if (first_id == second_id) {
                return dp::Result<dp::u64, dp::Error>::err(self_merge());
            }
            auto &first = first_it->second;
            auto &second = second_it->second;
            if (first.getOwner() != ctx.caller || second.getOwner() != ctx.caller) {
                return dp::Result<dp::u64, dp::Error>::err(not_owner("Caller must own both blocks"));
            }
            if (!first.active || !second.active) {
                return dp::Result<dp::u64, dp::Error>::err(inactive("Both blocks must be active"));
            }
            if (first.power > std::numeric_limits<dp::u64>::max() - second.power) {
                return dp::Result<dp::u64, dp::Error>::err(overflow("Power overflow"));
            }

            first.active = false;
            second.active = false;

            id = next_id_++;
            EvolvingBlock merged;
            merged.id = id;
            merged.owner = toDpString(ctx.caller.str());
            merged.power = first.power + second.power;
            merged.generation = std::max(first.generation, second.generation) + 1;
            merged.birth_time = ctx.timestamp;
            merged.color = first.color;
            merged.active = true;

            blocks_[id] = merged;
            by_owner_[ctx.caller].push_back(id);

            event = Event(EventType::BlocksMerged, CONTRACT_NAME, ctx.timestamp);
            event.withNumber("first_id", first_id)
                .withNumber("second_id", second_id)
                .withNumber("new_id", id)
                .withNumber("power", merged.power)
                .withNumber("generation", merged.generation);
        }
        publish(event);
        return dp::Result<dp::u64, dp::Error>::ok(id);
    }

    dp::Result<EvolvingBlock, dp::Error> EvolvingRegistry::getBlock(dp::u64 id) const {
        std::shared_lock lock(mutex_);
        auto it = blocks_.find(id);
        if (it == blocks_.end()) {
            return dp::Result<EvolvingBlock, dp::Error>::err(not_found("Block not found"));
        }
        return dp::Result<EvolvingBlock, dp::Error>::ok(it->second);
    }

    std::vector<dp::u64> EvolvingRegistry::getBlocksOf(const Address &owner) const {
        std::shared_lock lock(mutex_);
        auto it = by_owner_.find(owner);
        return (it != by_owner_.end()) ? it->second : std::vector<dp::u64>{};
    }

    std::vector<dp::u64> EvolvingRegistry::getActiveBlocksOf(const Address &owner) const {
        std::shared_lock lock(mutex_);
        std::vector<dp::u64> result;
        auto it = by_owner_.find(owner);
        if (it == by_owner_.end())
            return result;
        for (auto id : it->second) {
            auto block_it = blocks_.find(id);
            if (block_it != blocks_.end() && block_it->second.active)
                result.push_back(id);
        }
        return result;
    }

    size_t EvolvingRegistry::totalBlocks() const {
        std::shared_lock lock(mutex_);
        return blocks_.size();
    }

    dp::Result<dp::i64, dp::Error> EvolvingRegistry::timeUntilEvolution(dp::u64 id, dp::i64 now) const {
        std::shared_lock lock(mutex_);
        auto it = blocks_.find(id);
        if (it == blocks_.end()) {
            return dp::Result<dp::i64, dp::Error>::err(not_found("Block not found"));
        }
        auto ready_at = checkedAdd(it->second.birth_time, config_.evolution_time);
        if (!ready_at) {
            return dp::Result<dp::i64, dp::Error>::err(overflow("Evolution time out of range"));
        }
        if (now >= *ready_at) {
            return dp::Result<dp::i64, dp::Error>::ok(0);
        }
        if (now < 0 && *ready_at > std::numeric_limits<dp::i64>::max() + now) {
            return dp::Result<dp::i64, dp::Error>::err(overflow("Evolution time out of range"));
        }
        return dp::Result<dp::i64, dp::Error>::ok(*ready_at - now);
    }

    dp::u64 EvolvingRegistry::collectedFees() const {
        std::shared_lock lock(mutex_);
        return collected_fees_;
    }

    dp::Result<dp::u64, dp::Error> EvolvingRegistry::withdrawFees(const CallContext &ctx) {
        Event event;
        dp::u64 amount = 0;
        {
            std::unique_lock lock(mutex_);
            auto auth = ownable_.requireOwner(ctx.caller);
            if (!auth.is_ok()) {
                return dp::Result<dp::u64, dp::Error>::err(auth.error());
            }
            amount = collected_fees_;
            collected_fees_ = 0;
            event = Event(EventType::FeesWithdrawn, CONTRACT_NAME, ctx.timestamp);
            event.with("to", ctx.caller.str()).withNumber("amount", amount);
        }
        publish(event);
        return dp::Result<dp::u64, dp::Error>::ok(amount);
    }

    dp::Result<void, dp::Error> EvolvingRegistry::transferOwnership(const CallContext &ctx,
                                                                    const Address &new_owner) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            auto changed = ownable_.applyTransfer(ctx, new_owner);
            if (!changed.is_ok()) {
                return dp::Result<void, dp::Error>::err(changed.error());
            }
            event = changed.value();
        }
        publish(event);
        return dp::Result<void, dp::Error>::ok();
    }

    EvolvingConfig EvolvingRegistry::config() const {
        std::shared_lock lock(mutex_);
        return config_;
    }

    void EvolvingRegistry::setEventSink(std::shared_ptr<EventSink> sink) {
        std::unique_lock lock(mutex_);
        sink_ = std::move(sink);
    }

    EvolvingState EvolvingRegistry::snapshot() const {
        std::shared_lock lock(mutex_);
        EvolvingState state;
        state.owner = toDpString(ownable_.owner().str());
        state.next_id = next_id_;
        state.collected_fees = collected_fees_;
        state.config = config_;
        for (const auto &[id, block] : blocks_) {
            state.blocks.push_back(block);
        }
        return state;
    }

    dp::Result<void, dp::Error> EvolvingRegistry::validate(const EvolvingState &state) {
        std::set<dp::u64> ids;
        dp::u64 max_id = 0;
        for (const auto &block : state.blocks) {
            if (block.id == 0 || !ids.insert(block.id).second) {
                return dp::Result<void, dp::Error>::err(deserialization_failed("Duplicate or invalid block id"));
            }
            max_id = std::max(max_id, block.id);
        }
        if (state.next_id <= max_id) {
            return dp::Result<void, dp::Error>::err(deserialization_failed("Block counter behind stored ids"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> EvolvingRegistry::restore(const EvolvingState &state) {
        auto valid = validate(state);
        if (!valid.is_ok()) {
            return valid;
        }

        std::map<dp::u64, EvolvingBlock> blocks;
        std::unordered_map<Address, std::vector<dp::u64>> by_owner;
        for (const auto &block : state.blocks) {
            blocks[block.id] = block;
        }
        // Ownership never changes hands, so ascending id order is creation order per owner
        for (const auto &[id, block] : blocks) {
            by_owner[block.getOwner()].push_back(id);
        }

        {
            std::unique_lock lock(mutex_);
            config_ = state.config;
            blocks_ = std::move(blocks);
            by_owner_ = std::move(by_owner);
            next_id_ = state.next_id;
            collected_fees_ = state.collected_fees;
            ownable_.restoreOwner(Address(fromDpString(state.owner)));
        }
        std::cout << "EvolvingRegistry restored with " << state.blocks.size() << " blocks" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    void EvolvingRegistry::publish(const Event &event) const {
        std::shared_ptr<EventSink> sink;
        {
            std::shared_lock lock(mutex_);
            sink = sink_;
        }
        if (sink) {
            sink->publish(event);
        }
    }

} // namespace ledgit::evolving
