#include <algorithm>
#include <iostream>
#include <ledgit/token/token_ledger.hpp>
#include <limits>

namespace ledgit::token {

    TokenLedger::TokenLedger(const CallContext &deployer, const TokenConfig &config, std::shared_ptr<EventSink> sink)
        : config_(config), ownable_(CONTRACT_NAME, deployer.caller) {
        setEventSink(std::move(sink));
        if (config_.initial_supply > 0) {
            auto result = mint(deployer, deployer.caller, config_.initial_supply);
            if (!result.is_ok()) {
                std::cerr << "Initial mint failed: " << result.error().message.c_str() << std::endl;
            }
        }
    }

    dp::Result<void, dp::Error> TokenLedger::moveLocked(const Address &from, const Address &to, dp::u64 amount) {
        auto from_it = balances_.find(from);
        dp::u64 from_balance = (from_it != balances_.end()) ? from_it->second : 0;
        if (from_balance < amount) {
            return dp::Result<void, dp::Error>::err(insufficient_balance());
        }
        if (from == to) {
            return dp::Result<void, dp::Error>::ok();
        }
        // Cannot overflow: both balances are bounded by total supply
        balances_[from] = from_balance - amount;
        balances_[to] += amount;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TokenLedger::transfer(const CallContext &ctx, const Address &to, dp::u64 amount) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            if (to.isZero()) {
                return dp::Result<void, dp::Error>::err(zero_address("Transfer to the zero address"));
            }
            auto moved = moveLocked(ctx.caller, to, amount);
            if (!moved.is_ok()) {
                return moved;
            }
            event = transferEvent(ctx.caller, to, amount, ctx.timestamp);
        }
        publish(event);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TokenLedger::approve(const CallContext &ctx, const Address &spender, dp::u64 amount) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            allowances_[ctx.caller][spender] = amount;
            event = approvalEvent(ctx.caller, spender, amount, ctx.timestamp);
        }
        publish(event);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TokenLedger::increaseAllowance(const CallContext &ctx, const Address &spender,
                                                               dp::u64 added) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            auto &current = allowances_[ctx.caller][spender];
            if (current > std::numeric_limits<dp::u64>::max() - added) {
                return dp::Result<void, dp::Error>::err(overflow("Allowance overflow"));
            }
            current += added;
            event = approvalEvent(ctx.caller, spender, current, ctx.timestamp);
        }
        publish(event);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TokenLedger::decreaseAllowance(const CallContext &ctx, const Address &spender,
                                                               dp::u64 subtracted) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            dp::u64 current = allowanceLocked(ctx.caller, spender);
            if (current < subtracted) {
                return dp::Result<void, dp::Error>::err(allowance_exceeded("Decreased allowance below zero"));
            }
            allowances_[ctx.caller][spender] = current - subtracted;
            event = approvalEvent(ctx.caller, spender, current - subtracted, ctx.timestamp);
        }
        publish(event);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TokenLedger::transferFrom(const CallContext &ctx, const Address &from,
                                                          const Address &to, dp::u64 amount) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            if (to.isZero() || from.isZero()) {
                return dp::Result<void, dp::Error>::err(zero_address("Transfer involving the zero address"));
            }
            auto from_it = balances_.find(from);
            dp::u64 from_balance = (from_it != balances_.end()) ? from_it->second : 0;
            if (from_balance < amount) {
                return dp::Result<void, dp::Error>::err(insufficient_balance());
            }
            dp::u64 allowed = allowanceLocked(from, ctx.caller);
            if (allowed < amount) {
                return dp::Result<void, dp::Error>::err(allowance_exceeded());
            }

            auto moved = moveLocked(from, to, amount);
            if (!moved.is_ok()) {
                return moved;
            }
            allowances_[from][ctx.caller] = allowed - amount;
            event = transferEvent(from, to, amount, ctx.timestamp);
        }
        publish(event);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TokenLedger::mint(const CallContext &ctx, const Address &to, dp::u64 amount) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            auto auth = ownable_.requireOwner(ctx.caller);
            if (!auth.is_ok()) {
                return auth;
            }
            if (to.isZero()) {
                return dp::Result<void, dp::Error>::err(zero_address("Mint to the zero address"));
            }
            if (total_supply_ > std::numeric_limits<dp::u64>::max() - amount) {
                return dp::Result<void, dp::Error>::err(overflow("Total supply overflow"));
            }
            total_supply_ += amount;
            balances_[to] += amount;
            event = transferEvent(Address::zero(), to, amount, ctx.timestamp);
        }
        publish(event);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TokenLedger::burn(const CallContext &ctx, const Address &from, dp::u64 amount) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            auto auth = ownable_.requireOwner(ctx.caller);
            if (!auth.is_ok()) {
                return auth;
            }
            auto it = balances_.find(from);
            dp::u64 balance = (it != balances_.end()) ? it->second : 0;
            if (balance < amount) {
                return dp::Result<void, dp::Error>::err(insufficient_balance("Burn amount exceeds balance"));
            }
            if (it != balances_.end())
                it->second = balance - amount;
            total_supply_ -= amount;
            event = transferEvent(from, Address::zero(), amount, ctx.timestamp);
        }
        publish(event);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TokenLedger::transferOwnership(const CallContext &ctx, const Address &new_owner) {
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

    std::string TokenLedger::name() const {
        std::shared_lock lock(mutex_);
        return std::string(config_.name.c_str());
    }

    std::string TokenLedger::symbol() const {
        std::shared_lock lock(mutex_);
        return std::string(config_.symbol.c_str());
    }

    dp::u8 TokenLedger::decimals() const {
        std::shared_lock lock(mutex_);
        return config_.decimals;
    }

    dp::u64 TokenLedger::totalSupply() const {
        std::shared_lock lock(mutex_);
        return total_supply_;
    }

    dp::u64 TokenLedger::balanceOf(const Address &holder) const {
        std::shared_lock lock(mutex_);
        auto it = balances_.find(holder);
        return (it != balances_.end()) ? it->second : 0;
    }

    dp::u64 TokenLedger::allowance(const Address &owner, const Address &spender) const {
        std::shared_lock lock(mutex_);
        return allowanceLocked(owner, spender);
    }

    dp::u64 TokenLedger::allowanceLocked(const Address &owner, const Address &spender) const {
        auto owner_it = allowances_.find(owner);
        if (owner_it == allowances_.end())
            return 0;
        auto spender_it = owner_it->second.find(spender);
        return (spender_it != owner_it->second.end()) ? spender_it->second : 0;
    }

    std::vector<Address> TokenLedger::holders() const {
        std::shared_lock lock(mutex_);
        std::vector<Address> result;
        for (const auto &[holder, amount] : balances_) {
            if (amount > 0)
                result.push_back(holder);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    void TokenLedger::setEventSink(std::shared_ptr<EventSink> sink) {
        std::unique_lock lock(mutex_);
        sink_ = std::move(sink);
    }

    TokenState TokenLedger::snapshot() const {
        std::shared_lock lock(mutex_);
        TokenState state;
        state.owner = toDpString(ownable_.owner().str());
        state.config = config_;
        state.total_supply = total_supply_;
        for (const auto &[holder, amount] : balances_) {
            if (amount > 0)
                state.balances.push_back(BalanceRecord{toDpString(holder.str()), amount});
        }
        for (const auto &[owner, spenders] : allowances_) {
            for (const auto &[spender, amount] : spenders) {
                if (amount > 0)
                    state.allowances.push_back(
                        AllowanceRecord{toDpString(owner.str()), toDpString(spender.str()), amount});
            }
        }
        return state;
    }

    dp::Result<void, dp::Error> TokenLedger::validate(const TokenState &state) {
        dp::u64 sum = 0;
        for (const auto &record : state.balances) {
            if (sum > std::numeric_limits<dp::u64>::max() - record.amount) {
                return dp::Result<void, dp::Error>::err(deserialization_failed("Balance sum overflow"));
            }
            sum += record.amount;
        }
        if (sum != state.total_supply) {
            return dp::Result<void, dp::Error>::err(deserialization_failed("Balances do not add up to total supply"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TokenLedger::restore(const TokenState &state) {
        auto valid = validate(state);
        if (!valid.is_ok()) {
            return valid;
        }

        std::unordered_map<Address, dp::u64> balances;
        for (const auto &record : state.balances) {
            balances[Address(fromDpString(record.holder))] += record.amount;
        }

        std::unordered_map<Address, std::unordered_map<Address, dp::u64>> allowances;
        for (const auto &record : state.allowances) {
            allowances[Address(fromDpString(record.owner))][Address(fromDpString(record.spender))] = record.amount;
        }

        {
            std::unique_lock lock(mutex_);
            config_ = state.config;
            total_supply_ = state.total_supply;
            balances_ = std::move(balances);
            allowances_ = std::move(allowances);
            ownable_.restoreOwner(Address(fromDpString(state.owner)));
        }
        std::cout << "TokenLedger restored with " << state.balances.size() << " balances" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    Event TokenLedger::transferEvent(const Address &from, const Address &to, dp::u64 amount,
                                     dp::i64 timestamp) const {
        Event event(EventType::Transfer, CONTRACT_NAME, timestamp);
        event.with("from", from.str()).with("to", to.str()).withNumber("value", amount);
        return event;
    }

    Event TokenLedger::approvalEvent(const Address &owner, const Address &spender, dp::u64 amount,
                                     dp::i64 timestamp) const {
        Event event(EventType::Approval, CONTRACT_NAME, timestamp);
        event.with("owner", owner.str()).with("spender", spender.str()).withNumber("value", amount);
        return event;
    }

    void TokenLedger::publish(const Event &event) const {
        std::shared_ptr<EventSink> sink;
        {
            std::shared_lock lock(mutex_);
            sink = sink_;
        }
        if (sink) {
            sink->publish(event);
        }
    }

} // namespace ledgit::token
