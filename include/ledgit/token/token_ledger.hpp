#pragma once

#include <datapod/datapod.hpp>
#include <ledgit/common/error.hpp>
#include <ledgit/common/types.hpp>
#include <ledgit/events/event_sink.hpp>
#include <ledgit/ownership/ownable.hpp>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledgit::token {

    struct TokenConfig {
        dp::String name = "Ledgit Token";
        dp::String symbol = "LDG";
        dp::u8 decimals = 18;
        dp::u64 initial_supply = 0; // Minted to the deployer

        auto members() { return std::tie(name, symbol, decimals, initial_supply); }
        auto members() const { return std::tie(name, symbol, decimals, initial_supply); }
    };

    struct BalanceRecord {
        dp::String holder;
        dp::u64 amount{0};

        auto members() { return std::tie(holder, amount); }
        auto members() const { return std::tie(holder, amount); }
    };

    struct AllowanceRecord {
        dp::String owner;
        dp::String spender;
        dp::u64 amount{0};

        auto members() { return std::tie(owner, spender, amount); }
        auto members() const { return std::tie(owner, spender, amount); }
    };

    /// Serializable ledger state
    struct TokenState {
        dp::String owner;
        TokenConfig config;
        dp::u64 total_supply{0};
        dp::Vector<BalanceRecord> balances;
        dp::Vector<AllowanceRecord> allowances;

        auto members() { return std::tie(owner, config, total_supply, balances, allowances); }
        auto members() const { return std::tie(owner, config, total_supply, balances, allowances); }
    };

    /// Fungible balance ledger with ERC20 semantics
    /// The sum of all balances equals totalSupply() after every call
    class TokenLedger {
      public:
        static constexpr const char *CONTRACT_NAME = "TokenLedger";

        /// Deploys the ledger; config.initial_supply is minted to deployer.caller
        explicit TokenLedger(const CallContext &deployer, const TokenConfig &config = TokenConfig{},
                             std::shared_ptr<EventSink> sink = nullptr);

        TokenLedger(const TokenLedger &) = delete;
        TokenLedger &operator=(const TokenLedger &) = delete;

        dp::Result<void, dp::Error> transfer(const CallContext &ctx, const Address &to, dp::u64 amount);

        /// Overwrites the allowance, never adds to it
        dp::Result<void, dp::Error> approve(const CallContext &ctx, const Address &spender, dp::u64 amount);

        dp::Result<void, dp::Error> increaseAllowance(const CallContext &ctx, const Address &spender, dp::u64 added);

        dp::Result<void, dp::Error> decreaseAllowance(const CallContext &ctx, const Address &spender,
                                                      dp::u64 subtracted);

        /// Move tokens from `from` to `to`, spending the caller's allowance
        dp::Result<void, dp::Error> transferFrom(const CallContext &ctx, const Address &from, const Address &to,
                                                 dp::u64 amount);

        dp::Result<void, dp::Error> mint(const CallContext &ctx, const Address &to, dp::u64 amount);

        dp::Result<void, dp::Error> burn(const CallContext &ctx, const Address &from, dp::u64 amount);

        dp::Result<void, dp::Error> transferOwnership(const CallContext &ctx, const Address &new_owner);

        // === Queries ===

        std::string name() const;
        std::string symbol() const;
        dp::u8 decimals() const;
        dp::u64 totalSupply() const;
        dp::u64 balanceOf(const Address &holder) const;
        dp::u64 allowance(const Address &owner, const Address &spender) const;

        /// Holders with a non-zero balance
        std::vector<Address> holders() const;

        Address owner() const { return ownable_.owner(); }

        void setEventSink(std::shared_ptr<EventSink> sink);

        TokenState snapshot() const;

        dp::Result<void, dp::Error> restore(const TokenState &state);

        /// Balance records must add up to total_supply
        static dp::Result<void, dp::Error> validate(const TokenState &state);

      private:
        // Caller holds the unique lock
        dp::u64 allowanceLocked(const Address &owner, const Address &spender) const;
        dp::Result<void, dp::Error> moveLocked(const Address &from, const Address &to, dp::u64 amount);
        Event transferEvent(const Address &from, const Address &to, dp::u64 amount, dp::i64 timestamp) const;
        Event approvalEvent(const Address &owner, const Address &spender, dp::u64 amount, dp::i64 timestamp) const;
        void publish(const Event &event) const;

        TokenConfig config_;
        Ownable ownable_;

        dp::u64 total_supply_ = 0;
        std::unordered_map<Address, dp::u64> balances_;
        std::unordered_map<Address, std::unordered_map<Address, dp::u64>> allowances_;

        std::shared_ptr<EventSink> sink_;
        mutable std::shared_mutex mutex_;
    };

} // namespace ledgit::token
