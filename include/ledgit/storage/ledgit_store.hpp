#pragma once

#include <datapod/datapod.hpp>
#include <ledgit/common/error.hpp>
#include <ledgit/common/types.hpp>
#include <ledgit/events/event_sink.hpp>
#include <ledgit/evolving/evolving_registry.hpp>
#include <ledgit/registry/content_registry.hpp>
#include <ledgit/storage/snapshot_store.hpp>
#include <ledgit/token/token_ledger.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>

namespace ledgit {

    struct LedgitConfig {
        Address owner; // Contract owner of all three registries
        evolving::EvolvingConfig evolving_config;
        token::TokenConfig token_config;
        storage::StoreOptions store_options;
    };

    // ===========================================
    // Ledgit - registries + persistence
    // ===========================================

    /// Hosts the evolving registry, the content registry and the token ledger behind one
    /// event sink, and saves/restores their state through a SnapshotStore
    class Ledgit {
      public:
        static constexpr const char *EVOLVING_SNAPSHOT = "evolving";
        static constexpr const char *CONTENT_SNAPSHOT = "content";
        static constexpr const char *TOKEN_SNAPSHOT = "token";

        inline explicit Ledgit(const LedgitConfig &config, std::shared_ptr<EventSink> sink = nullptr)
            : config_(config), sink_(std::move(sink)) {
            evolving_ = std::make_unique<evolving::EvolvingRegistry>(config_.owner, config_.evolving_config);
            content_ = std::make_unique<registry::ContentRegistry>(config_.owner);

            // Initial supply is minted in initialize() unless a snapshot supersedes it
            token::TokenConfig token_config = config_.token_config;
            token_config.initial_supply = 0;
            token_ = std::make_unique<token::TokenLedger>(CallContext::now(config_.owner), token_config);

            evolving_->setEventSink(sink_);
            content_->setEventSink(sink_);
            token_->setEventSink(sink_);
        }

        Ledgit(const Ledgit &) = delete;
        Ledgit &operator=(const Ledgit &) = delete;

        /// Restore saved state from db_path, or start fresh there
        /// An empty path keeps everything in memory. Either every saved snapshot is applied or none is,
        /// and a facade can only be initialized once
        /// @param db_path Path to the snapshot directory
        /// @return Result indicating success or error
        inline dp::Result<void, dp::Error> initialize(const dp::String &db_path = dp::String()) {
            std::unique_lock lock(mutex_);
            if (initialized_) {
                return dp::Result<void, dp::Error>::err(dp::Error::already_exists("Ledgit already initialized"));
            }

            std::optional<evolving::EvolvingState> evolving_state;
            std::optional<registry::ContentState> content_state;
            std::optional<token::TokenState> token_state;

            if (!std::string(db_path.c_str()).empty()) {
                auto open_result = store_.open(db_path, config_.store_options);
                if (!open_result.is_ok()) {
                    return open_result;
                }

                auto loaded = loadSnapshot(EVOLVING_SNAPSHOT, evolving_state, &evolving::EvolvingRegistry::validate);
                if (loaded.is_ok())
                    loaded = loadSnapshot(CONTENT_SNAPSHOT, content_state, &registry::ContentRegistry::validate);
                if (loaded.is_ok())
                    loaded = loadSnapshot(TOKEN_SNAPSHOT, token_state, &token::TokenLedger::validate);
                if (!loaded.is_ok()) {
                    store_.close();
                    return loaded;
                }
            }

            // Every snapshot passed validation, so the restores below cannot fail part way
            if (evolving_state) {
                auto restored = evolving_->restore(*evolving_state);
                if (!restored.is_ok())
                    return restored;
            }
            if (content_state) {
                auto restored = content_->restore(*content_state);
                if (!restored.is_ok())
                    return restored;
            }
            if (token_state) {
                auto restored = token_->restore(*token_state);
                if (!restored.is_ok())
                    return restored;
            } else if (config_.token_config.initial_supply > 0) {
                auto genesis = CallContext::now(config_.owner);
                auto minted = token_->mint(genesis, config_.owner, config_.token_config.initial_supply);
                if (!minted.is_ok())
                    return minted;
            }

            initialized_ = true;
            return dp::Result<void, dp::Error>::ok();
        }

        /// Save all three registries; each snapshot is replaced atomically
        inline dp::Result<void, dp::Error> commit() {
            std::unique_lock lock(mutex_);
            if (!initialized_ || !store_.isOpen())
                return dp::Result<void, dp::Error>::err(store_not_open());

            auto saved = store_.save(EVOLVING_SNAPSHOT, evolving_->snapshot());
            if (!saved.is_ok())
                return saved;
            saved = store_.save(CONTENT_SNAPSHOT, content_->snapshot());
            if (!saved.is_ok())
                return saved;
            return store_.save(TOKEN_SNAPSHOT, token_->snapshot());
        }

        inline bool isInitialized() const {
            std::shared_lock lock(mutex_);
            return initialized_;
        }

        inline bool isPersistent() const {
            std::shared_lock lock(mutex_);
            return store_.isOpen();
        }

        // ===========================================
        // Registries
        // ===========================================

        inline evolving::EvolvingRegistry &evolvingRegistry() { return *evolving_; }
        inline const evolving::EvolvingRegistry &evolvingRegistry() const { return *evolving_; }

        inline registry::ContentRegistry &contentRegistry() { return *content_; }
        inline const registry::ContentRegistry &contentRegistry() const { return *content_; }

        inline token::TokenLedger &tokenLedger() { return *token_; }
        inline const token::TokenLedger &tokenLedger() const { return *token_; }

        inline void setEventSink(std::shared_ptr<EventSink> sink) {
            std::unique_lock lock(mutex_);
            sink_ = sink;
            evolving_->setEventSink(sink);
            content_->setEventSink(sink);
            token_->setEventSink(sink);
        }

      private:
        // Load a snapshot if it exists and check it without applying it
        template <typename State>
        inline dp::Result<void, dp::Error> loadSnapshot(const char *name, std::optional<State> &out,
                                                        dp::Result<void, dp::Error> (*validate)(const State &)) {
            if (!store_.exists(name))
                return dp::Result<void, dp::Error>::ok();
            auto state = store_.load<State>(name);
            if (!state.is_ok())
                return dp::Result<void, dp::Error>::err(state.error());
            auto valid = validate(state.value());
            if (!valid.is_ok())
                return valid;
            out = state.value();
            return dp::Result<void, dp::Error>::ok();
        }

        LedgitConfig config_;
        std::shared_ptr<EventSink> sink_;

        std::unique_ptr<evolving::EvolvingRegistry> evolving_;
        std::unique_ptr<registry::ContentRegistry> content_;
        std::unique_ptr<token::TokenLedger> token_;

        storage::SnapshotStore store_;
        bool initialized_ = false;

        mutable std::shared_mutex mutex_;
    };

} // namespace ledgit
