#pragma once

#include <ledgit/common/error.hpp>
#include <ledgit/common/types.hpp>
#include <ledgit/events/event_sink.hpp>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace ledgit {

    /// Contract-level owner, distinct from the owner of any single entity
    /// A registry that gates mutations on the owner checks requireOwner() and commits applyTransfer()
    /// under its own unique lock, so ownership cannot change between the check and the mutation
    class Ownable {
      public:
        inline Ownable(std::string contract, Address owner) : contract_(std::move(contract)), owner_(std::move(owner)) {}

        Ownable(const Ownable &) = delete;
        Ownable &operator=(const Ownable &) = delete;

        inline Address owner() const {
            std::shared_lock lock(mutex_);
            return owner_;
        }

        inline bool isOwner(const Address &who) const {
            std::shared_lock lock(mutex_);
            return !owner_.isZero() && owner_ == who;
        }

        inline dp::Result<void, dp::Error> requireOwner(const Address &who) const {
            if (!isOwner(who)) {
                return dp::Result<void, dp::Error>::err(not_owner());
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> transferOwnership(const CallContext &ctx, const Address &new_owner) {
            auto changed = applyTransfer(ctx, new_owner);
            if (!changed.is_ok()) {
                return dp::Result<void, dp::Error>::err(changed.error());
            }
            publish(changed.value());
            return dp::Result<void, dp::Error>::ok();
        }

        /// Check and commit an ownership change without publishing it
        /// Registries call this under their own unique lock, then publish the returned event
        inline dp::Result<Event, dp::Error> applyTransfer(const CallContext &ctx, const Address &new_owner) {
            std::unique_lock lock(mutex_);
            if (owner_.isZero() || owner_ != ctx.caller) {
                return dp::Result<Event, dp::Error>::err(not_owner());
            }
            if (new_owner.isZero()) {
                return dp::Result<Event, dp::Error>::err(zero_address("New owner is the zero address"));
            }
            Event event(EventType::OwnershipTransferred, contract_, ctx.timestamp);
            event.with("previous_owner", owner_.str()).with("new_owner", new_owner.str());
            owner_ = new_owner;
            return dp::Result<Event, dp::Error>::ok(event);
        }

        inline void setEventSink(std::shared_ptr<EventSink> sink) {
            std::unique_lock lock(mutex_);
            sink_ = std::move(sink);
        }

        /// Replace the owner without checks (snapshot restore)
        inline void restoreOwner(const Address &owner) {
            std::unique_lock lock(mutex_);
            owner_ = owner;
        }

      private:
        inline void publish(const Event &event) const {
            std::shared_ptr<EventSink> sink;
            {
                std::shared_lock lock(mutex_);
                sink = sink_;
            }
            if (sink) {
                sink->publish(event);
            }
        }

        std::string contract_;
        Address owner_;
        std::shared_ptr<EventSink> sink_;
        mutable std::shared_mutex mutex_;
    };

} // namespace ledgit
