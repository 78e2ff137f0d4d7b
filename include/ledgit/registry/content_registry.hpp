#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <ledgit/common/error.hpp>
#include <ledgit/common/types.hpp>
#include <ledgit/events/event_sink.hpp>
#include <ledgit/ownership/ownable.hpp>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace ledgit::registry {

    /// One version of a content entry
    struct ContentVersion {
        dp::u64 version_id{0}; // Global id, shared across all keys
        dp::String key;        // Logical key grouping the versions
        dp::u64 version{0};    // 1-based, per key
        dp::String label;
        dp::String uri;
        dp::String tag;
        dp::String creator;
        dp::i64 created_at{0};
        bool active{true};

        inline std::string getKey() const { return std::string(key.c_str()); }
        inline std::string getLabel() const { return std::string(label.c_str()); }
        inline std::string getUri() const { return std::string(uri.c_str()); }
        inline std::string getTag() const { return std::string(tag.c_str()); }
        inline Address getCreator() const { return Address(std::string(creator.c_str())); }

        auto members() { return std::tie(version_id, key, version, label, uri, tag, creator, created_at, active); }
        auto members() const {
            return std::tie(version_id, key, version, label, uri, tag, creator, created_at, active);
        }
    };

    /// Serializable registry state
    struct ContentState {
        dp::String owner;
        dp::u64 next_version_id{1};
        dp::Vector<ContentVersion> versions;

        auto members() { return std::tie(owner, next_version_id, versions); }
        auto members() const { return std::tie(owner, next_version_id, versions); }
    };

    /// Content registry keeps every version of every key
    /// Versions of a key count up from 1; version ids come from one global counter
    class ContentRegistry {
      public:
        static constexpr const char *CONTRACT_NAME = "ContentRegistry";

        inline explicit ContentRegistry(const Address &owner) : ownable_(CONTRACT_NAME, owner) {}

        ContentRegistry(const ContentRegistry &) = delete;
        ContentRegistry &operator=(const ContentRegistry &) = delete;

        // === Mutations ===

        /// Create version 1 of a new key
        inline dp::Result<ContentVersion, dp::Error> createBlock(const CallContext &ctx, const std::string &key,
                                                                 const std::string &label, const std::string &uri,
                                                                 const std::string &tag) {
            auto text = checkText({&key, &label, &uri, &tag});
            if (!text.is_ok()) {
                return dp::Result<ContentVersion, dp::Error>::err(text.error());
            }

            Event event;
            ContentVersion created;
            {
                std::unique_lock lock(mutex_);
                if (latest_.find(key) != latest_.end()) {
                    return dp::Result<ContentVersion, dp::Error>::err(key_exists());
                }

                created = insertVersion(ctx, key, 1, label, uri, tag);

                event = Event(EventType::ContentCreated, CONTRACT_NAME, ctx.timestamp);
                event.with("key", key)
                    .withNumber("version_id", created.version_id)
                    .with("creator", ctx.caller.str())
                    .with("label", label);
            }
            publish(event);
            return dp::Result<ContentVersion, dp::Error>::ok(created);
        }

        /// Append a version to an existing key; only the creator of the latest version may do so
        inline dp::Result<ContentVersion, dp::Error> createNewVersion(const CallContext &ctx, const std::string &key,
                                                                      const std::string &label,
                                                                      const std::string &uri,
                                                                      const std::string &tag) {
            auto text = checkText({&key, &label, &uri, &tag});
            if (!text.is_ok()) {
                return dp::Result<ContentVersion, dp::Error>::err(text.error());
            }

            Event event;
            ContentVersion created;
            {
                std::unique_lock lock(mutex_);
                auto latest_it = latest_.find(key);
                if (latest_it == latest_.end()) {
                    return dp::Result<ContentVersion, dp::Error>::err(key_not_found());
                }
                const auto &latest = versions_.at(latest_it->second);
                if (latest.getCreator() != ctx.caller) {
                    return dp::Result<ContentVersion, dp::Error>::err(
                        not_creator("Only the creator of the latest version can add versions"));
                }

                created = insertVersion(ctx, key, latest.version + 1, label, uri, tag);

                event = Event(EventType::VersionCreated, CONTRACT_NAME, ctx.timestamp);
                event.with("key", key)
                    .withNumber("version_id", created.version_id)
                    .withNumber("version", created.version)
                    .with("creator", ctx.caller.str());
            }
            publish(event);
            return dp::Result<ContentVersion, dp::Error>::ok(created);
        }

        inline dp::Result<void, dp::Error> setVersionActive(const CallContext &ctx, dp::u64 version_id, bool active) {
            Event event;
            {
                std::unique_lock lock(mutex_);
                auto it = versions_.find(version_id);
                if (it == versions_.end()) {
                    return dp::Result<void, dp::Error>::err(not_found("Version not found"));
                }
                if (it->second.getCreator() != ctx.caller) {
                    return dp::Result<void, dp::Error>::err(not_creator());
                }
                it->second.active = active;

                event = Event(EventType::VersionStatusChanged, CONTRACT_NAME, ctx.timestamp);
                event.withNumber("version_id", version_id).withFlag("active", active);
            }
            publish(event);
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> transferOwnership(const CallContext &ctx, const Address &new_owner) {
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

        // === Query Operations ===

        inline dp::Result<ContentVersion, dp::Error> getVersion(dp::u64 version_id) const {
            std::shared_lock lock(mutex_);
            auto it = versions_.find(version_id);
            if (it == versions_.end()) {
                return dp::Result<ContentVersion, dp::Error>::err(not_found("Version not found"));
            }
            return dp::Result<ContentVersion, dp::Error>::ok(it->second);
        }

        inline dp::Result<ContentVersion, dp::Error> getLatest(const std::string &key) const {
            std::shared_lock lock(mutex_);
            auto it = latest_.find(key);
            if (it == latest_.end()) {
                return dp::Result<ContentVersion, dp::Error>::err(key_not_found());
            }
            return dp::Result<ContentVersion, dp::Error>::ok(versions_.at(it->second));
        }

        inline std::optional<dp::u64> latestVersionId(const std::string &key) const {
            std::shared_lock lock(mutex_);
            auto it = latest_.find(key);
            if (it == latest_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        /// Version ids of a key in creation order
        inline std::vector<dp::u64> getVersionsOf(const std::string &key) const {
            std::shared_lock lock(mutex_);
            auto it = by_key_.find(key);
            return (it != by_key_.end()) ? it->second : std::vector<dp::u64>{};
        }

        inline std::vector<dp::u64> getVersionsByCreator(const Address &creator) const {
            std::shared_lock lock(mutex_);
            auto it = by_creator_.find(creator);
            return (it != by_creator_.end()) ? it->second : std::vector<dp::u64>{};
        }

        inline bool keyExists(const std::string &key) const {
            std::shared_lock lock(mutex_);
            return latest_.find(key) != latest_.end();
        }

        inline size_t totalVersions() const {
            std::shared_lock lock(mutex_);
            return versions_.size();
        }

        inline Address owner() const { return ownable_.owner(); }

        inline void setEventSink(std::shared_ptr<EventSink> sink) {
            std::unique_lock lock(mutex_);
            sink_ = std::move(sink);
        }

        // === Persistence ===

        inline ContentState snapshot() const {
            std::shared_lock lock(mutex_);
            ContentState state;
            state.owner = toDpString(ownable_.owner().str());
            state.next_version_id = next_version_id_;
            for (const auto &[id, version] : versions_) {
                state.versions.push_back(version);
            }
            return state;
        }

        /// Checks restore() performs before touching any state
        static inline dp::Result<void, dp::Error> validate(const ContentState &state) {
            std::map<dp::u64, const ContentVersion *> versions;
            for (const auto &v : state.versions) {
                if (v.version_id == 0 || versions.count(v.version_id) != 0) {
                    return dp::Result<void, dp::Error>::err(deserialization_failed("Duplicate or invalid version id"));
                }
                if (v.version_id >= state.next_version_id) {
                    return dp::Result<void, dp::Error>::err(
                        deserialization_failed("Version counter behind stored ids"));
                }
                versions[v.version_id] = &v;
            }

            // In id order, each key's version numbers must strictly increase
            std::unordered_map<std::string, dp::u64> last_version;
            for (const auto &[id, v] : versions) {
                auto key = v->getKey();
                auto it = last_version.find(key);
                if (it != last_version.end() && it->second >= v->version) {
                    return dp::Result<void, dp::Error>::err(
                        deserialization_failed("Version numbers not increasing for key"));
                }
                last_version[key] = v->version;
            }
            return dp::Result<void, dp::Error>::ok();
        }

        /// Rebuild every index from the stored versions
        inline dp::Result<void, dp::Error> restore(const ContentState &state) {
            auto valid = validate(state);
            if (!valid.is_ok()) {
                return valid;
            }

            std::map<dp::u64, ContentVersion> versions;
            for (const auto &v : state.versions) {
                versions[v.version_id] = v;
            }

            std::unordered_map<std::string, dp::u64> latest;
            std::unordered_map<std::string, std::vector<dp::u64>> by_key;
            std::unordered_map<Address, std::vector<dp::u64>> by_creator;
            for (const auto &[id, v] : versions) {
                auto key = v.getKey();
                latest[key] = id;
                by_key[key].push_back(id);
                by_creator[v.getCreator()].push_back(id);
            }

            {
                std::unique_lock lock(mutex_);
                versions_ = std::move(versions);
                latest_ = std::move(latest);
                by_key_ = std::move(by_key);
                by_creator_ = std::move(by_creator);
                next_version_id_ = state.next_version_id;
                ownable_.restoreOwner(Address(fromDpString(state.owner)));
            }
            std::cout << "ContentRegistry restored with " << state.versions.size() << " versions" << std::endl;
            return dp::Result<void, dp::Error>::ok();
        }

      private:
        // Stored text goes through dp::String, which ends at the first NUL
        static inline dp::Result<void, dp::Error> checkText(std::initializer_list<const std::string *> fields) {
            for (const auto *field : fields) {
                if (field->find('\0') != std::string::npos) {
                    return dp::Result<void, dp::Error>::err(
                        dp::Error::invalid_argument("Content text must not contain NUL characters"));
                }
            }
            return dp::Result<void, dp::Error>::ok();
        }

        // Caller holds the unique lock
        inline ContentVersion insertVersion(const CallContext &ctx, const std::string &key, dp::u64 version,
                                            const std::string &label, const std::string &uri,
                                            const std::string &tag) {
            ContentVersion v;
            v.version_id = next_version_id_++;
            v.key = toDpString(key);
            v.version = version;
            v.label = toDpString(label);
            v.uri = toDpString(uri);
            v.tag = toDpString(tag);
            v.creator = toDpString(ctx.caller.str());
            v.created_at = ctx.timestamp;
            v.active = true;

            versions_[v.version_id] = v;
            latest_[key] = v.version_id;
            by_key_[key].push_back(v.version_id);
            by_creator_[ctx.caller].push_back(v.version_id);
            return v;
        }

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

        Ownable ownable_;

        std::map<dp::u64, ContentVersion> versions_;
        // Key -> id of its latest version; absent means the key was never created
        std::unordered_map<std::string, dp::u64> latest_;
        std::unordered_map<std::string, std::vector<dp::u64>> by_key_;
        std::unordered_map<Address, std::vector<dp::u64>> by_creator_;
        dp::u64 next_version_id_ = 1;

        std::shared_ptr<EventSink> sink_;
        mutable std::shared_mutex mutex_;
    };

} // namespace ledgit::registry
