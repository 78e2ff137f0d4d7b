#pragma once

#include "event.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace ledgit {

    /// Destination for registry events
    /// publish() is fire-and-forget and may be called concurrently
    class EventSink {
      public:
        virtual ~EventSink() = default;
        virtual void publish(const Event &event) = 0;
    };

    /// Prints one JSON line per event to stdout
    class ConsoleEventSink : public EventSink {
      public:
        inline void publish(const Event &event) override {
            std::lock_guard lock(mutex_);
            std::cout << "[event] " << event.toJson() << std::endl;
        }

      private:
        std::mutex mutex_;
    };

    /// Keeps every published event in memory
    class MemoryEventSink : public EventSink {
      public:
        inline void publish(const Event &event) override {
            std::unique_lock lock(mutex_);
            events_.push_back(event);
        }

        inline std::vector<Event> events() const {
            std::shared_lock lock(mutex_);
            return events_;
        }

        inline std::vector<Event> eventsOfType(EventType type) const {
            std::shared_lock lock(mutex_);
            std::vector<Event> result;
            for (const auto &e : events_) {
                if (e.getType() == type) {
                    result.push_back(e);
                }
            }
            return result;
        }

        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return events_.size();
        }

        inline Event last() const {
            std::shared_lock lock(mutex_);
            return events_.empty() ? Event{} : events_.back();
        }

        inline void clear() {
            std::unique_lock lock(mutex_);
            events_.clear();
        }

      private:
        std::vector<Event> events_;
        mutable std::shared_mutex mutex_;
    };

    /// Forwards each event to several sinks in registration order
    class FanoutEventSink : public EventSink {
      public:
        inline void addSink(std::shared_ptr<EventSink> sink) {
            std::unique_lock lock(mutex_);
            if (sink) {
                sinks_.push_back(std::move(sink));
            }
        }

        inline void publish(const Event &event) override {
            std::shared_lock lock(mutex_);
            for (const auto &sink : sinks_) {
                sink->publish(event);
            }
        }

        inline size_t sinkCount() const {
            std::shared_lock lock(mutex_);
            return sinks_.size();
        }

      private:
        std::vector<std::shared_ptr<EventSink>> sinks_;
        mutable std::shared_mutex mutex_;
    };

} // namespace ledgit
