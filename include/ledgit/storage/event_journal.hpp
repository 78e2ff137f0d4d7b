#pragma once

#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ledgit/common/error.hpp>
#include <ledgit/events/event_sink.hpp>
#include <mutex>
#include <vector>

namespace ledgit::storage {

    using namespace datapod;

    /// Append-only event log: one length-prefixed datapod record per event
    class EventJournal : public EventSink {
      public:
        EventJournal() = default;

        EventJournal(const EventJournal &) = delete;
        EventJournal &operator=(const EventJournal &) = delete;

        inline Result<void, Error> open(const String &file) {
            std::lock_guard lock(mutex_);
            try {
                path_ = std::string(file.c_str());
                if (path_.has_parent_path()) {
                    std::filesystem::create_directories(path_.parent_path());
                }
                if (!std::filesystem::exists(path_)) {
                    std::ofstream(path_, std::ios::binary).close();
                }
                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        inline bool isOpen() const {
            std::lock_guard lock(mutex_);
            return is_open_;
        }

        /// Fire-and-forget: failures are reported on stderr and never reach the registry
        inline void publish(const Event &event) override {
            auto result = append(event);
            if (!result.is_ok()) {
                std::cerr << "Event journal write failed: " << result.error().message.c_str() << std::endl;
            }
        }

        inline Result<void, Error> append(const Event &event) {
            std::lock_guard lock(mutex_);
            if (!is_open_)
                return Result<void, Error>::err(store_not_open("Journal not open"));

            try {
                std::ofstream out(path_, std::ios::binary | std::ios::app);
                if (!out)
                    return Result<void, Error>::err(Error::io_error("Failed to open journal for writing"));

                Event mutable_event = event;
                auto buffer = datapod::serialize<Mode::WITH_VERSION>(mutable_event);
                u32 len = static_cast<u32>(buffer.size());

                out.write(reinterpret_cast<const char *>(&len), sizeof(len));
                out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
                if (!out)
                    return Result<void, Error>::err(Error::io_error("Failed to write journal record"));
                ++count_;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(serialization_failed(String(e.what())));
            }
        }

        /// All events in append order; stops at the first truncated record
        inline Result<std::vector<Event>, Error> readAll() const {
            std::lock_guard lock(mutex_);
            if (!is_open_)
                return Result<std::vector<Event>, Error>::err(store_not_open("Journal not open"));

            std::vector<Event> events;
            std::ifstream in(path_, std::ios::binary);
            if (!in)
                return Result<std::vector<Event>, Error>::ok(std::move(events));

            try {
                while (in) {
                    u32 len;
                    in.read(reinterpret_cast<char *>(&len), sizeof(len));
                    if (!in)
                        break;

                    ByteBuf data(len);
                    in.read(reinterpret_cast<char *>(data.data()), len);
                    if (!in)
                        break;

                    events.push_back(datapod::deserialize<Mode::WITH_VERSION, Event>(data));
                }
            } catch (const std::exception &e) {
                return Result<std::vector<Event>, Error>::err(deserialization_failed(String(e.what())));
            }
            return Result<std::vector<Event>, Error>::ok(std::move(events));
        }

        /// Records appended through this handle since open()
        inline size_t appendedCount() const {
            std::lock_guard lock(mutex_);
            return count_;
        }

      private:
        std::filesystem::path path_;
        bool is_open_ = false;
        size_t count_ = 0;
        mutable std::mutex mutex_;
    };

} // namespace ledgit::storage
