#pragma once

#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ledgit/common/error.hpp>
#include <string>

namespace ledgit::storage {

    using namespace datapod;

    /// Storage configuration options
    struct StoreOptions {
        bool sync_on_save = true; // Flush each snapshot before the rename

        auto members() { return std::tie(sync_on_save); }
        auto members() const { return std::tie(sync_on_save); }
    };

    // ===========================================
    // SnapshotStore - whole-state snapshots on disk
    // ===========================================

    /// Each named snapshot lives in <dir>/<name>.snap as a length-prefixed datapod record
    /// save() writes a temp file and renames it over the old one, so readers see either
    /// the previous or the new state, never a partial write
    class SnapshotStore {
      public:
        SnapshotStore() = default;

        SnapshotStore(const SnapshotStore &) = delete;
        SnapshotStore &operator=(const SnapshotStore &) = delete;

        inline SnapshotStore(SnapshotStore &&other) noexcept
            : base_path_(std::move(other.base_path_)), is_open_(other.is_open_), options_(other.options_) {
            other.is_open_ = false;
        }

        inline SnapshotStore &operator=(SnapshotStore &&other) noexcept {
            if (this != &other) {
                base_path_ = std::move(other.base_path_);
                is_open_ = other.is_open_;
                options_ = other.options_;
                other.is_open_ = false;
            }
            return *this;
        }

        /// Open or create storage at given path (directory)
        inline Result<void, Error> open(const String &path, const StoreOptions &opts = StoreOptions{}) {
            try {
                base_path_ = std::string(path.c_str());
                options_ = opts;
                std::filesystem::create_directories(base_path_);
                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        inline void close() { is_open_ = false; }

        inline bool isOpen() const { return is_open_; }

        inline const std::filesystem::path &path() const { return base_path_; }

        inline bool exists(const std::string &name) const {
            return is_open_ && std::filesystem::exists(snapshotPath(name));
        }

        template <typename T> inline Result<void, Error> save(const std::string &name, const T &state) {
            if (!is_open_)
                return Result<void, Error>::err(store_not_open());

            auto final_path = snapshotPath(name);
            auto tmp_path = final_path;
            tmp_path += ".tmp";

            try {
                // Serialize using datapod (need mutable copy)
                T mutable_state = state;
                auto buffer = datapod::serialize<Mode::WITH_VERSION>(mutable_state);
                u32 len = static_cast<u32>(buffer.size());

                {
                    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
                    if (!out)
                        return Result<void, Error>::err(Error::io_error("Failed to open snapshot for writing"));
                    out.write(reinterpret_cast<const char *>(&len), sizeof(len));
                    out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
                    if (options_.sync_on_save)
                        out.flush();
                    if (!out)
                        return Result<void, Error>::err(Error::io_error("Failed to write snapshot"));
                }

                std::filesystem::rename(tmp_path, final_path);
                std::cout << "Snapshot saved: " << final_path.string() << " (" << len << " bytes)" << std::endl;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                std::error_code ec;
                std::filesystem::remove(tmp_path, ec);
                return Result<void, Error>::err(serialization_failed(String(e.what())));
            }
        }

        template <typename T> inline Result<T, Error> load(const std::string &name) const {
            if (!is_open_)
                return Result<T, Error>::err(store_not_open());

            auto file = snapshotPath(name);
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return Result<T, Error>::err(Error::not_found(String(("No snapshot named " + name).c_str())));

            u32 len = 0;
            in.read(reinterpret_cast<char *>(&len), sizeof(len));
            if (!in)
                return Result<T, Error>::err(deserialization_failed("Truncated snapshot header"));

            ByteBuf data(len);
            in.read(reinterpret_cast<char *>(data.data()), len);
            if (!in)
                return Result<T, Error>::err(deserialization_failed("Truncated snapshot body"));

            try {
                auto state = datapod::deserialize<Mode::WITH_VERSION, T>(data);
                return Result<T, Error>::ok(std::move(state));
            } catch (const std::exception &e) {
                return Result<T, Error>::err(deserialization_failed(String(e.what())));
            }
        }

        inline Result<void, Error> remove(const std::string &name) {
            if (!is_open_)
                return Result<void, Error>::err(store_not_open());
            std::error_code ec;
            std::filesystem::remove(snapshotPath(name), ec);
            if (ec)
                return Result<void, Error>::err(Error::io_error(String(ec.message().c_str())));
            return Result<void, Error>::ok();
        }

      private:
        inline std::filesystem::path snapshotPath(const std::string &name) const { return base_path_ / (name + ".snap"); }

        std::filesystem::path base_path_;
        bool is_open_ = false;
        StoreOptions options_;
    };

} // namespace ledgit::storage
