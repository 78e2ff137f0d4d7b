#pragma once

#include "hash.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <datapod/datapod.hpp>
#include <functional>
#include <string>

namespace ledgit {

    /// Account identifier: "0x" followed by 40 hex digits
    /// An empty or all-zero address is the zero address
    class Address {
      public:
        Address() = default;

        inline explicit Address(std::string hex) : hex_(normalize(std::move(hex))) {}

        /// The zero address, used as the source of mints and sink of burns
        inline static Address zero() { return Address("0x" + std::string(40, '0')); }

        /// Deterministic address for a seed (first 20 bytes of SHA-256(seed))
        inline static Address derive(const std::string &seed) {
            auto digest = computeSHA256(seed);
            if (digest.size() < 20) {
                return Address();
            }
            digest.resize(20);
            return Address("0x" + toHex(digest));
        }

        inline bool isZero() const {
            if (hex_.size() <= 2) {
                return true;
            }
            return std::all_of(hex_.begin() + 2, hex_.end(), [](char c) { return c == '0'; });
        }

        inline const std::string &str() const { return hex_; }

        inline bool operator==(const Address &other) const { return hex_ == other.hex_; }
        inline bool operator!=(const Address &other) const { return hex_ != other.hex_; }
        inline bool operator<(const Address &other) const { return hex_ < other.hex_; }

      private:
        inline static std::string normalize(std::string hex) {
            std::transform(hex.begin(), hex.end(), hex.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (!hex.empty() && hex.rfind("0x", 0) != 0) {
                hex = "0x" + hex;
            }
            return hex;
        }

        std::string hex_;
    };

    /// Host-supplied call information: who calls, what value is attached, and when
    struct CallContext {
        Address caller;
        dp::u64 value{0};
        dp::i64 timestamp{0};

        CallContext() = default;
        CallContext(Address c, dp::u64 v, dp::i64 ts) : caller(std::move(c)), value(v), timestamp(ts) {}

        inline static CallContext at(const Address &caller, dp::i64 timestamp, dp::u64 value = 0) {
            return CallContext(caller, value, timestamp);
        }

        /// Context stamped with the current system time (seconds)
        inline static CallContext now(const Address &caller, dp::u64 value = 0) {
            auto ts = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
            return CallContext(caller, value, ts);
        }
    };

    inline dp::String toDpString(const std::string &s) { return dp::String(s.c_str()); }
    inline std::string fromDpString(const dp::String &s) { return std::string(s.c_str()); }

} // namespace ledgit

namespace std {
    template <> struct hash<ledgit::Address> {
        size_t operator()(const ledgit::Address &a) const noexcept { return std::hash<std::string>{}(a.str()); }
    };
} // namespace std
