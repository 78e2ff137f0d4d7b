#pragma once

#include <cstdint>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace ledgit {

    /// SHA-256 digest of arbitrary bytes, empty on failure
    inline std::vector<uint8_t> computeSHA256(const std::vector<uint8_t> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(data);
        if (!result.success) {
            return {};
        }
        return result.data;
    }

    inline std::vector<uint8_t> computeSHA256(const std::string &data) {
        return computeSHA256(std::vector<uint8_t>(data.begin(), data.end()));
    }

    inline std::string toHex(const std::vector<uint8_t> &bytes) { return keylock::keylock::to_hex(bytes); }

    /// Append an integer in little-endian byte order
    template <typename T> inline void appendLE(std::vector<uint8_t> &out, T value) {
        auto v = static_cast<uint64_t>(value);
        for (size_t i = 0; i < sizeof(T); ++i) {
            out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
        }
    }

    /// First 8 bytes of a digest read as a big-endian integer
    inline uint64_t digestPrefix(const std::vector<uint8_t> &digest) {
        uint64_t v = 0;
        for (size_t i = 0; i < 8 && i < digest.size(); ++i) {
            v = (v << 8) | digest[i];
        }
        return v;
    }

} // namespace ledgit
