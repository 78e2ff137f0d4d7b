#pragma once

#include <datapod/datapod.hpp>

namespace ledgit {

    // ===========================================
    // Ledgit-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_NOT_OWNER = 100;
    constexpr dp::u32 ERR_NOT_CREATOR = 101;
    constexpr dp::u32 ERR_INACTIVE = 102;
    constexpr dp::u32 ERR_NOT_FOUND = 103;
    constexpr dp::u32 ERR_KEY_NOT_FOUND = 104;
    constexpr dp::u32 ERR_KEY_EXISTS = 105;
    constexpr dp::u32 ERR_EVOLUTION_NOT_READY = 106;
    constexpr dp::u32 ERR_INSUFFICIENT_PAYMENT = 107;
    constexpr dp::u32 ERR_INSUFFICIENT_BALANCE = 108;
    constexpr dp::u32 ERR_ALLOWANCE_EXCEEDED = 109;
    constexpr dp::u32 ERR_ZERO_ADDRESS = 110;
    constexpr dp::u32 ERR_SELF_MERGE = 111;
    constexpr dp::u32 ERR_OVERFLOW = 112;
    constexpr dp::u32 ERR_STORE_NOT_OPEN = 113;
    constexpr dp::u32 ERR_SERIALIZATION_FAILED = 114;
    constexpr dp::u32 ERR_DESERIALIZATION_FAILED = 115;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error not_owner(const dp::String &msg = "Caller is not the owner") {
        return dp::Error{ERR_NOT_OWNER, msg};
    }

    inline dp::Error not_creator(const dp::String &msg = "Caller is not the creator") {
        return dp::Error{ERR_NOT_CREATOR, msg};
    }

    inline dp::Error inactive(const dp::String &msg = "Entity is inactive") { return dp::Error{ERR_INACTIVE, msg}; }

    inline dp::Error not_found(const dp::String &msg = "Entity not found") { return dp::Error{ERR_NOT_FOUND, msg}; }

    inline dp::Error key_not_found(const dp::String &msg = "Key not found") {
        return dp::Error{ERR_KEY_NOT_FOUND, msg};
    }

    inline dp::Error key_exists(const dp::String &msg = "Key already exists") {
        return dp::Error{ERR_KEY_EXISTS, msg};
    }

    inline dp::Error evolution_not_ready(const dp::String &msg = "Evolution not ready yet") {
        return dp::Error{ERR_EVOLUTION_NOT_READY, msg};
    }

    inline dp::Error insufficient_payment(const dp::String &msg = "Insufficient payment") {
        return dp::Error{ERR_INSUFFICIENT_PAYMENT, msg};
    }

    inline dp::Error insufficient_balance(const dp::String &msg = "Insufficient balance") {
        return dp::Error{ERR_INSUFFICIENT_BALANCE, msg};
    }

    inline dp::Error allowance_exceeded(const dp::String &msg = "Allowance exceeded") {
        return dp::Error{ERR_ALLOWANCE_EXCEEDED, msg};
    }

    inline dp::Error zero_address(const dp::String &msg = "Zero address") { return dp::Error{ERR_ZERO_ADDRESS, msg}; }

    inline dp::Error self_merge(const dp::String &msg = "Cannot merge a block with itself") {
        return dp::Error{ERR_SELF_MERGE, msg};
    }

    inline dp::Error overflow(const dp::String &msg = "Arithmetic overflow") { return dp::Error{ERR_OVERFLOW, msg}; }

    inline dp::Error store_not_open(const dp::String &msg = "Store not open") {
        return dp::Error{ERR_STORE_NOT_OPEN, msg};
    }

    inline dp::Error serialization_failed(const dp::String &msg = "Serialization failed") {
        return dp::Error{ERR_SERIALIZATION_FAILED, msg};
    }

    inline dp::Error deserialization_failed(const dp::String &msg = "Deserialization failed") {
        return dp::Error{ERR_DESERIALIZATION_FAILED, msg};
    }

} // namespace ledgit
