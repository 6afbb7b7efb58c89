// BALLOT - Core Types Header
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// This file defines fundamental types used throughout BALLOT.

#ifndef BALLOT_CORE_TYPES_H
#define BALLOT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace ballot {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Unit of voting power
using Weight = uint64_t;

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-width binary value
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null value
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if value is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string (storage byte order)
    std::string ToHex() const;

    /// Create from hex string, throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 160-bit value (20 bytes) - for account addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
};

// ============================================================================
// Identity
// ============================================================================

/**
 * Opaque caller identity (an account address).
 *
 * The voting core never inspects the bytes; it only compares identities
 * and uses them as storage keys.
 */
class Identity : public Hash160 {
public:
    using Hash160::Hash160;
    Identity() = default;
    Identity(const Byte* data, size_t len) noexcept : Hash160(data, len) {}
    explicit Identity(const Hash160& h) : Hash160(h) {}

    /// Parse 40 hex digits, throws std::invalid_argument on bad input
    static Identity FromHex(const std::string& hex);

    /// Build an identity from a short account label (at most SIZE bytes).
    /// Throws std::invalid_argument for empty or oversized labels.
    static Identity FromLabel(const std::string& label);

    /// Label form if the identity was built from a printable label, hex otherwise
    std::string ToString() const;
};

// ============================================================================
// Result Type
// ============================================================================

/// Ballot operation error codes
enum class BallotError {
    OK = 0,

    // Authorization
    NotAuthorized,

    // Voting rights
    AlreadyHasRights,
    NoVotingRights,
    AlreadyVoted,

    // Delegation
    SelfDelegation,
    DelegationCycle,

    // Proposals
    InvalidProposal,
    InvalidInput,

    // Storage
    StorageError,
    NotInitialized,
};

/// Convert error to string
const char* BallotErrorToString(BallotError err);

} // namespace ballot

#endif // BALLOT_CORE_TYPES_H
