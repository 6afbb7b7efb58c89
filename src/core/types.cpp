// BALLOT - Core Types Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/core/types.h"

#include <cctype>

namespace ballot {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";

    std::string result;
    result.reserve(SIZE * 2);
    for (size_t i = 0; i < SIZE; ++i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }
    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for " +
                                    std::to_string(SIZE) + "-byte value");
    }

    auto hexCharToNibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    BaseHash result;
    for (size_t i = 0; i < SIZE; ++i) {
        Byte high = hexCharToNibble(hex[i * 2]);
        Byte low = hexCharToNibble(hex[i * 2 + 1]);
        result.data_[i] = static_cast<Byte>((high << 4) | low);
    }
    return result;
}

template class BaseHash<160>;

// ============================================================================
// Identity Implementation
// ============================================================================

Identity Identity::FromHex(const std::string& hex) {
    BaseHash<160> base = BaseHash<160>::FromHex(hex);
    return Identity(base.data(), SIZE);
}

Identity Identity::FromLabel(const std::string& label) {
    if (label.empty()) {
        throw std::invalid_argument("Empty identity label");
    }
    if (label.size() > SIZE) {
        throw std::invalid_argument("Identity label longer than " +
                                    std::to_string(SIZE) + " bytes: " + label);
    }
    return Identity(reinterpret_cast<const Byte*>(label.data()), label.size());
}

std::string Identity::ToString() const {
    // Printable prefix followed only by zero padding reads back as a label
    size_t len = 0;
    while (len < SIZE && data_[len] != 0) {
        if (!std::isprint(data_[len])) {
            return ToHex();
        }
        ++len;
    }
    if (len == 0) {
        return ToHex();
    }
    for (size_t i = len; i < SIZE; ++i) {
        if (data_[i] != 0) {
            return ToHex();
        }
    }
    return std::string(reinterpret_cast<const char*>(data_.data()), len);
}

// ============================================================================
// BallotError Implementation
// ============================================================================

const char* BallotErrorToString(BallotError err) {
    switch (err) {
        case BallotError::OK: return "OK";
        case BallotError::NotAuthorized: return "NotAuthorized";
        case BallotError::AlreadyHasRights: return "AlreadyHasRights";
        case BallotError::NoVotingRights: return "NoVotingRights";
        case BallotError::AlreadyVoted: return "AlreadyVoted";
        case BallotError::SelfDelegation: return "SelfDelegation";
        case BallotError::DelegationCycle: return "DelegationCycle";
        case BallotError::InvalidProposal: return "InvalidProposal";
        case BallotError::InvalidInput: return "InvalidInput";
        case BallotError::StorageError: return "StorageError";
        case BallotError::NotInitialized: return "NotInitialized";
        default: return "Unknown";
    }
}

} // namespace ballot
