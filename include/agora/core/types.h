// AGORA - Core Types Header
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// This file defines fundamental types used throughout AGORA.

#ifndef AGORA_CORE_TYPES_H
#define AGORA_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace agora {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer (opaque payloads)
using Bytes = std::vector<Byte>;

/// Token amount in smallest units
using Amount = uint64_t;

/// Block height supplied by the host with every invocation
using BlockHeight = uint64_t;

/// Canonical account or contract address
using Address = std::string;

/// Sequential poll identifier (the first poll is 1)
using PollId = uint64_t;

/// Unsigned 128-bit integer for intermediate products
using Uint128 = unsigned __int128;

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// a + b, or nullopt on overflow
inline std::optional<Amount> CheckedAdd(Amount a, Amount b) {
    if (a > std::numeric_limits<Amount>::max() - b) {
        return std::nullopt;
    }
    return a + b;
}

/// a - b, or nullopt on underflow
inline std::optional<Amount> CheckedSub(Amount a, Amount b) {
    if (b > a) {
        return std::nullopt;
    }
    return a - b;
}

/**
 * Compute floor(value * numerator / denominator) using a 128-bit product.
 * Returns nullopt if the denominator is zero or the result does not fit.
 */
inline std::optional<Amount> MultiplyRatio(Amount value, Amount numerator,
                                           Amount denominator) {
    if (denominator == 0) {
        return std::nullopt;
    }
    Uint128 product = static_cast<Uint128>(value) * numerator;
    Uint128 result = product / denominator;
    if (result > std::numeric_limits<Amount>::max()) {
        return std::nullopt;
    }
    return static_cast<Amount>(result);
}

/// ceil(value * numerator / denominator); nullopt as for MultiplyRatio
inline std::optional<Amount> MultiplyRatioCeil(Amount value, Amount numerator,
                                               Amount denominator) {
    if (denominator == 0) {
        return std::nullopt;
    }
    Uint128 product = static_cast<Uint128>(value) * numerator;
    Uint128 result = (product + denominator - 1) / denominator;
    if (result > std::numeric_limits<Amount>::max()) {
        return std::nullopt;
    }
    return static_cast<Amount>(result);
}

/// Decimal representation of a 128-bit unsigned value
std::string Uint128ToString(Uint128 value);

} // namespace agora

#endif // AGORA_CORE_TYPES_H
