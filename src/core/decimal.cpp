// AGORA - Fixed-Point Decimal Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/core/decimal.h"

#include <limits>

namespace agora {

Decimal Decimal::Percent(uint64_t pct) {
    return Decimal(static_cast<Uint128>(pct) * (FRACTIONAL / 100));
}

std::optional<Decimal> Decimal::FromRatio(Amount numerator, Amount denominator) {
    if (denominator == 0) {
        return std::nullopt;
    }
    // numerator < 2^64 and FRACTIONAL < 2^60, so the product fits in 128 bits
    Uint128 scaled = static_cast<Uint128>(numerator) * FRACTIONAL;
    return Decimal(scaled / denominator);
}

std::optional<Decimal> Decimal::FromString(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    size_t dot = str.find('.');
    std::string whole = str.substr(0, dot);
    std::string frac = (dot == std::string::npos) ? "" : str.substr(dot + 1);

    if (whole.empty()) {
        return std::nullopt;
    }
    if (dot != std::string::npos && frac.empty()) {
        return std::nullopt;
    }
    if (frac.size() > DECIMAL_PLACES) {
        return std::nullopt;
    }

    const Uint128 maxWhole = std::numeric_limits<Uint128>::max() / FRACTIONAL;
    Uint128 wholeValue = 0;
    for (char c : whole) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        wholeValue = wholeValue * 10 + static_cast<Uint128>(c - '0');
        if (wholeValue > maxWhole) {
            return std::nullopt;
        }
    }

    Uint128 fracValue = 0;
    for (char c : frac) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        fracValue = fracValue * 10 + static_cast<Uint128>(c - '0');
    }
    for (size_t i = frac.size(); i < DECIMAL_PLACES; ++i) {
        fracValue *= 10;
    }

    Uint128 atomics = wholeValue * FRACTIONAL;
    if (atomics > std::numeric_limits<Uint128>::max() - fracValue) {
        return std::nullopt;
    }
    return Decimal(atomics + fracValue);
}

std::string Decimal::ToString() const {
    Uint128 whole = atomics_ / FRACTIONAL;
    uint64_t frac = static_cast<uint64_t>(atomics_ % FRACTIONAL);

    std::string out = Uint128ToString(whole);
    if (frac == 0) {
        return out;
    }

    std::string digits = std::to_string(frac);
    digits.insert(0, DECIMAL_PLACES - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') {
        digits.pop_back();
    }
    return out + "." + digits;
}

} // namespace agora
