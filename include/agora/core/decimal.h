// AGORA - Fixed-Point Decimal
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Unsigned fixed-point number with 18 fractional digits. Used for the quorum
// and threshold ratios and for the ratios computed when a poll is resolved.

#ifndef AGORA_CORE_DECIMAL_H
#define AGORA_CORE_DECIMAL_H

#include "agora/core/types.h"
#include "agora/core/serialize.h"

#include <optional>
#include <string>

namespace agora {

class Decimal {
public:
    /// Number of fractional decimal digits
    static constexpr unsigned DECIMAL_PLACES = 18;

    /// Atomic units per whole unit (10^18)
    static constexpr uint64_t FRACTIONAL = 1000000000000000000ULL;

    constexpr Decimal() : atomics_(0) {}

    static constexpr Decimal Zero() { return Decimal(); }
    static constexpr Decimal One() { return Decimal(FRACTIONAL); }

    /// Build from raw atomic units (value * 10^18)
    static constexpr Decimal FromAtomics(Uint128 atomics) { return Decimal(atomics); }

    /// pct / 100
    static Decimal Percent(uint64_t pct);

    /// numerator / denominator, floored to 18 digits. nullopt if denominator is 0.
    static std::optional<Decimal> FromRatio(Amount numerator, Amount denominator);

    /**
     * Parse a plain decimal string such as "0.3", "1" or "0.500".
     * Rejects signs, exponents, empty parts and more than 18 fractional digits.
     */
    static std::optional<Decimal> FromString(const std::string& str);

    /// Shortest decimal representation ("0.3", "1", "0")
    std::string ToString() const;

    Uint128 Atomics() const { return atomics_; }
    bool IsZero() const { return atomics_ == 0; }

    bool operator==(const Decimal& o) const { return atomics_ == o.atomics_; }
    bool operator!=(const Decimal& o) const { return atomics_ != o.atomics_; }
    bool operator<(const Decimal& o) const { return atomics_ < o.atomics_; }
    bool operator<=(const Decimal& o) const { return atomics_ <= o.atomics_; }
    bool operator>(const Decimal& o) const { return atomics_ > o.atomics_; }
    bool operator>=(const Decimal& o) const { return atomics_ >= o.atomics_; }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata64(s, static_cast<uint64_t>(atomics_ >> 64));
        ser_writedata64(s, static_cast<uint64_t>(atomics_));
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        Uint128 high = ser_readdata64(s);
        Uint128 low = ser_readdata64(s);
        atomics_ = (high << 64) | low;
    }

private:
    explicit constexpr Decimal(Uint128 atomics) : atomics_(atomics) {}

    Uint128 atomics_;
};

template<typename Stream>
void Serialize(Stream& s, const Decimal& d) {
    d.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, Decimal& d) {
    d.Unserialize(s);
}

} // namespace agora

#endif // AGORA_CORE_DECIMAL_H
