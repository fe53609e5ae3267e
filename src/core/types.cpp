// AGORA - Core Types Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/core/types.h"

#include <algorithm>

namespace agora {

std::string Uint128ToString(Uint128 value) {
    if (value == 0) {
        return "0";
    }

    std::string digits;
    while (value > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace agora
