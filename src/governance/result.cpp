// AGORA - Governance Operation Result
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/result.h"

namespace agora {
namespace governance {

std::string FormatAttributes(const std::vector<Attribute>& attributes) {
    std::string out;
    for (const auto& [key, value] : attributes) {
        if (!out.empty()) {
            out += ", ";
        }
        out += key;
        out += '=';
        out += value;
    }
    return out;
}

} // namespace governance
} // namespace agora
