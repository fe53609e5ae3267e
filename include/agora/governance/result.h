// AGORA - Governance Operation Result
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Outcome of an engine operation: the error code and reason on failure, or
// the emitted attributes and outbound effects on success.

#ifndef AGORA_GOVERNANCE_RESULT_H
#define AGORA_GOVERNANCE_RESULT_H

#include "agora/core/types.h"
#include "agora/governance/errors.h"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace agora {
namespace governance {

/// Key/value event attribute, e.g. ("action", "staking")
using Attribute = std::pair<std::string, std::string>;

/// Instructs the host to move tokens out of the pool
struct TokenTransfer {
    Address token;
    Address recipient;
    Amount amount{0};

    bool operator==(const TokenTransfer& o) const {
        return token == o.token && recipient == o.recipient && amount == o.amount;
    }
};

/// Opaque call relayed to a target on poll execution
struct DelegatedCall {
    Address target;
    Bytes payload;

    bool operator==(const DelegatedCall& o) const {
        return target == o.target && payload == o.payload;
    }
};

using Effect = std::variant<TokenTransfer, DelegatedCall>;

struct HandleResult {
    GovError error{GovError::OK};

    /// Human-readable reason; empty on success
    std::string reason;

    std::vector<Attribute> attributes;

    /// Outbound effects in emission order
    std::vector<Effect> effects;

    bool IsOk() const { return error == GovError::OK; }

    static HandleResult Success() { return HandleResult(); }

    static HandleResult Failure(GovError err, std::string why = "") {
        HandleResult result;
        result.error = err;
        result.reason = why.empty() ? GovErrorToString(err) : std::move(why);
        return result;
    }

    HandleResult& AddAttribute(std::string key, std::string value) {
        attributes.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    HandleResult& AddEffect(Effect effect) {
        effects.push_back(std::move(effect));
        return *this;
    }

    /// First attribute with the given key
    std::optional<std::string> GetAttribute(const std::string& key) const {
        for (const auto& [k, v] : attributes) {
            if (k == key) {
                return v;
            }
        }
        return std::nullopt;
    }
};

/// "k1=v1, k2=v2" for log output
std::string FormatAttributes(const std::vector<Attribute>& attributes);

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_RESULT_H
