// AGORA - Token Balance Query
// Copyright (c) 2024 AGORA Developers
// MIT License

#ifndef AGORA_STAKING_TOKEN_H
#define AGORA_STAKING_TOKEN_H

#include "agora/core/types.h"

#include <optional>

namespace agora {
namespace staking {

/**
 * Host-provided view of the governed token contract.
 * Only balances are read; transfers leave the engine as effects.
 */
class TokenQuerier {
public:
    virtual ~TokenQuerier() = default;

    /// Balance of holder in token, or nullopt if the query failed
    virtual std::optional<Amount> QueryBalance(const Address& token,
                                               const Address& holder) const = 0;
};

} // namespace staking
} // namespace agora

#endif // AGORA_STAKING_TOKEN_H
