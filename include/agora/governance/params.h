// AGORA - Governance Parameters
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Policy limits, instantiation parameters and configuration updates, plus
// loading of both from an INI configuration file.

#ifndef AGORA_GOVERNANCE_PARAMS_H
#define AGORA_GOVERNANCE_PARAMS_H

#include "agora/core/decimal.h"
#include "agora/core/types.h"
#include "agora/governance/errors.h"

#include <optional>
#include <string>

namespace agora {

namespace util {
class ConfigManager;
}

namespace governance {

struct GovConfig;

// ============================================================================
// Policy Constants
// ============================================================================

/// Poll title length bounds (bytes)
constexpr size_t MIN_TITLE_LENGTH = 4;
constexpr size_t MAX_TITLE_LENGTH = 64;

/// Poll description length bounds (bytes)
constexpr size_t MIN_DESC_LENGTH = 4;
constexpr size_t MAX_DESC_LENGTH = 1024;

/// Poll link length bounds (bytes)
constexpr size_t MIN_LINK_LENGTH = 12;
constexpr size_t MAX_LINK_LENGTH = 128;

/// Page size for list queries when none is given
constexpr uint32_t DEFAULT_QUERY_LIMIT = 10;

/// Largest page size a list query returns
constexpr uint32_t MAX_QUERY_LIMIT = 30;

/// Configuration file section holding InitParams
constexpr const char* GOVERNANCE_SECTION = "governance";

/// Configuration file section holding logger settings
constexpr const char* LOGGING_SECTION = "logging";

// ============================================================================
// Instantiation and Update Messages
// ============================================================================

struct InitParams {
    Decimal quorum;
    Decimal threshold;
    BlockHeight votingPeriod{0};
    BlockHeight timelockPeriod{0};
    BlockHeight expirationPeriod{0};
    Amount proposalDeposit{0};
    BlockHeight snapshotPeriod{0};

    /// Address holding the pool's tokens
    Address contractAddress;
};

/// Owner-initiated change; unset fields are left as they are
struct ConfigUpdate {
    std::optional<Address> owner;
    std::optional<Decimal> quorum;
    std::optional<Decimal> threshold;
    std::optional<BlockHeight> votingPeriod;
    std::optional<BlockHeight> timelockPeriod;
    std::optional<BlockHeight> expirationPeriod;
    std::optional<Amount> proposalDeposit;
    std::optional<BlockHeight> snapshotPeriod;
};

// ============================================================================
// Validation
// ============================================================================

/// True if 0 <= ratio <= 1
bool ValidateRatio(const Decimal& ratio);

/**
 * Check the ratio invariants of a configuration.
 * @param[out] reason Message naming the offending field
 * @return OK or InvalidRatio
 */
GovError ValidateConfig(const GovConfig& config, std::string& reason);

// ============================================================================
// Loading from Configuration Files
// ============================================================================

/// Require every [governance] key and allow the [logging] keys
void RegisterConfigKeys(util::ConfigManager& config);

/**
 * Read InitParams from the [governance] section.
 *
 * quorum and threshold are decimal strings ("0.3"); the periods and the
 * deposit are unsigned integers; contract is the pool address. All keys are
 * required, and a key outside [governance] and [logging]'s known set (a
 * misspelling, say) is rejected. Registers the known keys on config.
 *
 * @param[out] error Message naming the offending key
 * @return InitParams, or nullopt with error set
 */
std::optional<InitParams> LoadInitParams(util::ConfigManager& config,
                                         std::string& error);

/// Apply [logging] level and file to the global logger
bool ApplyLogSettings(const util::ConfigManager& config, std::string& error);

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_PARAMS_H
