// AGORA - Governance Parameters Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/params.h"
#include "agora/governance/state.h"
#include "agora/util/config.h"
#include "agora/util/logging.h"

#include <memory>
#include <vector>

namespace agora {
namespace governance {

bool ValidateRatio(const Decimal& ratio) {
    return ratio >= Decimal::Zero() && ratio <= Decimal::One();
}

GovError ValidateConfig(const GovConfig& config, std::string& reason) {
    if (!ValidateRatio(config.quorum)) {
        reason = "quorum must be 0 to 1";
        return GovError::InvalidRatio;
    }
    if (!ValidateRatio(config.threshold)) {
        reason = "threshold must be 0 to 1";
        return GovError::InvalidRatio;
    }
    return GovError::OK;
}

namespace {

bool ReadRatio(const util::ConfigManager& config, const char* key,
               Decimal& out, std::string& error) {
    auto raw = config.TryGetString(key, GOVERNANCE_SECTION);
    if (!raw) {
        error = std::string("missing key: ") + GOVERNANCE_SECTION + "." + key;
        return false;
    }
    auto parsed = Decimal::FromString(*raw);
    if (!parsed) {
        error = std::string("invalid decimal for ") + GOVERNANCE_SECTION + "." + key +
                ": " + *raw;
        return false;
    }
    if (!ValidateRatio(*parsed)) {
        error = std::string(key) + " must be 0 to 1";
        return false;
    }
    out = *parsed;
    return true;
}

bool ReadUInt(const util::ConfigManager& config, const char* key,
              uint64_t& out, std::string& error) {
    if (!config.HasKey(key, GOVERNANCE_SECTION)) {
        error = std::string("missing key: ") + GOVERNANCE_SECTION + "." + key;
        return false;
    }
    auto parsed = config.TryGetUInt(key, GOVERNANCE_SECTION);
    if (!parsed) {
        error = std::string("invalid unsigned integer for ") + GOVERNANCE_SECTION +
                "." + key + ": " + config.GetString(key, "", GOVERNANCE_SECTION);
        return false;
    }
    out = *parsed;
    return true;
}

const char* const GOVERNANCE_KEYS[] = {
    "contract", "quorum", "threshold", "voting_period", "timelock_period",
    "expiration_period", "proposal_deposit", "snapshot_period",
};

const char* const LOGGING_KEYS[] = {"level", "file"};

} // namespace

void RegisterConfigKeys(util::ConfigManager& config) {
    for (const char* key : GOVERNANCE_KEYS) {
        config.RequireKey(key, GOVERNANCE_SECTION);
    }
    for (const char* key : LOGGING_KEYS) {
        config.AllowKey(key, LOGGING_SECTION);
    }
}

std::optional<InitParams> LoadInitParams(util::ConfigManager& config,
                                         std::string& error) {
    RegisterConfigKeys(config);

    InitParams params;
    if (!ReadRatio(config, "quorum", params.quorum, error) ||
        !ReadRatio(config, "threshold", params.threshold, error) ||
        !ReadUInt(config, "voting_period", params.votingPeriod, error) ||
        !ReadUInt(config, "timelock_period", params.timelockPeriod, error) ||
        !ReadUInt(config, "expiration_period", params.expirationPeriod, error) ||
        !ReadUInt(config, "proposal_deposit", params.proposalDeposit, error) ||
        !ReadUInt(config, "snapshot_period", params.snapshotPeriod, error)) {
        LOG_WARN(util::LogCategory::CONFIG) << "Rejected governance settings: " << error;
        return std::nullopt;
    }

    auto contract = config.TryGetString("contract", GOVERNANCE_SECTION);
    if (!contract || contract->empty()) {
        error = std::string("missing key: ") + GOVERNANCE_SECTION + ".contract";
        LOG_WARN(util::LogCategory::CONFIG) << "Rejected governance settings: " << error;
        return std::nullopt;
    }
    params.contractAddress = *contract;

    // Every required key was read above, so anything left is unknown
    std::vector<std::string> problems = config.Validate();
    if (!problems.empty()) {
        error = problems.front();
        LOG_WARN(util::LogCategory::CONFIG) << "Rejected governance settings: " << error;
        return std::nullopt;
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded governance settings: quorum="
                                         << params.quorum.ToString()
                                         << " threshold=" << params.threshold.ToString()
                                         << " voting_period=" << params.votingPeriod;
    return params;
}

bool ApplyLogSettings(const util::ConfigManager& config, std::string& error) {
    auto& logger = util::Logger::Instance();

    if (auto level = config.TryGetString("level", LOGGING_SECTION)) {
        logger.SetLevel(util::LogLevelFromString(*level));
    }

    if (auto file = config.TryGetString("file", LOGGING_SECTION)) {
        auto sink = std::make_shared<util::FileSink>(logger.GetLevel());
        if (!sink->Open(*file)) {
            error = "cannot open log file: " + *file;
            return false;
        }
        logger.AddSink(sink);
    }
    return true;
}

} // namespace governance
} // namespace agora
