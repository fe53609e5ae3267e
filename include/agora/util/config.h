// AGORA - Configuration File Parser
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Parses INI-style configuration files that describe a governance instance.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Environment variable expansion: ${VAR_NAME}

#ifndef AGORA_UTIL_CONFIG_H
#define AGORA_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agora {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<string>"
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds key/value settings grouped by section.
 *
 * Later definitions of a key replace earlier ones. Keys are addressed as
 * "section:key", or just "key" in the global section.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @return Parse result with the failing line on error
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config text
     * @param sourceName Name used in error messages
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Unsigned integer; nullopt if missing, negative or not a whole number
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    // ========================================================================
    // Validation
    // ========================================================================

    /// Key must be present for Validate to pass
    void RequireKey(const std::string& key, const std::string& section = "");

    /// Key may be present; once any key is allowed, unlisted keys are errors
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Missing required keys and, when allowed keys are registered, unknown keys
    std::vector<std::string> Validate() const;

    /// Expand ${VAR} and $VAR references from the environment
    static std::string ExpandEnvVars(const std::string& value);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    ConfigParseResult ParseStream(std::istream& in, const std::string& sourceName);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
};

} // namespace util
} // namespace agora

#endif // AGORA_UTIL_CONFIG_H
