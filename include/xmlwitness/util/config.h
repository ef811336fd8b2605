// XMLWITNESS - Configuration File Parser
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Parses INI-style configuration files holding witness generation defaults.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs (the first '=' separates key and value)
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef XMLWITNESS_UTIL_CONFIG_H
#define XMLWITNESS_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace xmlwitness {
namespace util {

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
    std::string source;    // File path where this was defined
    int lineNumber{0};
};

/**
 * Result of parsing a configuration file.
 */
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

    /// "file:line: message" for diagnostics
    std::string Describe() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration values keyed by (section, key).
 *
 * Values set with Set() or parsed from a file replace earlier values.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
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

    /// Returns nullopt if the key is missing or not a non-negative integer
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Inspection and Validation
    // ========================================================================

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Register an allowed key for Validate()
    void AllowKey(const std::string& key, const std::string& section = "");

    /// One message per key in a section with allowed keys that is not allowed
    std::vector<std::string> Validate() const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// Expand ${VAR} and $VAR references from the environment
    static std::string ExpandEnvVars(const std::string& value);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    /// Section holding witness generation parameters
    constexpr const char* WITNESS_SECTION = "witness";

    constexpr const char* NULLIFIER_SEED = "nullifierseed";
    constexpr const char* REVEAL_START = "revealstart";
    constexpr const char* REVEAL_END = "revealend";
    constexpr const char* MAX_INPUT_LENGTH = "maxinputlength";
    constexpr const char* RSA_BITS_PER_CHUNK = "rsakeybitsperchunk";
    constexpr const char* RSA_NUM_CHUNKS = "rsakeynumchunks";
    constexpr const char* ANCHOR = "anchor";

    // Global section
    constexpr const char* LOG_LEVEL = "loglevel";
    constexpr const char* LOG_FILE = "logfile";
}

} // namespace util
} // namespace xmlwitness

#endif // XMLWITNESS_UTIL_CONFIG_H
