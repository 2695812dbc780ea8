// PROPSHARE - Configuration File Parser
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Parses INI-style configuration for the ledger service and console.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Bare flags: "key" means true, "nokey" means false
// - Environment variable expansion: ${VAR_NAME}
//
// Command-line overrides use --key=value or --section.key=value.

#ifndef PROPSHARE_UTIL_CONFIG_H
#define PROPSHARE_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace propshare {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "propshare.conf";

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
    std::string source;    // File path, "<string>", "<command-line>" ...
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        return {false, msg, source, line};
    }

    /// "source:line: message"
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration values from files, strings and the command line.
 *
 * Later sources overwrite earlier ones, except that defaults never
 * overwrite explicit values.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // === Parsing ===

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line options. Non-option arguments are returned
     * through positional (may be nullptr).
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       std::vector<std::string>* positional = nullptr);

    // === Value Retrieval ===

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    // === Value Setting ===

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (never overwrites an explicit value)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // === Sections ===

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // === Validation ===

    /// Register a known key
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Warnings for keys that were never allowed (empty if none allowed)
    std::vector<std::string> Validate() const;

    // === Utilities ===

    void Clear();
    size_t Size() const;

    /// Expand ${VAR} references
    static std::string ExpandEnvVars(const std::string& value);

    /// Dump all entries as "section.key=value" lines
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool isDefault);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key, char* badChar);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* BOOTSTRAPADMIN = "bootstrapadmin";

    // [market]
    constexpr const char* MARKET_SECTION = "market";
    constexpr const char* PURGESTALE = "purgestale";

    // [registry]
    constexpr const char* REGISTRY_SECTION = "registry";
    constexpr const char* REQUIREMANAGER = "requiremanager";
}

} // namespace util
} // namespace propshare

#endif // PROPSHARE_UTIL_CONFIG_H
