// BALLOT - Configuration File Parser
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// Parses INI-style configuration files for the ballot tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, a bare "key" means true and "nokey" means false
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Environment variable expansion: ${VAR_NAME}

#ifndef BALLOT_UTIL_CONFIG_H
#define BALLOT_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ballot {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".ballot";

/// Default config file name (inside the data directory)
constexpr const char* DEFAULT_CONFIG_FILENAME = "ballot.conf";

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
    std::string source;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
    bool isDefault{false};
    bool fromCommandLine{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }

    /// "file:line: message" style description of the failure
    std::string Describe() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration gathered from the command line, a config file and
 * built-in defaults.
 *
 * Priority order (highest to lowest):
 * 1. Command-line options (SetCommandLine)
 * 2. Config file (ParseFile / ParseString)
 * 3. Built-in defaults (SetDefault)
 *
 * A key repeated inside one file collects into a list (see GetList).
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file (path gets ~ and ${VAR} expansion)
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text; sourceName is used in messages
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

    /// Accepts true/false, yes/no, on/off, 1/0 (nullopt if missing or invalid)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// All values of a key: repeated entries plus comma-separated items
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// String value with ~ and ${VAR} expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value with command-line priority
    void SetCommandLine(const std::string& key, const std::string& value);

    /// Set a value programmatically (same priority as a config file)
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (only when the key is not present yet)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    void AllowKey(const std::string& key, const std::string& section = "");

    /// Unknown keys (when any key is allowed explicitly) as error strings
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const;

    /// $HOME/.ballot, or ./.ballot when HOME is unset
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(ConfigEntry entry, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;  // Repeated entries
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* STORAGE = "storage";            // leveldb | memory
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";                // category list
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* TRUNCATENAMES = "truncatenames";
    constexpr const char* CALLER = "caller";
}

} // namespace util
} // namespace ballot

#endif // BALLOT_UTIL_CONFIG_H
