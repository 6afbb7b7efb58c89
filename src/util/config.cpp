// BALLOT - Configuration File Parser Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace ballot {
namespace util {

namespace {

constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

std::string ConfigParseResult::Describe() const {
    if (success) {
        return "OK";
    }
    std::string out;
    if (!errorFile.empty()) {
        out = errorFile;
        if (errorLine > 0) {
            out += ":" + std::to_string(errorLine);
        }
        out += ": ";
    }
    return out + errorMessage;
}

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    char first = str.front();
    if ((first != '"' && first != '\'') || str.back() != first) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Double quotes honour \n \t \\ and \"
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n': out += '\n'; ++i; continue;
                case 't': out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"': out += '"'; ++i; continue;
                default: break;
            }
        }
        out += inner[i];
    }
    return out;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string varName = value.substr(i + 2, end - i - 2);
                if (const char* env = std::getenv(varName.c_str())) {
                    result += env;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i];
        ++i;
    }

    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        // ~user forms are left alone
        return path;
    }

    std::string home;
    if (const char* homeEnv = std::getenv("HOME")) {
        home = homeEnv;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }

    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/" + DEFAULT_DATADIR_NAME;
    }
    return std::string("./") + DEFAULT_DATADIR_NAME;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(ConfigEntry entry, ConfigParseResult& result) {
    std::string fullKey = MakeKey(entry.key, entry.section);

    auto it = entries_.find(fullKey);
    if (it == entries_.end() || it->second.isDefault) {
        entries_[fullKey] = std::move(entry);
        return;
    }

    if (it->second.fromCommandLine) {
        result.warnings.push_back(entry.source + ":" + std::to_string(entry.lineNumber) +
                                  ": '" + fullKey + "' ignored, set on the command line");
        return;
    }

    if (it->second.source == entry.source) {
        // Repeated key in the same source becomes a list
        lists_[fullKey].push_back(entry.value);
        return;
    }

    entries_[fullKey] = std::move(entry);
    lists_.erase(fullKey);
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag, "nokey" negates
        entry.key = trimmed;
        entry.value = "true";
        if (entry.key.size() > 2 && entry.key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(entry.key[2]))) {
            entry.key = entry.key.substr(2);
            entry.value = "false";
        }
    } else {
        entry.key = Trim(trimmed.substr(0, eqPos));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (entry.key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    if (!IsValidKey(entry.key)) {
        result = ConfigParseResult::Error("Invalid key: " + entry.key, source, lineNum);
        return false;
    }

    Store(std::move(entry), result);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    ConfigParseResult result = ConfigParseResult::Success();
    std::string currentSection;
    std::string line;
    std::string continuation;
    int lineNum = 0;
    int startLine = 0;

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!line.empty() && line.back() == '\\') {
            if (continuation.empty()) {
                startLine = lineNum;
            }
            continuation += line.substr(0, line.length() - 1);
            continue;
        }

        int reportLine = lineNum;
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
            reportLine = startLine;
        }

        if (!ParseLine(line, source, reportLine, currentSection, result)) {
            return result;
        }
    }

    if (!continuation.empty()) {
        if (!ParseLine(continuation, source, startLine, currentSection, result)) {
            return result;
        }
    }

    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }

    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto value = TryGetString(key, section);
    if (!value) {
        return std::nullopt;
    }
    return ParseBool(*value);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::string fullKey = MakeKey(key, section);
    std::vector<std::string> values;

    auto entryIt = entries_.find(fullKey);
    if (entryIt == entries_.end()) {
        return values;
    }

    values.push_back(entryIt->second.value);
    auto listIt = lists_.find(fullKey);
    if (listIt != lists_.end()) {
        values.insert(values.end(), listIt->second.begin(), listIt->second.end());
    }

    std::vector<std::string> result;
    for (const auto& value : values) {
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    }
    return result;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::SetCommandLine(const std::string& key, const std::string& value) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.source = COMMAND_LINE_SOURCE;
    entry.fromCommandLine = true;

    entries_[key] = std::move(entry);
    lists_.erase(key);
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && it->second.fromCommandLine) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";

    entries_[fullKey] = std::move(entry);
    lists_.erase(fullKey);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.count(fullKey) > 0) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;

    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    if (allowedKeys_.empty()) {
        return errors;
    }

    for (const auto& [fullKey, entry] : entries_) {
        if (allowedKeys_.count(fullKey) == 0) {
            std::string where = entry.source;
            if (entry.lineNumber > 0) {
                where += ":" + std::to_string(entry.lineNumber);
            }
            errors.push_back("Unknown key: " + fullKey + " (defined in " + where + ")");
        }
    }
    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    allowedKeys_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    oss << "# Configuration (" << entries_.size() << " entries)\n";

    // Global section sorts first since its name is empty
    std::map<std::string, std::vector<const ConfigEntry*>> bySection;
    for (const auto& [fullKey, entry] : entries_) {
        bySection[entry.section].push_back(&entry);
    }

    for (const auto& [section, entries] : bySection) {
        if (!section.empty()) {
            oss << "\n[" << section << "]\n";
        }
        for (const ConfigEntry* entry : entries) {
            oss << entry->key << "=" << entry->value << "  # ";
            if (entry->isDefault) {
                oss << "(default)";
            } else {
                oss << entry->source;
                if (entry->lineNumber > 0) {
                    oss << ":" << entry->lineNumber;
                }
            }
            oss << "\n";
        }
    }
    return oss.str();
}

} // namespace util
} // namespace ballot
