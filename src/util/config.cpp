// XMLWITNESS - Configuration File Parser Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/util/config.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace xmlwitness {
namespace util {

std::string ConfigParseResult::Describe() const {
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) {
            oss << ":" << errorLine;
        }
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

// ============================================================================
// Helpers
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
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

    // Double-quoted values support a few escapes
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n':  out += '\n'; ++i; continue;
                case 't':  out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"':  out += '"';  ++i; continue;
                default: break;
            }
        }
        out += inner[i];
    }
    return out;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart = i + 1;
            size_t nameEnd;
            size_t next;
            if (value[nameStart] == '{') {
                nameEnd = value.find('}', nameStart + 1);
                if (nameEnd == std::string::npos) {
                    result += value.substr(i);
                    break;
                }
                ++nameStart;
                next = nameEnd + 1;
            } else {
                nameEnd = nameStart;
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                next = nameEnd;
            }

            if (nameEnd > nameStart) {
                const char* env = std::getenv(value.substr(nameStart, nameEnd - nameStart).c_str());
                if (env) {
                    result += env;
                }
                i = next;
                continue;
            }
        }
        result += value[i++];
    }
    return result;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

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

    size_t eqPos = trimmed.find('=');
    std::string key = Trim(eqPos == std::string::npos ? trimmed : trimmed.substr(0, eqPos));
    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, c), source, lineNum);
            return false;
        }
    }

    ConfigEntry entry;
    entry.key = key;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    if (eqPos == std::string::npos) {
        // Bare key is a flag
        entry.value = "true";
    } else {
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    entries_[MakeKey(key, currentSection)] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        return ConfigParseResult::Error("Cannot open config file", filePath);
    }

    std::ostringstream content;
    content << file.rdbuf();
    std::string text = content.str();
    if (text.size() > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Error("Config file too large", filePath);
    }

    return ParseString(text, filePath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    std::string pending;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(stream, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            pending += line.substr(0, line.length() - 1);
            continue;
        }

        if (!ParseLine(pending + line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
        pending.clear();
    }

    if (!pending.empty() &&
        !ParseLine(pending, sourceName, lineNum, currentSection, result)) {
        return result;
    }

    return ConfigParseResult::Success();
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
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    for (char c : *str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    try {
        return std::stoull(*str);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<set>";
    entries_[MakeKey(key, section)] = entry;
}

// ============================================================================
// Inspection and Validation
// ============================================================================

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::set<std::string> checkedSections;
    for (const auto& allowed : allowedKeys_) {
        size_t dot = allowed.find('.');
        checkedSections.insert(dot == std::string::npos ? "" : allowed.substr(0, dot));
    }

    std::vector<std::string> problems;
    for (const auto& [fullKey, entry] : entries_) {
        if (!checkedSections.count(entry.section)) {
            continue;
        }
        if (!allowedKeys_.count(fullKey)) {
            std::string where = entry.source;
            if (entry.lineNumber > 0) {
                where += ":" + std::to_string(entry.lineNumber);
            }
            problems.push_back(where + ": unknown key '" + fullKey + "'");
        }
    }
    return problems;
}

void ConfigManager::Clear() {
    entries_.clear();
    allowedKeys_.clear();
}

} // namespace util
} // namespace xmlwitness
