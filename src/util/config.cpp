// HNSLEDGER - Configuration File Parser Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hnsledger {
namespace util {

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
    }
    std::string out;
    if (!errorFile.empty()) {
        out += errorFile;
        if (errorLine > 0) {
            out += ":" + std::to_string(errorLine);
        }
        out += ": ";
    }
    return out + errorMessage;
}

// ============================================================================
// Static Helpers
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
    if (str.size() < 2) {
        return str;
    }
    char quote = str.front();
    if ((quote != '"' && quote != '\'') || str.back() != quote) {
        return str;
    }

    std::string inner = str.substr(1, str.size() - 2);
    if (quote == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] != '\\' || i + 1 == inner.size()) {
            out += inner[i];
            continue;
        }
        char next = inner[++i];
        switch (next) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case '\\': out += '\\'; break;
            case '"': out += '"'; break;
            default: out += '\\'; out += next; break;
        }
    }
    return out;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

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
    return std::all_of(key.begin(), key.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
               c == '-' || c == '.';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$' || i + 1 == value.size()) {
            result += value[i++];
            continue;
        }

        size_t nameStart;
        size_t nameEnd;
        size_t resume;
        if (value[i + 1] == '{') {
            nameStart = i + 2;
            nameEnd = value.find('}', nameStart);
            if (nameEnd == std::string::npos) {
                result += value[i++];
                continue;
            }
            resume = nameEnd + 1;
        } else {
            nameStart = i + 1;
            nameEnd = nameStart;
            while (nameEnd < value.size() &&
                   (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                    value[nameEnd] == '_')) {
                ++nameEnd;
            }
            if (nameEnd == nameStart) {
                result += value[i++];
                continue;
            }
            resume = nameEnd;
        }

        std::string name = value.substr(nameStart, nameEnd - nameStart);
        if (const char* env = std::getenv(name.c_str())) {
            result += env;
        }
        i = resume;
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    return section.empty() ? key : section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(ConfigEntry entry) {
    std::string fullKey = MakeKey(entry.key, entry.section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && it->second.source > entry.source) {
        return;
    }
    entries_[fullKey] = std::move(entry);
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        if (trimmed.back() != ']') {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, trimmed.size() - 2));
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.origin = source;
    entry.lineNumber = lineNum;
    entry.source = ConfigSource::File;

    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
        entry.key = trimmed;
        entry.value = "true";
        if (entry.key.size() > 2 && entry.key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(entry.key[2]))) {
            entry.key = entry.key.substr(2);
            entry.value = "false";
        }
    } else {
        entry.key = Trim(trimmed.substr(0, eq));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eq + 1))));
    }

    if (!IsValidKey(entry.key)) {
        result = ConfigParseResult::Error("Invalid key: '" + entry.key + "'",
                                          source, lineNum);
        return false;
    }

    Store(std::move(entry));
    return true;
}

ConfigParseResult ConfigManager::ParseLines(std::istream& in, const std::string& source) {
    ConfigParseResult result = ConfigParseResult::Success();
    std::string section;
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }
        if (!ParseLine(line, source, lineNum, section, result)) {
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
    std::streamoff size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }

    return ParseLines(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseLines(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        arg.erase(0, arg.find_first_not_of('-'));

        ConfigEntry entry;
        entry.origin = "<command-line>";
        entry.source = ConfigSource::CommandLine;

        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            entry.key = arg.substr(0, eq);
            entry.value = arg.substr(eq + 1);
        } else if (arg.size() > 2 && arg.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(arg[2]))) {
            entry.key = arg.substr(2);
            entry.value = "false";
        } else {
            entry.key = arg;
            entry.value = "true";
        }

        if (!IsValidKey(entry.key)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            "<command-line>", i);
        }
        Store(std::move(entry));
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile(const std::string& dataDir) {
    if (!dataDir.empty()) {
        SetDataDir(dataDir);
    }

    std::string path = GetPath(ConfigKeys::CONF,
                               GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME);

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        ConfigParseResult result = ConfigParseResult::Success();
        result.warnings.push_back("No config file at " + path);
        return result;
    }
    return ParseFile(path);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) != 0;
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

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto value = TryGetString(key, section);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(*value, &pos, 0);
        if (pos != value->size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto value = TryGetString(key, section);
    if (!value) {
        return std::nullopt;
    }
    return ParseBool(*value);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
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
    entry.origin = "<programmatic>";
    entry.source = ConfigSource::CommandLine;
    Store(std::move(entry));
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.origin = "<default>";
    entry.source = ConfigSource::Default;
    if (!HasKey(key, section)) {
        Store(std::move(entry));
    }
}

// ============================================================================
// Validation and Utilities
// ============================================================================

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

void ConfigManager::AllowStandardKeys() {
    for (const char* key : {ConfigKeys::DATADIR, ConfigKeys::CONF,
                            ConfigKeys::TRANSPORT, ConfigKeys::DEVICE, ConfigKeys::HOST,
                            ConfigKeys::PORT, ConfigKeys::TIMEOUT, ConfigKeys::NETWORK,
                            ConfigKeys::LOGLEVEL, ConfigKeys::LOGFILE,
                            ConfigKeys::PRINTTOCONSOLE}) {
        AllowKey(key);
    }
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    if (allowedKeys_.empty()) {
        return errors;
    }
    for (const auto& kv : entries_) {
        if (allowedKeys_.count(kv.first) == 0) {
            errors.push_back("Unknown key: " + kv.first + " (defined in " +
                             kv.second.origin + ")");
        }
    }
    return errors;
}

void ConfigManager::Clear() {
    entries_.clear();
    allowedKeys_.clear();
    positional_.clear();
    dataDir_.clear();
}

std::string ConfigManager::GetDataDir() const {
    if (!dataDir_.empty()) {
        return dataDir_;
    }
    auto fromConfig = TryGetString(ConfigKeys::DATADIR);
    if (fromConfig) {
        return ExpandEnvVars(ExpandTilde(*fromConfig));
    }
    return GetDefaultDataDir();
}

void ConfigManager::SetDataDir(const std::string& dir) {
    dataDir_ = ExpandEnvVars(ExpandTilde(dir));
}

std::string ConfigManager::GenerateSampleConfig() const {
    std::ostringstream oss;
    oss << "# hnsledger configuration\n\n"
        << "# Device transport: hid (USB, via /dev/hidraw) or tcp (emulator)\n"
        << "#transport=hid\n\n"
        << "# hidraw node of the device (required for transport=hid)\n"
        << "#device=/dev/hidraw0\n\n"
        << "# Emulator APDU endpoint for transport=tcp\n"
        << "#host=127.0.0.1\n"
        << "#port=9999\n\n"
        << "# Exchange timeout in milliseconds (default: 5 minutes)\n"
        << "#timeout=300000\n\n"
        << "# main, testnet, regtest or simnet\n"
        << "#network=main\n\n"
        << "# trace, debug, info, warn, error, off\n"
        << "#loglevel=info\n"
        << "#logfile=~/.hnsledger/debug.log\n"
        << "#printtoconsole=1\n";
    return oss.str();
}

} // namespace util
} // namespace hnsledger
