// HNSLEDGER - Configuration File Parser
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// INI-style configuration for the device bridge.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optional [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME
// - A bare key is a flag (true); "nokey" negates it

#ifndef HNSLEDGER_UTIL_CONFIG_H
#define HNSLEDGER_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hnsledger {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".hnsledger";

constexpr const char* DEFAULT_CONFIG_FILENAME = "hnsledger.conf";

/// Maximum config file size (256 KB)
constexpr size_t MAX_CONFIG_SIZE = 256 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/// Where a value came from. Higher sources override lower ones.
enum class ConfigSource {
    Default = 0,
    File = 1,
    CommandLine = 2,
};

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string origin;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
    ConfigSource source{ConfigSource::File};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() { return ConfigParseResult(); }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        ConfigParseResult r;
        r.success = false;
        r.errorMessage = msg;
        r.errorFile = file;
        r.errorLine = line;
        return r;
    }

    /// "file:line: message"
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments and Set()
 * 2. <datadir>/hnsledger.conf
 * 3. SetDefault()
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and $VARS are expanded)
     * @return Parse result; on failure nothing after the bad line is applied
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text; sourceName is used in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse "-key=value", "--key=value", "-flag" and "-noflag" options.
     * Arguments that are not options are kept as positional arguments.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Load <datadir>/hnsledger.conf if it exists
    ConfigParseResult LoadConfigFile(const std::string& dataDir = "");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt when missing or not an integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// String value with ~ and environment expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set with command-line priority
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set only if nothing else provides the key
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    void AllowKey(const std::string& key, const std::string& section = "");

    /// Allow every key in ConfigKeys
    void AllowStandardKeys();

    /// Unknown keys, when any key has been allowed
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();

    size_t Size() const { return entries_.size(); }

    std::string GetDataDir() const;

    void SetDataDir(const std::string& dir);

    /// $HOME/.hnsledger
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);

    static std::string ExpandTilde(const std::string& path);

    std::string GenerateSampleConfig() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseLines(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(ConfigEntry entry);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
    std::vector<std::string> positional_;
    std::string dataDir_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";

    // Device
    constexpr const char* TRANSPORT = "transport";   // hid | tcp
    constexpr const char* DEVICE = "device";         // /dev/hidrawN
    constexpr const char* HOST = "host";             // emulator host
    constexpr const char* PORT = "port";             // emulator APDU port
    constexpr const char* TIMEOUT = "timeout";       // milliseconds
    constexpr const char* NETWORK = "network";

    // Logging
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
}

} // namespace util
} // namespace hnsledger

#endif // HNSLEDGER_UTIL_CONFIG_H
