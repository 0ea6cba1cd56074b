// HNSLEDGER - Configuration File Parser Tests
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "hnsledger/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace hnsledger {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/hnsledger_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigTest, ParseEmptyAndComments) {
    auto result = config_.ParseString("\n# comment\n; also a comment\n   \n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValues) {
    auto result = config_.ParseString(
        "transport = tcp\n"
        "port=9999\n"
        "host=\"127.0.0.1\"\n"
        "label='single quoted'\n");
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString("transport", ""), "tcp");
    EXPECT_EQ(config_.GetInt("port", 0), 9999);
    EXPECT_EQ(config_.GetString("host", ""), "127.0.0.1");
    EXPECT_EQ(config_.GetString("label", ""), "single quoted");
}

TEST_F(ConfigTest, EscapesInDoubleQuotes) {
    ASSERT_TRUE(config_.ParseString("msg=\"a\\tb\\\"c\\\\\"\n").success);
    EXPECT_EQ(config_.GetString("msg", ""), "a\tb\"c\\");
}

TEST_F(ConfigTest, FlagsAndNegation) {
    ASSERT_TRUE(config_.ParseString("printtoconsole\nnocolor\n").success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("color", true));
}

TEST_F(ConfigTest, Sections) {
    ASSERT_TRUE(config_.ParseString("timeout=100\n[regtest]\ntimeout=5\n").success);
    EXPECT_EQ(config_.GetInt("timeout", 0), 100);
    EXPECT_EQ(config_.GetInt("timeout", 0, "regtest"), 5);
    EXPECT_TRUE(config_.HasKey("timeout", "regtest"));
    EXPECT_FALSE(config_.HasKey("timeout", "main"));
}

TEST_F(ConfigTest, ErrorsCarryLocation) {
    auto result = config_.ParseString("a=1\n[broken\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.ToString(), "test.conf:2: Missing closing bracket in section header");

    result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, RejectsLongLine) {
    auto result = config_.ParseString("key=" + std::string(MAX_LINE_LENGTH, 'x') + "\n");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, Booleans) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=OFF\nc=1\nd=maybe\n").success);
    EXPECT_EQ(config_.TryGetBool("a"), std::optional<bool>(true));
    EXPECT_EQ(config_.TryGetBool("b"), std::optional<bool>(false));
    EXPECT_EQ(config_.TryGetBool("c"), std::optional<bool>(true));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, Integers) {
    ASSERT_TRUE(config_.ParseString("dec=42\nhex=0x10\nneg=-3\nbad=12abc\nempty=\n").success);
    EXPECT_EQ(config_.TryGetInt("dec"), std::optional<int64_t>(42));
    EXPECT_EQ(config_.TryGetInt("hex"), std::optional<int64_t>(16));
    EXPECT_EQ(config_.TryGetInt("neg"), std::optional<int64_t>(-3));
    EXPECT_FALSE(config_.TryGetInt("bad").has_value());
    EXPECT_FALSE(config_.TryGetInt("empty").has_value());
    EXPECT_EQ(config_.GetInt("missing", 7), 7);
}

// ============================================================================
// Expansion
// ============================================================================

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("HNSLEDGER_TEST_VAR", "value", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a-${HNSLEDGER_TEST_VAR}-b"), "a-value-b");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$HNSLEDGER_TEST_VAR/x"), "value/x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a $ b"), "a $ b");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${UNTERMINATED"), "${UNTERMINATED");
    unsetenv("HNSLEDGER_TEST_VAR");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("[$HNSLEDGER_TEST_VAR]"), "[]");
}

TEST_F(ConfigTest, TildeExpansion) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/x"), "/home/tester/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("~"), "/home/tester");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/x"), "~other/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/tester/.hnsledger");
}

// ============================================================================
// Priority
// ============================================================================

TEST_F(ConfigTest, CommandLineOverridesFile) {
    const char* argv[] = {"hnsledger-cli", "-port=1234", "getappversion"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);
    ASSERT_TRUE(config_.ParseString("port=9999\nhost=10.0.0.1\n").success);

    EXPECT_EQ(config_.GetInt("port", 0), 1234);
    EXPECT_EQ(config_.GetString("host", ""), "10.0.0.1");
    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "getappversion");
}

TEST_F(ConfigTest, DefaultsHaveLowestPriority) {
    config_.SetDefault("network", "main");
    EXPECT_EQ(config_.GetString("network", ""), "main");

    ASSERT_TRUE(config_.ParseString("network=regtest\n").success);
    EXPECT_EQ(config_.GetString("network", ""), "regtest");

    config_.SetDefault("network", "testnet");
    EXPECT_EQ(config_.GetString("network", ""), "regtest");

    config_.Set("network", "simnet");
    EXPECT_EQ(config_.GetString("network", ""), "simnet");
}

TEST_F(ConfigTest, CommandLineForms) {
    const char* argv[] = {"hnsledger-cli", "--timeout=500", "-xpub", "-noconfirm", "-"};
    ASSERT_TRUE(config_.ParseCommandLine(5, argv).success);

    EXPECT_EQ(config_.GetInt("timeout", 0), 500);
    EXPECT_TRUE(config_.GetBool("xpub", false));
    EXPECT_FALSE(config_.GetBool("confirm", true));
    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "-");

    const char* bad[] = {"hnsledger-cli", "-bad key=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, bad).success);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("transport=hid\ndevice=/dev/hidraw3\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("device", ""), "/dev/hidraw3");

    EXPECT_FALSE(config_.ParseFile("/nonexistent/hnsledger.conf").success);
}

TEST_F(ConfigTest, LoadConfigFileFromConfKey) {
    std::string path = CreateTempFile("network=testnet\n");
    config_.Set("conf", path);

    auto result = config_.LoadConfigFile();
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("network", ""), "testnet");
}

TEST_F(ConfigTest, MissingConfigFileIsOnlyAWarning) {
    auto result = config_.LoadConfigFile("/nonexistent-hnsledger-dir");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(config_.GetDataDir(), "/nonexistent-hnsledger-dir");
}

// ============================================================================
// Validation and Utilities
// ============================================================================

TEST_F(ConfigTest, ValidateUnknownKeys) {
    ASSERT_TRUE(config_.ParseString("port=1\nprot=2\n", "x.conf").success);
    EXPECT_TRUE(config_.Validate().empty());

    config_.AllowKey("port");
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("prot"), std::string::npos);
    EXPECT_NE(errors[0].find("x.conf"), std::string::npos);
}

TEST_F(ConfigTest, StandardKeysCoverDeviceSettings) {
    ASSERT_TRUE(config_.ParseString("transport=tcp\nhost=localhost\nport=9999\n"
                                    "timeout=1000\nnetwork=regtest\ndevice=/dev/hidraw0\n"
                                    "loglevel=debug\nlogfile=/tmp/x.log\n"
                                    "printtoconsole=0\ndatadir=/tmp\nconf=a.conf\n"
                                    "trasnport=hid\n", "x.conf").success);

    config_.AllowStandardKeys();
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("trasnport"), std::string::npos);
}

TEST_F(ConfigTest, SampleConfigParses) {
    std::string sample = config_.GenerateSampleConfig();
    EXPECT_NE(sample.find("#transport="), std::string::npos);

    ConfigManager other;
    EXPECT_TRUE(other.ParseString(sample).success);
    EXPECT_EQ(other.Size(), 0u);
}

TEST_F(ConfigTest, ClearResetsEverything) {
    const char* argv[] = {"hnsledger-cli", "-a=1", "positional"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);
    config_.SetDataDir("/tmp/x");
    config_.Clear();

    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_TRUE(config_.GetPositionalArgs().empty());
    EXPECT_NE(config_.GetDataDir(), "/tmp/x");
}

} // namespace test
} // namespace util
} // namespace hnsledger
