// HNSLEDGER CLI - Device Command Line Tool
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// The hnsledger-cli tool talks to a Ledger device running the Handshake app,
// over USB (hidraw) or to the Speculos emulator over TCP.

#include <hnsledger/core/hex.h>
#include <hnsledger/ledger/apdu.h>
#include <hnsledger/ledger/error.h>
#include <hnsledger/ledger/ledger.h>
#include <hnsledger/ledger/settings.h>
#include <hnsledger/util/config.h>
#include <hnsledger/util/logging.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace hnsledger {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "HNSLEDGER CLI";

// ============================================================================
// Help
// ============================================================================

void PrintVersion() {
    std::cout << CLIENT_NAME << " version " << VERSION << "\n";
}

void PrintHelp() {
    PrintVersion();
    std::cout << "\n"
              << "Usage: hnsledger-cli [options] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  getappversion              Version of the Handshake app on the device\n"
              << "  getpublickey <path>        Public key for a derivation path\n"
              << "  getaddress <path>          Address for a derivation path\n"
              << "  ping                       Check that the device answers (hid only)\n"
              << "  sampleconfig               Print an example hnsledger.conf\n"
              << "\n"
              << "Options:\n"
              << "  -datadir=<dir>             Data directory (default: ~/.hnsledger)\n"
              << "  -conf=<file>               Config file (default: <datadir>/hnsledger.conf)\n"
              << "  -transport=<hid|tcp>       Device transport (default: hid)\n"
              << "  -device=<path>             hidraw device node\n"
              << "  -host=<host> -port=<port>  Emulator APDU endpoint (default: 127.0.0.1:9999)\n"
              << "  -timeout=<ms>              Exchange timeout (default: 300000)\n"
              << "  -network=<name>            main, testnet, regtest or simnet\n"
              << "  -xpub                      getpublickey: include chain code and fingerprint\n"
              << "  -address                   getpublickey: include the address\n"
              << "  -confirm                   Show the key or address on the device\n"
              << "  -loglevel=<level>          trace, debug, info, warn, error, off\n"
              << "  -logfile=<file>            Also log to a file\n";
}

// ============================================================================
// Logging Setup
// ============================================================================

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    util::LogLevel level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));

    logger.ClearSinks();
    logger.SetLevel(level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        logger.AddSink(std::make_shared<util::ConsoleSink>(level, true, true));
    }

    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE, "");
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = level;
        logger.AddSink(std::make_shared<util::FileSink>(fileConfig));
    }
}

// ============================================================================
// Commands
// ============================================================================

std::string RequirePathArg(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw ledger::UsageError("Missing derivation path argument");
    }
    return args[1];
}

int CommandGetPublicKey(ledger::LedgerHSD& hsd, const util::ConfigManager& config,
                        const std::vector<std::string>& args) {
    ledger::PublicKeyOptions options;
    options.confirm = config.GetBool("confirm", false);
    options.xpub = config.GetBool("xpub", false);
    options.address = config.GetBool("address", false);

    ledger::PublicKeyResult result =
        hsd.GetPublicKey(ledger::ParsePath(RequirePathArg(args)), options);

    std::cout << "publicKey: " << result.publicKey.ToHex() << "\n";
    if (result.chainCode) {
        std::cout << "chainCode: " << BytesToHex(*result.chainCode) << "\n";
    }
    if (result.parentFingerprint) {
        std::cout << "parentFingerprint: " << *result.parentFingerprint << "\n";
    }
    if (result.address) {
        std::cout << "address: " << *result.address << "\n";
    }
    return 0;
}

int CommandPing(ledger::Transport& transport) {
    auto* hid = dynamic_cast<ledger::HidTransport*>(&transport);
    if (hid == nullptr) {
        std::cerr << "Error: ping requires the hid transport\n";
        return 1;
    }
    hid->Ping();
    std::cout << "pong\n";
    return 0;
}

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;

    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error parsing command line: " << parsed.ToString() << "\n";
        return 1;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    const std::vector<std::string>& args = config.GetPositionalArgs();
    if (args.empty()) {
        std::cerr << "Error: No command specified.\n"
                  << "Use 'hnsledger-cli -help' for usage information.\n";
        return 1;
    }
    const std::string& command = args[0];

    if (command == "sampleconfig") {
        std::cout << config.GenerateSampleConfig();
        return 0;
    }

    util::ConfigParseResult loaded = config.LoadConfigFile();
    if (!loaded.success) {
        std::cerr << "Error reading config file: " << loaded.ToString() << "\n";
        return 1;
    }

    config.AllowStandardKeys();
    for (const char* flag : {"help", "h", "version", "xpub", "address", "confirm"}) {
        config.AllowKey(flag);
    }
    std::vector<std::string> unknown = config.Validate();
    if (!unknown.empty()) {
        for (const auto& error : unknown) {
            std::cerr << "Error: " << error << "\n";
        }
        return 1;
    }

    SetupLogging(config);
    for (const auto& warning : loaded.warnings) {
        LOG_DEBUG(util::LogCategory::CONFIG) << warning;
    }

    ledger::DeviceSettings settings = ledger::DeviceSettings::FromConfig(config);
    std::unique_ptr<ledger::Transport> transport = ledger::OpenTransport(settings);
    ledger::LedgerHSD hsd(*transport, settings.network);

    int rc;
    if (command == "getappversion") {
        std::cout << hsd.GetAppVersion() << "\n";
        rc = 0;
    } else if (command == "getpublickey") {
        rc = CommandGetPublicKey(hsd, config, args);
    } else if (command == "getaddress") {
        std::cout << hsd.GetAddress(ledger::ParsePath(RequirePathArg(args)),
                                    config.GetBool("confirm", false))
                  << "\n";
        rc = 0;
    } else if (command == "ping") {
        rc = CommandPing(*transport);
    } else {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        rc = 1;
    }

    transport->Close();
    util::Logger::Instance().Shutdown();
    return rc;
}

} // namespace cli
} // namespace hnsledger

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return hnsledger::cli::AppMain(argc, argv);
    } catch (const hnsledger::ledger::LedgerError& e) {
        std::cerr << "Error (" << hnsledger::ledger::ErrorCategoryToString(e.GetCategory())
                  << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
