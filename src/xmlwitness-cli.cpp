// XMLWITNESS CLI - Command Line Interface
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// The xmlwitness-cli tool turns a signed XML document into the JSON input
// file of the hash-and-RSA circuit.

#include <xmlwitness/util/config.h>
#include <xmlwitness/util/fs.h>
#include <xmlwitness/util/json.h>
#include <xmlwitness/util/logging.h>
#include <xmlwitness/witness/errors.h>
#include <xmlwitness/witness/input.h>
#include <xmlwitness/xml/dsig.h>

#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <unistd.h>

namespace xmlwitness {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "XMLWITNESS CLI";

// ============================================================================
// Exit Codes
// ============================================================================

namespace exitcode {
    constexpr int OK = 0;
    constexpr int FAILURE = 1;
    constexpr int USAGE = 2;
}

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    // Input / output
    std::string inputFile;
    std::string outputFile;
    std::string configFile;
    bool prettyPrint{true};

    // Logging
    std::string logLevel;
    std::string logFile;

    // Witness parameters given on the command line, applied over the config file
    util::ConfigManager overrides;

    // Flags
    bool showHelp{false};
    bool showVersion{false};
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: xmlwitness-cli [options] <signed.xml>\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file path\n";
    std::cout << "  -o, --output=FILE          Write circuit input JSON to FILE (default: stdout)\n";
    std::cout << "  --compact                  Emit JSON on a single line\n";
    std::cout << "\nWitness Options:\n";
    std::cout << "  --nullifier-seed=N         Nullifier seed, decimal (required)\n";
    std::cout << "  --reveal-start=S           Marker opening the revealed window\n";
    std::cout << "  --reveal-end=S             Marker closing the revealed window\n";
    std::cout << "  --max-input-length=N       Circuit SHA capacity in bytes (default: 1280)\n";
    std::cout << "  --bits-per-chunk=N         RSA limb width (default: 121)\n";
    std::cout << "  --num-chunks=N             RSA limb count (default: 17)\n";
    std::cout << "  --anchor=S                 Element the hash is split at (default: <CertificateData>)\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --logfile=FILE             Also write log output to FILE\n";
    std::cout << "\nConfig file keys go in a [witness] section:\n";
    std::cout << "  nullifierseed, revealstart, revealend, maxinputlength,\n";
    std::cout << "  rsakeybitsperchunk, rsakeynumchunks, anchor\n";
    std::cout << "\nExamples:\n";
    std::cout << "  xmlwitness-cli --nullifier-seed=12345678 signed.xml\n";
    std::cout << "  xmlwitness-cli -c witness.conf -o input.json signed.xml\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 XMLWITNESS Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    namespace keys = util::ConfigKeys;
    const std::string section = keys::WITNESS_SECTION;

    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"output", required_argument, nullptr, 'o'},
        {"nullifier-seed", required_argument, nullptr, 1001},
        {"reveal-start", required_argument, nullptr, 1002},
        {"reveal-end", required_argument, nullptr, 1003},
        {"max-input-length", required_argument, nullptr, 1004},
        {"bits-per-chunk", required_argument, nullptr, 1005},
        {"num-chunks", required_argument, nullptr, 1006},
        {"anchor", required_argument, nullptr, 1007},
        {"compact", no_argument, nullptr, 1008},
        {"loglevel", required_argument, nullptr, 1009},
        {"logfile", required_argument, nullptr, 1010},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    // Reset getopt
    optind = 1;

    while ((opt = getopt_long(argc, argv, "hvc:o:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 'o':
                config.outputFile = optarg;
                break;
            case 1001:  // --nullifier-seed
                config.overrides.Set(keys::NULLIFIER_SEED, optarg, section);
                break;
            case 1002:  // --reveal-start
                config.overrides.Set(keys::REVEAL_START, optarg, section);
                break;
            case 1003:  // --reveal-end
                config.overrides.Set(keys::REVEAL_END, optarg, section);
                break;
            case 1004:  // --max-input-length
                config.overrides.Set(keys::MAX_INPUT_LENGTH, optarg, section);
                break;
            case 1005:  // --bits-per-chunk
                config.overrides.Set(keys::RSA_BITS_PER_CHUNK, optarg, section);
                break;
            case 1006:  // --num-chunks
                config.overrides.Set(keys::RSA_NUM_CHUNKS, optarg, section);
                break;
            case 1007:  // --anchor
                config.overrides.Set(keys::ANCHOR, optarg, section);
                break;
            case 1008:  // --compact
                config.prettyPrint = false;
                break;
            case 1009:  // --loglevel
                config.logLevel = optarg;
                break;
            case 1010:  // --logfile
                config.logFile = optarg;
                break;
            case '?':
            default:
                return false;
        }
    }

    // Exactly one positional argument: the signed document
    if (optind != argc - 1) {
        return false;
    }
    config.inputFile = argv[optind];
    return true;
}

// ============================================================================
// Config File
// ============================================================================

/// Load the config file (if any) and lay command-line values over it
bool LoadConfig(const CLIConfig& cli, util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;

    if (!cli.configFile.empty()) {
        util::ConfigParseResult result = config.ParseFile(cli.configFile);
        if (!result.success) {
            std::cerr << "Error: " << result.Describe() << "\n";
            return false;
        }
    }

    const std::string section = keys::WITNESS_SECTION;
    for (const char* key : {keys::NULLIFIER_SEED, keys::REVEAL_START, keys::REVEAL_END,
                            keys::MAX_INPUT_LENGTH, keys::RSA_BITS_PER_CHUNK,
                            keys::RSA_NUM_CHUNKS, keys::ANCHOR}) {
        config.AllowKey(key, section);
    }
    auto problems = config.Validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << "\n";
        }
        return false;
    }

    for (const auto& key : cli.overrides.GetKeys(section)) {
        if (auto value = cli.overrides.TryGetString(key, section)) {
            config.Set(key, *value, section);
        }
    }
    if (!cli.logLevel.empty()) {
        config.Set(keys::LOG_LEVEL, cli.logLevel);
    }
    if (!cli.logFile.empty()) {
        config.Set(keys::LOG_FILE, cli.logFile);
    }
    return true;
}

// ============================================================================
// Logging Setup
// ============================================================================

bool SetupLogging(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;

    util::LogLevel level = util::LogLevel::Warn;
    if (auto name = config.TryGetString(keys::LOG_LEVEL)) {
        try {
            level = util::LogLevelFromString(*name);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return false;
        }
    }

    auto& logger = util::Logger::Instance();
    logger.SetLevel(level);
    logger.AddSink(std::make_shared<util::ConsoleSink>(level, isatty(fileno(stderr)) != 0));

    if (auto path = config.TryGetString(keys::LOG_FILE)) {
        auto sink = std::make_shared<util::FileSink>(*path, level);
        if (!sink->IsOpen()) {
            std::cerr << "Error: cannot open log file " << *path << "\n";
            return false;
        }
        logger.AddSink(sink);
    }
    return true;
}

// ============================================================================
// Witness Generation
// ============================================================================

int GenerateWitness(const CLIConfig& cli, const util::ConfigManager& config) {
    auto xml = util::ReadFile(cli.inputFile);
    if (!xml) {
        std::cerr << "Error: cannot read " << cli.inputFile << "\n";
        return exitcode::FAILURE;
    }

    InputGenerationParams params = InputGenerationParams::FromConfig(config);

    xml::ScopedCryptoEngine engine;
    Witness witness = GenerateInput(*xml, params);

    std::string json = witness.ToJSON().ToJSON(cli.prettyPrint);
    json += "\n";

    if (cli.outputFile.empty()) {
        std::cout << json;
        std::cout.flush();
    } else if (!util::WriteFile(cli.outputFile, json)) {
        std::cerr << "Error: cannot write " << cli.outputFile << "\n";
        return exitcode::FAILURE;
    } else {
        LOG_INFO(util::LogCategory::CLI) << "Wrote circuit input to " << cli.outputFile;
    }
    return exitcode::OK;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig cli;

    // Parse command line
    if (!ParseCommandLine(argc, argv, cli)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return exitcode::USAGE;
    }

    // Handle special flags
    if (cli.showHelp) {
        PrintHelp();
        return exitcode::OK;
    }

    if (cli.showVersion) {
        PrintVersion();
        return exitcode::OK;
    }

    util::ConfigManager config;
    if (!LoadConfig(cli, config)) {
        return exitcode::FAILURE;
    }

    if (!SetupLogging(config)) {
        return exitcode::USAGE;
    }

    try {
        return GenerateWitness(cli, config);
    } catch (const WitnessError& e) {
        LOG_ERROR(util::LogCategory::CLI) << ErrorCodeToString(e.Code()) << ": " << e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        return exitcode::FAILURE;
    }
}

} // namespace cli
} // namespace xmlwitness

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return xmlwitness::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
