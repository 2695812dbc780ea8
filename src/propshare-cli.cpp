// PROPSHARE - Command Line Console
// Copyright (c) 2024 PROPSHARE Developers
// MIT License
//
// Runs ledger commands from a script file or standard input against an
// in-process ledger.
//
// Usage: propshare-cli [options]
//   -c, --conf=FILE       Configuration file
//   -f, --file=FILE       Command script (default: stdin)
//   -o, --set=KEY=VALUE   Override a configuration key ([section.]key)
//   --loglevel=LEVEL      trace, debug, info, warn, error, off
//   -h, --help            Show help
//   -v, --version         Show version

#include <propshare/cli/commands.h>
#include <propshare/service/service.h>
#include <propshare/util/config.h>
#include <propshare/util/logging.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <getopt.h>

namespace propshare {
namespace cli {

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "PROPSHARE CLI";

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    std::string configFile;
    std::string scriptFile;
    std::string logLevel;
    std::vector<std::string> overrides;     // "[section.]key=value"

    bool showHelp{false};
    bool showVersion{false};
};

// ============================================================================
// Help and Version
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: propshare-cli [options]\n\n";
    std::cout << "Reads one command per line from --file or standard input.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Configuration file\n";
    std::cout << "  -f, --file=FILE            Command script (default: stdin)\n";
    std::cout << "  -o, --set=KEY=VALUE        Override a configuration key (repeatable)\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error, off\n";
    std::cout << "\nConfiguration keys (in --conf FILE, or --set section.key=value):\n";
    std::cout << "  loglevel, logfile, printtoconsole, bootstrapadmin\n";
    std::cout << "  [market] purgestale\n";
    std::cout << "  [registry] requiremanager\n";
    std::cout << "\nCommands:\n";
    std::cout << "  Use 'help' inside a script for a list of available commands\n";
    std::cout << "\nExample:\n";
    std::cout << "  printf 'bootstrap_admin alice\\nregister Loft 100\\n' | propshare-cli\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 PROPSHARE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"file", required_argument, nullptr, 'f'},
        {"set", required_argument, nullptr, 'o'},
        {"loglevel", required_argument, nullptr, 1001},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    // Reset getopt
    optind = 1;

    while ((opt = getopt_long(argc, argv, "hvc:f:o:", longOptions, &optionIndex)) != -1) {
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
            case 'f':
                config.scriptFile = optarg;
                break;
            case 'o':
                config.overrides.push_back(optarg);
                break;
            case 1001:  // --loglevel
                config.logLevel = optarg;
                break;
            case '?':
            default:
                return false;
        }
    }

    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

// ============================================================================
// Setup
// ============================================================================

bool LoadConfigFile(const CLIConfig& cli, util::ConfigManager& config) {
    config.AllowKey(util::ConfigKeys::LOGLEVEL);
    config.AllowKey(util::ConfigKeys::LOGFILE);
    config.AllowKey(util::ConfigKeys::PRINTTOCONSOLE);
    config.AllowKey(util::ConfigKeys::BOOTSTRAPADMIN);
    config.AllowKey(util::ConfigKeys::PURGESTALE, util::ConfigKeys::MARKET_SECTION);
    config.AllowKey(util::ConfigKeys::REQUIREMANAGER, util::ConfigKeys::REGISTRY_SECTION);

    if (!cli.configFile.empty()) {
        auto result = config.ParseFile(cli.configFile);
        if (!result.success) {
            std::cerr << "Error reading config: " << result.ToString() << "\n";
            return false;
        }
    }

    // Command line wins over the file
    std::vector<std::string> args;
    args.push_back("propshare-cli");
    for (const auto& entry : cli.overrides) {
        args.push_back("--" + entry);
    }
    if (!cli.logLevel.empty()) {
        args.push_back(std::string("--") + util::ConfigKeys::LOGLEVEL + "=" + cli.logLevel);
    }

    std::vector<const char*> argv;
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    auto result = config.ParseCommandLine(static_cast<int>(argv.size()), argv.data());
    if (!result.success) {
        std::cerr << "Error in --set: " << result.ToString() << "\n";
        return false;
    }
    return true;
}

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    logger.SetLevel(level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.useStderr = true;
        consoleConfig.level = level;
        consoleConfig.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetString(util::ConfigKeys::LOGFILE, "");
    if (!logFile.empty()) {
        auto sink = std::make_shared<util::FileSink>(logFile, level);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            std::cerr << "Warning: cannot open log file " << logFile << "\n";
        }
    }

    for (const auto& warning : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }
}

// ============================================================================
// Script Execution
// ============================================================================

int RunScript(std::istream& in, CommandTable& table) {
    bool anyFailed = false;
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        CommandResult result = table.Execute(line);
        std::string text = result.ToString();

        if (!result.success) {
            anyFailed = true;
            LOG_DEBUG(util::LogCategory::CLI) << "line " << lineNum << ": " << text;
        }
        if (!text.empty()) {
            std::cout << text << "\n";
        }
    }

    return anyFailed ? 1 : 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig cli;

    if (!ParseCommandLine(argc, argv, cli)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }

    if (cli.showHelp) {
        PrintHelp();
        return 0;
    }

    if (cli.showVersion) {
        PrintVersion();
        return 0;
    }

    util::ConfigManager config;
    if (!LoadConfigFile(cli, config)) {
        return 1;
    }
    SetupLogging(config);

    service::LedgerService service(service::LoadServiceOptions(config));
    CommandTable table(service);

    int rc;
    if (cli.scriptFile.empty()) {
        rc = RunScript(std::cin, table);
    } else {
        std::ifstream script(cli.scriptFile);
        if (!script.is_open()) {
            std::cerr << "Error: cannot open script " << cli.scriptFile << "\n";
            return 1;
        }
        rc = RunScript(script, table);
    }

    util::Logger::Instance().Flush();
    return rc;
}

} // namespace cli
} // namespace propshare

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return propshare::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
