// Copyright (c) 2025 The Proxima Core developers
// Distributed under the MIT software license

/**
 * Proxima Engine - daemon
 *
 * Usage:
 *   proximad [options]
 *     --datadir=<path>      Data directory (default: ~/.proxima)
 *     --conf=<file>         Configuration file (default: <datadir>/proxima.conf)
 *     --profile=<file>      Profile document (default: <datadir>/profile.json)
 *     --transports=<list>   Comma list of lan, loopback, ble, mdns
 *     --debug[=<category>]  Verbose logging, optionally for one category
 */

#include <core/engine_config.h>
#include <core/engine_context.h>
#include <core/version.h>
#include <util/config.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <util/pidfile.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

/** Seconds between status lines */
const int STATUS_INTERVAL = 30;

/** Milliseconds between checks of the shutdown flag */
const int SHUTDOWN_POLL_MS = 200;

// Only a lock-free atomic store is safe inside a signal handler
static_assert(std::atomic<bool>::is_always_lock_free, "shutdown flag must be lock free");
std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int signal) {
    (void)signal;
    g_shutdown_requested.store(true);
}

/** Sleep up to `seconds`, returning false as soon as shutdown is requested */
bool WaitForStatusTick(int seconds) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!g_shutdown_requested.load()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(SHUTDOWN_POLL_MS));
    }
    return false;
}

struct DaemonArgs {
    std::string datadir;
    std::string conf;
    std::string profile;
    std::string transports;
    std::vector<std::string> debug;

    bool ParseArgs(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            if (arg.find("--datadir=") == 0) {
                datadir = arg.substr(10);
            } else if (arg.find("--conf=") == 0) {
                conf = arg.substr(7);
            } else if (arg.find("--profile=") == 0) {
                profile = arg.substr(10);
            } else if (arg.find("--transports=") == 0) {
                transports = arg.substr(13);
            } else if (arg == "--debug") {
                debug.push_back("all");
            } else if (arg.find("--debug=") == 0) {
                debug.push_back(arg.substr(8));
            } else if (arg == "--help" || arg == "-h") {
                return false;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
        }
        return true;
    }

    void PrintUsage(const char* program) {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --datadir=<path>      Data directory (default: ~/.proxima)" << std::endl;
        std::cout << "  --conf=<file>         Configuration file (default: <datadir>/proxima.conf)" << std::endl;
        std::cout << "  --profile=<file>      Profile document (default: <datadir>/profile.json)" << std::endl;
        std::cout << "  --transports=<list>   Transports to use: lan, loopback, ble, mdns" << std::endl;
        std::cout << "  --debug[=<category>]  Debug logging (discovery, connect, protocol, privacy," << std::endl;
        std::cout << "                        transport, storage, engine, all)" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
        std::cout << std::endl;
        std::cout << "Configuration:" << std::endl;
        std::cout << "  Configuration file: proxima.conf (in data directory)" << std::endl;
        std::cout << "  Environment variables: PROXIMA_* (e.g., PROXIMA_MAXCONNECTIONS=2)" << std::endl;
        std::cout << "  Priority: Command-line > Environment > Config file > Default" << std::endl;
    }
};

void PrintStatus(const EngineContext& engine) {
    size_t available = 0;
    std::vector<AdapterCapability> capabilities = engine.GetCapabilities();
    for (const AdapterCapability& capability : capabilities) {
        if (capability.status == TransportStatus::AVAILABLE) {
            available++;
        }
    }
    LogPrintf(ENGINE, INFO, "Status: %zu candidates, %zu active connections, %zu completed, %zu/%zu transports",
              engine.GetCandidates().size(), engine.GetConnectionSummaries().size(), engine.GetHistory().size(),
              available, capabilities.size());
}

/** Print a startup failure to the terminal and debug.log */
int Fail(StartupFailure kind, const std::string& subject, const std::string& details) {
    ErrorMessage error = CErrorFormatter::Make(kind, subject, details);
    std::cerr << CErrorFormatter::FormatForUser(error, isatty(STDERR_FILENO) != 0) << std::endl;
    LogPrintf(ENGINE, ERROR, "%s", CErrorFormatter::FormatForLog(error).c_str());
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    DaemonArgs args;
    if (!args.ParseArgs(argc, argv)) {
        args.PrintUsage(argv[0]);
        return 1;
    }

    std::string datadir = args.datadir.empty() ? GetDefaultDataDir() : args.datadir;
    std::error_code ec;
    std::filesystem::create_directories(datadir, ec);
    if (ec) {
        return Fail(StartupFailure::STORAGE, datadir, ec.message());
    }

    // Command-line > Environment > Config file > Default
    std::string config_file = args.conf.empty() ? GetConfigFilePath(datadir) : args.conf;
    CConfigParser config_parser;
    if (!config_parser.LoadConfigFile(config_file)) {
        return Fail(StartupFailure::CONFIG, "conf", "cannot read " + config_file);
    }
    config_parser.SetOverride("datadir", datadir);
    if (!args.profile.empty()) {
        config_parser.SetOverride("profile", args.profile);
    }
    if (!args.transports.empty()) {
        config_parser.SetOverride("transports", args.transports);
    }

    CLogger& logger = CLogger::GetInstance();
    logger.SetConsole(config_parser.GetBool("printtoconsole", true));
    std::vector<std::string> debug = args.debug;
    for (const std::string& name : config_parser.GetList("debug")) {
        debug.push_back(name);
    }
    std::string unknown;
    if (!logger.SetDebugCategories(debug, unknown)) {
        return Fail(StartupFailure::CONFIG, "debug", "unknown log category '" + unknown + "'");
    }
    if (!logger.OpenFile(datadir, config_parser.GetString("logfile", "debug.log"))) {
        LogPrintf(ENGINE, WARN, "Logging to console only");
    }

    CEngineConfig engine_config;
    std::vector<ConfigValidationResult> errors;
    if (!engine_config.Load(config_parser, errors)) {
        for (const ConfigValidationResult& result : errors) {
            ErrorMessage error = CErrorFormatter::Make(StartupFailure::CONFIG, result.field_name,
                                                       result.error_message);
            error.recovery_steps = result.suggestions;
            std::cerr << CErrorFormatter::FormatForUser(error, isatty(STDERR_FILENO) != 0) << std::endl;
        }
        return 1;
    }

    CPidFile pidfile(datadir);
    if (!pidfile.TryAcquire()) {
        return Fail(StartupFailure::DATADIR_LOCKED, datadir,
                    "held by PID " + std::to_string(pidfile.GetLockingPid()));
    }

    if (std::signal(SIGINT, SignalHandler) == SIG_ERR) {
        LogPrintf(ENGINE, WARN, "Failed to install SIGINT handler");
    }
    if (std::signal(SIGTERM, SignalHandler) == SIG_ERR) {
        LogPrintf(ENGINE, WARN, "Failed to install SIGTERM handler");
    }

    LogPrintf(ENGINE, INFO, "%s starting, datadir %s", GetFullVersionString().c_str(), datadir.c_str());
    LogPrintf(ENGINE, DEBUG, "Config %s, transports from %s, privacy level from %s", config_file.c_str(),
              ConfigSourceName(config_parser.GetSource("transports")),
              ConfigSourceName(config_parser.GetSource("privacylevel")));

    int ret = 0;
    {
        EngineContext engine;
        if (!engine.Init(engine_config)) {
            ret = Fail(StartupFailure::STORAGE, "engine", "initialization failed, see debug.log");
        } else {
            for (const AdapterCapability& capability : engine.GetCapabilities()) {
                if (capability.status != TransportStatus::AVAILABLE) {
                    ErrorMessage warning = CErrorFormatter::Make(StartupFailure::TRANSPORT, capability.name,
                                                                 TransportStatusName(capability.status));
                    LogPrintf(TRANSPORT, WARN, "%s", CErrorFormatter::FormatForLog(warning).c_str());
                }
            }
            CLocalAdvert local;
            if (!engine.advertiser->GetLocal(local)) {
                ErrorMessage warning = CErrorFormatter::Make(StartupFailure::PROFILE, engine_config.GetProfilePath(),
                                                             "missing or invalid");
                std::cerr << CErrorFormatter::FormatForUser(warning, isatty(STDERR_FILENO) != 0) << std::endl;
            }

            engine.EnableDiscovery();
            while (WaitForStatusTick(STATUS_INTERVAL)) {
                PrintStatus(engine);
            }

            LogPrintf(ENGINE, INFO, "Shutdown requested");
            engine.Shutdown();
        }
    }

    pidfile.Release();
    logger.Close();
    return ret;
}
