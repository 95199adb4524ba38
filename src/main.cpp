/**
 * @file main.cpp
 * @brief Entry point of the device_doctor command line tool.
 */

#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "DDOC/AndroidDeviceDiscovery.h"
#include "DDOC/DoctorConfig.hpp"
#include "DDOC/Error.h"
#include "DDOC/JsonHelpers.hpp"
#include "DDOC/PosixProcessRunner.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
    std::string action{"healthcheck"};
    std::optional<std::string> outputDirectory;
    std::optional<std::string> configPath;
    std::optional<std::string> adbPath;
    bool verbose{false};
    bool help{false};
};

void printUsage(std::ostream& os) {
    os << "Usage: device_doctor [options]\n"
       << "  --action <healthcheck|properties|recovery>  Action to run (default: healthcheck)\n"
       << "  --output <dir>                              Output directory for reports\n"
       << "  --config <file>                             JSON configuration file\n"
       << "  --adb <path>                                adb executable\n"
       << "  --verbose                                   Enable debug logging\n"
       << "  --help                                      Show this message\n";
}

std::optional<CommandLine> parseCommandLine(int argc, char** argv) {
    CommandLine cmd;
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto nextValue = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else if (arg == "--action") {
            auto v = nextValue();
            if (!v) return std::nullopt;
            cmd.action = *v;
        } else if (arg == "--output") {
            auto v = nextValue();
            if (!v) return std::nullopt;
            cmd.outputDirectory = *v;
        } else if (arg == "--config") {
            auto v = nextValue();
            if (!v) return std::nullopt;
            cmd.configPath = *v;
        } else if (arg == "--adb") {
            auto v = nextValue();
            if (!v) return std::nullopt;
            cmd.adbPath = *v;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    if (cmd.action != "healthcheck" && cmd.action != "properties" && cmd.action != "recovery") {
        std::cerr << "Unknown action: " << cmd.action << std::endl;
        return std::nullopt;
    }
    return cmd;
}

int runHealthCheck(DDOC::AndroidDeviceDiscovery& discovery) {
    auto checks = discovery.checkDevices();
    if (!checks) {
        spdlog::error("Health check failed: {}", DDOC::make_error_code(checks.error()).message());
        return kExitFailure;
    }

    auto written = DDOC::JsonHelpers::writeJsonReport(discovery.getConfig().outputDirectory,
                                                      DDOC::JsonHelpers::kHealthCheckReportFile,
                                                      DDOC::JsonHelpers::deviceCheckMapToJson(*checks));
    if (!written) {
        return kExitFailure;
    }

    bool healthy = true;
    for (const auto& [deviceId, results] : *checks) {
        for (const auto& result : results) {
            healthy = healthy && result.succeeded();
        }
    }
    spdlog::info("Health check {}", healthy ? "passed" : "found problems");
    return healthy ? kExitOk : kExitFailure;
}

int runProperties(DDOC::AndroidDeviceDiscovery& discovery) {
    auto properties = discovery.deviceProperties();
    if (!properties) {
        spdlog::error("Property query failed: {}", DDOC::make_error_code(properties.error()).message());
        return kExitFailure;
    }
    auto written = DDOC::JsonHelpers::writeJsonReport(discovery.getConfig().outputDirectory,
                                                      DDOC::JsonHelpers::kDevicePropertiesReportFile,
                                                      DDOC::JsonHelpers::devicePropertiesToJson(*properties));
    return written ? kExitOk : kExitFailure;
}

int runRecovery(DDOC::AndroidDeviceDiscovery& discovery) {
    auto result = discovery.recoverDevices();
    if (!result) {
        spdlog::error("Recovery failed: {}", DDOC::make_error_code(result.error()).message());
        return kExitFailure;
    }
    spdlog::info("Recovery finished");
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    auto cmd = parseCommandLine(argc, argv);
    if (!cmd) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (cmd->help) {
        printUsage(std::cout);
        return kExitOk;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>("device_doctor", console_sink);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return kExitFailure;
    }

    DDOC::DoctorConfig config;
    if (cmd->configPath) {
        auto loaded = DDOC::loadConfig(*cmd->configPath);
        if (!loaded) {
            spdlog::critical("Cannot use configuration '{}': {}", *cmd->configPath,
                             DDOC::make_error_code(loaded.error()).message());
            return kExitFailure;
        }
        config = std::move(*loaded);
    }
    if (cmd->outputDirectory) config.outputDirectory = *cmd->outputDirectory;
    if (cmd->adbPath) config.adbPath = *cmd->adbPath;
    config.logger = logger;
    if (!config.isValid()) {
        spdlog::critical("Invalid configuration: adb path, output directory and log level must be set");
        return kExitFailure;
    }

    spdlog::set_level(cmd->verbose ? spdlog::level::debug : spdlog::level::from_str(config.logLevel));
    logger->flush_on(spdlog::level::warn);
    spdlog::info("device_doctor starting (action: {}, output: {})", cmd->action, config.outputDirectory);

    // The runner spawns adb inside the output directory.
    std::error_code ec;
    std::filesystem::create_directories(config.outputDirectory, ec);
    if (ec) {
        spdlog::critical("Cannot create output directory '{}': {}", config.outputDirectory, ec.message());
        return kExitFailure;
    }

    int exitCode = kExitFailure;
    try {
        auto runner = std::make_shared<DDOC::PosixProcessRunner>(logger);
        DDOC::AndroidDeviceDiscovery discovery(config, runner);

        if (cmd->action == "properties") {
            exitCode = runProperties(discovery);
        } else if (cmd->action == "recovery") {
            exitCode = runRecovery(discovery);
        } else {
            exitCode = runHealthCheck(discovery);
        }
    } catch (const std::exception& ex) {
        spdlog::critical("An error occurred: {}", ex.what());
        exitCode = kExitFailure;
    }

    spdlog::info("device_doctor finished with exit code {}", exitCode);
    spdlog::default_logger()->flush();
    return exitCode;
}
