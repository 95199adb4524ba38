// src/DDOC/AndroidDeviceDiscovery.cpp

#include "DDOC/AndroidDeviceDiscovery.h"
#include "DDOC/OutputParsers.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace DDOC {

AndroidDeviceDiscovery::AndroidDeviceDiscovery(DoctorConfig config, std::shared_ptr<IProcessRunner> runner)
    : config_(std::move(config))
    , runner_(std::move(runner))
    , logger_(config_.logger ? config_.logger : spdlog::default_logger())
{
}

std::expected<CommandOutcome, CommandFailure> AndroidDeviceDiscovery::runAdb(
    const std::vector<std::string>& args) const
{
    CommandSpec spec;
    spec.executable = config_.adbPath;
    spec.args = args;
    if (!config_.outputDirectory.empty()) {
        spec.workingDirectory = config_.outputDirectory;
    }
    spec.timeout = config_.commandTimeout;
    logger_->debug("AndroidDeviceDiscovery: {}", spec.toString());
    return runner_->run(spec);
}

std::expected<std::vector<Device>, DoctorError> AndroidDeviceDiscovery::discoverDevices() {
    return discoverDevices(config_.discovery.retryDuration, config_.discovery.maxAttempts);
}

std::expected<std::vector<Device>, DoctorError> AndroidDeviceDiscovery::discoverDevices(
    std::chrono::milliseconds retryDuration, uint32_t maxAttempts)
{
    const uint32_t attempts = std::max<uint32_t>(maxAttempts, 1);
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        auto result = runAdb({"devices"});
        if (result && result->exitCode == 0) {
            std::vector<Device> devices;
            for (const auto& entry : OutputParsers::parseDeviceList(result->stdoutData)) {
                if (entry.state != DeviceState::Device) {
                    logger_->info("AndroidDeviceDiscovery: skipping {} (state: {})",
                                  entry.deviceId, OutputParsers::deviceStateToString(entry.state));
                    continue;
                }
                devices.emplace_back(entry.deviceId);
            }
            logger_->info("AndroidDeviceDiscovery: found {} ready device(s)", devices.size());
            return devices;
        }

        const std::string cause = result
            ? formatExitCodeFailure(config_.adbPath, result->exitCode)
            : result.error().cause;
        if (attempt < attempts) {
            logger_->warn("AndroidDeviceDiscovery: attempt {}/{} failed ({}), retrying in {} ms",
                          attempt, attempts, cause, retryDuration.count());
            std::this_thread::sleep_for(retryDuration);
        } else {
            logger_->error("AndroidDeviceDiscovery: attempt {}/{} failed ({})", attempt, attempts, cause);
        }
    }

    logger_->error("AndroidDeviceDiscovery: device discovery failed after {} attempt(s)", attempts);
    return std::unexpected(DoctorError::BuildFailed);
}

std::expected<DeviceProperties, DoctorError> AndroidDeviceDiscovery::deviceProperties() {
    auto devices = discoverDevices(std::chrono::milliseconds(0), 1);
    if (!devices) {
        return std::unexpected(devices.error());
    }
    if (devices->empty()) {
        logger_->info("AndroidDeviceDiscovery: no device attached, no properties to report");
        return DeviceProperties{};
    }
    return getDeviceProperties(devices->front());
}

std::expected<DeviceProperties, DoctorError> AndroidDeviceDiscovery::getDeviceProperties(const Device& device) {
    auto result = runAdb({"-s", device.getDeviceId(), "shell", "getprop"});
    if (!result) {
        logger_->error("AndroidDeviceDiscovery: getprop on {} failed: {}",
                       device.getDeviceId(), result.error().cause);
        return std::unexpected(result.error().error);
    }
    if (result->exitCode != 0) {
        logger_->error("AndroidDeviceDiscovery: {}", formatExitCodeFailure(config_.adbPath, result->exitCode));
        return std::unexpected(DoctorError::NonZeroExit);
    }

    auto properties = OutputParsers::parseDeviceProperties(result->stdoutData);
    logger_->debug("AndroidDeviceDiscovery: {} recognised properties on {}",
                   properties.size(), device.getDeviceId());
    return properties;
}

HealthCheckResult AndroidDeviceDiscovery::adbPowerServiceCheck() {
    auto result = runAdb({"shell", "dumpsys", "power"});
    if (!result) {
        return HealthCheckResult::failure(kAdbPowerServiceCheckKey, result.error().cause);
    }
    if (result->exitCode != 0) {
        return HealthCheckResult::failure(kAdbPowerServiceCheckKey,
                                          formatExitCodeFailure(config_.adbPath, result->exitCode));
    }
    return HealthCheckResult::success(kAdbPowerServiceCheckKey);
}

HealthCheckResult AndroidDeviceDiscovery::developerModeCheck() {
    auto result = runAdb({"shell", "settings", "get", "global", "development_settings_enabled"});
    if (!result) {
        return HealthCheckResult::failure(kDeveloperModeCheckKey, result.error().cause);
    }
    if (result->exitCode != 0) {
        return HealthCheckResult::failure(kDeveloperModeCheckKey,
                                          formatExitCodeFailure(config_.adbPath, result->exitCode));
    }
    if (!OutputParsers::parseBooleanSetting(result->stdoutData)) {
        return HealthCheckResult::failure(kDeveloperModeCheckKey, kDeveloperModeOffDetails);
    }
    return HealthCheckResult::success(kDeveloperModeCheckKey);
}

std::expected<DeviceCheckMap, DoctorError> AndroidDeviceDiscovery::checkDevices() {
    auto devices = discoverDevices();
    if (!devices) {
        return std::unexpected(devices.error());
    }

    DeviceCheckMap checks;
    if (devices->empty()) {
        checks[kUnknownDeviceId].push_back(
            HealthCheckResult::failure(kAttachedDeviceHealthcheckKey, kAttachedDeviceHealthcheckValue));
        logger_->warn("AndroidDeviceDiscovery: {}", kAttachedDeviceHealthcheckValue);
        return checks;
    }

    for (const auto& device : *devices) {
        auto& results = checks[device.getDeviceId()];
        results.push_back(HealthCheckResult::success(kAttachedDeviceHealthcheckKey));
        results.push_back(adbPowerServiceCheck());
        results.push_back(developerModeCheck());

        for (const auto& r : results) {
            if (r.succeeded()) {
                logger_->info("  {} {}: ok", device.getDeviceId(), r.getName());
            } else {
                logger_->warn("  {} {}: FAILED ({})", device.getDeviceId(), r.getName(), r.getDetails());
            }
        }
    }
    return checks;
}

std::expected<void, DoctorError> AndroidDeviceDiscovery::recoverDevices() {
    auto devices = discoverDevices();
    if (!devices) {
        return std::unexpected(devices.error());
    }

    bool anyFailed = false;
    for (const auto& device : *devices) {
        logger_->info("AndroidDeviceDiscovery: rebooting {}", device.getDeviceId());
        auto result = runAdb({"-s", device.getDeviceId(), "reboot"});
        if (!result) {
            logger_->error("AndroidDeviceDiscovery: reboot of {} failed: {}",
                           device.getDeviceId(), result.error().cause);
            anyFailed = true;
        } else if (result->exitCode != 0) {
            logger_->error("AndroidDeviceDiscovery: reboot of {} failed: {}", device.getDeviceId(),
                           formatExitCodeFailure(config_.adbPath, result->exitCode));
            anyFailed = true;
        }
    }

    if (anyFailed) {
        return std::unexpected(DoctorError::RecoveryFailed);
    }
    return {};
}

} // namespace DDOC
