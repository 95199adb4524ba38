// include/DDOC/AndroidDeviceDiscovery.h
#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>
#include "DDOC/DoctorConfig.hpp"
#include "DDOC/IDeviceDiscovery.h"
#include "DDOC/IProcessRunner.h"

namespace DDOC {

/**
 * @brief Discovers and probes Android devices through adb
 *
 * Every operation spawns its own adb process through the injected runner and
 * keeps no state between calls, so operations may be invoked concurrently.
 * The output directory is passed to the runner as working directory.
 */
class AndroidDeviceDiscovery : public IDeviceDiscovery {
public:
    /**
     * @brief Construct a new Android Device Discovery
     * @param config adb path, output directory, timeouts and retry policy
     * @param runner Process runner used for every adb invocation
     */
    AndroidDeviceDiscovery(DoctorConfig config, std::shared_ptr<IProcessRunner> runner);
    ~AndroidDeviceDiscovery() override = default;

    AndroidDeviceDiscovery(const AndroidDeviceDiscovery&) = delete;
    AndroidDeviceDiscovery& operator=(const AndroidDeviceDiscovery&) = delete;

    /**
     * @brief Discover devices with the retry policy from the configuration
     */
    std::expected<std::vector<Device>, DoctorError> discoverDevices();

    std::expected<std::vector<Device>, DoctorError> discoverDevices(
        std::chrono::milliseconds retryDuration, uint32_t maxAttempts) override;

    std::expected<DeviceProperties, DoctorError> deviceProperties() override;
    std::expected<DeviceProperties, DoctorError> getDeviceProperties(const Device& device) override;
    std::expected<DeviceCheckMap, DoctorError> checkDevices() override;
    std::expected<void, DoctorError> recoverDevices() override;

    /**
     * @brief Check that `dumpsys power` answers; success iff exit code is 0
     */
    HealthCheckResult adbPowerServiceCheck();

    /**
     * @brief Check that the global development_settings_enabled setting reads "1"
     */
    HealthCheckResult developerModeCheck();

    const DoctorConfig& getConfig() const { return config_; }

private:
    std::expected<CommandOutcome, CommandFailure> runAdb(const std::vector<std::string>& args) const;

    DoctorConfig config_;
    std::shared_ptr<IProcessRunner> runner_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace DDOC
