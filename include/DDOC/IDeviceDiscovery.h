// include/DDOC/IDeviceDiscovery.h
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <vector>
#include "DDOC/Device.h"
#include "DDOC/Error.h"
#include "DDOC/HealthCheck.hpp"
#include "DDOC/OutputParsers.hpp"

namespace DDOC {

/**
 * @brief Interface for discovering and probing attached devices
 *
 * This interface defines the contract for point-in-time enumeration of
 * devices, property queries, health checks and recovery. Infrastructure
 * failures are returned as errors; unhealthy devices are reported as
 * HealthCheckResult data.
 */
class IDeviceDiscovery {
public:
    virtual ~IDeviceDiscovery() = default;

    /**
     * @brief List devices that are ready for commands
     * @param retryDuration Delay between attempts after a transient failure
     * @param maxAttempts Total number of attempts before giving up
     * @return Ready devices in reported order, or DoctorError::BuildFailed
     */
    virtual std::expected<std::vector<Device>, DoctorError> discoverDevices(
        std::chrono::milliseconds retryDuration, uint32_t maxAttempts) = 0;

    /**
     * @brief Properties of the first attached device
     * @return Recognised properties, or an empty map when no device is attached
     */
    virtual std::expected<DeviceProperties, DoctorError> deviceProperties() = 0;

    /**
     * @brief Properties of a specific device
     * @param device Device to query
     * @return Recognised properties or the error of the underlying command
     */
    virtual std::expected<DeviceProperties, DoctorError> getDeviceProperties(const Device& device) = 0;

    /**
     * @brief Run every health check against every ready device
     * @return Results keyed by device id
     */
    virtual std::expected<DeviceCheckMap, DoctorError> checkDevices() = 0;

    /**
     * @brief Bring ready devices back to a clean state
     * @return Success, or the first class of failure encountered
     */
    virtual std::expected<void, DoctorError> recoverDevices() = 0;
};

} // namespace DDOC
