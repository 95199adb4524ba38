#pragma once

#include <map>
#include <string>
#include <vector>

namespace DDOC {

// Stable check identifiers used by downstream reporting.
inline constexpr const char* kAttachedDeviceHealthcheckKey = "attached_device";
inline constexpr const char* kAttachedDeviceHealthcheckValue = "No device is available";
inline constexpr const char* kAdbPowerServiceCheckKey = "adb_power_service";
inline constexpr const char* kDeveloperModeCheckKey = "developer_mode";
inline constexpr const char* kDeveloperModeOffDetails = "developer mode is off";
// Device id used for the aggregate entry when nothing is attached.
inline constexpr const char* kUnknownDeviceId = "unknown";

/**
 * @brief Outcome of one health check invocation.
 *
 * A failed result always carries non-empty details.
 */
class HealthCheckResult {
public:
    static HealthCheckResult success(std::string name, std::string details = {});
    static HealthCheckResult failure(std::string name, std::string details);

    const std::string& getName() const { return name_; }
    bool succeeded() const { return succeeded_; }
    const std::string& getDetails() const { return details_; }

    bool operator==(const HealthCheckResult& other) const = default;

private:
    HealthCheckResult(std::string name, bool succeeded, std::string details);

    std::string name_;
    bool succeeded_{false};
    std::string details_;
};

/// Device id -> results of every check run against that device.
using DeviceCheckMap = std::map<std::string, std::vector<HealthCheckResult>>;

/**
 * @brief "Executable <exe> failed with exit code <code>."
 */
std::string formatExitCodeFailure(const std::string& executable, int exitCode);

} // namespace DDOC
