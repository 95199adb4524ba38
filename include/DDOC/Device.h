// include/DDOC/Device.h
#pragma once

#include <string>
#include <utility>

namespace DDOC {

/**
 * @brief A discovered device, identified by the opaque id reported by adb.
 *
 * Immutable value type. Probes against the device go through
 * AndroidDeviceDiscovery, which owns the command runner.
 */
class Device {
public:
    explicit Device(std::string deviceId) : deviceId_(std::move(deviceId)) {}

    const std::string& getDeviceId() const { return deviceId_; }

    bool operator==(const Device& other) const { return deviceId_ == other.deviceId_; }
    bool operator!=(const Device& other) const { return !(*this == other); }

private:
    std::string deviceId_;
};

} // namespace DDOC
