#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <spdlog/logger.h>
#include "DDOC/Error.h"

namespace DDOC {

// --- Configuration ---

/**
 * @brief Retry policy for device discovery.
 */
struct DiscoveryConfig {
    std::chrono::milliseconds retryDuration{10000};
    uint32_t maxAttempts{3};
};

/**
 * @brief Configuration parameters for AndroidDeviceDiscovery and the CLI.
 */
struct DoctorConfig {
    std::string adbPath{"adb"};
    std::string outputDirectory{"/tmp/device_doctor"};
    std::chrono::milliseconds commandTimeout{30000};
    DiscoveryConfig discovery;
    std::string logLevel{"info"};

    std::shared_ptr<spdlog::logger> logger; // null -> spdlog::default_logger()

    bool isValid() const {
        if (adbPath.empty() || outputDirectory.empty()) {
            return false;
        }
        if (commandTimeout.count() <= 0) {
            return false;
        }
        if (discovery.maxAttempts < 1 || discovery.retryDuration.count() < 0) {
            return false;
        }
        // from_str maps unknown names to off
        if (spdlog::level::from_str(logLevel) == spdlog::level::off && logLevel != "off") {
            return false;
        }
        return true;
    }
};

/**
 * @brief Load a DoctorConfig from a JSON file.
 *
 * Keys that are absent keep their defaults. Unreadable files, malformed JSON,
 * values of the wrong type and configurations failing isValid() yield
 * DoctorError::InvalidConfig.
 */
std::expected<DoctorConfig, DoctorError> loadConfig(const std::string& path);

/**
 * @brief Same as loadConfig() but from an in-memory JSON document.
 */
std::expected<DoctorConfig, DoctorError> parseConfig(const std::string& jsonText);

} // namespace DDOC
